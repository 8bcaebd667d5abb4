#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace calfuse {

// The eight quality layers. Enumerator order is the fixed layer priority used
// to break veto ties (@b first, @m last) and the field order of LayerScoreVector.
enum class LayerId : uint8_t {
  kBase = 0,        // @b
  kChain = 1,       // @chain
  kQuestion = 2,    // @q
  kDimension = 3,   // @d
  kPolicy = 4,      // @p
  kCongruence = 5,  // @C
  kUnit = 6,        // @u
  kMeta = 7,        // @m
};

inline constexpr size_t kLayerCount = 8;

inline constexpr std::array<LayerId, kLayerCount> kAllLayers = {
    LayerId::kBase,   LayerId::kChain,      LayerId::kQuestion, LayerId::kDimension,
    LayerId::kPolicy, LayerId::kCongruence, LayerId::kUnit,     LayerId::kMeta,
};

constexpr size_t layer_index(LayerId id) noexcept { return static_cast<size_t>(id); }

// "@b", "@chain", ... (case-sensitive; "@C" and "@chain" are distinct).
std::string_view layer_symbol(LayerId id) noexcept;

// Human-readable name ("base", "chain", "question", ...).
std::string_view layer_display_name(LayerId id) noexcept;

std::optional<LayerId> parse_layer_symbol(std::string_view symbol) noexcept;

}  // namespace calfuse
