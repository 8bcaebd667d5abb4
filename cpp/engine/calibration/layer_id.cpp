#include "engine/calibration/layer_id.hpp"

namespace calfuse {
namespace {

struct LayerNames {
  std::string_view symbol;
  std::string_view display;
};

constexpr std::array<LayerNames, kLayerCount> kNames = {{
    {"@b", "base"},
    {"@chain", "chain"},
    {"@q", "question"},
    {"@d", "dimension"},
    {"@p", "policy"},
    {"@C", "congruence"},
    {"@u", "unit"},
    {"@m", "meta"},
}};

}  // namespace

std::string_view layer_symbol(LayerId id) noexcept {
  const size_t i = layer_index(id);
  return i < kLayerCount ? kNames[i].symbol : std::string_view("@?");
}

std::string_view layer_display_name(LayerId id) noexcept {
  const size_t i = layer_index(id);
  return i < kLayerCount ? kNames[i].display : std::string_view("unknown");
}

std::optional<LayerId> parse_layer_symbol(std::string_view symbol) noexcept {
  for (size_t i = 0; i < kLayerCount; ++i) {
    if (kNames[i].symbol == symbol) return kAllLayers[i];
  }
  return std::nullopt;
}

}  // namespace calfuse
