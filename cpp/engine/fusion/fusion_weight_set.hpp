#pragma once
/*
================================================================================
Fusion: Weight Sets per Role
FILE: cpp/engine/fusion/fusion_weight_set.hpp

Purpose:
  - Immutable 2-additive capacity for one fusion role: eight linear weights
    plus weights on unordered pairs of distinct layers.
  - Closed FusionRole enumeration; strings are only parsed at the boundary.

Rules (checked at construction, WeightNormalizationError on violation):
  - every weight finite and >= 0
  - no (l, l) pair, no pair repeated in either order
  - |sum(linear) + sum(interaction) - 1| <= kWeightSumTolerance
================================================================================
*/

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "engine/calibration/layer_id.hpp"
#include "engine/core/json_reader.hpp"

namespace calfuse {

enum class FusionRole : uint8_t {
  EXECUTOR = 0,
  CLUSTER = 1,
  MACRO = 2,
};

inline constexpr size_t kRoleCount = 3;

inline constexpr std::array<FusionRole, kRoleCount> kAllRoles = {
    FusionRole::EXECUTOR, FusionRole::CLUSTER, FusionRole::MACRO};

const char* to_string(FusionRole r) noexcept;

// Exact, case-sensitive match on the role name.
std::optional<FusionRole> parse_fusion_role(std::string_view s) noexcept;

inline constexpr double kWeightSumTolerance = 1e-6;

struct InteractionTerm {
  LayerId first;   // lower layer index
  LayerId second;  // higher layer index
  double weight = 0.0;
};

// "@u,@chain" style key -> pair ordered by layer_index, whatever the written
// order. Throws WeightNormalizationError on a
// malformed key or unknown symbol.
std::pair<LayerId, LayerId> parse_interaction_key(std::string_view key);

class FusionWeightSet final {
 public:
  FusionWeightSet(FusionRole role,
                  const std::array<double, kLayerCount>& linear,
                  std::vector<InteractionTerm> interactions);

  FusionRole role() const noexcept { return role_; }
  double linear(LayerId id) const noexcept { return linear_[layer_index(id)]; }
  const std::array<double, kLayerCount>& linear_weights() const noexcept { return linear_; }

  // Pairs normalized to (lower index, higher index), sorted by that key.
  const std::vector<InteractionTerm>& interactions() const noexcept { return interactions_; }

  double linear_sum() const noexcept { return linear_sum_; }
  double interaction_sum() const noexcept { return interaction_sum_; }

  // "<ROLE>:<first 16 hex of sha256(canonical weights)>"
  const std::string& id() const noexcept { return id_; }

  // {"interaction_weights":{"@chain,@u":...},"linear_weights":{...},"role":"EXECUTOR"}
  JsonValue to_json() const;

 private:
  FusionRole role_;
  std::array<double, kLayerCount> linear_{};
  std::vector<InteractionTerm> interactions_;
  double linear_sum_ = 0.0;
  double interaction_sum_ = 0.0;
  std::string id_;
};

// At most one weight set per role.
class RoleWeightTable final {
 public:
  // Throws ConfigError if the role already has a weight set.
  void add(FusionWeightSet ws);

  bool has(FusionRole role) const noexcept { return sets_[static_cast<size_t>(role)].has_value(); }

  // Throws UnknownRoleError if no weight set is configured for role.
  const FusionWeightSet& at(FusionRole role) const;

  // Parses the name first; unknown names also throw UnknownRoleError.
  const FusionWeightSet& at(std::string_view role_name) const;

  std::vector<FusionRole> configured_roles() const;

 private:
  std::array<std::optional<FusionWeightSet>, kRoleCount> sets_;
};

}  // namespace calfuse
