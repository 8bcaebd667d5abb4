#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "engine/config/calibration_config.hpp"

namespace calfuse {

// Immutable, validated calibration state. Built once at startup; shared
// read-only by every evaluator via CalibrationContextPtr. There is no way to
// obtain a context that has not passed every load check.
class CalibrationContext final {
 public:
  const std::string& cohort() const noexcept { return cfg_.cohort; }
  const std::string& version() const noexcept { return cfg_.version; }

  // sha256 of the canonical configuration document.
  const std::string& state_hash() const noexcept { return state_hash_; }

  const RoleWeightTable& weights() const noexcept { return cfg_.weights; }

  // Throws UnknownRoleError.
  const FusionWeightSet& weight_set(FusionRole role) const { return cfg_.weights.at(role); }

  const std::vector<CalibrationLayer>& layers() const noexcept { return cfg_.layers; }

  // Newest version of layer_id (the one no other version supersedes), or nullptr.
  const CalibrationLayer* active_layer(const std::string& layer_id) const;

  const governance::DependencyGraph& graph() const noexcept { return cfg_.graph; }
  const std::vector<std::string>& topological_order() const noexcept { return topo_order_; }
  const governance::ProductBounds& product_bounds() const noexcept { return cfg_.product_bounds; }

 private:
  friend std::shared_ptr<const CalibrationContext> load_calibration_context_text(std::string_view);

  CalibrationContext(CalibrationConfig cfg, std::string state_hash, std::vector<std::string> topo);

  CalibrationConfig cfg_;
  std::string state_hash_;
  std::vector<std::string> topo_order_;
};

using CalibrationContextPtr = std::shared_ptr<const CalibrationContext>;

// parse -> typed construction -> governor validation -> state hash.
// Any failure throws (ConfigError, OutOfBoundsError, IncompleteProvenanceError,
// WeightNormalizationError, CyclicDependencyError, LevelInversionError) and no
// context is produced.
CalibrationContextPtr load_calibration_context_text(std::string_view json_text);

// Reads the file first (IoError on failure).
CalibrationContextPtr load_calibration_context(const std::string& path);

// sha256 of the canonical form of a JSON document (ConfigError if it does not parse).
std::string calibration_state_hash(std::string_view json_text);

}  // namespace calfuse
