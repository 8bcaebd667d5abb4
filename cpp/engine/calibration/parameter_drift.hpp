#pragma once

#include <string>
#include <vector>

#include "engine/calibration/calibration_layer.hpp"
#include "engine/core/json_reader.hpp"

namespace calfuse {

// Severity bands on the drift ratio r:
//   NONE r == 0, MINOR r < 0.10, MODERATE r < 0.30, SIGNIFICANT r < 0.50, CRITICAL r >= 0.50
enum class DriftSeverity : int { kNone = 0, kMinor = 1, kModerate = 2, kSignificant = 3, kCritical = 4 };

const char* to_string(DriftSeverity s) noexcept;

// Lower edge of each band.
inline constexpr double kModerateDriftThreshold = 0.10;
inline constexpr double kSignificantDriftThreshold = 0.30;
inline constexpr double kCriticalDriftThreshold = 0.50;

// Penalty triggers.
inline constexpr double kCoveragePenaltyThreshold = 0.85;    // extraction_coverage_target below this
inline constexpr double kDispersionPenaltyThreshold = 0.40;  // share of drifts at SIGNIFICANT or above

// Parameters with a fixed meaning across layers.
inline constexpr const char* kPriorStrengthParam = "prior_strength";
inline constexpr const char* kVetoThresholdParam = "veto_threshold";
inline constexpr const char* kCoverageTargetParam = "extraction_coverage_target";

// |new - old| / |old|, or |new - old| when |old| < 1e-6.
double drift_ratio(double old_value, double new_value) noexcept;

DriftSeverity classify_drift(double ratio) noexcept;

struct ParameterDrift {
  std::string name;
  double old_value = 0.0;
  double new_value = 0.0;
  double ratio = 0.0;
  DriftSeverity severity = DriftSeverity::kNone;
};

struct DriftReport {
  std::string layer_id;
  std::string baseline_version;
  std::string current_version;
  std::string baseline_hash;
  std::string current_hash;
  std::vector<ParameterDrift> drifts;   // only parameters that moved, sorted by name
  std::vector<std::string> added;       // present only in current
  std::vector<std::string> removed;     // present only in baseline
  DriftSeverity overall = DriftSeverity::kNone;

  // prior_strength and veto_threshold moved the same way. A stronger prior
  // should come with a looser veto, and the reverse.
  bool contradiction = false;
  bool coverage_penalty = false;
  bool dispersion_penalty = false;
  std::vector<std::string> recommendations;  // never empty

  bool requires_review() const noexcept {
    return overall == DriftSeverity::kSignificant || overall == DriftSeverity::kCritical;
  }

  bool requires_recalibration() const noexcept {
    return overall == DriftSeverity::kCritical || contradiction;
  }

  JsonValue to_json() const;
};

// Compare two versions of the same layer. Throws ConfigError if layer ids differ.
DriftReport compute_parameter_drift(const CalibrationLayer& baseline, const CalibrationLayer& current);

}  // namespace calfuse
