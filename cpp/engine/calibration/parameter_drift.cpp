#include "engine/calibration/parameter_drift.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"

namespace calfuse {

const char* to_string(DriftSeverity s) noexcept {
  switch (s) {
    case DriftSeverity::kNone:        return "NONE";
    case DriftSeverity::kMinor:       return "MINOR";
    case DriftSeverity::kModerate:    return "MODERATE";
    case DriftSeverity::kSignificant: return "SIGNIFICANT";
    case DriftSeverity::kCritical:    return "CRITICAL";
    default:                          return "NONE";
  }
}

double drift_ratio(double old_value, double new_value) noexcept {
  const double delta = std::fabs(new_value - old_value);
  if (std::fabs(old_value) < 1e-6) return delta;
  return delta / std::fabs(old_value);
}

DriftSeverity classify_drift(double ratio) noexcept {
  if (ratio >= kCriticalDriftThreshold) return DriftSeverity::kCritical;
  if (ratio >= kSignificantDriftThreshold) return DriftSeverity::kSignificant;
  if (ratio >= kModerateDriftThreshold) return DriftSeverity::kModerate;
  if (ratio > 0.0) return DriftSeverity::kMinor;
  return DriftSeverity::kNone;
}

namespace {

const ParameterDrift* find_drift(const std::vector<ParameterDrift>& drifts, const std::string& name) {
  for (const auto& d : drifts) {
    if (d.name == name) return &d;
  }
  return nullptr;
}

bool detect_contradiction(const DriftReport& rep) {
  const ParameterDrift* prior = find_drift(rep.drifts, kPriorStrengthParam);
  const ParameterDrift* veto = find_drift(rep.drifts, kVetoThresholdParam);
  if (!prior || !veto) return false;

  const bool prior_up = prior->new_value > prior->old_value;
  const bool veto_up = veto->new_value > veto->old_value;
  if (prior_up != veto_up) return false;

  std::ostringstream oss;
  oss << "drift " << rep.layer_id << ": contradiction, " << kPriorStrengthParam << " " << prior->old_value
      << " -> " << prior->new_value << " and " << kVetoThresholdParam << " " << veto->old_value << " -> "
      << veto->new_value << " moved the same way";
  log(LogLevel::WARN, oss.str());
  return true;
}

bool detect_dispersion(const std::vector<ParameterDrift>& drifts) {
  if (drifts.empty()) return false;
  const auto heavy = std::count_if(drifts.begin(), drifts.end(), [](const ParameterDrift& d) {
    return d.severity >= DriftSeverity::kSignificant;
  });
  return static_cast<double>(heavy) / static_cast<double>(drifts.size()) >= kDispersionPenaltyThreshold;
}

std::vector<std::string> build_recommendations(const DriftReport& rep) {
  std::vector<std::string> out;
  if (rep.contradiction) {
    out.push_back(std::string("CRITICAL: ") + kPriorStrengthParam + " and " + kVetoThresholdParam +
                  " moved in the same direction; review the calibration logic");
  }
  if (rep.coverage_penalty) {
    std::ostringstream oss;
    oss << kCoverageTargetParam << " below " << kCoveragePenaltyThreshold
        << "; raise extraction coverage or narrow the unit scope";
    out.push_back(oss.str());
  }
  if (rep.dispersion_penalty) {
    out.push_back("high parameter dispersion; review calibration stability and consider recalibration");
  }
  for (const auto& d : rep.drifts) {
    if (d.severity != DriftSeverity::kCritical) continue;
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(1);
    oss << "CRITICAL: " << d.name << " drifted " << d.ratio * 100.0 << "%; recalibrate before use";
    out.push_back(oss.str());
  }
  if (out.empty()) out.push_back("no significant issues; calibration stable");
  return out;
}

}  // namespace

DriftReport compute_parameter_drift(const CalibrationLayer& baseline, const CalibrationLayer& current) {
  if (baseline.layer_id() != current.layer_id()) {
    throw ConfigError("drift comparison across layers: '" + baseline.layer_id() + "' vs '" +
                          current.layer_id() + "'",
                      CALFUSE_SITE);
  }

  DriftReport rep;
  rep.layer_id = baseline.layer_id();
  rep.baseline_version = baseline.version();
  rep.current_version = current.version();
  rep.baseline_hash = baseline.content_hash();
  rep.current_hash = current.content_hash();

  // Both maps iterate in name order, so the report is sorted without extra work.
  for (const auto& [name, old_p] : baseline.parameters()) {
    const BoundedParameter* new_p = current.find_parameter(name);
    if (!new_p) {
      rep.removed.push_back(name);
      continue;
    }
    ParameterDrift d;
    d.name = name;
    d.old_value = old_p.value();
    d.new_value = new_p->value();
    d.ratio = drift_ratio(d.old_value, d.new_value);
    d.severity = classify_drift(d.ratio);
    if (d.severity == DriftSeverity::kNone) continue;
    rep.overall = std::max(rep.overall, d.severity);
    rep.drifts.push_back(std::move(d));
  }
  for (const auto& [name, p] : current.parameters()) {
    (void)p;
    if (!baseline.find_parameter(name)) rep.added.push_back(name);
  }

  rep.contradiction = detect_contradiction(rep);
  if (const BoundedParameter* coverage = current.find_parameter(kCoverageTargetParam)) {
    rep.coverage_penalty = coverage->value() < kCoveragePenaltyThreshold;
  }
  rep.dispersion_penalty = detect_dispersion(rep.drifts);
  rep.recommendations = build_recommendations(rep);

  std::ostringstream oss;
  oss << "drift " << rep.layer_id << " " << rep.baseline_version << " -> " << rep.current_version
      << ": severity=" << to_string(rep.overall) << " changed=" << rep.drifts.size()
      << " added=" << rep.added.size() << " removed=" << rep.removed.size()
      << " recalibrate=" << (rep.requires_recalibration() ? "yes" : "no");
  log(rep.requires_review() || rep.requires_recalibration() ? LogLevel::WARN : LogLevel::INFO, oss.str());
  return rep;
}

JsonValue DriftReport::to_json() const {
  JsonValue ds = JsonValue::make_array();
  for (const auto& d : drifts) {
    JsonValue o = JsonValue::make_object();
    o.set("name", JsonValue::make_string(d.name));
    o.set("new_value", JsonValue::make_number(d.new_value));
    o.set("old_value", JsonValue::make_number(d.old_value));
    o.set("ratio", JsonValue::make_number(d.ratio));
    o.set("severity", JsonValue::make_string(to_string(d.severity)));
    ds.push_back(std::move(o));
  }
  auto names = [](const std::vector<std::string>& v) {
    JsonValue a = JsonValue::make_array();
    for (const auto& s : v) a.push_back(JsonValue::make_string(s));
    return a;
  };

  JsonValue o = JsonValue::make_object();
  o.set("added", names(added));
  o.set("baseline_hash", JsonValue::make_string(baseline_hash));
  o.set("baseline_version", JsonValue::make_string(baseline_version));
  o.set("contradiction", JsonValue::make_bool(contradiction));
  o.set("coverage_penalty", JsonValue::make_bool(coverage_penalty));
  o.set("current_hash", JsonValue::make_string(current_hash));
  o.set("current_version", JsonValue::make_string(current_version));
  o.set("dispersion_penalty", JsonValue::make_bool(dispersion_penalty));
  o.set("drifts", std::move(ds));
  o.set("layer_id", JsonValue::make_string(layer_id));
  o.set("overall", JsonValue::make_string(to_string(overall)));
  o.set("recommendations", names(recommendations));
  o.set("removed", names(removed));
  o.set("requires_recalibration", JsonValue::make_bool(requires_recalibration()));
  return o;
}

}  // namespace calfuse
