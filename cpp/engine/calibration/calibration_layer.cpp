#include "engine/calibration/calibration_layer.hpp"

#include <cctype>
#include <utility>

#include "engine/core/canonical_json.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/hashing.hpp"

namespace calfuse {
namespace {

bool is_blank(const std::string& s) {
  for (unsigned char c : s) {
    if (!std::isspace(c)) return false;
  }
  return true;
}

}  // namespace

CalibrationLayer::CalibrationLayer(std::string layer_id,
                                   std::string version,
                                   std::vector<BoundedParameter> parameters,
                                   std::string rationale,
                                   std::vector<EvidenceReference> evidence,
                                   Timestamp created_at,
                                   std::optional<std::string> supersedes)
    : layer_id_(std::move(layer_id)),
      version_(std::move(version)),
      rationale_(std::move(rationale)),
      evidence_(std::move(evidence)),
      created_at_(created_at),
      supersedes_(std::move(supersedes)) {
  if (layer_id_.empty()) throw ConfigError("calibration layer_id must not be empty", CALFUSE_SITE);
  if (version_.empty()) {
    throw ConfigError("calibration layer '" + layer_id_ + "' has an empty version", CALFUSE_SITE);
  }
  if (is_blank(rationale_)) {
    throw IncompleteProvenanceError("calibration layer '" + layer_id_ + "' " + version_ +
                                        " has no rationale",
                                    CALFUSE_SITE);
  }
  if (evidence_.empty()) {
    throw IncompleteProvenanceError("calibration layer '" + layer_id_ + "' " + version_ +
                                        " has no evidence references",
                                    CALFUSE_SITE);
  }

  for (auto& p : parameters) {
    const std::string name = p.name();
    auto [it, inserted] = parameters_.emplace(name, std::move(p));
    (void)it;
    if (!inserted) {
      throw ConfigError("calibration layer '" + layer_id_ + "' repeats parameter '" + name + "'",
                        CALFUSE_SITE);
    }
  }

  content_hash_ = sha256_hex(to_canonical_json(to_json(/*with_hash=*/false)));
}

const BoundedParameter* CalibrationLayer::find_parameter(const std::string& name) const {
  auto it = parameters_.find(name);
  return it == parameters_.end() ? nullptr : &it->second;
}

const BoundedParameter& CalibrationLayer::parameter(const std::string& name) const {
  const BoundedParameter* p = find_parameter(name);
  if (!p) {
    throw ConfigError("calibration layer '" + layer_id_ + "' has no parameter '" + name + "'",
                      CALFUSE_SITE);
  }
  return *p;
}

CalibrationLayer CalibrationLayer::supersede(std::string new_version,
                                             std::vector<BoundedParameter> parameters,
                                             std::string rationale,
                                             std::vector<EvidenceReference> evidence,
                                             Timestamp created_at) const {
  if (new_version == version_) {
    throw ConfigError("superseding layer '" + layer_id_ + "' must change the version (still " +
                          version_ + ")",
                      CALFUSE_SITE);
  }
  return CalibrationLayer(layer_id_, std::move(new_version), std::move(parameters),
                          std::move(rationale), std::move(evidence), created_at, content_hash_);
}

JsonValue CalibrationLayer::to_json(bool with_hash) const {
  JsonValue params = JsonValue::make_array();
  for (const auto& [name, p] : parameters_) {
    (void)name;
    params.push_back(p.to_json());
  }

  JsonValue ev = JsonValue::make_array();
  for (const auto& e : evidence_) ev.push_back(e.to_json());

  JsonValue o = JsonValue::make_object();
  if (with_hash) o.set("content_hash", JsonValue::make_string(content_hash_));
  o.set("created_at", JsonValue::make_string(format_utc_iso8601(created_at_)));
  o.set("evidence", std::move(ev));
  o.set("layer_id", JsonValue::make_string(layer_id_));
  o.set("parameters", std::move(params));
  o.set("rationale", JsonValue::make_string(rationale_));
  o.set("supersedes", supersedes_ ? JsonValue::make_string(*supersedes_) : JsonValue::make_null());
  o.set("version", JsonValue::make_string(version_));
  return o;
}

}  // namespace calfuse
