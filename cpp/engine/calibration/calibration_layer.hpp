#pragma once
/*
================================================================================
Calibration: Calibration Layer (immutable, content-addressed)
FILE: cpp/engine/calibration/calibration_layer.hpp

Purpose:
  - One versioned bundle of bounded parameters for a single layer, with the
    rationale and evidence that justify it.
  - content_hash() = sha256(canonical JSON of every field except the hash).

Rules:
  - Blank rationale or empty evidence -> IncompleteProvenanceError.
  - Duplicate parameter names -> ConfigError.
  - No mutation. supersede() produces a NEW layer that records this layer's
    content hash in supersedes().
================================================================================
*/

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "engine/calibration/bounded_parameter.hpp"
#include "engine/calibration/evidence_reference.hpp"
#include "engine/core/clock.hpp"
#include "engine/core/json_reader.hpp"

namespace calfuse {

class CalibrationLayer final {
 public:
  CalibrationLayer(std::string layer_id,
                   std::string version,
                   std::vector<BoundedParameter> parameters,
                   std::string rationale,
                   std::vector<EvidenceReference> evidence,
                   Timestamp created_at,
                   std::optional<std::string> supersedes = std::nullopt);

  const std::string& layer_id() const noexcept { return layer_id_; }
  const std::string& version() const noexcept { return version_; }
  const std::map<std::string, BoundedParameter>& parameters() const noexcept { return parameters_; }
  const std::string& rationale() const noexcept { return rationale_; }
  const std::vector<EvidenceReference>& evidence() const noexcept { return evidence_; }
  Timestamp created_at() const noexcept { return created_at_; }
  const std::optional<std::string>& supersedes() const noexcept { return supersedes_; }
  const std::string& content_hash() const noexcept { return content_hash_; }

  // nullptr if absent.
  const BoundedParameter* find_parameter(const std::string& name) const;

  // Throws ConfigError if absent.
  const BoundedParameter& parameter(const std::string& name) const;

  // New layer for the same layer_id. new_version must differ from version().
  CalibrationLayer supersede(std::string new_version,
                             std::vector<BoundedParameter> parameters,
                             std::string rationale,
                             std::vector<EvidenceReference> evidence,
                             Timestamp created_at) const;

  // Canonical body; includes "content_hash" only when with_hash is set.
  JsonValue to_json(bool with_hash = true) const;

 private:
  std::string layer_id_;
  std::string version_;
  std::map<std::string, BoundedParameter> parameters_;
  std::string rationale_;
  std::vector<EvidenceReference> evidence_;
  Timestamp created_at_;
  std::optional<std::string> supersedes_;
  std::string content_hash_;
};

}  // namespace calfuse
