#pragma once
/*
================================================================================
Pipeline: Decision (veto -> fusion -> manifest)
FILE: cpp/engine/pipeline/decision_pipeline.hpp

  decide(request):
    1) resolve role            UnknownRoleError
    2) validate scores         MissingLayer / UnexpectedLayer / ScoreOutOfRange
    3) veto cascade            InvalidVetoError; a selected veto skips fusion
    4) Choquet fusion          only when no veto
    5) one manifest entry

Rejected calls (any InputError) leave no manifest entry.
Safe to call from several threads: the context is read-only and the manifest
serializes appends.
================================================================================
*/

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "engine/config/calibration_context.hpp"
#include "engine/core/json_reader.hpp"
#include "engine/manifest/calibration_manifest.hpp"
#include "engine/veto/veto_coordinator.hpp"

namespace calfuse {

struct DecisionRequest {
  std::string unit_id;
  std::string role;
  std::map<std::string, double> scores;
  std::vector<VetoResult> veto_results;

  // {"unit_id":..,"role":..,"scores":{..},"veto_results":[..]}; InputError on bad shape.
  static DecisionRequest from_json(const JsonValue& v);
};

enum class DecisionStatus : int { kFused = 0, kVetoed = 1 };

const char* to_string(DecisionStatus s) noexcept;

struct Decision {
  DecisionStatus status = DecisionStatus::kFused;
  std::string status_text;           // "FUSED" or the veto reason
  std::optional<double> score;
  std::optional<VetoResult> veto;
  std::vector<VetoResult> suppressed_vetoes;
  ManifestEntry entry;

  JsonValue to_json() const;
};

class DecisionPipeline final {
 public:
  DecisionPipeline(CalibrationContextPtr context, CalibrationManifest& manifest);

  Decision decide(const DecisionRequest& request);

  const CalibrationContext& context() const noexcept { return *context_; }

 private:
  CalibrationContextPtr context_;
  CalibrationManifest& manifest_;
};

}  // namespace calfuse
