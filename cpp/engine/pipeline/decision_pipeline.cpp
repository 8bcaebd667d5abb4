#include "engine/pipeline/decision_pipeline.hpp"

#include <sstream>
#include <utility>

#include "engine/calibration/layer_score_vector.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/fusion/choquet.hpp"

namespace calfuse {

const char* to_string(DecisionStatus s) noexcept {
  switch (s) {
    case DecisionStatus::kFused:  return "FUSED";
    case DecisionStatus::kVetoed: return "VETOED";
    default:                      return "UNKNOWN";
  }
}

DecisionRequest DecisionRequest::from_json(const JsonValue& v) {
  if (!v.is_object()) {
    throw InputError("request", "an object", "decision request must be a JSON object", CALFUSE_SITE);
  }

  DecisionRequest r;
  const JsonValue* unit = v.find("unit_id");
  if (!unit || !unit->is_string() || unit->as_string().empty()) {
    throw InputError("unit_id", "a non-empty string", "decision request has no unit_id", CALFUSE_SITE);
  }
  r.unit_id = unit->as_string();

  const JsonValue* role = v.find("role");
  if (!role || !role->is_string()) {
    throw UnknownRoleError("role", "EXECUTOR, CLUSTER or MACRO",
                           "decision request for " + r.unit_id + " has no role", CALFUSE_SITE);
  }
  r.role = role->as_string();

  const JsonValue* scores = v.find("scores");
  if (!scores) {
    throw InputError("scores", "an object keyed by layer symbol",
                     "decision request for " + r.unit_id + " has no scores object", CALFUSE_SITE);
  }
  r.scores = named_scores_from_json(*scores);

  if (const JsonValue* vetoes = v.find("veto_results")) {
    if (!vetoes->is_array()) {
      throw InvalidVetoError("veto_results", "an array", "veto_results must be an array", CALFUSE_SITE);
    }
    const auto& arr = vetoes->as_array();
    for (size_t i = 0; i < arr.size(); ++i) r.veto_results.push_back(VetoResult::from_json(arr[i], i));
  }
  return r;
}

JsonValue Decision::to_json() const {
  JsonValue sup = JsonValue::make_array();
  for (const auto& s : suppressed_vetoes) sup.push_back(s.to_json());

  JsonValue o = JsonValue::make_object();
  o.set("entry_hash", JsonValue::make_string(entry.entry_hash));
  o.set("score", score ? JsonValue::make_number(*score) : JsonValue::make_null());
  o.set("sequence", JsonValue::make_number(static_cast<double>(entry.sequence)));
  o.set("status", JsonValue::make_string(status_text));
  o.set("suppressed_vetoes", std::move(sup));
  o.set("unit_id", JsonValue::make_string(entry.unit_id));
  o.set("veto", veto ? veto->to_json() : JsonValue::make_null());
  return o;
}

DecisionPipeline::DecisionPipeline(CalibrationContextPtr context, CalibrationManifest& manifest)
    : context_(std::move(context)), manifest_(manifest) {
  CALFUSE_ENSURE(context_ != nullptr, ErrorCode::kInternal, "DecisionPipeline requires a calibration context");
}

Decision DecisionPipeline::decide(const DecisionRequest& request) {
  try {
    const auto role = parse_fusion_role(request.role);
    if (!role) {
      throw UnknownRoleError("role", "EXECUTOR, CLUSTER or MACRO",
                             "unknown fusion role '" + request.role + "'", CALFUSE_SITE);
    }
    const FusionWeightSet& weights = context_->weight_set(*role);
    const LayerScoreVector scores = LayerScoreVector::from_named(request.scores);
    const VetoCascadeReport cascade = run_veto_cascade(request.veto_results);

    Decision d;
    for (size_t i : cascade.suppressed) d.suppressed_vetoes.push_back(cascade.ordered[i]);

    if (const VetoResult* v = cascade.veto()) {
      d.status = DecisionStatus::kVetoed;
      d.status_text = v->reason.empty() ? std::string("VETO:") + v->layer_id : v->reason;
      d.veto = *v;
      log(LogLevel::INFO, "veto: unit=" + request.unit_id + " layer=" + v->layer_id +
                              " reason=" + d.status_text);
    } else {
      d.status = DecisionStatus::kFused;
      d.status_text = to_string(DecisionStatus::kFused);
      d.score = evaluate(scores, weights);
    }

    DecisionInputs inputs{request.unit_id, *role, weights.id(), scores,
                          cascade.ordered, context_->state_hash()};
    d.entry = manifest_.record(inputs, d.score, d.veto);
    return d;
  } catch (const InputError& e) {
    std::ostringstream oss;
    oss << "rejected: unit=" << request.unit_id << " field=" << e.field()
        << " expected=" << e.expected() << " (" << e.message() << ")";
    log(LogLevel::WARN, oss.str());
    throw;
  }
}

}  // namespace calfuse
