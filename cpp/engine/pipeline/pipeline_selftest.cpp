// ============================================================================
// Decision pipeline selftest (veto -> fusion -> manifest, end to end)
// ============================================================================

#include <limits>
#include <map>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "engine/config/calibration_context.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/manifest/manifest_audit.hpp"
#include "engine/pipeline/decision_pipeline.hpp"

namespace calfuse {
namespace {

using selftest::Report;
using selftest::near;

const char* kCalibration = R"({
  "cohort": "COHORT_P", "version": "v1",
  "role_fusion_parameters": {
    "EXECUTOR": {
      "linear_weights": {"@b": 0.17, "@chain": 0.13, "@q": 0.08, "@d": 0.07,
                         "@p": 0.06, "@C": 0.08, "@u": 0.04, "@m": 0.04},
      "interaction_weights": {"@u,@chain": 0.13, "@chain,@C": 0.10, "@q,@d": 0.10}
    }
  },
  "layers": [{
    "layer_id": "@chain", "version": "v1", "rationale": "completeness floor",
    "created_at": "2024-03-15T12:30:00Z",
    "evidence": [{"locator": "src/chain/completeness.cpp"}],
    "parameters": [{"name": "completeness_floor", "value": 0.8, "bounds": [0.5, 1.0]}]
  }],
  "dependency_graph": {
    "nodes": [{"id": "@b", "tier": "EMPIRICAL"}, {"id": "@chain", "tier": "INFERENTIAL"}],
    "edges": [{"from": "@b", "to": "@chain"}]
  }
})";

const std::string kKey = "pipeline-key";

std::map<std::string, double> reference_scores() {
  return {{"@b", 0.88}, {"@u", 0.76}, {"@q", 0.91}, {"@d", 0.95},
          {"@p", 0.83}, {"@C", 0.94}, {"@chain", 1.0}, {"@m", 0.72}};
}

DecisionRequest request(const std::string& unit, std::map<std::string, double> scores = reference_scores()) {
  DecisionRequest q;
  q.unit_id = unit;
  q.role = "EXECUTOR";
  q.scores = std::move(scores);
  return q;
}

VetoResult veto(const std::string& layer, bool triggered, double specificity, const std::string& reason) {
  VetoResult v;
  v.layer_id = layer;
  v.triggered = triggered;
  v.specificity_score = specificity;
  v.reason = reason;
  return v;
}

ManifestOptions options() {
  ManifestOptions opt;
  opt.clock = fixed_clock(*parse_utc_iso8601("2024-06-01T08:00:00Z"));
  opt.signing_key = kKey;
  return opt;
}

void test_fused_and_vetoed(Report& r) {
  const CalibrationContextPtr ctx = load_calibration_context_text(kCalibration);
  CalibrationManifest manifest(options());
  DecisionPipeline pipeline(ctx, manifest);

  const Decision fused = pipeline.decide(request("m-001"));
  r.check(fused.status == DecisionStatus::kFused && fused.status_text == "FUSED", "no veto fuses");
  r.check(fused.score && near(*fused.score, 0.8869), "reference score");
  r.check(fused.entry.sequence == 0 && fused.entry.score == fused.score, "entry records the score");
  r.check(fused.entry.calibration_state_hash == ctx->state_hash(), "entry pins the calibration state");
  r.check(fused.entry.weight_set_id == ctx->weight_set(FusionRole::EXECUTOR).id(), "entry pins the weight set");

  auto broken_chain = reference_scores();
  broken_chain["@chain"] = 0.0;
  DecisionRequest vq = request("m-002", broken_chain);
  vq.veto_results = {veto("@q", true, 0.4, "question scope mismatch"),
                     veto("@chain", true, 0.9, "chain incomplete"),
                     veto("@p", false, 0.99, "")};
  const Decision vetoed = pipeline.decide(vq);
  r.check(vetoed.status == DecisionStatus::kVetoed && vetoed.status_text == "chain incomplete",
          "highest-specificity triggered veto wins");
  r.check(!vetoed.score && vetoed.veto && vetoed.veto->layer_id == "@chain", "veto skips fusion");
  r.check(vetoed.suppressed_vetoes.size() == 1 && vetoed.suppressed_vetoes[0].layer_id == "@q",
          "outranked veto reported as suppressed");
  r.check(vetoed.entry.vetoed() && vetoed.entry.sequence == 1, "veto recorded in the manifest");

  DecisionRequest quiet = request("m-003");
  quiet.veto_results = {veto("@q", true, 0.5, "")};
  r.check(pipeline.decide(quiet).status_text == "VETO:@q", "reasonless veto falls back to its layer");

  DecisionRequest untriggered = request("m-004");
  untriggered.veto_results = {veto("@q", false, 0.5, "fine")};
  r.check(pipeline.decide(untriggered).status == DecisionStatus::kFused, "untriggered vetoes do not block");

  r.check(manifest.size() == 4, "one entry per decision");
  r.check(verify_chain(manifest.snapshot(), std::string_view(kKey)).ok, "decision chain verifies");

  const JsonValue j = vetoed.to_json();
  r.check(j.find("status")->as_string() == "chain incomplete" && j.find("score")->is_null(), "decision json");
}

void test_rejections(Report& r) {
  const CalibrationContextPtr ctx = load_calibration_context_text(kCalibration);
  CalibrationManifest manifest(options());
  DecisionPipeline pipeline(ctx, manifest);

  auto missing = reference_scores();
  missing.erase("@u");
  try {
    (void)pipeline.decide(request("bad-1", missing));
    r.fail("missing layer accepted");
  } catch (const MissingLayerError& e) {
    r.check(e.field() == "@u", "missing layer named");
  }

  auto high = reference_scores();
  high["@d"] = 1.01;
  r.check(selftest::throws_as<ScoreOutOfRangeError>(r, "range", [&] { (void)pipeline.decide(request("bad-2", high)); }),
          "score above one rejected");

  auto extra = reference_scores();
  extra["@z"] = 0.5;
  r.check(selftest::throws_as<UnexpectedLayerError>(r, "extra", [&] { (void)pipeline.decide(request("bad-3", extra)); }),
          "unexpected layer rejected");

  DecisionRequest pilot = request("bad-4");
  pilot.role = "PILOT";
  r.check(selftest::throws_as<UnknownRoleError>(r, "pilot", [&] { (void)pipeline.decide(pilot); }), "unknown role");

  DecisionRequest cluster = request("bad-5");
  cluster.role = "CLUSTER";
  r.check(selftest::throws_as<UnknownRoleError>(r, "cluster", [&] { (void)pipeline.decide(cluster); }),
          "role without weights");

  DecisionRequest nan_veto = request("bad-6");
  nan_veto.veto_results = {veto("@q", true, std::numeric_limits<double>::quiet_NaN(), "x")};
  r.check(selftest::throws_as<InvalidVetoError>(r, "veto", [&] { (void)pipeline.decide(nan_veto); }),
          "malformed veto rejected");

  r.check(manifest.size() == 0, "rejected requests leave no manifest entry");
}

void test_request_json(Report& r) {
  JsonValue doc;
  const bool parsed = parse_json(R"({
    "unit_id": "m-010", "role": "EXECUTOR",
    "scores": {"@b": 0.88, "@u": 0.76, "@q": 0.91, "@d": 0.95, "@p": 0.83, "@C": 0.94, "@chain": 1.0, "@m": 0.72},
    "veto_results": [{"layer_id": "@m", "triggered": false, "specificity_score": 0.2}]
  })", &doc);
  r.check(parsed, "request document parses");
  const DecisionRequest q = DecisionRequest::from_json(doc);
  r.check(q.unit_id == "m-010" && q.scores.size() == 8 && q.veto_results.size() == 1, "request fields");

  JsonValue no_unit = JsonValue::make_object();
  no_unit.set("role", JsonValue::make_string("EXECUTOR"));
  try {
    (void)DecisionRequest::from_json(no_unit);
    r.fail("request without unit_id accepted");
  } catch (const InputError& e) {
    r.check(e.field() == "unit_id", "missing unit id named");
  }

  JsonValue bad_score;
  r.check(parse_json(R"({"unit_id": "u", "role": "EXECUTOR", "scores": {"@b": "high"}})", &bad_score),
          "bad score document parses");
  r.check(selftest::throws_as<ScoreOutOfRangeError>(r, "score", [&] { (void)DecisionRequest::from_json(bad_score); }),
          "non-numeric score rejected");

  JsonValue stray;
  r.check(parse_json(R"({"unit_id": "u", "role": "EXECUTOR", "scores": {"@b": 0.5, "@zz": "x"}})", &stray),
          "stray layer document parses");
  try {
    (void)DecisionRequest::from_json(stray);
    r.fail("unknown layer key accepted");
  } catch (const UnexpectedLayerError& e) {
    r.check(e.field() == "@zz", "unknown layer named even with a non-numeric value");
  } catch (const InputError& e) {
    r.fail(std::string("unknown layer key reported as the wrong error: ") + e.what());
  }
}

void test_concurrent_decisions(Report& r) {
  const CalibrationContextPtr ctx = load_calibration_context_text(kCalibration);
  CalibrationManifest manifest(options());
  DecisionPipeline pipeline(ctx, manifest);

  constexpr int kThreads = 4;
  constexpr int kPerThread = 50;
  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        (void)pipeline.decide(request("w" + std::to_string(t) + "-" + std::to_string(i)));
      }
    });
  }
  for (auto& w : workers) w.join();

  r.check(manifest.size() == static_cast<size_t>(kThreads * kPerThread), "all concurrent decisions recorded");
  r.check(verify_chain(manifest.snapshot(), std::string_view(kKey)).ok, "concurrent chain verifies");
}

}  // namespace
}  // namespace calfuse

int main() {
  calfuse::set_log_level(calfuse::LogLevel::ERROR);
  calfuse::selftest::Report r;
  calfuse::test_fused_and_vetoed(r);
  calfuse::test_rejections(r);
  calfuse::test_request_json(r);
  calfuse::test_concurrent_decisions(r);
  return calfuse::selftest::finish(r, "pipeline_selftest");
}
