/*
  Config selftest

  Loads calibration documents from text and from the bundled sample, and
  checks that every load failure surfaces as its own error type with no
  context produced.
*/

#include <string>

#include "engine/calibration/parameter_drift.hpp"
#include "engine/config/calibration_context.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/hashing.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"

#ifndef CALFUSE_DATA_DIR
#define CALFUSE_DATA_DIR "data"
#endif

namespace calfuse {
namespace {

using selftest::Report;

const char* kRoles = R"({
  "EXECUTOR": {
    "linear_weights": {"@b": 0.17, "@chain": 0.13, "@q": 0.08, "@d": 0.07,
                       "@p": 0.06, "@C": 0.08, "@u": 0.04, "@m": 0.04},
    "interaction_weights": {"@u,@chain": 0.13, "@chain,@C": 0.10, "@q,@d": 0.10}
  }
})";

const char* kLayerV1 = R"({
  "layer_id": "@b", "version": "v1", "rationale": "fit",
  "created_at": "2024-01-01T00:00:00Z",
  "evidence": [{"locator": "docs/fit.md"}],
  "parameters": [{"name": "prior_strength", "value": 0.5, "bounds": [0, 1]}]
})";

const char* kGraph = R"({
  "nodes": [{"id": "@b", "tier": "EMPIRICAL"}, {"id": "@chain", "tier": "INFERENTIAL"},
            {"id": "@m", "tier": "AUDIT"}],
  "edges": [{"from": "@b", "to": "@chain"}, {"from": "@chain", "to": "@m", "kind": "PRIMARY"}]
})";

std::string doc(const std::string& roles, const std::string& layers, const std::string& graph,
                const std::string& extra = "") {
  return R"({"cohort": "COHORT_T", "version": "v1", "role_fusion_parameters": )" + roles +
         R"(, "layers": )" + layers + R"(, "dependency_graph": )" + graph + extra + "}";
}

std::string valid_doc() {
  return doc(kRoles, std::string("[") + kLayerV1 + "]", kGraph);
}

std::string layer(const std::string& version, double value, const std::string& extra = "",
                  const std::string& evidence = R"([{"locator": "docs/fit.md"}])") {
  return R"({"layer_id": "@b", "version": ")" + version +
         R"(", "rationale": "fit", "created_at": "2024-01-01T00:00:00Z", "evidence": )" + evidence +
         R"(, "parameters": [{"name": "prior_strength", "value": )" + std::to_string(value) +
         R"(, "bounds": [0, 1]}])" + extra + "}";
}

template <class E>
void expect_load_error(Report& r, const std::string& text, const std::string& what) {
  CalibrationContextPtr ctx;
  const bool threw = selftest::throws_as<E>(r, what, [&] { ctx = load_calibration_context_text(text); });
  r.check(threw && !ctx, what);
}

void test_load(Report& r) {
  const CalibrationContextPtr ctx = load_calibration_context_text(valid_doc());
  r.check(ctx != nullptr, "valid document loads");
  if (!ctx) return;

  r.check(ctx->cohort() == "COHORT_T" && ctx->version() == "v1", "cohort and version");
  r.check(ctx->state_hash().size() == 64 && is_hex_string(ctx->state_hash()), "state hash is sha256 hex");
  r.check(ctx->weights().configured_roles().size() == 1, "one role configured");
  r.check(ctx->weight_set(FusionRole::EXECUTOR).interactions().size() == 3, "interactions loaded");
  r.check(selftest::throws_as<UnknownRoleError>(r, "cluster", [&] { (void)ctx->weight_set(FusionRole::CLUSTER); }),
          "unconfigured role");
  r.check(ctx->layers().size() == 1 && ctx->active_layer("@b") != nullptr, "layer loaded");
  r.check(ctx->active_layer("@q") == nullptr, "absent layer");
  r.check(ctx->topological_order() == std::vector<std::string>{"@b", "@chain", "@m"}, "graph order");
  r.check(ctx->product_bounds().min == 0.01 && ctx->product_bounds().max == 10.0, "default product bounds");
}

void test_state_hash(Report& r) {
  const std::string reordered = R"({
    "dependency_graph": )" + std::string(kGraph) + R"(,
    "layers": [)" + kLayerV1 + R"(],
    "version": "v1",
    "role_fusion_parameters": )" + kRoles + R"(,
    "cohort": "COHORT_T"
  })";
  const auto a = load_calibration_context_text(valid_doc());
  const auto b = load_calibration_context_text(reordered);
  r.check(a->state_hash() == b->state_hash(), "state hash ignores key order and whitespace");
  r.check(calibration_state_hash(reordered) == a->state_hash(), "standalone state hash agrees");

  const auto c = load_calibration_context_text(doc(kRoles, "[" + layer("v1", 0.25) + "]", kGraph));
  r.check(c->state_hash() != a->state_hash(), "state hash covers parameter values");
}

void test_failures(Report& r) {
  expect_load_error<ConfigError>(r, "{ not json", "malformed JSON is a config error");
  expect_load_error<ConfigError>(r, doc(kRoles, "[]", kGraph, R"(, "extra": 1)"), "unknown top-level key");
  expect_load_error<ConfigError>(r, R"({"cohort": "C"})", "missing sections");
  expect_load_error<ConfigError>(r, doc("{}", "[]", kGraph), "no roles configured");
  expect_load_error<ConfigError>(r, doc(R"({"PILOT": {"linear_weights": {}}})", "[]", kGraph), "unknown role");

  const std::string partial = R"({"EXECUTOR": {"linear_weights": {"@b": 1.0}}})";
  expect_load_error<ConfigError>(r, doc(partial, "[]", kGraph), "missing linear weights");

  const std::string light = R"({"EXECUTOR": {"linear_weights": {"@b": 0.16, "@chain": 0.13, "@q": 0.08,
    "@d": 0.07, "@p": 0.06, "@C": 0.08, "@u": 0.04, "@m": 0.04},
    "interaction_weights": {"@u,@chain": 0.13, "@chain,@C": 0.10, "@q,@d": 0.10}}})";
  expect_load_error<WeightNormalizationError>(r, doc(light, "[]", kGraph), "weights summing to 0.99");

  expect_load_error<OutOfBoundsError>(r, doc(kRoles, "[" + layer("v1", 1.5) + "]", kGraph),
                                      "parameter outside its bounds");
  expect_load_error<IncompleteProvenanceError>(r, doc(kRoles, "[" + layer("v1", 0.5, "", "[]") + "]", kGraph),
                                               "layer without evidence");
  expect_load_error<InvalidEvidenceError>(
      r, doc(kRoles, "[" + layer("v1", 0.5, "", R"([{"locator": "/tmp/fit.md"}])") + "]", kGraph),
      "evidence outside the repository roots");

  const std::string cyclic = R"({"nodes": [{"id": "a", "tier": "EMPIRICAL"}, {"id": "b", "tier": "EMPIRICAL"}],
    "edges": [{"from": "a", "to": "b"}, {"from": "b", "to": "a", "kind": "ADVISORY"}]})";
  try {
    (void)load_calibration_context_text(doc(kRoles, "[]", cyclic));
    r.fail("cyclic graph loaded");
  } catch (const CyclicDependencyError& e) {
    r.check(e.cycle() == std::vector<std::string>{"a", "b", "a"}, "cycle reported through the loader");
  }

  const std::string inverted = R"({"nodes": [{"id": "audit", "tier": "N3"}, {"id": "infer", "tier": "N2"}],
    "edges": [{"from": "audit", "to": "infer"}]})";
  expect_load_error<LevelInversionError>(r, doc(kRoles, "[]", inverted), "audit feeding inference");

  expect_load_error<ConfigError>(
      r, doc(kRoles, "[]", R"({"nodes": [{"id": "a", "tier": "EMPIRICAL"}], "edges": [{"from": "a", "to": "z"}]})"),
      "edge to an undeclared node");
  expect_load_error<ConfigError>(r, doc(kRoles, "[]", R"({"nodes": [{"id": "a", "tier": "N9"}]})"), "unknown tier");

  expect_load_error<OutOfBoundsError>(r, doc(kRoles, "[]", kGraph, R"(, "product_bounds": {"min": 5, "max": 1})"),
                                      "inverted product bounds");
  expect_load_error<ConfigError>(
      r, doc(kRoles, "[" + layer("v1", 0.5, R"(, "created_at_local": "x")") + "]", kGraph),
      "unknown layer key");

  std::string far_future = layer("v1", 0.5);
  const size_t at = far_future.find("2024-01-01");
  far_future.replace(at, 4, "2300");
  expect_load_error<ConfigError>(r, doc(kRoles, "[" + far_future + "]", kGraph), "created_at beyond the clock range");
}

void test_versions(Report& r) {
  // Two unlinked versions of one layer are ambiguous.
  expect_load_error<ConfigError>(r, doc(kRoles, "[" + layer("v1", 0.5) + "," + layer("v2", 0.4) + "]", kGraph),
                                 "two active versions");
  expect_load_error<ConfigError>(r, doc(kRoles, "[" + layer("v1", 0.5) + "," + layer("v1", 0.4) + "]", kGraph),
                                 "repeated version");
  expect_load_error<ConfigError>(
      r, doc(kRoles, "[" + layer("v2", 0.4, R"(, "supersedes_version": "v0")") + "]", kGraph),
      "supersedes an unknown version");

  const auto ctx = load_calibration_context_text(
      doc(kRoles, "[" + layer("v1", 0.5) + "," + layer("v2", 0.4, R"(, "supersedes_version": "v1")") + "]", kGraph));
  const CalibrationLayer* active = ctx->active_layer("@b");
  r.check(active && active->version() == "v2", "newest version is active");
  r.check(active && active->supersedes() == ctx->layers()[0].content_hash(), "supersedes resolved to content hash");
}

void test_sample_document(Report& r) {
  const std::string path = std::string(CALFUSE_DATA_DIR) + "/calibration/cohort_2024_v1.json";
  CalibrationContextPtr ctx;
  try {
    ctx = load_calibration_context(path);
  } catch (const Error& e) {
    r.fail(std::string("sample calibration failed to load: ") + e.what());
    return;
  }
  r.check(ctx->weights().configured_roles().size() == 2, "sample configures two roles");
  r.check(ctx->graph().node_count() == 6, "sample graph");

  const CalibrationLayer* b = ctx->active_layer("@b");
  r.check(b && b->version() == "v1", "sample base layer is at v1");
  if (b && b->supersedes()) {
    const CalibrationLayer* prev = nullptr;
    for (const auto& l : ctx->layers()) {
      if (l.content_hash() == *b->supersedes()) prev = &l;
    }
    r.check(prev && prev->version() == "v0", "sample supersession chain");
    if (prev) {
      const DriftReport d = compute_parameter_drift(*prev, *b);
      r.check(d.drifts.size() == 2 && d.overall == DriftSeverity::kCritical && d.requires_review(),
              "min_support 20 -> 30 needs review");
    }
  } else {
    r.fail("sample base layer does not supersede v0");
  }

  r.check(selftest::throws_as<IoError>(r, "missing", [] { (void)load_calibration_context("/nonexistent/cal.json"); }),
          "missing file is an IoError");
}

}  // namespace
}  // namespace calfuse

int main() {
  calfuse::set_log_level(calfuse::LogLevel::ERROR);
  calfuse::selftest::Report r;
  calfuse::test_load(r);
  calfuse::test_state_hash(r);
  calfuse::test_failures(r);
  calfuse::test_versions(r);
  calfuse::test_sample_document(r);
  return calfuse::selftest::finish(r, "config_selftest");
}
