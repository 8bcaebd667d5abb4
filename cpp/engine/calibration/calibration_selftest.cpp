/*
  Calibration selftest

  Covers:
    1) Bounded parameters reject (never clamp) out-of-range values.
    2) Evidence locators are confined to src/, artifacts/, docs/.
    3) Layer content hashes are stable and sensitive to every field.
    4) supersede() links by content hash; drift bands are classified.
    5) Score vectors validate at the boundary and name the offending layer.

  Framework-free. Non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <limits>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "engine/calibration/bounded_parameter.hpp"
#include "engine/calibration/calibration_layer.hpp"
#include "engine/calibration/evidence_reference.hpp"
#include "engine/calibration/layer_id.hpp"
#include "engine/calibration/layer_score_vector.hpp"
#include "engine/calibration/parameter_drift.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"

namespace calfuse {
namespace {

static int g_fail_count = 0;

void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

template <class E, class Fn>
void expect_throw(Fn&& fn, std::string_view msg) {
  try {
    fn();
  } catch (const E&) {
    pass(msg);
    return;
  } catch (const std::exception& e) {
    fail(msg);
    std::cerr << "  unexpected: " << e.what() << "\n";
    return;
  }
  fail(msg);
  std::cerr << "  no exception\n";
}

Timestamp t0() {
  return *parse_utc_iso8601("2024-01-01T00:00:00Z");
}

CalibrationLayer make_layer(const std::string& version, double prior, double support) {
  return CalibrationLayer("@b", version,
                          {BoundedParameter("prior_strength", prior, ClosedInterval(0.0, 1.0)),
                           BoundedParameter("min_support", support, ClosedInterval(1.0, 1000.0))},
                          "fit on cohort", {EvidenceReference("docs/fits/base.md")}, t0());
}

void test_bounds() {
  const ClosedInterval unit(0.0, 1.0);
  expect_true(unit.contains(0.0) && unit.contains(1.0), "closed interval includes endpoints");
  expect_true(!unit.contains(std::nan("")), "NaN never contained");

  expect_throw<OutOfBoundsError>([] { ClosedInterval(1.0, 0.0); }, "inverted interval rejected");
  expect_throw<OutOfBoundsError>([] { ClosedInterval(0.0, std::numeric_limits<double>::infinity()); },
                                 "infinite endpoint rejected");

  const BoundedParameter p("alpha", 0.25, unit);
  expect_true(p.value() == 0.25 && p.name() == "alpha", "in-range parameter kept verbatim");

  expect_throw<OutOfBoundsError>([&] { BoundedParameter("alpha", 1.0000001, unit); },
                                 "value above upper bound rejected");
  expect_throw<OutOfBoundsError>([&] { BoundedParameter("alpha", -0.5, unit); },
                                 "value below lower bound rejected");
  expect_throw<OutOfBoundsError>([&] { BoundedParameter("", 0.5, unit); }, "empty name rejected");

  // Load errors share a base class so a loader can report them uniformly.
  expect_throw<CalibrationLoadError>([&] { BoundedParameter("alpha", 2.0, unit); },
                                     "OutOfBoundsError is a CalibrationLoadError");
}

void test_evidence() {
  const EvidenceReference src("src/fit/base.cpp");
  expect_true(src.kind() == EvidenceKind::kSource, "src/ locator");
  expect_true(EvidenceReference("artifacts/a.json", std::string("00ff")).kind() == EvidenceKind::kArtifact,
              "artifacts/ locator with content id");
  expect_true(EvidenceReference("docs/x.md").kind() == EvidenceKind::kDocumentation, "docs/ locator");

  expect_throw<InvalidEvidenceError>([] { EvidenceReference(""); }, "empty locator");
  expect_throw<InvalidEvidenceError>([] { EvidenceReference("/etc/passwd"); }, "absolute locator");
  expect_throw<InvalidEvidenceError>([] { EvidenceReference("docs/"); }, "bare prefix");
  expect_throw<InvalidEvidenceError>([] { EvidenceReference("docs/../secret"); }, "parent segment");
  expect_throw<InvalidEvidenceError>([] { EvidenceReference("docs/a.md", std::string("xyz")); },
                                     "non-hex content id");
  expect_true(EvidenceReference("docs/a..b.md").locator() == "docs/a..b.md", "dots inside a name are fine");
}

void test_layer() {
  const CalibrationLayer a = make_layer("v1", 0.5, 20);
  const CalibrationLayer b = make_layer("v1", 0.5, 20);
  expect_true(a.content_hash().size() == 64, "content hash is sha256 hex");
  expect_true(a.content_hash() == b.content_hash(), "content hash is deterministic");
  expect_true(make_layer("v1", 0.51, 20).content_hash() != a.content_hash(), "hash covers parameter values");
  expect_true(make_layer("v2", 0.5, 20).content_hash() != a.content_hash(), "hash covers version");

  expect_true(a.parameter("prior_strength").value() == 0.5, "parameter lookup");
  expect_true(a.find_parameter("nope") == nullptr, "absent parameter");
  expect_throw<ConfigError>([&] { (void)a.parameter("nope"); }, "parameter() on absent name");

  expect_throw<IncompleteProvenanceError>(
      [] {
        CalibrationLayer("@b", "v1", {BoundedParameter("k", 1.0, ClosedInterval(0, 2))}, "   ",
                         {EvidenceReference("docs/x.md")}, t0());
      },
      "blank rationale");
  expect_throw<IncompleteProvenanceError>(
      [] {
        CalibrationLayer("@b", "v1", {BoundedParameter("k", 1.0, ClosedInterval(0, 2))}, "why", {}, t0());
      },
      "no evidence");
  expect_throw<ConfigError>(
      [] {
        CalibrationLayer("@b", "v1",
                         {BoundedParameter("k", 1.0, ClosedInterval(0, 2)),
                          BoundedParameter("k", 1.5, ClosedInterval(0, 2))},
                         "why", {EvidenceReference("docs/x.md")}, t0());
      },
      "duplicate parameter name");

  const CalibrationLayer next =
      a.supersede("v2", {BoundedParameter("prior_strength", 0.42, ClosedInterval(0.0, 1.0))}, "refit",
                  {EvidenceReference("artifacts/refit.json")}, t0());
  expect_true(next.supersedes() && *next.supersedes() == a.content_hash(), "supersede links by content hash");
  expect_true(next.layer_id() == a.layer_id() && next.version() == "v2", "supersede keeps layer id");
  expect_true(!a.supersedes(), "original layer untouched");
  expect_throw<ConfigError>(
      [&] { (void)a.supersede("v1", {}, "same", {EvidenceReference("docs/x.md")}, t0()); },
      "supersede requires a new version");

  const JsonValue j = a.to_json();
  expect_true(j.find("content_hash") && j.find("content_hash")->as_string() == a.content_hash(),
              "to_json carries the hash");
  expect_true(a.to_json(false).find("content_hash") == nullptr, "hash-free body");
}

void test_drift() {
  expect_true(drift_ratio(0.5, 0.5) == 0.0, "no change");
  expect_true(std::fabs(drift_ratio(0.5, 0.55) - 0.1) < 1e-12, "relative ratio");
  expect_true(drift_ratio(0.0, 0.2) == 0.2, "absolute difference near zero");

  expect_true(classify_drift(0.0) == DriftSeverity::kNone, "NONE band");
  expect_true(classify_drift(0.05) == DriftSeverity::kMinor, "MINOR band");
  expect_true(classify_drift(0.10) == DriftSeverity::kModerate, "MODERATE lower edge");
  expect_true(classify_drift(0.30) == DriftSeverity::kSignificant, "SIGNIFICANT lower edge");
  expect_true(classify_drift(0.50) == DriftSeverity::kCritical, "CRITICAL lower edge");

  const CalibrationLayer v0 = make_layer("v0", 0.50, 20);
  const CalibrationLayer v1 = make_layer("v1", 0.42, 20);
  const DriftReport small = compute_parameter_drift(v0, v1);
  expect_true(small.drifts.size() == 1 && small.drifts[0].name == "prior_strength",
              "only moved parameters are listed");
  expect_true(small.overall == DriftSeverity::kModerate && !small.requires_review(),
              "16% move is MODERATE");

  const CalibrationLayer v2 = make_layer("v2", 0.50, 40);
  const DriftReport big = compute_parameter_drift(v0, v2);
  expect_true(big.overall == DriftSeverity::kCritical && big.requires_review(), "doubling is CRITICAL");

  const CalibrationLayer other("@q", "v1", {BoundedParameter("k", 1.0, ClosedInterval(0, 2))}, "why",
                               {EvidenceReference("docs/x.md")}, t0());
  expect_throw<ConfigError>([&] { (void)compute_parameter_drift(v0, other); }, "drift across layers refused");

  const CalibrationLayer renamed("@b", "v3", {BoundedParameter("prior_strength", 0.5, ClosedInterval(0, 1)),
                                              BoundedParameter("window", 7, ClosedInterval(1, 30))},
                                 "why", {EvidenceReference("docs/x.md")}, t0());
  const DriftReport shape = compute_parameter_drift(v0, renamed);
  expect_true(shape.added == std::vector<std::string>{"window"}, "added parameter reported");
  expect_true(shape.removed == std::vector<std::string>{"min_support"}, "removed parameter reported");
  expect_true(shape.drifts.empty() && shape.overall == DriftSeverity::kNone, "unchanged values stay quiet");
  expect_true(shape.recommendations.size() == 1 && !shape.requires_recalibration(), "stable layer, one note");
  expect_true(shape.baseline_hash == v0.content_hash() && shape.current_hash == renamed.content_hash(),
              "report pins both layer hashes");
  expect_true(!small.requires_recalibration() && !small.dispersion_penalty, "MODERATE alone needs nothing");
  expect_true(big.requires_recalibration(), "CRITICAL drift needs recalibration");
}

CalibrationLayer gate_layer(const std::string& version, double prior, double veto, double coverage) {
  return CalibrationLayer("@b", version,
                          {BoundedParameter("prior_strength", prior, ClosedInterval(0.0, 1.0)),
                           BoundedParameter("veto_threshold", veto, ClosedInterval(0.0, 1.0)),
                           BoundedParameter("extraction_coverage_target", coverage, ClosedInterval(0.0, 1.0))},
                          "gate fit", {EvidenceReference("docs/fits/gate.md")}, t0());
}

bool mentions(const std::vector<std::string>& lines, const std::string& needle) {
  for (const auto& l : lines) {
    if (l.find(needle) != std::string::npos) return true;
  }
  return false;
}

void test_drift_flags() {
  const CalibrationLayer base = gate_layer("v0", 0.50, 0.60, 0.90);

  // Prior up with veto down is the expected coupling.
  const DriftReport coupled = compute_parameter_drift(base, gate_layer("v1", 0.52, 0.58, 0.90));
  expect_true(!coupled.contradiction && !coupled.requires_recalibration(), "opposite moves are consistent");
  expect_true(coupled.overall == DriftSeverity::kMinor, "small coupled move is MINOR");

  const DriftReport both_up = compute_parameter_drift(base, gate_layer("v1", 0.52, 0.62, 0.90));
  expect_true(both_up.contradiction, "prior and veto both rising is a contradiction");
  expect_true(both_up.overall == DriftSeverity::kMinor && both_up.requires_recalibration(),
              "contradiction forces recalibration below CRITICAL");
  expect_true(mentions(both_up.recommendations, "same direction"), "contradiction recommended on");

  const DriftReport both_down = compute_parameter_drift(base, gate_layer("v1", 0.48, 0.58, 0.90));
  expect_true(both_down.contradiction, "prior and veto both falling is a contradiction");

  const DriftReport veto_only = compute_parameter_drift(base, gate_layer("v1", 0.50, 0.70, 0.90));
  expect_true(!veto_only.contradiction, "one moved parameter cannot contradict");

  const DriftReport low_cov = compute_parameter_drift(base, gate_layer("v1", 0.50, 0.60, 0.80));
  expect_true(low_cov.coverage_penalty, "coverage target below 0.85 penalized");
  expect_true(mentions(low_cov.recommendations, "extraction_coverage_target"), "coverage recommended on");
  const DriftReport edge_cov = compute_parameter_drift(base, gate_layer("v1", 0.50, 0.60, 0.85));
  expect_true(!edge_cov.coverage_penalty, "coverage at 0.85 not penalized");

  // Veto +50% is CRITICAL; the other two moves are small, so 1 of 3 is heavy.
  const DriftReport one_heavy = compute_parameter_drift(base, gate_layer("v1", 0.51, 0.90, 0.91));
  expect_true(one_heavy.drifts.size() == 3 && !one_heavy.dispersion_penalty, "one heavy drift of three");
  expect_true(mentions(one_heavy.recommendations, "veto_threshold drifted 50.0%"), "critical drift named");

  const DriftReport dispersed = compute_parameter_drift(base, gate_layer("v1", 0.80, 0.90, 0.91));
  expect_true(dispersed.dispersion_penalty, "two heavy drifts of three penalized");

  const JsonValue j = both_up.to_json();
  expect_true(j.find("contradiction")->as_bool() && j.find("requires_recalibration")->as_bool(),
              "flags serialized");
  expect_true(j.find("recommendations")->as_array().size() == both_up.recommendations.size(),
              "recommendations serialized");
}

std::map<std::string, double> reference_scores() {
  return {{"@b", 0.88}, {"@u", 0.76}, {"@q", 0.91}, {"@d", 0.95},
          {"@p", 0.83}, {"@C", 0.94}, {"@chain", 1.0}, {"@m", 0.72}};
}

void test_layers_and_scores() {
  expect_true(kAllLayers.size() == kLayerCount && kLayerCount == 8, "eight layers");
  for (LayerId id : kAllLayers) {
    const auto back = parse_layer_symbol(layer_symbol(id));
    expect_true(back && *back == id, std::string("symbol round trip ") + std::string(layer_symbol(id)));
  }
  expect_true(!parse_layer_symbol("@x") && !parse_layer_symbol("b"), "unknown symbols");

  const LayerScoreVector s = LayerScoreVector::from_named(reference_scores());
  expect_true(s[LayerId::kBase] == 0.88 && s.get(LayerId::kChain) == 1.0, "named scores mapped by symbol");

  try {
    auto bad = reference_scores();
    bad.erase("@m");
    (void)LayerScoreVector::from_named(bad);
    fail("missing layer accepted");
  } catch (const MissingLayerError& e) {
    expect_true(e.field() == "@m", "missing layer named in field");
  }

  try {
    auto bad = reference_scores();
    bad["@x"] = 0.5;
    (void)LayerScoreVector::from_named(bad);
    fail("unexpected layer accepted");
  } catch (const UnexpectedLayerError& e) {
    expect_true(e.field() == "@x", "unexpected layer named in field");
  }

  try {
    auto bad = reference_scores();
    bad["@q"] = 1.2;
    (void)LayerScoreVector::from_named(bad);
    fail("out-of-range score accepted");
  } catch (const ScoreOutOfRangeError& e) {
    expect_true(e.field() == "@q" && e.expected() == "[0, 1]", "range violation names field and range");
  }

  expect_throw<ScoreOutOfRangeError>([&] { (void)s.with(LayerId::kUnit, std::nan("")); }, "NaN score rejected");
  expect_throw<ScoreOutOfRangeError>([] { LayerScoreVector(0, 0, 0, 0, 0, 0, 0, -0.01); },
                                     "negative positional score rejected");
  expect_true(s.with(LayerId::kUnit, 0.4)[LayerId::kUnit] == 0.4, "with() replaces one layer");
  expect_true(s[LayerId::kUnit] == 0.76, "with() leaves the original alone");

  JsonValue obj = JsonValue::make_object();
  for (const auto& [k, v] : reference_scores()) obj.set(k, JsonValue::make_number(v));
  expect_true(LayerScoreVector::from_json(obj).values() == s.values(), "from_json agrees with from_named");
  obj.set("@u", JsonValue::make_string("high"));
  expect_throw<ScoreOutOfRangeError>([&] { (void)LayerScoreVector::from_json(obj); }, "non-numeric score");
  expect_throw<InputError>([] { (void)LayerScoreVector::from_json(JsonValue::make_array()); },
                           "non-object scores");
}

}  // namespace
}  // namespace calfuse

int main() {
  calfuse::set_log_level(calfuse::LogLevel::WARN);
  calfuse::test_bounds();
  calfuse::test_evidence();
  calfuse::test_layer();
  calfuse::test_drift();
  calfuse::test_drift_flags();
  calfuse::test_layers_and_scores();

  if (calfuse::g_fail_count != 0) {
    std::cerr << "[FAIL] calibration_selftest: " << calfuse::g_fail_count << " failure(s)\n";
    return 1;
  }
  std::cerr << "[ OK ] calibration_selftest\n";
  return 0;
}
