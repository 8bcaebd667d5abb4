// Veto cascade selftest. Non-zero exit on failure.

#include <algorithm>
#include <limits>
#include <numeric>
#include <string>
#include <utility>
#include <vector>

#include "engine/core/errors.hpp"
#include "engine/core/selftest.hpp"
#include "engine/veto/veto_coordinator.hpp"

namespace calfuse {
namespace {

using selftest::Report;

VetoResult veto(std::string layer, bool triggered, double specificity, std::string reason = {}) {
  VetoResult r;
  r.layer_id = std::move(layer);
  r.triggered = triggered;
  r.specificity_score = specificity;
  r.reason = std::move(reason);
  return r;
}

bool same(const VetoResult& a, const VetoResult& b) {
  return a.layer_id == b.layer_id && a.triggered == b.triggered &&
         a.specificity_score == b.specificity_score && a.reason == b.reason;
}

std::vector<VetoResult> mixed_results() {
  return {veto("@q", true, 0.4, "question scope mismatch"),
          veto("@chain", true, 0.9, "chain incomplete"),
          veto("@p", false, 0.95, "policy ok"),
          veto("@u", true, 0.9, "unit untestable"),
          veto("@m", false, 0.1)};
}

void test_selection(Report& r) {
  const auto selected = execute_veto_cascade(mixed_results());
  r.check(selected.has_value(), "a triggered result vetoes");
  // 0.95 is not triggered; @chain and @u tie at 0.9, @chain has priority.
  if (selected) r.check(selected->layer_id == "@chain" && selected->reason == "chain incomplete", "winner");

  r.check(!execute_veto_cascade({}).has_value(), "no results, no veto");
  r.check(!execute_veto_cascade({veto("@b", false, 1.0), veto("@m", false, 0.5)}).has_value(),
          "nothing triggered, no veto");

  const VetoCascadeReport rep = run_veto_cascade(mixed_results());
  r.check(rep.vetoed() && rep.veto()->layer_id == "@chain", "report agrees with execute");
  r.check(rep.suppressed.size() == 2, "other triggered results suppressed");
  if (rep.suppressed.size() == 2) {
    r.check(rep.ordered[rep.suppressed[0]].layer_id == "@u" && rep.ordered[rep.suppressed[1]].layer_id == "@q",
            "suppressed in cascade order");
  }
  const JsonValue j = rep.to_json();
  r.check(j.find("selected") && j.find("selected")->find("layer_id")->as_string() == "@chain", "report json");
}

void test_order_independence(Report& r) {
  const auto base = mixed_results();
  const auto expected = order_veto_results(base);

  std::vector<size_t> idx(base.size());
  std::iota(idx.begin(), idx.end(), size_t{0});
  int permutations = 0;
  int mismatches = 0;
  do {
    std::vector<VetoResult> shuffled;
    for (size_t i : idx) shuffled.push_back(base[i]);
    const auto ordered = order_veto_results(shuffled);
    for (size_t k = 0; k < ordered.size(); ++k) {
      if (!same(ordered[k], expected[k])) {
        ++mismatches;
        break;
      }
    }
    const auto sel = execute_veto_cascade(shuffled);
    if (!sel || sel->layer_id != "@chain") ++mismatches;
    ++permutations;
  } while (std::next_permutation(idx.begin(), idx.end()));

  r.check(permutations == 120, "every permutation visited");
  r.check(mismatches == 0, "cascade result independent of input order");

  const auto twice = order_veto_results(expected);
  bool idempotent = twice.size() == expected.size();
  for (size_t k = 0; idempotent && k < twice.size(); ++k) idempotent = same(twice[k], expected[k]);
  r.check(idempotent, "ordering is idempotent");
}

void test_tie_breaks(Report& r) {
  // Same specificity across every known layer: fixed priority order.
  std::vector<VetoResult> all = {veto("@m", true, 0.5), veto("@u", true, 0.5), veto("@C", true, 0.5),
                                 veto("@p", true, 0.5), veto("@d", true, 0.5), veto("@q", true, 0.5),
                                 veto("@chain", true, 0.5), veto("@b", true, 0.5)};
  const auto ordered = order_veto_results(all);
  const std::vector<std::string> want = {"@b", "@chain", "@q", "@d", "@p", "@C", "@u", "@m"};
  bool match = ordered.size() == want.size();
  for (size_t i = 0; match && i < want.size(); ++i) match = ordered[i].layer_id == want[i];
  r.check(match, "layer priority breaks specificity ties");

  // Unknown ids rank after known layers, lexicographically among themselves.
  const auto ext = order_veto_results({veto("zeta", true, 0.5), veto("@m", true, 0.5), veto("alpha", true, 0.5)});
  r.check(ext[0].layer_id == "@m" && ext[1].layer_id == "alpha" && ext[2].layer_id == "zeta",
          "unknown layer ids after known ones");
  r.check(veto_layer_priority("@b") == 0 && veto_layer_priority("custom") == 8, "priority ranks");

  // Same layer and score: the triggered entry wins.
  const auto sel = execute_veto_cascade({veto("@q", false, 0.7, "a"), veto("@q", true, 0.7, "b")});
  r.check(sel && sel->reason == "b", "triggered entry wins an exact tie");

  // Specificity dominates priority.
  const auto spec = execute_veto_cascade({veto("@b", true, 0.2), veto("@m", true, 0.21)});
  r.check(spec && spec->layer_id == "@m", "higher specificity beats layer priority");
}

void test_invalid(Report& r) {
  try {
    (void)order_veto_results({veto("@b", true, 0.5), veto("@q", true, std::numeric_limits<double>::quiet_NaN())});
    r.fail("NaN specificity accepted");
  } catch (const InvalidVetoError& e) {
    r.check(e.field() == "veto_results[1].specificity_score", "NaN specificity named by index");
  }
  r.check(selftest::throws_as<InvalidVetoError>(
              r, "inf", [] { (void)execute_veto_cascade({veto("@b", true, std::numeric_limits<double>::infinity())}); }),
          "infinite specificity rejected");
  r.check(selftest::throws_as<InvalidVetoError>(r, "empty", [] { (void)run_veto_cascade({veto("", true, 0.5)}); }),
          "empty layer id rejected");

  JsonValue j = JsonValue::make_object();
  j.set("layer_id", JsonValue::make_string("@d"));
  j.set("triggered", JsonValue::make_string("yes"));
  j.set("specificity_score", JsonValue::make_number(0.3));
  try {
    (void)VetoResult::from_json(j, 2);
    r.fail("string triggered accepted");
  } catch (const InvalidVetoError& e) {
    r.check(e.field() == "veto_results[2].triggered", "bad triggered field named");
  }

  j.set("triggered", JsonValue::make_bool(true));
  const VetoResult ok = VetoResult::from_json(j, 0);
  r.check(ok.layer_id == "@d" && ok.triggered && ok.reason.empty(), "reason is optional");
  r.check(same(VetoResult::from_json(ok.to_json(), 0), ok), "json round trip");
}

}  // namespace
}  // namespace calfuse

int main() {
  calfuse::selftest::Report r;
  calfuse::test_selection(r);
  calfuse::test_order_independence(r);
  calfuse::test_tie_breaks(r);
  calfuse::test_invalid(r);
  return calfuse::selftest::finish(r, "veto_selftest");
}
