// ============================================================================
// Fusion selftest: weight-set normalization, reference scenarios, grid checks
// for boundedness and monotonicity, breakdown attribution.
// ============================================================================

#include <array>
#include <map>
#include <random>
#include <string>
#include <vector>

#include "engine/core/errors.hpp"
#include "engine/core/selftest.hpp"
#include "engine/fusion/choquet.hpp"
#include "engine/fusion/fusion_weight_set.hpp"

namespace calfuse {
namespace {

using selftest::Report;
using selftest::near;

std::array<double, kLayerCount> executor_linear() {
  // b, chain, q, d, p, C, u, m
  return {0.17, 0.13, 0.08, 0.07, 0.06, 0.08, 0.04, 0.04};
}

std::vector<InteractionTerm> executor_interactions() {
  return {{LayerId::kUnit, LayerId::kChain, 0.13},
          {LayerId::kChain, LayerId::kCongruence, 0.10},
          {LayerId::kQuestion, LayerId::kDimension, 0.10}};
}

FusionWeightSet executor() {
  return FusionWeightSet(FusionRole::EXECUTOR, executor_linear(), executor_interactions());
}

LayerScoreVector reference_scores() {
  // b, chain, q, d, p, C, u, m
  return LayerScoreVector(0.88, 1.0, 0.91, 0.95, 0.83, 0.94, 0.76, 0.72);
}

void test_weight_set(Report& r) {
  const FusionWeightSet ws = executor();
  r.check(near(ws.linear_sum() + ws.interaction_sum(), 1.0, 0.0, 1e-9), "reference weights sum to one");
  r.check(ws.interactions().size() == 3, "three interaction terms");

  // (@u,@chain) is stored as (@chain,@u); sort order is by (first, second) index.
  const auto& it = ws.interactions();
  r.check(it[0].first == LayerId::kChain && it[0].second == LayerId::kCongruence, "pairs sorted");
  r.check(it[1].first == LayerId::kChain && it[1].second == LayerId::kUnit, "pair normalized to index order");
  r.check(it[2].first == LayerId::kQuestion && it[2].second == LayerId::kDimension, "last pair");

  r.check(ws.id().rfind("EXECUTOR:", 0) == 0 && ws.id().size() == 9 + 16, "weight set id shape");
  r.check(executor().id() == ws.id(), "weight set id deterministic");

  // Declaring the pair in the other order is the same weight set.
  auto swapped = executor_interactions();
  swapped[0] = {LayerId::kChain, LayerId::kUnit, 0.13};
  r.check(FusionWeightSet(FusionRole::EXECUTOR, executor_linear(), swapped).id() == ws.id(),
          "pair order does not change the id");
  r.check(FusionWeightSet(FusionRole::CLUSTER, executor_linear(), executor_interactions()).id() != ws.id(),
          "role is part of the id");

  for (double b : {0.16, 0.18, 0.15}) {
    auto lin = executor_linear();
    lin[layer_index(LayerId::kBase)] = b;
    r.check(selftest::throws_as<WeightNormalizationError>(
                r, "sum", [&] { FusionWeightSet(FusionRole::EXECUTOR, lin, executor_interactions()); }),
            "sum off by " + std::to_string(b - 0.17) + " rejected");
  }

  {
    auto lin = executor_linear();
    lin[layer_index(LayerId::kMeta)] = -0.04;
    lin[layer_index(LayerId::kBase)] = 0.25;
    r.check(selftest::throws_as<WeightNormalizationError>(
                r, "negative", [&] { FusionWeightSet(FusionRole::EXECUTOR, lin, executor_interactions()); }),
            "negative weight rejected even when the sum is one");
  }
  {
    auto terms = executor_interactions();
    terms[0] = {LayerId::kUnit, LayerId::kUnit, 0.13};
    r.check(selftest::throws_as<WeightNormalizationError>(
                r, "self", [&] { FusionWeightSet(FusionRole::EXECUTOR, executor_linear(), terms); }),
            "self pair rejected");
  }
  {
    auto terms = executor_interactions();
    terms[1] = {LayerId::kChain, LayerId::kUnit, 0.10};
    r.check(selftest::throws_as<WeightNormalizationError>(
                r, "dup", [&] { FusionWeightSet(FusionRole::EXECUTOR, executor_linear(), terms); }),
            "duplicate pair rejected");
  }

  const auto key = parse_interaction_key("@u,@chain");
  r.check(key.first == LayerId::kChain && key.second == LayerId::kUnit, "interaction key parsed and ordered");
  const auto same = parse_interaction_key("@chain, @u");
  r.check(same == key, "written order does not change the pair");
  r.check(selftest::throws_as<WeightNormalizationError>(r, "key", [] { (void)parse_interaction_key("@u"); }),
          "key without comma");
  r.check(selftest::throws_as<WeightNormalizationError>(r, "key", [] { (void)parse_interaction_key("@u,@x"); }),
          "key with unknown layer");

  RoleWeightTable table;
  table.add(executor());
  r.check(table.has(FusionRole::EXECUTOR) && !table.has(FusionRole::MACRO), "table membership");
  r.check(table.at("EXECUTOR").id() == ws.id(), "lookup by name");
  r.check(selftest::throws_as<ConfigError>(r, "dup role", [&] { table.add(executor()); }), "duplicate role");
  r.check(selftest::throws_as<UnknownRoleError>(r, "unset", [&] { (void)table.at(FusionRole::CLUSTER); }),
          "unconfigured role");
  r.check(selftest::throws_as<UnknownRoleError>(r, "name", [&] { (void)table.at("PILOT"); }), "unknown role name");
  r.check(table.configured_roles() == std::vector<FusionRole>{FusionRole::EXECUTOR}, "configured roles");
}

void test_reference_scenarios(Report& r) {
  const FusionWeightSet ws = executor();
  const LayerScoreVector base = reference_scores();

  // Linear 0.6031 + interaction 0.2838.
  r.check(near(evaluate(base, ws), 0.8869), "reference scenario");

  // Weak unit layer: linear loses 0.0144, the (@u,@chain) term drops to 0.13*0.40.
  r.check(near(evaluate(base.with(LayerId::kUnit, 0.40), ws), 0.8257), "weak unit layer");

  // Broken chain: both chain interactions collapse to zero.
  const double broken = evaluate(base.with(LayerId::kChain, 0.0), ws);
  r.check(near(broken, 0.5641), "broken chain");
  r.check(broken < evaluate(base, ws) - 0.3, "broken chain is heavily penalized");

  const std::map<std::string, double> named = {{"@b", 0.88}, {"@u", 0.76}, {"@q", 0.91}, {"@d", 0.95},
                                                {"@p", 0.83}, {"@C", 0.94}, {"@chain", 1.0}, {"@m", 0.72}};
  r.check(evaluate_named(named, ws) == evaluate(base, ws), "named input agrees");

  auto missing = named;
  missing.erase("@chain");
  r.check(selftest::throws_as<MissingLayerError>(r, "missing", [&] { (void)evaluate_named(missing, ws); }),
          "named input with a missing layer");
}

void test_grids(Report& r) {
  const FusionWeightSet ws = executor();

  r.check(evaluate(LayerScoreVector(0, 0, 0, 0, 0, 0, 0, 0), ws) == 0.0, "all zero scores fuse to zero");
  r.check(near(evaluate(LayerScoreVector(1, 1, 1, 1, 1, 1, 1, 1), ws), 1.0, 0.0, 1e-9),
          "all one scores fuse to one");

  std::mt19937 rng(20240315u);
  std::uniform_real_distribution<double> unit(0.0, 1.0);

  int bounded_failures = 0;
  int monotone_failures = 0;
  for (int trial = 0; trial < 200; ++trial) {
    LayerScoreVector s(unit(rng), unit(rng), unit(rng), unit(rng), unit(rng), unit(rng), unit(rng), unit(rng));
    const double v = evaluate(s, ws);
    if (!(v >= 0.0 && v <= 1.0 + 1e-12)) ++bounded_failures;

    for (LayerId id : kAllLayers) {
      double prev = evaluate(s.with(id, 0.0), ws);
      for (int k = 1; k <= 10; ++k) {
        const double cur = evaluate(s.with(id, k / 10.0), ws);
        if (cur < prev) ++monotone_failures;
        prev = cur;
      }
    }
  }
  r.check(bounded_failures == 0, "fused score stays in [0, 1] over random grid");
  r.check(monotone_failures == 0, "fused score is non-decreasing in every layer");

  // An interaction term is capped by its weaker partner.
  const LayerScoreVector s = reference_scores();
  const double lifted = evaluate(s.with(LayerId::kChain, 0.2).with(LayerId::kUnit, 1.0), ws);
  const double capped = evaluate(s.with(LayerId::kChain, 0.2).with(LayerId::kUnit, 0.2), ws);
  r.check(near(lifted - capped, 0.04 * 0.8), "raising the stronger partner only moves the linear term");
}

void test_breakdown(Report& r) {
  const FusionWeightSet ws = executor();
  const LayerScoreVector s = reference_scores();
  const FusionBreakdown b = evaluate_with_breakdown(s, ws);

  r.check(b.score == evaluate(s, ws), "breakdown score matches evaluate");
  r.check(near(b.linear_total, 0.6031) && near(b.interaction_total, 0.2838), "linear and interaction totals");
  r.check(b.layers.size() == kLayerCount && b.interactions.size() == 3, "one row per term");
  r.check(b.dominant_layer == LayerId::kBase, "base layer dominates the linear part");
  r.check(b.dominant_interaction.has_value(), "dominant interaction present");
  if (b.dominant_interaction) {
    const auto& d = b.interactions[*b.dominant_interaction];
    r.check(d.first == LayerId::kChain && d.second == LayerId::kUnit, "(@chain,@u) dominates the interactions");
  }
  r.check(b.summary.find("score=0.8869") != std::string::npos, "summary carries the score");
  r.check(b.summary.find("dominant=@b (base)") != std::string::npos, "summary names the dominant layer");

  const JsonValue j = b.to_json();
  r.check(j.find("layers") && j.find("layers")->find("@chain"), "json breakdown keyed by symbol");

  // Equal contributions: the earlier layer wins.
  const std::array<double, kLayerCount> flat = {0.125, 0.125, 0.125, 0.125, 0.125, 0.125, 0.125, 0.125};
  const FusionWeightSet even(FusionRole::MACRO, flat, {});
  const FusionBreakdown tie = evaluate_with_breakdown(LayerScoreVector(1, 1, 1, 1, 1, 1, 1, 1), even);
  r.check(tie.dominant_layer == LayerId::kBase && !tie.dominant_interaction, "ties resolve to the first layer");
}

}  // namespace
}  // namespace calfuse

int main() {
  calfuse::selftest::Report r;
  calfuse::test_weight_set(r);
  calfuse::test_reference_scenarios(r);
  calfuse::test_grids(r);
  calfuse::test_breakdown(r);
  return calfuse::selftest::finish(r, "choquet_selftest");
}
