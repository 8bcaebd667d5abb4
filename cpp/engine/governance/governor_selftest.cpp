/*
  Governance selftest: dependency graph construction, cycle and level-inversion
  detection, bounded multiplicative operator.
*/

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/governance/dependency_graph.hpp"
#include "engine/governance/interaction_governor.hpp"

namespace calfuse::governance {
namespace {

using selftest::Report;
using Path = std::vector<std::string>;

DependencyGraph chain_graph() {
  DependencyGraph g;
  g.add_node("base", EpistemicTier::EMPIRICAL);
  g.add_node("question", EpistemicTier::EMPIRICAL);
  g.add_node("chain", EpistemicTier::INFERENTIAL);
  g.add_node("meta", EpistemicTier::AUDIT);
  g.add_edge("base", "chain");
  g.add_edge("question", "chain");
  g.add_edge("chain", "meta");
  return g;
}

void test_graph_structure(Report& r) {
  DependencyGraph g = chain_graph();
  r.check(g.node_count() == 4 && g.edge_count() == 3, "node and edge counts");
  r.check(g.tier("meta") == EpistemicTier::AUDIT, "tier lookup");
  r.check(selftest::throws_as<ConfigError>(r, "tier", [&] { (void)g.tier("nope"); }), "unknown tier lookup");
  r.check(selftest::throws_as<ConfigError>(r, "dup node", [&] { g.add_node("base", EpistemicTier::AUDIT); }),
          "duplicate node");
  r.check(selftest::throws_as<ConfigError>(r, "empty", [&] { g.add_node("", EpistemicTier::AUDIT); }),
          "empty node id");
  r.check(selftest::throws_as<ConfigError>(r, "dangling", [&] { g.add_edge("base", "ghost"); }),
          "edge to unknown node");
  r.check(selftest::throws_as<ConfigError>(r, "dup edge", [&] { g.add_edge("base", "chain"); }),
          "duplicate edge");

  r.check(parse_epistemic_tier("N2") == EpistemicTier::INFERENTIAL, "tier alias");
  r.check(!parse_epistemic_tier("N4"), "unknown tier");
  r.check(parse_edge_kind("ADVISORY") == EdgeKind::ADVISORY && !parse_edge_kind("SOFT"), "edge kinds");
}

void test_acyclic(Report& r) {
  const DependencyGraph g = chain_graph();
  const Path order = validate(g);
  r.check(order == Path{"base", "question", "chain", "meta"}, "topological order with id tie-break");
  r.check(collect_violations(g).empty(), "clean graph has no violations");
}

void test_cycles(Report& r) {
  {
    DependencyGraph g;
    g.add_node("a", EpistemicTier::INFERENTIAL);
    g.add_node("b", EpistemicTier::INFERENTIAL);
    g.add_node("c", EpistemicTier::INFERENTIAL);
    g.add_node("d", EpistemicTier::INFERENTIAL);
    g.add_edge("b", "c");
    g.add_edge("c", "a");
    g.add_edge("a", "b");
    g.add_edge("c", "d");
    try {
      (void)check_acyclic(g);
      r.fail("three-node cycle not detected");
    } catch (const CyclicDependencyError& e) {
      r.check(e.cycle() == Path{"a", "b", "c", "a"}, "cycle named in edge order from the smallest id");
      r.check(e.message().find("a -> b -> c -> a") != std::string::npos, "cycle path in message");
      r.check(e.code() == ErrorCode::kCyclicDependency, "cycle error code");
    }
  }
  {
    DependencyGraph g;
    g.add_node("solo", EpistemicTier::EMPIRICAL);
    g.add_edge("solo", "solo");
    try {
      (void)validate(g);
      r.fail("self loop not detected");
    } catch (const CyclicDependencyError& e) {
      r.check(e.cycle() == Path{"solo", "solo"}, "self loop reported as a one-node cycle");
    }
  }
  {
    // Advisory edges still close cycles.
    DependencyGraph g;
    g.add_node("x", EpistemicTier::EMPIRICAL);
    g.add_node("y", EpistemicTier::AUDIT);
    g.add_edge("x", "y");
    g.add_edge("y", "x", EdgeKind::ADVISORY);
    r.check(selftest::throws_as<CyclicDependencyError>(r, "advisory cycle", [&] { (void)validate(g); }),
            "advisory edge participates in cycle detection");
    const auto v = collect_violations(g);
    r.check(v.size() == 1 && v[0].kind == ViolationKind::kCycle, "cycle collected without throwing");
  }
  {
    // Two independent cycles, a self-loop, and a node that only sits downstream of one.
    DependencyGraph g;
    for (const char* id : {"a", "b", "p", "q", "r", "s", "z"}) g.add_node(id, EpistemicTier::INFERENTIAL);
    g.add_edge("a", "b");
    g.add_edge("b", "a");
    g.add_edge("p", "q");
    g.add_edge("q", "r");
    g.add_edge("r", "p");
    g.add_edge("s", "s");
    g.add_edge("b", "z");
    const auto v = collect_violations(g);
    r.check(v.size() == 3, "one cycle per cyclic component");
    if (v.size() == 3) {
      r.check(v[0].nodes == Path{"a", "b", "a"}, "first component");
      r.check(v[1].nodes == Path{"p", "q", "r", "p"}, "second component");
      r.check(v[2].nodes == Path{"s", "s"}, "self-loop component");
    }
    for (const auto& x : v) {
      r.check(std::find(x.nodes.begin(), x.nodes.end(), "z") == x.nodes.end(), "downstream node is not a cycle");
    }
  }
}

void test_inversions(Report& r) {
  {
    DependencyGraph g = chain_graph();
    g.add_node("audit_feed", EpistemicTier::AUDIT);
    g.add_edge("audit_feed", "chain");
    try {
      (void)validate(g);
      r.fail("audit -> inferential inversion not detected");
    } catch (const LevelInversionError& e) {
      r.check(e.edges().size() == 1 && e.edges()[0] == LevelInversionError::Edge{"audit_feed", "chain"},
              "inverted edge named");
      r.check(e.message().find("AUDIT") != std::string::npos &&
                  e.message().find("INFERENTIAL") != std::string::npos,
              "tiers in message");
    }
  }
  {
    DependencyGraph g = chain_graph();
    g.add_node("audit_feed", EpistemicTier::AUDIT);
    g.add_edge("audit_feed", "chain");
    g.add_node("late_review", EpistemicTier::AUDIT);
    g.add_edge("late_review", "base");  // AUDIT -> EMPIRICAL
    try {
      check_level_inversions(g);
      r.fail("two inversions not detected");
    } catch (const LevelInversionError& e) {
      r.check(e.edges().size() == 2, "every inversion listed");
    }
    r.check(collect_violations(g).size() == 2, "both inversions collected");
  }
  {
    DependencyGraph g = chain_graph();
    g.add_node("review_note", EpistemicTier::AUDIT);
    g.add_edge("review_note", "base", EdgeKind::ADVISORY);
    bool ok = true;
    try {
      (void)validate(g);
    } catch (const CalibrationLoadError& e) {
      ok = false;
      r.fail(std::string("advisory downward edge rejected: ") + e.what());
    }
    r.check(ok, "advisory edges are exempt from the inversion rule");
  }
  {
    DependencyGraph g;
    g.add_node("p", EpistemicTier::INFERENTIAL);
    g.add_node("q", EpistemicTier::INFERENTIAL);
    g.add_edge("p", "q");
    r.check(validate(g).size() == 2, "same-tier edges are allowed");
  }
}

void test_bounded_product(Report& r) {
  std::vector<std::string> warnings;
  set_log_sink([&](LogLevel lvl, const std::string& msg) {
    if (lvl == LogLevel::WARN) warnings.push_back(msg);
  });

  const ProductBounds bounds;
  const BoundedProduct inside = bounded_product({2.0, 1.5}, bounds);
  r.check(inside.value == 3.0 && !inside.clamped && warnings.empty(), "in-range product unchanged, no warning");

  const BoundedProduct high = bounded_product({5.0, 5.0}, bounds);
  r.check(high.raw == 25.0 && high.value == 10.0 && high.clamped, "product clamped at max");
  r.check(warnings.size() == 1 && warnings[0].find("clamped") != std::string::npos, "clamp logged at WARN");

  const BoundedProduct low = bounded_product({0.001, 0.5}, bounds);
  r.check(low.value == 0.01 && low.clamped, "product clamped at min");

  const BoundedProduct zero = bounded_product({0.0}, bounds);
  r.check(zero.raw == 0.0 && zero.value == 0.01, "zero factor clamps to min");

  const BoundedProduct empty = bounded_product({}, bounds);
  r.check(empty.value == 1.0 && !empty.clamped, "empty product is one");

  set_log_sink(nullptr);

  try {
    (void)bounded_product({1.0, -2.0}, bounds);
    r.fail("negative factor accepted");
  } catch (const InputError& e) {
    r.check(e.field() == "factors[1]", "negative factor named by index");
  }
  r.check(selftest::throws_as<InputError>(
              r, "nan", [&] { (void)bounded_product({std::numeric_limits<double>::quiet_NaN()}, bounds); }),
          "NaN factor rejected");

  ProductBounds bad;
  bad.min = 2.0;
  bad.max = 1.0;
  r.check(selftest::throws_as<OutOfBoundsError>(r, "bounds", [&] { bad.validate(); }), "inverted bounds");
  bad.min = 0.0;
  bad.max = 1.0;
  r.check(selftest::throws_as<OutOfBoundsError>(r, "bounds", [&] { bad.validate(); }), "zero minimum");
}

}  // namespace
}  // namespace calfuse::governance

int main() {
  calfuse::set_log_level(calfuse::LogLevel::WARN);
  calfuse::selftest::Report r;
  calfuse::governance::test_graph_structure(r);
  calfuse::governance::test_acyclic(r);
  calfuse::governance::test_cycles(r);
  calfuse::governance::test_inversions(r);
  calfuse::governance::test_bounded_product(r);
  return calfuse::selftest::finish(r, "governor_selftest");
}
