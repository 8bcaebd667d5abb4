#pragma once
/*
================================================================================
Governance: Interaction Governor
FILE: cpp/engine/governance/interaction_governor.hpp

Load-time checks on the dependency graph, run once before a calibration
context becomes ready. This is the only place that raises
CyclicDependencyError or LevelInversionError.

  1) Cycle detector      Kahn topological sort; leftover nodes -> one concrete
                         cycle (first node repeated at the end).
  2) Inversion detector  PRIMARY edge whose producer tier is above its
                         consumer tier (e.g. AUDIT -> INFERENTIAL).

Also hosts the bounded multiplicative operator: a product of non-negative
factors clamped into [min, max]. Clamping is logged at WARN, never thrown.
================================================================================
*/

#include <string>
#include <vector>

#include "engine/governance/dependency_graph.hpp"

namespace calfuse::governance {

enum class ViolationKind : int { kCycle = 0, kLevelInversion = 1 };

const char* to_string(ViolationKind k) noexcept;

struct GovernanceViolation {
  ViolationKind kind = ViolationKind::kCycle;
  // kCycle: cycle nodes with the first repeated at the end.
  // kLevelInversion: {from, to}.
  std::vector<std::string> nodes;
  std::string message;
};

// Returns the topological order (ties broken by node id).
// Throws CyclicDependencyError naming one cycle.
std::vector<std::string> check_acyclic(const DependencyGraph& g);

// Throws LevelInversionError listing every offending PRIMARY edge.
void check_level_inversions(const DependencyGraph& g);

// Cycles first, then inversions. Returns the topological order.
std::vector<std::string> validate(const DependencyGraph& g);

// Non-throwing variant for reports: one concrete cycle per cyclic strongly
// connected component (so every node on a cycle is covered), sorted, then
// every inversion.
std::vector<GovernanceViolation> collect_violations(const DependencyGraph& g);

// ----------------------------- Bounded product -------------------------------

struct ProductBounds {
  double min = 0.01;
  double max = 10.0;

  // Throws OutOfBoundsError unless 0 < min < max and both finite.
  void validate() const;
};

struct BoundedProduct {
  double raw = 1.0;    // unclamped product
  double value = 1.0;  // clamped into [min, max]
  bool clamped = false;
};

// Empty input multiplies to 1. Non-finite or negative factors reject the call
// with InputError naming the factor index.
BoundedProduct bounded_product(const std::vector<double>& factors, const ProductBounds& bounds);

}  // namespace calfuse::governance
