#pragma once
/*
================================================================================
Veto: Cascade Coordinator
FILE: cpp/engine/veto/veto_coordinator.hpp

Order:
  1) specificity_score, descending
  2) fixed layer priority @b @chain @q @d @p @C @u @m, then unknown ids
     lexicographically
  3) triggered before not triggered, then reason (keeps the order total)

The first triggered result in that order is the veto. A veto is an outcome,
not an error; only malformed results (non-finite specificity, empty id)
reject the call with InvalidVetoError.
================================================================================
*/

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "engine/core/json_reader.hpp"

namespace calfuse {

struct VetoResult {
  std::string layer_id;
  bool triggered = false;
  double specificity_score = 0.0;
  std::string reason;

  JsonValue to_json() const;
  static VetoResult from_json(const JsonValue& v, size_t index);
};

// Rank of a layer id in the tie-break order; unknown ids share the last rank.
size_t veto_layer_priority(const std::string& layer_id) noexcept;

// Strict weak ordering implementing the cascade order above.
bool veto_precedes(const VetoResult& a, const VetoResult& b) noexcept;

// Validates and returns the results in cascade order.
std::vector<VetoResult> order_veto_results(std::vector<VetoResult> results);

std::optional<VetoResult> execute_veto_cascade(std::vector<VetoResult> results);

struct VetoCascadeReport {
  std::vector<VetoResult> ordered;
  std::optional<size_t> selected;   // index into ordered
  std::vector<size_t> suppressed;   // triggered but outranked, indices into ordered

  bool vetoed() const noexcept { return selected.has_value(); }
  const VetoResult* veto() const noexcept { return selected ? &ordered[*selected] : nullptr; }

  JsonValue to_json() const;
};

VetoCascadeReport run_veto_cascade(std::vector<VetoResult> results);

}  // namespace calfuse
