#pragma once
/*
================================================================================
Fusion: 2-additive Choquet Evaluator
FILE: cpp/engine/fusion/choquet.hpp

  Cal(I) = sum_l a_l * x_l  +  sum_(l,k) a_lk * min(x_l, x_k)

Guarantees (given a valid FusionWeightSet and a valid LayerScoreVector):
  - 0 <= Cal(I) <= 1 (weights are non-negative and sum to 1)
  - non-decreasing in every x_l
  - a low x_l caps every interaction term that touches l

Notes:
  - Pure function. Double precision, no rounding, no clamping, no I/O.
  - Loop bounds are fixed (8 layers, bounded interaction list).
================================================================================
*/

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "engine/calibration/layer_score_vector.hpp"
#include "engine/core/json_reader.hpp"
#include "engine/fusion/fusion_weight_set.hpp"

namespace calfuse {

double evaluate(const LayerScoreVector& scores, const FusionWeightSet& weights) noexcept;

// Validates named input at the boundary (MissingLayerError, UnexpectedLayerError,
// ScoreOutOfRangeError) and then evaluates.
double evaluate_named(const std::map<std::string, double>& scores, const FusionWeightSet& weights);

struct LayerContribution {
  LayerId layer = LayerId::kBase;
  double weight = 0.0;
  double score = 0.0;
  double contribution = 0.0;  // weight * score
};

struct InteractionContribution {
  LayerId first = LayerId::kBase;
  LayerId second = LayerId::kBase;
  double weight = 0.0;
  double min_score = 0.0;
  double contribution = 0.0;  // weight * min(score_first, score_second)
};

struct FusionBreakdown {
  double score = 0.0;
  double linear_total = 0.0;
  double interaction_total = 0.0;
  std::vector<LayerContribution> layers;              // LayerId order
  std::vector<InteractionContribution> interactions;  // weight-set order
  LayerId dominant_layer = LayerId::kBase;            // largest linear contribution (ties: priority order)
  std::optional<size_t> dominant_interaction;         // index into interactions
  std::string summary;

  JsonValue to_json() const;
};

// Same score as evaluate(), plus per-term attribution.
FusionBreakdown evaluate_with_breakdown(const LayerScoreVector& scores, const FusionWeightSet& weights);

}  // namespace calfuse
