#pragma once
/*
================================================================================
Config: Calibration document -> typed objects
FILE: cpp/engine/config/calibration_config.hpp

Document shape (one per cohort/version):

  {
    "cohort": "COHORT_2024",
    "version": "v1",
    "role_fusion_parameters": {
      "EXECUTOR": { "linear_weights": { "@b": 0.17, ... all eight ... },
                    "interaction_weights": { "@u,@chain": 0.13, ... } }
    },
    "layers": [
      { "layer_id": "@b", "version": "v1", "rationale": "...",
        "created_at": "2024-01-01T00:00:00Z",
        "supersedes_version": "v0",                       (optional)
        "evidence": [ { "locator": "docs/...", "content_id": "ab12..." } ],
        "parameters": [ { "name": "...", "value": 0.5, "bounds": [0, 1] } ] }
    ],
    "dependency_graph": {
      "nodes": [ { "id": "...", "tier": "EMPIRICAL" } ],
      "edges": [ { "from": "a", "to": "b", "kind": "PRIMARY" } ]
    },
    "product_bounds": { "min": 0.01, "max": 10.0 }        (optional)
  }

Hardening:
  - Nothing is defaulted except edge kind (PRIMARY) and product_bounds.
  - Unknown top-level keys, unknown roles, missing linear weights -> ConfigError.
  - Typed constructors raise their own load errors (OutOfBounds, provenance,
    weight normalization). Governor checks are NOT run here.
================================================================================
*/

#include <string>
#include <vector>

#include "engine/calibration/calibration_layer.hpp"
#include "engine/core/json_reader.hpp"
#include "engine/fusion/fusion_weight_set.hpp"
#include "engine/governance/dependency_graph.hpp"
#include "engine/governance/interaction_governor.hpp"

namespace calfuse {

struct CalibrationConfig {
  std::string cohort;
  std::string version;
  RoleWeightTable weights;
  std::vector<CalibrationLayer> layers;  // document order; predecessors first
  governance::DependencyGraph graph;
  governance::ProductBounds product_bounds;
};

CalibrationConfig parse_calibration_config(const JsonValue& doc);

}  // namespace calfuse
