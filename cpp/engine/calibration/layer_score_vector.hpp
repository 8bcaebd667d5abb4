#pragma once
/*
================================================================================
Calibration: Layer Score Vector
FILE: cpp/engine/calibration/layer_score_vector.hpp

Purpose:
  - Closed, typed record of exactly eight layer scores.
  - Boundary validation for untyped (name -> value) input.

Rules:
  - Every layer present, no extra keys, every value finite and in [0, 1].
  - Violations reject the call with an InputError subclass naming the field.
  - Nothing is ever defaulted.
================================================================================
*/

#include <array>
#include <map>
#include <string>

#include "engine/calibration/layer_id.hpp"
#include "engine/core/json_reader.hpp"

namespace calfuse {

// JSON scores object -> name/value map. Checks shape only: an unknown key is an
// UnexpectedLayerError (whatever its value) and a non-number value for a known
// layer is a ScoreOutOfRangeError. Completeness and range are from_named()'s job.
std::map<std::string, double> named_scores_from_json(const JsonValue& obj);

class LayerScoreVector final {
 public:
  // Positional constructor, one value per layer in LayerId order.
  LayerScoreVector(double b, double chain, double q, double d,
                   double p, double C, double u, double m);

  // Throws MissingLayerError / UnexpectedLayerError / ScoreOutOfRangeError.
  static LayerScoreVector from_named(const std::map<std::string, double>& named);

  // named_scores_from_json() then from_named().
  static LayerScoreVector from_json(const JsonValue& obj);

  double operator[](LayerId id) const noexcept { return values_[layer_index(id)]; }
  double get(LayerId id) const noexcept { return values_[layer_index(id)]; }

  // Copy with one layer replaced (validated).
  LayerScoreVector with(LayerId id, double value) const;

  const std::array<double, kLayerCount>& values() const noexcept { return values_; }

  // {"@C":..,"@b":..,...} keyed by layer symbol.
  JsonValue to_json() const;

 private:
  explicit LayerScoreVector(const std::array<double, kLayerCount>& v);

  std::array<double, kLayerCount> values_{};
};

}  // namespace calfuse
