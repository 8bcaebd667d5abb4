#include "engine/calibration/layer_score_vector.hpp"

#include <cmath>
#include <sstream>
#include <string_view>

#include "engine/core/errors.hpp"

namespace calfuse {
namespace {

constexpr const char* kScoreRange = "[0, 1]";

void require_score(LayerId id, double v) {
  if (std::isfinite(v) && v >= 0.0 && v <= 1.0) return;
  std::ostringstream oss;
  oss << "score for " << layer_symbol(id) << " is " << v << ", outside " << kScoreRange;
  throw ScoreOutOfRangeError(std::string(layer_symbol(id)), kScoreRange, oss.str(), CALFUSE_SITE);
}

std::string expected_layer_list() {
  std::string s = "one of";
  for (LayerId id : kAllLayers) {
    s += " ";
    s += layer_symbol(id);
  }
  return s;
}

}  // namespace

LayerScoreVector::LayerScoreVector(const std::array<double, kLayerCount>& v) : values_(v) {
  for (LayerId id : kAllLayers) require_score(id, values_[layer_index(id)]);
}

LayerScoreVector::LayerScoreVector(double b, double chain, double q, double d,
                                   double p, double C, double u, double m)
    : LayerScoreVector(std::array<double, kLayerCount>{b, chain, q, d, p, C, u, m}) {}

LayerScoreVector LayerScoreVector::from_named(const std::map<std::string, double>& named) {
  for (const auto& [key, value] : named) {
    (void)value;
    if (!parse_layer_symbol(key)) {
      throw UnexpectedLayerError(key, expected_layer_list(),
                                 "unexpected layer key '" + key + "'", CALFUSE_SITE);
    }
  }

  std::array<double, kLayerCount> v{};
  for (LayerId id : kAllLayers) {
    const std::string sym(layer_symbol(id));
    auto it = named.find(sym);
    if (it == named.end()) {
      throw MissingLayerError(sym, "a score in [0, 1]",
                              "missing score for layer " + sym, CALFUSE_SITE);
    }
    v[layer_index(id)] = it->second;
  }
  return LayerScoreVector(v);
}

std::map<std::string, double> named_scores_from_json(const JsonValue& obj) {
  if (!obj.is_object()) {
    throw InputError("scores", "an object keyed by layer symbol",
                     std::string("scores must be an object, got ") + json_type_name(obj.type()),
                     CALFUSE_SITE);
  }

  std::map<std::string, double> named;
  for (const auto& [key, value] : obj.as_object()) {
    // Unknown keys are reported as such whatever their value.
    if (!parse_layer_symbol(key)) {
      throw UnexpectedLayerError(key, expected_layer_list(),
                                 "unexpected layer key '" + key + "'", CALFUSE_SITE);
    }
    if (!value.is_number()) {
      throw ScoreOutOfRangeError(key, kScoreRange,
                                 "score for " + key + " must be a number, got " +
                                     json_type_name(value.type()),
                                 CALFUSE_SITE);
    }
    named.emplace(key, value.as_number());
  }
  return named;
}

LayerScoreVector LayerScoreVector::from_json(const JsonValue& obj) {
  return from_named(named_scores_from_json(obj));
}

LayerScoreVector LayerScoreVector::with(LayerId id, double value) const {
  auto v = values_;
  v[layer_index(id)] = value;
  return LayerScoreVector(v);
}

JsonValue LayerScoreVector::to_json() const {
  JsonValue o = JsonValue::make_object();
  for (LayerId id : kAllLayers) {
    o.set(std::string(layer_symbol(id)), JsonValue::make_number(values_[layer_index(id)]));
  }
  return o;
}

}  // namespace calfuse
