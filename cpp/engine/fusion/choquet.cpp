#include "engine/fusion/choquet.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace calfuse {

double evaluate(const LayerScoreVector& scores, const FusionWeightSet& weights) noexcept {
  double linear = 0.0;
  for (LayerId id : kAllLayers) {
    linear += weights.linear(id) * scores[id];
  }

  double interaction = 0.0;
  for (const auto& t : weights.interactions()) {
    interaction += t.weight * std::min(scores[t.first], scores[t.second]);
  }

  return linear + interaction;
}

double evaluate_named(const std::map<std::string, double>& scores, const FusionWeightSet& weights) {
  return evaluate(LayerScoreVector::from_named(scores), weights);
}

FusionBreakdown evaluate_with_breakdown(const LayerScoreVector& scores, const FusionWeightSet& weights) {
  FusionBreakdown out;
  out.layers.reserve(kLayerCount);
  out.interactions.reserve(weights.interactions().size());

  for (LayerId id : kAllLayers) {
    LayerContribution c;
    c.layer = id;
    c.weight = weights.linear(id);
    c.score = scores[id];
    c.contribution = c.weight * c.score;
    out.linear_total += c.contribution;
    out.layers.push_back(c);
  }

  for (const auto& t : weights.interactions()) {
    InteractionContribution c;
    c.first = t.first;
    c.second = t.second;
    c.weight = t.weight;
    c.min_score = std::min(scores[t.first], scores[t.second]);
    c.contribution = c.weight * c.min_score;
    out.interaction_total += c.contribution;
    out.interactions.push_back(c);
  }

  out.score = out.linear_total + out.interaction_total;

  // Strict '>' keeps the earliest (highest priority) layer on ties.
  double best = -1.0;
  for (const auto& c : out.layers) {
    if (c.contribution > best) {
      best = c.contribution;
      out.dominant_layer = c.layer;
    }
  }
  double best_i = -1.0;
  for (size_t i = 0; i < out.interactions.size(); ++i) {
    if (out.interactions[i].contribution > best_i) {
      best_i = out.interactions[i].contribution;
      out.dominant_interaction = i;
    }
  }

  std::ostringstream oss;
  oss << std::fixed << std::setprecision(4)
      << "score=" << out.score
      << " linear=" << out.linear_total
      << " interaction=" << out.interaction_total
      << " dominant=" << layer_symbol(out.dominant_layer) << " (" << layer_display_name(out.dominant_layer) << ")";
  if (out.dominant_interaction) {
    const auto& d = out.interactions[*out.dominant_interaction];
    oss << " dominant_pair=(" << layer_symbol(d.first) << "," << layer_symbol(d.second) << ")";
  }
  out.summary = oss.str();
  return out;
}

JsonValue FusionBreakdown::to_json() const {
  JsonValue ls = JsonValue::make_object();
  for (const auto& c : layers) {
    JsonValue o = JsonValue::make_object();
    o.set("contribution", JsonValue::make_number(c.contribution));
    o.set("score", JsonValue::make_number(c.score));
    o.set("weight", JsonValue::make_number(c.weight));
    ls.set(std::string(layer_symbol(c.layer)), std::move(o));
  }

  JsonValue is = JsonValue::make_array();
  for (const auto& c : interactions) {
    JsonValue o = JsonValue::make_object();
    o.set("contribution", JsonValue::make_number(c.contribution));
    o.set("min_score", JsonValue::make_number(c.min_score));
    o.set("pair", JsonValue::make_string(std::string(layer_symbol(c.first)) + "," +
                                         std::string(layer_symbol(c.second))));
    o.set("weight", JsonValue::make_number(c.weight));
    is.push_back(std::move(o));
  }

  JsonValue o = JsonValue::make_object();
  o.set("dominant_layer", JsonValue::make_string(std::string(layer_symbol(dominant_layer))));
  o.set("interaction_total", JsonValue::make_number(interaction_total));
  o.set("interactions", std::move(is));
  o.set("layers", std::move(ls));
  o.set("linear_total", JsonValue::make_number(linear_total));
  o.set("score", JsonValue::make_number(score));
  o.set("summary", JsonValue::make_string(summary));
  return o;
}

}  // namespace calfuse
