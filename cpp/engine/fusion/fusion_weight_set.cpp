#include "engine/fusion/fusion_weight_set.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

#include "engine/core/canonical_json.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/hashing.hpp"

namespace calfuse {

const char* to_string(FusionRole r) noexcept {
  switch (r) {
    case FusionRole::EXECUTOR: return "EXECUTOR";
    case FusionRole::CLUSTER:  return "CLUSTER";
    case FusionRole::MACRO:    return "MACRO";
    default:                   return "UNKNOWN";
  }
}

std::optional<FusionRole> parse_fusion_role(std::string_view s) noexcept {
  for (FusionRole r : kAllRoles) {
    if (s == to_string(r)) return r;
  }
  return std::nullopt;
}

namespace {

std::string pair_key(LayerId a, LayerId b) {
  std::string k(layer_symbol(a));
  k += ",";
  k += layer_symbol(b);
  return k;
}

void require_weight(double w, const std::string& label, FusionRole role) {
  if (std::isfinite(w) && w >= 0.0) return;
  std::ostringstream oss;
  oss << to_string(role) << ": weight " << label << " = " << w << " must be finite and >= 0";
  throw WeightNormalizationError(oss.str(), CALFUSE_SITE);
}

}  // namespace

std::pair<LayerId, LayerId> parse_interaction_key(std::string_view key) {
  const size_t comma = key.find(',');
  if (comma == std::string_view::npos || key.find(',', comma + 1) != std::string_view::npos) {
    throw WeightNormalizationError("interaction key '" + std::string(key) +
                                       "' must be two layer symbols separated by one comma",
                                   CALFUSE_SITE);
  }
  auto trim = [](std::string_view s) {
    while (!s.empty() && s.front() == ' ') s.remove_prefix(1);
    while (!s.empty() && s.back() == ' ') s.remove_suffix(1);
    return s;
  };
  const auto a = parse_layer_symbol(trim(key.substr(0, comma)));
  const auto b = parse_layer_symbol(trim(key.substr(comma + 1)));
  if (!a || !b) {
    throw WeightNormalizationError("interaction key '" + std::string(key) +
                                       "' names an unknown layer",
                                   CALFUSE_SITE);
  }
  if (layer_index(*b) < layer_index(*a)) return {*b, *a};
  return {*a, *b};
}

FusionWeightSet::FusionWeightSet(FusionRole role,
                                 const std::array<double, kLayerCount>& linear,
                                 std::vector<InteractionTerm> interactions)
    : role_(role), linear_(linear) {
  for (LayerId id : kAllLayers) {
    const double w = linear_[layer_index(id)];
    require_weight(w, std::string(layer_symbol(id)), role_);
    linear_sum_ += w;
  }

  for (auto& t : interactions) {
    if (t.first == t.second) {
      throw WeightNormalizationError(std::string(to_string(role_)) + ": interaction pairs " +
                                         std::string(layer_symbol(t.first)) + " with itself",
                                     CALFUSE_SITE);
    }
    if (layer_index(t.second) < layer_index(t.first)) std::swap(t.first, t.second);
    require_weight(t.weight, pair_key(t.first, t.second), role_);
  }

  std::sort(interactions.begin(), interactions.end(),
            [](const InteractionTerm& x, const InteractionTerm& y) {
              if (x.first != y.first) return layer_index(x.first) < layer_index(y.first);
              return layer_index(x.second) < layer_index(y.second);
            });
  for (size_t i = 1; i < interactions.size(); ++i) {
    if (interactions[i].first == interactions[i - 1].first &&
        interactions[i].second == interactions[i - 1].second) {
      throw WeightNormalizationError(std::string(to_string(role_)) + ": interaction " +
                                         pair_key(interactions[i].first, interactions[i].second) +
                                         " is listed more than once",
                                     CALFUSE_SITE);
    }
  }
  interactions_ = std::move(interactions);
  for (const auto& t : interactions_) interaction_sum_ += t.weight;

  const double total = linear_sum_ + interaction_sum_;
  if (std::fabs(total - 1.0) > kWeightSumTolerance) {
    std::ostringstream oss;
    oss.precision(12);
    oss << to_string(role_) << ": weights sum to " << total << " (linear " << linear_sum_
        << " + interaction " << interaction_sum_ << "), expected 1 +/- " << kWeightSumTolerance;
    throw WeightNormalizationError(oss.str(), CALFUSE_SITE);
  }

  const std::string digest = sha256_hex(to_canonical_json(to_json()));
  id_ = std::string(to_string(role_)) + ":" + digest.substr(0, 16);
}

JsonValue FusionWeightSet::to_json() const {
  JsonValue lin = JsonValue::make_object();
  for (LayerId id : kAllLayers) {
    lin.set(std::string(layer_symbol(id)), JsonValue::make_number(linear_[layer_index(id)]));
  }
  JsonValue inter = JsonValue::make_object();
  for (const auto& t : interactions_) {
    inter.set(pair_key(t.first, t.second), JsonValue::make_number(t.weight));
  }

  JsonValue o = JsonValue::make_object();
  o.set("interaction_weights", std::move(inter));
  o.set("linear_weights", std::move(lin));
  o.set("role", JsonValue::make_string(to_string(role_)));
  return o;
}

// ----------------------------- RoleWeightTable -------------------------------

void RoleWeightTable::add(FusionWeightSet ws) {
  auto& slot = sets_[static_cast<size_t>(ws.role())];
  if (slot.has_value()) {
    throw ConfigError(std::string("duplicate weight set for role ") + to_string(ws.role()),
                      CALFUSE_SITE);
  }
  slot.emplace(std::move(ws));
}

const FusionWeightSet& RoleWeightTable::at(FusionRole role) const {
  const auto& slot = sets_[static_cast<size_t>(role)];
  if (!slot.has_value()) {
    std::string expected = "a configured role:";
    for (FusionRole r : configured_roles()) {
      expected += " ";
      expected += to_string(r);
    }
    throw UnknownRoleError("role", expected,
                           std::string("no weight set configured for role ") + to_string(role),
                           CALFUSE_SITE);
  }
  return *slot;
}

const FusionWeightSet& RoleWeightTable::at(std::string_view role_name) const {
  const auto role = parse_fusion_role(role_name);
  if (!role) {
    throw UnknownRoleError("role", "EXECUTOR, CLUSTER or MACRO",
                           "unknown fusion role '" + std::string(role_name) + "'", CALFUSE_SITE);
  }
  return at(*role);
}

std::vector<FusionRole> RoleWeightTable::configured_roles() const {
  std::vector<FusionRole> out;
  for (FusionRole r : kAllRoles) {
    if (has(r)) out.push_back(r);
  }
  return out;
}

}  // namespace calfuse
