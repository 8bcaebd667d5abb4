#include "engine/veto/veto_coordinator.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "engine/calibration/layer_id.hpp"
#include "engine/core/errors.hpp"

namespace calfuse {

size_t veto_layer_priority(const std::string& layer_id) noexcept {
  const auto id = parse_layer_symbol(layer_id);
  return id ? layer_index(*id) : kLayerCount;
}

bool veto_precedes(const VetoResult& a, const VetoResult& b) noexcept {
  if (a.specificity_score != b.specificity_score) return a.specificity_score > b.specificity_score;

  const size_t pa = veto_layer_priority(a.layer_id);
  const size_t pb = veto_layer_priority(b.layer_id);
  if (pa != pb) return pa < pb;
  if (a.layer_id != b.layer_id) return a.layer_id < b.layer_id;

  if (a.triggered != b.triggered) return a.triggered;
  return a.reason < b.reason;
}

namespace {

void validate_results(const std::vector<VetoResult>& results) {
  for (size_t i = 0; i < results.size(); ++i) {
    const auto& r = results[i];
    const std::string field = "veto_results[" + std::to_string(i) + "]";
    if (r.layer_id.empty()) {
      throw InvalidVetoError(field + ".layer_id", "a non-empty layer id",
                             "veto result " + std::to_string(i) + " has no layer id", CALFUSE_SITE);
    }
    if (!std::isfinite(r.specificity_score)) {
      std::ostringstream oss;
      oss << "veto result for " << r.layer_id << " has non-finite specificity " << r.specificity_score;
      throw InvalidVetoError(field + ".specificity_score", "a finite number", oss.str(), CALFUSE_SITE);
    }
  }
}

}  // namespace

std::vector<VetoResult> order_veto_results(std::vector<VetoResult> results) {
  validate_results(results);
  std::stable_sort(results.begin(), results.end(), veto_precedes);
  return results;
}

std::optional<VetoResult> execute_veto_cascade(std::vector<VetoResult> results) {
  auto ordered = order_veto_results(std::move(results));
  for (auto& r : ordered) {
    if (r.triggered) return std::move(r);
  }
  return std::nullopt;
}

VetoCascadeReport run_veto_cascade(std::vector<VetoResult> results) {
  VetoCascadeReport rep;
  rep.ordered = order_veto_results(std::move(results));
  for (size_t i = 0; i < rep.ordered.size(); ++i) {
    if (!rep.ordered[i].triggered) continue;
    if (!rep.selected) rep.selected = i;
    else rep.suppressed.push_back(i);
  }
  return rep;
}

JsonValue VetoResult::to_json() const {
  JsonValue o = JsonValue::make_object();
  o.set("layer_id", JsonValue::make_string(layer_id));
  o.set("reason", JsonValue::make_string(reason));
  o.set("specificity_score", JsonValue::make_number(specificity_score));
  o.set("triggered", JsonValue::make_bool(triggered));
  return o;
}

VetoResult VetoResult::from_json(const JsonValue& v, size_t index) {
  const std::string field = "veto_results[" + std::to_string(index) + "]";
  if (!v.is_object()) {
    throw InvalidVetoError(field, "an object", field + " must be an object", CALFUSE_SITE);
  }

  VetoResult r;
  const JsonValue* id = v.find("layer_id");
  if (!id || !id->is_string()) {
    throw InvalidVetoError(field + ".layer_id", "a string", field + ".layer_id missing or not a string",
                           CALFUSE_SITE);
  }
  r.layer_id = id->as_string();

  const JsonValue* trig = v.find("triggered");
  if (!trig || !trig->is_bool()) {
    throw InvalidVetoError(field + ".triggered", "true or false",
                           field + ".triggered missing or not a bool", CALFUSE_SITE);
  }
  r.triggered = trig->as_bool();

  const JsonValue* spec = v.find("specificity_score");
  if (!spec || !spec->is_number()) {
    throw InvalidVetoError(field + ".specificity_score", "a finite number",
                           field + ".specificity_score missing or not a number", CALFUSE_SITE);
  }
  r.specificity_score = spec->as_number();

  if (const JsonValue* reason = v.find("reason")) {
    if (!reason->is_string()) {
      throw InvalidVetoError(field + ".reason", "a string", field + ".reason must be a string",
                             CALFUSE_SITE);
    }
    r.reason = reason->as_string();
  }
  return r;
}

JsonValue VetoCascadeReport::to_json() const {
  JsonValue ord = JsonValue::make_array();
  for (const auto& r : ordered) ord.push_back(r.to_json());

  JsonValue sup = JsonValue::make_array();
  for (size_t i : suppressed) sup.push_back(ordered[i].to_json());

  JsonValue o = JsonValue::make_object();
  o.set("ordered", std::move(ord));
  o.set("selected", selected ? ordered[*selected].to_json() : JsonValue::make_null());
  o.set("suppressed", std::move(sup));
  return o;
}

}  // namespace calfuse
