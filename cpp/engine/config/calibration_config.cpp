#include "engine/config/calibration_config.hpp"

#include <set>
#include <utility>

#include "engine/core/errors.hpp"

namespace calfuse {
namespace {

// Path-aware typed field access; every failure is a ConfigError naming the path.
class Fields {
 public:
  Fields(const JsonValue& obj, std::string path) : obj_(obj), path_(std::move(path)) {
    if (!obj_.is_object()) fail(path_, "must be an object");
  }

  [[noreturn]] static void fail(const std::string& path, const std::string& what) {
    throw ConfigError(path + " " + what, CALFUSE_SITE);
  }

  std::string child(const std::string& key) const { return path_ + "." + key; }

  const JsonValue& required(const std::string& key, JsonType t) const {
    const JsonValue* v = obj_.find(key);
    if (!v) fail(child(key), "is required");
    if (v->type() != t) fail(child(key), std::string("must be ") + json_type_name(t));
    return *v;
  }

  const JsonValue* optional(const std::string& key, JsonType t) const {
    const JsonValue* v = obj_.find(key);
    if (v && v->type() != t) fail(child(key), std::string("must be ") + json_type_name(t));
    return v;
  }

  std::string str(const std::string& key) const { return required(key, JsonType::kString).as_string(); }
  double num(const std::string& key) const { return required(key, JsonType::kNumber).as_number(); }

  void only(const std::set<std::string>& allowed) const {
    for (const auto& [k, v] : obj_.as_object()) {
      (void)v;
      if (allowed.count(k) == 0) fail(child(k), "is not a recognized key");
    }
  }

 private:
  const JsonValue& obj_;
  std::string path_;
};

std::string index_path(const std::string& base, size_t i) {
  return base + "[" + std::to_string(i) + "]";
}

FusionWeightSet parse_weight_set(FusionRole role, const JsonValue& v, const std::string& path) {
  Fields f(v, path);
  f.only({"linear_weights", "interaction_weights"});

  const JsonValue& lin = f.required("linear_weights", JsonType::kObject);
  std::array<double, kLayerCount> linear{};
  std::array<bool, kLayerCount> seen{};
  for (const auto& [key, w] : lin.as_object()) {
    const auto id = parse_layer_symbol(key);
    if (!id) Fields::fail(f.child("linear_weights") + "." + key, "is not a layer symbol");
    if (!w.is_number()) Fields::fail(f.child("linear_weights") + "." + key, "must be number");
    linear[layer_index(*id)] = w.as_number();
    seen[layer_index(*id)] = true;
  }
  for (LayerId id : kAllLayers) {
    if (!seen[layer_index(id)]) {
      Fields::fail(f.child("linear_weights") + "." + std::string(layer_symbol(id)), "is required");
    }
  }

  std::vector<InteractionTerm> terms;
  if (const JsonValue* inter = f.optional("interaction_weights", JsonType::kObject)) {
    for (const auto& [key, w] : inter->as_object()) {
      if (!w.is_number()) Fields::fail(f.child("interaction_weights") + "." + key, "must be number");
      const auto [a, b] = parse_interaction_key(key);
      terms.push_back(InteractionTerm{a, b, w.as_number()});
    }
  }

  return FusionWeightSet(role, linear, std::move(terms));
}

EvidenceReference parse_evidence(const JsonValue& v, const std::string& path) {
  Fields f(v, path);
  f.only({"locator", "content_id"});
  std::optional<std::string> content_id;
  if (const JsonValue* cid = f.optional("content_id", JsonType::kString)) content_id = cid->as_string();
  return EvidenceReference(f.str("locator"), std::move(content_id));
}

BoundedParameter parse_parameter(const JsonValue& v, const std::string& path) {
  Fields f(v, path);
  f.only({"name", "value", "bounds"});
  const auto& bounds = f.required("bounds", JsonType::kArray).as_array();
  if (bounds.size() != 2 || !bounds[0].is_number() || !bounds[1].is_number()) {
    Fields::fail(f.child("bounds"), "must be [lower, upper]");
  }
  return BoundedParameter(f.str("name"), f.num("value"),
                          ClosedInterval(bounds[0].as_number(), bounds[1].as_number()));
}

void parse_layers(const JsonValue& arr, CalibrationConfig& cfg) {
  const auto& items = arr.as_array();
  for (size_t i = 0; i < items.size(); ++i) {
    const std::string path = index_path("$.layers", i);
    Fields f(items[i], path);
    f.only({"layer_id", "version", "rationale", "created_at", "supersedes_version", "evidence",
            "parameters"});

    const std::string layer_id = f.str("layer_id");
    const std::string version = f.str("version");

    const auto created = parse_utc_iso8601(f.str("created_at"));
    if (!created) Fields::fail(f.child("created_at"), "must be UTC ISO-8601 (YYYY-MM-DDTHH:MM:SSZ)");

    std::vector<EvidenceReference> evidence;
    const auto& ev = f.required("evidence", JsonType::kArray).as_array();
    for (size_t k = 0; k < ev.size(); ++k) {
      evidence.push_back(parse_evidence(ev[k], index_path(f.child("evidence"), k)));
    }

    std::vector<BoundedParameter> params;
    const auto& ps = f.required("parameters", JsonType::kArray).as_array();
    for (size_t k = 0; k < ps.size(); ++k) {
      params.push_back(parse_parameter(ps[k], index_path(f.child("parameters"), k)));
    }

    std::optional<std::string> supersedes;
    if (const JsonValue* sv = f.optional("supersedes_version", JsonType::kString)) {
      const CalibrationLayer* prev = nullptr;
      for (const auto& l : cfg.layers) {
        if (l.layer_id() == layer_id && l.version() == sv->as_string()) prev = &l;
      }
      if (!prev) {
        Fields::fail(f.child("supersedes_version"),
                     "references '" + sv->as_string() + "', which is not an earlier version of " +
                         layer_id);
      }
      supersedes = prev->content_hash();
    }

    for (const auto& l : cfg.layers) {
      if (l.layer_id() == layer_id && l.version() == version) {
        Fields::fail(path, "repeats layer " + layer_id + " version " + version);
      }
    }

    cfg.layers.emplace_back(layer_id, version, std::move(params), f.str("rationale"),
                            std::move(evidence), *created, std::move(supersedes));
  }
}

void parse_graph(const JsonValue& v, CalibrationConfig& cfg) {
  Fields f(v, "$.dependency_graph");
  f.only({"nodes", "edges"});

  const auto& nodes = f.required("nodes", JsonType::kArray).as_array();
  for (size_t i = 0; i < nodes.size(); ++i) {
    Fields n(nodes[i], index_path(f.child("nodes"), i));
    n.only({"id", "tier"});
    const auto tier = governance::parse_epistemic_tier(n.str("tier"));
    if (!tier) Fields::fail(n.child("tier"), "must be EMPIRICAL, INFERENTIAL or AUDIT");
    cfg.graph.add_node(n.str("id"), *tier);
  }

  if (const JsonValue* edges = f.optional("edges", JsonType::kArray)) {
    const auto& es = edges->as_array();
    for (size_t i = 0; i < es.size(); ++i) {
      Fields e(es[i], index_path(f.child("edges"), i));
      e.only({"from", "to", "kind"});
      governance::EdgeKind kind = governance::EdgeKind::PRIMARY;
      if (const JsonValue* k = e.optional("kind", JsonType::kString)) {
        const auto parsed = governance::parse_edge_kind(k->as_string());
        if (!parsed) Fields::fail(e.child("kind"), "must be PRIMARY or ADVISORY");
        kind = *parsed;
      }
      cfg.graph.add_edge(e.str("from"), e.str("to"), kind);
    }
  }
}

}  // namespace

CalibrationConfig parse_calibration_config(const JsonValue& doc) {
  Fields root(doc, "$");
  root.only({"cohort", "version", "role_fusion_parameters", "layers", "dependency_graph",
             "product_bounds"});

  CalibrationConfig cfg;
  cfg.cohort = root.str("cohort");
  cfg.version = root.str("version");
  if (cfg.cohort.empty()) Fields::fail("$.cohort", "must not be empty");
  if (cfg.version.empty()) Fields::fail("$.version", "must not be empty");

  const auto& roles = root.required("role_fusion_parameters", JsonType::kObject).as_object();
  if (roles.empty()) Fields::fail("$.role_fusion_parameters", "must configure at least one role");
  for (const auto& [name, params] : roles) {
    const auto role = parse_fusion_role(name);
    if (!role) {
      Fields::fail("$.role_fusion_parameters." + name, "is not a role (EXECUTOR, CLUSTER, MACRO)");
    }
    cfg.weights.add(parse_weight_set(*role, params, "$.role_fusion_parameters." + name));
  }

  parse_layers(root.required("layers", JsonType::kArray), cfg);
  parse_graph(root.required("dependency_graph", JsonType::kObject), cfg);

  if (const JsonValue* pb = root.optional("product_bounds", JsonType::kObject)) {
    Fields b(*pb, "$.product_bounds");
    b.only({"min", "max"});
    cfg.product_bounds.min = b.num("min");
    cfg.product_bounds.max = b.num("max");
  }
  cfg.product_bounds.validate();

  return cfg;
}

}  // namespace calfuse
