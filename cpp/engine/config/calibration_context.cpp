#include "engine/config/calibration_context.hpp"

#include <set>
#include <utility>

#include "engine/core/canonical_json.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/hashing.hpp"
#include "engine/core/logging.hpp"

namespace calfuse {
namespace {

JsonValue parse_document(std::string_view json_text) {
  JsonValue doc;
  JsonParseError err;
  if (!parse_json(json_text, &doc, &err)) {
    throw ConfigError("calibration document is not valid JSON: " + err.to_string(), CALFUSE_SITE);
  }
  return doc;
}

// At most one unsuperseded version per layer id.
void check_single_active_version(const std::vector<CalibrationLayer>& layers) {
  std::set<std::string> superseded;
  for (const auto& l : layers) {
    if (l.supersedes()) superseded.insert(*l.supersedes());
  }
  std::set<std::string> active_ids;
  for (const auto& l : layers) {
    if (superseded.count(l.content_hash())) continue;
    if (!active_ids.insert(l.layer_id()).second) {
      throw ConfigError("layer '" + l.layer_id() +
                            "' has more than one active version; mark the older one with supersedes_version",
                        CALFUSE_SITE);
    }
  }
}

}  // namespace

CalibrationContext::CalibrationContext(CalibrationConfig cfg, std::string state_hash,
                                       std::vector<std::string> topo)
    : cfg_(std::move(cfg)), state_hash_(std::move(state_hash)), topo_order_(std::move(topo)) {}

const CalibrationLayer* CalibrationContext::active_layer(const std::string& layer_id) const {
  const CalibrationLayer* found = nullptr;
  for (const auto& l : cfg_.layers) {
    if (l.layer_id() != layer_id) continue;
    bool is_superseded = false;
    for (const auto& other : cfg_.layers) {
      if (other.supersedes() && *other.supersedes() == l.content_hash()) {
        is_superseded = true;
        break;
      }
    }
    if (!is_superseded) found = &l;
  }
  return found;
}

std::string calibration_state_hash(std::string_view json_text) {
  return sha256_hex(to_canonical_json(parse_document(json_text)));
}

CalibrationContextPtr load_calibration_context_text(std::string_view json_text) {
  log(LogLevel::INFO, "calibration load: start (" + std::to_string(json_text.size()) + " bytes)");

  const JsonValue doc = parse_document(json_text);
  const std::string state_hash = sha256_hex(to_canonical_json(doc));

  CalibrationConfig cfg = parse_calibration_config(doc);
  check_single_active_version(cfg.layers);

  std::vector<std::string> topo = governance::validate(cfg.graph);

  std::string roles;
  for (FusionRole r : cfg.weights.configured_roles()) {
    if (!roles.empty()) roles += ",";
    roles += to_string(r);
  }
  log(LogLevel::INFO, "calibration load: ready cohort=" + cfg.cohort + " version=" + cfg.version +
                          " roles=" + roles + " layers=" + std::to_string(cfg.layers.size()) +
                          " state_hash=" + state_hash);

  return CalibrationContextPtr(
      new CalibrationContext(std::move(cfg), state_hash, std::move(topo)));
}

CalibrationContextPtr load_calibration_context(const std::string& path) {
  const std::string text = read_text_file(path);
  log(LogLevel::INFO, "calibration load: reading " + path);
  return load_calibration_context_text(text);
}

}  // namespace calfuse
