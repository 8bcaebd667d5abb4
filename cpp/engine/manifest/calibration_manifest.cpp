#include "engine/manifest/calibration_manifest.hpp"

#include <cmath>
#include <sstream>
#include <utility>

#include "engine/core/canonical_json.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/hashing.hpp"
#include "engine/core/logging.hpp"

namespace calfuse {

std::string canonical_inputs_json(const DecisionInputs& in) {
  JsonValue vetoes = JsonValue::make_array();
  for (const auto& r : order_veto_results(in.veto_results)) vetoes.push_back(r.to_json());

  JsonValue o = JsonValue::make_object();
  o.set("calibration_state_hash", JsonValue::make_string(in.calibration_state_hash));
  o.set("role", JsonValue::make_string(to_string(in.role)));
  o.set("scores", in.scores.to_json());
  o.set("unit_id", JsonValue::make_string(in.unit_id));
  o.set("veto_results", std::move(vetoes));
  o.set("weight_set_id", JsonValue::make_string(in.weight_set_id));
  return to_canonical_json(o);
}

namespace {

JsonValue entry_body(const ManifestEntry& e) {
  JsonValue o = JsonValue::make_object();
  o.set("calibration_state_hash", JsonValue::make_string(e.calibration_state_hash));
  o.set("inputs_hash", JsonValue::make_string(e.inputs_hash));
  o.set("previous_hash", JsonValue::make_string(e.previous_hash));
  o.set("schema", JsonValue::make_string(e.schema));
  o.set("score", e.score ? JsonValue::make_number(*e.score) : JsonValue::make_null());
  o.set("sequence", JsonValue::make_number(static_cast<double>(e.sequence)));
  o.set("timestamp", JsonValue::make_string(e.timestamp));
  o.set("unit_id", JsonValue::make_string(e.unit_id));
  o.set("veto", e.veto ? e.veto->to_json() : JsonValue::make_null());
  o.set("weight_set_id", JsonValue::make_string(e.weight_set_id));
  return o;
}

const JsonValue& require_field(const JsonValue& v, const char* key, JsonType t) {
  const JsonValue* f = v.find(key);
  if (!f || f->type() != t) {
    CALFUSE_THROW(ErrorCode::kParse, std::string("manifest entry field '") + key +
                                         "' missing or not " + json_type_name(t));
  }
  return *f;
}

}  // namespace

std::string entry_body_json(const ManifestEntry& e) {
  return to_canonical_json(entry_body(e));
}

JsonValue entry_to_json(const ManifestEntry& e) {
  JsonValue o = entry_body(e);
  o.set("entry_hash", JsonValue::make_string(e.entry_hash));
  if (e.signature) o.set("signature", JsonValue::make_string(*e.signature));
  return o;
}

ManifestEntry entry_from_json(const JsonValue& v) {
  if (!v.is_object()) CALFUSE_THROW(ErrorCode::kParse, "manifest entry must be a JSON object");

  ManifestEntry e;
  e.schema = require_field(v, "schema", JsonType::kString).as_string();

  const double seq = require_field(v, "sequence", JsonType::kNumber).as_number();
  if (seq < 0.0 || seq != std::floor(seq)) {
    CALFUSE_THROW(ErrorCode::kParse, "manifest entry field 'sequence' must be a non-negative integer");
  }
  e.sequence = static_cast<uint64_t>(seq);

  e.unit_id = require_field(v, "unit_id", JsonType::kString).as_string();
  e.inputs_hash = require_field(v, "inputs_hash", JsonType::kString).as_string();
  e.weight_set_id = require_field(v, "weight_set_id", JsonType::kString).as_string();
  e.calibration_state_hash = require_field(v, "calibration_state_hash", JsonType::kString).as_string();
  e.timestamp = require_field(v, "timestamp", JsonType::kString).as_string();
  e.previous_hash = require_field(v, "previous_hash", JsonType::kString).as_string();
  e.entry_hash = require_field(v, "entry_hash", JsonType::kString).as_string();

  const JsonValue* score = v.find("score");
  if (!score) CALFUSE_THROW(ErrorCode::kParse, "manifest entry field 'score' missing");
  if (score->is_number()) e.score = score->as_number();
  else if (!score->is_null()) CALFUSE_THROW(ErrorCode::kParse, "manifest entry field 'score' must be number or null");

  const JsonValue* veto = v.find("veto");
  if (!veto) CALFUSE_THROW(ErrorCode::kParse, "manifest entry field 'veto' missing");
  if (!veto->is_null()) e.veto = VetoResult::from_json(*veto, 0);

  if (const JsonValue* sig = v.find("signature")) {
    if (!sig->is_string()) CALFUSE_THROW(ErrorCode::kParse, "manifest entry field 'signature' must be a string");
    e.signature = sig->as_string();
  }
  return e;
}

// ----------------------------- CalibrationManifest ---------------------------

CalibrationManifest::CalibrationManifest(ManifestOptions opt)
    : opt_(std::move(opt)),
      chunks_(std::make_unique<std::array<std::unique_ptr<Chunk>, kMaxChunks>>()) {
  if (!opt_.clock) opt_.clock = system_now;
  if (opt_.signing_key && opt_.signing_key->empty()) {
    throw SignatureError("manifest signing key must not be empty", CALFUSE_SITE);
  }
}

ManifestEntry CalibrationManifest::record(const DecisionInputs& inputs,
                                          std::optional<double> score,
                                          std::optional<VetoResult> veto) {
  if (score.has_value() == veto.has_value()) {
    throw InputError("score/veto", "exactly one of score or veto",
                     "a manifest entry records either a fused score or a veto", CALFUSE_SITE);
  }
  if (score && !std::isfinite(*score)) {
    throw InputError("score", "a finite number", "fused score is not finite", CALFUSE_SITE);
  }

  // Hashing the inputs does not touch shared state; keep it outside the lock.
  ManifestEntry e;
  e.unit_id = inputs.unit_id;
  e.inputs_hash = sha256_hex(canonical_inputs_json(inputs));
  e.weight_set_id = inputs.weight_set_id;
  e.calibration_state_hash = inputs.calibration_state_hash;
  e.score = score;
  e.veto = std::move(veto);

  std::lock_guard<std::mutex> lk(append_mu_);

  const size_t n = published_.load(std::memory_order_relaxed);
  if (n >= kChunkSize * kMaxChunks) {
    CALFUSE_THROW(ErrorCode::kInternal, "manifest capacity exhausted");
  }

  e.sequence = static_cast<uint64_t>(n);
  e.previous_hash = (n == 0) ? kGenesisHash : slot(n - 1).entry_hash;
  e.timestamp = format_utc_iso8601(opt_.clock());

  const std::string body = entry_body_json(e);
  e.entry_hash = sha256_hex(body);
  if (opt_.signing_key) {
    e.signature = hmac_sha256_hex(*opt_.signing_key, body + "\n" + e.entry_hash);
  }

  auto& chunk = (*chunks_)[n / kChunkSize];
  if (!chunk) chunk = std::make_unique<Chunk>();
  (*chunk)[n % kChunkSize] = e;
  published_.store(n + 1, std::memory_order_release);

  log(LogLevel::DEBUG, "manifest: appended #" + std::to_string(n) + " unit=" + e.unit_id +
                           " entry_hash=" + e.entry_hash);
  return e;
}

ManifestEntry CalibrationManifest::at(size_t i) const {
  if (i >= size()) {
    CALFUSE_THROW(ErrorCode::kInternal, "manifest index " + std::to_string(i) + " out of range");
  }
  return slot(i);
}

std::vector<ManifestEntry> CalibrationManifest::snapshot() const {
  const size_t n = size();
  std::vector<ManifestEntry> out;
  out.reserve(n);
  for (size_t i = 0; i < n; ++i) out.push_back(slot(i));
  return out;
}

std::string CalibrationManifest::head_hash() const {
  const size_t n = size();
  return n == 0 ? kGenesisHash : slot(n - 1).entry_hash;
}

}  // namespace calfuse
