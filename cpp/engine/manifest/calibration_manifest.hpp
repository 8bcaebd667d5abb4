// ============================================================================
// Manifest: Append-only, hash-chained decision record
// File: cpp/engine/manifest/calibration_manifest.hpp
// ============================================================================
//
// Purpose:
// - One entry per decision (fused or vetoed), enough to reproduce and verify it.
// - inputs_hash   = sha256(canonical_inputs_json(inputs))
// - previous_hash = entry_hash of the previous entry (64 zeros for the first)
// - entry_hash    = sha256(canonical body), body = every field except
//                   entry_hash and signature
// - signature     = HMAC-SHA256(key, body + "\n" + entry_hash), only when a
//                   signing key is configured
//
// Concurrency:
// - record() is serialized by a mutex.
// - snapshot()/size()/at() never take that mutex. Entries live in fixed chunks
//   that are never moved, and a published count is released after the slot
//   is written.
//
// ============================================================================

#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "engine/calibration/layer_score_vector.hpp"
#include "engine/core/clock.hpp"
#include "engine/core/json_reader.hpp"
#include "engine/fusion/fusion_weight_set.hpp"
#include "engine/veto/veto_coordinator.hpp"

namespace calfuse {

inline constexpr const char* kManifestSchemaVersion = "calfuse_manifest_v1";

// previous_hash of the first entry.
inline const std::string kGenesisHash(64, '0');

struct DecisionInputs {
  std::string unit_id;
  FusionRole role = FusionRole::EXECUTOR;
  std::string weight_set_id;
  LayerScoreVector scores;
  std::vector<VetoResult> veto_results;
  std::string calibration_state_hash;
};

// Sorted keys, no whitespace, shortest round-trip numbers; veto results in
// cascade order so the caller's ordering does not change the hash.
std::string canonical_inputs_json(const DecisionInputs& in);

struct ManifestEntry final {
  std::string schema = kManifestSchemaVersion;
  uint64_t sequence = 0;  // 0-based position in the chain
  std::string unit_id;
  std::string inputs_hash;
  std::string weight_set_id;
  std::string calibration_state_hash;
  std::optional<double> score;     // absent when vetoed
  std::optional<VetoResult> veto;  // the selected veto, if any
  std::string timestamp;           // UTC ISO-8601
  std::string previous_hash;
  std::string entry_hash;
  std::optional<std::string> signature;

  bool vetoed() const noexcept { return veto.has_value(); }
};

// Canonical body used for entry_hash (excludes entry_hash and signature).
std::string entry_body_json(const ManifestEntry& e);

JsonValue entry_to_json(const ManifestEntry& e);

// Throws calfuse::Error(kParse) naming the missing/ill-typed field.
ManifestEntry entry_from_json(const JsonValue& v);

struct ManifestOptions {
  Clock clock = system_now;
  std::optional<std::string> signing_key;  // HMAC key; no signatures when absent
};

class CalibrationManifest final {
 public:
  explicit CalibrationManifest(ManifestOptions opt = {});

  CalibrationManifest(const CalibrationManifest&) = delete;
  CalibrationManifest& operator=(const CalibrationManifest&) = delete;

  // Appends one entry and returns a copy of it. Exactly one of score / veto
  // must be set (InputError otherwise).
  ManifestEntry record(const DecisionInputs& inputs,
                       std::optional<double> score,
                       std::optional<VetoResult> veto);

  size_t size() const noexcept { return published_.load(std::memory_order_acquire); }

  // Copy of entry i (Error(kInternal) if i >= size()).
  ManifestEntry at(size_t i) const;

  // Consistent prefix of the chain as of the call.
  std::vector<ManifestEntry> snapshot() const;

  // entry_hash of the newest entry, or the genesis hash when empty.
  std::string head_hash() const;

  bool signing_enabled() const noexcept { return opt_.signing_key.has_value(); }

 private:
  static constexpr size_t kChunkSize = 1024;
  static constexpr size_t kMaxChunks = 16384;

  using Chunk = std::array<ManifestEntry, kChunkSize>;

  const ManifestEntry& slot(size_t i) const { return (*(*chunks_)[i / kChunkSize])[i % kChunkSize]; }

  ManifestOptions opt_;
  std::mutex append_mu_;
  std::unique_ptr<std::array<std::unique_ptr<Chunk>, kMaxChunks>> chunks_;
  std::atomic<size_t> published_{0};
};

}  // namespace calfuse
