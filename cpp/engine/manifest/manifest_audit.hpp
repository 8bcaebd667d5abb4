#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "engine/manifest/calibration_manifest.hpp"

namespace calfuse {

// True iff entry_hash matches the recomputed body hash AND the signature is
// present and matches HMAC(key, body + "\n" + entry_hash). Comparison is
// constant time. Throws SignatureError for an empty key.
bool verify_entry(const ManifestEntry& e, std::string_view key);

struct ChainVerification {
  bool ok = true;
  std::optional<size_t> first_bad;  // index of the first failing entry
  std::string reason;
};

// Checks, in order, for every entry i:
//   sequence == i, previous_hash links to entry i-1 (genesis for i == 0),
//   entry_hash == sha256(body), and the signature when a key is given.
ChainVerification verify_chain(const std::vector<ManifestEntry>& entries,
                               std::optional<std::string_view> key = std::nullopt);

// One canonical JSON object per line.
void write_jsonl(std::ostream& os, const std::vector<ManifestEntry>& entries);

// Blank lines are skipped. Throws Error(kParse) with the 1-based line number.
std::vector<ManifestEntry> read_jsonl(std::istream& is);

}  // namespace calfuse
