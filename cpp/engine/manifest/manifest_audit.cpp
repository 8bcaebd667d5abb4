#include "engine/manifest/manifest_audit.hpp"

#include <istream>
#include <ostream>

#include "engine/core/canonical_json.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/hashing.hpp"
#include "engine/core/logging.hpp"

namespace calfuse {

bool verify_entry(const ManifestEntry& e, std::string_view key) {
  const std::string body = entry_body_json(e);
  if (!constant_time_equal(sha256_hex(body), e.entry_hash)) return false;
  if (!e.signature) return false;
  const std::string expected = hmac_sha256_hex(key, body + "\n" + e.entry_hash);
  return constant_time_equal(expected, *e.signature);
}

ChainVerification verify_chain(const std::vector<ManifestEntry>& entries,
                               std::optional<std::string_view> key) {
  ChainVerification out;
  auto bad = [&](size_t i, std::string why) {
    out.ok = false;
    out.first_bad = i;
    out.reason = "entry " + std::to_string(i) + ": " + std::move(why);
    log(LogLevel::WARN, "manifest verify failed: " + out.reason);
    return out;
  };

  for (size_t i = 0; i < entries.size(); ++i) {
    const auto& e = entries[i];
    if (e.sequence != static_cast<uint64_t>(i)) {
      return bad(i, "sequence " + std::to_string(e.sequence) + " out of order");
    }
    const std::string& expected_prev = (i == 0) ? kGenesisHash : entries[i - 1].entry_hash;
    if (e.previous_hash != expected_prev) {
      return bad(i, "previous_hash does not link to the prior entry");
    }
    if (sha256_hex(entry_body_json(e)) != e.entry_hash) {
      return bad(i, "entry_hash does not match entry body");
    }
    if (key && !verify_entry(e, *key)) {
      return bad(i, e.signature ? "signature mismatch" : "signature missing");
    }
  }

  log(LogLevel::INFO, "manifest verify ok: " + std::to_string(entries.size()) + " entries" +
                          (key ? " (signatures checked)" : ""));
  return out;
}

void write_jsonl(std::ostream& os, const std::vector<ManifestEntry>& entries) {
  for (const auto& e : entries) {
    os << to_canonical_json(entry_to_json(e)) << "\n";
  }
  if (!os) throw IoError("failed writing manifest JSON lines", CALFUSE_SITE);
}

std::vector<ManifestEntry> read_jsonl(std::istream& is) {
  std::vector<ManifestEntry> out;
  std::string line;
  size_t line_no = 0;
  while (std::getline(is, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.find_first_not_of(" \t") == std::string::npos) continue;

    JsonValue v;
    JsonParseError err;
    if (!parse_json(line, &v, &err)) {
      CALFUSE_THROW(ErrorCode::kParse,
                    "manifest line " + std::to_string(line_no) + ": " + err.to_string());
    }
    try {
      out.push_back(entry_from_json(v));
    } catch (const Error& e) {
      CALFUSE_THROW(ErrorCode::kParse,
                    "manifest line " + std::to_string(line_no) + ": " + e.message());
    }
  }
  return out;
}

}  // namespace calfuse
