// ============================================================================
// Manifest selftest
// ----------------------------------------------------------------------------
// Hash chain, HMAC signatures, tamper detection, JSON-lines persistence and
// concurrent appends with a lock-free reader.
// ============================================================================

#include <algorithm>
#include <atomic>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "engine/core/errors.hpp"
#include "engine/core/hashing.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/manifest/calibration_manifest.hpp"
#include "engine/manifest/manifest_audit.hpp"

namespace calfuse {
namespace {

using selftest::Report;

const std::string kKey = "manifest-test-key";
const std::string kState(64, 'a');

DecisionInputs inputs(const std::string& unit, std::vector<VetoResult> vetoes = {}) {
  return DecisionInputs{unit,
                        FusionRole::EXECUTOR,
                        "EXECUTOR:0123456789abcdef",
                        LayerScoreVector(0.88, 1.0, 0.91, 0.95, 0.83, 0.94, 0.76, 0.72),
                        std::move(vetoes),
                        kState};
}

VetoResult chain_veto() {
  VetoResult v;
  v.layer_id = "@chain";
  v.triggered = true;
  v.specificity_score = 0.9;
  v.reason = "chain incomplete";
  return v;
}

ManifestOptions signed_options() {
  ManifestOptions opt;
  opt.clock = fixed_clock(*parse_utc_iso8601("2024-03-15T12:30:00Z"));
  opt.signing_key = kKey;
  return opt;
}

void fill(CalibrationManifest& m) {
  (void)m.record(inputs("u1"), 0.8869, std::nullopt);
  (void)m.record(inputs("u2", {chain_veto()}), std::nullopt, chain_veto());
  (void)m.record(inputs("u3"), 0.5641, std::nullopt);
}

void test_chain(Report& r) {
  CalibrationManifest m(signed_options());
  r.check(m.size() == 0 && m.head_hash() == kGenesisHash, "empty manifest starts at genesis");
  fill(m);

  const auto entries = m.snapshot();
  r.check(entries.size() == 3, "three entries");
  r.check(entries[0].previous_hash == kGenesisHash, "first entry links to genesis");
  r.check(entries[1].previous_hash == entries[0].entry_hash && entries[2].previous_hash == entries[1].entry_hash,
          "entries link by hash");
  r.check(entries[2].sequence == 2 && m.head_hash() == entries[2].entry_hash, "sequence and head");
  r.check(entries[0].timestamp == "2024-03-15T12:30:00.000Z", "timestamp from injected clock");
  r.check(entries[1].vetoed() && !entries[1].score && entries[0].score == 0.8869, "score xor veto");
  r.check(entries[0].signature && entries[0].signature->size() == 64, "entries signed");
  r.check(verify_entry(entries[0], kKey), "single entry verifies");
  r.check(m.at(1).entry_hash == entries[1].entry_hash, "indexed access");
  r.check(selftest::throws_as<Error>(r, "oob", [&] { (void)m.at(3); }), "out of range index");

  r.check(verify_chain(entries).ok, "chain verifies without key");
  r.check(verify_chain(entries, std::string_view(kKey)).ok, "chain verifies with key");

  const ChainVerification wrong = verify_chain(entries, std::string_view("other-key"));
  r.check(!wrong.ok && wrong.first_bad == size_t{0}, "wrong key fails at the first entry");
}

void test_tampering(Report& r) {
  CalibrationManifest m(signed_options());
  fill(m);
  const auto good = m.snapshot();

  {
    auto t = good;
    t[1].veto->reason = "edited";
    const auto v = verify_chain(t);
    r.check(!v.ok && v.first_bad == size_t{1} && v.reason.find("entry_hash") != std::string::npos,
            "edited body detected");
  }
  {
    // Re-hashing the edited entry breaks the next link.
    auto t = good;
    t[0].score = 0.99;
    t[0].entry_hash = sha256_hex(entry_body_json(t[0]));
    const auto v = verify_chain(t);
    r.check(!v.ok && v.first_bad == size_t{1}, "re-hashed edit breaks the following link");
    r.check(!verify_chain({t[0]}, std::string_view(kKey)).ok, "re-hashed edit fails the signature");
  }
  {
    auto t = good;
    std::swap(t[1], t[2]);
    r.check(!verify_chain(t).ok, "reordering detected");
  }
  {
    auto t = good;
    t.erase(t.begin() + 1);
    const auto v = verify_chain(t);
    r.check(!v.ok && v.first_bad == size_t{1}, "deletion detected");
  }
  {
    auto t = good;
    t[2].signature.reset();
    r.check(verify_chain(t).ok, "hash chain alone ignores signatures");
    const auto v = verify_chain(t, std::string_view(kKey));
    r.check(!v.ok && v.reason.find("signature missing") != std::string::npos, "missing signature detected");
  }

  CalibrationManifest unsigned_m(ManifestOptions{});
  (void)unsigned_m.record(inputs("u1"), 0.5, std::nullopt);
  r.check(!unsigned_m.signing_enabled() && !unsigned_m.at(0).signature, "no key, no signature");
  r.check(!verify_chain(unsigned_m.snapshot(), std::string_view(kKey)).ok, "unsigned entries fail a keyed check");
}

void test_record_rules(Report& r) {
  CalibrationManifest m(signed_options());
  r.check(selftest::throws_as<InputError>(r, "both", [&] { (void)m.record(inputs("x"), 0.5, chain_veto()); }),
          "score and veto together rejected");
  r.check(selftest::throws_as<InputError>(r, "neither",
                                          [&] { (void)m.record(inputs("x"), std::nullopt, std::nullopt); }),
          "neither score nor veto rejected");
  r.check(m.size() == 0, "rejected records leave no entry");

  ManifestOptions empty_key;
  empty_key.signing_key = std::string();
  r.check(selftest::throws_as<SignatureError>(r, "empty key", [&] { CalibrationManifest bad(empty_key); }),
          "empty signing key rejected");

  VetoResult quiet;
  quiet.layer_id = "@q";
  quiet.specificity_score = 0.2;
  const std::string a = canonical_inputs_json(inputs("x", {chain_veto(), quiet}));
  const std::string b = canonical_inputs_json(inputs("x", {quiet, chain_veto()}));
  r.check(a == b, "inputs hash independent of veto order");
  r.check(canonical_inputs_json(inputs("y")) != canonical_inputs_json(inputs("x")), "inputs hash covers unit id");
}

void test_jsonl(Report& r) {
  CalibrationManifest m(signed_options());
  fill(m);

  std::ostringstream os;
  write_jsonl(os, m.snapshot());
  const std::string text = os.str();
  r.check(std::count(text.begin(), text.end(), '\n') == 3, "one line per entry");

  std::istringstream is("\n" + text + "\r\n");
  const auto back = read_jsonl(is);
  r.check(back.size() == 3, "all entries read back");
  r.check(verify_chain(back, std::string_view(kKey)).ok, "persisted chain still verifies");
  if (back.size() == 3) {
    r.check(back[1].veto && back[1].veto->reason == "chain incomplete", "veto survives persistence");
    r.check(back[0].score == 0.8869, "score survives persistence");
  }

  std::istringstream broken(text + "{\"schema\":\"calfuse_manifest_v1\"}\n");
  try {
    (void)read_jsonl(broken);
    r.fail("truncated entry accepted");
  } catch (const Error& e) {
    r.check(e.code() == ErrorCode::kParse && e.message().find("line 4") != std::string::npos,
            "parse error names the line");
  }
}

void test_concurrency(Report& r) {
  ManifestOptions opt;
  opt.signing_key = kKey;
  CalibrationManifest m(std::move(opt));

  constexpr int kThreads = 8;
  constexpr int kPerThread = 150;
  std::atomic<bool> done{false};
  std::atomic<int> reader_failures{0};

  std::thread reader([&] {
    while (!done.load()) {
      const auto snap = m.snapshot();
      if (!verify_chain(snap).ok) ++reader_failures;
    }
  });

  std::vector<std::thread> writers;
  for (int t = 0; t < kThreads; ++t) {
    writers.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        (void)m.record(inputs("t" + std::to_string(t) + "-" + std::to_string(i)), 0.5, std::nullopt);
      }
    });
  }
  for (auto& w : writers) w.join();
  done.store(true);
  reader.join();

  r.check(m.size() == static_cast<size_t>(kThreads * kPerThread), "every concurrent append recorded");
  r.check(reader_failures.load() == 0, "concurrent snapshots are always valid prefixes");
  r.check(verify_chain(m.snapshot(), std::string_view(kKey)).ok, "final chain verifies");
}

}  // namespace
}  // namespace calfuse

int main() {
  // verify_chain logs failures at WARN; the tamper cases produce them on purpose.
  calfuse::set_log_level(calfuse::LogLevel::ERROR);
  calfuse::selftest::Report r;
  calfuse::test_chain(r);
  calfuse::test_tampering(r);
  calfuse::test_record_rules(r);
  calfuse::test_jsonl(r);
  calfuse::test_concurrency(r);
  return calfuse::selftest::finish(r, "manifest_selftest");
}
