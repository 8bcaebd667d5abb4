#pragma once
/*
================================================================================
Core: Cryptographic Digest Utilities
FILE: cpp/engine/core/hashing.hpp

Purpose:
  - SHA-256 and HMAC-SHA256 for:
      * calibration state hashes (canonical config document)
      * layer content hashes and weight-set ids
      * manifest inputs_hash / entry_hash / signature

Design constraints:
  - Determinism: callers hash canonical JSON bytes, never in-memory layouts.
  - Output is always lowercase hex (64 chars for SHA-256).

Hardening:
  - Sha256 owns its OpenSSL digest context (RAII, non-copyable).
  - Signature comparison is constant time.
================================================================================
*/

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

// OpenSSL's EVP_MD_CTX, kept out of this header.
struct evp_md_ctx_st;

namespace calfuse {

using Digest256 = std::array<uint8_t, 32>;

// Incremental SHA-256. update() may be called any number of times before finish().
// finish() may be called once; the hasher is then reset and reusable.
class Sha256 {
 public:
  Sha256();

  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;

  void update(const void* data, size_t n);
  void update(std::string_view s) { update(s.data(), s.size()); }

  Digest256 finish();

 private:
  void reset();

  struct CtxFree {
    void operator()(evp_md_ctx_st* ctx) const noexcept;
  };
  std::unique_ptr<evp_md_ctx_st, CtxFree> ctx_;
};

// Lowercase hex encoding of arbitrary bytes.
std::string to_hex(const uint8_t* data, size_t n);

template <size_t N>
std::string to_hex(const std::array<uint8_t, N>& bytes) {
  return to_hex(bytes.data(), bytes.size());
}

// SHA-256 of data, 64 lowercase hex chars.
std::string sha256_hex(std::string_view data);

// HMAC-SHA256(key, data), 64 lowercase hex chars. Throws SignatureError for an empty key.
std::string hmac_sha256_hex(std::string_view key, std::string_view data);

// Constant-time comparison (length mismatch returns false immediately).
bool constant_time_equal(std::string_view a, std::string_view b) noexcept;

// True if s is non-empty and every char is [0-9a-fA-F].
bool is_hex_string(std::string_view s) noexcept;

}  // namespace calfuse
