#include "engine/core/hashing.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include "engine/core/errors.hpp"

namespace calfuse {

void Sha256::CtxFree::operator()(evp_md_ctx_st* ctx) const noexcept { EVP_MD_CTX_free(ctx); }

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
  CALFUSE_ENSURE(ctx_ != nullptr, ErrorCode::kInternal, "EVP_MD_CTX_new failed");
  reset();
}

void Sha256::reset() {
  CALFUSE_ENSURE(EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) == 1, ErrorCode::kInternal,
                 "EVP_DigestInit_ex(sha256) failed");
}

void Sha256::update(const void* data, size_t n) {
  if (data == nullptr || n == 0) return;
  CALFUSE_ENSURE(EVP_DigestUpdate(ctx_.get(), data, n) == 1, ErrorCode::kInternal, "EVP_DigestUpdate failed");
}

Digest256 Sha256::finish() {
  Digest256 out{};
  unsigned int len = 0;
  const bool ok = EVP_DigestFinal_ex(ctx_.get(), out.data(), &len) == 1 && len == out.size();
  CALFUSE_ENSURE(ok, ErrorCode::kInternal, "EVP_DigestFinal_ex failed");
  reset();
  return out;
}

std::string to_hex(const uint8_t* data, size_t n) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string s;
  s.resize(n * 2);
  for (size_t i = 0; i < n; ++i) {
    s[2 * i] = kHex[(data[i] >> 4) & 0xF];
    s[2 * i + 1] = kHex[data[i] & 0xF];
  }
  return s;
}

std::string sha256_hex(std::string_view data) {
  Sha256 h;
  h.update(data);
  return to_hex(h.finish());
}

std::string hmac_sha256_hex(std::string_view key, std::string_view data) {
  if (key.empty()) {
    throw SignatureError("HMAC key must not be empty", CALFUSE_SITE);
  }

  Digest256 mac{};
  unsigned int len = 0;
  const auto* bytes = static_cast<const unsigned char*>(static_cast<const void*>(data.data()));
  const unsigned char* res = HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
                                  bytes, data.size(), mac.data(), &len);
  if (res == nullptr || len != mac.size()) {
    throw SignatureError("HMAC-SHA256 computation failed", CALFUSE_SITE);
  }
  return to_hex(mac);
}

bool constant_time_equal(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) return false;
  if (a.empty()) return true;
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

bool is_hex_string(std::string_view s) noexcept {
  if (s.empty()) return false;
  for (char c : s) {
    const bool digit = (c >= '0' && c <= '9');
    const bool lo = (c >= 'a' && c <= 'f');
    const bool hi = (c >= 'A' && c <= 'F');
    if (!digit && !lo && !hi) return false;
  }
  return true;
}

}  // namespace calfuse
