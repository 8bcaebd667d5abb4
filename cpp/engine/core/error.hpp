#pragma once

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace calfuse {

// Stable error codes. Values are written into CLI diagnostics; keep them stable.
enum class ErrorCode : int {
  // Construction-time fatal (malformed calibration, blocks readiness)
  kOutOfBounds          = 10,
  kIncompleteProvenance = 11,
  kInvalidEvidence      = 12,
  kWeightNormalization  = 13,
  kCyclicDependency     = 14,
  kLevelInversion       = 15,
  kConfig               = 16,

  // Per-call rejection (only the single call fails)
  kMissingLayer         = 20,
  kUnexpectedLayer      = 21,
  kScoreOutOfRange      = 22,
  kUnknownRole          = 23,
  kInvalidVeto          = 24,
  kInvalidInput         = 25,

  // Audit / IO
  kSignature            = 30,
  kIo                   = 31,
  kParse                = 32,

  kInternal             = 99,
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::kOutOfBounds:          return "OutOfBounds";
    case ErrorCode::kIncompleteProvenance: return "IncompleteProvenance";
    case ErrorCode::kInvalidEvidence:      return "InvalidEvidence";
    case ErrorCode::kWeightNormalization:  return "WeightNormalization";
    case ErrorCode::kCyclicDependency:     return "CyclicDependency";
    case ErrorCode::kLevelInversion:       return "LevelInversion";
    case ErrorCode::kConfig:               return "Config";
    case ErrorCode::kMissingLayer:         return "MissingLayer";
    case ErrorCode::kUnexpectedLayer:      return "UnexpectedLayer";
    case ErrorCode::kScoreOutOfRange:      return "ScoreOutOfRange";
    case ErrorCode::kUnknownRole:          return "UnknownRole";
    case ErrorCode::kInvalidVeto:          return "InvalidVeto";
    case ErrorCode::kInvalidInput:         return "InvalidInput";
    case ErrorCode::kSignature:            return "Signature";
    case ErrorCode::kIo:                   return "Io";
    case ErrorCode::kParse:                return "Parse";
    case ErrorCode::kInternal:             return "Internal";
    default:                               return "Unknown";
  }
}

struct ErrorSite final {
  const char* file = "";
  const char* func = "";
  int line = 0;
};

// Uniform exception type used across the engine.
// Includes: code + file/line/function for auditability.
class Error : public std::runtime_error {
 public:
  Error(ErrorCode code, std::string message, ErrorSite site = {})
      : std::runtime_error(build_what(code, message, site)),
        code_(code),
        message_(std::move(message)),
        site_(site) {}

  ErrorCode code() const noexcept { return code_; }
  const std::string& message() const noexcept { return message_; }
  const ErrorSite& where() const noexcept { return site_; }

 private:
  static std::string build_what(ErrorCode code, const std::string& msg, const ErrorSite& site) {
    std::ostringstream oss;
    oss << "[calfuse::Error code=" << to_string(code) << "(" << static_cast<int>(code) << ")] "
        << (msg.empty() ? std::string{"<empty error message>"} : msg);
    if (site.file && *site.file) {
      oss << " @ " << site.file << ":" << site.line;
      if (site.func && *site.func) oss << " (" << site.func << ")";
    }
    return oss.str();
  }

  ErrorCode code_;
  std::string message_;
  ErrorSite site_;
};

[[noreturn]] inline void throw_error(ErrorCode code, std::string message, ErrorSite site) {
  throw Error(code, std::move(message), site);
}

inline void ensure(bool ok, ErrorCode code, std::string message, ErrorSite site) {
  if (!ok) {
    throw_error(code, std::move(message), site);
  }
}

}  // namespace calfuse

#define CALFUSE_SITE ::calfuse::ErrorSite{__FILE__, __func__, __LINE__}
#define CALFUSE_THROW(CODE, MSG) ::calfuse::throw_error((CODE), (MSG), CALFUSE_SITE)
#define CALFUSE_ENSURE(EXPR, CODE, MSG) ::calfuse::ensure((EXPR), (CODE), (MSG), CALFUSE_SITE)
