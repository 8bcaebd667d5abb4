#include "engine/calibration/evidence_reference.hpp"

#include <utility>

#include "engine/core/errors.hpp"
#include "engine/core/hashing.hpp"

namespace calfuse {
namespace {

struct PrefixRule {
  std::string_view prefix;
  EvidenceKind kind;
};

constexpr PrefixRule kAcceptedPrefixes[] = {
    {"src/", EvidenceKind::kSource},
    {"artifacts/", EvidenceKind::kArtifact},
    {"docs/", EvidenceKind::kDocumentation},
};

bool has_parent_segment(std::string_view path) {
  size_t start = 0;
  while (start <= path.size()) {
    size_t end = path.find('/', start);
    if (end == std::string_view::npos) end = path.size();
    if (path.substr(start, end - start) == "..") return true;
    start = end + 1;
  }
  return false;
}

}  // namespace

const char* to_string(EvidenceKind k) noexcept {
  switch (k) {
    case EvidenceKind::kSource:        return "source";
    case EvidenceKind::kArtifact:      return "artifact";
    case EvidenceKind::kDocumentation: return "documentation";
    default:                           return "unknown";
  }
}

EvidenceReference::EvidenceReference(std::string locator, std::optional<std::string> content_id)
    : locator_(std::move(locator)), content_id_(std::move(content_id)) {
  if (locator_.empty()) {
    throw InvalidEvidenceError("evidence locator must not be empty", CALFUSE_SITE);
  }

  bool matched = false;
  for (const auto& rule : kAcceptedPrefixes) {
    if (locator_.size() > rule.prefix.size() &&
        std::string_view(locator_).substr(0, rule.prefix.size()) == rule.prefix) {
      kind_ = rule.kind;
      matched = true;
      break;
    }
  }
  if (!matched) {
    throw InvalidEvidenceError("evidence locator '" + locator_ +
                                   "' must start with src/, artifacts/ or docs/",
                               CALFUSE_SITE);
  }
  if (has_parent_segment(locator_)) {
    throw InvalidEvidenceError("evidence locator '" + locator_ + "' must not contain '..'",
                               CALFUSE_SITE);
  }
  if (content_id_ && !is_hex_string(*content_id_)) {
    throw InvalidEvidenceError("evidence content_id for '" + locator_ +
                                   "' must be a non-empty hex digest",
                               CALFUSE_SITE);
  }
}

JsonValue EvidenceReference::to_json() const {
  JsonValue o = JsonValue::make_object();
  if (content_id_) o.set("content_id", JsonValue::make_string(*content_id_));
  o.set("locator", JsonValue::make_string(locator_));
  return o;
}

}  // namespace calfuse
