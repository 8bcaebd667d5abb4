#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "engine/core/json_reader.hpp"

namespace calfuse {

// Namespace a locator points into, derived from its prefix.
enum class EvidenceKind : int {
  kSource = 0,         // "src/"
  kArtifact = 1,       // "artifacts/"
  kDocumentation = 2,  // "docs/"
};

const char* to_string(EvidenceKind k) noexcept;

// Pointer from a calibration decision to the artifact that justifies it.
// Invalid references throw InvalidEvidenceError (a provenance failure).
class EvidenceReference final {
 public:
  explicit EvidenceReference(std::string locator,
                             std::optional<std::string> content_id = std::nullopt);

  const std::string& locator() const noexcept { return locator_; }
  const std::optional<std::string>& content_id() const noexcept { return content_id_; }
  EvidenceKind kind() const noexcept { return kind_; }

  // {"content_id":"...","locator":"..."}; content_id omitted when absent.
  JsonValue to_json() const;

 private:
  std::string locator_;
  std::optional<std::string> content_id_;
  EvidenceKind kind_ = EvidenceKind::kSource;
};

}  // namespace calfuse
