#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace calfuse::governance {

// Epistemic rank of a computation. Values only flow upward (N1 -> N2 -> N3).
enum class EpistemicTier : uint8_t {
  EMPIRICAL = 1,    // N1
  INFERENTIAL = 2,  // N2
  AUDIT = 3,        // N3
};

const char* to_string(EpistemicTier t) noexcept;

// Accepts "EMPIRICAL"/"INFERENTIAL"/"AUDIT" and "N1"/"N2"/"N3".
std::optional<EpistemicTier> parse_epistemic_tier(std::string_view s) noexcept;

// PRIMARY edges feed the consumer's computation. ADVISORY edges only annotate
// it and are exempt from the level-inversion rule (they still count for cycles).
enum class EdgeKind : uint8_t { PRIMARY = 0, ADVISORY = 1 };

const char* to_string(EdgeKind k) noexcept;
std::optional<EdgeKind> parse_edge_kind(std::string_view s) noexcept;

struct DependencyEdge {
  std::string from;  // producer
  std::string to;    // consumer
  EdgeKind kind = EdgeKind::PRIMARY;
};

// Built once at load time, then only read. Structural problems (duplicate node,
// unknown endpoint, repeated edge) are ConfigError; cycles and inversions are
// left for the governor to report.
class DependencyGraph final {
 public:
  void add_node(std::string id, EpistemicTier tier);
  void add_edge(std::string from, std::string to, EdgeKind kind = EdgeKind::PRIMARY);

  bool has_node(const std::string& id) const { return nodes_.count(id) != 0; }
  EpistemicTier tier(const std::string& id) const;  // ConfigError if absent

  const std::map<std::string, EpistemicTier>& nodes() const noexcept { return nodes_; }
  const std::vector<DependencyEdge>& edges() const noexcept { return edges_; }

  size_t node_count() const noexcept { return nodes_.size(); }
  size_t edge_count() const noexcept { return edges_.size(); }

 private:
  std::map<std::string, EpistemicTier> nodes_;
  std::vector<DependencyEdge> edges_;
};

}  // namespace calfuse::governance
