#include "engine/governance/dependency_graph.hpp"

#include <utility>

#include "engine/core/errors.hpp"

namespace calfuse::governance {

const char* to_string(EpistemicTier t) noexcept {
  switch (t) {
    case EpistemicTier::EMPIRICAL:   return "EMPIRICAL";
    case EpistemicTier::INFERENTIAL: return "INFERENTIAL";
    case EpistemicTier::AUDIT:       return "AUDIT";
    default:                         return "UNKNOWN";
  }
}

std::optional<EpistemicTier> parse_epistemic_tier(std::string_view s) noexcept {
  if (s == "EMPIRICAL" || s == "N1") return EpistemicTier::EMPIRICAL;
  if (s == "INFERENTIAL" || s == "N2") return EpistemicTier::INFERENTIAL;
  if (s == "AUDIT" || s == "N3") return EpistemicTier::AUDIT;
  return std::nullopt;
}

const char* to_string(EdgeKind k) noexcept {
  switch (k) {
    case EdgeKind::PRIMARY:  return "PRIMARY";
    case EdgeKind::ADVISORY: return "ADVISORY";
    default:                 return "UNKNOWN";
  }
}

std::optional<EdgeKind> parse_edge_kind(std::string_view s) noexcept {
  if (s == "PRIMARY") return EdgeKind::PRIMARY;
  if (s == "ADVISORY") return EdgeKind::ADVISORY;
  return std::nullopt;
}

void DependencyGraph::add_node(std::string id, EpistemicTier tier) {
  if (id.empty()) throw ConfigError("dependency graph node id must not be empty", CALFUSE_SITE);
  const std::string key = id;
  if (!nodes_.emplace(std::move(id), tier).second) {
    throw ConfigError("dependency graph node '" + key + "' declared twice", CALFUSE_SITE);
  }
}

void DependencyGraph::add_edge(std::string from, std::string to, EdgeKind kind) {
  if (!has_node(from)) {
    throw ConfigError("dependency edge references unknown node '" + from + "'", CALFUSE_SITE);
  }
  if (!has_node(to)) {
    throw ConfigError("dependency edge references unknown node '" + to + "'", CALFUSE_SITE);
  }
  for (const auto& e : edges_) {
    if (e.from == from && e.to == to) {
      throw ConfigError("dependency edge " + from + " -> " + to + " declared twice", CALFUSE_SITE);
    }
  }
  edges_.push_back(DependencyEdge{std::move(from), std::move(to), kind});
}

EpistemicTier DependencyGraph::tier(const std::string& id) const {
  auto it = nodes_.find(id);
  if (it == nodes_.end()) {
    throw ConfigError("dependency graph has no node '" + id + "'", CALFUSE_SITE);
  }
  return it->second;
}

}  // namespace calfuse::governance
