#include "engine/governance/interaction_governor.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <map>
#include <set>
#include <sstream>

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"

namespace calfuse::governance {

const char* to_string(ViolationKind k) noexcept {
  switch (k) {
    case ViolationKind::kCycle:          return "CYCLE";
    case ViolationKind::kLevelInversion: return "LEVEL_INVERSION";
    default:                             return "UNKNOWN";
  }
}

namespace {

using Adjacency = std::map<std::string, std::set<std::string>>;

struct KahnResult {
  std::vector<std::string> order;
  std::vector<std::string> cycle;  // empty when acyclic
  std::set<std::string> residual;  // nodes left unsorted
  Adjacency succs;
  Adjacency preds;
};

std::string join_path(const std::vector<std::string>& nodes) {
  std::string s;
  for (size_t i = 0; i < nodes.size(); ++i) {
    if (i) s += " -> ";
    s += nodes[i];
  }
  return s;
}

// Walks predecessors inside the residual (unsorted) subgraph. Every residual
// node keeps at least one residual predecessor, so the walk must revisit a node.
std::vector<std::string> extract_cycle(const Adjacency& preds,
                                       const std::set<std::string>& residual) {
  std::vector<std::string> path;
  std::map<std::string, size_t> seen;
  std::string cur = *residual.begin();

  while (seen.find(cur) == seen.end()) {
    seen.emplace(cur, path.size());
    path.push_back(cur);
    const auto& ps = preds.at(cur);
    auto it = std::find_if(ps.begin(), ps.end(),
                           [&](const std::string& p) { return residual.count(p) != 0; });
    if (it == ps.end()) {
      CALFUSE_THROW(ErrorCode::kInternal, "residual node '" + cur + "' has no residual predecessor");
    }
    cur = *it;
  }

  // path[start..] was collected against edge direction; reverse it.
  std::vector<std::string> cycle(path.begin() + static_cast<std::ptrdiff_t>(seen[cur]), path.end());
  std::reverse(cycle.begin(), cycle.end());

  // Start at the smallest id so the reported cycle is stable.
  auto min_it = std::min_element(cycle.begin(), cycle.end());
  std::rotate(cycle.begin(), min_it, cycle.end());
  cycle.push_back(cycle.front());
  return cycle;
}

KahnResult run_kahn(const DependencyGraph& g) {
  KahnResult out;
  Adjacency& succs = out.succs;
  Adjacency& preds = out.preds;
  std::map<std::string, size_t> indegree;
  for (const auto& [id, tier] : g.nodes()) {
    (void)tier;
    succs[id];
    preds[id];
    indegree[id] = 0;
  }
  for (const auto& e : g.edges()) {
    if (succs[e.from].insert(e.to).second) {
      preds[e.to].insert(e.from);
      indegree[e.to]++;
    }
  }

  std::set<std::string> ready;
  for (const auto& [id, deg] : indegree) {
    if (deg == 0) ready.insert(id);
  }

  out.order.reserve(g.node_count());
  while (!ready.empty()) {
    const std::string n = *ready.begin();
    ready.erase(ready.begin());
    out.order.push_back(n);
    for (const auto& s : succs[n]) {
      if (--indegree[s] == 0) ready.insert(s);
    }
  }

  if (out.order.size() != g.node_count()) {
    for (const auto& [id, deg] : indegree) {
      if (deg > 0) out.residual.insert(id);
    }
    out.cycle = extract_cycle(preds, out.residual);
  }
  return out;
}

// Tarjan over the residual subgraph. Residual nodes downstream of a cycle form
// trivial components and are dropped; what is left is one component per
// independent knot of cycles.
class CyclicComponents {
 public:
  CyclicComponents(const Adjacency& succs, const std::set<std::string>& residual)
      : succs_(succs), residual_(residual) {
    for (const auto& n : residual_) {
      if (index_.find(n) == index_.end()) visit(n);
    }
  }

  const std::vector<std::set<std::string>>& components() const noexcept { return components_; }

 private:
  void visit(const std::string& n) {
    index_[n] = low_[n] = next_index_++;
    stack_.push_back(n);
    on_stack_.insert(n);

    for (const auto& s : succs_.at(n)) {
      if (residual_.count(s) == 0) continue;
      if (index_.find(s) == index_.end()) {
        visit(s);
        low_[n] = std::min(low_[n], low_[s]);
      } else if (on_stack_.count(s) != 0) {
        low_[n] = std::min(low_[n], index_[s]);
      }
    }

    if (low_[n] != index_[n]) return;
    std::set<std::string> comp;
    std::string top;
    do {
      top = stack_.back();
      stack_.pop_back();
      on_stack_.erase(top);
      comp.insert(top);
    } while (top != n);

    const bool self_loop = succs_.at(n).count(n) != 0;
    if (comp.size() > 1 || self_loop) components_.push_back(std::move(comp));
  }

  const Adjacency& succs_;
  const std::set<std::string>& residual_;
  std::map<std::string, size_t> index_;
  std::map<std::string, size_t> low_;
  std::vector<std::string> stack_;
  std::set<std::string> on_stack_;
  size_t next_index_ = 0;
  std::vector<std::set<std::string>> components_;
};

std::vector<DependencyEdge> find_inversions(const DependencyGraph& g) {
  std::vector<DependencyEdge> out;
  for (const auto& e : g.edges()) {
    if (e.kind != EdgeKind::PRIMARY) continue;
    if (static_cast<int>(g.tier(e.from)) > static_cast<int>(g.tier(e.to))) out.push_back(e);
  }
  return out;
}

std::string inversion_message(const DependencyGraph& g, const DependencyEdge& e) {
  return e.from + " (" + to_string(g.tier(e.from)) + ") -> " + e.to + " (" +
         to_string(g.tier(e.to)) + ")";
}

}  // namespace

std::vector<std::string> check_acyclic(const DependencyGraph& g) {
  KahnResult k = run_kahn(g);
  if (!k.cycle.empty()) {
    const std::string msg = "dependency cycle: " + join_path(k.cycle);
    log(LogLevel::ERROR, "governor: " + msg);
    throw CyclicDependencyError(msg, std::move(k.cycle), CALFUSE_SITE);
  }
  log(LogLevel::INFO, "governor: acyclic (" + std::to_string(g.node_count()) + " nodes, " +
                          std::to_string(g.edge_count()) + " edges)");
  return std::move(k.order);
}

void check_level_inversions(const DependencyGraph& g) {
  const auto inv = find_inversions(g);
  if (inv.empty()) {
    log(LogLevel::INFO, "governor: no level inversions");
    return;
  }

  std::vector<LevelInversionError::Edge> edges;
  std::string msg = "level inversion on " + std::to_string(inv.size()) + " primary edge(s): ";
  for (size_t i = 0; i < inv.size(); ++i) {
    if (i) msg += "; ";
    msg += inversion_message(g, inv[i]);
    edges.emplace_back(inv[i].from, inv[i].to);
  }
  log(LogLevel::ERROR, "governor: " + msg);
  throw LevelInversionError(msg, std::move(edges), CALFUSE_SITE);
}

std::vector<std::string> validate(const DependencyGraph& g) {
  auto order = check_acyclic(g);
  check_level_inversions(g);
  return order;
}

std::vector<GovernanceViolation> collect_violations(const DependencyGraph& g) {
  std::vector<GovernanceViolation> out;

  const KahnResult k = run_kahn(g);
  std::vector<std::vector<std::string>> cycles;
  for (const auto& comp : CyclicComponents(k.succs, k.residual).components()) {
    cycles.push_back(extract_cycle(k.preds, comp));
  }
  std::sort(cycles.begin(), cycles.end());
  for (auto& c : cycles) {
    GovernanceViolation v;
    v.kind = ViolationKind::kCycle;
    v.message = "dependency cycle: " + join_path(c);
    v.nodes = std::move(c);
    out.push_back(std::move(v));
  }

  for (const auto& e : find_inversions(g)) {
    GovernanceViolation v;
    v.kind = ViolationKind::kLevelInversion;
    v.nodes = {e.from, e.to};
    v.message = "level inversion: " + inversion_message(g, e);
    out.push_back(std::move(v));
  }
  return out;
}

// ----------------------------- Bounded product -------------------------------

void ProductBounds::validate() const {
  if (!std::isfinite(min) || !std::isfinite(max) || !(min > 0.0) || !(min < max)) {
    std::ostringstream oss;
    oss << "product bounds [" << min << ", " << max << "] must satisfy 0 < min < max (finite)";
    throw OutOfBoundsError(oss.str(), CALFUSE_SITE);
  }
}

BoundedProduct bounded_product(const std::vector<double>& factors, const ProductBounds& bounds) {
  bounds.validate();

  BoundedProduct out;
  for (size_t i = 0; i < factors.size(); ++i) {
    const double f = factors[i];
    if (!std::isfinite(f) || f < 0.0) {
      std::ostringstream oss;
      oss << "multiplicative factor " << i << " is " << f;
      throw InputError("factors[" + std::to_string(i) + "]", "finite and >= 0", oss.str(),
                       CALFUSE_SITE);
    }
    out.raw *= f;
  }

  out.value = std::clamp(out.raw, bounds.min, bounds.max);
  out.clamped = (out.value != out.raw);
  if (out.clamped) {
    std::ostringstream oss;
    oss.precision(12);
    oss << "bounded product clamped: raw=" << out.raw << " -> " << out.value
        << " bounds=[" << bounds.min << ", " << bounds.max << "]";
    log(LogLevel::WARN, oss.str());
  }
  return out;
}

}  // namespace calfuse::governance
