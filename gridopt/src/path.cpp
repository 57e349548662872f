#include "gridopt/path.hpp"

#include <algorithm>
#include <cmath>

#include "gridopt/errors.hpp"

namespace {

bool same_cost(float_type lhs, float_type rhs) {
  if (lhs == rhs) return true;
  const auto scale = std::max<float_type>(
      {static_cast<float_type>(1), std::abs(lhs), std::abs(rhs)});
  return std::abs(lhs - rhs) <= 1e-12 * scale;
}

// Total order on candidate routes from a common source.
bool better(const Path& lhs, const Path& rhs) {
  if (!same_cost(lhs.cost, rhs.cost)) return lhs.cost < rhs.cost;
  if (lhs.hops() != rhs.hops()) return lhs.hops() < rhs.hops();
  return std::lexicographical_compare(lhs.nodes.begin(), lhs.nodes.end(),
                                      rhs.nodes.begin(), rhs.nodes.end());
}

}  // namespace

PathFinder::PathFinder(float_type risk_weight) : risk_weight_(risk_weight) {}

std::vector<Path> PathFinder::find_all(const Topology& topology,
                                       index_type source) const {
  topology.node(source);  // throws for unknown ids

  const auto n = topology.n_nodes();
  std::vector<Path> best(n);
  std::vector<bool> reached(n, false);
  std::vector<bool> settled(n, false);

  for (auto& p : best) {
    p.cost = inf_v;
  }
  best[source].nodes = {source};
  best[source].cost = 0;
  reached[source] = true;

  for (;;) {
    index_type u = -1;
    for (index_type i = 0; i < n; ++i) {
      if (reached[i] && !settled[i] && (u < 0 || better(best[i], best[u]))) {
        u = i;
      }
    }
    if (u < 0) break;
    settled[u] = true;

    for (const auto id : topology.neighbors(u)) {
      const auto& e = topology.edge(id);
      if (!e.in_service) continue;
      const auto v = e.other(u);
      if (settled[v]) continue;

      Path candidate = best[u];
      candidate.nodes.push_back(v);
      candidate.edges.push_back(id);
      candidate.cost += edge_weight(e, risk_weight_);
      candidate.resistance += std::max<float_type>(e.resistance, 0);
      candidate.risk += clamp_risk(e.risk);

      if (!reached[v] || better(candidate, best[v])) {
        best[v] = std::move(candidate);
        reached[v] = true;
      }
    }
  }

  return best;
}

Path PathFinder::find(const Topology& topology, index_type source,
                      index_type target) const {
  topology.node(target);  // throws for unknown ids
  auto all = find_all(topology, source);
  auto& path = all[target];
  if (path.nodes.empty()) {
    throw NoPathError(source, target);
  }
  return std::move(path);
}

bool is_valid_path(const Topology& topology,
                   const std::vector<index_type>& path) {
  if (path.empty()) return false;
  for (size_t i = 1; i < path.size(); ++i) {
    const auto id = topology.find_edge(path[i - 1], path[i]);
    if (!id || !topology.edge(*id).in_service) {
      return false;
    }
  }
  return true;
}
