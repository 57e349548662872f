#include "gridopt/statistics.hpp"

#include <algorithm>
#include <cmath>

#include "gridopt/errors.hpp"

SummaryStats summarize(const VectorAF& values) {
  if (!values.size()) return {};
  const auto mean = values.mean();
  const auto var = (values - mean).square().mean();
  return {mean, std::sqrt(var), values.minCoeff(), values.maxCoeff()};
}

GridStatistics grid_statistics(const GridView& grid) {
  GridStatistics res;
  res.n_nodes = static_cast<index_type>(grid.nodes.size());
  res.n_edges = static_cast<index_type>(grid.edges.size());

  VectorAF voltage(res.n_nodes);
  std::vector<float_type> demand;
  for (index_type i = 0; i < res.n_nodes; ++i) {
    const auto& n = grid.nodes[i];
    voltage(i) = n.voltage;
    if (n.role == NodeRole::substation) demand.push_back(n.demand);
  }
  res.voltage = summarize(voltage);
  res.demand = summarize(Eigen::Map<const VectorAF>(
      demand.data(), static_cast<index_type>(demand.size())));

  VectorAF risk(res.n_edges);
  VectorAF temperature(res.n_edges);
  VectorAF current(res.n_edges);
  VectorAF flow(res.n_edges);
  for (index_type i = 0; i < res.n_edges; ++i) {
    const auto& e = grid.edges[i];
    risk(i) = e.risk;
    temperature(i) = e.temperature;
    current(i) = e.current;
    flow(i) = e.power_flow;
    if (e.in_service) ++res.n_in_service;
  }
  res.risk = summarize(risk);
  res.temperature = summarize(temperature);
  res.current = summarize(current);
  res.total_power_flow = flow.sum();
  res.mean_power_flow = res.n_edges ? flow.mean() : 0;
  res.high_risk_edges = (risk > high_risk_threshold).count();
  return res;
}

std::vector<NodeRisk> rank_node_risk(const GridView& grid) {
  std::vector<NodeRisk> res;
  res.reserve(grid.nodes.size());
  for (const auto& n : grid.nodes) {
    res.push_back({n.id, n.name});
  }
  for (const auto& e : grid.edges) {
    for (const auto id : {e.u, e.v}) {
      auto& r = res[id];
      r.avg_risk += e.risk;
      r.max_risk = std::max(r.max_risk, e.risk);
      ++r.degree;
    }
  }
  for (auto& r : res) {
    if (r.degree) r.avg_risk /= r.degree;
  }
  std::stable_sort(res.begin(), res.end(),
                   [](const NodeRisk& a, const NodeRisk& b) {
                     return a.avg_risk > b.avg_risk;
                   });
  return res;
}

NodeDetail node_detail(const GridView& grid, index_type id) {
  if (id < 0 || id >= static_cast<index_type>(grid.nodes.size())) {
    throw UnknownEntityError("node", {id});
  }
  NodeDetail res{grid.nodes[id], {}};
  for (const auto& e : grid.edges) {
    if (e.u != id && e.v != id) continue;
    const auto& other = grid.nodes[e.other(id)];
    res.neighbors.push_back({other.id, other.name, e});
  }
  return res;
}

LossSummary loss_summary(const Snapshot& snapshot) {
  LossSummary res;
  if (snapshot.latest) res.current = snapshot.latest->loss_percent;
  res.best = snapshot.best_loss;
  res.worst = snapshot.worst_loss;
  res.episodes = snapshot.episodes_trained;
  return res;
}
