#include "gridopt/topology.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <random>
#include <string_view>
#include <utility>

#include "gridopt/cost.hpp"
#include "gridopt/errors.hpp"
#include "gridopt/logging.hpp"
#include "spdlog/fmt/ranges.h"

namespace {

struct CatalogEntry {
  std::string_view name;
  float_type demand;
};

constexpr std::array<std::string_view, 2> generator_catalog = {
    "North Power Plant", "South Thermal Station"};

constexpr std::array<CatalogEntry, 6> substation_catalog = {{
    {"Downtown Substation", 45},
    {"Uptown Substation", 52},
    {"Industrial Zone Station", 75},
    {"Residential Hub", 38},
    {"Shopping Complex Node", 41},
    {"University Campus Hub", 48},
}};

constexpr float_type base_resistance = 0.002;
constexpr float_type nominal_voltage = 220;

}  // namespace

Topology::Topology(std::vector<Node> nodes, std::vector<Edge> edges)
    : nodes_(std::move(nodes)),
      edges_(std::move(edges)),
      incident_(nodes_.size()),
      substation_slots_(nodes_.size(), -1) {
  if (nodes_.empty()) {
    throw TopologyError("topology has no nodes");
  }

  for (index_type i = 0; i < n_nodes(); ++i) {
    auto& node = nodes_[i];
    if (node.id != i) {
      throw TopologyError("node ids must be 0.." + std::to_string(n_nodes() - 1) +
                          " in order, found " + std::to_string(node.id) +
                          " at position " + std::to_string(i));
    }
    if (node.role == NodeRole::generator) {
      if (node.demand != 0) {
        throw TopologyError("generator " + std::to_string(i) +
                            " declares a non-zero demand");
      }
      generators_.push_back(i);
    } else {
      if (!(node.demand >= 0)) {
        throw TopologyError("substation " + std::to_string(i) +
                            " has a negative demand");
      }
      substation_slots_[i] = static_cast<index_type>(substations_.size());
      substations_.push_back(i);
    }
  }
  if (generators_.empty() || substations_.empty()) {
    throw TopologyError("topology needs at least one generator and one substation");
  }

  edge_index_.reserve(edges_.size());
  for (index_type i = 0; i < n_edges(); ++i) {
    auto& e = edges_[i];
    if (e.id != i) {
      throw TopologyError("edge ids must be 0.." + std::to_string(n_edges() - 1) +
                          " in order");
    }
    if (!valid_node(e.u) || !valid_node(e.v)) {
      throw TopologyError("edge " + std::to_string(i) +
                          " references an unknown node");
    }
    if (e.u == e.v) {
      throw TopologyError("edge " + std::to_string(i) + " is a self loop");
    }
    if (!std::isfinite(e.resistance) || e.resistance < 0) {
      throw TopologyError("edge " + std::to_string(i) +
                          " has an invalid resistance");
    }
    if (!edge_index_.emplace(edge_key(e.u, e.v), i).second) {
      throw TopologyError("duplicate edge between " + std::to_string(e.u) +
                          " and " + std::to_string(e.v));
    }
    e.risk = clamp_risk(e.risk);
    update_power_flow(e);
    incident_[e.u].push_back(i);
    incident_[e.v].push_back(i);
  }

  if (!connected()) {
    throw TopologyError("topology is not connected");
  }
}

Topology Topology::generate(index_type n_nodes, index_type n_generators,
                            float_type edge_probability, rng_type& rng) {
  if (n_generators < 1 || n_nodes <= n_generators) {
    throw TopologyError("need at least one generator and one substation");
  }

  std::vector<Node> nodes(n_nodes);
  std::uniform_int_distribution<int> extra_demand(20, 60);
  for (index_type i = 0; i < n_nodes; ++i) {
    auto& node = nodes[i];
    node.id = i;
    node.voltage = nominal_voltage;
    if (i < n_generators) {
      node.role = NodeRole::generator;
      node.name = i < static_cast<index_type>(generator_catalog.size())
                      ? std::string(generator_catalog[i])
                      : "Generator " + std::to_string(i);
    } else {
      const auto slot = static_cast<size_t>(i - n_generators);
      node.role = NodeRole::substation;
      if (slot < substation_catalog.size()) {
        node.name = std::string(substation_catalog[slot].name);
        node.demand = substation_catalog[slot].demand;
      } else {
        node.name = "Substation " + std::to_string(i);
        node.demand = extra_demand(rng);
      }
    }
  }

  auto logger = get_logger("gridopt.topology");
  std::bernoulli_distribution has_edge(edge_probability);
  for (uint64_t attempt = 1;; ++attempt) {
    std::vector<Edge> edges;
    for (index_type u = 0; u < n_nodes; ++u) {
      for (index_type v = u + 1; v < n_nodes; ++v) {
        if (has_edge(rng)) {
          Edge e;
          e.id = static_cast<index_type>(edges.size());
          e.u = u;
          e.v = v;
          e.resistance = base_resistance;
          edges.push_back(e);
        }
      }
    }
    try {
      auto topology = Topology(nodes, std::move(edges));
      logger->debug("generated connected grid with {} nodes and {} edges "
                    "after {} attempt(s)",
                    topology.n_nodes(), topology.n_edges(), attempt);
      return topology;
    } catch (const TopologyError& e) {
      logger->trace("rejected grid sample {}: {}", attempt, e.what());
    }
  }
}

const Node& Topology::node(index_type id) const {
  if (!valid_node(id)) {
    throw UnknownEntityError("node", {id});
  }
  return nodes_[id];
}

const Edge& Topology::edge(index_type id) const {
  if (id < 0 || id >= n_edges()) {
    throw UnknownEntityError("edge", {id});
  }
  return edges_[id];
}

const std::vector<index_type>& Topology::neighbors(index_type node) const {
  if (!valid_node(node)) {
    throw UnknownEntityError("node", {node});
  }
  return incident_[node];
}

std::optional<index_type> Topology::find_edge(index_type u,
                                              index_type v) const {
  if (!valid_node(u) || !valid_node(v)) {
    return std::nullopt;
  }
  const auto it = edge_index_.find(edge_key(u, v));
  if (it == edge_index_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<index_type> Topology::substation_slot(index_type node) const {
  if (!valid_node(node) || substation_slots_[node] < 0) {
    return std::nullopt;
  }
  return substation_slots_[node];
}

void Topology::apply_telemetry(const std::vector<NodeTelemetry>& node_updates,
                               const std::vector<EdgeTelemetry>& edge_updates) {
  // Non-finite readings leave the previous value in place.
  const auto assign = [](float_type& field, float_type value) {
    if (!std::isfinite(value)) return false;
    field = value;
    return true;
  };
  std::vector<index_type> non_finite;

  std::vector<index_type> unknown_nodes;
  for (const auto& update : node_updates) {
    if (!valid_node(update.id)) {
      unknown_nodes.push_back(update.id);
      continue;
    }
    if (!assign(nodes_[update.id].voltage, update.voltage)) {
      get_logger("gridopt.topology")
          ->warn("node {}: non-finite voltage ignored", update.id);
    }
  }

  std::vector<index_type> unknown_edges;
  for (const auto& update : edge_updates) {
    const auto id = find_edge(update.u, update.v);
    if (!id) {
      unknown_edges.push_back(update.u);
      unknown_edges.push_back(update.v);
      continue;
    }
    auto& e = edges_[*id];
    bool finite =
        assign(e.resistance, std::max<float_type>(update.resistance, 0));
    finite = assign(e.current, update.current) && finite;
    finite = assign(e.temperature, update.temperature) && finite;
    if (!finite) non_finite.push_back(*id);
    e.condition = update.condition;
    e.in_service = update.in_service;
  }
  if (!non_finite.empty()) {
    get_logger("gridopt.topology")
        ->warn("edges {}: non-finite readings ignored",
               fmt::join(non_finite, ", "));
  }

  for (auto& e : edges_) {
    update_power_flow(e);
  }

  if (!unknown_nodes.empty() && !unknown_edges.empty()) {
    unknown_nodes.insert(unknown_nodes.end(), unknown_edges.begin(),
                         unknown_edges.end());
    throw UnknownEntityError("node and edge endpoint",
                             std::move(unknown_nodes));
  }
  if (!unknown_nodes.empty()) {
    throw UnknownEntityError("node", std::move(unknown_nodes));
  }
  if (!unknown_edges.empty()) {
    throw UnknownEntityError("edge endpoint", std::move(unknown_edges));
  }
}

void Topology::set_risk(index_type edge, float_type risk) {
  if (edge < 0 || edge >= n_edges()) {
    throw UnknownEntityError("edge", {edge});
  }
  edges_[edge].risk = clamp_risk(risk);
  edges_[edge].risk_known = true;
}

float_type Topology::total_demand() const {
  float_type total = 0;
  for (const auto s : substations_) {
    total += nodes_[s].demand;
  }
  return total;
}

bool Topology::connected() const {
  std::vector<bool> seen(nodes_.size(), false);
  std::vector<index_type> stack{0};
  seen[0] = true;
  index_type n_seen = 1;
  while (!stack.empty()) {
    const auto n = stack.back();
    stack.pop_back();
    for (const auto id : incident_[n]) {
      const auto& e = edges_[id];
      if (!e.in_service) continue;
      const auto m = e.other(n);
      if (!seen[m]) {
        seen[m] = true;
        ++n_seen;
        stack.push_back(m);
      }
    }
  }
  return n_seen == n_nodes();
}

uint64_t Topology::edge_key(index_type u, index_type v) const {
  const auto lo = static_cast<uint64_t>(std::min(u, v));
  const auto hi = static_cast<uint64_t>(std::max(u, v));
  return lo * static_cast<uint64_t>(nodes_.size()) + hi;
}

bool Topology::valid_node(index_type id) const {
  return id >= 0 && id < n_nodes();
}

void Topology::update_power_flow(Edge& edge) {
  const auto avg_voltage = (nodes_[edge.u].voltage + nodes_[edge.v].voltage) / 2;
  edge.power_flow = avg_voltage * edge.current / 1000;
}
