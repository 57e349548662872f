#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "gridopt/config.hpp"
#include "tsl/robin_map.h"

enum class NodeRole { generator, substation };

struct Node {
  index_type id{};
  NodeRole role = NodeRole::substation;
  std::string name;
  float_type demand = 0;   // MW, constant for the lifetime of the topology
  float_type voltage = 0;  // kV
};

// Condition monitoring readings of a line, consumed by the risk oracle.
struct AssetCondition {
  float_type vibration = 0;
  float_type age = 0;  // years
  float_type corrosion = 0;
  float_type harmonics = 0;  // THD %
  float_type oil_quality = 1;
  float_type trip_count = 0;
  float_type ambient_temperature = 25;
  float_type humidity = 50;
};

struct Edge {
  index_type id{};
  index_type u{};
  index_type v{};

  float_type resistance = 0;   // ohm
  float_type current = 0;      // A
  float_type temperature = 0;  // degC
  float_type power_flow = 0;   // MW
  float_type risk = 0;
  bool risk_known = false;
  bool in_service = true;

  AssetCondition condition{};

  index_type other(index_type node) const { return node == u ? v : u; }
};

struct NodeTelemetry {
  index_type id{};
  float_type voltage = 0;
};

struct EdgeTelemetry {
  index_type u{};
  index_type v{};
  float_type resistance = 0;
  float_type current = 0;
  float_type temperature = 0;
  AssetCondition condition{};
  bool in_service = true;
};

class Topology {
 public:
  // Throws TopologyError when ids are not 0..n-1 in order, roles or demands
  // are inconsistent, an edge is invalid or duplicated, or the graph is not
  // connected.
  Topology(std::vector<Node> nodes, std::vector<Edge> edges);

  // Random connected G(n, p) grid. Node 0..n_generators-1 are generators.
  static Topology generate(index_type n_nodes, index_type n_generators,
                           float_type edge_probability, rng_type& rng);

  index_type n_nodes() const { return static_cast<index_type>(nodes_.size()); }
  index_type n_edges() const { return static_cast<index_type>(edges_.size()); }

  const auto& nodes() const { return nodes_; }
  const auto& edges() const { return edges_; }
  const auto& generators() const { return generators_; }
  const auto& substations() const { return substations_; }

  const Node& node(index_type id) const;
  const Edge& edge(index_type id) const;

  // Incident edge ids of `node`, in service or not.
  const std::vector<index_type>& neighbors(index_type node) const;

  std::optional<index_type> find_edge(index_type u, index_type v) const;

  // Position of a substation in substations(), or nullopt for generators.
  std::optional<index_type> substation_slot(index_type node) const;

  // Known ids are applied; unknown ones are dropped and reported together in
  // one UnknownEntityError after the rest has been applied. A non-finite
  // reading keeps the previous value of its field.
  void apply_telemetry(const std::vector<NodeTelemetry>& node_updates,
                       const std::vector<EdgeTelemetry>& edge_updates);

  void set_risk(index_type edge, float_type risk);

  float_type total_demand() const;

  // Connectivity over in-service edges.
  bool connected() const;

 private:
  std::vector<Node> nodes_;
  std::vector<Edge> edges_;

  std::vector<std::vector<index_type>> incident_;
  tsl::robin_map<uint64_t, index_type> edge_index_;

  std::vector<index_type> generators_;
  std::vector<index_type> substations_;
  std::vector<index_type> substation_slots_;

  uint64_t edge_key(index_type u, index_type v) const;
  bool valid_node(index_type id) const;
  void update_power_flow(Edge& edge);
};
