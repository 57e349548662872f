#pragma once

#include <optional>
#include <string>
#include <vector>

#include "gridopt/config.hpp"
#include "gridopt/state_guard.hpp"

static constexpr float_type high_risk_threshold = 0.5;

struct SummaryStats {
  float_type mean = 0;
  float_type stddev = 0;  // population
  float_type min = 0;
  float_type max = 0;
};

// All zeros for an empty sample.
SummaryStats summarize(const VectorAF& values);

struct GridStatistics {
  index_type n_nodes = 0;
  index_type n_edges = 0;
  index_type n_in_service = 0;

  SummaryStats voltage;
  SummaryStats demand;  // substations only
  SummaryStats risk;
  SummaryStats temperature;
  SummaryStats current;

  float_type total_power_flow = 0;
  float_type mean_power_flow = 0;
  index_type high_risk_edges = 0;
};

GridStatistics grid_statistics(const GridView& grid);

struct NodeRisk {
  index_type id{};
  std::string name;
  index_type degree = 0;
  float_type avg_risk = 0;
  float_type max_risk = 0;
};

// Incident edge risk per node, highest average first. Ties keep id order.
std::vector<NodeRisk> rank_node_risk(const GridView& grid);

struct Neighbor {
  index_type id{};
  std::string name;
  Edge edge;
};

struct NodeDetail {
  Node node;
  std::vector<Neighbor> neighbors;
};

// Throws UnknownEntityError for an id outside the grid.
NodeDetail node_detail(const GridView& grid, index_type id);

struct LossSummary {
  std::optional<float_type> current;
  std::optional<float_type> best;
  std::optional<float_type> worst;
  uint64_t episodes = 0;
};

LossSummary loss_summary(const Snapshot& snapshot);
