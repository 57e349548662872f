#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "gridopt/config.hpp"
#include "gridopt/path.hpp"
#include "gridopt/topology.hpp"

struct Route {
  std::vector<index_type> path;
  float_type resistance = 0;
  float_type risk = 0;
  float_type cost = 0;
  float_type loss = 0;  // MW
};

struct PathRecord {
  index_type substation_id{};
  std::string substation_name;
  index_type generator_id{};
  std::string generator_name;
  float_type demand = 0;

  // Empty when the substation could not reach its generator this episode.
  std::optional<Route> route;

  bool resolved() const { return route.has_value(); }
};

struct EpisodeResult {
  uint64_t episode = 0;
  std::vector<PathRecord> paths;

  float_type total_loss = 0;  // MW, resolved substations only
  float_type loss_percent = 0;
  float_type avg_risk = 0;  // over distinct edges of resolved routes
  float_type total_demand = 0;
  float_type resolved_demand = 0;
  float_type reward = 0;

  index_type n_unresolved() const;
};

// Routes every substation to its assigned generator and aggregates loss and
// risk. `assignment[i]` is the generator node for topology.substations()[i].
// Deterministic for a fixed topology and assignment.
EpisodeResult evaluate_assignment(const Topology& topology,
                                  const PathFinder& finder,
                                  const std::vector<index_type>& assignment);
