#include "gridopt/episode.hpp"

#include <algorithm>
#include <stdexcept>

#include "gridopt/errors.hpp"

index_type EpisodeResult::n_unresolved() const {
  return std::count_if(paths.begin(), paths.end(),
                       [](const PathRecord& p) { return !p.resolved(); });
}

EpisodeResult evaluate_assignment(const Topology& topology,
                                  const PathFinder& finder,
                                  const std::vector<index_type>& assignment) {
  const auto& substations = topology.substations();
  if (assignment.size() != substations.size()) {
    throw std::invalid_argument("assignment covers " +
                                std::to_string(assignment.size()) + " of " +
                                std::to_string(substations.size()) +
                                " substations");
  }

  EpisodeResult res;
  res.paths.reserve(substations.size());
  std::vector<bool> used(topology.n_edges(), false);

  for (size_t i = 0; i < substations.size(); ++i) {
    const auto& sub = topology.node(substations[i]);
    const auto& gen = topology.node(assignment[i]);
    if (gen.role != NodeRole::generator) {
      throw std::invalid_argument("node " + std::to_string(gen.id) +
                                  " is not a generator");
    }

    PathRecord record;
    record.substation_id = sub.id;
    record.substation_name = sub.name;
    record.generator_id = gen.id;
    record.generator_name = gen.name;
    record.demand = sub.demand;
    res.total_demand += sub.demand;

    try {
      auto path = finder.find(topology, sub.id, gen.id);
      Route route;
      route.resistance = path.resistance;
      route.risk = path.risk;
      route.cost = path.cost;
      route.loss = path.loss(sub.demand);
      route.path = std::move(path.nodes);
      for (const auto id : path.edges) {
        used[id] = true;
      }
      res.total_loss += route.loss;
      res.resolved_demand += sub.demand;
      record.route = std::move(route);
    } catch (const NoPathError&) {
      record.route = std::nullopt;
    }

    res.paths.push_back(std::move(record));
  }

  res.loss_percent =
      res.resolved_demand > 0 ? 100 * res.total_loss / res.resolved_demand : 0;

  float_type risk_sum = 0;
  index_type n_used = 0;
  for (index_type id = 0; id < topology.n_edges(); ++id) {
    if (used[id]) {
      risk_sum += topology.edge(id).risk;
      ++n_used;
    }
  }
  res.avg_risk = n_used ? risk_sum / n_used : 0;

  return res;
}
