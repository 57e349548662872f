#pragma once

#include <vector>

#include "gridopt/config.hpp"
#include "gridopt/cost.hpp"
#include "gridopt/topology.hpp"

struct Path {
  std::vector<index_type> nodes;
  std::vector<index_type> edges;

  float_type cost = 0;
  float_type resistance = 0;
  float_type risk = 0;  // cumulative risk exposure

  index_type hops() const { return static_cast<index_type>(edges.size()); }

  // Transmission loss in MW for `demand` MW carried along the path.
  float_type loss(float_type demand) const { return demand * resistance; }
};

// Minimum cost route over in-service edges. Ties are broken by hop count,
// then by the lexicographically smallest node sequence.
class PathFinder {
 public:
  explicit PathFinder(float_type risk_weight = default_risk_weight);

  // Throws NoPathError when `target` is unreachable from `source` and
  // UnknownEntityError for ids outside the topology.
  Path find(const Topology& topology, index_type source,
            index_type target) const;

  // Shortest routes from `source` to every node; unreachable entries are
  // empty paths with infinite cost.
  std::vector<Path> find_all(const Topology& topology, index_type source) const;

 private:
  const float_type risk_weight_;
};

// True when every consecutive node pair of `path` is joined by an in-service
// edge of `topology`.
bool is_valid_path(const Topology& topology, const std::vector<index_type>& path);
