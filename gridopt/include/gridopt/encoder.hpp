#pragma once

#include <optional>
#include <vector>

#include "gridopt/config.hpp"
#include "gridopt/path.hpp"
#include "gridopt/topology.hpp"

// Numeric encoding of the grid as seen from one substation:
//   [ one-hot substation slot | demand/100, mean incident risk,
//     max incident risk, degree/10 | per generator: relative path
//     resistance, mean path risk, reachable ]
class StateEncoder {
 public:
  explicit StateEncoder(const Topology& topology);

  static constexpr index_type n_local_features = 4;
  static constexpr index_type n_generator_features = 3;

  index_type n_features() const;

  // `candidates[g]` is the route to the g-th generator, nullopt when
  // unreachable.
  VectorMF encode(const Topology& topology, index_type substation,
                  const std::vector<std::optional<Path>>& candidates) const;

 private:
  const index_type n_substations_;
  const index_type n_generators_;
};
