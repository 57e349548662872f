#include "gridopt/encoder.hpp"

#include <algorithm>

#include "gridopt/cost.hpp"
#include "gridopt/errors.hpp"

StateEncoder::StateEncoder(const Topology& topology)
    : n_substations_(static_cast<index_type>(topology.substations().size())),
      n_generators_(static_cast<index_type>(topology.generators().size())) {}

index_type StateEncoder::n_features() const {
  return n_substations_ + n_local_features +
         n_generator_features * n_generators_;
}

VectorMF StateEncoder::encode(
    const Topology& topology, index_type substation,
    const std::vector<std::optional<Path>>& candidates) const {
  const auto slot = topology.substation_slot(substation);
  if (!slot) {
    throw UnknownEntityError("substation", {substation});
  }

  VectorMF x = VectorMF::Zero(n_features());
  x(*slot) = 1;

  index_type degree = 0;
  float_type risk_sum = 0;
  float_type risk_max = 0;
  for (const auto id : topology.neighbors(substation)) {
    const auto& e = topology.edge(id);
    if (!e.in_service) continue;
    const auto r = clamp_risk(e.risk);
    risk_sum += r;
    risk_max = std::max(risk_max, r);
    ++degree;
  }

  auto i = n_substations_;
  x(i++) = topology.node(substation).demand / 100;
  x(i++) = degree ? risk_sum / degree : 0;
  x(i++) = risk_max;
  x(i++) = static_cast<float_type>(degree) / 10;

  float_type max_resistance = 0;
  for (const auto& c : candidates) {
    if (c) max_resistance = std::max(max_resistance, c->resistance);
  }

  const std::optional<Path> unreachable;
  for (index_type g = 0; g < n_generators_; ++g) {
    const auto& c = g < static_cast<index_type>(candidates.size())
                        ? candidates[g]
                        : unreachable;
    if (c) {
      x(i++) = max_resistance > 0 ? c->resistance / max_resistance : 0;
      x(i++) = c->hops() ? c->risk / c->hops() : 0;
      x(i++) = 1;
    } else {
      x(i++) = 1;
      x(i++) = 1;
      x(i++) = 0;
    }
  }

  return x;
}
