#pragma once

#include <algorithm>
#include <cmath>

#include "gridopt/config.hpp"
#include "gridopt/topology.hpp"

static constexpr float_type default_risk_weight = 10.0;

// NaN counts as maximum risk.
inline float_type clamp_risk(float_type risk) {
  if (std::isnan(risk)) return 1;
  return std::clamp<float_type>(risk, 0, 1);
}

// resistance + risk_weight * risk, never negative.
inline float_type edge_weight(const Edge& edge,
                              float_type risk_weight = default_risk_weight) {
  const auto resistance = std::isnan(edge.resistance)
                              ? static_cast<float_type>(0)
                              : std::max<float_type>(edge.resistance, 0);
  return resistance + std::max<float_type>(risk_weight, 0) *
                          clamp_risk(edge.risk);
}
