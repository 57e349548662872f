#include "gridopt/telemetry.hpp"

#include <algorithm>
#include <random>

ScadaSimulator::ScadaSimulator(uint64_t seed) : rng_(seed) {}

TelemetryFrame ScadaSimulator::next(const Topology& topology) {
  using uniform = std::uniform_real_distribution<float_type>;

  if (assets_.size() != static_cast<size_t>(topology.n_edges())) {
    // Line age and installation quality are drawn once per line.
    assets_.resize(topology.n_edges());
    for (auto& a : assets_) {
      a.age = uniform(0, 20)(rng_);
      a.corrosion = uniform(0, 0.5)(rng_);
      a.oil_quality = uniform(0.6, 1)(rng_);
    }
  }

  TelemetryFrame frame;
  frame.iteration = ++iteration_;

  std::vector<float_type> demand(topology.n_nodes(), 0);
  frame.nodes.reserve(topology.n_nodes());
  for (const auto& node : topology.nodes()) {
    frame.nodes.push_back({node.id, uniform(210, 230)(rng_)});
    if (node.role == NodeRole::substation) {
      demand[node.id] = std::max(node.demand + uniform(-2, 2)(rng_),
                                 node.demand * 0.8);
    }
  }

  frame.edges.reserve(topology.n_edges());
  for (const auto& e : topology.edges()) {
    EdgeTelemetry t;
    t.u = e.u;
    t.v = e.v;
    t.resistance = uniform(0.001, 0.005)(rng_);
    t.current = uniform(100, 400)(rng_) + (demand[e.u] + demand[e.v]) * 2;
    t.temperature = 25 + (t.current / 400) * 40 + uniform(-2, 2)(rng_);

    auto& a = assets_[e.id];
    a.vibration = uniform(0, 1)(rng_);
    a.harmonics = uniform(1, 10)(rng_);
    a.ambient_temperature = uniform(15, 35)(rng_);
    a.humidity = uniform(30, 90)(rng_);
    if (t.temperature > 80) {
      a.trip_count += 1;
    }
    t.condition = a;
    t.in_service = e.in_service;

    frame.edges.push_back(t);
  }

  return frame;
}
