#pragma once

#include <cstdint>
#include <vector>

#include "gridopt/config.hpp"
#include "gridopt/topology.hpp"

struct TelemetryFrame {
  uint64_t iteration = 0;
  std::vector<NodeTelemetry> nodes;
  std::vector<EdgeTelemetry> edges;
};

class TelemetrySource {
 public:
  virtual ~TelemetrySource() = default;

  // Readings for the next cycle of `topology`.
  virtual TelemetryFrame next(const Topology& topology) = 0;
};

// Synthetic SCADA feed: bus voltages in [210, 230] kV, line resistance in
// [0.001, 0.005] ohm, current driven by the demand at both ends and a
// temperature that rises with current.
class ScadaSimulator : public TelemetrySource {
 public:
  explicit ScadaSimulator(uint64_t seed);

  TelemetryFrame next(const Topology& topology) override;

  uint64_t iteration() const { return iteration_; }

 private:
  rng_type rng_;
  uint64_t iteration_ = 0;
  std::vector<AssetCondition> assets_;
};
