#pragma once

#include <memory>
#include <vector>

#include "gridopt/config.hpp"
#include "gridopt/encoder.hpp"
#include "gridopt/episode.hpp"
#include "gridopt/path.hpp"
#include "gridopt/policy.hpp"
#include "gridopt/reward.hpp"
#include "gridopt/risk.hpp"
#include "gridopt/settings.hpp"
#include "gridopt/state_guard.hpp"
#include "gridopt/telemetry.hpp"
#include "gridopt/topology.hpp"
#include "spdlog/spdlog.h"

// Runs training episodes: telemetry, risk scoring, generator assignment,
// routing, policy update and publication. Not thread-safe; callers serialize
// train_episode().
class GridOptimizer {
 public:
  GridOptimizer(const Settings& settings, Topology topology,
                TelemetrySource& telemetry, RiskOracle& oracle,
                StateGuard& guard);

  // One full cycle. Per-entity failures are logged and absorbed; the
  // published result is returned.
  EpisodeResult train_episode();

  // Arg-max generator per substation under the current policy and grid.
  std::vector<index_type> greedy_assignment() const;

  // Deterministic evaluation of greedy_assignment(). Trains nothing and
  // publishes nothing.
  EpisodeResult evaluate_greedy() const;

  // Generator probabilities for `substation`, in generators() order.
  VectorMF probabilities(index_type substation) const;

  // Throws CheckpointError when the shapes do not match this grid.
  void set_policy(Policy policy);

  const Policy& policy() const { return policy_; }
  const Topology& topology() const { return topology_; }
  const RewardBaseline& baseline() const { return baseline_; }

 private:
  const Settings settings_;
  Topology topology_;
  TelemetrySource& telemetry_;
  RiskOracle& oracle_;
  StateGuard& guard_;

  const PathFinder finder_;
  const StateEncoder encoder_;
  Policy policy_;
  RewardBaseline baseline_;
  rng_type rng_;

  std::shared_ptr<spdlog::logger> logger_;

  void ingest_telemetry();
  void score_risk();
  VectorMF features(index_type substation) const;
};
