#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "gridopt/episode.hpp"
#include "gridopt/optimizer.hpp"
#include "gridopt/periodic_task.hpp"
#include "gridopt/risk.hpp"
#include "gridopt/settings.hpp"
#include "gridopt/state_guard.hpp"
#include "gridopt/telemetry.hpp"
#include "gridopt/topology.hpp"
#include "spdlog/spdlog.h"

// Owns one grid and its optimizer. Scheduled and manual cycles serialize on
// a single mutex, so episode numbers are consecutive whatever triggers them.
class GridEngine {
 public:
  GridEngine(const Settings& settings, Topology topology,
             std::unique_ptr<TelemetrySource> telemetry,
             std::unique_ptr<RiskOracle> oracle);
  ~GridEngine();

  GridEngine(const GridEngine&) = delete;
  GridEngine& operator=(const GridEngine&) = delete;

  // Generated topology, SCADA simulator and heuristic oracle. Loads
  // settings.policy_checkpoint when set; an unreadable checkpoint is logged
  // and the policy starts untrained.
  static std::unique_ptr<GridEngine> from_settings(const Settings& settings);

  void start();
  // Saves the policy checkpoint when one is configured.
  void stop();
  bool running() const { return task_.running(); }

  EpisodeResult optimize_now();

  std::shared_ptr<const Snapshot> snapshot() const { return guard_.snapshot(); }

  EpisodeResult evaluate_greedy() const;
  VectorMF probabilities(index_type substation) const;

  void save_policy(const std::string& path) const;
  void load_policy(const std::string& path);

  const Settings& settings() const { return settings_; }

 private:
  const Settings settings_;
  std::unique_ptr<TelemetrySource> telemetry_;
  std::unique_ptr<RiskOracle> oracle_;
  StateGuard guard_;
  GridOptimizer optimizer_;
  mutable std::mutex cycle_mu_;
  std::shared_ptr<spdlog::logger> logger_;

  // Declared last: its thread is joined before anything it touches is gone.
  PeriodicTask task_;
};
