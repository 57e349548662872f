#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "gridopt/config.hpp"
#include "gridopt/episode.hpp"
#include "gridopt/topology.hpp"

struct HistoryPoint {
  uint64_t episode = 0;
  float_type loss_percent = 0;
  float_type avg_risk = 0;
};

// Copy of the grid at publication time.
struct GridView {
  std::vector<Node> nodes;
  std::vector<Edge> edges;
};

struct Snapshot {
  std::optional<EpisodeResult> latest;
  std::deque<HistoryPoint> history;  // oldest first
  std::optional<float_type> best_loss;
  std::optional<float_type> worst_loss;
  uint64_t episodes_trained = 0;
  GridView grid;
};

// Holds the published engine state. Readers get an immutable snapshot that
// stays valid after later publications.
class StateGuard {
 public:
  explicit StateGuard(size_t history_window);

  // Throws std::logic_error unless result.episode == episodes_trained + 1.
  void publish(const EpisodeResult& result, const Topology& topology);

  std::shared_ptr<const Snapshot> snapshot() const;

  uint64_t episodes_trained() const;

 private:
  const size_t history_window_;

  mutable std::mutex mu_;
  std::shared_ptr<const Snapshot> current_;
};
