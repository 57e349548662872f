#include "gridopt/state_guard.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

StateGuard::StateGuard(size_t history_window)
    : history_window_(history_window),
      current_(std::make_shared<const Snapshot>()) {
  if (history_window_ == 0) {
    throw std::invalid_argument("history window must be positive");
  }
}

void StateGuard::publish(const EpisodeResult& result,
                         const Topology& topology) {
  // The grid copy is taken outside the lock.
  GridView grid{topology.nodes(), topology.edges()};

  std::lock_guard<std::mutex> lock(mu_);
  if (result.episode != current_->episodes_trained + 1) {
    throw std::logic_error("out of order publication: episode " +
                           std::to_string(result.episode) + " after " +
                           std::to_string(current_->episodes_trained));
  }

  auto next = std::make_shared<Snapshot>(*current_);
  next->latest = result;
  // Episodes with nothing resolved carry no loss information.
  if (result.resolved_demand > 0 && std::isfinite(result.loss_percent)) {
    next->history.push_back(
        {result.episode, result.loss_percent, result.avg_risk});
    while (next->history.size() > history_window_) {
      next->history.pop_front();
    }
    next->best_loss = next->best_loss
                          ? std::min(*next->best_loss, result.loss_percent)
                          : result.loss_percent;
    next->worst_loss = next->worst_loss
                           ? std::max(*next->worst_loss, result.loss_percent)
                           : result.loss_percent;
  }
  next->episodes_trained = result.episode;
  next->grid = std::move(grid);

  current_ = std::move(next);
}

std::shared_ptr<const Snapshot> StateGuard::snapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return current_;
}

uint64_t StateGuard::episodes_trained() const {
  std::lock_guard<std::mutex> lock(mu_);
  return current_->episodes_trained;
}
