#include "gridopt/reward.hpp"

#include <algorithm>
#include <cmath>

static constexpr float_type max_normalized_advantage = 5;
static constexpr float_type min_sigma = 1e-9;

RewardBaseline::RewardBaseline(float_type decay, bool normalize)
    : decay_(decay), normalize_(normalize) {}

float_type RewardBaseline::advantage(float_type reward) {
  if (!initialized_) {
    initialized_ = true;
    mean_ = reward;
    var_ = 0;
    return 0;
  }

  const auto diff = reward - mean_;
  auto res = diff;
  if (normalize_) {
    const auto sigma = std::sqrt(var_);
    if (sigma > min_sigma) {
      res = std::clamp(diff / sigma, -max_normalized_advantage,
                       max_normalized_advantage);
    } else if (std::abs(diff) > eps_v) {
      // first outcome that differs from a run of identical rewards
      res = diff > 0 ? 1 : -1;
    } else {
      res = 0;
    }
  }

  mean_ += (1 - decay_) * diff;
  var_ = decay_ * (var_ + (1 - decay_) * diff * diff);
  return res;
}
