#pragma once

#include "gridopt/config.hpp"

static constexpr auto loss_risk_reward = [](auto loss_percent, auto avg_risk,
                                            auto reward_risk_weight) {
  return -(loss_percent + reward_risk_weight * avg_risk);
};

// Exponential moving average of past rewards, used to turn a reward into an
// advantage before the policy update.
class RewardBaseline {
 public:
  RewardBaseline(float_type decay, bool normalize);

  // Advantage of `reward` against the rewards seen so far, then folds
  // `reward` into the running statistics. The first reward has advantage 0.
  float_type advantage(float_type reward);

  float_type mean() const { return mean_; }
  float_type variance() const { return var_; }
  bool initialized() const { return initialized_; }

 private:
  const float_type decay_;
  const bool normalize_;

  bool initialized_ = false;
  float_type mean_ = 0;
  float_type var_ = 0;
};
