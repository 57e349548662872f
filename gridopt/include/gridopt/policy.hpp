#pragma once

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "cereal/access.hpp"
#include "cereal/archives/binary.hpp"
#include "gridopt/config.hpp"
#include "gridopt/serialize.hpp"

// Linear softmax scorer: p(a | x) = softmax(x * weights^T + bias)(a).
struct PolicyParams {
  MatrixF weights;  // (n_actions, n_features)
  VectorMF bias;    // (1, n_actions)

  index_type n_actions() const { return weights.rows(); }
  index_type n_features() const { return weights.cols(); }

  bool operator==(const PolicyParams& other) const;

  template <class Archive>
  void serialize(Archive& ar) {
    ar(weights, bias);
  }
};

struct SampledAction {
  VectorMF features;
  index_type action{};
};

VectorMF softmax(const VectorMF& logits);

VectorMF action_probabilities(const PolicyParams& params,
                              const VectorMF& features);

// One REINFORCE ascent step: every sampled action's log-probability gradient
// (onehot(a) - p) x^T is scaled by `reward` and `learning_rate`.
PolicyParams reinforce_update(const PolicyParams& params,
                              const std::vector<SampledAction>& samples,
                              float_type reward, float_type learning_rate);

class Policy {
 public:
  // Zero parameters, i.e. the uniform distribution.
  Policy(index_type n_features, index_type n_actions);
  explicit Policy(PolicyParams params);
  Policy() = default;

  index_type n_actions() const { return params_.n_actions(); }
  index_type n_features() const { return params_.n_features(); }

  VectorMF probabilities(const VectorMF& features) const;

  index_type sample(const VectorMF& features, rng_type& rng) const;

  index_type greedy(const VectorMF& features) const;

  void update(const std::vector<SampledAction>& samples, float_type reward,
              float_type learning_rate);

  const auto& params() const { return params_; }
  uint64_t n_updates() const { return n_updates_; }

  bool operator==(const Policy& other) const;

  void to_stream(std::ostream& os) const;
  static Policy from_stream(std::istream& is);
  void to_file(const std::string& path) const;
  static Policy from_file(const std::string& path);
  std::string to_str() const;
  static Policy from_str(const std::string& str);

 private:
  PolicyParams params_;
  uint64_t n_updates_ = 0;

  friend class cereal::access;
  void save(cereal::BinaryOutputArchive& ar) const;
  void load(cereal::BinaryInputArchive& ar);
};
