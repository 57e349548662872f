#include "gridopt/policy.hpp"

#include <fstream>
#include <random>
#include <sstream>

#include "gridopt/errors.hpp"

static constexpr uint32_t checkpoint_magic = 0x67726f70;  // "grop"

bool PolicyParams::operator==(const PolicyParams& other) const {
  return (weights.rows() == other.weights.rows()) &&
         (weights.cols() == other.weights.cols()) &&
         (bias.cols() == other.bias.cols()) && (weights == other.weights) &&
         (bias == other.bias);
}

VectorMF softmax(const VectorMF& logits) {
  const VectorAF shifted = logits.array() - logits.maxCoeff();
  const VectorAF e = shifted.exp();
  return (e / e.sum()).matrix();
}

VectorMF action_probabilities(const PolicyParams& params,
                              const VectorMF& features) {
  const VectorMF logits = features * params.weights.transpose() + params.bias;
  return softmax(logits);
}

PolicyParams reinforce_update(const PolicyParams& params,
                              const std::vector<SampledAction>& samples,
                              float_type reward, float_type learning_rate) {
  MatrixF grad_weights = MatrixF::Zero(params.n_actions(), params.n_features());
  VectorMF grad_bias = VectorMF::Zero(params.n_actions());

  for (const auto& s : samples) {
    VectorMF g = -action_probabilities(params, s.features);
    g(s.action) += 1;
    grad_weights += g.transpose() * s.features;
    grad_bias += g;
  }

  PolicyParams res = params;
  const auto step = learning_rate * reward;
  res.weights += step * grad_weights;
  res.bias += step * grad_bias;
  return res;
}

Policy::Policy(index_type n_features, index_type n_actions)
    : params_{MatrixF::Zero(n_actions, n_features),
              VectorMF::Zero(n_actions)} {}

Policy::Policy(PolicyParams params) : params_(std::move(params)) {}

VectorMF Policy::probabilities(const VectorMF& features) const {
  return action_probabilities(params_, features);
}

index_type Policy::sample(const VectorMF& features, rng_type& rng) const {
  const VectorMF p = probabilities(features);
  std::discrete_distribution<index_type> dist(p.data(), p.data() + p.size());
  return dist(rng);
}

index_type Policy::greedy(const VectorMF& features) const {
  index_type a;
  probabilities(features).maxCoeff(&a);
  return a;
}

void Policy::update(const std::vector<SampledAction>& samples,
                    float_type reward, float_type learning_rate) {
  params_ = reinforce_update(params_, samples, reward, learning_rate);
  ++n_updates_;
}

bool Policy::operator==(const Policy& other) const {
  return (params_ == other.params_) && (n_updates_ == other.n_updates_);
}

void Policy::save(cereal::BinaryOutputArchive& ar) const {
  ar(checkpoint_magic, params_, n_updates_);
}

void Policy::load(cereal::BinaryInputArchive& ar) {
  uint32_t magic;
  ar(magic);
  if (magic != checkpoint_magic) {
    throw CheckpointError("not a policy checkpoint");
  }
  ar(params_, n_updates_);
  if (params_.bias.cols() != params_.n_actions()) {
    throw CheckpointError("policy checkpoint has inconsistent shapes");
  }
}

void Policy::to_stream(std::ostream& os) const {
  cereal::BinaryOutputArchive ar(os);
  ar(*this);
}

Policy Policy::from_stream(std::istream& is) {
  Policy policy;
  try {
    cereal::BinaryInputArchive ar(is);
    ar(policy);
  } catch (const cereal::Exception& e) {
    throw CheckpointError(std::string("truncated policy checkpoint: ") +
                          e.what());
  }
  return policy;
}

void Policy::to_file(const std::string& path) const {
  std::ofstream os(path, std::ios::binary);
  if (!os) {
    throw CheckpointError("cannot write policy checkpoint " + path);
  }
  to_stream(os);
}

Policy Policy::from_file(const std::string& path) {
  std::ifstream is(path, std::ios::binary);
  if (!is) {
    throw CheckpointError("cannot read policy checkpoint " + path);
  }
  return from_stream(is);
}

std::string Policy::to_str() const {
  std::stringstream os;
  to_stream(os);
  return os.str();
}

Policy Policy::from_str(const std::string& str) {
  std::stringstream is(str);
  return from_stream(is);
}
