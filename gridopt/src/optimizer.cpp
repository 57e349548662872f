#include "gridopt/optimizer.hpp"

#include <chrono>
#include <cmath>
#include <exception>

#include "gridopt/errors.hpp"
#include "gridopt/logging.hpp"
#include "spdlog/fmt/ranges.h"

GridOptimizer::GridOptimizer(const Settings& settings, Topology topology,
                             TelemetrySource& telemetry, RiskOracle& oracle,
                             StateGuard& guard)
    : settings_(settings),
      topology_(std::move(topology)),
      telemetry_(telemetry),
      oracle_(oracle),
      guard_(guard),
      finder_(settings.risk_weight),
      encoder_(topology_),
      policy_(encoder_.n_features(),
              static_cast<index_type>(topology_.generators().size())),
      baseline_(settings.baseline_decay, settings.normalize_advantage),
      rng_(settings.policy_seed),
      logger_(get_logger("gridopt.optimizer")) {}

void GridOptimizer::ingest_telemetry() {
  const auto frame = telemetry_.next(topology_);
  try {
    topology_.apply_telemetry(frame.nodes, frame.edges);
  } catch (const UnknownEntityError& e) {
    logger_->warn("telemetry frame {}: dropped updates for unknown {} {}",
                  frame.iteration, e.kind, fmt::join(e.ids, ", "));
  }
}

void GridOptimizer::score_risk() {
  using clock = std::chrono::steady_clock;
  const auto budget = settings_.oracle_timeout();

  for (index_type id = 0; id < topology_.n_edges(); ++id) {
    const auto& edge = topology_.edge(id);
    try {
      const auto start = clock::now();
      const auto assessment = oracle_.score(edge_features(edge));
      const auto elapsed =
          std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() -
                                                                start);
      if (elapsed > budget) {
        throw RiskOracleUnavailable("answer took " +
                                    std::to_string(elapsed.count()) + " ms");
      }
      topology_.set_risk(id, assessment.probability);
      if (assessment.level >= RiskLevel::high) {
        logger_->debug("edge {} ({}-{}): {} risk {:.3f}, {}", id, edge.u,
                       edge.v, to_string(assessment.level),
                       assessment.probability,
                       to_string(assessment.failure_type));
      }
    } catch (const std::exception& e) {
      if (edge.risk_known) {
        logger_->warn("risk of edge {} ({}-{}) unavailable, keeping {:.3f}: {}",
                      id, edge.u, edge.v, edge.risk, e.what());
      } else {
        logger_->warn("risk of edge {} ({}-{}) unavailable, assuming {:.3f}: {}",
                      id, edge.u, edge.v, settings_.default_risk, e.what());
        topology_.set_risk(id, settings_.default_risk);
      }
    }
  }
}

VectorMF GridOptimizer::features(index_type substation) const {
  const auto paths = finder_.find_all(topology_, substation);
  std::vector<std::optional<Path>> candidates;
  candidates.reserve(topology_.generators().size());
  for (const auto gen : topology_.generators()) {
    if (paths[gen].nodes.empty()) {
      candidates.emplace_back(std::nullopt);
    } else {
      candidates.emplace_back(paths[gen]);
    }
  }
  return encoder_.encode(topology_, substation, candidates);
}

EpisodeResult GridOptimizer::train_episode() {
  ingest_telemetry();
  score_risk();

  const auto& substations = topology_.substations();
  const auto& generators = topology_.generators();

  std::vector<SampledAction> samples;
  std::vector<index_type> assignment;
  samples.reserve(substations.size());
  assignment.reserve(substations.size());
  for (const auto sub : substations) {
    auto x = features(sub);
    const auto action = policy_.sample(x, rng_);
    assignment.push_back(generators[action]);
    samples.push_back({std::move(x), action});
  }

  auto result = evaluate_assignment(topology_, finder_, assignment);
  result.reward = loss_risk_reward(result.loss_percent, result.avg_risk,
                                   settings_.reward_risk_weight);

  std::vector<SampledAction> resolved;
  for (size_t i = 0; i < result.paths.size(); ++i) {
    const auto& record = result.paths[i];
    if (record.resolved()) {
      resolved.push_back(std::move(samples[i]));
    } else {
      logger_->warn("no path from {} ({}) to {} ({})", record.substation_name,
                    record.substation_id, record.generator_name,
                    record.generator_id);
    }
  }

  if (resolved.empty()) {
    logger_->warn("no substation resolved, policy update skipped");
  } else if (!std::isfinite(result.reward)) {
    logger_->warn("non-finite reward {}, policy update skipped", result.reward);
  } else {
    const auto advantage = baseline_.advantage(result.reward);
    policy_.update(resolved, advantage, settings_.learning_rate);
  }

  result.episode = guard_.episodes_trained() + 1;
  guard_.publish(result, topology_);

  logger_->debug("episode {}: loss {:.4f}% risk {:.4f} reward {:.4f}",
                 result.episode, result.loss_percent, result.avg_risk,
                 result.reward);
  if (result.episode % 10 == 0) {
    logger_->info("episode {}: loss {:.4f}% risk {:.4f} unresolved {}",
                  result.episode, result.loss_percent, result.avg_risk,
                  result.n_unresolved());
  }
  return result;
}

std::vector<index_type> GridOptimizer::greedy_assignment() const {
  std::vector<index_type> res;
  res.reserve(topology_.substations().size());
  for (const auto sub : topology_.substations()) {
    res.push_back(topology_.generators()[policy_.greedy(features(sub))]);
  }
  return res;
}

EpisodeResult GridOptimizer::evaluate_greedy() const {
  auto result = evaluate_assignment(topology_, finder_, greedy_assignment());
  result.reward = loss_risk_reward(result.loss_percent, result.avg_risk,
                                   settings_.reward_risk_weight);
  result.episode = guard_.episodes_trained();
  return result;
}

VectorMF GridOptimizer::probabilities(index_type substation) const {
  return policy_.probabilities(features(substation));
}

void GridOptimizer::set_policy(Policy policy) {
  if (policy.n_features() != policy_.n_features() ||
      policy.n_actions() != policy_.n_actions()) {
    throw CheckpointError(
        "policy checkpoint is for " + std::to_string(policy.n_actions()) +
        " generators and " + std::to_string(policy.n_features()) +
        " features, grid needs " + std::to_string(policy_.n_actions()) +
        " and " + std::to_string(policy_.n_features()));
  }
  policy_ = std::move(policy);
}
