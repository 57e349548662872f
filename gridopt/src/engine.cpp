#include "gridopt/engine.hpp"

#include "gridopt/errors.hpp"
#include "gridopt/logging.hpp"

GridEngine::GridEngine(const Settings& settings, Topology topology,
                       std::unique_ptr<TelemetrySource> telemetry,
                       std::unique_ptr<RiskOracle> oracle)
    : settings_(settings),
      telemetry_(std::move(telemetry)),
      oracle_(std::move(oracle)),
      guard_(settings.history_window),
      optimizer_(settings_, std::move(topology), *telemetry_, *oracle_,
                 guard_),
      logger_(get_logger("gridopt.engine")),
      task_("optimizer", settings.refresh_interval(),
            [this] { optimize_now(); }) {}

GridEngine::~GridEngine() { stop(); }

std::unique_ptr<GridEngine> GridEngine::from_settings(
    const Settings& settings) {
  settings.validate();
  set_log_level(settings.log_level);

  rng_type rng(settings.topology_seed);
  auto topology =
      Topology::generate(settings.n_nodes, settings.n_generators,
                         settings.edge_probability, rng);

  auto engine = std::make_unique<GridEngine>(
      settings, std::move(topology),
      std::make_unique<ScadaSimulator>(settings.telemetry_seed),
      std::make_unique<HeuristicRiskOracle>());

  if (!settings.policy_checkpoint.empty()) {
    try {
      engine->load_policy(settings.policy_checkpoint);
    } catch (const CheckpointError& e) {
      engine->logger_->warn("starting from an untrained policy: {}", e.what());
    }
  }
  return engine;
}

void GridEngine::start() {
  if (task_.running()) return;
  logger_->info("starting, refresh every {} ms",
                settings_.refresh_interval_ms);
  task_.start();
}

void GridEngine::stop() {
  if (!task_.running()) return;
  task_.stop();
  logger_->info("stopped after {} episodes", guard_.episodes_trained());

  if (!settings_.policy_checkpoint.empty()) {
    try {
      save_policy(settings_.policy_checkpoint);
    } catch (const CheckpointError& e) {
      logger_->error("{}", e.what());
    }
  }
}

EpisodeResult GridEngine::optimize_now() {
  std::lock_guard<std::mutex> lk(cycle_mu_);
  return optimizer_.train_episode();
}

EpisodeResult GridEngine::evaluate_greedy() const {
  std::lock_guard<std::mutex> lk(cycle_mu_);
  return optimizer_.evaluate_greedy();
}

VectorMF GridEngine::probabilities(index_type substation) const {
  std::lock_guard<std::mutex> lk(cycle_mu_);
  return optimizer_.probabilities(substation);
}

void GridEngine::save_policy(const std::string& path) const {
  std::lock_guard<std::mutex> lk(cycle_mu_);
  optimizer_.policy().to_file(path);
  logger_->info("policy saved to {}", path);
}

void GridEngine::load_policy(const std::string& path) {
  auto policy = Policy::from_file(path);
  std::lock_guard<std::mutex> lk(cycle_mu_);
  optimizer_.set_policy(std::move(policy));
  logger_->info("policy loaded from {} ({} updates)", path,
                optimizer_.policy().n_updates());
}
