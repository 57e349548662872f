#pragma once

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>

#include "cereal/cereal.hpp"
#include "gridopt/config.hpp"

// Startup-time configuration. Nothing here changes while the engine runs.
struct Settings {
  index_type n_nodes = 8;
  index_type n_generators = 2;
  float_type edge_probability = 0.5;
  uint64_t topology_seed = 42;
  uint64_t telemetry_seed = 7;
  uint64_t policy_seed = 1;

  float_type risk_weight = 10.0;
  float_type reward_risk_weight = 1.0;
  float_type learning_rate = 0.05;
  float_type baseline_decay = 0.9;
  bool normalize_advantage = true;

  int64_t refresh_interval_ms = 3000;
  size_t history_window = 100;
  int64_t oracle_timeout_ms = 50;
  float_type default_risk = 1.0;

  std::string policy_checkpoint;
  std::string log_level = "info";

  std::chrono::milliseconds refresh_interval() const {
    return std::chrono::milliseconds(refresh_interval_ms);
  }
  std::chrono::milliseconds oracle_timeout() const {
    return std::chrono::milliseconds(oracle_timeout_ms);
  }

  // Throws ConfigError describing the first invalid field.
  void validate() const;

  template <class Archive>
  void serialize(Archive& ar) {
    ar(CEREAL_NVP(n_nodes), CEREAL_NVP(n_generators),
       CEREAL_NVP(edge_probability), CEREAL_NVP(topology_seed),
       CEREAL_NVP(telemetry_seed), CEREAL_NVP(policy_seed),
       CEREAL_NVP(risk_weight), CEREAL_NVP(reward_risk_weight),
       CEREAL_NVP(learning_rate), CEREAL_NVP(baseline_decay),
       CEREAL_NVP(normalize_advantage), CEREAL_NVP(refresh_interval_ms),
       CEREAL_NVP(history_window), CEREAL_NVP(oracle_timeout_ms),
       CEREAL_NVP(default_risk), CEREAL_NVP(policy_checkpoint),
       CEREAL_NVP(log_level));
  }

  void to_stream(std::ostream& os) const;
  static Settings from_stream(std::istream& is);
  void to_file(const std::string& path) const;
  static Settings from_file(const std::string& path);
  std::string to_str() const;
  static Settings from_str(const std::string& str);
};
