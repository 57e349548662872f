#include "gridopt/settings.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

#include "cereal/archives/json.hpp"
#include "cereal/types/string.hpp"
#include "gridopt/errors.hpp"
#include "spdlog/common.h"

void Settings::validate() const {
  if (n_generators < 1) {
    throw ConfigError("n_generators must be at least 1");
  }
  if (n_nodes <= n_generators) {
    throw ConfigError("n_nodes must exceed n_generators");
  }
  if (!(edge_probability > 0 && edge_probability <= 1)) {
    throw ConfigError("edge_probability must be in (0, 1]");
  }
  if (!std::isfinite(risk_weight) || risk_weight < 0) {
    throw ConfigError("risk_weight must be finite and non-negative");
  }
  if (!std::isfinite(reward_risk_weight) || reward_risk_weight < 0) {
    throw ConfigError("reward_risk_weight must be finite and non-negative");
  }
  if (!(learning_rate > 0) || !std::isfinite(learning_rate)) {
    throw ConfigError("learning_rate must be positive");
  }
  if (!(baseline_decay >= 0 && baseline_decay < 1)) {
    throw ConfigError("baseline_decay must be in [0, 1)");
  }
  if (refresh_interval_ms <= 0) {
    throw ConfigError("refresh_interval_ms must be positive");
  }
  if (history_window == 0) {
    throw ConfigError("history_window must be positive");
  }
  if (oracle_timeout_ms <= 0) {
    throw ConfigError("oracle_timeout_ms must be positive");
  }
  if (!(default_risk >= 0 && default_risk <= 1)) {
    throw ConfigError("default_risk must be in [0, 1]");
  }
  if (spdlog::level::from_str(log_level) == spdlog::level::off &&
      log_level != "off") {
    throw ConfigError("unknown log_level '" + log_level + "'");
  }
}

void Settings::to_stream(std::ostream& os) const {
  cereal::JSONOutputArchive ar(os);
  ar(cereal::make_nvp("gridopt", *this));
}

Settings Settings::from_stream(std::istream& is) {
  Settings settings;
  try {
    cereal::JSONInputArchive ar(is);
    ar(cereal::make_nvp("gridopt", settings));
  } catch (const cereal::Exception& e) {
    throw ConfigError(std::string("malformed settings: ") + e.what());
  } catch (const cereal::RapidJSONException& e) {
    throw ConfigError(std::string("malformed settings: ") + e.what());
  }
  settings.validate();
  return settings;
}

void Settings::to_file(const std::string& path) const {
  std::ofstream os(path);
  if (!os) {
    throw ConfigError("cannot write settings to " + path);
  }
  to_stream(os);
}

Settings Settings::from_file(const std::string& path) {
  std::ifstream is(path);
  if (!is) {
    throw ConfigError("cannot read settings from " + path);
  }
  return from_stream(is);
}

std::string Settings::to_str() const {
  std::stringstream os;
  to_stream(os);
  return os.str();
}

Settings Settings::from_str(const std::string& str) {
  std::stringstream is(str);
  return from_stream(is);
}
