#include "gridopt/risk.hpp"

#include <algorithm>

#include "gridopt/cost.hpp"

const char* to_string(RiskLevel level) {
  switch (level) {
    case RiskLevel::low:
      return "LOW";
    case RiskLevel::medium:
      return "MEDIUM";
    case RiskLevel::high:
      return "HIGH";
    case RiskLevel::critical:
      return "CRITICAL";
  }
  return "UNKNOWN";
}

const char* to_string(FailureType type) {
  switch (type) {
    case FailureType::none:
      return "none";
    case FailureType::thermal_overload:
      return "Thermal Overload";
    case FailureType::mechanical_fatigue:
      return "Mechanical Fatigue";
    case FailureType::electrical_disturbance:
      return "Electrical Disturbance";
    case FailureType::general_degradation:
      return "General Degradation";
  }
  return "unknown";
}

RiskLevel classify_level(float_type probability) {
  if (probability > 0.7) return RiskLevel::critical;
  if (probability > 0.4) return RiskLevel::high;
  if (probability > 0.2) return RiskLevel::medium;
  return RiskLevel::low;
}

FailureType classify_failure(const RiskFeatures& features,
                             float_type probability) {
  if (probability <= 0.3) return FailureType::none;
  if (features.temperature > 90) return FailureType::thermal_overload;
  if (features.vibration > 1.0) return FailureType::mechanical_fatigue;
  if (features.harmonics > 8) return FailureType::electrical_disturbance;
  return FailureType::general_degradation;
}

RiskFeatures edge_features(const Edge& edge) {
  RiskFeatures f;
  f.temperature = edge.temperature;
  f.load = edge.current;
  f.vibration = edge.condition.vibration;
  f.age = edge.condition.age;
  f.corrosion = edge.condition.corrosion;
  f.harmonics = edge.condition.harmonics;
  f.oil_quality = edge.condition.oil_quality;
  f.trip_count = edge.condition.trip_count;
  f.ambient_temperature = edge.condition.ambient_temperature;
  f.humidity = edge.condition.humidity;
  return f;
}

RiskAssessment HeuristicRiskOracle::score(const RiskFeatures& features) {
  const auto overload = std::clamp<float_type>(features.load / 500, 0, 1);
  const auto thermal = std::clamp<float_type>(features.temperature / 100, 0, 1);
  const auto aging = std::clamp<float_type>(features.age / 20, 0, 1);
  const auto vibration = std::clamp<float_type>(features.vibration, 0, 1);

  RiskAssessment res;
  res.probability = std::min<float_type>(
      clamp_risk(0.3 * overload + 0.4 * thermal + 0.2 * aging +
                 0.1 * vibration),
      0.95);
  res.level = classify_level(res.probability);
  res.failure_type = classify_failure(features, res.probability);
  return res;
}
