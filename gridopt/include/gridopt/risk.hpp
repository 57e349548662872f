#pragma once

#include "gridopt/config.hpp"
#include "gridopt/topology.hpp"

struct RiskFeatures {
  float_type temperature = 0;  // degC
  float_type load = 0;         // A
  float_type vibration = 0;
  float_type age = 0;
  float_type corrosion = 0;
  float_type harmonics = 0;
  float_type oil_quality = 1;
  float_type trip_count = 0;
  float_type ambient_temperature = 25;
  float_type humidity = 50;
};

enum class RiskLevel { low, medium, high, critical };

enum class FailureType {
  none,
  thermal_overload,
  mechanical_fatigue,
  electrical_disturbance,
  general_degradation
};

const char* to_string(RiskLevel level);
const char* to_string(FailureType type);

RiskLevel classify_level(float_type probability);
FailureType classify_failure(const RiskFeatures& features,
                             float_type probability);

struct RiskAssessment {
  float_type probability = 0;
  RiskLevel level = RiskLevel::low;
  FailureType failure_type = FailureType::none;
};

RiskFeatures edge_features(const Edge& edge);

// Equipment failure scorer. Implementations must answer quickly; callers
// treat an answer later than their budget as unavailable. Failures are
// reported by throwing RiskOracleUnavailable.
class RiskOracle {
 public:
  virtual ~RiskOracle() = default;

  virtual RiskAssessment score(const RiskFeatures& features) = 0;
};

// Weighted blend of overload, thermal stress, age and vibration, capped at
// 0.95 so no line is ever scored as certain failure.
class HeuristicRiskOracle : public RiskOracle {
 public:
  RiskAssessment score(const RiskFeatures& features) override;
};
