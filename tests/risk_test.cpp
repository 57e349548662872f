#include <cstdio>
#include <cstring>

#include "gridopt/risk.hpp"
#include "test_util.hpp"

static void test_classify_level() {
  std::printf("  test_classify_level...\n");
  CHECK(classify_level(0.1) == RiskLevel::low);
  CHECK(classify_level(0.2) == RiskLevel::low);
  CHECK(classify_level(0.21) == RiskLevel::medium);
  CHECK(classify_level(0.5) == RiskLevel::high);
  CHECK(classify_level(0.71) == RiskLevel::critical);
  CHECK(!std::strcmp(to_string(RiskLevel::critical), "CRITICAL"));
}

static void test_classify_failure() {
  std::printf("  test_classify_failure...\n");
  RiskFeatures f;
  f.temperature = 95;
  f.vibration = 2;
  f.harmonics = 9;
  CHECK(classify_failure(f, 0.3) == FailureType::none);
  CHECK(classify_failure(f, 0.5) == FailureType::thermal_overload);
  f.temperature = 50;
  CHECK(classify_failure(f, 0.5) == FailureType::mechanical_fatigue);
  f.vibration = 0.2;
  CHECK(classify_failure(f, 0.5) == FailureType::electrical_disturbance);
  f.harmonics = 2;
  CHECK(classify_failure(f, 0.5) == FailureType::general_degradation);
  CHECK(!std::strcmp(to_string(FailureType::thermal_overload),
                     "Thermal Overload"));
}

static void test_heuristic_oracle() {
  std::printf("  test_heuristic_oracle...\n");
  HeuristicRiskOracle oracle;

  RiskFeatures calm;
  calm.load = 100;
  calm.temperature = 20;
  calm.age = 2;
  calm.vibration = 0.1;
  const auto low = oracle.score(calm);
  CHECK_NEAR(low.probability, 0.3 * 0.2 + 0.4 * 0.2 + 0.2 * 0.1 + 0.1 * 0.1,
             1e-12);
  CHECK(low.level == RiskLevel::low);
  CHECK(low.failure_type == FailureType::none);

  RiskFeatures stressed;
  stressed.load = 900;
  stressed.temperature = 120;
  stressed.age = 40;
  stressed.vibration = 3;
  const auto high = oracle.score(stressed);
  CHECK(high.probability == 0.95);
  CHECK(high.level == RiskLevel::critical);
  CHECK(high.failure_type == FailureType::thermal_overload);
}

static void test_edge_features() {
  std::printf("  test_edge_features...\n");
  auto e = make_edge(0, 0, 1, 0.002);
  e.current = 321;
  e.temperature = 48;
  e.condition.age = 7;
  e.condition.harmonics = 4;
  const auto f = edge_features(e);
  CHECK(f.load == 321);
  CHECK(f.temperature == 48);
  CHECK(f.age == 7);
  CHECK(f.harmonics == 4);
  CHECK(f.oil_quality == 1);
}

int main() {
  std::printf("risk_test\n");

  test_classify_level();
  test_classify_failure();
  test_heuristic_oracle();
  test_edge_features();

  std::printf("OK: all risk tests passed\n");
  return 0;
}
