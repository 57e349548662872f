#include <cstdio>
#include <limits>

#include "gridopt/cost.hpp"
#include "test_util.hpp"

static void test_clamp_risk() {
  std::printf("  test_clamp_risk...\n");
  CHECK(clamp_risk(0.4) == 0.4);
  CHECK(clamp_risk(-0.1) == 0);
  CHECK(clamp_risk(1.5) == 1);
  CHECK(clamp_risk(std::numeric_limits<float_type>::quiet_NaN()) == 1);
}

static void test_edge_weight() {
  std::printf("  test_edge_weight...\n");
  CHECK_NEAR(edge_weight(make_edge(0, 0, 1, 0.002, 0.9)), 9.002, 1e-12);
  CHECK_NEAR(edge_weight(make_edge(0, 0, 1, 0.01, 0.1)), 1.01, 1e-12);
  CHECK_NEAR(edge_weight(make_edge(0, 0, 1, 0.01, 0.1), 0), 0.01, 1e-12);
  CHECK_NEAR(edge_weight(make_edge(0, 0, 1, 0.01, 0.1), 2), 0.21, 1e-12);
}

static void test_weight_never_negative() {
  std::printf("  test_weight_never_negative...\n");
  const float_type resistances[] = {-1, 0, 0.003,
                                    std::numeric_limits<float_type>::quiet_NaN()};
  const float_type risks[] = {-5, 0, 0.5, 7,
                              std::numeric_limits<float_type>::quiet_NaN()};
  const float_type weights[] = {-10, 0, 10};
  for (const auto r : resistances) {
    for (const auto k : risks) {
      for (const auto w : weights) {
        const auto weight = edge_weight(make_edge(0, 0, 1, r, k), w);
        CHECK(weight >= 0);
        CHECK(!std::isnan(weight));
      }
    }
  }
  // out-of-range risk behaves like the clamped value
  CHECK(edge_weight(make_edge(0, 0, 1, 0.001, 4)) ==
        edge_weight(make_edge(0, 0, 1, 0.001, 1)));
}

int main() {
  std::printf("cost_test\n");

  test_clamp_risk();
  test_edge_weight();
  test_weight_never_negative();

  std::printf("OK: all cost tests passed\n");
  return 0;
}
