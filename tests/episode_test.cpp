#include <cstdio>
#include <stdexcept>
#include <vector>

#include "gridopt/episode.hpp"
#include "test_util.hpp"

static void test_aggregates() {
  std::printf("  test_aggregates...\n");
  auto t = two_generator_grid();
  t.set_risk(0, 0.4);
  t.set_risk(2, 0.2);
  const PathFinder finder(0);

  // A to generator 0, everyone else to generator 1
  const std::vector<index_type> assignment{0, 1, 1, 1, 1, 1};
  const auto res = evaluate_assignment(t, finder, assignment);

  CHECK(res.paths.size() == 6);
  CHECK(res.n_unresolved() == 0);
  CHECK(res.total_demand == t.total_demand());
  CHECK(res.resolved_demand == t.total_demand());

  const auto& a = res.paths[0];
  CHECK(a.substation_id == 2);
  CHECK(a.generator_id == 0);
  CHECK(a.demand == 45);
  CHECK(a.resolved());
  CHECK((a.route->path == std::vector<index_type>{2, 0}));
  CHECK_NEAR(a.route->loss, 0.045, 1e-12);

  const auto others = (52 + 75 + 38 + 41 + 48) * 0.002;
  CHECK_NEAR(res.total_loss, 0.045 + others, 1e-12);
  CHECK_NEAR(res.loss_percent, 100 * (0.045 + others) / t.total_demand(),
             1e-12);
  // distinct edges used: 0 (risk 0.4) and the five generator 1 lines
  CHECK_NEAR(res.avg_risk, 0.4 / 6, 1e-12);
}

static void test_unresolved() {
  std::printf("  test_unresolved...\n");
  auto t = two_generator_grid();
  // cut substation 7 off
  EdgeTelemetry a;
  a.u = 7;
  a.v = 0;
  a.resistance = 0.002;
  a.in_service = false;
  auto b = a;
  b.v = 1;
  t.apply_telemetry({}, {a, b});

  const PathFinder finder;
  const auto res = evaluate_assignment(t, finder, {0, 0, 0, 0, 0, 0});
  CHECK(res.n_unresolved() == 1);
  CHECK(!res.paths[5].resolved());
  CHECK(res.paths[5].substation_id == 7);
  CHECK(res.resolved_demand == t.total_demand() - 48);
  CHECK_NEAR(res.loss_percent, 100 * res.total_loss / res.resolved_demand,
             1e-12);
  for (index_type i = 0; i < 5; ++i) CHECK(res.paths[i].resolved());
}

static void test_nothing_resolved() {
  std::printf("  test_nothing_resolved...\n");
  auto t = single_substation_grid();
  EdgeTelemetry off;
  off.u = 0;
  off.v = 2;
  off.in_service = false;
  t.apply_telemetry({}, {off});

  const auto res = evaluate_assignment(t, PathFinder(), {0});
  CHECK(res.n_unresolved() == 1);
  CHECK(res.loss_percent == 0);
  CHECK(res.avg_risk == 0);
  CHECK(res.total_demand == 45);
}

static void test_bad_assignment() {
  std::printf("  test_bad_assignment...\n");
  const auto t = two_generator_grid();
  const PathFinder finder;
  CHECK_THROWS(evaluate_assignment(t, finder, {0, 1}), std::invalid_argument);
  CHECK_THROWS(evaluate_assignment(t, finder, {0, 1, 2, 0, 0, 0}),
               std::invalid_argument);
}

static void test_deterministic() {
  std::printf("  test_deterministic...\n");
  rng_type rng(9);
  const auto t = Topology::generate(10, 2, 0.4, rng);
  const PathFinder finder;
  std::vector<index_type> assignment;
  for (size_t i = 0; i < t.substations().size(); ++i) {
    assignment.push_back(static_cast<index_type>(i % 2));
  }
  const auto a = evaluate_assignment(t, finder, assignment);
  const auto b = evaluate_assignment(t, finder, assignment);
  CHECK(a.total_loss == b.total_loss);
  CHECK(a.avg_risk == b.avg_risk);
  for (size_t i = 0; i < a.paths.size(); ++i) {
    CHECK(a.paths[i].route->path == b.paths[i].route->path);
  }
}

int main() {
  std::printf("episode_test\n");

  test_aggregates();
  test_unresolved();
  test_nothing_resolved();
  test_bad_assignment();
  test_deterministic();

  std::printf("OK: all episode tests passed\n");
  return 0;
}
