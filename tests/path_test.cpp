#include <cstdio>
#include <vector>

#include "gridopt/errors.hpp"
#include "gridopt/path.hpp"
#include "test_util.hpp"

// Substation 1 is joined to generator 0 directly over a risky line and
// through relay substation 2 over a safe one.
static Topology risky_direct_grid() {
  return Topology({make_generator(0), make_substation(1, 40),
                   make_substation(2, 20)},
                  {make_edge(0, 0, 1, 0.002, 0.9), make_edge(1, 1, 2, 0.01, 0.1),
                   make_edge(2, 2, 0, 0, 0)});
}

static void test_risk_outweighs_resistance() {
  std::printf("  test_risk_outweighs_resistance...\n");
  const auto t = risky_direct_grid();
  const PathFinder finder(10);
  const auto p = finder.find(t, 1, 0);
  CHECK((p.nodes == std::vector<index_type>{1, 2, 0}));
  CHECK((p.edges == std::vector<index_type>{1, 2}));
  CHECK_NEAR(p.cost, 1.01, 1e-12);
  CHECK_NEAR(p.resistance, 0.01, 1e-12);
  CHECK_NEAR(p.risk, 0.1, 1e-12);
  CHECK(p.hops() == 2);
  CHECK_NEAR(p.loss(40), 0.4, 1e-12);

  // without risk sensitivity the low resistance line wins
  const auto direct = PathFinder(0).find(t, 1, 0);
  CHECK((direct.nodes == std::vector<index_type>{1, 0}));
  CHECK_NEAR(direct.cost, 0.002, 1e-12);
}

static void test_tie_breaks() {
  std::printf("  test_tie_breaks...\n");
  // 3 -> 0 costs 0.004 over one hop or two
  {
    const Topology t({make_generator(0), make_substation(1, 1),
                      make_substation(2, 1), make_substation(3, 1)},
                     {make_edge(0, 3, 0, 0.004), make_edge(1, 3, 1, 0.002),
                      make_edge(2, 1, 0, 0.002), make_edge(3, 2, 0, 1)});
    const auto p = PathFinder(0).find(t, 3, 0);
    CHECK((p.nodes == std::vector<index_type>{3, 0}));
  }
  // equal cost and hops: the smaller node sequence wins
  {
    const Topology t({make_generator(0), make_substation(1, 1),
                      make_substation(2, 1), make_substation(3, 1)},
                     {make_edge(0, 3, 2, 0.001), make_edge(1, 2, 0, 0.001),
                      make_edge(2, 3, 1, 0.001), make_edge(3, 1, 0, 0.001)});
    const auto p = PathFinder(0).find(t, 3, 0);
    CHECK((p.nodes == std::vector<index_type>{3, 1, 0}));
  }
}

static void test_no_path() {
  std::printf("  test_no_path...\n");
  auto t = single_substation_grid();
  EdgeTelemetry off;
  off.u = 0;
  off.v = 2;
  off.resistance = 0.001;
  off.in_service = false;
  t.apply_telemetry({}, {off});

  const PathFinder finder;
  CHECK_THROWS(finder.find(t, 2, 0), NoPathError);
  CHECK(finder.find(t, 2, 1).nodes == (std::vector<index_type>{2, 1}));

  bool thrown = false;
  try {
    finder.find(t, 2, 0);
  } catch (const NoPathError& e) {
    thrown = true;
    CHECK(e.source == 2);
    CHECK(e.target == 0);
  }
  CHECK(thrown);

  const auto all = finder.find_all(t, 2);
  CHECK(all[0].nodes.empty());
  CHECK(all[0].cost == inf_v);
  CHECK(all[2].nodes == (std::vector<index_type>{2}));
  CHECK(all[2].cost == 0);

  CHECK_THROWS(finder.find(t, 2, 5), UnknownEntityError);
  CHECK_THROWS(finder.find_all(t, -1), UnknownEntityError);
}

static void test_paths_are_valid() {
  std::printf("  test_paths_are_valid...\n");
  rng_type rng(11);
  const auto t = Topology::generate(12, 3, 0.3, rng);
  const PathFinder finder;
  for (const auto s : t.substations()) {
    for (const auto g : t.generators()) {
      const auto p = finder.find(t, s, g);
      CHECK(p.nodes.front() == s);
      CHECK(p.nodes.back() == g);
      CHECK(is_valid_path(t, p.nodes));
      CHECK(p.cost >= 0);
      CHECK(p.edges.size() + 1 == p.nodes.size());
    }
  }
  CHECK(!is_valid_path(t, {}));
}

static void test_deterministic() {
  std::printf("  test_deterministic...\n");
  rng_type rng(5);
  const auto t = Topology::generate(10, 2, 0.5, rng);
  const PathFinder finder;
  for (const auto s : t.substations()) {
    const auto a = finder.find(t, s, 0);
    const auto b = finder.find(t, s, 0);
    CHECK(a.nodes == b.nodes);
    CHECK(a.cost == b.cost);
  }
}

static void test_monotonic_risk_aversion() {
  std::printf("  test_monotonic_risk_aversion...\n");
  // three routes from 4 to 0 trading resistance for risk
  const Topology t(
      {make_generator(0), make_substation(1, 10), make_substation(2, 10),
       make_substation(3, 10), make_substation(4, 10)},
      {make_edge(0, 4, 0, 0.001, 0.8), make_edge(1, 4, 1, 0.05, 0.2),
       make_edge(2, 1, 0, 0.05, 0.1), make_edge(3, 4, 2, 0.3, 0),
       make_edge(4, 2, 3, 0.3, 0), make_edge(5, 3, 0, 0.3, 0)});

  float_type last_risk = inf_v;
  float_type last_resistance = 0;
  for (const float_type w : {0.0, 0.01, 0.1, 0.5, 1.0, 2.0, 10.0, 100.0}) {
    const auto p = PathFinder(w).find(t, 4, 0);
    CHECK(p.risk <= last_risk + 1e-12);
    CHECK(p.resistance >= last_resistance - 1e-12);
    last_risk = p.risk;
    last_resistance = p.resistance;
  }
  CHECK(last_risk == 0);
}

int main() {
  std::printf("path_test\n");

  test_risk_outweighs_resistance();
  test_tie_breaks();
  test_no_path();
  test_paths_are_valid();
  test_deterministic();
  test_monotonic_risk_aversion();

  std::printf("OK: all path tests passed\n");
  return 0;
}
