#pragma once

#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "gridopt/errors.hpp"
#include "gridopt/risk.hpp"
#include "gridopt/telemetry.hpp"
#include "gridopt/topology.hpp"

#define CHECK(expr)                                                     \
  do {                                                                  \
    if (!(expr)) {                                                      \
      std::fprintf(stderr, "CHECK FAILED: %s (%s:%d)\n", #expr, __FILE__, \
                   __LINE__);                                           \
      std::abort();                                                     \
    }                                                                   \
  } while (0)

#define CHECK_NEAR(a, b, tol) CHECK(std::abs((a) - (b)) <= (tol))

#define CHECK_THROWS(expr, type) \
  do {                           \
    bool thrown = false;         \
    try {                        \
      (void)(expr);              \
    } catch (const type&) {      \
      thrown = true;             \
    }                            \
    CHECK(thrown);               \
  } while (0)

inline Node make_generator(index_type id) {
  return {id, NodeRole::generator, "G" + std::to_string(id), 0, 220};
}

inline Node make_substation(index_type id, float_type demand) {
  return {id, NodeRole::substation, "S" + std::to_string(id), demand, 220};
}

inline Edge make_edge(index_type id, index_type u, index_type v,
                      float_type resistance, float_type risk = 0) {
  Edge e;
  e.id = id;
  e.u = u;
  e.v = v;
  e.resistance = resistance;
  e.risk = risk;
  return e;
}

// Two generators (0, 1) and six substations (2..7). Substation 2 ("A",
// 45 MW) reaches generator 0 over 0.001 ohm and generator 1 over 0.005 ohm;
// every other substation has a 0.002 ohm line to each generator.
inline Topology two_generator_grid() {
  std::vector<Node> nodes{make_generator(0), make_generator(1),
                          make_substation(2, 45)};
  const float_type demands[] = {52, 75, 38, 41, 48};
  for (index_type i = 0; i < 5; ++i) {
    nodes.push_back(make_substation(3 + i, demands[i]));
  }

  std::vector<Edge> edges{make_edge(0, 0, 2, 0.001), make_edge(1, 1, 2, 0.005)};
  for (index_type s = 3; s < 8; ++s) {
    edges.push_back(make_edge(static_cast<index_type>(edges.size()), s, 0,
                              0.002));
    edges.push_back(make_edge(static_cast<index_type>(edges.size()), s, 1,
                              0.002));
  }
  return Topology(std::move(nodes), std::move(edges));
}

// Generators 0, 1 and a single 45 MW substation 2.
inline Topology single_substation_grid() {
  return Topology({make_generator(0), make_generator(1), make_substation(2, 45)},
                  {make_edge(0, 0, 2, 0.001), make_edge(1, 1, 2, 0.005)});
}

// Replays the same frame every cycle.
class FixedTelemetry : public TelemetrySource {
 public:
  FixedTelemetry() = default;
  explicit FixedTelemetry(TelemetryFrame frame) : frame_(std::move(frame)) {}

  TelemetryFrame next(const Topology&) override {
    auto frame = frame_;
    frame.iteration = ++calls_;
    return frame;
  }

 private:
  TelemetryFrame frame_;
  uint64_t calls_ = 0;
};

class FixedRiskOracle : public RiskOracle {
 public:
  explicit FixedRiskOracle(float_type probability) : probability_(probability) {}

  RiskAssessment score(const RiskFeatures&) override {
    ++calls;
    return {probability_, classify_level(probability_), FailureType::none};
  }

  uint64_t calls = 0;

 private:
  float_type probability_;
};

// Answers `good_calls` times, then fails every call.
class FailingRiskOracle : public RiskOracle {
 public:
  FailingRiskOracle(float_type probability, uint64_t good_calls)
      : probability_(probability), good_calls_(good_calls) {}

  RiskAssessment score(const RiskFeatures&) override {
    if (calls_++ >= good_calls_) {
      throw RiskOracleUnavailable("scorer offline");
    }
    return {probability_, classify_level(probability_), FailureType::none};
  }

 private:
  float_type probability_;
  uint64_t good_calls_;
  uint64_t calls_ = 0;
};

class SlowRiskOracle : public RiskOracle {
 public:
  explicit SlowRiskOracle(std::chrono::milliseconds delay) : delay_(delay) {}

  RiskAssessment score(const RiskFeatures&) override {
    std::this_thread::sleep_for(delay_);
    return {0.1, RiskLevel::low, FailureType::none};
  }

 private:
  std::chrono::milliseconds delay_;
};
