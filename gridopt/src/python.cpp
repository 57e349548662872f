#include <memory>
#include <string>
#include <vector>

#include "gridopt/engine.hpp"
#include "gridopt/statistics.hpp"
#include "nanobind/nanobind.h"
#include "nanobind/stl/optional.h"
#include "nanobind/stl/string.h"
#include "nanobind/stl/unique_ptr.h"
#include "nanobind/stl/vector.h"

namespace nb = nanobind;

using namespace nb::literals;

static auto to_vector(const VectorMF &v) {
  return std::vector<float_type>(v.data(), v.data() + v.size());
}

void make_settings(nb::module_ &m) {
  nb::class_<Settings>(m, "Settings")
      .def(nb::init<>())
      .def_rw("n_nodes", &Settings::n_nodes)
      .def_rw("n_generators", &Settings::n_generators)
      .def_rw("edge_probability", &Settings::edge_probability)
      .def_rw("topology_seed", &Settings::topology_seed)
      .def_rw("telemetry_seed", &Settings::telemetry_seed)
      .def_rw("policy_seed", &Settings::policy_seed)
      .def_rw("risk_weight", &Settings::risk_weight)
      .def_rw("reward_risk_weight", &Settings::reward_risk_weight)
      .def_rw("learning_rate", &Settings::learning_rate)
      .def_rw("baseline_decay", &Settings::baseline_decay)
      .def_rw("normalize_advantage", &Settings::normalize_advantage)
      .def_rw("refresh_interval_ms", &Settings::refresh_interval_ms)
      .def_rw("history_window", &Settings::history_window)
      .def_rw("oracle_timeout_ms", &Settings::oracle_timeout_ms)
      .def_rw("default_risk", &Settings::default_risk)
      .def_rw("policy_checkpoint", &Settings::policy_checkpoint)
      .def_rw("log_level", &Settings::log_level)
      .def("validate", &Settings::validate)
      .def("to_file", &Settings::to_file)
      .def_static("from_file", &Settings::from_file)
      .def("to_str", &Settings::to_str)
      .def_static("from_str", &Settings::from_str);
}

void make_grid(nb::module_ &m) {
  nb::enum_<NodeRole>(m, "NodeRole")
      .value("generator", NodeRole::generator)
      .value("substation", NodeRole::substation);

  nb::class_<Node>(m, "Node")
      .def_ro("id", &Node::id)
      .def_ro("role", &Node::role)
      .def_ro("name", &Node::name)
      .def_ro("demand", &Node::demand)
      .def_ro("voltage", &Node::voltage);

  nb::class_<Edge>(m, "Edge")
      .def_ro("id", &Edge::id)
      .def_ro("u", &Edge::u)
      .def_ro("v", &Edge::v)
      .def_ro("resistance", &Edge::resistance)
      .def_ro("current", &Edge::current)
      .def_ro("temperature", &Edge::temperature)
      .def_ro("power_flow", &Edge::power_flow)
      .def_ro("risk", &Edge::risk)
      .def_ro("in_service", &Edge::in_service);

  nb::class_<GridView>(m, "GridView")
      .def_ro("nodes", &GridView::nodes)
      .def_ro("edges", &GridView::edges);
}

void make_results(nb::module_ &m) {
  nb::class_<Route>(m, "Route")
      .def_ro("path", &Route::path)
      .def_ro("resistance", &Route::resistance)
      .def_ro("risk", &Route::risk)
      .def_ro("cost", &Route::cost)
      .def_ro("loss", &Route::loss);

  nb::class_<PathRecord>(m, "PathRecord")
      .def_ro("substation_id", &PathRecord::substation_id)
      .def_ro("substation_name", &PathRecord::substation_name)
      .def_ro("generator_id", &PathRecord::generator_id)
      .def_ro("generator_name", &PathRecord::generator_name)
      .def_ro("demand", &PathRecord::demand)
      .def_ro("route", &PathRecord::route)
      .def_prop_ro("resolved", &PathRecord::resolved);

  nb::class_<EpisodeResult>(m, "EpisodeResult")
      .def_ro("episode", &EpisodeResult::episode)
      .def_ro("paths", &EpisodeResult::paths)
      .def_ro("total_loss", &EpisodeResult::total_loss)
      .def_ro("loss_percent", &EpisodeResult::loss_percent)
      .def_ro("avg_risk", &EpisodeResult::avg_risk)
      .def_ro("total_demand", &EpisodeResult::total_demand)
      .def_ro("resolved_demand", &EpisodeResult::resolved_demand)
      .def_ro("reward", &EpisodeResult::reward);

  nb::class_<HistoryPoint>(m, "HistoryPoint")
      .def_ro("episode", &HistoryPoint::episode)
      .def_ro("loss_percent", &HistoryPoint::loss_percent)
      .def_ro("avg_risk", &HistoryPoint::avg_risk);

  nb::class_<Snapshot>(m, "Snapshot")
      .def_ro("latest", &Snapshot::latest)
      .def_prop_ro("history",
                   [](const Snapshot &self) {
                     return std::vector<HistoryPoint>(self.history.begin(),
                                                      self.history.end());
                   })
      .def_ro("best_loss", &Snapshot::best_loss)
      .def_ro("worst_loss", &Snapshot::worst_loss)
      .def_ro("episodes_trained", &Snapshot::episodes_trained)
      .def_ro("grid", &Snapshot::grid);
}

void make_statistics(nb::module_ &m) {
  nb::class_<SummaryStats>(m, "SummaryStats")
      .def_ro("mean", &SummaryStats::mean)
      .def_ro("stddev", &SummaryStats::stddev)
      .def_ro("min", &SummaryStats::min)
      .def_ro("max", &SummaryStats::max);

  nb::class_<GridStatistics>(m, "GridStatistics")
      .def_ro("n_nodes", &GridStatistics::n_nodes)
      .def_ro("n_edges", &GridStatistics::n_edges)
      .def_ro("n_in_service", &GridStatistics::n_in_service)
      .def_ro("voltage", &GridStatistics::voltage)
      .def_ro("demand", &GridStatistics::demand)
      .def_ro("risk", &GridStatistics::risk)
      .def_ro("temperature", &GridStatistics::temperature)
      .def_ro("current", &GridStatistics::current)
      .def_ro("total_power_flow", &GridStatistics::total_power_flow)
      .def_ro("mean_power_flow", &GridStatistics::mean_power_flow)
      .def_ro("high_risk_edges", &GridStatistics::high_risk_edges);

  nb::class_<NodeRisk>(m, "NodeRisk")
      .def_ro("id", &NodeRisk::id)
      .def_ro("name", &NodeRisk::name)
      .def_ro("degree", &NodeRisk::degree)
      .def_ro("avg_risk", &NodeRisk::avg_risk)
      .def_ro("max_risk", &NodeRisk::max_risk);

  m.def("grid_statistics", &grid_statistics, "grid"_a)
      .def("rank_node_risk", &rank_node_risk, "grid"_a);
}

void make_engine(nb::module_ &m) {
  nb::class_<GridEngine>(m, "GridEngine")
      .def_static("from_settings", &GridEngine::from_settings, "settings"_a)
      .def("start", &GridEngine::start)
      .def("stop", &GridEngine::stop)
      .def_prop_ro("running", &GridEngine::running)
      .def("optimize_now", &GridEngine::optimize_now)
      .def("snapshot",
           [](const GridEngine &self) { return Snapshot(*self.snapshot()); })
      .def("evaluate_greedy", &GridEngine::evaluate_greedy)
      .def(
          "probabilities",
          [](const GridEngine &self, index_type substation) {
            return to_vector(self.probabilities(substation));
          },
          "substation"_a)
      .def("save_policy", &GridEngine::save_policy, "path"_a)
      .def("load_policy", &GridEngine::load_policy, "path"_a);
}

NB_MODULE(gridopt_ext, m) {
  nb::exception<GridError>(m, "GridError");

  make_settings(m);
  make_grid(m);
  make_results(m);
  make_statistics(m);
  make_engine(m);
}
