#include <iostream>

#include "gridopt/engine.hpp"
#include "gridopt/statistics.hpp"

int main() {
  Settings settings;
  settings.log_level = "warn";
  auto engine = GridEngine::from_settings(settings);

  for (int i = 0; i < 50; ++i) {
    const auto res = engine->optimize_now();
    if (res.episode % 10 == 0) {
      std::cout << "episode " << res.episode << ": loss " << res.loss_percent
                << "% risk " << res.avg_risk << " reward " << res.reward
                << std::endl;
    }
  }

  const auto greedy = engine->evaluate_greedy();
  for (const auto& p : greedy.paths) {
    std::cout << p.substation_name << " <- " << p.generator_name;
    if (p.route) {
      std::cout << " loss " << p.route->loss << " MW";
    } else {
      std::cout << " unreachable";
    }
    std::cout << std::endl;
  }

  const auto summary = loss_summary(*engine->snapshot());
  std::cout << "best loss " << summary.best.value_or(0) << "%" << std::endl;
  return 0;
}
