#include <chrono>
#include <csignal>
#include <cstring>
#include <exception>
#include <iostream>
#include <thread>

#include "gridopt/engine.hpp"
#include "gridopt/errors.hpp"
#include "gridopt/logging.hpp"
#include "gridopt/statistics.hpp"

static volatile std::sig_atomic_t stop_requested = 0;

static void on_signal(int) { stop_requested = 1; }

int main(int argc, char** argv) {
  if (argc > 1 && !std::strcmp(argv[1], "--dump-config")) {
    Settings().to_stream(std::cout);
    std::cout << std::endl;
    return 0;
  }
  if (argc > 2) {
    std::cerr << "usage: " << argv[0] << " [--dump-config | settings.json]"
              << std::endl;
    return 2;
  }

  const auto logger = get_logger("gridoptd");
  try {
    const auto settings = argc > 1 ? Settings::from_file(argv[1]) : Settings();
    auto engine = GridEngine::from_settings(settings);

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    engine->start();
    while (!stop_requested) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    engine->stop();

    const auto summary = loss_summary(*engine->snapshot());
    if (summary.best) {
      logger->info("{} episodes, best loss {:.4f}%, worst {:.4f}%",
                   summary.episodes, *summary.best, *summary.worst);
    }
  } catch (const ConfigError& e) {
    logger->critical("invalid settings: {}", e.what());
    return 1;
  } catch (const TopologyError& e) {
    logger->critical("invalid topology: {}", e.what());
    return 1;
  }
  return 0;
}
