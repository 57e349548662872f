#include "gridopt/logging.hpp"

#include <mutex>

#include "spdlog/sinks/stdout_color_sinks.h"

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
  static std::mutex mu;
  std::lock_guard<std::mutex> lk(mu);

  if (auto logger = spdlog::get(name)) {
    return logger;
  }
  auto logger = spdlog::stdout_color_mt(name);
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
  return logger;
}

void set_log_level(const std::string& level) {
  spdlog::set_level(spdlog::level::from_str(level));
}
