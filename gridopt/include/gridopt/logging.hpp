#pragma once

#include <memory>
#include <string>

#include "spdlog/spdlog.h"

// Returns the shared logger registered under `name`, creating a colored
// stdout logger on first use.
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

// Applies a level name ("trace" ... "off") to every registered logger and to
// loggers created afterwards.
void set_log_level(const std::string& level);
