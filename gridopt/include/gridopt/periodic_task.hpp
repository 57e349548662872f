#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "spdlog/spdlog.h"

// Runs `tick` on a background thread every `interval`, the first time right
// after start(). A tick that throws anything is logged and the schedule
// continues. stop() never interrupts a running tick.
class PeriodicTask {
 public:
  PeriodicTask(std::string name, std::chrono::milliseconds interval,
               std::function<void()> tick);
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&) = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  void start();
  void stop();
  bool running() const;

  uint64_t ticks() const;

 private:
  const std::string name_;
  const std::chrono::milliseconds interval_;
  const std::function<void()> tick_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool stop_ = false;
  uint64_t ticks_ = 0;
  std::thread thread_;

  std::shared_ptr<spdlog::logger> logger_;

  void run();
};
