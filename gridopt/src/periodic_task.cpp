#include "gridopt/periodic_task.hpp"

#include <exception>

#include "gridopt/logging.hpp"

PeriodicTask::PeriodicTask(std::string name,
                           std::chrono::milliseconds interval,
                           std::function<void()> tick)
    : name_(std::move(name)),
      interval_(interval),
      tick_(std::move(tick)),
      logger_(get_logger("gridopt.task")) {}

PeriodicTask::~PeriodicTask() { stop(); }

void PeriodicTask::start() {
  std::lock_guard<std::mutex> lk(mu_);
  if (thread_.joinable()) return;
  stop_ = false;
  thread_ = std::thread(&PeriodicTask::run, this);
  logger_->debug("{}: started, interval {} ms", name_, interval_.count());
}

void PeriodicTask::stop() {
  std::thread worker;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!thread_.joinable()) return;
    stop_ = true;
    worker = std::move(thread_);
  }
  cv_.notify_all();
  worker.join();
  logger_->debug("{}: stopped", name_);
}

bool PeriodicTask::running() const {
  std::lock_guard<std::mutex> lk(mu_);
  return thread_.joinable() && !stop_;
}

uint64_t PeriodicTask::ticks() const {
  std::lock_guard<std::mutex> lk(mu_);
  return ticks_;
}

void PeriodicTask::run() {
  std::unique_lock<std::mutex> lk(mu_);
  while (!stop_) {
    lk.unlock();
    try {
      tick_();
    } catch (const std::exception& e) {
      logger_->error("{}: tick failed: {}", name_, e.what());
    } catch (...) {
      logger_->error("{}: tick failed with a non-standard exception", name_);
    }
    lk.lock();
    ++ticks_;
    cv_.wait_for(lk, interval_, [this] { return stop_; });
  }
}
