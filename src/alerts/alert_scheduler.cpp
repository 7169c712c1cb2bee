#include "alerts/alert_scheduler.hpp"
#include "core/logger.hpp"

#include <stdexcept>
#include <utility>

AlertScheduler::AlertScheduler(std::shared_ptr<AlertEvaluator> evaluator,
                               std::chrono::milliseconds interval)
    : evaluator_(std::move(evaluator)), interval_(interval) {
  if (!evaluator_)
    throw std::invalid_argument("AlertScheduler requires an evaluator");
  if (interval_.count() <= 0)
    throw std::invalid_argument("AlertScheduler interval must be positive");
}

AlertScheduler::~AlertScheduler() { stop(); }

void AlertScheduler::start() {
  if (running_.exchange(true))
    return;

  shutdown_flag_ = false;
  LOG(LogLevel::INFO, LogComponent::ALERTS_SCHEDULER,
      "AlertScheduler starting, interval " << interval_.count() << "ms");
  background_thread_ =
      std::thread(&AlertScheduler::background_thread_func, this);
}

void AlertScheduler::stop() {
  if (!running_.load())
    return;

  LOG(LogLevel::INFO, LogComponent::ALERTS_SCHEDULER,
      "Shutting down AlertScheduler...");
  {
    std::lock_guard<std::mutex> lock(cv_mutex_);
    shutdown_flag_ = true;
  }
  cv_.notify_one();

  if (background_thread_.joinable())
    background_thread_.join();

  running_ = false;
  LOG(LogLevel::INFO, LogComponent::ALERTS_SCHEDULER,
      "AlertScheduler shut down after " << ticks_.load() << " ticks ("
                                        << skipped_ticks_.load()
                                        << " skipped).");
}

void AlertScheduler::background_thread_func() {
  auto next_tick = std::chrono::steady_clock::now();

  while (!shutdown_flag_) {
    ticks_++;
    CycleReport report = evaluator_->run_alert_cycle();
    if (!report.executed && report.error)
      LOG(LogLevel::WARN, LogComponent::ALERTS_SCHEDULER,
          "Alert cycle did not execute: " << *report.error);

    // Fixed rate: ticks that passed while the cycle ran are dropped
    next_tick += interval_;
    auto now = std::chrono::steady_clock::now();
    while (next_tick <= now) {
      next_tick += interval_;
      skipped_ticks_++;
      LOG(LogLevel::WARN, LogComponent::ALERTS_SCHEDULER,
          "Alert cycle overran its interval, skipping a tick");
    }

    std::unique_lock<std::mutex> lock(cv_mutex_);
    cv_.wait_until(lock, next_tick, [this] { return shutdown_flag_.load(); });
  }
}
