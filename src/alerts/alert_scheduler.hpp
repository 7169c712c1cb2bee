#ifndef ALERT_SCHEDULER_HPP
#define ALERT_SCHEDULER_HPP

#include "alerts/alert_evaluator.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

// Runs alert cycles on a background thread at a fixed rate. Ticks that fall
// due while a cycle is still running are skipped, not queued.
class AlertScheduler {
public:
  AlertScheduler(std::shared_ptr<AlertEvaluator> evaluator,
                 std::chrono::milliseconds interval);
  ~AlertScheduler();

  AlertScheduler(const AlertScheduler &) = delete;
  AlertScheduler &operator=(const AlertScheduler &) = delete;

  void start();
  // Lets the current cycle finish, then joins the thread
  void stop();

  bool is_running() const { return running_.load(); }
  uint64_t get_ticks() const { return ticks_.load(); }
  uint64_t get_skipped_ticks() const { return skipped_ticks_.load(); }

private:
  void background_thread_func();

  std::shared_ptr<AlertEvaluator> evaluator_;
  std::chrono::milliseconds interval_;

  std::thread background_thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_flag_{false};
  std::atomic<uint64_t> ticks_{0};
  std::atomic<uint64_t> skipped_ticks_{0};

  std::condition_variable cv_;
  std::mutex cv_mutex_;
};

#endif // ALERT_SCHEDULER_HPP
