#include "alerts/alert_scheduler.hpp"
#include "io/rules/in_memory_rule_repository.hpp"
#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

class AlertSchedulerTest : public ::testing::Test {
protected:
  std::shared_ptr<AlertEvaluator>
  make_evaluator(std::chrono::milliseconds cycle_duration =
                     std::chrono::milliseconds(0)) {
    std::shared_ptr<const FeedSnapshot> snapshot =
        std::make_shared<FeedSnapshot>();
    return std::make_shared<AlertEvaluator>(
        [this, snapshot, cycle_duration]() {
          provider_calls_++;
          if (cycle_duration.count() > 0)
            std::this_thread::sleep_for(cycle_duration);
          return snapshot;
        },
        std::make_shared<InMemoryAlertRuleRepository>(),
        std::make_shared<RecordingNotifier>(), AlertEvaluator::Options{});
  }

  std::atomic<int> provider_calls_{0};
};

TEST_F(AlertSchedulerTest, RejectsInvalidArguments) {
  EXPECT_THROW(AlertScheduler(nullptr, std::chrono::milliseconds(10)),
               std::invalid_argument);
  EXPECT_THROW(AlertScheduler(make_evaluator(), std::chrono::milliseconds(0)),
               std::invalid_argument);
}

TEST_F(AlertSchedulerTest, RunsCyclesUntilStopped) {
  auto evaluator = make_evaluator();
  AlertScheduler scheduler(evaluator, std::chrono::milliseconds(20));

  scheduler.start();
  EXPECT_TRUE(scheduler.is_running());
  std::this_thread::sleep_for(std::chrono::milliseconds(150));
  scheduler.stop();

  EXPECT_FALSE(scheduler.is_running());
  EXPECT_GE(scheduler.get_ticks(), 2u);
  EXPECT_EQ(evaluator->get_cycles_run(), scheduler.get_ticks());

  // No further cycles after stop() returns
  uint64_t ticks_after_stop = scheduler.get_ticks();
  std::this_thread::sleep_for(std::chrono::milliseconds(60));
  EXPECT_EQ(scheduler.get_ticks(), ticks_after_stop);
}

TEST_F(AlertSchedulerTest, FirstCycleRunsImmediately) {
  AlertScheduler scheduler(make_evaluator(), std::chrono::hours(1));
  scheduler.start();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  scheduler.stop();

  EXPECT_EQ(scheduler.get_ticks(), 1u);
  EXPECT_EQ(provider_calls_.load(), 1);
}

TEST_F(AlertSchedulerTest, StopInterruptsLongWait) {
  AlertScheduler scheduler(make_evaluator(), std::chrono::hours(1));
  scheduler.start();
  std::this_thread::sleep_for(std::chrono::milliseconds(20));

  auto started = std::chrono::steady_clock::now();
  scheduler.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(1));
}

TEST_F(AlertSchedulerTest, OverrunningCyclesSkipTicks) {
  auto evaluator = make_evaluator(std::chrono::milliseconds(70));
  AlertScheduler scheduler(evaluator, std::chrono::milliseconds(20));

  scheduler.start();
  std::this_thread::sleep_for(std::chrono::milliseconds(250));
  scheduler.stop();

  EXPECT_GE(scheduler.get_ticks(), 2u);
  EXPECT_GT(scheduler.get_skipped_ticks(), 0u);
  // Cycles never run concurrently, so none are skipped by the evaluator
  EXPECT_EQ(evaluator->get_cycles_skipped(), 0u);
}

TEST_F(AlertSchedulerTest, StartIsIdempotentAndDestructorStops) {
  auto evaluator = make_evaluator();
  {
    AlertScheduler scheduler(evaluator, std::chrono::milliseconds(10));
    scheduler.start();
    scheduler.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
  }
  uint64_t cycles = evaluator->get_cycles_run();
  EXPECT_GE(cycles, 1u);
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  EXPECT_EQ(evaluator->get_cycles_run(), cycles);
}
