#ifndef ALERT_EVALUATOR_HPP
#define ALERT_EVALUATOR_HPP

#include "alerts/alert_rule.hpp"
#include "core/neo_types.hpp"
#include "io/notify/base_notifier.hpp"
#include "io/rules/base_rule_repository.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class RuleState { IDLE, CHECKING, TRIGGERED };

std::string rule_state_to_string(RuleState state);

struct RuleOutcome {
  uint64_t rule_id = 0;
  RuleState state = RuleState::IDLE;
  bool matched_object = false;
  bool criteria_met = false;
  bool suppressed_by_cooldown = false;
  bool notified = false;
};

struct CycleReport {
  bool executed = false; // false when skipped or aborted
  size_t rules_checked = 0;
  size_t rules_matched = 0;
  size_t notifications_sent = 0;
  size_t suppressed_by_cooldown = 0;
  size_t failures = 0;
  std::vector<RuleOutcome> outcomes;
  std::optional<std::string> error;
};

// Compares stored alert rules against the current scored feed and notifies
// at most once per rule per cooldown window. Cycles never overlap: a call
// made while another cycle is running returns immediately with
// executed == false.
class AlertEvaluator {
public:
  using Clock = std::chrono::system_clock;
  using TimeSource = std::function<Clock::time_point()>;
  using SnapshotProvider = std::function<std::shared_ptr<const FeedSnapshot>()>;

  struct Options {
    std::chrono::seconds cooldown{86400};
  };

  AlertEvaluator(SnapshotProvider snapshot_provider,
                 std::shared_ptr<IAlertRuleRepository> repository,
                 std::shared_ptr<INotifier> notifier, Options options,
                 TimeSource now = Clock::now);

  CycleReport run_alert_cycle();

  bool is_running() const { return running_.load(); }
  uint64_t get_cycles_run() const { return cycles_run_.load(); }
  uint64_t get_cycles_skipped() const { return cycles_skipped_.load(); }

  static bool criteria_met(const AlertRule &rule, const ScoredObject &obj);
  bool cooldown_elapsed(const AlertRule &rule, Clock::time_point now) const;

  static std::string format_subject(const AlertRule &rule,
                                    const ScoredObject &obj);
  static std::string format_body(const AlertRule &rule,
                                 const ScoredObject &obj);

private:
  void evaluate_cycle(CycleReport &report);
  RuleOutcome evaluate_rule(const AlertRule &rule,
                            const std::vector<const ScoredObject *> &matches,
                            Clock::time_point now, CycleReport &report);

  SnapshotProvider snapshot_provider_;
  std::shared_ptr<IAlertRuleRepository> repository_;
  std::shared_ptr<INotifier> notifier_;
  Options options_;
  TimeSource now_;

  std::atomic<bool> running_{false};
  std::atomic<uint64_t> cycles_run_{0};
  std::atomic<uint64_t> cycles_skipped_{0};
};

#endif // ALERT_EVALUATOR_HPP
