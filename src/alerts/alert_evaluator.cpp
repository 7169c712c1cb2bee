#include "alerts/alert_evaluator.hpp"
#include "core/logger.hpp"
#include "scoring/risk_scorer.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <utility>

std::string rule_state_to_string(RuleState state) {
  switch (state) {
  case RuleState::IDLE:
    return "IDLE";
  case RuleState::CHECKING:
    return "CHECKING";
  case RuleState::TRIGGERED:
    return "TRIGGERED";
  }
  return "UNKNOWN";
}

AlertEvaluator::AlertEvaluator(SnapshotProvider snapshot_provider,
                               std::shared_ptr<IAlertRuleRepository> repository,
                               std::shared_ptr<INotifier> notifier,
                               Options options, TimeSource now)
    : snapshot_provider_(std::move(snapshot_provider)),
      repository_(std::move(repository)), notifier_(std::move(notifier)),
      options_(options), now_(std::move(now)) {
  if (!snapshot_provider_)
    throw std::invalid_argument("AlertEvaluator requires a snapshot provider");
  if (!repository_)
    throw std::invalid_argument("AlertEvaluator requires a rule repository");
  if (!notifier_)
    throw std::invalid_argument("AlertEvaluator requires a notifier");
}

bool AlertEvaluator::criteria_met(const AlertRule &rule,
                                  const ScoredObject &obj) {
  // An unknown (infinite) distance never satisfies the distance bound
  bool within_distance = std::isfinite(obj.neo.miss_distance_km) &&
                         obj.neo.miss_distance_km <= rule.threshold_distance_km;
  return within_distance || obj.risk.score >= rule.threshold_risk_score;
}

bool AlertEvaluator::cooldown_elapsed(const AlertRule &rule,
                                      Clock::time_point now) const {
  if (!rule.last_triggered_at)
    return true;
  return now - *rule.last_triggered_at >= options_.cooldown;
}

CycleReport AlertEvaluator::run_alert_cycle() {
  CycleReport report;

  if (running_.exchange(true)) {
    cycles_skipped_++;
    LOG(LogLevel::WARN, LogComponent::ALERTS_EVAL,
        "Alert cycle already running, skipping this invocation");
    return report;
  }

  try {
    evaluate_cycle(report);
  } catch (const std::exception &e) {
    report.executed = false;
    report.error = e.what();
    LOG(LogLevel::ERROR, LogComponent::ALERTS_EVAL,
        "Alert cycle aborted: " << e.what());
  }

  running_ = false;
  return report;
}

void AlertEvaluator::evaluate_cycle(CycleReport &report) {
  std::shared_ptr<const FeedSnapshot> snapshot;
  try {
    snapshot = snapshot_provider_();
  } catch (const std::exception &e) {
    report.error = std::string("snapshot unavailable: ") + e.what();
    LOG(LogLevel::ERROR, LogComponent::ALERTS_EVAL,
        "Skipping alert cycle, could not obtain feed snapshot: " << e.what());
    return;
  }
  if (!snapshot) {
    report.error = "snapshot unavailable";
    LOG(LogLevel::ERROR, LogComponent::ALERTS_EVAL,
        "Skipping alert cycle, snapshot provider returned nothing");
    return;
  }

  std::vector<AlertRule> rules;
  try {
    rules = repository_->list_active();
  } catch (const std::exception &e) {
    report.error = std::string("rule repository unavailable: ") + e.what();
    LOG(LogLevel::ERROR, LogComponent::ALERTS_EVAL,
        "Skipping alert cycle, " << repository_->get_name()
                                 << " failed: " << e.what());
    return;
  }

  std::unordered_map<std::string, std::vector<const ScoredObject *>> by_id;
  for (const auto &obj : snapshot->objects)
    by_id[obj.neo.id].push_back(&obj);

  const Clock::time_point now = now_();
  report.executed = true;
  cycles_run_++;

  for (const auto &rule : rules) {
    if (!rule.is_active)
      continue;
    report.rules_checked++;

    auto it = by_id.find(rule.asteroid_id);
    if (it == by_id.end()) {
      report.outcomes.push_back(RuleOutcome{rule.id});
      continue;
    }

    report.rules_matched++;
    report.outcomes.push_back(evaluate_rule(rule, it->second, now, report));
  }

  LOG(LogLevel::INFO, LogComponent::ALERTS_EVAL,
      "Alert cycle complete | Rules: " << report.rules_checked
                                       << " | Matched: " << report.rules_matched
                                       << " | Notified: "
                                       << report.notifications_sent
                                       << " | Cooldown: "
                                       << report.suppressed_by_cooldown
                                       << " | Failures: " << report.failures);
}

RuleOutcome
AlertEvaluator::evaluate_rule(const AlertRule &rule,
                              const std::vector<const ScoredObject *> &matches,
                              Clock::time_point now, CycleReport &report) {
  RuleOutcome outcome;
  outcome.rule_id = rule.id;
  outcome.matched_object = true;
  outcome.state = RuleState::CHECKING;

  const ScoredObject *hit = nullptr;
  for (const ScoredObject *obj : matches) {
    if (criteria_met(rule, *obj)) {
      hit = obj;
      break;
    }
  }

  if (hit == nullptr) {
    outcome.state = RuleState::IDLE;
    return outcome;
  }
  outcome.criteria_met = true;

  if (!cooldown_elapsed(rule, now)) {
    outcome.suppressed_by_cooldown = true;
    outcome.state = RuleState::IDLE;
    report.suppressed_by_cooldown++;
    LOG(LogLevel::DEBUG, LogComponent::ALERTS_EVAL,
        "Rule " << rule.id << " matched " << hit->neo.name
                << " but is inside its cooldown window");
    return outcome;
  }

  bool delivered = false;
  try {
    delivered = notifier_->notify(rule.user_id, format_subject(rule, *hit),
                                  format_body(rule, *hit));
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::ALERTS_EVAL,
        "Notifier " << notifier_->get_name() << " threw for rule " << rule.id
                    << ": " << e.what());
  }

  if (!delivered) {
    report.failures++;
    outcome.state = RuleState::IDLE;
    LOG(LogLevel::WARN, LogComponent::ALERTS_EVAL,
        "Notification for rule " << rule.id
                                 << " was not delivered, will retry next cycle");
    return outcome;
  }

  outcome.notified = true;
  outcome.state = RuleState::TRIGGERED;
  report.notifications_sent++;

  try {
    if (!repository_->record_trigger(rule.id, now)) {
      report.failures++;
      LOG(LogLevel::WARN, LogComponent::ALERTS_EVAL,
          "Repository did not record trigger for rule " << rule.id);
    }
  } catch (const std::exception &e) {
    report.failures++;
    LOG(LogLevel::ERROR, LogComponent::ALERTS_EVAL,
        "Failed to record trigger for rule " << rule.id << ": " << e.what());
  }

  LOG(LogLevel::INFO, LogComponent::ALERTS_EVAL,
      "Rule " << rule.id << " triggered for " << hit->neo.name << " (score "
              << hit->risk.score << ") | User: " << rule.user_id);
  return outcome;
}

std::string AlertEvaluator::format_subject(const AlertRule &rule,
                                           const ScoredObject &obj) {
  std::ostringstream oss;
  oss << "NEO alert: " << obj.neo.name << " ("
      << threat_level_to_string(obj.risk.threat_level) << ")";
  if (!rule.name.empty())
    oss << " - " << rule.name;
  return oss.str();
}

std::string AlertEvaluator::format_body(const AlertRule &rule,
                                        const ScoredObject &obj) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(1);
  oss << "Asteroid: " << obj.neo.name << " (id " << obj.neo.id << ")\n";
  oss << "Close approach date: " << obj.neo.close_approach_date << "\n";
  oss << "Potentially hazardous: " << (obj.neo.is_hazardous ? "yes" : "no")
      << "\n";
  oss << std::setprecision(3) << "Estimated diameter: " << obj.neo.diameter_km
      << " km\n";

  oss << std::setprecision(0);
  if (std::isfinite(obj.neo.miss_distance_km))
    oss << "Miss distance: " << obj.neo.miss_distance_km << " km ("
        << std::setprecision(2)
        << RiskScoring::to_lunar_distances(obj.neo.miss_distance_km)
        << " LD)\n";
  else
    oss << "Miss distance: unknown\n";

  oss << std::setprecision(0) << "Relative velocity: " << obj.neo.velocity_kph
      << " km/h\n";
  oss << std::setprecision(1) << "Risk score: " << obj.risk.score << " ("
      << threat_level_to_string(obj.risk.threat_level) << ")\n";
  oss << std::setprecision(0)
      << "Rule thresholds: distance <= " << rule.threshold_distance_km
      << " km or score >= " << std::setprecision(1)
      << rule.threshold_risk_score << "\n";
  return oss.str();
}
