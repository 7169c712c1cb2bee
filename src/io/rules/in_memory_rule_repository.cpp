#include "io/rules/in_memory_rule_repository.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

InMemoryAlertRuleRepository::InMemoryAlertRuleRepository(
    std::vector<AlertRule> rules) {
  for (auto &rule : rules)
    add_rule(std::move(rule));
}

std::vector<AlertRule> InMemoryAlertRuleRepository::list_active() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<AlertRule> active;
  std::copy_if(rules_.begin(), rules_.end(), std::back_inserter(active),
               [](const AlertRule &rule) { return rule.is_active; });
  return active;
}

bool InMemoryAlertRuleRepository::record_trigger(
    uint64_t rule_id, std::chrono::system_clock::time_point when) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(rules_.begin(), rules_.end(),
                         [&](const AlertRule &r) { return r.id == rule_id; });
  if (it == rules_.end()) {
    LOG(LogLevel::WARN, LogComponent::IO_RULES,
        "record_trigger for unknown rule " << rule_id);
    return false;
  }
  it->last_triggered_at = when;
  return true;
}

uint64_t InMemoryAlertRuleRepository::add_rule(AlertRule rule) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (rule.id == 0)
    rule.id = next_id_;
  next_id_ = std::max(next_id_, rule.id + 1);

  uint64_t id = rule.id;
  auto it = std::find_if(rules_.begin(), rules_.end(),
                         [&](const AlertRule &r) { return r.id == id; });
  if (it != rules_.end())
    *it = std::move(rule);
  else
    rules_.push_back(std::move(rule));
  return id;
}

bool InMemoryAlertRuleRepository::remove_rule(uint64_t rule_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::remove_if(rules_.begin(), rules_.end(),
                           [&](const AlertRule &r) { return r.id == rule_id; });
  bool removed = it != rules_.end();
  rules_.erase(it, rules_.end());
  return removed;
}

std::optional<AlertRule>
InMemoryAlertRuleRepository::find(uint64_t rule_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &rule : rules_)
    if (rule.id == rule_id)
      return rule;
  return std::nullopt;
}

std::vector<AlertRule> InMemoryAlertRuleRepository::list_all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rules_;
}
