#ifndef IN_MEMORY_RULE_REPOSITORY_HPP
#define IN_MEMORY_RULE_REPOSITORY_HPP

#include "io/rules/base_rule_repository.hpp"

#include <mutex>
#include <optional>
#include <vector>

class InMemoryAlertRuleRepository : public IAlertRuleRepository {
public:
  InMemoryAlertRuleRepository() = default;
  explicit InMemoryAlertRuleRepository(std::vector<AlertRule> rules);

  std::vector<AlertRule> list_active() override;
  bool record_trigger(uint64_t rule_id,
                      std::chrono::system_clock::time_point when) override;
  const char *get_name() const override { return "InMemoryAlertRuleRepository"; }

  // Assigns an id when the rule has none; returns the stored id
  uint64_t add_rule(AlertRule rule);
  bool remove_rule(uint64_t rule_id);
  std::optional<AlertRule> find(uint64_t rule_id) const;
  std::vector<AlertRule> list_all() const;

private:
  std::vector<AlertRule> rules_;
  uint64_t next_id_ = 1;
  mutable std::mutex mutex_;
};

#endif // IN_MEMORY_RULE_REPOSITORY_HPP
