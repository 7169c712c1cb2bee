#ifndef BASE_RULE_REPOSITORY_HPP
#define BASE_RULE_REPOSITORY_HPP

#include "alerts/alert_rule.hpp"

#include <chrono>
#include <cstdint>
#include <vector>

// Storage collaborator owning the alert rules. Implementations may throw
// std::runtime_error when the backing store is unreachable.
class IAlertRuleRepository {
public:
  virtual ~IAlertRuleRepository() = default;
  virtual std::vector<AlertRule> list_active() = 0;
  // Returns false when no rule with that id exists
  virtual bool record_trigger(uint64_t rule_id,
                              std::chrono::system_clock::time_point when) = 0;
  virtual const char *get_name() const = 0;
};

#endif // BASE_RULE_REPOSITORY_HPP
