#ifndef JSON_FILE_RULE_REPOSITORY_HPP
#define JSON_FILE_RULE_REPOSITORY_HPP

#include "io/rules/base_rule_repository.hpp"
#include "nlohmann/json.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Rules kept in a JSON document of the form {"rules": [ ... ]}. The file is
// re-read on every call so external edits are picked up; record_trigger
// rewrites it through a temporary file and rename.
class JsonFileAlertRuleRepository : public IAlertRuleRepository {
public:
  explicit JsonFileAlertRuleRepository(const std::string &file_path);

  std::vector<AlertRule> list_active() override;
  bool record_trigger(uint64_t rule_id,
                      std::chrono::system_clock::time_point when) override;
  const char *get_name() const override { return "JsonFileAlertRuleRepository"; }

  std::vector<AlertRule> list_all();
  void save_all(const std::vector<AlertRule> &rules);

  static std::optional<AlertRule> rule_from_json(const nlohmann::json &j);
  static nlohmann::json rule_to_json(const AlertRule &rule);

private:
  std::vector<AlertRule> load_locked() const;
  void save_locked(const std::vector<AlertRule> &rules) const;

  std::string file_path_;
  std::mutex mutex_;
};

#endif // JSON_FILE_RULE_REPOSITORY_HPP
