#include "io/rules/json_file_rule_repository.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <system_error>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

JsonFileAlertRuleRepository::JsonFileAlertRuleRepository(
    const std::string &file_path)
    : file_path_(file_path) {
  if (file_path_.empty())
    throw std::invalid_argument("Alert rule file path must not be empty");
  LOG(LogLevel::INFO, LogComponent::IO_RULES,
      "Alert rules will be read from " << file_path_);
}

std::optional<AlertRule>
JsonFileAlertRuleRepository::rule_from_json(const nlohmann::json &j) {
  if (!j.is_object())
    return std::nullopt;

  auto id = j.find("id");
  auto asteroid = j.find("asteroid_id");
  if (id == j.end() || !id->is_number_unsigned() || asteroid == j.end() ||
      !asteroid->is_string())
    return std::nullopt;

  AlertRule rule;
  rule.id = id->get<uint64_t>();
  rule.asteroid_id = asteroid->get<std::string>();
  rule.user_id = j.value("user_id", std::string{});
  rule.name = j.value("name", std::string{});
  rule.threshold_distance_km = j.value("threshold_distance_km", 0.0);
  rule.threshold_risk_score = j.value("threshold_risk_score", 100.0);
  rule.is_active = j.value("is_active", true);

  auto last = j.find("last_triggered_at");
  if (last != j.end() && last->is_string()) {
    rule.last_triggered_at = Utils::parse_iso_timestamp(last->get<std::string>());
    if (!rule.last_triggered_at)
      LOG(LogLevel::WARN, LogComponent::IO_RULES,
          "Rule " << rule.id << " has an unreadable last_triggered_at: "
                  << last->get<std::string>());
  }
  return rule;
}

nlohmann::json JsonFileAlertRuleRepository::rule_to_json(const AlertRule &rule) {
  nlohmann::json j;
  j["id"] = rule.id;
  j["user_id"] = rule.user_id;
  j["asteroid_id"] = rule.asteroid_id;
  j["name"] = rule.name;
  j["threshold_distance_km"] = rule.threshold_distance_km;
  j["threshold_risk_score"] = rule.threshold_risk_score;
  j["is_active"] = rule.is_active;
  if (rule.last_triggered_at)
    j["last_triggered_at"] = Utils::format_iso_timestamp(*rule.last_triggered_at);
  else
    j["last_triggered_at"] = nullptr;
  return j;
}

std::vector<AlertRule> JsonFileAlertRuleRepository::list_active() {
  std::vector<AlertRule> active;
  for (auto &rule : list_all())
    if (rule.is_active)
      active.push_back(std::move(rule));
  return active;
}

std::vector<AlertRule> JsonFileAlertRuleRepository::list_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  return load_locked();
}

void JsonFileAlertRuleRepository::save_all(const std::vector<AlertRule> &rules) {
  std::lock_guard<std::mutex> lock(mutex_);
  save_locked(rules);
}

bool JsonFileAlertRuleRepository::record_trigger(
    uint64_t rule_id, std::chrono::system_clock::time_point when) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto rules = load_locked();

  bool found = false;
  for (auto &rule : rules) {
    if (rule.id == rule_id) {
      rule.last_triggered_at = when;
      found = true;
      break;
    }
  }
  if (!found) {
    LOG(LogLevel::WARN, LogComponent::IO_RULES,
        "record_trigger for unknown rule " << rule_id << " in " << file_path_);
    return false;
  }

  save_locked(rules);
  return true;
}

std::vector<AlertRule> JsonFileAlertRuleRepository::load_locked() const {
  std::vector<AlertRule> rules;

  if (!std::filesystem::exists(file_path_)) {
    LOG(LogLevel::DEBUG, LogComponent::IO_RULES,
        "Alert rule file " << file_path_ << " does not exist, no rules loaded");
    return rules;
  }

  std::ifstream file(file_path_);
  if (!file.is_open())
    throw std::runtime_error("Could not open alert rule file: " + file_path_);

  std::stringstream buffer;
  buffer << file.rdbuf();
  nlohmann::json doc = nlohmann::json::parse(buffer.str(), nullptr, false);
  if (doc.is_discarded() || !doc.is_object())
    throw std::runtime_error("Alert rule file is not a JSON object: " +
                             file_path_);

  auto list = doc.find("rules");
  if (list == doc.end() || !list->is_array())
    throw std::runtime_error("Alert rule file has no \"rules\" array: " +
                             file_path_);

  for (const auto &entry : *list) {
    try {
      auto rule = rule_from_json(entry);
      if (rule)
        rules.push_back(std::move(*rule));
      else
        LOG(LogLevel::WARN, LogComponent::IO_RULES,
            "Skipping alert rule without id or asteroid_id in " << file_path_);
    } catch (const nlohmann::json::exception &e) {
      LOG(LogLevel::WARN, LogComponent::IO_RULES,
          "Skipping unreadable alert rule in " << file_path_ << ": "
                                               << e.what());
    }
  }

  LOG(LogLevel::TRACE, LogComponent::IO_RULES,
      "Loaded " << rules.size() << " alert rules from " << file_path_);
  return rules;
}

void JsonFileAlertRuleRepository::save_locked(
    const std::vector<AlertRule> &rules) const {
  nlohmann::json doc;
  doc["rules"] = nlohmann::json::array();
  for (const auto &rule : rules)
    doc["rules"].push_back(rule_to_json(rule));

  Utils::create_directory_for_file(file_path_);
  const std::string tmp_path = file_path_ + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out.is_open())
      throw std::runtime_error("Could not write alert rule file: " + tmp_path);
    out << doc.dump(2) << '\n';
    if (!out.good())
      throw std::runtime_error("Failed writing alert rule file: " + tmp_path);
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, file_path_, ec);
  if (ec)
    throw std::runtime_error("Could not replace alert rule file " + file_path_ +
                             ": " + ec.message());
}
