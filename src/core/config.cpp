#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace Config {

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"cache", LogComponent::CACHE},
    {"io.feed", LogComponent::IO_FEED},
    {"io.rules", LogComponent::IO_RULES},
    {"io.notify", LogComponent::IO_NOTIFY},
    {"processing", LogComponent::PROCESSING},
    {"alerts.eval", LogComponent::ALERTS_EVAL},
    {"alerts.scheduler", LogComponent::ALERTS_SCHEDULER}};

void apply_default_log_levels(LoggingConfig &logging) {
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map)
    logging.log_levels[pair.second] = LogLevel::WARN;
  // Except for CORE, which we want to see INFO messages from by default
  logging.log_levels[LogComponent::CORE] = LogLevel::INFO;
}

// Convert string to boolean using common truthy values
bool string_to_bool(std::string &val_str_raw) {
  std::string val_str = Utils::trim_copy(val_str_raw);
  std::transform(val_str.begin(), val_str.end(), val_str.begin(), ::tolower);
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

// Validation functions for configuration parameters
bool validate_feed_config(const FeedConfig &config,
                          std::vector<std::string> &errors) {
  bool valid = true;

  if (!Utils::parse_url(config.base_url)) {
    errors.push_back("Feed base_url must be an http(s) URL: '" +
                     config.base_url + "'");
    valid = false;
  }

  if (config.api_key.empty()) {
    errors.push_back("Feed api_key cannot be empty");
    valid = false;
  }

  if (config.request_timeout_seconds < 1 ||
      config.request_timeout_seconds > 60) {
    errors.push_back("Feed request timeout must be between 1 and 60 seconds");
    valid = false;
  }

  if (config.cache_ttl_seconds < 1 || config.cache_ttl_seconds > 86400) {
    errors.push_back("Feed cache TTL must be between 1 and 86400 seconds");
    valid = false;
  }

  if (config.max_range_days < 1 || config.max_range_days > 31) {
    errors.push_back("Feed max range must be between 1 and 31 days");
    valid = false;
  }

  return valid;
}

bool validate_alerts_config(const AlertsConfig &config,
                            std::vector<std::string> &errors) {
  bool valid = true;

  if (config.check_interval_seconds < 1 ||
      config.check_interval_seconds > 86400) {
    errors.push_back(
        "Alert check interval must be between 1 and 86400 seconds");
    valid = false;
  }

  if (config.cooldown_seconds < 1) {
    errors.push_back("Alert cooldown must be at least 1 second");
    valid = false;
  }

  if (config.enabled && config.rules_path.empty()) {
    errors.push_back("Alert rules_path cannot be empty when alerts are "
                     "enabled");
    valid = false;
  }

  return valid;
}

bool validate_notifications_config(const NotificationsConfig &config,
                                   std::vector<std::string> &errors) {
  bool valid = true;

  if (config.file_enabled && config.file_path.empty()) {
    errors.push_back(
        "Notification file_path cannot be empty when file_enabled is set");
    valid = false;
  }

  if (config.http_enabled && !Utils::parse_url(config.http_webhook_url)) {
    errors.push_back("Notification http_webhook_url must be an http(s) URL "
                     "when http_enabled is set");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (!validate_feed_config(config.feed, errors))
    valid = false;

  if (!validate_alerts_config(config.alerts, errors))
    valid = false;

  if (!validate_notifications_config(config.notifications, errors))
    valid = false;

  if (config.cache.max_entries < 1) {
    errors.push_back("Cache max_entries must be at least 1");
    valid = false;
  }

  return valid;
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  apply_default_log_levels(config.logging);

  std::cout << "Attempting to load configuration from " << filepath
            << std::endl;
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    // Key-value pair parsing
    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    try {
      // Global (non-section) keys
      if (current_section.empty()) {
        config.custom_settings[key] = value;

      } else if (current_section == "Feed") {
        if (key == Keys::FEED_BASE_URL)
          config.feed.base_url = value;
        else if (key == Keys::FEED_API_KEY)
          config.feed.api_key = value;
        else if (key == Keys::FEED_REQUEST_TIMEOUT_SECONDS)
          config.feed.request_timeout_seconds =
              Utils::string_to_number<uint32_t>(value).value_or(
                  config.feed.request_timeout_seconds);
        else if (key == Keys::FEED_CACHE_TTL_SECONDS)
          config.feed.cache_ttl_seconds =
              Utils::string_to_number<uint32_t>(value).value_or(
                  config.feed.cache_ttl_seconds);
        else if (key == Keys::FEED_MAX_RANGE_DAYS)
          config.feed.max_range_days =
              Utils::string_to_number<uint32_t>(value).value_or(
                  config.feed.max_range_days);
        else if (key == Keys::FEED_USE_FALLBACK_SAMPLES)
          config.feed.use_fallback_samples = string_to_bool(value);

      } else if (current_section == "Cache") {
        if (key == Keys::CACHE_MAX_ENTRIES)
          config.cache.max_entries =
              Utils::string_to_number<size_t>(value).value_or(
                  config.cache.max_entries);

      } else if (current_section == "Alerts") {
        if (key == Keys::AL_ENABLED)
          config.alerts.enabled = string_to_bool(value);
        else if (key == Keys::AL_CHECK_INTERVAL_SECONDS)
          config.alerts.check_interval_seconds =
              Utils::string_to_number<uint32_t>(value).value_or(
                  config.alerts.check_interval_seconds);
        else if (key == Keys::AL_COOLDOWN_SECONDS)
          config.alerts.cooldown_seconds =
              Utils::string_to_number<uint64_t>(value).value_or(
                  config.alerts.cooldown_seconds);
        else if (key == Keys::AL_RULES_PATH)
          config.alerts.rules_path = value;

      } else if (current_section == "Notifications") {
        if (key == Keys::NO_STDOUT_ENABLED)
          config.notifications.stdout_enabled = string_to_bool(value);
        else if (key == Keys::NO_FILE_ENABLED)
          config.notifications.file_enabled = string_to_bool(value);
        else if (key == Keys::NO_FILE_PATH)
          config.notifications.file_path = value;
        else if (key == Keys::NO_HTTP_ENABLED)
          config.notifications.http_enabled = string_to_bool(value);
        else if (key == Keys::NO_HTTP_WEBHOOK_URL)
          config.notifications.http_webhook_url = value;

      } else if (current_section == "Logging") {
        if (key == Keys::LOGGING_DEFAULT_LEVEL) {
          LogLevel default_level = string_to_log_level(value);
          for (auto &pair : config.logging.log_levels)
            pair.second = default_level;
        } else {
          auto comp_it = key_to_component_map.find(key);
          if (comp_it != key_to_component_map.end())
            config.logging.log_levels[comp_it->second] =
                string_to_log_level(value);
          else if (key.length() > 2 && key.substr(key.length() - 2) == ".*") {
            // Wildcard match, e.g., "alerts.* = DEBUG"
            std::string prefix = key.substr(0, key.length() - 1);
            for (const auto &pair : key_to_component_map) {
              if (pair.first.rfind(prefix, 0) == 0)
                config.logging.log_levels[pair.second] =
                    string_to_log_level(value);
            }
          }
        }
      }
    } catch (const std::invalid_argument &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid value for key '" << key << "': '" << value
                << "' - " << e.what() << std::endl;
    } catch (const std::out_of_range &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Value out of range for key '" << key << "': '" << value
                << "' - " << e.what() << std::endl;
    }
  }

  config_file.close();
  std::cout << "Configuration loaded successfully from " << filepath
            << std::endl;
  return true;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  // Use the parsing logic to fill the new config object
  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  // Validate the configuration
  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  std::cout << "Configuration loaded and validated successfully from "
            << config_filepath_ << std::endl;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
