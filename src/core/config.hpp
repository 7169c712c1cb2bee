#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// Feed Settings
constexpr const char *FEED_BASE_URL = "base_url";
constexpr const char *FEED_API_KEY = "api_key";
constexpr const char *FEED_REQUEST_TIMEOUT_SECONDS = "request_timeout_seconds";
constexpr const char *FEED_CACHE_TTL_SECONDS = "cache_ttl_seconds";
constexpr const char *FEED_MAX_RANGE_DAYS = "max_range_days";
constexpr const char *FEED_USE_FALLBACK_SAMPLES = "use_fallback_samples";

// Cache Settings
constexpr const char *CACHE_MAX_ENTRIES = "max_entries";

// Alert Settings
constexpr const char *AL_ENABLED = "enabled";
constexpr const char *AL_CHECK_INTERVAL_SECONDS = "check_interval_seconds";
constexpr const char *AL_COOLDOWN_SECONDS = "cooldown_seconds";
constexpr const char *AL_RULES_PATH = "rules_path";

// Notification Settings
constexpr const char *NO_STDOUT_ENABLED = "stdout_enabled";
constexpr const char *NO_FILE_ENABLED = "file_enabled";
constexpr const char *NO_FILE_PATH = "file_path";
constexpr const char *NO_HTTP_ENABLED = "http_enabled";
constexpr const char *NO_HTTP_WEBHOOK_URL = "http_webhook_url";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";
} // namespace Keys

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct FeedConfig {
  std::string base_url = "https://api.nasa.gov/neo/rest/v1";
  std::string api_key = "DEMO_KEY";
  uint32_t request_timeout_seconds = 10;
  uint32_t cache_ttl_seconds = 300; // 5 minutes
  uint32_t max_range_days = 7;      // upstream feed limit
  bool use_fallback_samples = true;
};

struct CacheConfig {
  size_t max_entries = 256;
};

struct AlertsConfig {
  bool enabled = true;
  uint32_t check_interval_seconds = 60;
  uint64_t cooldown_seconds = 86400; // one day
  std::string rules_path = "data/alert_rules.json";
};

struct NotificationsConfig {
  bool stdout_enabled = true;
  bool file_enabled = false;
  std::string file_path = "data/notifications.jsonl";
  bool http_enabled = false;
  std::string http_webhook_url;
};

struct AppConfig {
  FeedConfig feed;
  CacheConfig cache;
  AlertsConfig alerts;
  NotificationsConfig notifications;
  LoggingConfig logging;

  std::unordered_map<std::string, std::string> custom_settings;

  AppConfig() = default;
};

// Validation functions for configuration parameters
bool validate_feed_config(const FeedConfig &config,
                          std::vector<std::string> &errors);
bool validate_alerts_config(const AlertsConfig &config,
                            std::vector<std::string> &errors);
bool validate_notifications_config(const NotificationsConfig &config,
                                   std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

LogLevel string_to_log_level(const std::string &level_str_raw);
void apply_default_log_levels(LoggingConfig &logging);

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
