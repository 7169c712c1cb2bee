#include "notification_manager.hpp"
#include "config.hpp"
#include "io/notify/file_notifier.hpp"
#include "io/notify/http_notifier.hpp"
#include "logger.hpp"

NotificationManager::NotificationManager(
    const Config::NotificationsConfig &config) {
  reconfigure(config);
}

void NotificationManager::reconfigure(
    const Config::NotificationsConfig &config) {
  std::lock_guard<std::mutex> lock(notifiers_mutex_);
  output_to_stdout_ = config.stdout_enabled;
  notifiers_.clear();

  if (config.file_enabled && !config.file_path.empty()) {
    notifiers_.push_back(std::make_unique<FileNotifier>(config.file_path));
    LOG(LogLevel::INFO, LogComponent::IO_NOTIFY,
        "NotificationManager: FileNotifier enabled, writing to "
            << config.file_path);
  }

  if (config.http_enabled && !config.http_webhook_url.empty()) {
    notifiers_.push_back(
        std::make_unique<HttpNotifier>(config.http_webhook_url));
    LOG(LogLevel::INFO, LogComponent::IO_NOTIFY,
        "NotificationManager: HttpNotifier enabled for URL: "
            << config.http_webhook_url);
  }

  LOG(LogLevel::INFO, LogComponent::IO_NOTIFY,
      "NotificationManager has been reconfigured. Active notifiers: "
          << notifiers_.size());
}

void NotificationManager::add_notifier(std::unique_ptr<INotifier> notifier) {
  if (!notifier)
    return;
  std::lock_guard<std::mutex> lock(notifiers_mutex_);
  notifiers_.push_back(std::move(notifier));
}

size_t NotificationManager::notifier_count() const {
  std::lock_guard<std::mutex> lock(notifiers_mutex_);
  return notifiers_.size();
}

bool NotificationManager::notify(const std::string &user_id,
                                 const std::string &subject,
                                 const std::string &body) {
  std::lock_guard<std::mutex> lock(notifiers_mutex_);

  if (output_to_stdout_ || notifiers_.empty())
    LOG(LogLevel::INFO, LogComponent::IO_NOTIFY,
        "Notification for " << user_id << " | " << subject << "\n"
                            << body);

  if (notifiers_.empty()) {
    delivered_++;
    return true;
  }

  bool any_delivered = false;
  for (const auto &notifier : notifiers_) {
    if (notifier->notify(user_id, subject, body)) {
      any_delivered = true;
    } else {
      LOG(LogLevel::WARN, LogComponent::IO_NOTIFY,
          notifier->get_name() << " failed to deliver notification for "
                               << user_id);
    }
  }

  if (any_delivered)
    delivered_++;
  else
    failed_++;
  return any_delivered;
}
