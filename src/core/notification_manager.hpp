#ifndef NOTIFICATION_MANAGER_HPP
#define NOTIFICATION_MANAGER_HPP

#include "io/notify/base_notifier.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Config {
struct NotificationsConfig;
}

// Fans each notification out to the configured notifiers. With no notifiers
// (or stdout enabled) the notification is written to the log.
class NotificationManager : public INotifier {
public:
  NotificationManager() = default;
  explicit NotificationManager(const Config::NotificationsConfig &config);

  void reconfigure(const Config::NotificationsConfig &config);
  void add_notifier(std::unique_ptr<INotifier> notifier);

  // Succeeds when at least one notifier delivered, or when only the log
  // sink is configured
  bool notify(const std::string &user_id, const std::string &subject,
              const std::string &body) override;
  const char *get_name() const override { return "NotificationManager"; }
  std::string get_notifier_type() const override { return "fanout"; }

  size_t notifier_count() const;
  size_t get_delivered_count() const { return delivered_.load(); }
  size_t get_failed_count() const { return failed_.load(); }

private:
  std::vector<std::unique_ptr<INotifier>> notifiers_;
  bool output_to_stdout_ = true;
  mutable std::mutex notifiers_mutex_;

  std::atomic<size_t> delivered_{0};
  std::atomic<size_t> failed_{0};
};

#endif // NOTIFICATION_MANAGER_HPP
