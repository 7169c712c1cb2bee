#ifndef HTTP_NOTIFIER_HPP
#define HTTP_NOTIFIER_HPP

#include "io/notify/base_notifier.hpp"

#include <string>

// POSTs each notification as JSON to a webhook
class HttpNotifier : public INotifier {
public:
  explicit HttpNotifier(const std::string &webhook_url, int timeout_seconds = 10);
  bool notify(const std::string &user_id, const std::string &subject,
              const std::string &body) override;
  const char *get_name() const override { return "HttpNotifier"; }
  std::string get_notifier_type() const override { return "http"; }

  bool is_valid() const { return !host_.empty(); }

private:
  std::string host_;
  int port_ = 0;
  std::string path_;
  bool is_https_ = false;
  int timeout_seconds_;
};

#endif // HTTP_NOTIFIER_HPP
