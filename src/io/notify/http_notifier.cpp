#include "io/notify/http_notifier.hpp"
#include "core/logger.hpp"
#include "httplib.h"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

HttpNotifier::HttpNotifier(const std::string &webhook_url, int timeout_seconds)
    : timeout_seconds_(timeout_seconds) {
  auto parsed = Utils::parse_url(webhook_url);
  if (parsed) {
    host_ = parsed->host;
    port_ = parsed->port;
    path_ = parsed->path;
    is_https_ = parsed->is_https;
    LOG(LogLevel::TRACE, LogComponent::IO_NOTIFY,
        "HttpNotifier initialized with URL: "
            << webhook_url << " | Host: " << host_ << ":" << port_
            << " | Path: " << path_
            << " | Protocol: " << (is_https_ ? "HTTPS" : "HTTP"));
  } else {
    LOG(LogLevel::ERROR, LogComponent::IO_NOTIFY,
        "Invalid webhook URL format provided to HttpNotifier: "
            << webhook_url);
    host_.clear();
    path_.clear();
  }
}

bool HttpNotifier::notify(const std::string &user_id,
                          const std::string &subject,
                          const std::string &body) {
  // If the URL was invalid during construction, don't try to send
  if (host_.empty() || path_.empty()) {
    LOG(LogLevel::ERROR, LogComponent::IO_NOTIFY,
        "Cannot send notification: Invalid host or path in HttpNotifier.");
    return false;
  }

  std::string json_body = JsonFormatter::format_notification_to_json(
      user_id, subject, body, Utils::get_current_time_ms());

  bool success = false;
  auto send_request = [&](auto &client) {
    client.set_connection_timeout(timeout_seconds_, 0);
    client.set_read_timeout(timeout_seconds_, 0);

    auto res = client.Post(path_, json_body, "application/json");
    if (res && res->status < 400) {
      LOG(LogLevel::TRACE, LogComponent::IO_NOTIFY,
          "Notification posted to " << (is_https_ ? "https://" : "http://")
                                    << host_ << path_
                                    << " | Status: " << res->status);
      success = true;
    } else {
      LOG(LogLevel::ERROR, LogComponent::IO_NOTIFY,
          "Failed to post notification to "
              << (is_https_ ? "https://" : "http://") << host_ << path_
              << " | Status: "
              << (res ? std::to_string(res->status) : "No response")
              << " | Error: "
              << (res ? std::string("none") : httplib::to_string(res.error())));
    }
  };

  if (is_https_) {
    httplib::SSLClient cli(host_, port_);
    send_request(cli);
  } else {
    httplib::Client cli(host_, port_);
    send_request(cli);
  }
  return success;
}
