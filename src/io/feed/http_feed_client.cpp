#include "io/feed/http_feed_client.hpp"
#include "core/logger.hpp"
#include "httplib.h"
#include "utils/utils.hpp"

#include <chrono>
#include <string>
#include <utility>

HttpFeedClient::HttpFeedClient(const std::string &base_url,
                               std::chrono::seconds timeout)
    : timeout_(timeout) {
  auto parsed = Utils::parse_url(base_url);
  if (parsed) {
    host_ = parsed->host;
    port_ = parsed->port;
    is_https_ = parsed->is_https;

    std::string base_path = parsed->path;
    while (!base_path.empty() && base_path.back() == '/')
      base_path.pop_back();
    feed_path_ = base_path + "/feed";

    LOG(LogLevel::TRACE, LogComponent::IO_FEED,
        "HttpFeedClient initialized with URL: "
            << base_url << " | Host: " << host_ << ":" << port_
            << " | Feed path: " << feed_path_
            << " | Protocol: " << (is_https_ ? "HTTPS" : "HTTP"));
  } else {
    LOG(LogLevel::ERROR, LogComponent::IO_FEED,
        "Invalid feed base URL provided to HttpFeedClient: " << base_url);
    host_.clear();
    feed_path_.clear();
  }
}

FeedHttpResponse HttpFeedClient::get_feed(const FeedRequest &request) {
  FeedHttpResponse response;

  // If the URL was invalid during construction, don't try to send
  if (host_.empty()) {
    response.error = "HttpFeedClient has no valid upstream host";
    return response;
  }

  httplib::Params params{{"start_date", request.start_date},
                         {"end_date", request.end_date},
                         {"api_key", request.api_key}};

  // httplib timeouts apply per socket operation; the content receiver caps
  // the whole transfer so a slowly dripping body cannot outlive the timeout
  const auto deadline = std::chrono::steady_clock::now() + timeout_;
  bool deadline_exceeded = false;
  std::string body;
  auto receive_within_deadline = [&](const char *data, size_t length) {
    if (std::chrono::steady_clock::now() >= deadline) {
      deadline_exceeded = true;
      return false;
    }
    body.append(data, length);
    return true;
  };

  auto send_request = [&](auto &client) {
    client.set_connection_timeout(timeout_.count(), 0);
    client.set_read_timeout(timeout_.count(), 0);
    client.set_write_timeout(timeout_.count(), 0);

    auto res = client.Get(feed_path_, params, httplib::Headers{},
                          receive_within_deadline);
    if (res) {
      response.status = res->status;
      response.body = std::move(body);
      LOG(LogLevel::DEBUG, LogComponent::IO_FEED,
          "Feed request " << request.start_date << ".." << request.end_date
                          << " to " << host_ << feed_path_
                          << " | Status: " << res->status
                          << " | Bytes: " << response.body.size());
    } else {
      response.error =
          deadline_exceeded
              ? "Request exceeded the " + std::to_string(timeout_.count()) +
                    "s deadline"
              : httplib::to_string(res.error());
      LOG(LogLevel::ERROR, LogComponent::IO_FEED,
          "Feed request to " << (is_https_ ? "https://" : "http://") << host_
                             << feed_path_
                             << " failed without a response: "
                             << response.error);
    }
  };

  if (is_https_) {
    httplib::SSLClient cli(host_, port_);
    send_request(cli);
  } else {
    httplib::Client cli(host_, port_);
    send_request(cli);
  }
  return response;
}
