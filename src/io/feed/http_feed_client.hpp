#ifndef HTTP_FEED_CLIENT_HPP
#define HTTP_FEED_CLIENT_HPP

#include "io/feed/base_feed_client.hpp"

#include <chrono>
#include <string>

class HttpFeedClient : public IFeedClient {
public:
  HttpFeedClient(const std::string &base_url, std::chrono::seconds timeout);
  FeedHttpResponse get_feed(const FeedRequest &request) override;
  const char *get_name() const override { return "HttpFeedClient"; }

  bool is_valid() const { return !host_.empty(); }
  const std::string &feed_path() const { return feed_path_; }

private:
  std::string host_;
  int port_ = 0;
  std::string feed_path_;
  bool is_https_ = false;
  std::chrono::seconds timeout_;
};

#endif // HTTP_FEED_CLIENT_HPP
