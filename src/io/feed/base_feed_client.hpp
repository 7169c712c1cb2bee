#ifndef BASE_FEED_CLIENT_HPP
#define BASE_FEED_CLIENT_HPP

#include <string>

struct FeedRequest {
  std::string start_date;
  std::string end_date;
  std::string api_key;
};

struct FeedHttpResponse {
  int status = 0;    // 0 when no HTTP response was received
  std::string body;
  std::string error; // transport error description when status == 0
};

class IFeedClient {
public:
  virtual ~IFeedClient() = default;
  virtual FeedHttpResponse get_feed(const FeedRequest &request) = 0;
  virtual const char *get_name() const = 0;
};

#endif // BASE_FEED_CLIENT_HPP
