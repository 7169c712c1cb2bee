#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

enum class UpstreamError {
  RATE_LIMITED, // HTTP 429
  UNAVAILABLE,  // network error, timeout, 5xx or any other non-200
  MALFORMED     // 200 with a body that is not a feed document
};

inline std::string upstream_error_to_string(UpstreamError error) {
  switch (error) {
  case UpstreamError::RATE_LIMITED:
    return "rate_limited";
  case UpstreamError::UNAVAILABLE:
    return "unavailable";
  case UpstreamError::MALFORMED:
    return "malformed";
  }
  return "unknown";
}

// Raised inside a feed computation. The fetcher converts it into the
// stale-then-fallback path, so it never reaches callers of fetch_feed.
class FeedFetchError : public std::runtime_error {
public:
  FeedFetchError(UpstreamError kind, int http_status, const std::string &what)
      : std::runtime_error(what), kind_(kind), http_status_(http_status) {}

  UpstreamError kind() const { return kind_; }
  int http_status() const { return http_status_; } // 0 for transport errors

private:
  UpstreamError kind_;
  int http_status_;
};

// Raised only when the fallback sample set is disabled and no stale data is
// available for the requested range.
class FeedUnavailableError : public std::runtime_error {
public:
  FeedUnavailableError(UpstreamError kind, const std::string &what)
      : std::runtime_error(what), kind_(kind) {}

  UpstreamError kind() const { return kind_; }

private:
  UpstreamError kind_;
};

#endif // ERRORS_HPP
