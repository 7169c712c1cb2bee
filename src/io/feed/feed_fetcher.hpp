#ifndef FEED_FETCHER_HPP
#define FEED_FETCHER_HPP

#include "core/cache_store.hpp"
#include "core/neo_types.hpp"
#include "io/feed/base_feed_client.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

using PayloadPtr = std::shared_ptr<const FeedPayload>;
using PayloadCache = CacheStore<PayloadPtr>;

struct FetchResult {
  PayloadPtr payload;
  bool is_real_data = true;
  FetchStatus status = FetchStatus::LIVE;
  std::optional<UpstreamError> degraded_reason;
};

class FeedFetcher {
public:
  struct Options {
    std::string api_key{"DEMO_KEY"};
    std::chrono::seconds cache_ttl{300};
    uint32_t max_range_days{7};
    bool use_fallback_samples{true};
  };

  struct Counters {
    std::atomic<uint64_t> upstream_calls{0};
    std::atomic<uint64_t> live_results{0};
    std::atomic<uint64_t> cached_results{0};
    std::atomic<uint64_t> stale_results{0};
    std::atomic<uint64_t> fallback_results{0};

    Counters() = default;
    Counters(const Counters &other)
        : upstream_calls(other.upstream_calls.load()),
          live_results(other.live_results.load()),
          cached_results(other.cached_results.load()),
          stale_results(other.stale_results.load()),
          fallback_results(other.fallback_results.load()) {}
  };

  FeedFetcher(std::shared_ptr<IFeedClient> client,
              std::shared_ptr<PayloadCache> cache, Options options);

  // Throws std::invalid_argument for a bad range. With fallback samples
  // enabled every other path resolves to a payload; otherwise
  // FeedUnavailableError is thrown when neither live nor stale data exists.
  FetchResult fetch_feed(const std::string &start_date,
                         const std::string &end_date);
  FetchResult fetch_today();

  void validate_range(const std::string &start_date,
                      const std::string &end_date) const;

  static std::string make_cache_key(const std::string &start_date,
                                    const std::string &end_date);

  Counters get_counters() const { return counters_; }
  const Options &options() const { return options_; }

private:
  PayloadPtr fetch_from_upstream(const std::string &start_date,
                                 const std::string &end_date);
  FetchResult degrade(const std::string &key, const std::string &start_date,
                      const std::string &end_date, UpstreamError reason);

  std::shared_ptr<IFeedClient> client_;
  std::shared_ptr<PayloadCache> cache_;
  Options options_;
  Counters counters_;
};

#endif // FEED_FETCHER_HPP
