#ifndef NEO_FEED_SERVICE_HPP
#define NEO_FEED_SERVICE_HPP

#include "analysis/feed_processor.hpp"
#include "core/cache_store.hpp"
#include "core/neo_types.hpp"
#include "io/feed/feed_fetcher.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

using SnapshotPtr = std::shared_ptr<const FeedSnapshot>;

// Entry point combining the fetcher and the processor. Scored snapshots are
// memoised per date range and reused as long as the fetcher keeps handing
// out the same payload.
class NeoFeedService {
public:
  struct SnapshotMemo {
    PayloadPtr source;
    SnapshotPtr snapshot;
  };
  using SnapshotCache = CacheStore<SnapshotMemo>;

  NeoFeedService(std::shared_ptr<FeedFetcher> fetcher,
                 SnapshotCache::Config cache_config = {});

  SnapshotPtr fetch_feed(const std::string &start_date,
                         const std::string &end_date);
  SnapshotPtr fetch_today();

  RiskAssessment score(const NearEarthObject &neo) const;

  uint64_t get_processing_runs() const { return processing_runs_.load(); }
  FeedFetcher &fetcher() { return *fetcher_; }

private:
  SnapshotPtr build_snapshot(const FetchResult &result);

  std::shared_ptr<FeedFetcher> fetcher_;
  FeedProcessor processor_;
  SnapshotCache snapshots_;
  std::atomic<uint64_t> processing_runs_{0};
};

#endif // NEO_FEED_SERVICE_HPP
