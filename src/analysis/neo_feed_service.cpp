#include "analysis/neo_feed_service.hpp"
#include "core/logger.hpp"
#include "scoring/risk_scorer.hpp"
#include "utils/utils.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

NeoFeedService::NeoFeedService(std::shared_ptr<FeedFetcher> fetcher,
                               SnapshotCache::Config cache_config)
    : fetcher_(std::move(fetcher)), snapshots_(cache_config) {
  if (!fetcher_)
    throw std::invalid_argument("NeoFeedService requires a feed fetcher");
}

SnapshotPtr NeoFeedService::fetch_feed(const std::string &start_date,
                                       const std::string &end_date) {
  FetchResult result = fetcher_->fetch_feed(start_date, end_date);
  const std::string key = FeedFetcher::make_cache_key(start_date, end_date);

  if (auto memo = snapshots_.get(key); memo && memo->source == result.payload) {
    const FeedSnapshot &cached = *memo->snapshot;
    if (cached.source == result.status &&
        cached.degraded_reason == result.degraded_reason)
      return memo->snapshot;

    // Same scored objects, different provenance for this call
    auto relabelled = std::make_shared<FeedSnapshot>(cached);
    relabelled->source = result.status;
    relabelled->is_real_data = result.is_real_data;
    relabelled->degraded_reason = result.degraded_reason;
    SnapshotPtr snapshot = std::move(relabelled);
    snapshots_.set(key, SnapshotMemo{result.payload, snapshot},
                   fetcher_->options().cache_ttl);
    return snapshot;
  }

  SnapshotPtr snapshot = build_snapshot(result);
  snapshots_.set(key, SnapshotMemo{result.payload, snapshot},
                 fetcher_->options().cache_ttl);
  return snapshot;
}

SnapshotPtr NeoFeedService::fetch_today() {
  std::string today = Utils::format_iso_date(std::chrono::system_clock::now());
  return fetch_feed(today, today);
}

RiskAssessment NeoFeedService::score(const NearEarthObject &neo) const {
  return RiskScoring::score(neo);
}

SnapshotPtr NeoFeedService::build_snapshot(const FetchResult &result) {
  processing_runs_.fetch_add(1, std::memory_order_relaxed);

  auto snapshot = std::make_shared<FeedSnapshot>(processor_.process(*result.payload));
  snapshot->is_real_data = result.is_real_data;
  snapshot->source = result.status;
  snapshot->degraded_reason = result.degraded_reason;

  if (!result.is_real_data)
    LOG(LogLevel::WARN, LogComponent::PROCESSING,
        "Snapshot " << snapshot->start_date << ".." << snapshot->end_date
                    << " built from fallback samples");
  return snapshot;
}
