#include "io/feed/feed_fetcher.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "io/feed/fallback_samples.hpp"
#include "io/feed/feed_parser.hpp"
#include "utils/utils.hpp"

#include <stdexcept>
#include <string>
#include <utility>

FeedFetcher::FeedFetcher(std::shared_ptr<IFeedClient> client,
                         std::shared_ptr<PayloadCache> cache, Options options)
    : client_(std::move(client)), cache_(std::move(cache)),
      options_(std::move(options)) {
  if (!client_)
    throw std::invalid_argument("FeedFetcher requires a feed client");
  if (!cache_)
    cache_ = std::make_shared<PayloadCache>();

  LOG(LogLevel::INFO, LogComponent::IO_FEED,
      "FeedFetcher created with client " << client_->get_name()
                                         << " | TTL: "
                                         << options_.cache_ttl.count() << "s"
                                         << " | Max range: "
                                         << options_.max_range_days << " days");
}

std::string FeedFetcher::make_cache_key(const std::string &start_date,
                                        const std::string &end_date) {
  return "neo_feed:" + start_date + ":" + end_date;
}

void FeedFetcher::validate_range(const std::string &start_date,
                                 const std::string &end_date) const {
  auto start_days = Utils::parse_iso_date_to_days(start_date);
  if (!start_days)
    throw std::invalid_argument("Invalid start date '" + start_date +
                                "', expected YYYY-MM-DD");

  auto end_days = Utils::parse_iso_date_to_days(end_date);
  if (!end_days)
    throw std::invalid_argument("Invalid end date '" + end_date +
                                "', expected YYYY-MM-DD");

  if (*start_days > *end_days)
    throw std::invalid_argument("Start date " + start_date +
                                " is after end date " + end_date);

  if (*end_days - *start_days > static_cast<int64_t>(options_.max_range_days))
    throw std::invalid_argument(
        "Date range " + start_date + ".." + end_date + " exceeds " +
        std::to_string(options_.max_range_days) + " days");
}

FetchResult FeedFetcher::fetch_feed(const std::string &start_date,
                                    const std::string &end_date) {
  validate_range(start_date, end_date);
  const std::string key = make_cache_key(start_date, end_date);

  try {
    PayloadCache::Lookup lookup = PayloadCache::Lookup::COMPUTED;
    PayloadPtr payload = cache_->get_or_compute(
        key, options_.cache_ttl,
        [&]() { return fetch_from_upstream(start_date, end_date); }, &lookup);

    if (lookup == PayloadCache::Lookup::HIT) {
      counters_.cached_results.fetch_add(1, std::memory_order_relaxed);
      LOG(LogLevel::DEBUG, LogComponent::IO_FEED, "Cache hit for " << key);
      return FetchResult{std::move(payload), true, FetchStatus::CACHED,
                         std::nullopt};
    }

    counters_.live_results.fetch_add(1, std::memory_order_relaxed);
    return FetchResult{std::move(payload), true, FetchStatus::LIVE,
                       std::nullopt};
  } catch (const FeedFetchError &e) {
    LOG(LogLevel::WARN, LogComponent::IO_FEED,
        "Upstream fetch for " << key << " failed ("
                              << upstream_error_to_string(e.kind())
                              << ", HTTP " << e.http_status()
                              << "): " << e.what());
    return degrade(key, start_date, end_date, e.kind());
  }
}

FetchResult FeedFetcher::fetch_today() {
  std::string today = Utils::format_iso_date(std::chrono::system_clock::now());
  return fetch_feed(today, today);
}

PayloadPtr FeedFetcher::fetch_from_upstream(const std::string &start_date,
                                            const std::string &end_date) {
  counters_.upstream_calls.fetch_add(1, std::memory_order_relaxed);
  LOG(LogLevel::DEBUG, LogComponent::IO_FEED,
      "Requesting upstream feed " << start_date << ".." << end_date);

  FeedHttpResponse response;
  try {
    response = client_->get_feed(
        FeedRequest{start_date, end_date, options_.api_key});
  } catch (const std::exception &e) {
    throw FeedFetchError(UpstreamError::UNAVAILABLE, 0,
                         std::string("Feed client error: ") + e.what());
  }

  if (response.status == 0)
    throw FeedFetchError(UpstreamError::UNAVAILABLE, 0,
                         "No response from upstream: " + response.error);

  if (response.status == 429)
    throw FeedFetchError(UpstreamError::RATE_LIMITED, 429,
                         "Upstream rate limit exceeded");

  if (response.status != 200)
    throw FeedFetchError(UpstreamError::UNAVAILABLE, response.status,
                         "Unexpected upstream status");

  return std::make_shared<const FeedPayload>(
      FeedParser::parse_feed(response.body, start_date, end_date));
}

FetchResult FeedFetcher::degrade(const std::string &key,
                                 const std::string &start_date,
                                 const std::string &end_date,
                                 UpstreamError reason) {
  if (auto stale = cache_->get_stale(key)) {
    counters_.stale_results.fetch_add(1, std::memory_order_relaxed);
    LOG(LogLevel::WARN, LogComponent::IO_FEED,
        "Serving stale cached payload for " << key);
    return FetchResult{*stale, true, FetchStatus::STALE, reason};
  }

  if (!options_.use_fallback_samples)
    throw FeedUnavailableError(reason, "No data available for " + start_date +
                                           ".." + end_date + " (" +
                                           upstream_error_to_string(reason) +
                                           ")");

  counters_.fallback_results.fetch_add(1, std::memory_order_relaxed);
  LOG(LogLevel::WARN, LogComponent::IO_FEED,
      "Serving fallback sample set for " << key);
  return FetchResult{std::make_shared<const FeedPayload>(
                         FallbackSamples::build_payload(start_date, end_date)),
                     false, FetchStatus::FALLBACK, reason};
}
