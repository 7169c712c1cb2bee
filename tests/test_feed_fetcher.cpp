#include "core/errors.hpp"
#include "io/feed/fallback_samples.hpp"
#include "io/feed/feed_fetcher.hpp"
#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

class FeedFetcherTest : public ::testing::Test {
protected:
  void SetUp() override {
    client_ = std::make_shared<FakeFeedClient>();
    cache_ = std::make_shared<PayloadCache>(PayloadCache::Config{},
                                            [this]() { return now_; });
  }

  std::unique_ptr<FeedFetcher> make_fetcher(bool use_fallback = true) {
    FeedFetcher::Options options;
    options.api_key = "TEST_KEY";
    options.cache_ttl = std::chrono::seconds(300);
    options.use_fallback_samples = use_fallback;
    return std::make_unique<FeedFetcher>(client_, cache_, options);
  }

  std::shared_ptr<FakeFeedClient> client_;
  std::shared_ptr<PayloadCache> cache_;
  PayloadCache::Clock::time_point now_{std::chrono::hours(1)};
};

TEST_F(FeedFetcherTest, LiveFetchPassesRequestParameters) {
  auto fetcher = make_fetcher();
  auto result = fetcher->fetch_feed("2024-01-01", "2024-01-03");

  EXPECT_EQ(result.status, FetchStatus::LIVE);
  EXPECT_TRUE(result.is_real_data);
  EXPECT_FALSE(result.degraded_reason.has_value());
  ASSERT_NE(result.payload, nullptr);
  EXPECT_EQ(result.payload->objects.size(), 1u);

  EXPECT_EQ(client_->last_request.start_date, "2024-01-01");
  EXPECT_EQ(client_->last_request.end_date, "2024-01-03");
  EXPECT_EQ(client_->last_request.api_key, "TEST_KEY");
}

TEST_F(FeedFetcherTest, SecondFetchWithinTtlIsServedFromCache) {
  auto fetcher = make_fetcher();
  auto first = fetcher->fetch_feed("2024-01-01", "2024-01-01");
  now_ += std::chrono::seconds(299);
  auto second = fetcher->fetch_feed("2024-01-01", "2024-01-01");

  EXPECT_EQ(client_->calls.load(), 1);
  EXPECT_EQ(second.status, FetchStatus::CACHED);
  EXPECT_EQ(first.payload.get(), second.payload.get());

  now_ += std::chrono::seconds(1);
  auto third = fetcher->fetch_feed("2024-01-01", "2024-01-01");
  EXPECT_EQ(client_->calls.load(), 2);
  EXPECT_EQ(third.status, FetchStatus::LIVE);

  auto counters = fetcher->get_counters();
  EXPECT_EQ(counters.upstream_calls.load(), 2u);
  EXPECT_EQ(counters.cached_results.load(), 1u);
  EXPECT_EQ(counters.live_results.load(), 2u);

  // One cache lookup per fetch: miss, hit, expired miss
  auto stats = cache_->get_statistics();
  EXPECT_EQ(stats.hits.load(), 1u);
  EXPECT_EQ(stats.misses.load(), 2u);
  EXPECT_EQ(stats.expired_reads.load(), 1u);
}

TEST_F(FeedFetcherTest, DifferentRangesUseDifferentKeys) {
  auto fetcher = make_fetcher();
  fetcher->fetch_feed("2024-01-01", "2024-01-01");
  fetcher->fetch_feed("2024-01-01", "2024-01-02");
  EXPECT_EQ(client_->calls.load(), 2);
  EXPECT_EQ(FeedFetcher::make_cache_key("2024-01-01", "2024-01-02"),
            "neo_feed:2024-01-01:2024-01-02");
}

TEST_F(FeedFetcherTest, ConcurrentFetchesIssueOneUpstreamCall) {
  client_->delay = std::chrono::milliseconds(150);
  auto fetcher = make_fetcher();
  constexpr int kCallers = 12;

  std::vector<FetchResult> results(kCallers);
  std::vector<std::thread> threads;
  for (int i = 0; i < kCallers; ++i)
    threads.emplace_back([&, i]() {
      results[i] = fetcher->fetch_feed("2024-02-01", "2024-02-01");
    });
  for (auto &t : threads)
    t.join();

  EXPECT_EQ(client_->calls.load(), 1);
  for (const auto &result : results) {
    ASSERT_NE(result.payload, nullptr);
    EXPECT_EQ(result.payload.get(), results.front().payload.get());
    EXPECT_TRUE(result.is_real_data);
  }
}

TEST_F(FeedFetcherTest, RateLimitWithoutCacheServesFallback) {
  client_->enqueue(429);
  auto fetcher = make_fetcher();
  auto result = fetcher->fetch_feed("2024-03-05", "2024-03-05");

  EXPECT_FALSE(result.is_real_data);
  EXPECT_EQ(result.status, FetchStatus::FALLBACK);
  ASSERT_TRUE(result.degraded_reason.has_value());
  EXPECT_EQ(*result.degraded_reason, UpstreamError::RATE_LIMITED);

  ASSERT_EQ(result.payload->objects.size(), 5u);
  EXPECT_EQ(result.payload->objects[0].name, "(2010 PK9)");
  EXPECT_EQ(result.payload->objects[0].close_approach_date, "2024-03-05");

  // The failure is not cached; the next call reaches upstream again
  auto next = fetcher->fetch_feed("2024-03-05", "2024-03-05");
  EXPECT_EQ(next.status, FetchStatus::LIVE);
  EXPECT_EQ(client_->calls.load(), 2);
}

TEST_F(FeedFetcherTest, RateLimitWithExpiredEntryServesStale) {
  auto fetcher = make_fetcher();
  auto live = fetcher->fetch_feed("2024-01-01", "2024-01-01");

  now_ += std::chrono::seconds(301);
  client_->enqueue(429);
  auto result = fetcher->fetch_feed("2024-01-01", "2024-01-01");

  EXPECT_TRUE(result.is_real_data);
  EXPECT_EQ(result.status, FetchStatus::STALE);
  EXPECT_EQ(result.degraded_reason, UpstreamError::RATE_LIMITED);
  EXPECT_EQ(result.payload.get(), live.payload.get());
}

TEST_F(FeedFetcherTest, ServerAndNetworkErrorsAreUnavailable) {
  auto fetcher = make_fetcher();

  client_->enqueue(503);
  auto server_error = fetcher->fetch_feed("2024-01-01", "2024-01-01");
  EXPECT_EQ(server_error.status, FetchStatus::FALLBACK);
  EXPECT_EQ(server_error.degraded_reason, UpstreamError::UNAVAILABLE);

  client_->enqueue(0, "", "Connection timed out");
  auto network_error = fetcher->fetch_feed("2024-01-02", "2024-01-02");
  EXPECT_EQ(network_error.status, FetchStatus::FALLBACK);
  EXPECT_EQ(network_error.degraded_reason, UpstreamError::UNAVAILABLE);

  client_->enqueue(403, R"({"error":"API_KEY_INVALID"})");
  auto forbidden = fetcher->fetch_feed("2024-01-03", "2024-01-03");
  EXPECT_EQ(forbidden.degraded_reason, UpstreamError::UNAVAILABLE);
}

TEST_F(FeedFetcherTest, NonJsonBodyIsMalformed) {
  client_->enqueue(200, "<html>maintenance</html>");
  auto fetcher = make_fetcher();
  auto result = fetcher->fetch_feed("2024-01-01", "2024-01-01");
  EXPECT_EQ(result.status, FetchStatus::FALLBACK);
  EXPECT_EQ(result.degraded_reason, UpstreamError::MALFORMED);
}

TEST_F(FeedFetcherTest, DisabledFallbackThrows) {
  client_->enqueue(500);
  auto fetcher = make_fetcher(false);
  try {
    fetcher->fetch_feed("2024-01-01", "2024-01-01");
    FAIL() << "Expected FeedUnavailableError";
  } catch (const FeedUnavailableError &e) {
    EXPECT_EQ(e.kind(), UpstreamError::UNAVAILABLE);
  }
}

TEST_F(FeedFetcherTest, DisabledFallbackStillServesStale) {
  auto fetcher = make_fetcher(false);
  fetcher->fetch_feed("2024-01-01", "2024-01-01");
  now_ += std::chrono::seconds(600);
  client_->enqueue(500);
  EXPECT_EQ(fetcher->fetch_feed("2024-01-01", "2024-01-01").status,
            FetchStatus::STALE);
}

TEST_F(FeedFetcherTest, InvalidRangesFailFast) {
  auto fetcher = make_fetcher();
  EXPECT_THROW(fetcher->fetch_feed("2024-01-05", "2024-01-01"),
               std::invalid_argument);
  EXPECT_THROW(fetcher->fetch_feed("2024-1-01", "2024-01-01"),
               std::invalid_argument);
  EXPECT_THROW(fetcher->fetch_feed("2024-01-01", "2024-02-30"),
               std::invalid_argument);
  EXPECT_THROW(fetcher->fetch_feed("2024-01-01", "2024-01-09"),
               std::invalid_argument);
  EXPECT_NO_THROW(fetcher->fetch_feed("2024-01-01", "2024-01-08"));
  EXPECT_EQ(client_->calls.load(), 1);
}

TEST(FallbackSamplesTest, SampleSetIsStable) {
  auto payload = FallbackSamples::build_payload("2025-06-01", "2025-06-02");
  EXPECT_EQ(payload.start_date, "2025-06-01");
  EXPECT_EQ(payload.end_date, "2025-06-02");
  EXPECT_EQ(payload.element_count, 5u);
  ASSERT_EQ(payload.objects.size(), 5u);
  EXPECT_EQ(payload.objects[2].name, "465633 (2009 JR5)");
  EXPECT_TRUE(payload.objects[2].is_hazardous);
  EXPECT_DOUBLE_EQ(payload.objects[2].diameter_km, 1.2);
  for (const auto &neo : payload.objects)
    EXPECT_EQ(neo.close_approach_date, "2025-06-01");
}
