#include "analysis/neo_feed_service.hpp"
#include "core/errors.hpp"
#include "scoring/risk_scorer.hpp"
#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>

class NeoFeedServiceTest : public ::testing::Test {
protected:
  void SetUp() override {
    client_ = std::make_shared<FakeFeedClient>();
    client_->default_response = FeedHttpResponse{
        200, make_feed_body("2024-01-01", {"10", "11", "12"}), ""};
    cache_ = std::make_shared<PayloadCache>(PayloadCache::Config{},
                                            [this]() { return now_; });
    make_service(true);
  }

  void make_service(bool use_fallback) {
    FeedFetcher::Options options;
    options.cache_ttl = std::chrono::seconds(300);
    options.use_fallback_samples = use_fallback;
    fetcher_ = std::make_shared<FeedFetcher>(client_, cache_, options);
    service_ = std::make_unique<NeoFeedService>(fetcher_);
  }

  std::shared_ptr<FakeFeedClient> client_;
  std::shared_ptr<PayloadCache> cache_;
  std::shared_ptr<FeedFetcher> fetcher_;
  std::unique_ptr<NeoFeedService> service_;
  PayloadCache::Clock::time_point now_{std::chrono::hours(1)};
};

TEST_F(NeoFeedServiceTest, RejectsNullFetcher) {
  EXPECT_THROW(NeoFeedService service(nullptr), std::invalid_argument);
}

TEST_F(NeoFeedServiceTest, LiveSnapshotCarriesScoresAndStatistics) {
  auto snapshot = service_->fetch_feed("2024-01-01", "2024-01-01");

  ASSERT_NE(snapshot, nullptr);
  EXPECT_EQ(snapshot->source, FetchStatus::LIVE);
  EXPECT_TRUE(snapshot->is_real_data);
  EXPECT_FALSE(snapshot->degraded_reason.has_value());
  ASSERT_EQ(snapshot->objects.size(), 3u);
  EXPECT_EQ(snapshot->objects[0].neo.id, "10");
  EXPECT_DOUBLE_EQ(snapshot->objects[0].risk.score, 69.0);
  EXPECT_EQ(snapshot->statistics.total, 3u);
  EXPECT_EQ(snapshot->statistics.hazardous_count, 3u);
  EXPECT_EQ(service_->get_processing_runs(), 1u);
}

TEST_F(NeoFeedServiceTest, CachedPayloadIsNotScoredAgain) {
  auto live = service_->fetch_feed("2024-01-01", "2024-01-01");
  auto cached = service_->fetch_feed("2024-01-01", "2024-01-01");
  auto again = service_->fetch_feed("2024-01-01", "2024-01-01");

  EXPECT_EQ(client_->calls.load(), 1);
  EXPECT_EQ(service_->get_processing_runs(), 1u);

  EXPECT_EQ(live->source, FetchStatus::LIVE);
  EXPECT_EQ(cached->source, FetchStatus::CACHED);
  EXPECT_EQ(cached->objects.size(), live->objects.size());
  EXPECT_EQ(again.get(), cached.get());
}

TEST_F(NeoFeedServiceTest, NewPayloadAfterExpiryIsScored) {
  service_->fetch_feed("2024-01-01", "2024-01-01");
  now_ += std::chrono::seconds(301);
  client_->enqueue(200, make_feed_body("2024-01-01", {"20"}));

  auto refreshed = service_->fetch_feed("2024-01-01", "2024-01-01");
  EXPECT_EQ(refreshed->source, FetchStatus::LIVE);
  ASSERT_EQ(refreshed->objects.size(), 1u);
  EXPECT_EQ(refreshed->objects[0].neo.id, "20");
  EXPECT_EQ(service_->get_processing_runs(), 2u);
}

TEST_F(NeoFeedServiceTest, StalePayloadIsRelabelledWithoutRescoring) {
  auto live = service_->fetch_feed("2024-01-01", "2024-01-01");
  now_ += std::chrono::seconds(301);
  client_->enqueue(429);

  auto stale = service_->fetch_feed("2024-01-01", "2024-01-01");
  EXPECT_EQ(stale->source, FetchStatus::STALE);
  EXPECT_TRUE(stale->is_real_data);
  EXPECT_EQ(stale->degraded_reason, UpstreamError::RATE_LIMITED);
  ASSERT_EQ(stale->objects.size(), live->objects.size());
  EXPECT_EQ(stale->objects[0].neo.id, live->objects[0].neo.id);
  EXPECT_EQ(service_->get_processing_runs(), 1u);

  // The live snapshot is not mutated
  EXPECT_EQ(live->source, FetchStatus::LIVE);
}

TEST_F(NeoFeedServiceTest, FallbackSnapshotIsFlaggedAsSampleData) {
  client_->enqueue(503);
  auto snapshot = service_->fetch_feed("2024-02-02", "2024-02-02");

  EXPECT_EQ(snapshot->source, FetchStatus::FALLBACK);
  EXPECT_FALSE(snapshot->is_real_data);
  EXPECT_EQ(snapshot->degraded_reason, UpstreamError::UNAVAILABLE);
  EXPECT_EQ(snapshot->objects.size(), 5u);
  EXPECT_EQ(snapshot->start_date, "2024-02-02");
}

TEST_F(NeoFeedServiceTest, UnavailableFeedPropagatesWithoutFallback) {
  make_service(false);
  client_->enqueue(0, "", "connection refused");

  EXPECT_THROW(service_->fetch_feed("2024-03-01", "2024-03-01"),
               FeedUnavailableError);
  EXPECT_EQ(service_->get_processing_runs(), 0u);
}

TEST_F(NeoFeedServiceTest, InvalidRangePropagates) {
  EXPECT_THROW(service_->fetch_feed("2024-01-05", "2024-01-01"),
               std::invalid_argument);
  EXPECT_THROW(service_->fetch_feed("not-a-date", "2024-01-01"),
               std::invalid_argument);
  EXPECT_EQ(client_->calls.load(), 0);
}

TEST_F(NeoFeedServiceTest, ScoreMatchesRiskScorer) {
  NearEarthObject neo;
  neo.is_hazardous = true;
  neo.diameter_km = 0.3;
  neo.miss_distance_km = 150000.0;
  neo.velocity_kph = 70000.0;

  auto assessment = service_->score(neo);
  EXPECT_DOUBLE_EQ(assessment.score, RiskScoring::risk_score(neo));
  EXPECT_EQ(assessment.threat_level,
            RiskScoring::threat_level_for(assessment.score));
}
