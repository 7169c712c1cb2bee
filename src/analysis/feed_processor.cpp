#include "analysis/feed_processor.hpp"
#include "core/logger.hpp"
#include "scoring/risk_scorer.hpp"

#include <algorithm>

FeedSnapshot FeedProcessor::process(const FeedPayload &payload) const {
  FeedSnapshot snapshot;
  snapshot.start_date = payload.start_date;
  snapshot.end_date = payload.end_date;
  snapshot.objects = score_objects(payload.objects);
  snapshot.statistics = compute_statistics(snapshot.objects);
  snapshot.malformed_entries = payload.malformed_entries;

  LOG(LogLevel::DEBUG, LogComponent::PROCESSING,
      "Processed " << snapshot.statistics.total << " objects for "
                   << snapshot.start_date << ".." << snapshot.end_date
                   << " | Hazardous: " << snapshot.statistics.hazardous_count
                   << " | Avg risk: " << snapshot.statistics.average_risk);
  return snapshot;
}

std::vector<ScoredObject>
FeedProcessor::score_objects(const std::vector<NearEarthObject> &objects) {
  std::vector<ScoredObject> scored;
  scored.reserve(objects.size());
  for (const auto &neo : objects)
    scored.push_back(ScoredObject{neo, RiskScoring::score(neo)});
  return scored;
}

FeedStatistics
FeedProcessor::compute_statistics(const std::vector<ScoredObject> &objects) {
  FeedStatistics stats;
  stats.total = objects.size();
  if (objects.empty())
    return stats;

  double risk_sum = 0.0;
  stats.max_risk = objects.front().risk.score;
  stats.min_risk = objects.front().risk.score;
  const ScoredObject *closest = nullptr;

  for (const auto &obj : objects) {
    if (obj.neo.is_hazardous)
      stats.hazardous_count++;

    risk_sum += obj.risk.score;
    stats.max_risk = std::max(stats.max_risk, obj.risk.score);
    stats.min_risk = std::min(stats.min_risk, obj.risk.score);
    stats.threat_level_counts[static_cast<size_t>(obj.risk.threat_level)]++;

    // Strict comparison keeps the first of equal distances
    if (closest == nullptr ||
        obj.neo.miss_distance_km < closest->neo.miss_distance_km)
      closest = &obj;
  }

  stats.hazardous_percentage = static_cast<double>(stats.hazardous_count) /
                               static_cast<double>(stats.total) * 100.0;
  stats.average_risk = risk_sum / static_cast<double>(stats.total);
  stats.closest_approach = *closest;
  return stats;
}
