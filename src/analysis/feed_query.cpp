#include "analysis/feed_query.hpp"
#include "scoring/risk_scorer.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <stdexcept>
#include <string>

namespace FeedQuery {

bool matches(const ScoredObject &obj, const FeedFilter &filter) {
  if (filter.hazardous_only && !obj.neo.is_hazardous)
    return false;
  if (filter.min_diameter_km && obj.neo.diameter_km < *filter.min_diameter_km)
    return false;
  if (filter.max_distance_km &&
      !(std::isfinite(obj.neo.miss_distance_km) &&
        obj.neo.miss_distance_km <= *filter.max_distance_km))
    return false;
  if (filter.min_risk_score && obj.risk.score < *filter.min_risk_score)
    return false;
  if (filter.max_risk_score && obj.risk.score > *filter.max_risk_score)
    return false;
  return true;
}

std::vector<ScoredObject> filter(const FeedSnapshot &snapshot,
                                 const FeedFilter &filter) {
  std::vector<ScoredObject> result;
  std::copy_if(snapshot.objects.begin(), snapshot.objects.end(),
               std::back_inserter(result),
               [&](const ScoredObject &obj) { return matches(obj, filter); });
  return result;
}

void validate_page_request(const PageRequest &request) {
  if (request.page < 1)
    throw std::invalid_argument("Page must be >= 1");
  if (request.size < 1 || request.size > MAX_PAGE_SIZE)
    throw std::invalid_argument("Page size must be between 1 and " +
                                std::to_string(MAX_PAGE_SIZE));
}

std::vector<ScoredObject> search(const FeedSnapshot &snapshot,
                                 const std::string &query, size_t limit) {
  std::string needle = Utils::to_lower_copy(Utils::trim_copy(query));
  if (needle.empty())
    throw std::invalid_argument("Search query must not be empty");
  if (limit < 1 || limit > MAX_SEARCH_LIMIT)
    throw std::invalid_argument("Search limit must be between 1 and " +
                                std::to_string(MAX_SEARCH_LIMIT));

  std::vector<ScoredObject> result;
  for (const auto &obj : snapshot.objects) {
    if (Utils::to_lower_copy(obj.neo.name).find(needle) != std::string::npos ||
        Utils::to_lower_copy(obj.neo.id).find(needle) != std::string::npos) {
      result.push_back(obj);
      if (result.size() >= limit)
        break;
    }
  }
  return result;
}

std::vector<ScoredObject> top_hazardous(const FeedSnapshot &snapshot,
                                        size_t limit) {
  if (limit < 1 || limit > MAX_TOP_HAZARDOUS_LIMIT)
    throw std::invalid_argument("Top hazardous limit must be between 1 and " +
                                std::to_string(MAX_TOP_HAZARDOUS_LIMIT));

  FeedFilter hazardous;
  hazardous.hazardous_only = true;
  std::vector<ScoredObject> result = filter(snapshot, hazardous);

  std::stable_sort(result.begin(), result.end(),
                   [](const ScoredObject &a, const ScoredObject &b) {
                     return a.risk.score > b.risk.score;
                   });
  if (result.size() > limit)
    result.resize(limit);
  return result;
}

std::vector<CloseApproach> upcoming_close_approaches(const FeedSnapshot &snapshot,
                                                     double max_distance_ld,
                                                     bool hazardous_only) {
  std::vector<CloseApproach> result;
  for (const auto &obj : snapshot.objects) {
    if (hazardous_only && !obj.neo.is_hazardous)
      continue;
    if (!std::isfinite(obj.neo.miss_distance_km))
      continue;

    double ld = RiskScoring::to_lunar_distances(obj.neo.miss_distance_km);
    if (ld > max_distance_ld)
      continue;
    result.push_back(CloseApproach{obj, std::round(ld * 1000.0) / 1000.0});
  }

  std::stable_sort(result.begin(), result.end(),
                   [](const CloseApproach &a, const CloseApproach &b) {
                     return a.object.neo.miss_distance_km <
                            b.object.neo.miss_distance_km;
                   });
  return result;
}

} // namespace FeedQuery
