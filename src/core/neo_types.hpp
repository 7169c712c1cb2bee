#ifndef NEO_TYPES_HPP
#define NEO_TYPES_HPP

#include "errors.hpp"

#include <array>
#include <cstddef>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class ThreatLevel { MINIMAL, LOW, MODERATE, HIGH, CRITICAL };

enum class SizeCategory { SMALL, MEDIUM, LARGE };

enum class DistanceCategory {
  EXTREMELY_CLOSE,
  VERY_CLOSE,
  CLOSE,
  NEARBY,
  DISTANT
};

// Where the objects of a fetch came from
enum class FetchStatus {
  LIVE,    // fetched from upstream by this request
  CACHED,  // served from a fresh cache entry
  STALE,   // upstream failed, an expired real payload was served
  FALLBACK // upstream failed and nothing was cached, static samples served
};

std::string threat_level_to_string(ThreatLevel level);
std::string size_category_to_string(SizeCategory category);
std::string distance_category_to_string(DistanceCategory category);
std::string fetch_status_to_string(FetchStatus status);

struct NearEarthObject {
  std::string id;
  std::string name;
  bool is_hazardous = false;
  double diameter_km = 0.0; // 0 when unknown
  double miss_distance_km = std::numeric_limits<double>::infinity();
  double velocity_kph = 0.0;
  std::string close_approach_date; // YYYY-MM-DD
};

struct RiskAssessment {
  double score = 0.0;
  ThreatLevel threat_level = ThreatLevel::MINIMAL;
  SizeCategory size_category = SizeCategory::SMALL;
  DistanceCategory distance_category = DistanceCategory::DISTANT;
};

struct ScoredObject {
  NearEarthObject neo;
  RiskAssessment risk;
};

// Parsed upstream response for one date range
struct FeedPayload {
  std::string start_date;
  std::string end_date;
  size_t element_count = 0;
  std::vector<NearEarthObject> objects;
  size_t malformed_entries = 0;
};

struct FeedStatistics {
  size_t total = 0;
  size_t hazardous_count = 0;
  double hazardous_percentage = 0.0;
  double average_risk = 0.0;
  double max_risk = 0.0;
  double min_risk = 0.0;
  std::array<size_t, 5> threat_level_counts{}; // indexed by ThreatLevel
  std::optional<ScoredObject> closest_approach;

  size_t count_for(ThreatLevel level) const {
    return threat_level_counts[static_cast<size_t>(level)];
  }
};

struct FeedSnapshot {
  std::string start_date;
  std::string end_date;
  std::vector<ScoredObject> objects;
  FeedStatistics statistics;

  bool is_real_data = true;
  FetchStatus source = FetchStatus::LIVE;
  std::optional<UpstreamError> degraded_reason;
  size_t malformed_entries = 0;
};

#endif // NEO_TYPES_HPP
