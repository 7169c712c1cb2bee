#include "neo_types.hpp"

#include <string>

std::string threat_level_to_string(ThreatLevel level) {
  switch (level) {
  case ThreatLevel::MINIMAL:
    return "MINIMAL";
  case ThreatLevel::LOW:
    return "LOW";
  case ThreatLevel::MODERATE:
    return "MODERATE";
  case ThreatLevel::HIGH:
    return "HIGH";
  case ThreatLevel::CRITICAL:
    return "CRITICAL";
  default:
    return "UNKNOWN";
  }
}

std::string size_category_to_string(SizeCategory category) {
  switch (category) {
  case SizeCategory::SMALL:
    return "SMALL";
  case SizeCategory::MEDIUM:
    return "MEDIUM";
  case SizeCategory::LARGE:
    return "LARGE";
  default:
    return "UNKNOWN";
  }
}

std::string distance_category_to_string(DistanceCategory category) {
  switch (category) {
  case DistanceCategory::EXTREMELY_CLOSE:
    return "EXTREMELY_CLOSE";
  case DistanceCategory::VERY_CLOSE:
    return "VERY_CLOSE";
  case DistanceCategory::CLOSE:
    return "CLOSE";
  case DistanceCategory::NEARBY:
    return "NEARBY";
  case DistanceCategory::DISTANT:
    return "DISTANT";
  default:
    return "UNKNOWN";
  }
}

std::string fetch_status_to_string(FetchStatus status) {
  switch (status) {
  case FetchStatus::LIVE:
    return "live";
  case FetchStatus::CACHED:
    return "cached";
  case FetchStatus::STALE:
    return "stale";
  case FetchStatus::FALLBACK:
    return "fallback";
  default:
    return "unknown";
  }
}
