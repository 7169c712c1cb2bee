#include "json_formatter.hpp"
#include "scoring/risk_scorer.hpp"

#include <cmath>

namespace {

nlohmann::json distance_or_null(double km) {
  if (!std::isfinite(km))
    return nullptr;
  return km;
}

} // namespace

nlohmann::json JsonFormatter::neo_to_json_object(const NearEarthObject &neo) {
  nlohmann::json j;
  j["id"] = neo.id;
  j["name"] = neo.name;
  j["is_hazardous"] = neo.is_hazardous;
  j["diameter_km"] = neo.diameter_km;
  j["miss_distance_km"] = distance_or_null(neo.miss_distance_km);
  j["miss_distance_ld"] = std::isfinite(neo.miss_distance_km)
                              ? nlohmann::json(RiskScoring::to_lunar_distances(
                                    neo.miss_distance_km))
                              : nlohmann::json(nullptr);
  j["velocity_kph"] = neo.velocity_kph;
  j["close_approach_date"] = neo.close_approach_date;
  return j;
}

nlohmann::json JsonFormatter::risk_to_json_object(const RiskAssessment &risk) {
  return {{"score", risk.score},
          {"threat_level", threat_level_to_string(risk.threat_level)},
          {"size_category", size_category_to_string(risk.size_category)},
          {"distance_category",
           distance_category_to_string(risk.distance_category)}};
}

nlohmann::json
JsonFormatter::scored_object_to_json_object(const ScoredObject &obj) {
  nlohmann::json j = neo_to_json_object(obj.neo);
  j["risk"] = risk_to_json_object(obj.risk);
  return j;
}

nlohmann::json
JsonFormatter::statistics_to_json_object(const FeedStatistics &stats) {
  nlohmann::json j;
  j["total"] = stats.total;
  j["hazardous_count"] = stats.hazardous_count;
  j["hazardous_percentage"] = stats.hazardous_percentage;
  j["average_risk"] = stats.average_risk;
  j["max_risk"] = stats.max_risk;
  j["min_risk"] = stats.min_risk;

  nlohmann::json levels = nlohmann::json::object();
  for (ThreatLevel level :
       {ThreatLevel::MINIMAL, ThreatLevel::LOW, ThreatLevel::MODERATE,
        ThreatLevel::HIGH, ThreatLevel::CRITICAL})
    levels[threat_level_to_string(level)] = stats.count_for(level);
  j["threat_levels"] = levels;

  if (stats.closest_approach)
    j["closest_approach"] =
        scored_object_to_json_object(*stats.closest_approach);
  else
    j["closest_approach"] = nullptr;
  return j;
}

nlohmann::json
JsonFormatter::snapshot_to_json_object(const FeedSnapshot &snapshot) {
  nlohmann::json j;
  j["start_date"] = snapshot.start_date;
  j["end_date"] = snapshot.end_date;
  j["is_real_data"] = snapshot.is_real_data;
  j["source"] = fetch_status_to_string(snapshot.source);
  if (snapshot.degraded_reason)
    j["degraded_reason"] = upstream_error_to_string(*snapshot.degraded_reason);
  else
    j["degraded_reason"] = nullptr;
  j["malformed_entries"] = snapshot.malformed_entries;
  j["statistics"] = statistics_to_json_object(snapshot.statistics);

  nlohmann::json objects = nlohmann::json::array();
  for (const auto &obj : snapshot.objects)
    objects.push_back(scored_object_to_json_object(obj));
  j["objects"] = std::move(objects);
  return j;
}

nlohmann::json JsonFormatter::close_approaches_to_json_object(
    const std::vector<FeedQuery::CloseApproach> &items) {
  nlohmann::json j = nlohmann::json::array();
  for (const auto &item : items) {
    nlohmann::json entry = scored_object_to_json_object(item.object);
    entry["distance_ld"] = item.distance_ld;
    j.push_back(std::move(entry));
  }
  return j;
}

nlohmann::json
JsonFormatter::page_to_json_object(const FeedQuery::Page<ScoredObject> &page) {
  nlohmann::json items = nlohmann::json::array();
  for (const auto &obj : page.items)
    items.push_back(scored_object_to_json_object(obj));

  return {{"items", std::move(items)},
          {"total", page.total},
          {"page", page.page},
          {"size", page.size},
          {"total_pages", page.total_pages},
          {"has_next", page.has_next},
          {"has_previous", page.has_previous}};
}

nlohmann::json JsonFormatter::notification_to_json_object(
    const std::string &user_id, const std::string &subject,
    const std::string &body, uint64_t timestamp_ms) {
  return {{"timestamp_ms", timestamp_ms},
          {"user_id", user_id},
          {"subject", subject},
          {"body", body}};
}

std::string JsonFormatter::format_snapshot_to_json(const FeedSnapshot &snapshot,
                                                   int indent) {
  return snapshot_to_json_object(snapshot).dump(indent);
}

std::string JsonFormatter::format_notification_to_json(
    const std::string &user_id, const std::string &subject,
    const std::string &body, uint64_t timestamp_ms) {
  return notification_to_json_object(user_id, subject, body, timestamp_ms)
      .dump();
}
