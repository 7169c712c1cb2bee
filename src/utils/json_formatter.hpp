#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "analysis/feed_query.hpp"
#include "core/neo_types.hpp"
#include "nlohmann/json.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace JsonFormatter {

// Unknown miss distances are rendered as null
nlohmann::json neo_to_json_object(const NearEarthObject &neo);
nlohmann::json risk_to_json_object(const RiskAssessment &risk);
nlohmann::json scored_object_to_json_object(const ScoredObject &obj);
nlohmann::json statistics_to_json_object(const FeedStatistics &stats);
nlohmann::json snapshot_to_json_object(const FeedSnapshot &snapshot);
nlohmann::json
close_approaches_to_json_object(const std::vector<FeedQuery::CloseApproach> &items);
nlohmann::json page_to_json_object(const FeedQuery::Page<ScoredObject> &page);

nlohmann::json notification_to_json_object(const std::string &user_id,
                                           const std::string &subject,
                                           const std::string &body,
                                           uint64_t timestamp_ms);

std::string format_snapshot_to_json(const FeedSnapshot &snapshot,
                                    int indent = -1);
std::string format_notification_to_json(const std::string &user_id,
                                        const std::string &subject,
                                        const std::string &body,
                                        uint64_t timestamp_ms);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP
