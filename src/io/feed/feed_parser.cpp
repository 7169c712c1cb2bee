#include "io/feed/feed_parser.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <cmath>
#include <limits>
#include <string>

namespace {

// Returns the member if `parent` is an object containing `key`
const nlohmann::json *child(const nlohmann::json *parent, const char *key) {
  if (parent == nullptr || !parent->is_object())
    return nullptr;
  auto it = parent->find(key);
  if (it == parent->end())
    return nullptr;
  return &(*it);
}

double non_negative_or(std::optional<double> value, double fallback) {
  if (!value || !std::isfinite(*value) || *value < 0.0)
    return fallback;
  return *value;
}

} // namespace

namespace FeedParser {

std::optional<double> read_number(const nlohmann::json &value) {
  if (value.is_number())
    return value.get<double>();

  if (value.is_string()) {
    std::string text = Utils::trim_copy(value.get<std::string>());
    if (text.empty())
      return std::nullopt;
    return Utils::string_to_number<double>(text);
  }
  return std::nullopt;
}

std::optional<NearEarthObject> parse_entry(const nlohmann::json &entry,
                                           const std::string &date_key) {
  if (!entry.is_object())
    return std::nullopt;

  NearEarthObject neo;

  const nlohmann::json *id = child(&entry, "id");
  if (id == nullptr)
    return std::nullopt;
  if (id->is_string())
    neo.id = id->get<std::string>();
  else if (id->is_number_integer())
    neo.id = std::to_string(id->get<int64_t>());
  if (neo.id.empty())
    return std::nullopt;

  const nlohmann::json *name = child(&entry, "name");
  neo.name = (name && name->is_string()) ? name->get<std::string>() : neo.id;

  const nlohmann::json *hazardous =
      child(&entry, "is_potentially_hazardous_asteroid");
  neo.is_hazardous = hazardous && hazardous->is_boolean() && hazardous->get<bool>();

  const nlohmann::json *diameter = child(
      child(child(&entry, "estimated_diameter"), "kilometers"),
      "estimated_diameter_max");
  neo.diameter_km =
      non_negative_or(diameter ? read_number(*diameter) : std::nullopt, 0.0);

  neo.close_approach_date = date_key;

  const nlohmann::json *approaches = child(&entry, "close_approach_data");
  if (approaches && approaches->is_array() && !approaches->empty() &&
      approaches->front().is_object()) {
    const nlohmann::json *approach = &approaches->front();

    const nlohmann::json *miss =
        child(child(approach, "miss_distance"), "kilometers");
    neo.miss_distance_km =
        non_negative_or(miss ? read_number(*miss) : std::nullopt,
                        std::numeric_limits<double>::infinity());

    const nlohmann::json *velocity =
        child(child(approach, "relative_velocity"), "kilometers_per_hour");
    neo.velocity_kph = non_negative_or(
        velocity ? read_number(*velocity) : std::nullopt, 0.0);

    const nlohmann::json *date = child(approach, "close_approach_date");
    if (date && date->is_string() &&
        Utils::parse_iso_date_to_days(date->get<std::string>()))
      neo.close_approach_date = date->get<std::string>();
  }

  return neo;
}

FeedPayload parse_feed(const std::string &body, const std::string &start_date,
                       const std::string &end_date) {
  nlohmann::json doc = nlohmann::json::parse(body, nullptr, false);
  if (doc.is_discarded() || !doc.is_object())
    throw FeedFetchError(UpstreamError::MALFORMED, 200,
                         "Feed body is not a JSON object");

  const nlohmann::json *neos = child(&doc, "near_earth_objects");
  if (neos == nullptr || !neos->is_object())
    throw FeedFetchError(UpstreamError::MALFORMED, 200,
                         "Feed body has no near_earth_objects object");

  FeedPayload payload;
  payload.start_date = start_date;
  payload.end_date = end_date;

  // Object keys iterate in sorted order, i.e. by ascending date
  for (const auto &day : neos->items()) {
    if (!day.value().is_array()) {
      payload.malformed_entries++;
      LOG(LogLevel::WARN, LogComponent::IO_FEED,
          "Skipping non-array feed entry list for date " << day.key());
      continue;
    }

    for (const auto &entry : day.value()) {
      try {
        auto neo = parse_entry(entry, day.key());
        if (neo) {
          payload.objects.push_back(std::move(*neo));
        } else {
          payload.malformed_entries++;
          LOG(LogLevel::WARN, LogComponent::IO_FEED,
              "Skipping malformed feed entry on " << day.key());
        }
      } catch (const nlohmann::json::exception &e) {
        payload.malformed_entries++;
        LOG(LogLevel::WARN, LogComponent::IO_FEED,
            "Skipping unreadable feed entry on " << day.key() << ": "
                                                 << e.what());
      }
    }
  }

  const nlohmann::json *count = child(&doc, "element_count");
  if (count && count->is_number_unsigned())
    payload.element_count = count->get<size_t>();
  else
    payload.element_count = payload.objects.size();

  LOG(LogLevel::DEBUG, LogComponent::IO_FEED,
      "Parsed " << payload.objects.size() << " objects for " << start_date
                << ".." << end_date << " (" << payload.malformed_entries
                << " malformed entries skipped)");
  return payload;
}

} // namespace FeedParser
