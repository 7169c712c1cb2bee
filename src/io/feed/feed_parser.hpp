#ifndef FEED_PARSER_HPP
#define FEED_PARSER_HPP

#include "core/neo_types.hpp"
#include "nlohmann/json.hpp"

#include <optional>
#include <string>

namespace FeedParser {

// Parses an upstream feed document. Throws FeedFetchError(MALFORMED) when the
// body is not a JSON object with a "near_earth_objects" object. Individual
// entries that cannot be read are skipped and counted in malformed_entries.
FeedPayload parse_feed(const std::string &body, const std::string &start_date,
                       const std::string &end_date);

// Missing numbers become 0, a missing miss distance becomes +infinity and a
// missing hazard flag becomes false. Returns nullopt for entries without a
// usable id or that are not objects.
std::optional<NearEarthObject> parse_entry(const nlohmann::json &entry,
                                           const std::string &date_key);

// Accepts JSON numbers and numeric strings ("12345.67")
std::optional<double> read_number(const nlohmann::json &value);

} // namespace FeedParser

#endif // FEED_PARSER_HPP
