#include "utils.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace Utils {

std::vector<std::string> split_string(const std::string &text, char delimiter) {
  std::vector<std::string> tokens;
  std::string current_token;
  std::istringstream token_stream(text);

  while (std::getline(token_stream, current_token, delimiter)) {
    tokens.push_back(current_token);
  }
  return tokens;
}

uint64_t get_current_time_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

void create_directory_for_file(const std::string &file_path) {
  std::filesystem::path parent = std::filesystem::path(file_path).parent_path();
  if (parent.empty())
    return;
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
}

std::optional<ParsedUrl> parse_url(std::string_view url) {
  // Group 1: scheme, Group 2: host, Group 3: optional port, Group 4: path
  static const std::regex url_regex(
      R"(^(https?):\/\/([^\/:]+)(?::(\d{1,5}))?(\/.*)?$)");
  std::string url_str(url);
  std::smatch match;
  if (!std::regex_match(url_str, match, url_regex))
    return std::nullopt;

  ParsedUrl parsed;
  parsed.is_https = (match[1].str() == "https");
  parsed.host = match[2].str();
  parsed.port = parsed.is_https ? 443 : 80;
  if (match[3].matched) {
    auto port = string_to_number<int>(match[3].str());
    if (!port || *port < 1 || *port > 65535)
      return std::nullopt;
    parsed.port = *port;
  }
  parsed.path = match[4].matched ? match[4].str() : "/";
  return parsed;
}

std::optional<int64_t> parse_iso_date_to_days(std::string_view date_str) {
  // Expected format: 2025-05-23
  if (date_str.size() != 10 || date_str[4] != '-' || date_str[7] != '-')
    return std::nullopt;

  auto year = string_to_number<int>(date_str.substr(0, 4));
  auto month = string_to_number<int>(date_str.substr(5, 2));
  auto day = string_to_number<int>(date_str.substr(8, 2));
  if (!year || !month || !day || *month < 1 || *month > 12 || *day < 1 ||
      *day > 31)
    return std::nullopt;

  std::tm t{};
  t.tm_year = *year - 1900;
  t.tm_mon = *month - 1;
  t.tm_mday = *day;

  // timegm normalises out-of-range days (e.g. Feb 30 -> Mar 2), so a round
  // trip catches dates that do not exist
  time_t epoch_seconds = timegm(&t);
  std::tm check{};
  gmtime_r(&epoch_seconds, &check);
  if (check.tm_year != *year - 1900 || check.tm_mon != *month - 1 ||
      check.tm_mday != *day)
    return std::nullopt;

  return static_cast<int64_t>(epoch_seconds) / 86400;
}

std::string format_iso_date(std::chrono::system_clock::time_point tp) {
  time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_utc{};
  gmtime_r(&t, &tm_utc);
  char buffer[16];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &tm_utc);
  return buffer;
}

std::string format_iso_timestamp(std::chrono::system_clock::time_point tp) {
  time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_utc{};
  gmtime_r(&t, &tm_utc);
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
  return buffer;
}

std::optional<std::chrono::system_clock::time_point>
parse_iso_timestamp(std::string_view timestamp_str) {
  // Expected format: 2025-05-23T08:30:00Z
  if (timestamp_str.size() != 20 || timestamp_str[10] != 'T' ||
      timestamp_str[13] != ':' || timestamp_str[16] != ':' ||
      timestamp_str[19] != 'Z')
    return std::nullopt;

  auto days = parse_iso_date_to_days(timestamp_str.substr(0, 10));
  auto hour = string_to_number<int>(timestamp_str.substr(11, 2));
  auto minute = string_to_number<int>(timestamp_str.substr(14, 2));
  auto second = string_to_number<int>(timestamp_str.substr(17, 2));
  if (!days || !hour || !minute || !second || *hour > 23 || *minute > 59 ||
      *second > 59)
    return std::nullopt;

  int64_t epoch_seconds =
      *days * 86400 + *hour * 3600 + *minute * 60 + *second;
  return std::chrono::system_clock::time_point(
      std::chrono::seconds(epoch_seconds));
}

} // namespace Utils
