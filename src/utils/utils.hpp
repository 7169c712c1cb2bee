#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace Utils {
std::vector<std::string> split_string(const std::string &text, char delimiter);
uint64_t get_current_time_ms();
void create_directory_for_file(const std::string &file_path);

struct ParsedUrl {
  bool is_https = false;
  std::string host;
  int port = 0;
  std::string path; // never empty, "/" when the URL has no path
};

std::optional<ParsedUrl> parse_url(std::string_view url);

// Calendar dates are ISO "YYYY-MM-DD" in UTC. Days are counted from the Unix
// epoch so ranges can be compared and measured directly.
std::optional<int64_t> parse_iso_date_to_days(std::string_view date_str);
std::string format_iso_date(std::chrono::system_clock::time_point tp);
std::string format_iso_timestamp(std::chrono::system_clock::time_point tp);
std::optional<std::chrono::system_clock::time_point>
parse_iso_timestamp(std::string_view timestamp_str);

template <typename T> std::optional<T> string_to_number(std::string_view s) {
  if (s.empty() || s == "-") {
    if constexpr (std::is_floating_point_v<T>)
      return static_cast<T>(0.0);
    if constexpr (std::is_integral_v<T>)
      return static_cast<T>(0);
    return std::nullopt;
  }

  T value;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);

  if (ec == std::errc() && ptr == s.data() + s.size())
    return value;
  return std::nullopt;
}

inline void ltrim_inplace(std::string &s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
            return !std::isspace(ch);
          }));
}

inline void rtrim_inplace(std::string &s) {
  s.erase(std::find_if(s.rbegin(), s.rend(),
                       [](unsigned char ch) { return !std::isspace(ch); })
              .base(),
          s.end());
}

inline void trim_inplace(std::string &s) {
  ltrim_inplace(s);
  rtrim_inplace(s);
}

inline std::string trim_copy(std::string_view sv) {
  std::string s{sv};
  trim_inplace(s);
  return s;
}

inline std::string to_lower_copy(std::string_view sv) {
  std::string s{sv};
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char ch) { return std::tolower(ch); });
  return s;
}
} // namespace Utils

#endif // UTILS_HPP
