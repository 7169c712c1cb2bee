#include "utils/utils.hpp"
#include <gtest/gtest.h>

#include <chrono>

// --- Tests for parse_url ---
TEST(UtilsTest, ParseUrl) {
  auto https = Utils::parse_url("https://api.nasa.gov/neo/rest/v1");
  ASSERT_TRUE(https.has_value());
  EXPECT_TRUE(https->is_https);
  EXPECT_EQ(https->host, "api.nasa.gov");
  EXPECT_EQ(https->port, 443);
  EXPECT_EQ(https->path, "/neo/rest/v1");

  auto http = Utils::parse_url("http://localhost:8080");
  ASSERT_TRUE(http.has_value());
  EXPECT_FALSE(http->is_https);
  EXPECT_EQ(http->host, "localhost");
  EXPECT_EQ(http->port, 8080);
  EXPECT_EQ(http->path, "/");

  // Invalid URLs
  EXPECT_FALSE(Utils::parse_url("ftp://example.com").has_value());
  EXPECT_FALSE(Utils::parse_url("not a url").has_value());
  EXPECT_FALSE(Utils::parse_url("http://host:99999/").has_value());
  EXPECT_FALSE(Utils::parse_url("").has_value());
}

// --- Tests for parse_iso_date_to_days ---
TEST(UtilsTest, ParseIsoDate) {
  EXPECT_EQ(Utils::parse_iso_date_to_days("1970-01-01").value_or(-1), 0);
  EXPECT_EQ(Utils::parse_iso_date_to_days("1970-01-02").value_or(-1), 1);

  auto a = Utils::parse_iso_date_to_days("2024-02-28");
  auto b = Utils::parse_iso_date_to_days("2024-03-01");
  ASSERT_TRUE(a && b);
  EXPECT_EQ(*b - *a, 2); // leap year

  // Invalid inputs
  EXPECT_FALSE(Utils::parse_iso_date_to_days("2023-02-29").has_value());
  EXPECT_FALSE(Utils::parse_iso_date_to_days("2024-13-01").has_value());
  EXPECT_FALSE(Utils::parse_iso_date_to_days("2024-1-01").has_value());
  EXPECT_FALSE(Utils::parse_iso_date_to_days("24-01-01").has_value());
  EXPECT_FALSE(Utils::parse_iso_date_to_days("2024/01/01").has_value());
  EXPECT_FALSE(Utils::parse_iso_date_to_days("").has_value());
}

TEST(UtilsTest, FormatIsoDateAndTimestamp) {
  std::chrono::system_clock::time_point tp{std::chrono::seconds(1700000000)};
  EXPECT_EQ(Utils::format_iso_date(tp), "2023-11-14");
  EXPECT_EQ(Utils::format_iso_timestamp(tp), "2023-11-14T22:13:20Z");
}

TEST(UtilsTest, ParseIsoTimestamp) {
  auto tp = Utils::parse_iso_timestamp("2023-11-14T22:13:20Z");
  ASSERT_TRUE(tp.has_value());
  EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(
                tp->time_since_epoch())
                .count(),
            1700000000);

  EXPECT_FALSE(Utils::parse_iso_timestamp("2023-11-14 22:13:20").has_value());
  EXPECT_FALSE(Utils::parse_iso_timestamp("2023-11-14T25:13:20Z").has_value());
  EXPECT_FALSE(Utils::parse_iso_timestamp("2023-11-14").has_value());
}

TEST(UtilsTest, StringToNumber) {
  EXPECT_EQ(Utils::string_to_number<int>("42").value_or(0), 42);
  EXPECT_DOUBLE_EQ(*Utils::string_to_number<double>("12345.67"), 12345.67);
  EXPECT_FALSE(Utils::string_to_number<int>("42abc").has_value());
  EXPECT_FALSE(Utils::string_to_number<double>("abc").has_value());
  EXPECT_EQ(Utils::string_to_number<int>("-").value_or(-1), 0);
}

TEST(UtilsTest, TrimAndSplit) {
  EXPECT_EQ(Utils::trim_copy("  hello \t\n"), "hello");
  EXPECT_EQ(Utils::trim_copy("   "), "");

  auto parts = Utils::split_string("a,b,,c", ',');
  ASSERT_EQ(parts.size(), 4u);
  EXPECT_EQ(parts[0], "a");
  EXPECT_EQ(parts[2], "");
  EXPECT_EQ(parts[3], "c");
}
