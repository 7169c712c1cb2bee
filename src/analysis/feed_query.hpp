#ifndef FEED_QUERY_HPP
#define FEED_QUERY_HPP

#include "core/neo_types.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace FeedQuery {

constexpr size_t MAX_PAGE_SIZE = 100;
constexpr size_t MAX_SEARCH_LIMIT = 100;
constexpr size_t MAX_TOP_HAZARDOUS_LIMIT = 50;

struct FeedFilter {
  bool hazardous_only = false;
  std::optional<double> min_diameter_km;
  std::optional<double> max_distance_km;
  std::optional<double> min_risk_score;
  std::optional<double> max_risk_score;
};

struct PageRequest {
  size_t page = 1; // 1-based
  size_t size = 20;
};

template <typename T> struct Page {
  std::vector<T> items;
  size_t total = 0;
  size_t page = 1;
  size_t size = 0;
  size_t total_pages = 0;
  bool has_next = false;
  bool has_previous = false;
};

struct CloseApproach {
  ScoredObject object;
  double distance_ld = 0.0; // rounded to three decimals
};

bool matches(const ScoredObject &obj, const FeedFilter &filter);

std::vector<ScoredObject> filter(const FeedSnapshot &snapshot,
                                 const FeedFilter &filter);

// Throws std::invalid_argument unless page >= 1 and 1 <= size <= 100
void validate_page_request(const PageRequest &request);

template <typename T>
Page<T> paginate(const std::vector<T> &items, const PageRequest &request) {
  validate_page_request(request);

  Page<T> page;
  page.total = items.size();
  page.page = request.page;
  page.size = request.size;
  page.total_pages = (items.size() + request.size - 1) / request.size;
  page.has_previous = request.page > 1;
  page.has_next = request.page < page.total_pages;

  // Checked before multiplying so a huge page number cannot wrap the offset
  if (request.page > page.total_pages)
    return page;

  size_t begin = (request.page - 1) * request.size;
  size_t end = std::min(items.size(), begin + request.size);
  page.items.assign(items.begin() + begin, items.begin() + end);
  return page;
}

// Case-insensitive substring match on name or id, first `limit` matches in
// snapshot order. Throws std::invalid_argument for a blank query or a limit
// outside 1..100.
std::vector<ScoredObject> search(const FeedSnapshot &snapshot,
                                 const std::string &query, size_t limit = 20);

// Hazardous objects by descending risk score, equal scores in snapshot order.
// Throws std::invalid_argument for a limit outside 1..50.
std::vector<ScoredObject> top_hazardous(const FeedSnapshot &snapshot,
                                        size_t limit = 10);

// Objects at or within max_distance_ld, closest first
std::vector<CloseApproach> upcoming_close_approaches(const FeedSnapshot &snapshot,
                                                     double max_distance_ld,
                                                     bool hazardous_only);

} // namespace FeedQuery

#endif // FEED_QUERY_HPP
