#ifndef FEED_PROCESSOR_HPP
#define FEED_PROCESSOR_HPP

#include "core/neo_types.hpp"

#include <vector>

// Turns a parsed payload into scored objects plus aggregate statistics.
// Output order matches the payload order. No I/O.
class FeedProcessor {
public:
  FeedSnapshot process(const FeedPayload &payload) const;

  static std::vector<ScoredObject>
  score_objects(const std::vector<NearEarthObject> &objects);
  static FeedStatistics
  compute_statistics(const std::vector<ScoredObject> &objects);
};

#endif // FEED_PROCESSOR_HPP
