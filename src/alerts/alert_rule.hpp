#ifndef ALERT_RULE_HPP
#define ALERT_RULE_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

// A user's watch on one asteroid. Fires when the object comes within
// threshold_distance_km or scores at least threshold_risk_score.
struct AlertRule {
  uint64_t id = 0;
  std::string user_id;
  std::string asteroid_id;
  std::string name;
  double threshold_distance_km = 0.0;
  double threshold_risk_score = 100.0; // 0-100
  bool is_active = true;
  std::optional<std::chrono::system_clock::time_point> last_triggered_at;
};

#endif // ALERT_RULE_HPP
