#ifndef RISK_SCORER_HPP
#define RISK_SCORER_HPP

#include "core/neo_types.hpp"

namespace RiskScoring {

constexpr double LUNAR_DISTANCE_KM = 384400.0;

namespace Weights {
constexpr double HAZARDOUS = 35.0;
constexpr double MAX_SIZE = 30.0;

// Distance term by lunar-distance band
constexpr double DISTANCE_LD_0_05 = 25.0;
constexpr double DISTANCE_LD_0_1 = 20.0;
constexpr double DISTANCE_LD_0_5 = 15.0;
constexpr double DISTANCE_LD_1 = 10.0;
constexpr double DISTANCE_LD_5 = 5.0;

// Velocity term by km/h band
constexpr double VELOCITY_ABOVE_80K = 10.0;
constexpr double VELOCITY_ABOVE_60K = 7.0;
constexpr double VELOCITY_ABOVE_40K = 4.0;
constexpr double VELOCITY_BASE = 2.0;
} // namespace Weights

namespace Bands {
constexpr double LOW = 10.0;
constexpr double MODERATE = 30.0;
constexpr double HIGH = 50.0;
constexpr double CRITICAL = 70.0;
} // namespace Bands

double hazard_term(bool is_hazardous);
double size_term(double diameter_km);
double distance_term(double miss_distance_km);
double velocity_term(double velocity_kph);

double to_lunar_distances(double miss_distance_km);

ThreatLevel threat_level_for(double score);
SizeCategory size_category_for(double diameter_km);
DistanceCategory distance_category_for(double miss_distance_km);

// Sum of the four terms, clamped to [0, 100] and rounded to one decimal
double risk_score(const NearEarthObject &neo);

RiskAssessment score(const NearEarthObject &neo);

} // namespace RiskScoring

#endif // RISK_SCORER_HPP
