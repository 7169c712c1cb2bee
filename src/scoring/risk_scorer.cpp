#include "risk_scorer.hpp"

#include <algorithm>
#include <cmath>

namespace RiskScoring {

double hazard_term(bool is_hazardous) {
  return is_hazardous ? Weights::HAZARDOUS : 0.0;
}

double size_term(double diameter_km) {
  if (!(diameter_km > 0.0))
    return 0.0;

  // Objects under one metre would give a negative logarithm
  double term = 10.0 * std::log10(diameter_km * 1000.0);
  return std::clamp(term, 0.0, Weights::MAX_SIZE);
}

double to_lunar_distances(double miss_distance_km) {
  return miss_distance_km / LUNAR_DISTANCE_KM;
}

double distance_term(double miss_distance_km) {
  if (!std::isfinite(miss_distance_km))
    return 0.0;

  double ld = to_lunar_distances(miss_distance_km);
  if (ld <= 0.05)
    return Weights::DISTANCE_LD_0_05;
  if (ld <= 0.1)
    return Weights::DISTANCE_LD_0_1;
  if (ld <= 0.5)
    return Weights::DISTANCE_LD_0_5;
  if (ld <= 1.0)
    return Weights::DISTANCE_LD_1;
  if (ld <= 5.0)
    return Weights::DISTANCE_LD_5;
  return 0.0;
}

double velocity_term(double velocity_kph) {
  if (velocity_kph > 80000.0)
    return Weights::VELOCITY_ABOVE_80K;
  if (velocity_kph > 60000.0)
    return Weights::VELOCITY_ABOVE_60K;
  if (velocity_kph > 40000.0)
    return Weights::VELOCITY_ABOVE_40K;
  return Weights::VELOCITY_BASE;
}

ThreatLevel threat_level_for(double score) {
  if (score >= Bands::CRITICAL)
    return ThreatLevel::CRITICAL;
  if (score >= Bands::HIGH)
    return ThreatLevel::HIGH;
  if (score >= Bands::MODERATE)
    return ThreatLevel::MODERATE;
  if (score >= Bands::LOW)
    return ThreatLevel::LOW;
  return ThreatLevel::MINIMAL;
}

SizeCategory size_category_for(double diameter_km) {
  if (diameter_km >= 1.0)
    return SizeCategory::LARGE;
  if (diameter_km >= 0.1)
    return SizeCategory::MEDIUM;
  return SizeCategory::SMALL;
}

DistanceCategory distance_category_for(double miss_distance_km) {
  double ld = to_lunar_distances(miss_distance_km);
  if (ld <= 0.1)
    return DistanceCategory::EXTREMELY_CLOSE;
  if (ld <= 0.5)
    return DistanceCategory::VERY_CLOSE;
  if (ld <= 1.0)
    return DistanceCategory::CLOSE;
  if (ld <= 5.0)
    return DistanceCategory::NEARBY;
  return DistanceCategory::DISTANT;
}

double risk_score(const NearEarthObject &neo) {
  double total = hazard_term(neo.is_hazardous) + size_term(neo.diameter_km) +
                 distance_term(neo.miss_distance_km) +
                 velocity_term(neo.velocity_kph);

  total = std::clamp(total, 0.0, 100.0);
  return std::round(total * 10.0) / 10.0;
}

RiskAssessment score(const NearEarthObject &neo) {
  RiskAssessment assessment;
  assessment.score = risk_score(neo);
  assessment.threat_level = threat_level_for(assessment.score);
  assessment.size_category = size_category_for(neo.diameter_km);
  assessment.distance_category = distance_category_for(neo.miss_distance_km);
  return assessment;
}

} // namespace RiskScoring
