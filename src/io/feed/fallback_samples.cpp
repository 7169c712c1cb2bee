#include "io/feed/fallback_samples.hpp"

namespace FallbackSamples {

namespace {

struct Sample {
  const char *id;
  const char *name;
  bool is_hazardous;
  double diameter_km;
  double miss_distance_km;
  double velocity_kph;
};

constexpr Sample SAMPLES[] = {
    {"3542519", "(2010 PK9)", true, 0.284, 7230000.0, 67600.0},
    {"3726710", "(2015 RC)", false, 0.041, 15400000.0, 54200.0},
    {"2465633", "465633 (2009 JR5)", true, 1.2, 12500000.0, 58900.0},
    {"3752467", "(2016 CA30)", true, 0.048, 8900000.0, 61200.0},
    {"3550117", "(2010 VB)", false, 0.045, 53200000.0, 43849.0},
};

} // namespace

std::vector<NearEarthObject> sample_objects(const std::string &date) {
  std::vector<NearEarthObject> objects;
  objects.reserve(std::size(SAMPLES));
  for (const auto &sample : SAMPLES) {
    NearEarthObject neo;
    neo.id = sample.id;
    neo.name = sample.name;
    neo.is_hazardous = sample.is_hazardous;
    neo.diameter_km = sample.diameter_km;
    neo.miss_distance_km = sample.miss_distance_km;
    neo.velocity_kph = sample.velocity_kph;
    neo.close_approach_date = date;
    objects.push_back(std::move(neo));
  }
  return objects;
}

FeedPayload build_payload(const std::string &start_date,
                          const std::string &end_date) {
  FeedPayload payload;
  payload.start_date = start_date;
  payload.end_date = end_date;
  payload.objects = sample_objects(start_date);
  payload.element_count = payload.objects.size();
  return payload;
}

} // namespace FallbackSamples
