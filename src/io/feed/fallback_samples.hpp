#ifndef FALLBACK_SAMPLES_HPP
#define FALLBACK_SAMPLES_HPP

#include "core/neo_types.hpp"

#include <string>
#include <vector>

namespace FallbackSamples {

// Static objects served when upstream fails and nothing is cached. The close
// approach date of every sample is set to `date`.
std::vector<NearEarthObject> sample_objects(const std::string &date);

FeedPayload build_payload(const std::string &start_date,
                          const std::string &end_date);

} // namespace FallbackSamples

#endif // FALLBACK_SAMPLES_HPP
