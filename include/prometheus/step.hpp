#pragma once

#include <cstdint>
#include <string>

#include "prometheus/query_model.hpp"

namespace sshprom {

// "<integer><unit>" with unit s, m, h or d, in seconds. Returns 0 when the
// string does not follow that grammar.
std::int64_t ParseInterval(const std::string &interval);

// Step in seconds for a range query: a positive explicit interval wins,
// otherwise floor(range / max_data_points), never below 1.
std::int64_t CalculateStep(const TimeRange &range, std::int64_t max_data_points,
                           const std::string &interval);

} // namespace sshprom
