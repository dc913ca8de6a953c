#include "prometheus/step.hpp"

#include <algorithm>
#include <charconv>
#include <limits>

namespace sshprom {

namespace {
constexpr std::int64_t kDefaultMaxDataPoints = 1000;
}

std::int64_t ParseInterval(const std::string &interval) {
  if (interval.size() < 2) {
    return 0;
  }
  const char unit = interval.back();
  std::int64_t value = 0;
  const char *begin = interval.data();
  const char *end = interval.data() + interval.size() - 1;
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc{} || ptr != end || value < 0) {
    return 0;
  }
  std::int64_t unit_seconds = 0;
  switch (unit) {
  case 's':
    unit_seconds = 1;
    break;
  case 'm':
    unit_seconds = 60;
    break;
  case 'h':
    unit_seconds = 3600;
    break;
  case 'd':
    unit_seconds = 86400;
    break;
  default:
    return 0;
  }
  if (value > std::numeric_limits<std::int64_t>::max() / unit_seconds) {
    return 0;
  }
  return value * unit_seconds;
}

std::int64_t CalculateStep(const TimeRange &range, std::int64_t max_data_points,
                           const std::string &interval) {
  if (!interval.empty()) {
    if (auto parsed = ParseInterval(interval); parsed > 0) {
      return parsed;
    }
  }
  if (max_data_points <= 0) {
    max_data_points = kDefaultMaxDataPoints;
  }
  const std::int64_t range_seconds = range.to_seconds() - range.from_seconds();
  return std::max<std::int64_t>(1, range_seconds / max_data_points);
}

} // namespace sshprom
