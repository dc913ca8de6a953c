#pragma once

#include <boost/json.hpp>

#include <cmath>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sshprom {

using Labels = std::map<std::string, std::string>;

// Epoch milliseconds, inclusive on both ends.
struct TimeRange {
  std::int64_t from_ms{0};
  std::int64_t to_ms{0};

  std::int64_t from_seconds() const { return FloorSeconds(from_ms); }
  std::int64_t to_seconds() const { return FloorSeconds(to_ms); }

private:
  static std::int64_t FloorSeconds(std::int64_t ms) {
    return ms >= 0 ? ms / 1000 : -((-ms + 999) / 1000);
  }
};

struct QuerySpec {
  std::string ref_id;
  std::string expr;
  std::string legend_format;
  bool instant{false};
  bool range{true};
  // "<integer><s|m|h|d>"; empty or unparseable falls back to max_data_points.
  std::string interval;
  TimeRange time_range;
  std::int64_t max_data_points{1000};

  bool is_range_query() const { return range && !instant; }
};

struct Sample {
  std::int64_t timestamp_ms{0};
  double value{0};
};

struct SeriesFrame {
  std::string ref_id;
  std::string name;
  Labels labels;
  std::vector<Sample> samples;

  // {"refId", "name", "labels", "samples": [[ts_ms, value], ...]}. Non-finite
  // values are emitted as their Prometheus spelling ("NaN", "+Inf", "-Inf").
  friend void tag_invoke(const boost::json::value_from_tag &,
                         boost::json::value &jv, const SeriesFrame &frame) {
    boost::json::object labels;
    for (const auto &[k, v] : frame.labels) {
      labels[k] = v;
    }
    boost::json::array samples;
    samples.reserve(frame.samples.size());
    for (const auto &s : frame.samples) {
      boost::json::value value;
      if (std::isnan(s.value)) {
        value = "NaN";
      } else if (std::isinf(s.value)) {
        value = s.value > 0 ? "+Inf" : "-Inf";
      } else {
        value = s.value;
      }
      samples.push_back(boost::json::array{s.timestamp_ms, value});
    }
    jv = boost::json::object{{"refId", frame.ref_id},
                             {"name", frame.name},
                             {"labels", std::move(labels)},
                             {"samples", std::move(samples)}};
  }
};

// One "vector" result entry: labels plus a single [ts, "value"] pair.
struct VectorEntry {
  Labels metric;
  std::optional<Sample> value;
};

// One "matrix" result entry: labels plus [[ts, "value"], ...].
struct MatrixEntry {
  Labels metric;
  std::vector<Sample> values;
};

// The /api/v1/query and /api/v1/query_range reply envelope. result holds the
// entries decoded according to result_type; other result types decode to
// std::monostate.
struct PrometheusResponse {
  std::string status;
  std::string error_type;
  std::string error;
  std::string result_type;
  std::variant<std::monostate, std::vector<VectorEntry>,
               std::vector<MatrixEntry>>
      result;

  bool success() const { return status == "success"; }
};

} // namespace sshprom
