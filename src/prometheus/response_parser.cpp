#include "prometheus/response_parser.hpp"

#include <boost/json.hpp>
#include <fmt/format.h>

#include <cmath>
#include <cstdlib>
#include <optional>

#include "prometheus/legend.hpp"
#include "proxy_error.hpp"

namespace sshprom {
namespace json = boost::json;

namespace {

std::optional<double> NumberOf(const json::value &v) {
  switch (v.kind()) {
  case json::kind::int64:
    return static_cast<double>(v.get_int64());
  case json::kind::uint64:
    return static_cast<double>(v.get_uint64());
  case json::kind::double_:
    return v.get_double();
  default:
    return std::nullopt;
  }
}

// "1.5", "NaN", "+Inf", "-Inf" all go through strtod.
std::optional<double> ParseSampleValue(const json::string &text) {
  if (text.empty()) {
    return std::nullopt;
  }
  std::string s(text.data(), text.size());
  char *end = nullptr;
  const double value = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size()) {
    return std::nullopt;
  }
  return value;
}

// [<unix seconds>, "<value>"]
std::optional<Sample> ParseSample(const json::value &v) {
  const auto *pair = v.if_array();
  if (!pair || pair->size() != 2) {
    return std::nullopt;
  }
  auto ts = NumberOf((*pair)[0]);
  const auto *text = (*pair)[1].if_string();
  if (!ts || !text) {
    return std::nullopt;
  }
  auto value = ParseSampleValue(*text);
  if (!value) {
    return std::nullopt;
  }
  return Sample{static_cast<std::int64_t>(std::llround(*ts * 1000.0)), *value};
}

Labels ParseLabels(const json::object &entry) {
  Labels labels;
  if (const auto *metric = entry.if_contains("metric")) {
    if (const auto *obj = metric->if_object()) {
      for (const auto &kv : *obj) {
        if (const auto *s = kv.value().if_string()) {
          labels.emplace(std::string(kv.key()), std::string(s->c_str()));
        }
      }
    }
  }
  return labels;
}

json::object ParseEnvelope(std::string_view body) {
  json::error_code ec;
  json::value jv =
      json::parse(json::string_view(body.data(), body.size()), ec);
  if (ec) {
    throw ParseError(
        fmt::format("invalid JSON in response: {}", ec.message()));
  }
  if (!jv.is_object()) {
    throw ParseError("response is not a JSON object");
  }
  return std::move(jv.as_object());
}

std::string StringField(const json::object &obj, const char *key) {
  if (const auto *v = obj.if_contains(key)) {
    if (const auto *s = v->if_string()) {
      return std::string(s->c_str());
    }
    if (!v->is_null()) {
      throw ParseError(fmt::format("field '{}' is not a string", key),
                       my_errors::JSON::TYPE_MISMATCH);
    }
  }
  return {};
}

} // namespace

PrometheusResponse ParsePrometheusResponse(std::string_view body) {
  json::object obj = ParseEnvelope(body);

  PrometheusResponse resp;
  resp.status = StringField(obj, "status");
  resp.error_type = StringField(obj, "errorType");
  resp.error = StringField(obj, "error");

  const auto *data_val = obj.if_contains("data");
  if (!data_val || data_val->is_null()) {
    return resp;
  }
  const auto *data = data_val->if_object();
  if (!data) {
    throw ParseError("field 'data' is not an object",
                     my_errors::JSON::TYPE_MISMATCH);
  }
  resp.result_type = StringField(*data, "resultType");

  const auto *result_val = data->if_contains("result");
  const auto *result = result_val ? result_val->if_array() : nullptr;
  if (!result) {
    return resp;
  }

  if (resp.result_type == "vector") {
    std::vector<VectorEntry> entries;
    for (const auto &item : *result) {
      const auto *entry = item.if_object();
      if (!entry) {
        continue;
      }
      VectorEntry ve;
      ve.metric = ParseLabels(*entry);
      if (const auto *value = entry->if_contains("value")) {
        ve.value = ParseSample(*value);
      }
      entries.push_back(std::move(ve));
    }
    resp.result = std::move(entries);
  } else if (resp.result_type == "matrix") {
    std::vector<MatrixEntry> entries;
    for (const auto &item : *result) {
      const auto *entry = item.if_object();
      if (!entry) {
        continue;
      }
      MatrixEntry me;
      me.metric = ParseLabels(*entry);
      if (const auto *values = entry->if_contains("values")) {
        if (const auto *arr = values->if_array()) {
          for (const auto &v : *arr) {
            if (auto sample = ParseSample(v)) {
              me.values.push_back(*sample);
            }
          }
        }
      }
      entries.push_back(std::move(me));
    }
    resp.result = std::move(entries);
  }
  return resp;
}

std::vector<SeriesFrame> ToFrames(const PrometheusResponse &response,
                                  const std::string &legend_format,
                                  const std::string &ref_id) {
  std::vector<SeriesFrame> frames;
  auto make_frame = [&](const Labels &labels) {
    SeriesFrame frame;
    frame.ref_id = ref_id;
    frame.labels = labels;
    frame.name = FormatLegend(labels, legend_format);
    return frame;
  };

  if (const auto *vec =
          std::get_if<std::vector<VectorEntry>>(&response.result)) {
    for (const auto &entry : *vec) {
      SeriesFrame frame = make_frame(entry.metric);
      if (entry.value) {
        frame.samples.push_back(*entry.value);
      }
      frames.push_back(std::move(frame));
    }
  } else if (const auto *mat =
                 std::get_if<std::vector<MatrixEntry>>(&response.result)) {
    for (const auto &entry : *mat) {
      SeriesFrame frame = make_frame(entry.metric);
      frame.samples = entry.values;
      frames.push_back(std::move(frame));
    }
  }
  return frames;
}

std::vector<std::string> ParseStringListResponse(std::string_view body,
                                                 int http_status) {
  json::object obj = ParseEnvelope(body);
  const std::string status = StringField(obj, "status");
  if (status != "success") {
    std::string error = StringField(obj, "error");
    if (error.empty()) {
      error = fmt::format("remote returned status '{}'", status);
    }
    throw QueryError(error, http_status);
  }
  std::vector<std::string> out;
  if (const auto *data = obj.if_contains("data")) {
    const auto *arr = data->if_array();
    if (!arr) {
      if (data->is_null()) {
        return out;
      }
      throw ParseError("field 'data' is not an array",
                       my_errors::JSON::TYPE_MISMATCH);
    }
    out.reserve(arr->size());
    for (const auto &v : *arr) {
      if (const auto *s = v.if_string()) {
        out.emplace_back(s->c_str());
      }
    }
  }
  return out;
}

std::string ExtractErrorMessage(std::string_view body) {
  json::error_code ec;
  json::value jv =
      json::parse(json::string_view(body.data(), body.size()), ec);
  if (ec || !jv.is_object()) {
    return {};
  }
  if (const auto *err = jv.as_object().if_contains("error")) {
    if (const auto *s = err->if_string()) {
      return std::string(s->c_str());
    }
  }
  return {};
}

} // namespace sshprom
