#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "prometheus/query_model.hpp"

namespace sshprom {

// Decodes a query reply envelope. Throws ParseError when the body is not a
// JSON object or the envelope fields have the wrong types. Result entries or
// sample pairs that do not have the expected shape are skipped.
PrometheusResponse ParsePrometheusResponse(std::string_view body);

// One frame per result entry; the frame name comes from FormatLegend.
std::vector<SeriesFrame> ToFrames(const PrometheusResponse &response,
                                  const std::string &legend_format,
                                  const std::string &ref_id);

// Decodes the {"status": "success", "data": ["a", "b"]} envelope returned by
// the label and label value endpoints. Throws ParseError on malformed bodies
// and QueryError when status is not "success".
std::vector<std::string> ParseStringListResponse(std::string_view body,
                                                 int http_status);

// Best effort "error" field of an envelope, empty when absent.
std::string ExtractErrorMessage(std::string_view body);

} // namespace sshprom
