#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "conf/datasource_config.hpp"
#include "prometheus/http_exchange.hpp"
#include "prometheus/query_model.hpp"

namespace sshprom {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Decodes customQueryParameters ("a=1&b=2"). Malformed strings yield no
// parameters.
QueryParams ParseCustomQueryParameters(const std::string &raw);

// Percent-encodes params as an application/x-www-form-urlencoded string.
std::string EncodeForm(const QueryParams &params);

// /api/v1/query (instant: query, time) or /api/v1/query_range (query, start,
// end, step) under base_path. Extra params are appended after the standard
// ones. GET carries the params in the target; POST sends them as a form body.
HttpRequest BuildQueryRequest(const QuerySpec &query,
                              const std::string &base_path, HttpMethod method,
                              const QueryParams &extra);

// GET request for a discovery endpoint with optional query params.
HttpRequest BuildGetRequest(const std::string &path, const QueryParams &params);

// Flattens a JSON object body into form encoding. Returns nullopt when the
// body is not a JSON object.
std::optional<std::string> JsonBodyToForm(const std::string &body);

// Adds Authorization per the configured remote auth method. Basic is added
// only when username or password is non-empty, Bearer only for a non-empty
// token.
void ApplyRemoteAuth(HttpRequest &req, const DatasourceSettings &settings,
                     const SecureSettings &secure);

} // namespace sshprom
