#include "prometheus/request_builder.hpp"

#include <boost/json.hpp>
#include <boost/url.hpp>
#include <fmt/format.h>
#include <openssl/evp.h>

#include "prometheus/step.hpp"
#include "util/my_logging.hpp"

namespace sshprom {
namespace json = boost::json;
namespace urls = boost::urls;

namespace {

constexpr const char *kFormContentType = "application/x-www-form-urlencoded";

std::string Base64(const std::string &in) {
  std::string out(4 * ((in.size() + 2) / 3), '\0');
  const int n = EVP_EncodeBlock(
      reinterpret_cast<unsigned char *>(out.data()),
      reinterpret_cast<const unsigned char *>(in.data()),
      static_cast<int>(in.size()));
  out.resize(n > 0 ? static_cast<std::size_t>(n) : 0);
  return out;
}

std::string FormValue(const json::value &v) {
  switch (v.kind()) {
  case json::kind::string:
    return std::string(v.get_string().c_str());
  case json::kind::int64:
    return std::to_string(v.get_int64());
  case json::kind::uint64:
    return std::to_string(v.get_uint64());
  case json::kind::double_:
    return fmt::format("{}", v.get_double());
  case json::kind::bool_:
    return v.get_bool() ? "true" : "false";
  case json::kind::null:
    return {};
  default:
    return json::serialize(v);
  }
}

} // namespace

QueryParams ParseCustomQueryParameters(const std::string &raw) {
  QueryParams out;
  std::string text = raw;
  if (!text.empty() && text.front() == '?') {
    text.erase(0, 1);
  }
  if (text.empty()) {
    return out;
  }
  if (auto rv = urls::parse_query(text); !rv) {
    src::severity_logger<trivial::severity_level> lg;
    BOOST_LOG_SEV(lg, trivial::warning)
        << "Ignoring malformed customQueryParameters: "
        << rv.error().message();
    return out;
  }
  urls::url u;
  u.set_encoded_query(text);
  for (auto param : u.params()) {
    if (param.key.empty()) {
      continue;
    }
    out.emplace_back(param.key, param.has_value ? param.value : std::string{});
  }
  return out;
}

std::string EncodeForm(const QueryParams &params) {
  urls::url u;
  auto ps = u.params();
  for (const auto &[key, value] : params) {
    ps.append({key, value});
  }
  return std::string(u.encoded_query());
}

HttpRequest BuildQueryRequest(const QuerySpec &query,
                              const std::string &base_path, HttpMethod method,
                              const QueryParams &extra) {
  QueryParams params;
  params.emplace_back("query", query.expr);
  std::string path = base_path;
  if (query.is_range_query()) {
    path += "/api/v1/query_range";
    const auto step = CalculateStep(query.time_range, query.max_data_points,
                                    query.interval);
    params.emplace_back("start",
                        std::to_string(query.time_range.from_seconds()));
    params.emplace_back("end", std::to_string(query.time_range.to_seconds()));
    params.emplace_back("step", std::to_string(step));
  } else {
    path += "/api/v1/query";
    params.emplace_back("time", std::to_string(query.time_range.to_seconds()));
  }
  params.insert(params.end(), extra.begin(), extra.end());

  HttpRequest req;
  if (method == HttpMethod::Post) {
    req.method = "POST";
    req.target = path;
    req.body = EncodeForm(params);
    req.headers.emplace_back("Content-Type", kFormContentType);
  } else {
    req.method = "GET";
    req.target = path + "?" + EncodeForm(params);
  }
  return req;
}

HttpRequest BuildGetRequest(const std::string &path,
                            const QueryParams &params) {
  HttpRequest req;
  req.method = "GET";
  req.target = path;
  if (!params.empty()) {
    req.target += "?" + EncodeForm(params);
  }
  return req;
}

std::optional<std::string> JsonBodyToForm(const std::string &body) {
  json::error_code ec;
  json::value jv = json::parse(body, ec);
  if (ec || !jv.is_object()) {
    return std::nullopt;
  }
  QueryParams params;
  for (const auto &kv : jv.as_object()) {
    params.emplace_back(std::string(kv.key()), FormValue(kv.value()));
  }
  return EncodeForm(params);
}

void ApplyRemoteAuth(HttpRequest &req, const DatasourceSettings &settings,
                     const SecureSettings &secure) {
  switch (settings.prometheus_auth_method) {
  case RemoteAuthMethod::Basic: {
    const auto &user = settings.prometheus_username;
    const auto password = secure.get("prometheusPassword");
    if (!user.empty() || !password.empty()) {
      req.headers.emplace_back("Authorization",
                               "Basic " + Base64(user + ":" + password));
    }
    break;
  }
  case RemoteAuthMethod::Bearer: {
    const auto token = secure.get("prometheusBearerToken");
    if (!token.empty()) {
      req.headers.emplace_back("Authorization", "Bearer " + token);
    }
    break;
  }
  case RemoteAuthMethod::None:
    break;
  }
}

} // namespace sshprom
