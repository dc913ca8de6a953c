#include "engine/datasource.hpp"

#include <boost/beast/core/string.hpp>
#include <boost/json.hpp>
#include <boost/url.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <regex>

#include "prometheus/legend.hpp"
#include "prometheus/response_parser.hpp"
#include "proxy_error.hpp"
#include "util/string_util.hpp"

namespace sshprom {
namespace json = boost::json;
namespace urls = boost::urls;

namespace {

constexpr const char *kFormContentType = "application/x-www-form-urlencoded";

ResourceResponse JsonResponse(int status, const json::object &body) {
  ResourceResponse res;
  res.status = status;
  res.headers.emplace_back("Content-Type", "application/json");
  res.body = json::serialize(body);
  return res;
}

bool IsHopByHop(const std::string &name) {
  return boost::beast::iequals(name, "Host") ||
         boost::beast::iequals(name, "Connection") ||
         boost::beast::iequals(name, "Content-Length") ||
         boost::beast::iequals(name, "Transfer-Encoding");
}

std::string QueryErrorMessage(const ProxyError &err) {
  switch (err.kind()) {
  case ErrorKind::Gateway:
    return fmt::format("prometheus request failed: {}", err.what());
  case ErrorKind::Parse:
    return fmt::format("failed to parse prometheus response: {}", err.what());
  default:
    return err.what();
  }
}

// Non-2xx replies: prefer the envelope's error text over a bare status.
[[noreturn]] void ThrowBadStatus(const HttpResponse &res) {
  auto message = ExtractErrorMessage(res.body);
  if (message.empty()) {
    message = fmt::format("Prometheus returned status {}", res.status);
  }
  throw QueryError(message, res.status, my_errors::PROMETHEUS::BAD_STATUS);
}

std::int64_t NowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace

Datasource::Datasource(std::shared_ptr<IDatasourceConfigProvider> config,
                       std::shared_ptr<ITunnelFactory> tunnel_factory,
                       SessionFactory probe_session_factory)
    : config_(std::move(config)), tunnel_factory_(std::move(tunnel_factory)),
      probe_session_factory_(std::move(probe_session_factory)) {
  const auto &settings = config_->settings();
  const auto &secure = config_->secure();

  TlsOptions tls;
  try {
    tls.enabled = ParsePrometheusUrl(settings.prometheus_url).scheme == "https";
  } catch (const RequestError &ex) {
    // Surfaces again as a RequestError from EnsureTunnel.
    BOOST_LOG_SEV(lg, trivial::warning)
        << "Invalid prometheusUrl '" << settings.prometheus_url
        << "': " << ex.what();
  }
  tls.skip_verify = settings.tls_skip_verify;
  if (settings.tls_with_ca_cert) {
    tls.ca_cert_pem = secure.get("tlsCACert");
  }
  if (settings.tls_with_client_cert) {
    tls.client_cert_pem = secure.get("tlsClientCert");
    tls.client_key_pem = secure.get("tlsClientKey");
  }
  http_client_ = std::make_unique<HttpClient>(
      std::move(tls), std::chrono::seconds(settings.timeout_seconds));
  extra_params_ = ParseCustomQueryParameters(settings.custom_query_parameters);
}

Datasource::~Datasource() { Dispose(); }

PrometheusEndpoint Datasource::Endpoint() const {
  return ParsePrometheusUrl(config_->settings().prometheus_url);
}

int Datasource::StatusFor(const ProxyError &err) {
  switch (err.kind()) {
  case ErrorKind::Auth:
  case ErrorKind::Connect:
  case ErrorKind::Bind:
  case ErrorKind::Gateway:
    return 502;
  case ErrorKind::Query:
  case ErrorKind::Request:
    return 400;
  case ErrorKind::Parse:
    return 500;
  }
  return 500;
}

std::shared_ptr<ITunnel> Datasource::EnsureTunnel() {
  std::lock_guard<std::mutex> lock(tunnel_mu_);
  if (tunnel_) {
    if (tunnel_->IsAlive()) {
      return tunnel_;
    }
    BOOST_LOG_SEV(lg, trivial::warning)
        << "SSH tunnel " << tunnel_->LocalAddr()
        << " is no longer alive, rebuilding";
    tunnel_->Close();
    tunnel_.reset();
  }
  auto tunnel_config = BuildTunnelConfig(config_->settings(), config_->secure());
  BOOST_LOG_SEV(lg, trivial::info)
      << "Creating SSH tunnel: "
      << json::serialize(json::value_from(tunnel_config));
  tunnel_ = tunnel_factory_->Create(tunnel_config);
  return tunnel_;
}

HttpResponse Datasource::Send(HttpRequest req, const RequestContext &ctx) {
  auto tunnel = EnsureTunnel();
  ApplyRemoteAuth(req, config_->settings(), config_->secure());
  return http_client_->Send(tunnel->LocalAddr(), Endpoint(), req, ctx);
}

std::vector<SeriesFrame> Datasource::Query(const QuerySpec &query,
                                           const RequestContext &ctx) {
  if (query.expr.empty()) {
    return {};
  }
  auto req = BuildQueryRequest(query, Endpoint().base_path,
                               config_->settings().http_method, extra_params_);
  auto res = Send(std::move(req), ctx);
  if (!res.ok()) {
    ThrowBadStatus(res);
  }
  auto parsed = ParsePrometheusResponse(res.body);
  if (!parsed.success()) {
    throw QueryError(parsed.error.empty()
                         ? fmt::format("remote returned status '{}'",
                                       parsed.status)
                         : parsed.error,
                     res.status);
  }
  return ToFrames(parsed, query.legend_format, query.ref_id);
}

std::vector<QueryResult>
Datasource::QueryData(const std::vector<QuerySpec> &queries,
                      const RequestContext &ctx) {
  std::vector<QueryResult> results;
  results.reserve(queries.size());

  try {
    EnsureTunnel();
  } catch (const ProxyError &ex) {
    BOOST_LOG_SEV(lg, trivial::error)
        << "Failed to create SSH tunnel: " << ex.what();
    for (const auto &q : queries) {
      results.push_back(QueryResult{
          .ref_id = q.ref_id,
          .status = 502,
          .error = fmt::format("failed to create SSH tunnel: {}", ex.what())});
    }
    return results;
  } catch (const std::exception &ex) {
    BOOST_LOG_SEV(lg, trivial::error)
        << "Failed to create SSH tunnel: " << ex.what();
    for (const auto &q : queries) {
      results.push_back(QueryResult{.ref_id = q.ref_id,
                                    .status = 500,
                                    .error = ex.what()});
    }
    return results;
  }

  for (const auto &q : queries) {
    QueryResult result{.ref_id = q.ref_id};
    try {
      result.frames = Query(q, ctx);
    } catch (const ProxyError &ex) {
      result.status = StatusFor(ex);
      result.error = QueryErrorMessage(ex);
      BOOST_LOG_SEV(lg, trivial::warning)
          << "Query " << q.ref_id << " failed (" << to_string(ex.kind())
          << "): " << ex.what();
    } catch (const std::exception &ex) {
      result.status = 500;
      result.error = ex.what();
      BOOST_LOG_SEV(lg, trivial::error)
          << "Query " << q.ref_id << " failed: " << ex.what();
    }
    results.push_back(std::move(result));
  }
  return results;
}

HealthResult Datasource::CheckHealth(const RequestContext &ctx) {
  try {
    EnsureTunnel();
  } catch (const ProxyError &ex) {
    return {false, fmt::format("Failed to establish SSH tunnel: {}", ex.what())};
  } catch (const std::exception &ex) {
    BOOST_LOG_SEV(lg, trivial::error)
        << "Unexpected failure creating SSH tunnel: " << ex.what();
    return {false, fmt::format("Failed to establish SSH tunnel: {}", ex.what())};
  }

  HttpResponse res;
  try {
    res = Send(BuildGetRequest(Endpoint().base_path + "/api/v1/query",
                               {{"query", "1"}}),
               ctx);
  } catch (const ProxyError &ex) {
    return {false,
            fmt::format("Failed to connect to Prometheus: {}", ex.what())};
  } catch (const std::exception &ex) {
    BOOST_LOG_SEV(lg, trivial::error) << "Health check failed: " << ex.what();
    return {false,
            fmt::format("Failed to connect to Prometheus: {}", ex.what())};
  }

  switch (res.status) {
  case 200:
    return {true, "SSH connection and Prometheus are working"};
  case 401:
    return {false, "Prometheus authentication failed (401 Unauthorized)"};
  case 403:
    return {false, "Prometheus access forbidden (403 Forbidden)"};
  default:
    return {false, fmt::format("Prometheus returned status {}", res.status)};
  }
}

void Datasource::TestSshConnection() {
  auto tunnel_config = BuildTunnelConfig(config_->settings(), config_->secure());
  BOOST_LOG_SEV(lg, trivial::info)
      << "Testing SSH connection to " << tunnel_config.ssh_endpoint();
  ProbeSshConnection(tunnel_config, probe_session_factory_);
}

ResourceResponse Datasource::TestSshResource() {
  try {
    TestSshConnection();
  } catch (const ProxyError &ex) {
    BOOST_LOG_SEV(lg, trivial::warning)
        << "SSH connection test failed: " << ex.what();
    return JsonResponse(
        200, {{"status", "error"},
              {"message", fmt::format("SSH connection failed: {}", ex.what())}});
  }
  return JsonResponse(
      200, {{"status", "ok"}, {"message", "SSH connection successful"}});
}

ResourceResponse Datasource::CallResource(const ResourceRequest &req,
                                          const RequestContext &ctx) {
  std::string path = req.url.empty() ? req.path : req.url;
  if (stringutil::strip_copy(req.path, "/") ==
      "test-ssh") {
    return TestSshResource();
  }
  if (path.empty() || path.front() != '/') {
    path.insert(path.begin(), '/');
  }

  try {
    if (auto rv = urls::parse_origin_form(path); !rv) {
      throw RequestError(fmt::format("malformed resource path '{}': {}", path,
                                     rv.error().message()),
                         my_errors::PROMETHEUS::BAD_RESOURCE_PATH);
    }

    HttpRequest out;
    out.method = req.method.empty() ? "GET" : req.method;
    out.target = Endpoint().base_path + path;
    out.body = req.body;

    bool converted = false;
    if (boost::beast::iequals(out.method, "POST") && !req.body.empty()) {
      if (auto form = JsonBodyToForm(req.body)) {
        out.body = std::move(*form);
        converted = true;
      }
    }
    for (const auto &[name, value] : req.headers) {
      if (IsHopByHop(name)) {
        continue;
      }
      if (converted && boost::beast::iequals(name, "Content-Type")) {
        continue;
      }
      out.headers.emplace_back(name, value);
    }
    if (converted) {
      out.headers.emplace_back("Content-Type", kFormContentType);
    }
    return Send(std::move(out), ctx);
  } catch (const ProxyError &ex) {
    BOOST_LOG_SEV(lg, trivial::warning)
        << "Resource call " << req.method << ' ' << path
        << " failed: " << ex.what();
    return JsonResponse(StatusFor(ex), {{"error", ex.what()}});
  } catch (const std::exception &ex) {
    BOOST_LOG_SEV(lg, trivial::error)
        << "Resource call " << req.method << ' ' << path
        << " failed: " << ex.what();
    return JsonResponse(500, {{"error", ex.what()}});
  }
}

std::vector<std::string>
Datasource::FetchStringList(const std::string &path, const QueryParams &params,
                            const RequestContext &ctx) {
  auto res = Send(BuildGetRequest(Endpoint().base_path + path, params), ctx);
  if (!res.ok()) {
    ThrowBadStatus(res);
  }
  return ParseStringListResponse(res.body, res.status);
}

std::vector<std::string> Datasource::Metrics(const std::string &filter,
                                             const RequestContext &ctx) {
  auto names = FetchStringList("/api/v1/label/__name__/values", {}, ctx);
  if (filter.empty()) {
    return names;
  }
  std::vector<std::string> out;
  try {
    const std::regex pattern(filter);
    std::copy_if(names.begin(), names.end(), std::back_inserter(out),
                 [&](const std::string &name) {
                   return std::regex_search(name, pattern);
                 });
  } catch (const std::regex_error &) {
    BOOST_LOG_SEV(lg, trivial::debug)
        << "Metric filter '" << filter
        << "' is not a valid regex, using substring match";
    std::copy_if(names.begin(), names.end(), std::back_inserter(out),
                 [&](const std::string &name) {
                   return name.find(filter) != std::string::npos;
                 });
  }
  return out;
}

std::vector<std::string> Datasource::LabelNames(const RequestContext &ctx) {
  return FetchStringList("/api/v1/labels", {}, ctx);
}

std::vector<std::string>
Datasource::LabelValues(const std::string &label,
                        const std::string &match_metric,
                        const RequestContext &ctx) {
  if (label.empty()) {
    throw RequestError("label name is required");
  }
  QueryParams params;
  if (!match_metric.empty()) {
    params.emplace_back("match[]", match_metric);
  }
  return FetchStringList(
      fmt::format("/api/v1/label/{}/values", urls::encode(label, urls::pchars)),
      params, ctx);
}

std::vector<std::string>
Datasource::MetricFindQuery(const std::string &query,
                            const RequestContext &ctx) {
  static const std::regex kLabelValues(
      R"(^label_values\((?:(.+),\s*)?([a-zA-Z_][a-zA-Z0-9_]*)\)$)");
  static const std::regex kLabelNames(R"(^label_names\(\)$)");
  static const std::regex kMetricNames(R"(^metrics\((.+)?\)$)");

  const std::string text = stringutil::trim_copy(query);
  std::smatch m;
  if (std::regex_match(text, m, kLabelValues)) {
    const std::string metric =
        m[1].matched ? stringutil::trim_copy(m[1].str()) : std::string{};
    return LabelValues(m[2].str(), metric, ctx);
  }
  if (std::regex_match(text, kLabelNames)) {
    return LabelNames(ctx);
  }
  if (std::regex_match(text, m, kMetricNames)) {
    return Metrics(m[1].matched ? m[1].str() : std::string{}, ctx);
  }

  QuerySpec spec;
  spec.ref_id = "metricFindQuery";
  spec.expr = text;
  spec.instant = true;
  spec.range = false;
  spec.time_range.to_ms = NowMillis();
  spec.time_range.from_ms = spec.time_range.to_ms;

  std::vector<std::string> out;
  for (const auto &frame : Query(spec, ctx)) {
    if (!frame.labels.empty()) {
      out.push_back(FormatLegend(frame.labels, ""));
    } else if (!frame.samples.empty()) {
      out.push_back(fmt::format("{}", frame.samples.back().value));
    }
  }
  return out;
}

void Datasource::Dispose() {
  std::lock_guard<std::mutex> lock(tunnel_mu_);
  if (tunnel_) {
    BOOST_LOG_SEV(lg, trivial::info)
        << "Disposing datasource, closing SSH tunnel " << tunnel_->LocalAddr();
    tunnel_->Close();
    tunnel_.reset();
  }
}

} // namespace sshprom
