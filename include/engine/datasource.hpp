#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "conf/datasource_config.hpp"
#include "prometheus/http_exchange.hpp"
#include "prometheus/query_model.hpp"
#include "prometheus/request_builder.hpp"
#include "tunnel/tunnel.hpp"
#include "util/my_logging.hpp"

namespace sshprom {

// Per-query outcome of a QueryData batch. status follows HTTP conventions:
// 200 ok, 400 request or remote rejection, 500 parse/internal, 502 tunnel or
// gateway failure.
struct QueryResult {
  std::string ref_id;
  int status{200};
  std::string error;
  std::vector<SeriesFrame> frames;

  bool ok() const { return error.empty(); }
};

struct HealthResult {
  bool ok{false};
  std::string message;
};

struct ResourceRequest {
  std::string method{"GET"};
  // Relative path, e.g. "api/v1/labels" or "/api/v1/query".
  std::string path;
  // Path plus query string; wins over path when set.
  std::string url;
  HeaderList headers;
  std::string body;
};

using ResourceResponse = HttpResponse;

// The query proxy engine for one datasource instance. Owns at most one
// tunnel at a time and rebuilds it on demand when it is found dead.
class Datasource {
public:
  // Throws RequestError when TLS material in the secure settings cannot be
  // loaded.
  explicit Datasource(
      std::shared_ptr<IDatasourceConfigProvider> config,
      std::shared_ptr<ITunnelFactory> tunnel_factory =
          std::make_shared<SshTunnelFactory>(),
      SessionFactory probe_session_factory = DefaultSessionFactory());
  ~Datasource();

  Datasource(const Datasource &) = delete;
  Datasource &operator=(const Datasource &) = delete;

  // Returns the live tunnel, replacing a dead one. Check-alive,
  // close-if-stale, construct and install run as one critical section.
  // Throws AuthError, ConnectError, BindError or RequestError.
  std::shared_ptr<ITunnel> EnsureTunnel();

  // Runs every query of the batch; never throws.
  std::vector<QueryResult> QueryData(const std::vector<QuerySpec> &queries,
                                     const RequestContext &ctx = {});

  // Single query; throws the ProxyError family.
  std::vector<SeriesFrame> Query(const QuerySpec &query,
                                 const RequestContext &ctx = {});

  HealthResult CheckHealth(const RequestContext &ctx = {});

  // Relays a request to the remote server; never throws. The "test-ssh" path
  // runs the SSH-only probe instead.
  ResourceResponse CallResource(const ResourceRequest &req,
                                const RequestContext &ctx = {});

  // Metric names, optionally filtered by a regex (substring match when the
  // filter is not a valid regex).
  std::vector<std::string> Metrics(const std::string &filter = {},
                                   const RequestContext &ctx = {});
  std::vector<std::string> LabelNames(const RequestContext &ctx = {});
  // match_metric adds match[]=<metric> when non-empty.
  std::vector<std::string> LabelValues(const std::string &label,
                                       const std::string &match_metric = {},
                                       const RequestContext &ctx = {});

  // label_values(label), label_values(metric, label), label_names(),
  // metrics(filter); anything else runs as an instant query at "now".
  std::vector<std::string> MetricFindQuery(const std::string &query,
                                           const RequestContext &ctx = {});

  // Authenticates over SSH only. Throws AuthError or ConnectError.
  void TestSshConnection();

  // Closes the live tunnel, if any. Safe to call more than once.
  void Dispose();

  // Maps a ProxyError kind to the status used in query results.
  static int StatusFor(const ProxyError &err);

private:
  HttpResponse Send(HttpRequest req, const RequestContext &ctx);
  std::vector<std::string> FetchStringList(const std::string &path,
                                           const QueryParams &params,
                                           const RequestContext &ctx);
  ResourceResponse TestSshResource();
  PrometheusEndpoint Endpoint() const;

  std::shared_ptr<IDatasourceConfigProvider> config_;
  std::shared_ptr<ITunnelFactory> tunnel_factory_;
  SessionFactory probe_session_factory_;
  std::unique_ptr<HttpClient> http_client_;
  QueryParams extra_params_;

  // Guards the check-alive, close-if-stale, construct, install sequence.
  std::mutex tunnel_mu_;
  std::shared_ptr<ITunnel> tunnel_;

  src::severity_logger<trivial::severity_level> lg;
};

} // namespace sshprom
