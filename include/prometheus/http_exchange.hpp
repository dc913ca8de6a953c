#pragma once

#include <boost/asio/ssl/context.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "conf/datasource_config.hpp"
#include "util/my_logging.hpp"

namespace sshprom {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
  std::string method{"GET"};
  // Origin-form target: path plus optional "?query".
  std::string target{"/"};
  HeaderList headers;
  std::string body;
};

struct HttpResponse {
  int status{0};
  HeaderList headers;
  std::string body;

  bool ok() const { return status >= 200 && status < 300; }
};

// Cancellation and deadline shared between a caller and the request it
// issued. Copies share the same cancellation flag.
class RequestContext {
public:
  using clock = std::chrono::steady_clock;

  RequestContext() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

  void Cancel() const { cancelled_->store(true); }
  bool cancelled() const { return cancelled_->load(); }

  RequestContext &WithDeadline(clock::time_point deadline) {
    deadline_ = deadline;
    return *this;
  }
  std::optional<clock::time_point> deadline() const { return deadline_; }
  bool expired() const { return deadline_ && clock::now() >= *deadline_; }

private:
  std::shared_ptr<std::atomic<bool>> cancelled_;
  std::optional<clock::time_point> deadline_;
};

struct TlsOptions {
  bool enabled{false};
  bool skip_verify{false};
  // PEM blocks; empty means "not configured".
  std::string ca_cert_pem;
  std::string client_cert_pem;
  std::string client_key_pem;
};

// One-shot HTTP/1.1 exchanges against a loopback tunnel endpoint. Every
// call runs its own io_context on the calling thread, so calls on different
// threads are independent.
class HttpClient {
public:
  // Throws RequestError when a configured PEM block cannot be loaded.
  HttpClient(TlsOptions tls, std::chrono::seconds timeout);

  // local_addr is "host:port" of the tunnel listener. The Host header, SNI
  // and certificate verification use the remote endpoint's host. Throws
  // GatewayError on transport failure, timeout or cancellation.
  HttpResponse Send(const std::string &local_addr,
                    const PrometheusEndpoint &remote, const HttpRequest &req,
                    const RequestContext &ctx = {});

private:
  TlsOptions tls_;
  std::chrono::seconds timeout_;
  std::optional<boost::asio::ssl::context> ssl_ctx_;
  src::severity_logger<trivial::severity_level> lg;
};

} // namespace sshprom
