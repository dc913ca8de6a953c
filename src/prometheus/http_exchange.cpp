#include "prometheus/http_exchange.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <fmt/format.h>
#include <openssl/err.h>

#include <type_traits>

#include "proxy_error.hpp"

namespace sshprom {
namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

constexpr auto kPollSlice = std::chrono::milliseconds(20);
constexpr std::uint64_t kMaxResponseBytes = 64ull * 1024 * 1024;

tcp::endpoint ParseLocalAddr(const std::string &local_addr) {
  const auto colon = local_addr.rfind(':');
  if (colon == std::string::npos || colon + 1 >= local_addr.size()) {
    throw GatewayError(
        fmt::format("invalid tunnel address '{}'", local_addr));
  }
  beast::error_code ec;
  auto address = net::ip::make_address(local_addr.substr(0, colon), ec);
  int port = 0;
  try {
    port = std::stoi(local_addr.substr(colon + 1));
  } catch (const std::exception &) {
    port = -1;
  }
  if (ec || port <= 0 || port > 65535) {
    throw GatewayError(
        fmt::format("invalid tunnel address '{}'", local_addr));
  }
  return tcp::endpoint{address, static_cast<unsigned short>(port)};
}

std::string HostHeader(const PrometheusEndpoint &remote) {
  // IPv6 literals are bracketed only on the wire.
  const std::string host = remote.host.find(':') != std::string::npos
                               ? fmt::format("[{}]", remote.host)
                               : remote.host;
  const int default_port = remote.scheme == "https" ? 443 : 80;
  if (remote.port == default_port) {
    return host;
  }
  return fmt::format("{}:{}", host, remote.port);
}

bool IsIpLiteral(const std::string &host) {
  beast::error_code ec;
  net::ip::make_address(host, ec);
  return !ec;
}

http::request<http::string_body> ToBeastRequest(const HttpRequest &req,
                                                const std::string &host) {
  http::request<http::string_body> out;
  out.version(11);
  auto verb = http::string_to_verb(req.method);
  if (verb == http::verb::unknown) {
    out.method(http::verb::unknown);
    out.method_string(req.method);
  } else {
    out.method(verb);
  }
  out.target(req.target);
  for (const auto &[name, value] : req.headers) {
    out.insert(name, value);
  }
  out.set(http::field::host, host);
  out.set(http::field::user_agent,
          std::string("sshprom/") + BOOST_BEAST_VERSION_STRING);
  out.set(http::field::connection, "close");
  out.body() = req.body;
  if (!req.body.empty() || verb == http::verb::post) {
    out.prepare_payload();
  }
  return out;
}

// One request/response round trip over Stream, either a plain
// beast::tcp_stream or an ssl::stream over one.
template <class Stream>
class Exchange : public std::enable_shared_from_this<Exchange<Stream>> {
  static constexpr bool kTls = !std::is_same_v<Stream, beast::tcp_stream>;

public:
  template <class... StreamArgs>
  Exchange(http::request<http::string_body> request,
           std::chrono::seconds timeout, std::string server_name,
           bool verify_peer, StreamArgs &&...stream_args)
      : stream_(std::forward<StreamArgs>(stream_args)...),
        request_(std::move(request)),
        timeout_(timeout), server_name_(std::move(server_name)),
        verify_peer_(verify_peer) {
    parser_.body_limit(kMaxResponseBytes);
  }

  void Start(const tcp::endpoint &endpoint) {
    beast::get_lowest_layer(stream_).expires_after(timeout_);
    beast::get_lowest_layer(stream_).async_connect(
        endpoint,
        beast::bind_front_handler(&Exchange::OnConnect,
                                  this->shared_from_this()));
  }

  // Only called between io_context slices on the owning thread.
  void Cancel() {
    beast::error_code ec;
    beast::get_lowest_layer(stream_).socket().cancel(ec);
    beast::get_lowest_layer(stream_).socket().close(ec);
  }

  bool completed() const { return completed_; }
  bool timed_out() const { return timed_out_; }
  bool tls_failed() const { return tls_failed_; }
  const std::string &error() const { return error_; }

  HttpResponse TakeResponse() {
    auto res = parser_.release();
    HttpResponse out;
    out.status = static_cast<int>(res.result_int());
    for (const auto &field : res) {
      // The body is already de-chunked.
      if (field.name() == http::field::transfer_encoding) {
        continue;
      }
      out.headers.emplace_back(std::string(field.name_string()),
                               std::string(field.value()));
    }
    out.body = std::move(res.body());
    return out;
  }

private:
  void OnConnect(const beast::error_code &ec) {
    if (ec) {
      Fail("connect", ec);
      return;
    }
    if constexpr (kTls) {
      if (!IsIpLiteral(server_name_) &&
          !SSL_set_tlsext_host_name(stream_.native_handle(),
                                    server_name_.c_str())) {
        beast::error_code sni_error{static_cast<int>(::ERR_get_error()),
                                    net::error::get_ssl_category()};
        Fail("set_sni", sni_error);
        return;
      }
      if (verify_peer_) {
        stream_.set_verify_mode(ssl::verify_peer);
        stream_.set_verify_callback(ssl::host_name_verification(server_name_));
      } else {
        stream_.set_verify_mode(ssl::verify_none);
      }
      stream_.async_handshake(
          ssl::stream_base::client,
          beast::bind_front_handler(&Exchange::OnHandshake,
                                    this->shared_from_this()));
    } else {
      DoWrite();
    }
  }

  void OnHandshake(const beast::error_code &ec) {
    if (ec) {
      tls_failed_ = true;
      Fail("tls_handshake", ec);
      return;
    }
    DoWrite();
  }

  void DoWrite() {
    http::async_write(stream_, request_,
                      beast::bind_front_handler(&Exchange::OnWrite,
                                                this->shared_from_this()));
  }

  void OnWrite(const beast::error_code &ec, std::size_t) {
    if (ec) {
      Fail("write", ec);
      return;
    }
    http::async_read(stream_, buffer_, parser_,
                     beast::bind_front_handler(&Exchange::OnRead,
                                               this->shared_from_this()));
  }

  void OnRead(const beast::error_code &ec, std::size_t) {
    if (ec) {
      Fail("read", ec);
      return;
    }
    completed_ = true;
    beast::error_code ignore;
    beast::get_lowest_layer(stream_).socket().shutdown(
        tcp::socket::shutdown_both, ignore);
    beast::get_lowest_layer(stream_).socket().close(ignore);
  }

  void Fail(const char *step, const beast::error_code &ec) {
    timed_out_ = ec == beast::error::timeout;
    error_ = fmt::format("{} failed: {}", step, ec.message());
    beast::error_code ignore;
    beast::get_lowest_layer(stream_).socket().close(ignore);
  }

  Stream stream_;
  http::request<http::string_body> request_;
  std::chrono::seconds timeout_;
  std::string server_name_;
  bool verify_peer_;
  beast::flat_buffer buffer_;
  http::response_parser<http::string_body> parser_;
  bool completed_{false};
  bool timed_out_{false};
  bool tls_failed_{false};
  std::string error_;
};

template <class Stream>
HttpResponse RunExchange(net::io_context &ioc,
                         std::shared_ptr<Exchange<Stream>> exchange,
                         const tcp::endpoint &endpoint,
                         const RequestContext &ctx) {
  exchange->Start(endpoint);
  bool cancelled = false;
  bool deadline_hit = false;
  while (!ioc.stopped()) {
    ioc.run_for(kPollSlice);
    if (!cancelled && !ioc.stopped()) {
      if (ctx.cancelled()) {
        cancelled = true;
      } else if (ctx.expired()) {
        cancelled = true;
        deadline_hit = true;
      }
      if (cancelled) {
        exchange->Cancel();
      }
    }
  }
  if (exchange->completed()) {
    return exchange->TakeResponse();
  }
  if (deadline_hit) {
    throw GatewayError("request deadline exceeded",
                       my_errors::NETWORK::TIMEOUT_ERROR);
  }
  if (cancelled) {
    throw GatewayError("request cancelled", my_errors::NETWORK::CANCELLED);
  }
  int code = my_errors::PROMETHEUS::GATEWAY_ERROR;
  if (exchange->timed_out()) {
    code = my_errors::NETWORK::TIMEOUT_ERROR;
  } else if (exchange->tls_failed()) {
    code = my_errors::NETWORK::SSL_HANDSHAKE_ERROR;
  }
  throw GatewayError(exchange->error(), code);
}

} // namespace

HttpClient::HttpClient(TlsOptions tls, std::chrono::seconds timeout)
    : tls_(std::move(tls)),
      timeout_(timeout.count() > 0 ? timeout : std::chrono::seconds(30)) {
  if (!tls_.enabled) {
    return;
  }
  ssl_ctx_.emplace(ssl::context::tls_client);
  try {
    if (!tls_.skip_verify) {
      ssl_ctx_->set_default_verify_paths();
    }
    if (!tls_.ca_cert_pem.empty()) {
      ssl_ctx_->add_certificate_authority(
          net::buffer(tls_.ca_cert_pem.data(), tls_.ca_cert_pem.size()));
    }
  } catch (const boost::system::system_error &ex) {
    throw RequestError(
        fmt::format("failed to load CA certificate: {}", ex.what()),
        my_errors::OPENSSL::INVALID_CERT);
  }
  if (!tls_.client_cert_pem.empty() || !tls_.client_key_pem.empty()) {
    try {
      ssl_ctx_->use_certificate_chain(net::buffer(
          tls_.client_cert_pem.data(), tls_.client_cert_pem.size()));
    } catch (const boost::system::system_error &ex) {
      throw RequestError(
          fmt::format("failed to load client certificate: {}", ex.what()),
          my_errors::OPENSSL::INVALID_CERT);
    }
    try {
      ssl_ctx_->use_private_key(
          net::buffer(tls_.client_key_pem.data(), tls_.client_key_pem.size()),
          ssl::context::pem);
    } catch (const boost::system::system_error &ex) {
      throw RequestError(
          fmt::format("failed to load client key: {}", ex.what()),
          my_errors::OPENSSL::INVALID_KEY);
    }
  }
}

HttpResponse HttpClient::Send(const std::string &local_addr,
                              const PrometheusEndpoint &remote,
                              const HttpRequest &req,
                              const RequestContext &ctx) {
  const tcp::endpoint endpoint = ParseLocalAddr(local_addr);
  auto request = ToBeastRequest(req, HostHeader(remote));
  BOOST_LOG_SEV(lg, trivial::debug)
      << req.method << ' ' << req.target << " via " << local_addr;

  net::io_context ioc;
  if (ssl_ctx_) {
    auto exchange =
        std::make_shared<Exchange<ssl::stream<beast::tcp_stream>>>(
            std::move(request), timeout_, remote.host, !tls_.skip_verify, ioc,
            *ssl_ctx_);
    return RunExchange(ioc, std::move(exchange), endpoint, ctx);
  }
  auto exchange = std::make_shared<Exchange<beast::tcp_stream>>(
      std::move(request), timeout_, remote.host, false, ioc);
  return RunExchange(ioc, std::move(exchange), endpoint, ctx);
}

} // namespace sshprom
