#pragma once

#include <stdexcept>
#include <string>

#include "my_error_codes.hpp"

namespace sshprom {

enum class ErrorKind {
  Auth,     // bad credentials, unparseable key, no credential configured
  Connect,  // remote endpoint unreachable or handshake timeout
  Bind,     // local port allocation failure
  Gateway,  // HTTP round trip through the tunnel failed
  Query,    // remote answered with an error status or envelope
  Parse,    // malformed response body
  Request,  // caller supplied an unparseable query or resource path
};

const char *to_string(ErrorKind kind);

// Base of every failure the tunnel and the query engine raise. Carries the
// taxonomy kind plus one of the my_errors numeric codes.
class ProxyError : public std::runtime_error {
public:
  ProxyError(ErrorKind kind, int code, const std::string &what)
      : std::runtime_error(what), kind_(kind), code_(code) {}

  ErrorKind kind() const noexcept { return kind_; }
  int code() const noexcept { return code_; }

private:
  ErrorKind kind_;
  int code_;
};

class AuthError : public ProxyError {
public:
  explicit AuthError(const std::string &what,
                     int code = my_errors::SSH::AUTH_FAILED)
      : ProxyError(ErrorKind::Auth, code, what) {}
};

class ConnectError : public ProxyError {
public:
  explicit ConnectError(const std::string &what,
                        int code = my_errors::NETWORK::CONNECT_ERROR)
      : ProxyError(ErrorKind::Connect, code, what) {}
};

class BindError : public ProxyError {
public:
  explicit BindError(const std::string &what)
      : ProxyError(ErrorKind::Bind, my_errors::SSH::BIND_FAILED, what) {}
};

class GatewayError : public ProxyError {
public:
  explicit GatewayError(const std::string &what,
                        int code = my_errors::PROMETHEUS::GATEWAY_ERROR)
      : ProxyError(ErrorKind::Gateway, code, what) {}
};

// Remote server answered, but with a failure. http_status is 0 when the
// HTTP exchange itself succeeded and only the envelope reported an error.
class QueryError : public ProxyError {
public:
  QueryError(const std::string &what, int http_status,
             int code = my_errors::PROMETHEUS::REMOTE_REJECTED)
      : ProxyError(ErrorKind::Query, code, what), http_status_(http_status) {}

  int http_status() const noexcept { return http_status_; }

private:
  int http_status_;
};

class ParseError : public ProxyError {
public:
  explicit ParseError(const std::string &what,
                      int code = my_errors::PROMETHEUS::MALFORMED_RESPONSE)
      : ProxyError(ErrorKind::Parse, code, what) {}
};

class RequestError : public ProxyError {
public:
  explicit RequestError(const std::string &what,
                        int code = my_errors::PROMETHEUS::BAD_QUERY)
      : ProxyError(ErrorKind::Request, code, what) {}
};

} // namespace sshprom
