#include "proxy_error.hpp"

namespace sshprom {

const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Auth:
    return "auth";
  case ErrorKind::Connect:
    return "connect";
  case ErrorKind::Bind:
    return "bind";
  case ErrorKind::Gateway:
    return "gateway";
  case ErrorKind::Query:
    return "query";
  case ErrorKind::Parse:
    return "parse";
  case ErrorKind::Request:
    return "request";
  }
  return "unknown";
}

} // namespace sshprom
