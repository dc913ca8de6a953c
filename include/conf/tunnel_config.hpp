#pragma once

#include <boost/json.hpp>

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

#include "my_error_codes.hpp"
#include "proxy_error.hpp"

namespace sshprom {

enum class SshAuthMethod { Password, PrivateKey };

// Immutable per-session descriptor for one SSH tunnel.
struct TunnelConfig {
  std::string ssh_host;
  int ssh_port{22};
  std::string ssh_username;
  SshAuthMethod auth_method{SshAuthMethod::PrivateKey};
  std::string ssh_password;
  std::string ssh_private_key;
  std::string ssh_key_passphrase;
  // Final destination the tunnel forwards every local connection to.
  std::string remote_host;
  int remote_port{80};
  // Hex SHA-256 of the server host key; empty disables pinning.
  std::string host_key_fingerprint;
  // Loopback listener port; 0 picks an ephemeral one.
  unsigned short local_port{0};

  std::string ssh_endpoint() const {
    return ssh_host + ":" + std::to_string(ssh_port);
  }

  std::string destination() const {
    return remote_host + ":" + std::to_string(remote_port);
  }

  // Exactly one credential variant is consulted, selected by auth_method.
  // Throws AuthError when that variant holds no usable credential.
  void ensure_credential() const {
    if (auth_method == SshAuthMethod::Password) {
      if (ssh_password.empty()) {
        throw AuthError("no authentication method configured",
                        my_errors::SSH::NO_CREDENTIAL);
      }
      return;
    }
    if (ssh_private_key.empty()) {
      throw AuthError("no authentication method configured",
                      my_errors::SSH::NO_CREDENTIAL);
    }
  }

  // Secrets are never serialized; the output is meant for logs.
  friend void tag_invoke(const boost::json::value_from_tag &,
                         boost::json::value &jv, const TunnelConfig &cfg) {
    jv = boost::json::object{
        {"ssh_host", cfg.ssh_host},
        {"ssh_port", cfg.ssh_port},
        {"ssh_username", cfg.ssh_username},
        {"auth_method", cfg.auth_method == SshAuthMethod::Password
                            ? "password"
                            : "key"},
        {"remote_host", cfg.remote_host},
        {"remote_port", cfg.remote_port},
        {"host_key_pinned", !cfg.host_key_fingerprint.empty()},
        {"local_port", cfg.local_port}};
  }
};

// Authentication timeouts for building a tunnel and for the SSH-only probe.
inline constexpr std::chrono::seconds kTunnelConnectTimeout{30};
inline constexpr std::chrono::seconds kProbeConnectTimeout{10};

} // namespace sshprom
