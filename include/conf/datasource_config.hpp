#pragma once

#include <boost/json.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

#include "conf/tunnel_config.hpp"
#include "my_error_codes.hpp"

namespace sshprom {
namespace fs = std::filesystem;

enum class RemoteAuthMethod { None, Basic, Bearer };
enum class HttpMethod { Get, Post };

// Non-secret datasource settings ("jsonData").
struct DatasourceSettings {
  std::string ssh_host;
  int ssh_port{22};
  std::string ssh_username;
  SshAuthMethod auth_method{SshAuthMethod::PrivateKey};
  std::string ssh_host_key_fingerprint;

  std::string prometheus_url{"http://127.0.0.1:9090"};
  RemoteAuthMethod prometheus_auth_method{RemoteAuthMethod::None};
  std::string prometheus_username;

  bool tls_skip_verify{false};
  bool tls_with_ca_cert{false};
  bool tls_with_client_cert{false};

  HttpMethod http_method{HttpMethod::Get};
  std::string custom_query_parameters;
  int timeout_seconds{30};

  friend DatasourceSettings
  tag_invoke(const boost::json::value_to_tag<DatasourceSettings> &,
             const boost::json::value &jv);
  friend void tag_invoke(const boost::json::value_from_tag &,
                         boost::json::value &jv,
                         const DatasourceSettings &settings);
};

// Decrypted secure settings ("secureJsonData"), keyed by field name:
// sshPassword, sshPrivateKey, sshKeyPassphrase, prometheusPassword,
// prometheusBearerToken, tlsCACert, tlsClientCert, tlsClientKey.
struct SecureSettings {
  std::map<std::string, std::string> values;

  std::string get(const std::string &key) const {
    auto it = values.find(key);
    return it == values.end() ? std::string{} : it->second;
  }

  friend SecureSettings
  tag_invoke(const boost::json::value_to_tag<SecureSettings> &,
             const boost::json::value &jv);
};

// Where the Prometheus server lives, as seen from the SSH host.
struct PrometheusEndpoint {
  std::string scheme{"http"};
  std::string host;
  int port{80};
  std::string base_path;
};

// Parses prometheusUrl. Missing port defaults to 443 for https, 80 otherwise.
// Throws RequestError when the URL cannot be parsed or has no host.
PrometheusEndpoint ParsePrometheusUrl(const std::string &url);

// Builds the tunnel descriptor from the current settings. Only the credential
// variant selected by auth_method is copied over.
TunnelConfig BuildTunnelConfig(const DatasourceSettings &settings,
                               const SecureSettings &secure);

class IDatasourceConfigProvider {
public:
  virtual ~IDatasourceConfigProvider() = default;
  virtual const DatasourceSettings &settings() const = 0;
  virtual const SecureSettings &secure() const = 0;
};

class StaticDatasourceConfigProvider : public IDatasourceConfigProvider {
public:
  StaticDatasourceConfigProvider(DatasourceSettings settings,
                                 SecureSettings secure)
      : settings_(std::move(settings)), secure_(std::move(secure)) {}

  const DatasourceSettings &settings() const override { return settings_; }
  const SecureSettings &secure() const override { return secure_; }

private:
  DatasourceSettings settings_;
  SecureSettings secure_;
};

// Reads {"jsonData": {...}, "secureJsonData": {...}} from a file.
class DatasourceConfigProviderFile : public IDatasourceConfigProvider {
public:
  explicit DatasourceConfigProviderFile(const fs::path &file_path);

  const DatasourceSettings &settings() const override { return settings_; }
  const SecureSettings &secure() const override { return secure_; }

private:
  DatasourceSettings settings_{};
  SecureSettings secure_{};
};

} // namespace sshprom
