#include "conf/datasource_config.hpp"

#include <boost/url.hpp>
#include <fmt/format.h>

#include <charconv>
#include <fstream>
#include <iterator>

namespace sshprom {
namespace json = boost::json;
namespace urls = boost::urls;

namespace {

std::string GetString(const json::object &obj, const char *key,
                      std::string fallback = {}) {
  if (auto *p = obj.if_contains(key); p && p->is_string()) {
    return std::string(p->as_string().c_str());
  }
  return fallback;
}

bool GetBool(const json::object &obj, const char *key, bool fallback) {
  if (auto *p = obj.if_contains(key); p && p->is_bool()) {
    return p->as_bool();
  }
  return fallback;
}

// Accepts a JSON number or a numeric string; anything else yields nullopt.
std::optional<int> GetLooseInt(const json::object &obj, const char *key) {
  const auto *p = obj.if_contains(key);
  if (!p) {
    return std::nullopt;
  }
  if (p->is_int64() || p->is_uint64() || p->is_double()) {
    return p->to_number<int>();
  }
  if (p->is_string()) {
    const auto &s = p->as_string();
    int value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec == std::errc{} && ptr == s.data() + s.size()) {
      return value;
    }
  }
  return std::nullopt;
}

} // namespace

DatasourceSettings
tag_invoke(const json::value_to_tag<DatasourceSettings> &,
           const json::value &jv) {
  const auto *obj = jv.if_object();
  if (!obj) {
    throw std::runtime_error("DatasourceSettings is not an object");
  }
  DatasourceSettings s{};
  s.ssh_host = GetString(*obj, "sshHost");
  if (auto port = GetLooseInt(*obj, "sshPort"); port && *port != 0) {
    s.ssh_port = *port;
  }
  s.ssh_username = GetString(*obj, "sshUsername");
  s.auth_method = GetString(*obj, "authMethod") == "password"
                      ? SshAuthMethod::Password
                      : SshAuthMethod::PrivateKey;
  s.ssh_host_key_fingerprint = GetString(*obj, "sshHostKeyFingerprint");

  s.prometheus_url = GetString(*obj, "prometheusUrl", s.prometheus_url);
  if (s.prometheus_url.empty()) {
    s.prometheus_url = "http://127.0.0.1:9090";
  }
  const auto auth = GetString(*obj, "prometheusAuthMethod");
  if (auth == "basic") {
    s.prometheus_auth_method = RemoteAuthMethod::Basic;
  } else if (auth == "bearer") {
    s.prometheus_auth_method = RemoteAuthMethod::Bearer;
  }
  s.prometheus_username = GetString(*obj, "prometheusUsername");

  s.tls_skip_verify = GetBool(*obj, "tlsSkipVerify", false);
  s.tls_with_ca_cert = GetBool(*obj, "tlsWithCACert", false);
  s.tls_with_client_cert = GetBool(*obj, "tlsWithClientCert", false);

  s.http_method = GetString(*obj, "httpMethod") == "POST" ? HttpMethod::Post
                                                         : HttpMethod::Get;
  s.custom_query_parameters = GetString(*obj, "customQueryParameters");
  if (auto timeout = GetLooseInt(*obj, "timeout"); timeout && *timeout > 0) {
    s.timeout_seconds = *timeout;
  }
  return s;
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const DatasourceSettings &s) {
  auto auth_name = [&]() {
    switch (s.prometheus_auth_method) {
    case RemoteAuthMethod::Basic:
      return "basic";
    case RemoteAuthMethod::Bearer:
      return "bearer";
    default:
      return "none";
    }
  };
  jv = json::object{
      {"sshHost", s.ssh_host},
      {"sshPort", s.ssh_port},
      {"sshUsername", s.ssh_username},
      {"authMethod",
       s.auth_method == SshAuthMethod::Password ? "password" : "key"},
      {"prometheusUrl", s.prometheus_url},
      {"prometheusAuthMethod", auth_name()},
      {"prometheusUsername", s.prometheus_username},
      {"tlsSkipVerify", s.tls_skip_verify},
      {"tlsWithCACert", s.tls_with_ca_cert},
      {"tlsWithClientCert", s.tls_with_client_cert},
      {"httpMethod", s.http_method == HttpMethod::Post ? "POST" : "GET"},
      {"customQueryParameters", s.custom_query_parameters},
      {"timeout", s.timeout_seconds}};
}

SecureSettings tag_invoke(const json::value_to_tag<SecureSettings> &,
                          const json::value &jv) {
  SecureSettings secure{};
  if (const auto *obj = jv.if_object()) {
    for (const auto &[key, value] : *obj) {
      if (value.is_string()) {
        secure.values.emplace(std::string(key),
                              std::string(value.as_string().c_str()));
      }
    }
  }
  return secure;
}

PrometheusEndpoint ParsePrometheusUrl(const std::string &url) {
  auto parsed = urls::parse_uri(url);
  if (!parsed) {
    throw RequestError(fmt::format("invalid prometheus URL '{}': {}", url,
                                   parsed.error().message()),
                       my_errors::GENERAL::INVALID_ARGUMENT);
  }
  const auto &u = parsed.value();
  if (!u.has_authority() || u.host().empty()) {
    throw RequestError(fmt::format("prometheus URL missing host: '{}'", url),
                       my_errors::GENERAL::INVALID_ARGUMENT);
  }
  PrometheusEndpoint ep;
  ep.scheme = u.scheme().empty() ? std::string("http") : std::string(u.scheme());
  // Brackets of an IPv6 literal are not part of the address.
  ep.host = std::string(u.host_address());
  if (u.has_port() && !u.port().empty()) {
    ep.port = static_cast<int>(u.port_number());
  } else {
    ep.port = ep.scheme == "https" ? 443 : 80;
  }
  ep.base_path = std::string(u.encoded_path());
  while (!ep.base_path.empty() && ep.base_path.back() == '/') {
    ep.base_path.pop_back();
  }
  return ep;
}

TunnelConfig BuildTunnelConfig(const DatasourceSettings &settings,
                               const SecureSettings &secure) {
  TunnelConfig cfg;
  cfg.ssh_host = settings.ssh_host;
  cfg.ssh_port = settings.ssh_port;
  cfg.ssh_username = settings.ssh_username;
  cfg.auth_method = settings.auth_method;
  cfg.host_key_fingerprint = settings.ssh_host_key_fingerprint;
  if (settings.auth_method == SshAuthMethod::Password) {
    cfg.ssh_password = secure.get("sshPassword");
  } else {
    cfg.ssh_private_key = secure.get("sshPrivateKey");
    cfg.ssh_key_passphrase = secure.get("sshKeyPassphrase");
  }
  const auto endpoint = ParsePrometheusUrl(settings.prometheus_url);
  cfg.remote_host = endpoint.host;
  cfg.remote_port = endpoint.port;
  return cfg;
}

DatasourceConfigProviderFile::DatasourceConfigProviderFile(
    const fs::path &file_path) {
  std::ifstream ifs(file_path);
  if (!ifs) {
    throw std::runtime_error("Unable to open datasource config: " +
                             file_path.string());
  }
  std::string content((std::istreambuf_iterator<char>(ifs)),
                      std::istreambuf_iterator<char>());
  json::value jv;
  try {
    jv = json::parse(content);
  } catch (const std::exception &ex) {
    throw std::runtime_error("Invalid JSON content in " + file_path.string() +
                             ": " + ex.what());
  }
  const auto *obj = jv.if_object();
  if (!obj) {
    throw std::runtime_error("Datasource config is not a JSON object: " +
                             file_path.string());
  }
  if (auto *p = obj->if_contains("jsonData")) {
    settings_ = json::value_to<DatasourceSettings>(*p);
  }
  if (auto *p = obj->if_contains("secureJsonData")) {
    secure_ = json::value_to<SecureSettings>(*p);
  }
}

} // namespace sshprom
