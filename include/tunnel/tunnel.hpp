#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "conf/tunnel_config.hpp"
#include "tunnel/remote_session.hpp"
#include "util/my_logging.hpp"

namespace sshprom {

// A live forwarding path from a loopback endpoint to one fixed destination.
class ITunnel {
public:
  virtual ~ITunnel() = default;
  // False once closed; otherwise the session keepalive and transport check.
  virtual bool IsAlive() = 0;
  // Idempotent. A closed tunnel is never reused.
  virtual void Close() = 0;
  // "127.0.0.1:<port>" of the local listener.
  virtual std::string LocalAddr() const = 0;
};

using SessionFactory = std::function<std::shared_ptr<IRemoteSession>(
    const TunnelConfig &, std::chrono::seconds)>;

// Opens a libssh2 session (SshSession::Connect).
SessionFactory DefaultSessionFactory();

// Lifetime: Unstarted -> Alive on successful construction, Alive -> Closed on
// Close() or destruction. The accept loop runs on an internal io_context
// thread; every accepted connection is forwarded by its own task thread, and
// Close() joins all of them before the session is torn down.
class Tunnel : public ITunnel {
public:
  // Authenticates (bounded by kTunnelConnectTimeout), binds
  // 127.0.0.1:<config.local_port> and starts accepting. Throws AuthError, ConnectError or BindError; the session
  // is released again when the bind fails.
  explicit Tunnel(TunnelConfig config,
                  SessionFactory session_factory = DefaultSessionFactory());
  ~Tunnel() override;

  Tunnel(const Tunnel &) = delete;
  Tunnel &operator=(const Tunnel &) = delete;

  bool IsAlive() override;
  void Close() override;
  std::string LocalAddr() const override { return local_addr_; }

  unsigned short local_port() const { return local_port_; }
  std::size_t active_connections();

private:
  class ForwardingTask;

  void Bind();
  void DoAccept();
  void ReapFinishedTasks();

  TunnelConfig config_;
  std::shared_ptr<IRemoteSession> session_;
  boost::asio::io_context ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::thread accept_thread_;
  std::string local_addr_;
  unsigned short local_port_{0};

  // Guards alive_ and the Alive -> Closed transition.
  std::mutex mu_;
  bool alive_{false};
  std::atomic<bool> closing_{false};

  std::mutex tasks_mu_;
  std::list<std::shared_ptr<ForwardingTask>> tasks_;

  src::severity_logger<trivial::severity_level> lg;
};

class ITunnelFactory {
public:
  virtual ~ITunnelFactory() = default;
  virtual std::shared_ptr<ITunnel> Create(const TunnelConfig &config) = 0;
};

class SshTunnelFactory : public ITunnelFactory {
public:
  explicit SshTunnelFactory(
      SessionFactory session_factory = DefaultSessionFactory())
      : session_factory_(std::move(session_factory)) {}

  std::shared_ptr<ITunnel> Create(const TunnelConfig &config) override {
    return std::make_shared<Tunnel>(config, session_factory_);
  }

private:
  SessionFactory session_factory_;
};

// SSH-only connectivity probe: authenticate within kProbeConnectTimeout, send
// one keepalive, disconnect. Throws AuthError or ConnectError.
void ProbeSshConnection(const TunnelConfig &config,
                        const SessionFactory &session_factory =
                            DefaultSessionFactory());

} // namespace sshprom
