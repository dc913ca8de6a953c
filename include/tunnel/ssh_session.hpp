#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <libssh2.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "conf/tunnel_config.hpp"
#include "tunnel/remote_session.hpp"
#include "util/my_logging.hpp"

namespace sshprom {

// Unacknowledged data or unanswered TCP keepalive probes older than this
// make the kernel drop the SSH connection.
inline constexpr std::chrono::seconds kDeadPeerTimeout{10};

// Turns on TCP keepalive (idle 5 s, 1 s between probes, 3 probes) and
// TCP_USER_TIMEOUT = kDeadPeerTimeout, so a silently lost peer surfaces as a
// socket error within a bounded time.
boost::system::error_code
EnableDeadPeerDetection(boost::asio::ip::tcp::socket &socket);

// libssh2 client session. Setup (TCP connect, handshake, authentication) runs
// in blocking mode bounded by the caller's timeout; afterwards the session is
// switched to non-blocking mode and every libssh2 call is serialized by one
// mutex so any number of channels can be driven from different threads.
class SshSession : public IRemoteSession,
                   public std::enable_shared_from_this<SshSession> {
public:
  // Throws AuthError, ConnectError. Nothing is left open on failure.
  static std::shared_ptr<SshSession> Connect(const TunnelConfig &config,
                                             std::chrono::seconds timeout);

  ~SshSession() override;

  SshSession(const SshSession &) = delete;
  SshSession &operator=(const SshSession &) = delete;

  std::unique_ptr<IChannel> OpenChannel(const std::string &host,
                                        int port) override;
  bool SendKeepalive() override;
  void Interrupt() override;
  void Disconnect() override;

private:
  friend class SshChannel;

  SshSession();

  void Handshake(const TunnelConfig &config, std::chrono::seconds timeout);
  void VerifyHostKey(const TunnelConfig &config);
  void Authenticate(const TunnelConfig &config);
  std::string LastError() const;

  // Runs fn under the session lock, waiting on the socket and retrying while
  // libssh2 reports EAGAIN. Gives up with LIBSSH2_ERROR_TIMEOUT at deadline
  // and with LIBSSH2_ERROR_SOCKET_DISCONNECT once interrupted.
  int RunNonBlocking(const std::function<int()> &fn,
                     std::chrono::steady_clock::time_point deadline);
  void WaitSocket(int directions, std::chrono::milliseconds timeout) const;
  bool PeerHungUp() const;

  boost::asio::io_context ioc_;
  boost::asio::ip::tcp::socket socket_;
  LIBSSH2_SESSION *session_{nullptr};
  std::mutex mu_;
  std::atomic<bool> interrupted_{false};
  bool disconnected_{false};
  std::string host_key_fingerprint_;
  std::string endpoint_;
  src::severity_logger<trivial::severity_level> lg;
};

} // namespace sshprom
