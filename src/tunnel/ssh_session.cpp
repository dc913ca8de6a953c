#include "tunnel/ssh_session.hpp"

#include <boost/asio/connect.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/system/system_error.hpp>
#include <fmt/format.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>

#include <cerrno>
#include <thread>
#include <utility>

#include "my_error_codes.hpp"
#include "proxy_error.hpp"
#include "util/string_util.hpp"

namespace sshprom {
namespace net = boost::asio;
namespace beast = boost::beast;
using tcp = net::ip::tcp;
using namespace std::chrono_literals;

namespace {

constexpr auto kSocketPollSlice = 20ms;
constexpr auto kChannelOpenTimeout = 10s;
constexpr auto kKeepaliveTimeout = 5s;
constexpr auto kCloseTimeout = 2s;

void EnsureLibssh2() {
  static std::once_flag once;
  static int init_rc = 0;
  std::call_once(once, []() { init_rc = libssh2_init(0); });
  if (init_rc != 0) {
    throw ConnectError(fmt::format("libssh2_init failed: {}", init_rc),
                       my_errors::SSH::HANDSHAKE_FAILED);
  }
}

std::string ToHex(const unsigned char *data, std::size_t len) {
  static const char kHexDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out += kHexDigits[(data[i] >> 4) & 0x0F];
    out += kHexDigits[data[i] & 0x0F];
  }
  return out;
}

} // namespace

class SshChannel : public IChannel {
public:
  SshChannel(std::shared_ptr<SshSession> session, LIBSSH2_CHANNEL *channel)
      : session_(std::move(session)), channel_(channel) {}

  ~SshChannel() override { Close(); }

  std::size_t Read(char *data, std::size_t size) override {
    while (true) {
      int rc = session_->RunNonBlocking(
          [&]() {
            return static_cast<int>(libssh2_channel_read(channel_, data, size));
          },
          std::chrono::steady_clock::time_point::max());
      if (rc > 0) {
        return static_cast<std::size_t>(rc);
      }
      if (rc < 0) {
        throw ConnectError(fmt::format("channel read failed: {}", rc),
                           my_errors::NETWORK::READ_ERROR);
      }
      std::lock_guard<std::mutex> lock(session_->mu_);
      if (libssh2_channel_eof(channel_)) {
        return 0;
      }
    }
  }

  void Write(const char *data, std::size_t size) override {
    std::size_t offset = 0;
    while (offset < size) {
      int rc = session_->RunNonBlocking(
          [&]() {
            return static_cast<int>(
                libssh2_channel_write(channel_, data + offset, size - offset));
          },
          std::chrono::steady_clock::time_point::max());
      if (rc < 0) {
        throw ConnectError(fmt::format("channel write failed: {}", rc),
                           my_errors::NETWORK::WRITE_ERROR);
      }
      offset += static_cast<std::size_t>(rc);
    }
  }

  void SendEof() override {
    int rc = session_->RunNonBlocking(
        [&]() { return libssh2_channel_send_eof(channel_); },
        std::chrono::steady_clock::now() + kCloseTimeout);
    if (rc < 0) {
      throw ConnectError(fmt::format("channel send_eof failed: {}", rc),
                         my_errors::NETWORK::WRITE_ERROR);
    }
  }

  void Close() override {
    if (!channel_) {
      return;
    }
    {
      std::lock_guard<std::mutex> lock(session_->mu_);
      if (session_->disconnected_) {
        // libssh2_session_free already released every channel.
        channel_ = nullptr;
        return;
      }
    }
    const auto deadline = std::chrono::steady_clock::now() + kCloseTimeout;
    if (int rc = session_->RunNonBlocking(
            [&]() { return libssh2_channel_close(channel_); }, deadline);
        rc != 0) {
      BOOST_LOG_SEV(lg, trivial::debug)
          << "SSH channel close not acknowledged: " << rc;
    }
    // An unfreed channel is released with the session.
    if (int rc = session_->RunNonBlocking(
            [&]() { return libssh2_channel_free(channel_); }, deadline);
        rc != 0) {
      BOOST_LOG_SEV(lg, trivial::debug) << "SSH channel free failed: " << rc;
    }
    channel_ = nullptr;
  }

private:
  std::shared_ptr<SshSession> session_;
  LIBSSH2_CHANNEL *channel_;
  src::severity_logger<trivial::severity_level> lg;
};

boost::system::error_code
EnableDeadPeerDetection(boost::asio::ip::tcp::socket &socket) {
  boost::system::error_code ec;
  socket.set_option(net::socket_base::keep_alive(true), ec);
  if (ec) {
    return ec;
  }
  const int fd = socket.native_handle();
  const int user_timeout_ms = static_cast<int>(
      std::chrono::duration_cast<std::chrono::milliseconds>(kDeadPeerTimeout)
          .count());
  const std::pair<int, int> options[] = {{TCP_KEEPIDLE, 5},
                                         {TCP_KEEPINTVL, 1},
                                         {TCP_KEEPCNT, 3},
                                         {TCP_USER_TIMEOUT, user_timeout_ms}};
  for (const auto &[name, value] : options) {
    if (::setsockopt(fd, IPPROTO_TCP, name, &value, sizeof(value)) != 0) {
      return {errno, boost::system::system_category()};
    }
  }
  return {};
}

SshSession::SshSession() : socket_(ioc_) {}

SshSession::~SshSession() { Disconnect(); }

std::shared_ptr<SshSession>
SshSession::Connect(const TunnelConfig &config, std::chrono::seconds timeout) {
  config.ensure_credential();
  EnsureLibssh2();

  std::shared_ptr<SshSession> session(new SshSession());
  session->endpoint_ = config.ssh_endpoint();
  try {
    session->Handshake(config, timeout);
    session->VerifyHostKey(config);
    session->Authenticate(config);
  } catch (...) {
    session->Disconnect();
    throw;
  }
  // Keepalives only put bytes on the wire; the TCP timers set up by
  // EnableDeadPeerDetection decide when an unanswered peer is gone.
  libssh2_keepalive_config(session->session_, 1, 1);
  libssh2_session_set_blocking(session->session_, 0);
  BOOST_LOG_SEV(session->lg, trivial::info)
      << "SSH session authenticated to " << session->endpoint_ << " as "
      << config.ssh_username;
  return session;
}

void SshSession::Handshake(const TunnelConfig &config,
                           std::chrono::seconds timeout) {
  beast::tcp_stream stream(ioc_);
  beast::error_code ec;
  tcp::resolver resolver(ioc_);
  auto results =
      resolver.resolve(config.ssh_host, std::to_string(config.ssh_port), ec);
  if (ec) {
    throw ConnectError(fmt::format("failed to resolve {}: {}",
                                   config.ssh_endpoint(), ec.message()));
  }
  stream.expires_after(timeout);
  stream.async_connect(results,
                       [&ec](const beast::error_code &connect_ec,
                             const tcp::endpoint &) { ec = connect_ec; });
  ioc_.run();
  ioc_.restart();
  if (ec) {
    throw ConnectError(
        fmt::format("failed to connect to SSH server {}: {}",
                    config.ssh_endpoint(),
                    ec == beast::error::timeout ? std::string("timeout")
                                                : ec.message()),
        ec == beast::error::timeout ? my_errors::NETWORK::TIMEOUT_ERROR
                                    : my_errors::NETWORK::CONNECT_ERROR);
  }
  socket_ = stream.release_socket();
  if (auto opt_ec = EnableDeadPeerDetection(socket_)) {
    BOOST_LOG_SEV(lg, trivial::warning)
        << "Dead peer detection unavailable for " << config.ssh_endpoint()
        << ": " << opt_ec.message();
  }

  session_ = libssh2_session_init();
  if (!session_) {
    throw ConnectError("failed to allocate SSH session",
                       my_errors::SSH::HANDSHAKE_FAILED);
  }
  libssh2_session_set_blocking(session_, 1);
  libssh2_session_set_timeout(
      session_,
      static_cast<long>(
          std::chrono::duration_cast<std::chrono::milliseconds>(timeout)
              .count()));
  int rc = libssh2_session_handshake(session_, socket_.native_handle());
  if (rc != 0) {
    throw ConnectError(
        fmt::format("SSH handshake with {} failed: {}", config.ssh_endpoint(),
                    LastError()),
        rc == LIBSSH2_ERROR_TIMEOUT ? my_errors::NETWORK::TIMEOUT_ERROR
                                    : my_errors::SSH::HANDSHAKE_FAILED);
  }
}

void SshSession::VerifyHostKey(const TunnelConfig &config) {
  const char *hash = libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA256);
  if (hash) {
    host_key_fingerprint_ =
        ToHex(reinterpret_cast<const unsigned char *>(hash), 32);
  }
  BOOST_LOG_SEV(lg, trivial::debug)
      << "SSH host key SHA256 for " << endpoint_ << ": "
      << (host_key_fingerprint_.empty() ? "<unavailable>"
                                        : host_key_fingerprint_);
  if (config.host_key_fingerprint.empty()) {
    return;
  }
  if (stringutil::toLowerCase(config.host_key_fingerprint) != host_key_fingerprint_) {
    throw AuthError(fmt::format("host key fingerprint mismatch for {}",
                                endpoint_),
                    my_errors::SSH::HOST_KEY_MISMATCH);
  }
}

void SshSession::Authenticate(const TunnelConfig &config) {
  int rc = 0;
  if (config.auth_method == SshAuthMethod::Password) {
    rc = libssh2_userauth_password_ex(
        session_, config.ssh_username.c_str(),
        static_cast<unsigned int>(config.ssh_username.size()),
        config.ssh_password.c_str(),
        static_cast<unsigned int>(config.ssh_password.size()), nullptr);
  } else {
    rc = libssh2_userauth_publickey_frommemory(
        session_, config.ssh_username.c_str(), config.ssh_username.size(),
        nullptr, 0, config.ssh_private_key.c_str(),
        config.ssh_private_key.size(),
        config.ssh_key_passphrase.empty() ? nullptr
                                          : config.ssh_key_passphrase.c_str());
  }
  if (rc == 0) {
    return;
  }
  const std::string reason = LastError();
  BOOST_LOG_SEV(lg, trivial::warning)
      << "SSH authentication to " << endpoint_ << " failed: " << reason;
  switch (rc) {
  case LIBSSH2_ERROR_TIMEOUT:
  case LIBSSH2_ERROR_SOCKET_SEND:
  case LIBSSH2_ERROR_SOCKET_RECV:
  case LIBSSH2_ERROR_SOCKET_DISCONNECT:
    throw ConnectError(fmt::format("SSH authentication interrupted: {}", reason),
                       rc == LIBSSH2_ERROR_TIMEOUT
                           ? my_errors::NETWORK::TIMEOUT_ERROR
                           : my_errors::NETWORK::CONNECT_ERROR);
  case LIBSSH2_ERROR_FILE:
  case LIBSSH2_ERROR_METHOD_NOT_SUPPORTED:
    throw AuthError(fmt::format("failed to parse private key: {}", reason),
                    my_errors::SSH::KEY_PARSE_FAILED);
  default:
    throw AuthError(fmt::format("SSH authentication failed: {}", reason));
  }
}

std::string SshSession::LastError() const {
  if (!session_) {
    return "no session";
  }
  char *message = nullptr;
  int length = 0;
  libssh2_session_last_error(session_, &message, &length, 0);
  if (!message || length <= 0) {
    return "unknown error";
  }
  return std::string(message, static_cast<std::size_t>(length));
}

int SshSession::RunNonBlocking(const std::function<int()> &fn,
                               std::chrono::steady_clock::time_point deadline) {
  while (true) {
    int rc = 0;
    int directions = 0;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (disconnected_ || !session_) {
        return LIBSSH2_ERROR_SOCKET_DISCONNECT;
      }
      rc = fn();
      if (rc == LIBSSH2_ERROR_EAGAIN) {
        directions = libssh2_session_block_directions(session_);
      }
    }
    if (rc != LIBSSH2_ERROR_EAGAIN) {
      return rc;
    }
    if (interrupted_.load()) {
      return LIBSSH2_ERROR_SOCKET_DISCONNECT;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return LIBSSH2_ERROR_TIMEOUT;
    }
    WaitSocket(directions, kSocketPollSlice);
  }
}

void SshSession::WaitSocket(int directions,
                            std::chrono::milliseconds timeout) const {
  pollfd pfd{};
  pfd.fd = const_cast<tcp::socket &>(socket_).native_handle();
  if (directions & LIBSSH2_SESSION_BLOCK_INBOUND) {
    pfd.events |= POLLIN;
  }
  if (directions & LIBSSH2_SESSION_BLOCK_OUTBOUND) {
    pfd.events |= POLLOUT;
  }
  if (pfd.events == 0) {
    pfd.events = POLLIN;
  }
  // Another thread may drain the socket on our behalf, so the wait is
  // always short and the caller re-polls libssh2.
  ::poll(&pfd, 1, static_cast<int>(timeout.count()));
}

bool SshSession::PeerHungUp() const {
  pollfd pfd{};
  pfd.fd = const_cast<tcp::socket &>(socket_).native_handle();
  pfd.events = POLLRDHUP;
  if (::poll(&pfd, 1, 0) < 0) {
    return true;
  }
  return (pfd.revents & (POLLRDHUP | POLLHUP | POLLERR | POLLNVAL)) != 0;
}

std::unique_ptr<IChannel> SshSession::OpenChannel(const std::string &host,
                                                  int port) {
  LIBSSH2_CHANNEL *channel = nullptr;
  const auto deadline = std::chrono::steady_clock::now() + kChannelOpenTimeout;
  int rc = RunNonBlocking(
      [&]() {
        channel = libssh2_channel_direct_tcpip_ex(session_, host.c_str(), port,
                                                  "127.0.0.1", 0);
        if (channel) {
          return 0;
        }
        return libssh2_session_last_errno(session_);
      },
      deadline);
  if (!channel) {
    std::string reason;
    bool closed = false;
    {
      std::lock_guard<std::mutex> lock(mu_);
      closed = disconnected_ || interrupted_.load();
      reason = disconnected_ ? std::string("session closed") : LastError();
    }
    throw ConnectError(fmt::format("failed to open channel to {}:{}: {} ({})",
                                   host, port, reason, rc),
                       closed ? my_errors::SSH::SESSION_CLOSED
                              : my_errors::SSH::CHANNEL_OPEN_FAILED);
  }
  return std::make_unique<SshChannel>(shared_from_this(), channel);
}

bool SshSession::SendKeepalive() {
  if (interrupted_.load()) {
    return false;
  }
  int seconds_to_next = 0;
  int rc = RunNonBlocking(
      [&]() { return libssh2_keepalive_send(session_, &seconds_to_next); },
      std::chrono::steady_clock::now() + kKeepaliveTimeout);
  if (rc != 0) {
    BOOST_LOG_SEV(lg, trivial::debug)
        << "SSH keepalive to " << endpoint_ << " failed: " << rc;
    return false;
  }
  if (PeerHungUp()) {
    BOOST_LOG_SEV(lg, trivial::debug)
        << "SSH socket to " << endpoint_ << " was closed by peer";
    return false;
  }
  return true;
}

void SshSession::Interrupt() { interrupted_.store(true); }

void SshSession::Disconnect() {
  Interrupt();
  std::lock_guard<std::mutex> lock(mu_);
  if (disconnected_) {
    return;
  }
  disconnected_ = true;
  if (session_) {
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(
        session_,
        static_cast<long>(
            std::chrono::duration_cast<std::chrono::milliseconds>(kCloseTimeout)
                .count()));
    if (int rc = libssh2_session_disconnect(session_, "Normal shutdown");
        rc != 0) {
      BOOST_LOG_SEV(lg, trivial::debug)
          << "SSH disconnect message to " << endpoint_ << " not sent: " << rc;
    }
    libssh2_session_free(session_);
    session_ = nullptr;
  }
  beast::error_code ec;
  socket_.shutdown(tcp::socket::shutdown_both, ec);
  socket_.close(ec);
  BOOST_LOG_SEV(lg, trivial::debug) << "SSH session to " << endpoint_
                                    << " disconnected";
}

} // namespace sshprom
