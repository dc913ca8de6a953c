#include "tunnel/tunnel.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/error.hpp>
#include <fmt/format.h>

#include <array>

#include "proxy_error.hpp"
#include "tunnel/ssh_session.hpp"

namespace sshprom {
namespace net = boost::asio;
namespace beast = boost::beast;
using tcp = net::ip::tcp;

namespace {
constexpr std::size_t kCopyBufferSize = 32 * 1024;
}

SessionFactory DefaultSessionFactory() {
  return [](const TunnelConfig &config, std::chrono::seconds timeout)
             -> std::shared_ptr<IRemoteSession> {
    return SshSession::Connect(config, timeout);
  };
}

// Relays bytes between one accepted local connection and one channel opened
// to the tunnel destination. Remote -> local runs on the task thread,
// local -> remote on a helper thread; the task is done when both finished.
class Tunnel::ForwardingTask
    : public std::enable_shared_from_this<Tunnel::ForwardingTask> {
public:
  ForwardingTask(std::shared_ptr<IRemoteSession> session, tcp::socket local,
                 std::string host, int port)
      : session_(std::move(session)), local_(std::move(local)),
        host_(std::move(host)), port_(port) {}

  ~ForwardingTask() { Join(); }

  void Start() {
    thread_ = std::thread([self = shared_from_this()]() { self->Run(); });
  }

  bool done() const { return done_.load(); }

  void Join() {
    if (!thread_.joinable()) {
      return;
    }
    if (thread_.get_id() == std::this_thread::get_id()) {
      thread_.detach();
    } else {
      thread_.join();
    }
  }

  // Unblocks the local half. The channel half is unblocked by interrupting
  // the session. No-op once the task closed its socket.
  void Abort() { ShutdownLocal(tcp::socket::shutdown_both); }

private:
  void Run() {
    BOOST_LOG_SEV(lg, trivial::debug)
        << "Dialing " << host_ << ':' << port_ << " through SSH tunnel";
    try {
      channel_ = session_->OpenChannel(host_, port_);
    } catch (const std::exception &ex) {
      BOOST_LOG_SEV(lg, trivial::error)
          << "Failed to dial " << host_ << ':' << port_
          << " through SSH tunnel: " << ex.what();
      CloseLocal();
      done_.store(true);
      return;
    }
    BOOST_LOG_SEV(lg, trivial::debug)
        << "Connected to " << host_ << ':' << port_ << " through SSH tunnel";

    std::thread upstream([this]() { CopyLocalToRemote(); });
    CopyRemoteToLocal();
    upstream.join();

    try {
      channel_->Close();
    } catch (const std::exception &ex) {
      BOOST_LOG_SEV(lg, trivial::debug) << "Channel close: " << ex.what();
    }
    CloseLocal();
    done_.store(true);
  }

  void CopyRemoteToLocal() {
    std::array<char, kCopyBufferSize> buffer{};
    std::size_t total = 0;
    bool clean_eof = false;
    try {
      while (true) {
        const std::size_t n = channel_->Read(buffer.data(), buffer.size());
        if (n == 0) {
          clean_eof = true;
          break;
        }
        net::write(local_, net::buffer(buffer.data(), n));
        total += n;
      }
    } catch (const std::exception &ex) {
      BOOST_LOG_SEV(lg, trivial::debug)
          << "Copy from remote to local ended after " << total
          << " bytes: " << ex.what();
    }
    // On failure the local peer gets a hard stop so its half ends too.
    ShutdownLocal(clean_eof ? tcp::socket::shutdown_send
                            : tcp::socket::shutdown_both);
  }

  void CopyLocalToRemote() {
    std::array<char, kCopyBufferSize> buffer{};
    std::size_t total = 0;
    try {
      while (true) {
        beast::error_code ec;
        const std::size_t n =
            local_.read_some(net::buffer(buffer.data(), buffer.size()), ec);
        if (ec) {
          if (ec != net::error::eof) {
            BOOST_LOG_SEV(lg, trivial::debug)
                << "Copy from local to remote ended after " << total
                << " bytes: " << ec.message();
          }
          break;
        }
        channel_->Write(buffer.data(), n);
        total += n;
      }
      channel_->SendEof();
    } catch (const std::exception &ex) {
      BOOST_LOG_SEV(lg, trivial::debug)
          << "Copy from local to remote ended after " << total
          << " bytes: " << ex.what();
    }
  }

  void ShutdownLocal(net::socket_base::shutdown_type what) {
    std::lock_guard<std::mutex> lock(local_mu_);
    if (local_closed_) {
      return;
    }
    beast::error_code ec;
    local_.shutdown(what, ec);
  }

  // Only called once both copy directions are done.
  void CloseLocal() {
    std::lock_guard<std::mutex> lock(local_mu_);
    if (local_closed_) {
      return;
    }
    local_closed_ = true;
    beast::error_code ec;
    local_.shutdown(tcp::socket::shutdown_both, ec);
    local_.close(ec);
  }

  std::shared_ptr<IRemoteSession> session_;
  tcp::socket local_;
  // Serializes shutdown/close of local_ between the task and Tunnel::Close.
  std::mutex local_mu_;
  bool local_closed_{false};
  std::string host_;
  int port_;
  std::unique_ptr<IChannel> channel_;
  std::thread thread_;
  std::atomic<bool> done_{false};
  src::severity_logger<trivial::severity_level> lg;
};

Tunnel::Tunnel(TunnelConfig config, SessionFactory session_factory)
    : config_(std::move(config)), acceptor_(ioc_) {
  config_.ensure_credential();
  BOOST_LOG_SEV(lg, trivial::debug)
      << "Opening SSH tunnel " << config_.ssh_endpoint() << " -> "
      << config_.destination();
  session_ = session_factory(config_, kTunnelConnectTimeout);
  try {
    Bind();
  } catch (...) {
    session_->Disconnect();
    throw;
  }
  alive_ = true;
  DoAccept();
  accept_thread_ = std::thread([this]() { ioc_.run(); });
  BOOST_LOG_SEV(lg, trivial::info)
      << "SSH tunnel established via " << config_.ssh_endpoint() << ", "
      << local_addr_ << " -> " << config_.destination();
}

Tunnel::~Tunnel() { Close(); }

void Tunnel::Bind() {
  tcp::endpoint ep{net::ip::make_address("127.0.0.1"), config_.local_port};
  beast::error_code ec;
  acceptor_.open(ep.protocol(), ec);
  if (!ec) {
    acceptor_.bind(ep, ec);
  }
  if (!ec) {
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    beast::error_code ignore;
    acceptor_.close(ignore);
    throw BindError(
        fmt::format("failed to create local listener: {}", ec.message()));
  }
  local_port_ = acceptor_.local_endpoint().port();
  local_addr_ = fmt::format("127.0.0.1:{}", local_port_);
}

void Tunnel::DoAccept() {
  acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
    if (closing_.load()) {
      return;
    }
    if (ec) {
      BOOST_LOG_SEV(lg, trivial::debug)
          << "Tunnel accept failed, continuing: " << ec.message();
      DoAccept();
      return;
    }
    ReapFinishedTasks();
    auto task = std::make_shared<ForwardingTask>(
        session_, std::move(socket), config_.remote_host, config_.remote_port);
    {
      std::lock_guard<std::mutex> lock(tasks_mu_);
      tasks_.push_back(task);
    }
    task->Start();
    DoAccept();
  });
}

void Tunnel::ReapFinishedTasks() {
  std::list<std::shared_ptr<ForwardingTask>> finished;
  {
    std::lock_guard<std::mutex> lock(tasks_mu_);
    for (auto it = tasks_.begin(); it != tasks_.end();) {
      if ((*it)->done()) {
        finished.push_back(std::move(*it));
        it = tasks_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto &task : finished) {
    task->Join();
  }
}

std::size_t Tunnel::active_connections() {
  ReapFinishedTasks();
  std::lock_guard<std::mutex> lock(tasks_mu_);
  return tasks_.size();
}

bool Tunnel::IsAlive() {
  std::lock_guard<std::mutex> lock(mu_);
  if (!alive_) {
    return false;
  }
  return session_->SendKeepalive();
}

void Tunnel::Close() {
  std::lock_guard<std::mutex> lock(mu_);
  if (!alive_) {
    return;
  }
  alive_ = false;
  closing_.store(true);

  session_->Interrupt();
  // Closing the acceptor aborts the pending accept; the loop then sees
  // closing_ and does not re-arm, so ioc_.run() returns.
  net::post(ioc_, [this]() {
    beast::error_code ec;
    acceptor_.close(ec);
  });
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }

  std::list<std::shared_ptr<ForwardingTask>> tasks;
  {
    std::lock_guard<std::mutex> tasks_lock(tasks_mu_);
    tasks.swap(tasks_);
  }
  for (auto &task : tasks) {
    task->Abort();
  }
  for (auto &task : tasks) {
    task->Join();
  }

  session_->Disconnect();
  BOOST_LOG_SEV(lg, trivial::info)
      << "SSH tunnel " << local_addr_ << " -> " << config_.destination()
      << " closed";
}

void ProbeSshConnection(const TunnelConfig &config,
                        const SessionFactory &session_factory) {
  config.ensure_credential();
  auto session = session_factory(config, kProbeConnectTimeout);
  const bool ok = session->SendKeepalive();
  session->Disconnect();
  if (!ok) {
    throw ConnectError(
        "connection established but failed keepalive",
        my_errors::NETWORK::CONNECT_ERROR);
  }
}

} // namespace sshprom
