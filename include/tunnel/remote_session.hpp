#pragma once

#include <cstddef>
#include <memory>
#include <string>

namespace sshprom {

// One outbound byte stream opened over the remote session. Read and Write
// block until progress is made; Read returns 0 on orderly end of stream.
// Errors surface as boost::system::system_error or ProxyError.
class IChannel {
public:
  virtual ~IChannel() = default;
  virtual std::size_t Read(char *data, std::size_t size) = 0;
  virtual void Write(const char *data, std::size_t size) = 0;
  // Half-close: tell the far end no more bytes follow.
  virtual void SendEof() = 0;
  virtual void Close() = 0;
};

// An authenticated session able to open channels to arbitrary destinations.
class IRemoteSession {
public:
  virtual ~IRemoteSession() = default;

  // Opens one channel to host:port as seen from the remote side. Throws
  // ConnectError when the remote refuses or the session is gone.
  virtual std::unique_ptr<IChannel> OpenChannel(const std::string &host,
                                                int port) = 0;

  // Sends one keepalive and checks the transport. False when the send fails
  // or the connection is known to be gone; a lost peer is detected within a
  // bounded time, not on the first call.
  virtual bool SendKeepalive() = 0;

  // Makes every blocked channel operation fail promptly. Idempotent.
  virtual void Interrupt() = 0;

  // Tears the session down. Channels must already be closed. Idempotent.
  virtual void Disconnect() = 0;
};

} // namespace sshprom
