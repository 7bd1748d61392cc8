#pragma once

#include "ResultOrError.hpp"
#include "TcpConnection.h"
#include "Types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace lw {
namespace network {

class TcpServer {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr const int32_t E_STATE = 1;
  static constexpr const int32_t E_SOCKET = 2;
  static constexpr const int32_t E_TIMEOUT = 3;
  static constexpr const int32_t E_NO_PENDING = 4;

  TcpServer() = default;
  ~TcpServer();

  // Delete copy
  TcpServer(const TcpServer &) = delete;
  TcpServer &operator=(const TcpServer &) = delete;

  /**
   * Bind and start listening. An empty address or "0.0.0.0" binds all
   * interfaces; port 0 binds an ephemeral port reported by getEndpoint().
   */
  Roe<void> listen(const TcpEndpoint &endpoint, int backlog = 16);

  // Wait until a connection is pending (timeout in milliseconds, -1 for infinite)
  Roe<void> waitForConnection(int timeoutMs = -1);

  // Accept a pending connection (non-blocking)
  Roe<TcpConnection> accept();

  // Stop listening and release the socket
  void stop();

  bool isListening() const { return listening_; }

  // Actual bound endpoint, valid after listen()
  const TcpEndpoint &getEndpoint() const { return endpoint_; }

private:
  void closeSockets();

  int socketFd_{ -1 };
  int epollFd_{ -1 };
  bool listening_{ false };
  TcpEndpoint endpoint_;
};

} // namespace network
} // namespace lw
