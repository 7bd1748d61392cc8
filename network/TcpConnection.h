#pragma once

#include "ResultOrError.hpp"
#include "Types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace lw {
namespace network {

/**
 * Owns one connected TCP socket; closed on destruction.
 */
class TcpConnection {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr const int32_t E_CLOSED = 1;
  static constexpr const int32_t E_TIMEOUT = 2;
  static constexpr const int32_t E_IO = 3;
  static constexpr const int32_t E_PEER_CLOSED = 4;
  static constexpr const int32_t E_TOO_LARGE = 5;

  // Upper bound for receiveAll()
  static constexpr const size_t MAX_MESSAGE_SIZE = 64 * 1024 * 1024;

  explicit TcpConnection(int socketFd);
  ~TcpConnection();

  // Delete copy
  TcpConnection(const TcpConnection &) = delete;
  TcpConnection &operator=(const TcpConnection &) = delete;

  // Allow move
  TcpConnection(TcpConnection &&other) noexcept;
  TcpConnection &operator=(TcpConnection &&other) noexcept;

  // Send all bytes
  Roe<size_t> send(const void *data, size_t length);
  Roe<size_t> send(const std::string &message);

  // Send data and shutdown writing in one call
  Roe<size_t> sendAndShutdown(const std::string &message);

  // Shutdown writing (half-close the connection)
  Roe<void> shutdownWrite();

  // Receive whatever is available, at most maxLength bytes
  Roe<size_t> receive(void *buffer, size_t maxLength);

  // Receive until the peer closes its side
  Roe<std::string> receiveAll();

  // Set socket send/receive timeout (0 = no timeout)
  Roe<void> setTimeout(std::chrono::milliseconds timeout);

  void close();
  bool isOpen() const { return socketFd_ >= 0; }

  const TcpEndpoint &getPeerEndpoint() const { return peer_; }

private:
  int socketFd_{ -1 };
  TcpEndpoint peer_;
};

} // namespace network
} // namespace lw
