#pragma once

#include "ResultOrError.hpp"
#include "TcpConnection.h"
#include "Types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace lw {
namespace network {

class TcpClient {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr const int32_t E_ALREADY_CONNECTED = 1;
  static constexpr const int32_t E_RESOLVE = 2;
  static constexpr const int32_t E_CONNECT = 3;
  static constexpr const int32_t E_NOT_CONNECTED = 4;

  TcpClient() = default;
  ~TcpClient() = default;

  // Delete copy constructor and assignment
  TcpClient(const TcpClient &) = delete;
  TcpClient &operator=(const TcpClient &) = delete;

  // Allow move
  TcpClient(TcpClient &&other) noexcept = default;
  TcpClient &operator=(TcpClient &&other) noexcept = default;

  /**
   * Connect to a server, resolving the host name if needed
   * @param endpoint Host name or IPv4 address and port
   * @param timeout Send/receive timeout applied after connecting (0 = none)
   */
  Roe<void> connect(const TcpEndpoint &endpoint,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

  Roe<size_t> send(const std::string &message);

  // Send data and shutdown writing in one call
  Roe<size_t> sendAndShutdown(const std::string &message);

  Roe<size_t> receive(void *buffer, size_t maxLength);

  // Receive until the server closes the connection
  Roe<std::string> receiveAll();

  void close();

  bool isConnected() const;

private:
  std::optional<TcpConnection> connection_;
};

} // namespace network
} // namespace lw
