#pragma once

#include "Module.h"
#include "ResultOrError.hpp"
#include "Types.hpp"

#include <chrono>
#include <string>

namespace lw {
namespace network {

/**
 * FetchClient - Simple client for sending data and receiving responses
 *
 * One request per TCP connection: connect, send, half-close, read the
 * response until the server closes, close.
 */
class FetchClient : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr const int32_t E_CONNECT = 1;
  static constexpr const int32_t E_SEND = 2;
  static constexpr const int32_t E_RECEIVE = 3;

  static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{ 30000 };

  FetchClient();
  ~FetchClient() override = default;

  /**
   * Synchronous fetch - blocks until the response is received
   * @param endpoint Server to connect to
   * @param data Request bytes
   * @param timeout Socket send/receive timeout
   * @return Response bytes or error
   */
  Roe<std::string> fetchSync(const TcpEndpoint &endpoint, const std::string &data,
                             std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);
};

} // namespace network
} // namespace lw
