#pragma once

#include "ResultOrError.hpp"
#include "Service.h"
#include "TcpConnection.h"
#include "TcpServer.h"
#include "Types.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace lw {
namespace network {

/**
 * FetchServer - Simple server for receiving requests and sending responses
 *
 * Accepts connections on its own thread. Each connection carries exactly one
 * request, terminated by the client half-closing; the handler's return value
 * is written back and the connection is closed.
 */
class FetchServer : public Service {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  // Returns the response bytes for one request
  using RequestHandler =
      std::function<std::string(const std::string &request, const TcpEndpoint &peer)>;

  struct Config {
    TcpEndpoint endpoint;
    RequestHandler handler{ nullptr };
    std::vector<std::string> whitelist; // empty = allow all
    std::chrono::milliseconds connectionTimeout{ 5000 };
  };

  FetchServer();
  ~FetchServer() override;

  /**
   * Start listening on config.endpoint and serving on a background thread
   */
  Service::Roe<void> start(const Config &config);

  // Actual bound endpoint; differs from the configured one for port 0
  TcpEndpoint getEndpoint() const { return server_.getEndpoint(); }

protected:
  void runLoop() override;

  Service::Roe<void> onStart() override;
  void onStop() override;

private:
  // Helper: true if peer is allowed by whitelist (empty whitelist = allow all)
  bool isAllowedByWhitelist(const TcpEndpoint &peer) const;

  void serveConnection(TcpConnection &connection);

  TcpServer server_;
  Config config_;
};

} // namespace network
} // namespace lw
