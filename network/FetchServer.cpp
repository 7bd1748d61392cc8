#include "FetchServer.h"

#include <algorithm>
#include <exception>

namespace lw {
namespace network {

FetchServer::FetchServer() : Service("network.fetch_server") {}

FetchServer::~FetchServer() { stop(); }

Service::Roe<void> FetchServer::start(const Config &config) {
  if (!config.handler) {
    return Service::Error(-3, "Request handler is not set");
  }
  config_ = config;

  log().info << "Starting server on " << config_.endpoint;

  // Base start() calls onStart() then spawns the thread
  return Service::start();
}

Service::Roe<void> FetchServer::onStart() {
  auto listenResult = server_.listen(config_.endpoint);
  if (!listenResult) {
    return Service::Error(-2, "Failed to start listening: " + listenResult.error().message);
  }
  log().info << "Listening on " << server_.getEndpoint();
  return {};
}

void FetchServer::onStop() { server_.stop(); }

bool FetchServer::isAllowedByWhitelist(const TcpEndpoint &peer) const {
  if (config_.whitelist.empty()) {
    return true;
  }
  return std::find(config_.whitelist.begin(), config_.whitelist.end(),
                   peer.address) != config_.whitelist.end();
}

void FetchServer::serveConnection(TcpConnection &connection) {
  const TcpEndpoint &peer = connection.getPeerEndpoint();

  auto timeoutResult = connection.setTimeout(config_.connectionTimeout);
  if (!timeoutResult) {
    log().warning << "Failed to set timeout for " << peer << ": "
                  << timeoutResult.error().message;
  }

  auto request = connection.receiveAll();
  if (!request) {
    log().warning << "Failed to read request from " << peer << ": "
                  << request.error().message;
    return;
  }
  log().debug << "Received request from " << peer << " ("
              << request.value().size() << " bytes)";

  std::string response;
  try {
    response = config_.handler(request.value(), peer);
  } catch (const std::exception &e) {
    log().error << "Error processing request from " << peer << ": " << e.what();
    return;
  }

  auto sendResult = connection.sendAndShutdown(response);
  if (!sendResult) {
    log().warning << "Failed to send response to " << peer << ": "
                  << sendResult.error().message;
  }
}

void FetchServer::runLoop() {
  log().debug << "Server loop started";

  while (!isStopSet()) {
    auto waitResult = server_.waitForConnection(100);
    if (!waitResult) {
      if (waitResult.error().code != TcpServer::E_TIMEOUT) {
        log().error << "Wait failed: " << waitResult.error().message;
        waitForStop(std::chrono::milliseconds(100));
      }
      continue;
    }

    auto acceptResult = server_.accept();
    if (!acceptResult) {
      if (acceptResult.error().code != TcpServer::E_NO_PENDING) {
        log().warning << acceptResult.error().message;
      }
      continue;
    }

    TcpConnection connection = std::move(acceptResult.value());
    if (!isAllowedByWhitelist(connection.getPeerEndpoint())) {
      log().info << "Rejected connection from " << connection.getPeerEndpoint()
                 << " (not in whitelist)";
      continue;
    }
    serveConnection(connection);
  }

  log().debug << "Server loop ended";
}

} // namespace network
} // namespace lw
