#include "TcpClient.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

namespace lw {
namespace network {

TcpClient::Roe<void> TcpClient::connect(const TcpEndpoint &endpoint,
                                        std::chrono::milliseconds timeout) {
  if (isConnected()) {
    return Error(E_ALREADY_CONNECTED, "Already connected");
  }

  struct addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;

  struct addrinfo *resolved = nullptr;
  std::string service = std::to_string(endpoint.port);
  int rc = getaddrinfo(endpoint.address.c_str(), service.c_str(), &hints, &resolved);
  if (rc != 0 || resolved == nullptr) {
    return Error(E_RESOLVE, "Failed to resolve hostname: " + endpoint.address +
                                " (" + gai_strerror(rc) + ")");
  }

  int socketFd = socket(resolved->ai_family, resolved->ai_socktype,
                        resolved->ai_protocol);
  if (socketFd < 0) {
    freeaddrinfo(resolved);
    return Error(E_CONNECT, "Failed to create socket: " + std::string(std::strerror(errno)));
  }

  // The connection owns the socket from here on
  TcpConnection connection(socketFd);
  if (timeout.count() > 0) {
    auto timeoutResult = connection.setTimeout(timeout);
    if (!timeoutResult) {
      freeaddrinfo(resolved);
      return Error(E_CONNECT, timeoutResult.error().message);
    }
  }

  int connectRc = ::connect(socketFd, resolved->ai_addr, resolved->ai_addrlen);
  int connectErrno = errno;
  freeaddrinfo(resolved);
  if (connectRc < 0) {
    return Error(E_CONNECT, "Failed to connect to " + endpoint.ltsToString() +
                                ": " + std::strerror(connectErrno));
  }

  connection_.emplace(std::move(connection));
  return {};
}

TcpClient::Roe<size_t> TcpClient::send(const std::string &message) {
  if (!isConnected()) {
    return Error(E_NOT_CONNECTED, "Not connected");
  }
  auto result = connection_->send(message);
  if (!result) {
    return Error(result.error().code, result.error().message);
  }
  return result.value();
}

TcpClient::Roe<size_t> TcpClient::sendAndShutdown(const std::string &message) {
  if (!isConnected()) {
    return Error(E_NOT_CONNECTED, "Not connected");
  }
  auto result = connection_->sendAndShutdown(message);
  if (!result) {
    return Error(result.error().code, result.error().message);
  }
  return result.value();
}

TcpClient::Roe<size_t> TcpClient::receive(void *buffer, size_t maxLength) {
  if (!isConnected()) {
    return Error(E_NOT_CONNECTED, "Not connected");
  }
  auto result = connection_->receive(buffer, maxLength);
  if (!result) {
    return Error(result.error().code, result.error().message);
  }
  return result.value();
}

TcpClient::Roe<std::string> TcpClient::receiveAll() {
  if (!isConnected()) {
    return Error(E_NOT_CONNECTED, "Not connected");
  }
  auto result = connection_->receiveAll();
  if (!result) {
    return Error(result.error().code, result.error().message);
  }
  return result.value();
}

void TcpClient::close() { connection_.reset(); }

bool TcpClient::isConnected() const {
  return connection_.has_value() && connection_->isOpen();
}

} // namespace network
} // namespace lw
