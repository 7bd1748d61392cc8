#include "TcpConnection.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace lw {
namespace network {

TcpConnection::TcpConnection(int socketFd) : socketFd_(socketFd) {
  struct sockaddr_in peerAddr;
  socklen_t addrLen = sizeof(peerAddr);
  if (getpeername(socketFd_, (struct sockaddr *)&peerAddr, &addrLen) == 0) {
    char addrStr[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &peerAddr.sin_addr, addrStr, INET_ADDRSTRLEN);
    peer_.address = addrStr;
    peer_.port = ntohs(peerAddr.sin_port);
  }
}

TcpConnection::~TcpConnection() { close(); }

TcpConnection::TcpConnection(TcpConnection &&other) noexcept
    : socketFd_(other.socketFd_), peer_(std::move(other.peer_)) {
  other.socketFd_ = -1;
  other.peer_ = {};
}

TcpConnection &TcpConnection::operator=(TcpConnection &&other) noexcept {
  if (this != &other) {
    close();
    socketFd_ = other.socketFd_;
    peer_ = std::move(other.peer_);
    other.socketFd_ = -1;
    other.peer_ = {};
  }
  return *this;
}

TcpConnection::Roe<size_t> TcpConnection::send(const void *data,
                                               size_t length) {
  if (socketFd_ < 0) {
    return Error(E_CLOSED, "Connection closed");
  }

  const char *bytes = static_cast<const char *>(data);
  size_t total = 0;
  while (total < length) {
    ssize_t sent = ::send(socketFd_, bytes + total, length - total, MSG_NOSIGNAL);
    if (sent < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return Error(E_TIMEOUT, "Send timeout");
      }
      return Error(E_IO, "Failed to send data: " + std::string(std::strerror(errno)));
    }
    total += static_cast<size_t>(sent);
  }
  return total;
}

TcpConnection::Roe<size_t> TcpConnection::send(const std::string &message) {
  return send(message.data(), message.size());
}

TcpConnection::Roe<size_t>
TcpConnection::sendAndShutdown(const std::string &message) {
  auto result = send(message);
  if (!result) {
    return result;
  }

  auto shutdownResult = shutdownWrite();
  if (!shutdownResult) {
    return Error(shutdownResult.error().code, shutdownResult.error().message);
  }
  return result;
}

TcpConnection::Roe<void> TcpConnection::shutdownWrite() {
  if (socketFd_ < 0) {
    return Error(E_CLOSED, "Connection closed");
  }

  if (shutdown(socketFd_, SHUT_WR) < 0) {
    return Error(E_IO, "Failed to shutdown write: " + std::string(std::strerror(errno)));
  }
  return {};
}

TcpConnection::Roe<size_t> TcpConnection::receive(void *buffer,
                                                  size_t maxLength) {
  if (socketFd_ < 0) {
    return Error(E_CLOSED, "Connection closed");
  }

  ssize_t received;
  do {
    received = recv(socketFd_, buffer, maxLength, 0);
  } while (received < 0 && errno == EINTR);

  if (received < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return Error(E_TIMEOUT, "Receive timeout (no data within socket timeout)");
    }
    return Error(E_IO, "Failed to receive data: " + std::string(std::strerror(errno)));
  }
  if (received == 0) {
    return Error(E_PEER_CLOSED, "Connection closed by peer");
  }
  return static_cast<size_t>(received);
}

TcpConnection::Roe<std::string> TcpConnection::receiveAll() {
  std::string data;
  char buffer[8192];

  while (true) {
    auto result = receive(buffer, sizeof(buffer));
    if (result.isError()) {
      if (result.error().code == E_PEER_CLOSED) {
        break;
      }
      return result.error();
    }
    data.append(buffer, result.value());
    if (data.size() > MAX_MESSAGE_SIZE) {
      return Error(E_TOO_LARGE, "Message exceeds " +
                                    std::to_string(MAX_MESSAGE_SIZE) + " bytes");
    }
  }
  return data;
}

TcpConnection::Roe<void>
TcpConnection::setTimeout(std::chrono::milliseconds timeout) {
  if (socketFd_ < 0) {
    return Error(E_CLOSED, "Connection closed");
  }

  struct timeval tv;
  tv.tv_sec = timeout.count() / 1000;
  tv.tv_usec = (timeout.count() % 1000) * 1000;

  if (setsockopt(socketFd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
    return Error(E_IO, "Failed to set receive timeout: " + std::string(std::strerror(errno)));
  }
  if (setsockopt(socketFd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
    return Error(E_IO, "Failed to set send timeout: " + std::string(std::strerror(errno)));
  }
  return {};
}

void TcpConnection::close() {
  if (socketFd_ >= 0) {
    ::close(socketFd_);
    socketFd_ = -1;
  }
}

} // namespace network
} // namespace lw
