#include "TcpServer.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace lw {
namespace network {

TcpServer::~TcpServer() { stop(); }

TcpServer::Roe<void> TcpServer::listen(const TcpEndpoint &endpoint,
                                       int backlog) {
  if (listening_) {
    return Error(E_STATE, "Server already listening");
  }

  struct sockaddr_in serverAddr;
  std::memset(&serverAddr, 0, sizeof(serverAddr));
  serverAddr.sin_family = AF_INET;
  serverAddr.sin_port = htons(endpoint.port);
  if (endpoint.address.empty() || endpoint.address == "0.0.0.0") {
    serverAddr.sin_addr.s_addr = INADDR_ANY;
  } else if (inet_pton(AF_INET, endpoint.address.c_str(), &serverAddr.sin_addr) != 1) {
    return Error(E_SOCKET, "Invalid listen address: " + endpoint.address);
  }

  socketFd_ = socket(AF_INET, SOCK_STREAM, 0);
  if (socketFd_ < 0) {
    return Error(E_SOCKET, "Failed to create socket: " + std::string(std::strerror(errno)));
  }

  // Set socket options to reuse address
  int opt = 1;
  if (setsockopt(socketFd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
    closeSockets();
    return Error(E_SOCKET, "Failed to set socket options");
  }

  if (bind(socketFd_, (struct sockaddr *)&serverAddr, sizeof(serverAddr)) < 0) {
    std::string reason = std::strerror(errno);
    closeSockets();
    return Error(E_SOCKET, "Failed to bind to " + endpoint.ltsToString() + ": " + reason);
  }

  if (::listen(socketFd_, backlog) < 0) {
    closeSockets();
    return Error(E_SOCKET, "Failed to listen on " + endpoint.ltsToString());
  }

  // Set socket to non-blocking mode
  int flags = fcntl(socketFd_, F_GETFL, 0);
  if (flags < 0 || fcntl(socketFd_, F_SETFL, flags | O_NONBLOCK) < 0) {
    closeSockets();
    return Error(E_SOCKET, "Failed to set socket to non-blocking mode");
  }

  epollFd_ = epoll_create1(0);
  if (epollFd_ < 0) {
    closeSockets();
    return Error(E_SOCKET, "Failed to create epoll instance");
  }

  // Level-triggered: a pending connection keeps the socket readable
  struct epoll_event event;
  std::memset(&event, 0, sizeof(event));
  event.events = EPOLLIN;
  event.data.fd = socketFd_;
  if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, socketFd_, &event) < 0) {
    closeSockets();
    return Error(E_SOCKET, "Failed to add socket to epoll");
  }

  // Report the port actually bound (differs from the request for port 0)
  struct sockaddr_in boundAddr;
  socklen_t boundLen = sizeof(boundAddr);
  if (getsockname(socketFd_, (struct sockaddr *)&boundAddr, &boundLen) < 0) {
    closeSockets();
    return Error(E_SOCKET, "Failed to read bound address");
  }
  char addrStr[INET_ADDRSTRLEN];
  inet_ntop(AF_INET, &boundAddr.sin_addr, addrStr, INET_ADDRSTRLEN);
  endpoint_.address = addrStr;
  endpoint_.port = ntohs(boundAddr.sin_port);

  listening_ = true;
  return {};
}

TcpServer::Roe<void> TcpServer::waitForConnection(int timeoutMs) {
  if (!listening_) {
    return Error(E_STATE, "Server not listening");
  }

  struct epoll_event event;
  int numEvents;
  do {
    numEvents = epoll_wait(epollFd_, &event, 1, timeoutMs);
  } while (numEvents < 0 && errno == EINTR);

  if (numEvents < 0) {
    return Error(E_SOCKET, "epoll_wait failed: " + std::string(std::strerror(errno)));
  }
  if (numEvents == 0) {
    return Error(E_TIMEOUT, "Timeout waiting for connection");
  }
  return {};
}

TcpServer::Roe<TcpConnection> TcpServer::accept() {
  if (!listening_) {
    return Error(E_STATE, "Server not listening");
  }

  struct sockaddr_in clientAddr;
  socklen_t clientLen = sizeof(clientAddr);

  int clientFd = ::accept(socketFd_, (struct sockaddr *)&clientAddr, &clientLen);
  if (clientFd < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return Error(E_NO_PENDING, "No pending connections");
    }
    return Error(E_SOCKET, "Failed to accept connection: " + std::string(std::strerror(errno)));
  }

  // Connections use blocking I/O bounded by socket timeouts
  int flags = fcntl(clientFd, F_GETFL, 0);
  if (flags >= 0) {
    fcntl(clientFd, F_SETFL, flags & ~O_NONBLOCK);
  }

  return TcpConnection(clientFd);
}

void TcpServer::stop() {
  closeSockets();
  listening_ = false;
}

void TcpServer::closeSockets() {
  if (epollFd_ >= 0) {
    ::close(epollFd_);
    epollFd_ = -1;
  }
  if (socketFd_ >= 0) {
    ::close(socketFd_);
    socketFd_ = -1;
  }
}

} // namespace network
} // namespace lw
