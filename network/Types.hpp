#pragma once

#include "Utilities.h"

#include <cstdint>
#include <ostream>
#include <string>

namespace lw {
namespace network {

struct TcpEndpoint {
  std::string address;
  uint16_t port{0};

  std::string ltsToString() const {
    return address + ":" + std::to_string(port);
  }

  // Port is 0 when missing or malformed
  static TcpEndpoint ltsFromString(const std::string &endpointStr) {
    TcpEndpoint endpoint;
    if (!utl::parseHostPort(endpointStr, endpoint.address, endpoint.port)) {
      endpoint.address = endpointStr.substr(0, endpointStr.rfind(':'));
      endpoint.port = 0;
    }
    return endpoint;
  }

  bool operator==(const TcpEndpoint &other) const {
    return address == other.address && port == other.port;
  }
};

inline std::ostream &operator<<(std::ostream &os, const TcpEndpoint &endpoint) {
  return os << endpoint.address << ":" << endpoint.port;
}

} // namespace network
} // namespace lw
