#include "Client.h"
#include "../lib/BinaryPack.hpp"
#include "../network/FetchClient.h"

namespace lw {

Client::Client() : Module("client") {}

Client::~Client() {}

std::string Client::getErrorMessage(uint16_t errorCode) {
  switch (errorCode) {
  case E_NOT_CONNECTED:
    return "Not connected to server";
  case E_INVALID_RESPONSE:
    return "Invalid response from server";
  case E_SERVER_ERROR:
    return "Server error";
  case E_PARSE_ERROR:
    return "Failed to parse response";
  case E_REQUEST_FAILED:
    return "Request failed";
  default:
    return "Unknown error";
  }
}

Client::Roe<void> Client::setEndpoint(const std::string &endpoint) {
  auto ep = network::TcpEndpoint::ltsFromString(endpoint);
  if (ep.address.empty() || ep.port == 0) {
    return Error(E_NOT_CONNECTED, "Invalid endpoint: " + endpoint);
  }
  setEndpoint(ep);
  return {};
}

void Client::setEndpoint(const network::TcpEndpoint &endpoint) {
  std::lock_guard<std::mutex> lock(mutex_);
  endpoint_ = endpoint;
}

network::TcpEndpoint Client::getEndpoint() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return endpoint_;
}

ChainConfig Client::getConfig() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_;
}

Client::Roe<std::string> Client::sendRequest(uint32_t type,
                                             const std::string &payload,
                                             std::chrono::milliseconds timeout) {
  network::TcpEndpoint endpoint = getEndpoint();
  if (endpoint.port == 0) {
    return Error(E_NOT_CONNECTED, getErrorMessage(E_NOT_CONNECTED));
  }

  Request req;
  req.type = type;
  req.payload = payload;

  std::string requestData = utl::binaryPack(req);
  log().debug << "Sending request: " << req;

  network::FetchClient fetchClient;
  auto result = fetchClient.fetchSync(endpoint, requestData, timeout);
  if (!result) {
    return Error(E_REQUEST_FAILED, getErrorMessage(E_REQUEST_FAILED) + ": " +
                                       result.error().message);
  }

  auto respResult = utl::binaryUnpack<Response>(result.value());
  if (!respResult) {
    return Error(E_INVALID_RESPONSE, getErrorMessage(E_INVALID_RESPONSE) + ": " +
                                         respResult.error().message);
  }

  const Response &resp = respResult.value();
  if (resp.version != Response::VERSION) {
    return Error(E_INVALID_RESPONSE, "Unsupported response version: " +
                                         std::to_string(resp.version));
  }
  if (resp.isError()) {
    return Error(E_SERVER_ERROR, getErrorMessage(E_SERVER_ERROR) + ": " + resp.payload);
  }

  log().debug << "Response payload: " << resp.payload.size() << " bytes";
  return resp.payload;
}

Client::Roe<Block> Client::parseBlock(const std::string &payload) {
  Block block;
  if (!block.ltsFromString(payload)) {
    return Error(E_PARSE_ERROR, getErrorMessage(E_PARSE_ERROR) + ": block");
  }
  return block;
}

Client::Roe<ChainConfig> Client::fetchConfig() {
  auto result = sendRequest(T_REQ_CONFIG, "");
  if (!result) {
    return result.error();
  }

  auto configResult = utl::binaryUnpack<ChainConfig>(result.value());
  if (!configResult) {
    return Error(E_PARSE_ERROR, getErrorMessage(E_PARSE_ERROR) + ": " +
                                    configResult.error().message);
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = configResult.value();
  }
  log().debug << "Chain config: " << configResult.value().toJson().dump();
  return configResult.value();
}

Client::Roe<Block> Client::fetchLatestBlock() {
  auto result = sendRequest(T_REQ_BLOCK_LATEST, "");
  if (!result) {
    return result.error();
  }
  return parseBlock(result.value());
}

Client::Roe<Block> Client::fetchBlock(uint64_t blockId) {
  log().debug << "Requesting block " << blockId;

  auto result = sendRequest(T_REQ_BLOCK_GET, utl::binaryPack(blockId), TIMEOUT_DATA);
  if (!result) {
    return result.error();
  }
  return parseBlock(result.value());
}

Client::Roe<void> Client::addTransaction(const Transaction &tx) {
  auto result = sendRequest(T_REQ_TX_ADD, utl::binaryPack(tx), TIMEOUT_DATA);
  if (!result) {
    return result.error();
  }
  return {};
}

std::ostream &operator<<(std::ostream &os, const Client::Request &req) {
  os << "Request{version=" << req.version << ", type=" << req.type
     << ", payloadSize=" << req.payload.size() << "}";
  return os;
}

} // namespace lw
