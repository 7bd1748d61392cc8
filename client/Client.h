#ifndef LEDGERWATCH_CLIENT_H
#define LEDGERWATCH_CLIENT_H

#include "../interface/LedgerClient.hpp"
#include "../ledger/Block.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"
#include "../network/Types.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>

namespace lw {

/**
 * RPC client for a ledger node. One request per TCP connection.
 * Safe to use from several threads; the cached ChainConfig is shared.
 */
class Client : public Module, public iii::LedgerClient {
public:
  using Error = iii::LedgerClient::Error;

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr const char *DEFAULT_ENDPOINT = "127.0.0.1:8610";

  /** Timeout for fast, lightweight requests (config, latest block). */
  static constexpr std::chrono::milliseconds TIMEOUT_FAST{5000};
  /** Timeout for data-retrieval or data-submission requests. */
  static constexpr std::chrono::milliseconds TIMEOUT_DATA{15000};

  // Request types
  static constexpr const uint32_t T_REQ_CONFIG = 1;

  static constexpr const uint32_t T_REQ_BLOCK_LATEST = 1001;
  static constexpr const uint32_t T_REQ_BLOCK_GET = 1002;

  static constexpr const uint32_t T_REQ_TX_ADD = 3001;

  // Error codes
  static constexpr const uint16_t E_NOT_CONNECTED = 1;
  static constexpr const uint16_t E_INVALID_RESPONSE = 2;
  static constexpr const uint16_t E_SERVER_ERROR = 3;
  static constexpr const uint16_t E_PARSE_ERROR = 4;
  static constexpr const uint16_t E_REQUEST_FAILED = 5;

  // Get human-friendly error message for an error code
  static std::string getErrorMessage(uint16_t errorCode);

  struct Request {
    static constexpr const uint32_t VERSION = 1;

    uint32_t version{ VERSION };
    uint32_t type{ 0 };
    std::string payload;

    template <typename Archive>
    void serialize(Archive &ar) {
      ar & version & type & payload;
    }
  };

  struct Response {
    static constexpr const uint32_t VERSION = 1;
    uint32_t version{ VERSION };
    uint16_t errorCode{ 0 };
    std::string payload;

    template <typename Archive>
    void serialize(Archive &ar) {
      ar & version & errorCode & payload;
    }

    bool isError() const { return errorCode != 0; }
  };

  Client();
  ~Client() override;

  Roe<void> setEndpoint(const std::string &endpoint);
  void setEndpoint(const network::TcpEndpoint &endpoint);
  network::TcpEndpoint getEndpoint() const;

  /** Fetch chain parameters from the node and refresh the cached copy. */
  Roe<ChainConfig> fetchConfig();

  Roe<Block> fetchLatestBlock() override;
  Roe<Block> fetchBlock(uint64_t blockId);
  Roe<void> addTransaction(const Transaction &tx);

  /** Cached chain parameters; defaults until fetchConfig() succeeds. */
  ChainConfig getConfig() const override;

private:
  Roe<std::string> sendRequest(uint32_t type, const std::string &payload,
                               std::chrono::milliseconds timeout = TIMEOUT_FAST);
  Roe<Block> parseBlock(const std::string &payload);

  mutable std::mutex mutex_;
  network::TcpEndpoint endpoint_;
  ChainConfig config_;
};

std::ostream &operator<<(std::ostream &os, const Client::Request &req);

} // namespace lw

#endif // LEDGERWATCH_CLIENT_H
