#ifndef LEDGERWATCH_LEDGER_SERVER_H
#define LEDGERWATCH_LEDGER_SERVER_H

#include "../client/Client.h"
#include "../ledger/MemoryChain.h"
#include "../lib/ResultOrError.hpp"
#include "../lib/Service.h"
#include "../network/FetchServer.h"
#include "../network/Types.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace lw {

/**
 * Simulated ledger node
 *
 * Keeps an in-memory chain, collects submitted transactions and appends one
 * block per block interval. Serves the Client request types over a
 * FetchServer.
 */
class LedgerServer : public Service {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  // Error codes
  static constexpr const int32_t E_CONFIG = -1;
  static constexpr const int32_t E_NETWORK = -2;
  static constexpr const int32_t E_REQUEST = -4;
  static constexpr const int32_t E_INVALID_TX = -5;
  static constexpr const int32_t E_QUEUE_FULL = -6;

  // Error codes sent in Client::Response
  static constexpr const uint16_t RE_BAD_REQUEST = 1;
  static constexpr const uint16_t RE_NOT_FOUND = 2;
  static constexpr const uint16_t RE_INVALID_TX = 3;
  static constexpr const uint16_t RE_UNSUPPORTED = 4;

  static constexpr const char *DEFAULT_HOST = "127.0.0.1";
  static constexpr const uint16_t DEFAULT_PORT = 8610;
  static constexpr const uint64_t DEFAULT_MAX_PENDING_TRANSACTIONS = 10000;

  struct Config {
    std::string host{ DEFAULT_HOST };
    uint16_t port{ DEFAULT_PORT };
    std::chrono::milliseconds blockInterval{ ChainConfig::DEFAULT_BLOCK_INTERVAL };
    uint32_t maxTransactionsPerBlock{ ChainConfig::DEFAULT_MAX_TRANSACTIONS_PER_BLOCK };
    uint64_t maxPendingTransactions{ DEFAULT_MAX_PENDING_TRANSACTIONS };
    bool produceEmptyBlocks{ false };
    std::vector<std::string> whitelist;

    nlohmann::json ltsToJson() const;
    Roe<void> ltsFromJson(const nlohmann::json &jd);
  };

  LedgerServer();
  ~LedgerServer() override;

  /**
   * Read a Config from a JSON file; missing keys keep their defaults
   */
  static Roe<Config> loadConfig(const std::string &configPath);

  Service::Roe<void> start(const Config &config);

  // Bound endpoint, valid while running
  network::TcpEndpoint getEndpoint() const { return fetchServer_.getEndpoint(); }

  ChainConfig getChainConfig() const;
  const MemoryChain &getChain() const { return chain_; }
  size_t getPendingCount() const;

  /**
   * Validate and queue a transaction for the next block
   */
  Roe<void> addTransaction(const Transaction &tx);

  /**
   * Append a block from pending transactions (at most
   * maxTransactionsPerBlock). Without pending transactions a block is only
   * appended when produceEmptyBlocks is set.
   * @return true if a block was appended
   */
  bool produceBlock();

protected:
  void runLoop() override;

  Service::Roe<void> onStart() override;
  void onStop() override;

private:
  using Handler = std::function<Roe<std::string>(const Client::Request &request)>;

  void initHandlers();

  std::string binaryResponseOk(const std::string &payload) const;
  std::string binaryResponseError(uint16_t errorCode, const std::string &message) const;

  std::string handleRequest(const std::string &request);

  Roe<std::string> hConfig(const Client::Request &request);
  Roe<std::string> hBlockLatest(const Client::Request &request);
  Roe<std::string> hBlockGet(const Client::Request &request);
  Roe<std::string> hTxAdd(const Client::Request &request);

  Config config_;
  MemoryChain chain_;
  network::FetchServer fetchServer_;
  std::map<uint32_t, Handler> requestHandlers_;

  mutable std::mutex pendingMutex_;
  std::deque<Transaction> pending_;
};

} // namespace lw

#endif // LEDGERWATCH_LEDGER_SERVER_H
