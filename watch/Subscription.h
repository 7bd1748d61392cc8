#ifndef LEDGERWATCH_SUBSCRIPTION_H
#define LEDGERWATCH_SUBSCRIPTION_H

#include "../interface/LedgerClient.hpp"
#include "../ledger/Block.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"
#include "../lib/ThreadSafeQueue.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace lw {
namespace watch {

/**
 * Receives every newly observed block, one batch per poll
 */
class BlockReceiver {
public:
  virtual ~BlockReceiver() = default;
  virtual void onBlocks(const std::vector<Block> &blocks) = 0;
};

/**
 * Receives the transactions of every newly observed block, one batch per poll.
 * The batch is empty when the block carries no transactions.
 */
class TransactionReceiver {
public:
  virtual ~TransactionReceiver() = default;
  virtual void onTransactions(const std::vector<Transaction> &transactions) = 0;
};

/**
 * Subscription - push notifications on top of a pull-only ledger
 *
 * Polls LedgerClient::fetchLatestBlock() once per block interval while at
 * least one receiver is registered, and fans out each new head block to the
 * block receivers and its transactions to the transaction receivers.
 *
 * All state is owned by one event-loop thread that lives as long as the
 * object. subscribe/unsubscribe calls are queued to that thread and return
 * once applied; when an unsubscribe stops polling, any poll in progress has
 * finished and no receiver is invoked afterwards. Receivers run on the loop
 * thread and may subscribe or unsubscribe re-entrantly, but must not destroy
 * the Subscription.
 *
 * Failed polls are skipped silently: the cursor stays, nobody is invoked,
 * polling continues. An optional error observer sees each failure. Exceptions
 * thrown by receivers or by the observer are logged and do not stop polling.
 */
class Subscription : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr const int32_t E_INVALID_RECEIVER = 1;

  // Lower bound for the poll period
  static constexpr std::chrono::milliseconds MIN_POLL_INTERVAL{ 1 };

  // Opaque, non-zero, unique across both receiver kinds
  using Handle = uint64_t;

  using BlockCallback = std::function<void(const std::vector<Block> &blocks)>;
  using TransactionCallback =
      std::function<void(const std::vector<Transaction> &transactions)>;
  using ErrorObserver = std::function<void(const iii::LedgerClient::Error &error)>;

  /**
   * @param client Ledger to watch; must outlive the Subscription
   */
  explicit Subscription(iii::LedgerClient &client);
  ~Subscription() override;

  Subscription(const Subscription &) = delete;
  Subscription &operator=(const Subscription &) = delete;

  /**
   * Register a block receiver. Subscribing the same receiver again returns
   * its existing handle. Starts polling if it was stopped.
   */
  Roe<Handle> subscribeBlocks(std::shared_ptr<BlockReceiver> spReceiver);

  // Each call registers a new receiver with a fresh handle
  Roe<Handle> subscribeBlocks(BlockCallback callback);

  /**
   * Remove a block receiver; unknown handles are ignored. Stops polling
   * once no receiver of either kind is left.
   */
  void unsubscribeBlocks(Handle handle);

  Roe<Handle> subscribeTransactions(std::shared_ptr<TransactionReceiver> spReceiver);
  Roe<Handle> subscribeTransactions(TransactionCallback callback);
  void unsubscribeTransactions(Handle handle);

  void setErrorObserver(ErrorObserver observer);

  bool isPolling() const;
  size_t countBlockReceivers() const;
  size_t countTransactionReceivers() const;

  // Last observed block, unset before the first successful poll
  std::optional<Block> getLatestBlock() const;

private:
  struct BlockEntry {
    std::shared_ptr<BlockReceiver> spReceiver; // set for interface receivers
    BlockCallback callback;
  };

  struct TransactionEntry {
    std::shared_ptr<TransactionReceiver> spReceiver;
    TransactionCallback callback;
  };

  struct Command {
    std::function<void()> action;
    bool quit{ false };
  };

  void runLoop();

  // Run on the loop thread and wait for completion
  void execute(const std::function<void()> &action);

  Handle addBlockEntry(BlockEntry entry);
  Handle addTransactionEntry(TransactionEntry entry);
  void updatePolling();

  void startTimer();
  void stopTimer();
  void tick();

  void dispatchBlocks(const std::vector<Block> &blocks);
  void dispatchTransactions(const std::vector<Transaction> &transactions);
  void notifyError(const iii::LedgerClient::Error &error);

  iii::LedgerClient &client_;

  // Loop thread only
  std::optional<std::chrono::steady_clock::time_point> deadline_;
  std::chrono::milliseconds interval_{ 0 };
  Handle nextHandle_{ 1 };
  ErrorObserver errorObserver_;

  // Written on the loop thread only, read elsewhere under stateMutex_
  mutable std::mutex stateMutex_;
  std::map<Handle, BlockEntry> blockReceivers_;
  std::map<Handle, TransactionEntry> transactionReceivers_;
  std::optional<Block> latestBlock_;
  std::atomic<bool> polling_{ false };

  ThreadSafeQueue<Command> commands_;
  std::thread thread_;
  std::thread::id loopThreadId_;
};

} // namespace watch
} // namespace lw

#endif // LEDGERWATCH_SUBSCRIPTION_H
