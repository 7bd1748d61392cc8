#include "Subscription.h"

#include <algorithm>
#include <exception>
#include <future>

namespace lw {
namespace watch {

Subscription::Subscription(iii::LedgerClient &client)
    : Module("watch.subscription"), client_(client) {
  thread_ = std::thread(&Subscription::runLoop, this);
  loopThreadId_ = thread_.get_id();
}

Subscription::~Subscription() {
  Command quit;
  quit.quit = true;
  commands_.push(std::move(quit));
  if (thread_.joinable()) {
    thread_.join();
  }
}

void Subscription::runLoop() {
  while (true) {
    if (deadline_ && std::chrono::steady_clock::now() >= *deadline_) {
      tick();
      // Fixed delay: measured from the end of the poll. A receiver may have
      // stopped polling during the tick.
      if (deadline_) {
        deadline_ = std::chrono::steady_clock::now() + interval_;
      }
      continue;
    }

    Command command;
    if (deadline_) {
      if (!commands_.waitPollUntil(command, *deadline_)) {
        continue;
      }
    } else {
      commands_.waitPoll(command);
    }

    if (command.quit) {
      break;
    }
    command.action();
  }

  polling_ = false;
}

void Subscription::execute(const std::function<void()> &action) {
  if (std::this_thread::get_id() == loopThreadId_) {
    action();
    return;
  }

  auto spDone = std::make_shared<std::promise<void>>();
  std::future<void> done = spDone->get_future();
  Command command;
  command.action = [action, spDone]() {
    try {
      action();
      spDone->set_value();
    } catch (...) {
      // Rethrown to the caller by done.get()
      spDone->set_exception(std::current_exception());
    }
  };
  commands_.push(std::move(command));
  done.get();
}

Subscription::Roe<Subscription::Handle>
Subscription::subscribeBlocks(std::shared_ptr<BlockReceiver> spReceiver) {
  if (!spReceiver) {
    return Error(E_INVALID_RECEIVER, "Block receiver is null");
  }

  Handle handle = 0;
  execute([this, &spReceiver, &handle]() {
    for (const auto &entry : blockReceivers_) {
      if (entry.second.spReceiver == spReceiver) {
        handle = entry.first;
        return;
      }
    }
    BlockEntry entry;
    entry.spReceiver = spReceiver;
    handle = addBlockEntry(std::move(entry));
  });
  return handle;
}

Subscription::Roe<Subscription::Handle>
Subscription::subscribeBlocks(BlockCallback callback) {
  if (!callback) {
    return Error(E_INVALID_RECEIVER, "Block callback is empty");
  }

  Handle handle = 0;
  execute([this, &callback, &handle]() {
    BlockEntry entry;
    entry.callback = std::move(callback);
    handle = addBlockEntry(std::move(entry));
  });
  return handle;
}

void Subscription::unsubscribeBlocks(Handle handle) {
  execute([this, handle]() {
    size_t erased;
    {
      std::lock_guard<std::mutex> lock(stateMutex_);
      erased = blockReceivers_.erase(handle);
    }
    if (erased > 0) {
      log().debug << "Removed block receiver " << handle;
      updatePolling();
    }
  });
}

Subscription::Roe<Subscription::Handle> Subscription::subscribeTransactions(
    std::shared_ptr<TransactionReceiver> spReceiver) {
  if (!spReceiver) {
    return Error(E_INVALID_RECEIVER, "Transaction receiver is null");
  }

  Handle handle = 0;
  execute([this, &spReceiver, &handle]() {
    for (const auto &entry : transactionReceivers_) {
      if (entry.second.spReceiver == spReceiver) {
        handle = entry.first;
        return;
      }
    }
    TransactionEntry entry;
    entry.spReceiver = spReceiver;
    handle = addTransactionEntry(std::move(entry));
  });
  return handle;
}

Subscription::Roe<Subscription::Handle>
Subscription::subscribeTransactions(TransactionCallback callback) {
  if (!callback) {
    return Error(E_INVALID_RECEIVER, "Transaction callback is empty");
  }

  Handle handle = 0;
  execute([this, &callback, &handle]() {
    TransactionEntry entry;
    entry.callback = std::move(callback);
    handle = addTransactionEntry(std::move(entry));
  });
  return handle;
}

void Subscription::unsubscribeTransactions(Handle handle) {
  execute([this, handle]() {
    size_t erased;
    {
      std::lock_guard<std::mutex> lock(stateMutex_);
      erased = transactionReceivers_.erase(handle);
    }
    if (erased > 0) {
      log().debug << "Removed transaction receiver " << handle;
      updatePolling();
    }
  });
}

void Subscription::setErrorObserver(ErrorObserver observer) {
  execute([this, &observer]() { errorObserver_ = std::move(observer); });
}

bool Subscription::isPolling() const { return polling_; }

size_t Subscription::countBlockReceivers() const {
  std::lock_guard<std::mutex> lock(stateMutex_);
  return blockReceivers_.size();
}

size_t Subscription::countTransactionReceivers() const {
  std::lock_guard<std::mutex> lock(stateMutex_);
  return transactionReceivers_.size();
}

std::optional<Block> Subscription::getLatestBlock() const {
  std::lock_guard<std::mutex> lock(stateMutex_);
  return latestBlock_;
}

Subscription::Handle Subscription::addBlockEntry(BlockEntry entry) {
  Handle handle = nextHandle_++;
  {
    std::lock_guard<std::mutex> lock(stateMutex_);
    blockReceivers_.emplace(handle, std::move(entry));
  }
  try {
    updatePolling();
  } catch (...) {
    // Registration did not happen
    {
      std::lock_guard<std::mutex> lock(stateMutex_);
      blockReceivers_.erase(handle);
    }
    updatePolling();
    throw;
  }
  log().debug << "Added block receiver " << handle;
  return handle;
}

Subscription::Handle Subscription::addTransactionEntry(TransactionEntry entry) {
  Handle handle = nextHandle_++;
  {
    std::lock_guard<std::mutex> lock(stateMutex_);
    transactionReceivers_.emplace(handle, std::move(entry));
  }
  try {
    updatePolling();
  } catch (...) {
    {
      std::lock_guard<std::mutex> lock(stateMutex_);
      transactionReceivers_.erase(handle);
    }
    updatePolling();
    throw;
  }
  log().debug << "Added transaction receiver " << handle;
  return handle;
}

void Subscription::updatePolling() {
  if (blockReceivers_.empty() && transactionReceivers_.empty()) {
    stopTimer();
  } else {
    startTimer();
  }
}

void Subscription::startTimer() {
  if (deadline_) {
    return;
  }

  interval_ = std::max(client_.getConfig().blockInterval, MIN_POLL_INTERVAL);
  deadline_ = std::chrono::steady_clock::now();
  polling_ = true;
  log().debug << "Polling started, interval " << interval_.count() << " ms";

  // Priming poll seeds the cursor; a failure leaves it unset
  auto primed = client_.fetchLatestBlock();
  if (primed) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    latestBlock_ = primed.value();
  } else {
    notifyError(primed.error());
  }
  // First tick is due once priming is done
  deadline_ = std::chrono::steady_clock::now();
}

void Subscription::stopTimer() {
  if (!deadline_) {
    return;
  }
  // Ticks only run on this thread, so none is in progress here
  deadline_.reset();
  polling_ = false;
  log().debug << "Polling stopped";
}

void Subscription::tick() {
  auto result = client_.fetchLatestBlock();
  if (!result) {
    notifyError(result.error());
    return;
  }

  const Block &head = result.value();
  {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (latestBlock_ && *latestBlock_ == head) {
      return;
    }
    latestBlock_ = head;
  }

  std::vector<Block> newBlocks{ head };
  std::vector<Transaction> newTransactions;
  for (const auto &block : newBlocks) {
    newTransactions.insert(newTransactions.end(), block.transactions.begin(),
                           block.transactions.end());
  }

  dispatchBlocks(newBlocks);
  dispatchTransactions(newTransactions);
}

void Subscription::dispatchBlocks(const std::vector<Block> &blocks) {
  // Receivers may change the registry while being called
  auto snapshot = blockReceivers_;
  for (const auto &item : snapshot) {
    if (blockReceivers_.find(item.first) == blockReceivers_.end()) {
      continue;
    }
    try {
      if (item.second.spReceiver) {
        item.second.spReceiver->onBlocks(blocks);
      } else {
        item.second.callback(blocks);
      }
    } catch (const std::exception &e) {
      log().error << "Block receiver " << item.first << " failed: " << e.what();
    } catch (...) {
      log().error << "Block receiver " << item.first << " failed: unknown exception";
    }
  }
}

void Subscription::dispatchTransactions(
    const std::vector<Transaction> &transactions) {
  auto snapshot = transactionReceivers_;
  for (const auto &item : snapshot) {
    if (transactionReceivers_.find(item.first) == transactionReceivers_.end()) {
      continue;
    }
    try {
      if (item.second.spReceiver) {
        item.second.spReceiver->onTransactions(transactions);
      } else {
        item.second.callback(transactions);
      }
    } catch (const std::exception &e) {
      log().error << "Transaction receiver " << item.first
                  << " failed: " << e.what();
    } catch (...) {
      log().error << "Transaction receiver " << item.first
                  << " failed: unknown exception";
    }
  }
}

void Subscription::notifyError(const iii::LedgerClient::Error &error) {
  if (!errorObserver_) {
    return;
  }
  try {
    errorObserver_(error);
  } catch (const std::exception &e) {
    log().error << "Error observer failed: " << e.what();
  } catch (...) {
    log().error << "Error observer failed: unknown exception";
  }
}

} // namespace watch
} // namespace lw
