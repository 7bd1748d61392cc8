#include "MemoryChain.h"

namespace lw {

MemoryChain::MemoryChain() : Module("ledger.chain") {
  Block genesis;
  genesis.index = 0;
  genesis.timestamp = 0;
  genesis.hash = genesis.calculateHash();
  blocks_.push_back(genesis);
}

Block MemoryChain::appendBlock(const std::vector<Transaction> &transactions,
                               int64_t timestamp) {
  std::lock_guard<std::mutex> lock(mutex_);
  Block block;
  block.index = blocks_.size();
  block.timestamp = timestamp;
  block.previousHash = blocks_.back().hash;
  block.transactions = transactions;
  block.hash = block.calculateHash();
  blocks_.push_back(block);

  log().debug << "Appended block " << block.index << " with "
              << block.transactions.size() << " transactions";
  return block;
}

MemoryChain::Roe<Block> MemoryChain::readBlock(uint64_t index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index >= blocks_.size()) {
    return Error(E_BLOCK_NOT_FOUND,
                 "Block not found: " + std::to_string(index));
  }
  return blocks_[index];
}

MemoryChain::Roe<Block> MemoryChain::readLastBlock() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (blocks_.empty()) {
    return Error(E_CHAIN_EMPTY, "Chain is empty");
  }
  return blocks_.back();
}

uint64_t MemoryChain::getNextBlockId() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blocks_.size();
}

size_t MemoryChain::getSize() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blocks_.size();
}

bool MemoryChain::isValid() const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (size_t i = 0; i < blocks_.size(); ++i) {
    const Block &block = blocks_[i];
    if (block.index != i) {
      return false;
    }
    if (block.hash != block.calculateHash()) {
      return false;
    }
    if (i > 0 && block.previousHash != blocks_[i - 1].hash) {
      return false;
    }
  }
  return true;
}

} // namespace lw
