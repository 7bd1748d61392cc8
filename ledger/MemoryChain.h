#pragma once

#include "Block.h"
#include "Module.h"
#include "ResultOrError.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace lw {

/**
 * In-memory hash-linked chain
 *
 * Starts with a genesis block (index 0, no transactions, empty previous
 * hash). Every appended block links to the hash of its predecessor.
 * All methods are thread-safe.
 */
class MemoryChain : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr const int32_t E_BLOCK_NOT_FOUND = 1;
  static constexpr const int32_t E_CHAIN_EMPTY = 2;

  MemoryChain();
  ~MemoryChain() override = default;

  /**
   * Append a block holding the given transactions
   * @param transactions Transactions of the new block (may be empty)
   * @param timestamp Block time in ms since epoch
   * @return The appended block
   */
  Block appendBlock(const std::vector<Transaction> &transactions,
                    int64_t timestamp);

  Roe<Block> readBlock(uint64_t index) const;
  Roe<Block> readLastBlock() const;

  uint64_t getNextBlockId() const;
  size_t getSize() const;

  /**
   * Every stored hash matches its content and every previousHash points at
   * the predecessor's hash.
   */
  bool isValid() const;

private:
  mutable std::mutex mutex_;
  std::vector<Block> blocks_;
};

} // namespace lw
