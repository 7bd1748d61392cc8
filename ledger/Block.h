#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace lw {

/**
 * Transaction carried inside a block. Has no identity of its own beyond
 * its position in the containing block.
 */
struct Transaction {
  constexpr static uint16_t T_DEFAULT = 0;
  constexpr static uint16_t T_MINT = 1;

  uint16_t type{ T_DEFAULT };
  uint64_t tokenId{ 0 };      // 0 = native token
  uint64_t fromWalletId{ 0 };
  uint64_t toWalletId{ 0 };
  int64_t amount{ 0 };
  int64_t fee{ 0 };
  std::string meta;

  template <typename Archive> void serialize(Archive &ar) {
    ar & type & tokenId & fromWalletId & toWalletId & amount & fee & meta;
  }

  bool operator==(const Transaction &other) const;
  bool operator!=(const Transaction &other) const { return !(*this == other); }

  nlohmann::json toJson() const;
};

/**
 * One ledger entry. Two blocks are equal when their hashes are equal: the
 * hash covers every other field.
 */
struct Block {
  static constexpr uint16_t CURRENT_VERSION = 1;

  uint64_t index{ 0 };
  int64_t timestamp{ 0 }; // ms since epoch
  std::string previousHash;
  std::string hash;
  std::vector<Transaction> transactions;

  template <typename Archive> void serialize(Archive &ar) {
    ar & index & timestamp & previousHash & hash & transactions;
  }

  /**
   * SHA-256 over the packed content fields (everything except hash)
   * @return Lowercase hex digest
   */
  std::string calculateHash() const;

  bool operator==(const Block &other) const { return hash == other.hash; }
  bool operator!=(const Block &other) const { return !(*this == other); }

  /**
   * Versioned binary form used on the wire
   */
  std::string ltsToString() const;

  /**
   * @param str Output of ltsToString()
   * @return true if successful
   */
  bool ltsFromString(const std::string &str);

  nlohmann::json toJson() const;
};

/**
 * Chain parameters published by a ledger node.
 */
struct ChainConfig {
  static constexpr std::chrono::milliseconds DEFAULT_BLOCK_INTERVAL{ 5000 };
  static constexpr uint32_t DEFAULT_MAX_TRANSACTIONS_PER_BLOCK = 100;

  std::chrono::milliseconds blockInterval{ DEFAULT_BLOCK_INTERVAL };
  uint32_t maxTransactionsPerBlock{ DEFAULT_MAX_TRANSACTIONS_PER_BLOCK };

  template <typename Archive> void serialize(Archive &ar) {
    int64_t intervalMs = blockInterval.count();
    ar & intervalMs & maxTransactionsPerBlock;
    // Only reading changes the value
    if (intervalMs != blockInterval.count()) {
      blockInterval = std::chrono::milliseconds(intervalMs);
    }
  }

  bool operator==(const ChainConfig &other) const {
    return blockInterval == other.blockInterval &&
           maxTransactionsPerBlock == other.maxTransactionsPerBlock;
  }

  nlohmann::json toJson() const;
};

} // namespace lw
