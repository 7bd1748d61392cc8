#include "Block.h"
#include "Serialize.hpp"
#include "Utilities.h"

#include <sstream>

namespace lw {

bool Transaction::operator==(const Transaction &other) const {
  return type == other.type && tokenId == other.tokenId &&
         fromWalletId == other.fromWalletId &&
         toWalletId == other.toWalletId && amount == other.amount &&
         fee == other.fee && meta == other.meta;
}

nlohmann::json Transaction::toJson() const {
  nlohmann::json j;
  j["type"] = type;
  j["tokenId"] = tokenId;
  j["fromWalletId"] = fromWalletId;
  j["toWalletId"] = toWalletId;
  j["amount"] = amount;
  j["fee"] = fee;
  j["meta"] = utl::toJsonSafeString(meta);
  return j;
}

std::string Block::calculateHash() const {
  std::ostringstream oss(std::ios::binary);
  OutputArchive ar(oss);
  ar & CURRENT_VERSION & index & timestamp & previousHash & transactions;
  return utl::sha256(oss.str());
}

std::string Block::ltsToString() const {
  std::ostringstream oss(std::ios::binary);
  OutputArchive ar(oss);
  ar & CURRENT_VERSION & *this;
  return oss.str();
}

bool Block::ltsFromString(const std::string &str) {
  std::istringstream iss(str, std::ios::binary);
  InputArchive ar(iss);
  uint16_t version = 0;
  ar & version;
  if (ar.failed() || version != CURRENT_VERSION) {
    return false;
  }
  Block decoded;
  ar & decoded;
  if (ar.failed()) {
    return false;
  }
  *this = std::move(decoded);
  return true;
}

nlohmann::json Block::toJson() const {
  nlohmann::json j;
  j["index"] = index;
  j["timestamp"] = timestamp;
  j["previousHash"] = previousHash;
  j["hash"] = hash;
  nlohmann::json txArray = nlohmann::json::array();
  for (const auto &tx : transactions) {
    txArray.push_back(tx.toJson());
  }
  j["transactions"] = txArray;
  return j;
}

nlohmann::json ChainConfig::toJson() const {
  nlohmann::json j;
  j["blockIntervalMs"] = blockInterval.count();
  j["maxTransactionsPerBlock"] = maxTransactionsPerBlock;
  return j;
}

} // namespace lw
