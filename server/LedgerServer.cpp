#include "LedgerServer.h"
#include "../lib/BinaryPack.hpp"
#include "../lib/Utilities.h"

#include <algorithm>

namespace lw {

// Config

nlohmann::json LedgerServer::Config::ltsToJson() const {
  nlohmann::json j;
  j["host"] = host;
  j["port"] = port;
  j["blockIntervalMs"] = blockInterval.count();
  j["maxTransactionsPerBlock"] = maxTransactionsPerBlock;
  j["maxPendingTransactions"] = maxPendingTransactions;
  j["produceEmptyBlocks"] = produceEmptyBlocks;
  j["whitelist"] = whitelist;
  return j;
}

LedgerServer::Roe<void>
LedgerServer::Config::ltsFromJson(const nlohmann::json &jd) {
  if (!jd.is_object()) {
    return Error(E_CONFIG, "Configuration must be a JSON object");
  }

  try {
    if (jd.contains("host")) {
      if (!jd["host"].is_string()) {
        return Error(E_CONFIG, "Field 'host' must be a string");
      }
      host = jd["host"].get<std::string>();
      if (host.empty()) {
        return Error(E_CONFIG, "Field 'host' cannot be empty");
      }
    }

    if (jd.contains("port")) {
      if (!jd["port"].is_number_unsigned()) {
        return Error(E_CONFIG, "Field 'port' must be a positive number");
      }
      uint64_t portValue = jd["port"].get<uint64_t>();
      if (portValue > 65535) {
        return Error(E_CONFIG, "Field 'port' must be between 0 and 65535");
      }
      port = static_cast<uint16_t>(portValue);
    }

    if (jd.contains("blockIntervalMs")) {
      if (!jd["blockIntervalMs"].is_number_unsigned() ||
          jd["blockIntervalMs"].get<uint64_t>() == 0) {
        return Error(E_CONFIG, "Field 'blockIntervalMs' must be a positive number");
      }
      blockInterval = std::chrono::milliseconds(jd["blockIntervalMs"].get<uint64_t>());
    }

    if (jd.contains("maxTransactionsPerBlock")) {
      if (!jd["maxTransactionsPerBlock"].is_number_unsigned() ||
          jd["maxTransactionsPerBlock"].get<uint64_t>() == 0 ||
          jd["maxTransactionsPerBlock"].get<uint64_t>() > UINT32_MAX) {
        return Error(E_CONFIG, "Field 'maxTransactionsPerBlock' must be a positive 32-bit number");
      }
      maxTransactionsPerBlock = jd["maxTransactionsPerBlock"].get<uint32_t>();
    }

    if (jd.contains("maxPendingTransactions")) {
      if (!jd["maxPendingTransactions"].is_number_unsigned()) {
        return Error(E_CONFIG, "Field 'maxPendingTransactions' must be a positive number");
      }
      maxPendingTransactions = jd["maxPendingTransactions"].get<uint64_t>();
    }

    if (jd.contains("produceEmptyBlocks")) {
      if (!jd["produceEmptyBlocks"].is_boolean()) {
        return Error(E_CONFIG, "Field 'produceEmptyBlocks' must be a boolean");
      }
      produceEmptyBlocks = jd["produceEmptyBlocks"].get<bool>();
    }

    if (jd.contains("whitelist")) {
      if (!jd["whitelist"].is_array()) {
        return Error(E_CONFIG, "Field 'whitelist' must be an array");
      }
      whitelist.clear();
      for (const auto &item : jd["whitelist"]) {
        if (!item.is_string()) {
          return Error(E_CONFIG, "Field 'whitelist' must contain only strings");
        }
        whitelist.push_back(item.get<std::string>());
      }
    }
  } catch (const nlohmann::json::exception &e) {
    return Error(E_CONFIG, std::string("Failed to parse configuration: ") + e.what());
  }
  return {};
}

// LedgerServer

LedgerServer::LedgerServer() : Service("ledger_server") {
  fetchServer_.redirectLogger(log().getFullName());
  initHandlers();
}

LedgerServer::~LedgerServer() { stop(); }

LedgerServer::Roe<LedgerServer::Config>
LedgerServer::loadConfig(const std::string &configPath) {
  auto jsonResult = utl::loadJsonFile(configPath);
  if (!jsonResult) {
    return Error(E_CONFIG, "Failed to load config: " + jsonResult.error().message);
  }
  Config config;
  auto parsed = config.ltsFromJson(jsonResult.value());
  if (!parsed) {
    return parsed.error();
  }
  return config;
}

void LedgerServer::initHandlers() {
  requestHandlers_[Client::T_REQ_CONFIG] = [this](const Client::Request &request) {
    return hConfig(request);
  };
  requestHandlers_[Client::T_REQ_BLOCK_LATEST] = [this](const Client::Request &request) {
    return hBlockLatest(request);
  };
  requestHandlers_[Client::T_REQ_BLOCK_GET] = [this](const Client::Request &request) {
    return hBlockGet(request);
  };
  requestHandlers_[Client::T_REQ_TX_ADD] = [this](const Client::Request &request) {
    return hTxAdd(request);
  };
}

Service::Roe<void> LedgerServer::start(const Config &config) {
  config_ = config;
  return Service::start();
}

Service::Roe<void> LedgerServer::onStart() {
  network::FetchServer::Config fetchConfig;
  fetchConfig.endpoint = { config_.host, config_.port };
  fetchConfig.whitelist = config_.whitelist;
  fetchConfig.handler = [this](const std::string &request,
                               const network::TcpEndpoint &) {
    return handleRequest(request);
  };

  auto result = fetchServer_.start(fetchConfig);
  if (!result) {
    return Service::Error(E_NETWORK, "Failed to start fetch server: " + result.error().message);
  }

  log().info << "Ledger node serving on " << fetchServer_.getEndpoint()
             << " (block interval " << config_.blockInterval.count() << " ms)";
  return {};
}

void LedgerServer::onStop() { fetchServer_.stop(); }

void LedgerServer::runLoop() {
  while (!isStopSet()) {
    if (waitForStop(config_.blockInterval)) {
      break;
    }
    produceBlock();
  }
}

ChainConfig LedgerServer::getChainConfig() const {
  ChainConfig chainConfig;
  chainConfig.blockInterval = config_.blockInterval;
  chainConfig.maxTransactionsPerBlock = config_.maxTransactionsPerBlock;
  return chainConfig;
}

size_t LedgerServer::getPendingCount() const {
  std::lock_guard<std::mutex> lock(pendingMutex_);
  return pending_.size();
}

LedgerServer::Roe<void> LedgerServer::addTransaction(const Transaction &tx) {
  if (tx.amount <= 0) {
    return Error(E_INVALID_TX, "Transaction amount must be positive");
  }
  if (tx.fee < 0) {
    return Error(E_INVALID_TX, "Transaction fee must not be negative");
  }

  std::lock_guard<std::mutex> lock(pendingMutex_);
  if (pending_.size() >= config_.maxPendingTransactions) {
    return Error(E_QUEUE_FULL, "Too many pending transactions");
  }
  pending_.push_back(tx);
  return {};
}

bool LedgerServer::produceBlock() {
  std::vector<Transaction> transactions;
  {
    std::lock_guard<std::mutex> lock(pendingMutex_);
    size_t count = std::min<size_t>(pending_.size(), config_.maxTransactionsPerBlock);
    transactions.assign(pending_.begin(), pending_.begin() + count);
    pending_.erase(pending_.begin(), pending_.begin() + count);
  }

  if (transactions.empty() && !config_.produceEmptyBlocks) {
    return false;
  }

  Block block = chain_.appendBlock(transactions, utl::getCurrentTimeMs());
  log().info << "Produced block " << block.index << " with "
             << block.transactions.size() << " transactions";
  return true;
}

std::string LedgerServer::binaryResponseOk(const std::string &payload) const {
  Client::Response resp;
  resp.payload = payload;
  return utl::binaryPack(resp);
}

std::string LedgerServer::binaryResponseError(uint16_t errorCode,
                                              const std::string &message) const {
  Client::Response resp;
  resp.errorCode = errorCode;
  resp.payload = message;
  return utl::binaryPack(resp);
}

std::string LedgerServer::handleRequest(const std::string &request) {
  auto reqResult = utl::binaryUnpack<Client::Request>(request);
  if (!reqResult) {
    log().warning << "Malformed request: " << reqResult.error().message;
    return binaryResponseError(RE_BAD_REQUEST, "Malformed request");
  }

  const Client::Request &req = reqResult.value();
  if (req.version != Client::Request::VERSION) {
    return binaryResponseError(RE_BAD_REQUEST, "Unsupported request version: " +
                                                   std::to_string(req.version));
  }

  auto it = requestHandlers_.find(req.type);
  if (it == requestHandlers_.end()) {
    log().warning << "Unsupported request type: " << req.type;
    return binaryResponseError(RE_UNSUPPORTED, "Unsupported request type: " +
                                                   std::to_string(req.type));
  }

  auto result = it->second(req);
  if (!result) {
    log().debug << "Request " << req.type << " failed: " << result.error().message;
    return binaryResponseError(static_cast<uint16_t>(result.error().code),
                               result.error().message);
  }
  return binaryResponseOk(result.value());
}

LedgerServer::Roe<std::string> LedgerServer::hConfig(const Client::Request &request) {
  return utl::binaryPack(getChainConfig());
}

LedgerServer::Roe<std::string>
LedgerServer::hBlockLatest(const Client::Request &request) {
  auto result = chain_.readLastBlock();
  if (!result) {
    return Error(RE_NOT_FOUND, result.error().message);
  }
  return result.value().ltsToString();
}

LedgerServer::Roe<std::string> LedgerServer::hBlockGet(const Client::Request &request) {
  auto idResult = utl::binaryUnpack<uint64_t>(request.payload);
  if (!idResult) {
    return Error(RE_BAD_REQUEST, "Invalid block id: " + idResult.error().message);
  }
  auto result = chain_.readBlock(idResult.value());
  if (!result) {
    return Error(RE_NOT_FOUND, result.error().message);
  }
  return result.value().ltsToString();
}

LedgerServer::Roe<std::string> LedgerServer::hTxAdd(const Client::Request &request) {
  auto txResult = utl::binaryUnpack<Transaction>(request.payload);
  if (!txResult) {
    return Error(RE_BAD_REQUEST, "Invalid transaction: " + txResult.error().message);
  }
  auto result = addTransaction(txResult.value());
  if (!result) {
    return Error(RE_INVALID_TX, result.error().message);
  }
  log().debug << "Queued transaction " << txResult.value().fromWalletId << " -> "
              << txResult.value().toWalletId << " amount " << txResult.value().amount;
  return std::string();
}

} // namespace lw
