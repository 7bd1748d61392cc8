#include "../client/Client.h"
#include "../lib/Logger.h"
#include "../lib/Utilities.h"
#include "../watch/Subscription.h"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

using json = nlohmann::json;

namespace {
std::atomic<bool> g_interrupted{ false };

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_interrupted = true;
  }
}

struct ClientSettings {
  std::string endpoint{ lw::Client::DEFAULT_ENDPOINT };
  std::string logLevel{ "warning" };
};

// Missing keys keep their defaults
bool loadClientSettings(const std::string &path, ClientSettings &settings) {
  auto loaded = lw::utl::loadJsonFile(path);
  if (!loaded) {
    std::cerr << "Error: " << loaded.error().message << "\n";
    return false;
  }
  const json &jd = loaded.value();
  if (!jd.is_object()) {
    std::cerr << "Error: config must be a JSON object: " << path << "\n";
    return false;
  }
  if (jd.contains("endpoint")) {
    if (!jd["endpoint"].is_string()) {
      std::cerr << "Error: 'endpoint' must be a string\n";
      return false;
    }
    settings.endpoint = jd["endpoint"].get<std::string>();
  }
  if (jd.contains("logLevel")) {
    if (!jd["logLevel"].is_string()) {
      std::cerr << "Error: 'logLevel' must be a string\n";
      return false;
    }
    settings.logLevel = jd["logLevel"].get<std::string>();
  }
  return true;
}

int runWatch(lw::Client &client, bool watchBlocks, bool watchTransactions,
             int64_t durationS) {
  // Poll at the node's block interval
  auto config = client.fetchConfig();
  if (!config) {
    std::cerr << "Warning: " << config.error().message
              << ", polling at the default interval\n";
  }

  lw::watch::Subscription subscription(client);
  subscription.setErrorObserver([](const lw::iii::LedgerClient::Error &error) {
    std::cerr << "Poll failed: " << error.message << "\n";
  });

  if (watchBlocks) {
    auto handle = subscription.subscribeBlocks([](const std::vector<lw::Block> &blocks) {
      for (const auto &block : blocks) {
        std::cout << json{ { "block", block.toJson() } }.dump() << std::endl;
      }
    });
    if (!handle) {
      std::cerr << "Error: " << handle.error().message << "\n";
      return 1;
    }
  }

  if (watchTransactions) {
    auto handle = subscription.subscribeTransactions(
        [](const std::vector<lw::Transaction> &transactions) {
          if (transactions.empty()) {
            return;
          }
          json j = json::array();
          for (const auto &tx : transactions) {
            j.push_back(tx.toJson());
          }
          std::cout << json{ { "transactions", j } }.dump() << std::endl;
        });
    if (!handle) {
      std::cerr << "Error: " << handle.error().message << "\n";
      return 1;
    }
  }

  auto start = std::chrono::steady_clock::now();
  while (!g_interrupted) {
    if (durationS > 0 &&
        std::chrono::steady_clock::now() - start >= std::chrono::seconds(durationS)) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  return 0;
}
} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{ "lw-client - Command-line client for a ledgerwatch node" };
  app.require_subcommand(1);

  std::string configPath;
  app.add_option("-c,--config", configPath, "JSON config file (endpoint, logLevel)");

  std::string endpoint;
  app.add_option("-e,--endpoint", endpoint, "Node endpoint host:port (default: 127.0.0.1:8610)");

  std::string logLevel;
  app.add_option("--log-level", logLevel,
                 "Log level: debug, info, warning, error, critical");

  auto *config_cmd = app.add_subcommand("config", "Get the chain configuration");

  auto *latest_cmd = app.add_subcommand("latest", "Get the latest block");

  auto *block_cmd = app.add_subcommand("block", "Get block by index");
  uint64_t blockIndex = 0;
  block_cmd->add_option("index", blockIndex, "Block index")->required();

  auto *submit_cmd = app.add_subcommand("submit", "Submit a transaction");
  uint64_t fromWalletId = 0, toWalletId = 0;
  int64_t amount = 0;
  int64_t fee = 0;
  std::string meta;
  submit_cmd->add_option("--from", fromWalletId, "From wallet ID")->required();
  submit_cmd->add_option("--to", toWalletId, "To wallet ID")->required();
  submit_cmd->add_option("--amount", amount, "Amount to transfer")->required();
  submit_cmd->add_option("--fee", fee, "Transaction fee (default: 0)")->default_val(0);
  submit_cmd->add_option("--meta", meta, "Free-form metadata");

  auto *watch_cmd = app.add_subcommand("watch", "Print new blocks and transactions as JSON lines");
  bool watchBlocks = false;
  bool watchTransactions = false;
  int64_t durationS = 0;
  watch_cmd->add_flag("--blocks", watchBlocks, "Watch blocks");
  watch_cmd->add_flag("--transactions", watchTransactions, "Watch transactions");
  watch_cmd->add_option("--duration-s", durationS, "Stop after this many seconds (0 = until Ctrl+C)")
      ->default_val(0)
      ->check(CLI::NonNegativeNumber);

  app.footer("Example:\n"
             "  lw-client -e 127.0.0.1:8610 submit --from 1 --to 2 --amount 10\n"
             "  lw-client watch --blocks --transactions --duration-s 30\n");

  CLI11_PARSE(app, argc, argv);

  ClientSettings settings;
  if (!configPath.empty() && !loadClientSettings(configPath, settings)) {
    return 1;
  }
  if (!endpoint.empty()) {
    settings.endpoint = endpoint;
  }
  if (!logLevel.empty()) {
    settings.logLevel = logLevel;
  }

  lw::logging::Level level;
  if (!lw::logging::parseLevel(settings.logLevel, level)) {
    std::cerr << "Error: unknown log level: " << settings.logLevel << "\n";
    return 1;
  }
  lw::logging::setLevel(level);

  lw::Client client;
  auto endpointResult = client.setEndpoint(settings.endpoint);
  if (!endpointResult) {
    std::cerr << "Error: " << endpointResult.error().message << "\n";
    return 1;
  }

  int exitCode = 0;

  if (config_cmd->parsed()) {
    auto result = client.fetchConfig();
    if (result) {
      std::cout << result.value().toJson().dump(2) << "\n";
    } else {
      std::cerr << "Error: " << result.error().message << "\n";
      exitCode = 1;
    }
  } else if (latest_cmd->parsed()) {
    auto result = client.fetchLatestBlock();
    if (result) {
      std::cout << result.value().toJson().dump(2) << "\n";
    } else {
      std::cerr << "Error: " << result.error().message << "\n";
      exitCode = 1;
    }
  } else if (block_cmd->parsed()) {
    auto result = client.fetchBlock(blockIndex);
    if (result) {
      std::cout << result.value().toJson().dump(2) << "\n";
    } else {
      std::cerr << "Error: " << result.error().message << "\n";
      exitCode = 1;
    }
  } else if (submit_cmd->parsed()) {
    lw::Transaction tx;
    tx.type = lw::Transaction::T_DEFAULT;
    tx.fromWalletId = fromWalletId;
    tx.toWalletId = toWalletId;
    tx.amount = amount;
    tx.fee = fee;
    tx.meta = meta;
    auto result = client.addTransaction(tx);
    if (result) {
      std::cout << "Transaction submitted successfully\n";
    } else {
      std::cerr << "Error: " << result.error().message << "\n";
      exitCode = 1;
    }
  } else if (watch_cmd->parsed()) {
    if (!watchBlocks && !watchTransactions) {
      watchBlocks = true;
      watchTransactions = true;
    }
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    exitCode = runWatch(client, watchBlocks, watchTransactions, durationS);
  }

  return exitCode;
}
