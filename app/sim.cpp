#include "../lib/Logger.h"
#include "../server/LedgerServer.h"

#include <CLI/CLI.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

namespace {
std::atomic<bool> g_interrupted{ false };

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_interrupted = true;
  }
}
} // namespace

int runSim(const lw::LedgerServer::Config &config) {
  auto logger = lw::logging::getLogger("lw");

  lw::LedgerServer server;
  server.redirectLogger("lw.S");

  auto startResult = server.start(config);
  if (!startResult) {
    logger.error << "Failed to start ledger node: " + startResult.error().message;
    return 1;
  }

  logger.info << "Ledger node listening on " << server.getEndpoint()
              << ", block interval " << config.blockInterval.count() << " ms";

  while (!g_interrupted && server.isRunning()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  server.stop();
  logger.info << "Ledger node stopped at block " << server.getChain().getNextBlockId() - 1;
  return 0;
}

int main(int argc, char *argv[]) {
  CLI::App app{ "lw-sim - Simulated ledger node for ledgerwatch" };

  std::string configPath;
  app.add_option("-c,--config", configPath, "JSON config file");

  uint16_t port = 0;
  app.add_option("-p,--port", port, "Listen port (overrides config)")
      ->check(CLI::Range(1, 65535));

  int64_t blockIntervalMs = 0;
  app.add_option("--block-interval-ms", blockIntervalMs,
                 "Block production interval in milliseconds (overrides config)")
      ->check(CLI::PositiveNumber);

  bool emptyBlocks = false;
  app.add_flag("--empty-blocks", emptyBlocks,
               "Produce blocks even when no transaction is pending");

  std::string logLevel = "info";
  app.add_option("--log-level", logLevel,
                 "Log level: debug, info, warning, error, critical")
      ->capture_default_str();

  app.footer("Example:\n"
             "  lw-sim --port 8610 --block-interval-ms 1000 --empty-blocks\n");

  CLI11_PARSE(app, argc, argv);

  lw::logging::Level level;
  if (!lw::logging::parseLevel(logLevel, level)) {
    std::cerr << "Error: unknown log level: " << logLevel << "\n";
    return 1;
  }
  lw::logging::setLevel(level);

  lw::LedgerServer::Config config;
  if (!configPath.empty()) {
    auto loaded = lw::LedgerServer::loadConfig(configPath);
    if (!loaded) {
      std::cerr << "Error: " << loaded.error().message << "\n";
      return 1;
    }
    config = loaded.value();
  }

  if (port != 0) {
    config.port = port;
  }
  if (blockIntervalMs > 0) {
    config.blockInterval = std::chrono::milliseconds(blockIntervalMs);
  }
  if (emptyBlocks) {
    config.produceEmptyBlocks = true;
  }

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  return runSim(config);
}
