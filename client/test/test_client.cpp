#include "Client.h"
#include "BinaryPack.hpp"
#include "FetchServer.h"
#include "TcpServer.h"
#include <gtest/gtest.h>

#include <atomic>
#include <mutex>

using namespace lw;

namespace {

Block sampleBlock() {
  Block block;
  block.index = 5;
  block.timestamp = 1700000000000;
  block.previousHash = "abc";
  Transaction tx;
  tx.fromWalletId = 1;
  tx.toWalletId = 2;
  tx.amount = 10;
  block.transactions.push_back(tx);
  block.hash = block.calculateHash();
  return block;
}

std::string packResponse(uint16_t errorCode, const std::string &payload) {
  Client::Response resp;
  resp.errorCode = errorCode;
  resp.payload = payload;
  return utl::binaryPack(resp);
}

} // namespace

// Fake node answering with canned responses
class ClientTest : public ::testing::Test {
protected:
  void SetUp() override {
    network::FetchServer::Config config;
    config.endpoint = { "127.0.0.1", 0 };
    config.handler = [this](const std::string &data, const network::TcpEndpoint &) {
      auto req = utl::binaryUnpack<Client::Request>(data);
      if (!req) {
        return packResponse(1, "bad request");
      }
      std::lock_guard<std::mutex> lock(mutex);
      lastType = req.value().type;
      lastPayload = req.value().payload;
      if (!rawReply.empty()) {
        return rawReply;
      }
      switch (req.value().type) {
      case Client::T_REQ_CONFIG: {
        ChainConfig chainConfig;
        chainConfig.blockInterval = std::chrono::milliseconds(750);
        chainConfig.maxTransactionsPerBlock = 9;
        return packResponse(0, utl::binaryPack(chainConfig));
      }
      case Client::T_REQ_BLOCK_LATEST:
      case Client::T_REQ_BLOCK_GET:
        return packResponse(0, sampleBlock().ltsToString());
      case Client::T_REQ_TX_ADD:
        return packResponse(0, "");
      default:
        return packResponse(4, "unsupported");
      }
    };
    auto started = server.start(config);
    ASSERT_TRUE(started.isOk()) << started.error().message;
    client.setEndpoint(server.getEndpoint());
  }

  void TearDown() override { server.stop(); }

  void setRawReply(const std::string &reply) {
    std::lock_guard<std::mutex> lock(mutex);
    rawReply = reply;
  }

  network::FetchServer server;
  Client client;

  std::mutex mutex;
  uint32_t lastType{ 0 };
  std::string lastPayload;
  std::string rawReply;
};

TEST_F(ClientTest, FetchLatestBlock) {
  auto result = client.fetchLatestBlock();
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_EQ(result.value(), sampleBlock());
  EXPECT_EQ(result.value().transactions.size(), 1u);
  EXPECT_EQ(lastType, Client::T_REQ_BLOCK_LATEST);
}

TEST_F(ClientTest, FetchBlockSendsIndex) {
  auto result = client.fetchBlock(42);
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_EQ(lastType, Client::T_REQ_BLOCK_GET);
  auto index = utl::binaryUnpack<uint64_t>(lastPayload);
  ASSERT_TRUE(index.isOk());
  EXPECT_EQ(index.value(), 42u);
}

TEST_F(ClientTest, FetchConfigRefreshesCache) {
  EXPECT_EQ(client.getConfig().blockInterval, ChainConfig::DEFAULT_BLOCK_INTERVAL);

  auto result = client.fetchConfig();
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_EQ(result.value().blockInterval, std::chrono::milliseconds(750));
  EXPECT_EQ(client.getConfig().blockInterval, std::chrono::milliseconds(750));
  EXPECT_EQ(client.getConfig().maxTransactionsPerBlock, 9u);
}

TEST_F(ClientTest, AddTransactionSendsPackedTransaction) {
  Transaction tx;
  tx.fromWalletId = 3;
  tx.toWalletId = 4;
  tx.amount = 99;
  tx.meta = "memo";
  ASSERT_TRUE(client.addTransaction(tx).isOk());
  EXPECT_EQ(lastType, Client::T_REQ_TX_ADD);
  auto sent = utl::binaryUnpack<Transaction>(lastPayload);
  ASSERT_TRUE(sent.isOk());
  EXPECT_EQ(sent.value(), tx);
}

TEST_F(ClientTest, ServerErrorIsReported) {
  setRawReply(packResponse(2, "Block not found: 42"));
  auto result = client.fetchBlock(42);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, Client::E_SERVER_ERROR);
  EXPECT_NE(result.error().message.find("Block not found"), std::string::npos);
}

TEST_F(ClientTest, GarbageResponseIsInvalid) {
  setRawReply("not a response");
  auto result = client.fetchLatestBlock();
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, Client::E_INVALID_RESPONSE);
}

TEST_F(ClientTest, UndecodableBlockIsParseError) {
  setRawReply(packResponse(0, "xx"));
  auto result = client.fetchLatestBlock();
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, Client::E_PARSE_ERROR);
}

TEST_F(ClientTest, UndecodableConfigKeepsCache) {
  setRawReply(packResponse(0, "x"));
  auto result = client.fetchConfig();
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, Client::E_PARSE_ERROR);
  EXPECT_EQ(client.getConfig().blockInterval, ChainConfig::DEFAULT_BLOCK_INTERVAL);
}

TEST(ClientStandaloneTest, RejectsMalformedEndpoint) {
  Client client;
  EXPECT_TRUE(client.setEndpoint("localhost").isError());
  EXPECT_TRUE(client.setEndpoint("localhost:notaport").isError());
  EXPECT_TRUE(client.setEndpoint(":8610").isError());
  EXPECT_TRUE(client.setEndpoint("localhost:8610").isOk());
  EXPECT_EQ(client.getEndpoint().port, 8610);
}

TEST(ClientStandaloneTest, RequiresEndpoint) {
  Client client;
  auto result = client.fetchLatestBlock();
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, Client::E_NOT_CONNECTED);
}

TEST(ClientStandaloneTest, UnreachableNodeIsRequestFailure) {
  uint16_t port;
  {
    network::TcpServer probe;
    ASSERT_TRUE(probe.listen({ "127.0.0.1", 0 }).isOk());
    port = probe.getEndpoint().port;
  }
  Client client;
  client.setEndpoint(network::TcpEndpoint{ "127.0.0.1", port });
  auto result = client.fetchLatestBlock();
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, Client::E_REQUEST_FAILED);
}

TEST(ClientStandaloneTest, ErrorMessages) {
  EXPECT_EQ(Client::getErrorMessage(Client::E_NOT_CONNECTED), "Not connected to server");
  EXPECT_EQ(Client::getErrorMessage(Client::E_SERVER_ERROR), "Server error");
  EXPECT_EQ(Client::getErrorMessage(999), "Unknown error");
}
