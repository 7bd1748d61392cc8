#include "FetchClient.h"
#include "FetchServer.h"
#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace lw::network;

class FetchServerTest : public ::testing::Test {
protected:
  void TearDown() override { server.stop(); }

  void startEcho(std::vector<std::string> whitelist = {}) {
    FetchServer::Config config;
    config.endpoint = { "127.0.0.1", 0 };
    config.whitelist = std::move(whitelist);
    config.handler = [this](const std::string &req, const TcpEndpoint &) {
      ++requests;
      if (req == "throw") {
        throw std::runtime_error("handler failure");
      }
      return "Echo: " + req;
    };
    auto started = server.start(config);
    ASSERT_TRUE(started.isOk()) << started.error().message;
  }

  FetchServer server;
  FetchClient client;
  std::atomic<int> requests{ 0 };
};

TEST_F(FetchServerTest, StartsAndStops) {
  startEcho();
  EXPECT_TRUE(server.isRunning());
  EXPECT_NE(server.getEndpoint().port, 0);

  server.stop();
  EXPECT_FALSE(server.isRunning());
}

TEST_F(FetchServerTest, StartWithoutHandlerFails) {
  FetchServer::Config config;
  config.endpoint = { "127.0.0.1", 0 };
  EXPECT_TRUE(server.start(config).isError());
  EXPECT_FALSE(server.isRunning());
}

TEST_F(FetchServerTest, FailsToStartOnUsedPort) {
  startEcho();
  FetchServer other;
  FetchServer::Config config;
  config.endpoint = server.getEndpoint();
  config.handler = [](const std::string &, const TcpEndpoint &) { return std::string(); };
  EXPECT_TRUE(other.start(config).isError());
}

TEST_F(FetchServerTest, FetchSyncRoundTrip) {
  startEcho();
  auto response = client.fetchSync(server.getEndpoint(), "hello",
                                   std::chrono::milliseconds(2000));
  ASSERT_TRUE(response.isOk()) << response.error().message;
  EXPECT_EQ(response.value(), "Echo: hello");
}

TEST_F(FetchServerTest, HandlesBinaryAndLargePayloads) {
  startEcho();
  std::string payload(200000, '\0');
  for (size_t i = 0; i < payload.size(); ++i) {
    payload[i] = static_cast<char>(i % 251);
  }
  auto response = client.fetchSync(server.getEndpoint(), payload,
                                   std::chrono::milliseconds(5000));
  ASSERT_TRUE(response.isOk()) << response.error().message;
  EXPECT_EQ(response.value(), "Echo: " + payload);
}

TEST_F(FetchServerTest, SequentialRequests) {
  startEcho();
  for (int i = 0; i < 5; ++i) {
    auto response = client.fetchSync(server.getEndpoint(), std::to_string(i));
    ASSERT_TRUE(response.isOk());
    EXPECT_EQ(response.value(), "Echo: " + std::to_string(i));
  }
  EXPECT_EQ(requests.load(), 5);
}

TEST_F(FetchServerTest, ConcurrentClients) {
  startEcho();
  std::atomic<int> ok{ 0 };
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([this, &ok, i]() {
      FetchClient c;
      auto response = c.fetchSync(server.getEndpoint(), "c" + std::to_string(i));
      if (response.isOk() && response.value() == "Echo: c" + std::to_string(i)) {
        ++ok;
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }
  EXPECT_EQ(ok.load(), 4);
}

TEST_F(FetchServerTest, HandlerExceptionClosesConnection) {
  startEcho();
  auto response = client.fetchSync(server.getEndpoint(), "throw");
  // Connection closed without a response body
  if (response.isOk()) {
    EXPECT_TRUE(response.value().empty());
  }
  // Server keeps serving
  auto next = client.fetchSync(server.getEndpoint(), "again");
  ASSERT_TRUE(next.isOk());
  EXPECT_EQ(next.value(), "Echo: again");
}

TEST_F(FetchServerTest, WhitelistRejectsOtherPeers) {
  startEcho({ "10.1.2.3" });
  auto response = client.fetchSync(server.getEndpoint(), "hello",
                                   std::chrono::milliseconds(2000));
  if (response.isOk()) {
    EXPECT_TRUE(response.value().empty());
  }
  EXPECT_EQ(requests.load(), 0);
}

TEST_F(FetchServerTest, WhitelistAllowsListedPeer) {
  startEcho({ "127.0.0.1" });
  auto response = client.fetchSync(server.getEndpoint(), "hello");
  ASSERT_TRUE(response.isOk());
  EXPECT_EQ(response.value(), "Echo: hello");
}

TEST(FetchClientTest, FetchSyncFailsWithInvalidHost) {
  FetchClient client;
  auto result = client.fetchSync({ "invalid-host-that-does-not-exist.invalid", 9999 },
                                 "Hello", std::chrono::milliseconds(1000));
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, FetchClient::E_CONNECT);
}
