#include "TcpClient.h"
#include "TcpServer.h"
#include <gtest/gtest.h>

#include <thread>

using namespace lw::network;

TEST(TcpEndpointTest, ParsesHostAndPort) {
  auto ep = TcpEndpoint::ltsFromString("127.0.0.1:8610");
  EXPECT_EQ(ep.address, "127.0.0.1");
  EXPECT_EQ(ep.port, 8610);
  EXPECT_EQ(ep.ltsToString(), "127.0.0.1:8610");
}

TEST(TcpEndpointTest, MalformedPortIsZero) {
  EXPECT_EQ(TcpEndpoint::ltsFromString("localhost").port, 0);
  EXPECT_EQ(TcpEndpoint::ltsFromString("localhost:").port, 0);
  EXPECT_EQ(TcpEndpoint::ltsFromString("localhost:abc").port, 0);
  EXPECT_EQ(TcpEndpoint::ltsFromString("localhost:70000").port, 0);
}

class TcpServerTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto result = server.listen({ "127.0.0.1", 0 });
    ASSERT_TRUE(result.isOk()) << result.error().message;
  }

  void TearDown() override { server.stop(); }

  TcpServer server;
};

TEST_F(TcpServerTest, BindsEphemeralPort) {
  EXPECT_TRUE(server.isListening());
  EXPECT_NE(server.getEndpoint().port, 0);
  EXPECT_EQ(server.getEndpoint().address, "127.0.0.1");
}

TEST_F(TcpServerTest, ListenTwiceFails) {
  auto result = server.listen({ "127.0.0.1", 0 });
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, TcpServer::E_STATE);
}

TEST_F(TcpServerTest, SecondServerOnSamePortFails) {
  TcpServer other;
  EXPECT_TRUE(other.listen(server.getEndpoint()).isError());
}

TEST_F(TcpServerTest, WaitTimesOutWithoutClients) {
  auto result = server.waitForConnection(20);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, TcpServer::E_TIMEOUT);
}

TEST_F(TcpServerTest, AcceptWithoutPendingFails) {
  auto result = server.accept();
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, TcpServer::E_NO_PENDING);
}

TEST_F(TcpServerTest, ClientServerExchange) {
  std::string received;
  std::thread serverThread([this, &received]() {
    ASSERT_TRUE(server.waitForConnection(2000).isOk());
    auto conn = server.accept();
    ASSERT_TRUE(conn.isOk()) << conn.error().message;
    auto data = conn.value().receiveAll();
    ASSERT_TRUE(data.isOk());
    received = data.value();
    ASSERT_TRUE(conn.value().sendAndShutdown("pong:" + received).isOk());
  });

  TcpClient client;
  auto connected = client.connect(server.getEndpoint(), std::chrono::milliseconds(2000));
  ASSERT_TRUE(connected.isOk()) << connected.error().message;
  EXPECT_TRUE(client.isConnected());
  ASSERT_TRUE(client.sendAndShutdown("ping").isOk());
  auto reply = client.receiveAll();
  serverThread.join();

  ASSERT_TRUE(reply.isOk()) << reply.error().message;
  EXPECT_EQ(received, "ping");
  EXPECT_EQ(reply.value(), "pong:ping");

  client.close();
  EXPECT_FALSE(client.isConnected());
}

TEST(TcpClientTest, ConnectToClosedPortFails) {
  // Grab a free port, then release it
  uint16_t port;
  {
    TcpServer probe;
    ASSERT_TRUE(probe.listen({ "127.0.0.1", 0 }).isOk());
    port = probe.getEndpoint().port;
  }
  TcpClient client;
  auto result = client.connect({ "127.0.0.1", port });
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, TcpClient::E_CONNECT);
  EXPECT_FALSE(client.isConnected());
}

TEST(TcpClientTest, OperationsRequireConnection) {
  TcpClient client;
  auto result = client.send("x");
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, TcpClient::E_NOT_CONNECTED);
}
