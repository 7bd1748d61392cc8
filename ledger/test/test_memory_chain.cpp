#include "MemoryChain.h"
#include <gtest/gtest.h>

#include <thread>
#include <vector>

class MemoryChainTest : public ::testing::Test {
protected:
  static lw::Transaction tx(int64_t amount) {
    lw::Transaction t;
    t.fromWalletId = 1;
    t.toWalletId = 2;
    t.amount = amount;
    return t;
  }

  lw::MemoryChain chain;
};

TEST_F(MemoryChainTest, StartsWithGenesisBlock) {
  EXPECT_EQ(chain.getSize(), 1u);
  EXPECT_EQ(chain.getNextBlockId(), 1u);

  auto genesis = chain.readBlock(0);
  ASSERT_TRUE(genesis.isOk());
  EXPECT_EQ(genesis.value().index, 0u);
  EXPECT_TRUE(genesis.value().previousHash.empty());
  EXPECT_TRUE(genesis.value().transactions.empty());
  EXPECT_EQ(genesis.value().hash, genesis.value().calculateHash());
}

TEST_F(MemoryChainTest, AppendLinksToPrevious) {
  auto genesis = chain.readLastBlock();
  ASSERT_TRUE(genesis.isOk());

  lw::Block b1 = chain.appendBlock({ tx(10), tx(20) }, 1000);
  EXPECT_EQ(b1.index, 1u);
  EXPECT_EQ(b1.timestamp, 1000);
  EXPECT_EQ(b1.previousHash, genesis.value().hash);
  EXPECT_EQ(b1.transactions.size(), 2u);

  lw::Block b2 = chain.appendBlock({}, 2000);
  EXPECT_EQ(b2.index, 2u);
  EXPECT_EQ(b2.previousHash, b1.hash);
  EXPECT_NE(b2.hash, b1.hash);

  auto last = chain.readLastBlock();
  ASSERT_TRUE(last.isOk());
  EXPECT_EQ(last.value(), b2);
  EXPECT_EQ(chain.getNextBlockId(), 3u);
  EXPECT_TRUE(chain.isValid());
}

TEST_F(MemoryChainTest, ReadBlockOutOfRangeFails) {
  auto result = chain.readBlock(5);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, lw::MemoryChain::E_BLOCK_NOT_FOUND);
}

TEST_F(MemoryChainTest, ConcurrentAppendsStayValid) {
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([this, t]() {
      for (int i = 0; i < 25; ++i) {
        chain.appendBlock({ tx(t * 100 + i) }, i);
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }
  EXPECT_EQ(chain.getSize(), 101u);
  EXPECT_TRUE(chain.isValid());
}
