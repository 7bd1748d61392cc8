#include "ThreadSafeQueue.hpp"
#include <gtest/gtest.h>

#include <chrono>
#include <thread>

TEST(ThreadSafeQueueTest, PollOnEmptyReturnsFalse) {
  lw::ThreadSafeQueue<int> queue;
  int value = 0;
  EXPECT_FALSE(queue.poll(value));
  EXPECT_TRUE(queue.empty());
}

TEST(ThreadSafeQueueTest, KeepsFifoOrder) {
  lw::ThreadSafeQueue<int> queue;
  queue.push(1);
  queue.push(2);
  queue.push(3);
  EXPECT_EQ(queue.size(), 3u);

  int value = 0;
  ASSERT_TRUE(queue.poll(value));
  EXPECT_EQ(value, 1);
  ASSERT_TRUE(queue.poll(value));
  EXPECT_EQ(value, 2);
  ASSERT_TRUE(queue.poll(value));
  EXPECT_EQ(value, 3);
}

TEST(ThreadSafeQueueTest, WaitPollUntilTimesOut) {
  lw::ThreadSafeQueue<int> queue;
  int value = 0;
  auto begin = std::chrono::steady_clock::now();
  EXPECT_FALSE(queue.waitPollUntil(
      value, begin + std::chrono::milliseconds(20)));
  EXPECT_GE(std::chrono::steady_clock::now() - begin,
            std::chrono::milliseconds(20));
}

TEST(ThreadSafeQueueTest, WaitPollWakesOnPush) {
  lw::ThreadSafeQueue<int> queue;
  std::thread producer([&queue] {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    queue.push(42);
  });

  int value = 0;
  queue.waitPoll(value);
  EXPECT_EQ(value, 42);
  producer.join();
}
