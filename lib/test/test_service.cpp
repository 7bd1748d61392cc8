#include "Service.h"
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>

namespace {

class CountingService : public lw::Service {
public:
  CountingService() : lw::Service("test.counting_service") {}
  ~CountingService() override { stop(); }

  std::atomic<int> iterations{ 0 };
  std::atomic<int> stops{ 0 };
  bool failStart{ false };

protected:
  void runLoop() override {
    while (!isStopSet()) {
      ++iterations;
      waitForStop(std::chrono::milliseconds(5));
    }
  }

  Roe<void> onStart() override {
    if (failStart) {
      return Error(7, "refused");
    }
    return {};
  }

  void onStop() override { ++stops; }
};

class OneShotService : public lw::Service {
public:
  OneShotService() : lw::Service("test.one_shot") {}
  bool ran{ false };

protected:
  void runLoop() override { ran = true; }
};

} // namespace

TEST(ServiceTest, InitiallyStopped) {
  CountingService service;
  EXPECT_TRUE(service.isStopSet());
  EXPECT_FALSE(service.isRunning());
}

TEST(ServiceTest, StartRunsLoopUntilStop) {
  CountingService service;
  ASSERT_TRUE(service.start().isOk());
  EXPECT_TRUE(service.isRunning());

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (service.iterations < 3 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  EXPECT_GE(service.iterations.load(), 3);

  service.stop();
  EXPECT_TRUE(service.isStopSet());
  EXPECT_EQ(service.stops.load(), 1);
}

TEST(ServiceTest, StartTwiceFails) {
  CountingService service;
  ASSERT_TRUE(service.start().isOk());
  auto second = service.start();
  ASSERT_TRUE(second.isError());
  EXPECT_EQ(second.error().code, -1);
}

TEST(ServiceTest, FailedOnStartAbortsStart) {
  CountingService service;
  service.failStart = true;
  auto result = service.start();
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, -2);
  EXPECT_NE(result.error().message.find("refused"), std::string::npos);
  EXPECT_TRUE(service.isStopSet());
}

TEST(ServiceTest, StopWhenNotRunningIsHarmless) {
  CountingService service;
  service.stop();
  EXPECT_EQ(service.stops.load(), 0);
}

TEST(ServiceTest, WaitForStopWakesOnStop) {
  CountingService service;
  ASSERT_TRUE(service.start().isOk());
  auto begin = std::chrono::steady_clock::now();
  service.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(1));
}

TEST(ServiceTest, RunExecutesInCallerThread) {
  OneShotService service;
  ASSERT_TRUE(service.run().isOk());
  EXPECT_TRUE(service.ran);
  EXPECT_TRUE(service.isStopSet());
}
