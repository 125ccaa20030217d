#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "cam_merge/watchdog.hpp"

using namespace cam_merge;
using namespace std::chrono_literals;

TEST(WatchdogTest, FiresWithoutProgress) {
  std::atomic<int> fired{0};
  Watchdog watchdog(100ms, [&] { ++fired; });
  watchdog.start();

  std::this_thread::sleep_for(600ms);
  EXPECT_EQ(fired.load(), 1);
  EXPECT_TRUE(watchdog.fired());
  watchdog.stop();
}

TEST(WatchdogTest, ResetKeepsItQuiet) {
  std::atomic<int> fired{0};
  Watchdog watchdog(400ms, [&] { ++fired; });
  watchdog.start();

  for (int i = 0; i < 12; ++i) {
    std::this_thread::sleep_for(50ms);
    watchdog.reset();
  }
  watchdog.stop();
  EXPECT_EQ(fired.load(), 0);
  EXPECT_FALSE(watchdog.fired());
}

TEST(WatchdogTest, ZeroTimeoutIsDisabled) {
  std::atomic<int> fired{0};
  Watchdog watchdog(0ms, [&] { ++fired; });
  EXPECT_FALSE(watchdog.enabled());
  watchdog.start();

  std::this_thread::sleep_for(100ms);
  EXPECT_EQ(fired.load(), 0);
}

TEST(WatchdogTest, StopPreventsFiring) {
  std::atomic<int> fired{0};
  {
    Watchdog watchdog(200ms, [&] { ++fired; });
    watchdog.start();
    watchdog.stop();
    std::this_thread::sleep_for(400ms);
  }
  EXPECT_EQ(fired.load(), 0);
}
