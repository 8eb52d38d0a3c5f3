#include <gtest/gtest.h>
#include <stop_token>
#include <thread>
#include "Core/interfaces/IClock.hpp"

using namespace std::chrono_literals;

TEST(SystemClockTest, ShortSleepCompletes) {
  SystemClock clock;
  const auto start = clock.now();
  EXPECT_TRUE(clock.sleepFor(20ms));
  EXPECT_GE(clock.now() - start, 20ms);
}

TEST(SystemClockTest, NonPositiveDurationReturnsImmediately) {
  SystemClock clock;
  EXPECT_TRUE(clock.sleepFor(IClock::duration::zero()));
  EXPECT_TRUE(clock.sleepFor(-5ms));
}

TEST(SystemClockTest, StopRequestWakesSleeper) {
  SystemClock clock;
  std::stop_source source;
  std::thread stopper([&source] {
    std::this_thread::sleep_for(50ms);
    source.request_stop();
  });

  const auto start = clock.now();
  EXPECT_FALSE(clock.sleepFor(30s, source.get_token()));
  EXPECT_LT(clock.now() - start, 10s);
  stopper.join();
}

TEST(SystemClockTest, AlreadyStoppedTokenReturnsFalse) {
  SystemClock clock;
  std::stop_source source;
  source.request_stop();
  EXPECT_FALSE(clock.sleepFor(30s, source.get_token()));
  EXPECT_FALSE(clock.sleepFor(IClock::duration::zero(), source.get_token()));
}
