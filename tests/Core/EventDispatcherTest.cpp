#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>
#include "Core/concurrency/EventDispatcher.hpp"

using CONCURRENCY::EventDispatcher;

TEST(EventDispatcherTest, SubmitReturnsValue) {
  EventDispatcher dispatcher(2);
  auto fut = dispatcher.submit([] { return 21 * 2; });
  EXPECT_EQ(42, fut.get());
}

TEST(EventDispatcherTest, SubmitCarriesException) {
  EventDispatcher dispatcher(1);
  auto fut = dispatcher.submit([]() -> int { throw std::runtime_error("boom"); });
  EXPECT_THROW(fut.get(), std::runtime_error);

  // The worker survives and keeps serving.
  EXPECT_EQ(1, dispatcher.submit([] { return 1; }).get());
}

TEST(EventDispatcherTest, TasksRunConcurrently) {
  EventDispatcher dispatcher(4);
  std::atomic<int> done{0};
  std::vector<std::future<void>> futures;
  for (int i = 0; i < 16; ++i) {
    futures.push_back(dispatcher.submit([&done] { ++done; }));
  }
  for (auto& f : futures) f.get();
  EXPECT_EQ(16, done.load());
}

TEST(EventDispatcherTest, RestartsAfterStop) {
  EventDispatcher dispatcher(1);
  dispatcher.stop();
  dispatcher.start();
  EXPECT_EQ(7, dispatcher.submit([] { return 7; }).get());
}
