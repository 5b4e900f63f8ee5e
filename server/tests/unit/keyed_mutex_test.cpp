#include <chrono>
#include <future>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "fanout/keyed_mutex.hpp"

TEST(KeyedMutexTest, SameKeyIsSerialized) {
  fanout::KeyedMutex locks;
  int counter = 0;
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < 1000; ++i) {
        auto guard = locks.Lock("update-1");
        ++counter;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(counter, 8000);
  EXPECT_EQ(locks.ActiveKeys(), 0u);
}

TEST(KeyedMutexTest, DifferentKeysDoNotBlockEachOther) {
  fanout::KeyedMutex locks;
  auto held = locks.Lock("update-1");
  auto other = std::async(std::launch::async, [&locks]() {
    auto guard = locks.Lock("update-2");
    return true;
  });
  ASSERT_EQ(other.wait_for(std::chrono::seconds(2)), std::future_status::ready);
  EXPECT_TRUE(other.get());
}

TEST(KeyedMutexTest, SlotIsReleasedWhenLastHolderLeaves) {
  fanout::KeyedMutex locks;
  {
    auto guard = locks.Lock("alice");
    EXPECT_EQ(locks.ActiveKeys(), 1u);
    auto moved = std::move(guard);
    EXPECT_EQ(locks.ActiveKeys(), 1u);
  }
  EXPECT_EQ(locks.ActiveKeys(), 0u);
}
