#include "taskhive/core/lockfree_queue.hpp"

#include <atomic>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace taskhive;

TEST(BoundedMPSCQueueTest, PushPop_SingleValue) {
  BoundedMPSCQueue<int> queue(8);

  EXPECT_TRUE(queue.push(42));
  auto value = queue.try_pop();

  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, 42);
  EXPECT_TRUE(queue.empty());
}

TEST(BoundedMPSCQueueTest, Empty_TryPopReturnsNullopt) {
  BoundedMPSCQueue<int> queue(8);

  EXPECT_FALSE(queue.try_pop().has_value());
  EXPECT_TRUE(queue.empty());
}

TEST(BoundedMPSCQueueTest, Capacity_RoundsUpToPowerOfTwo) {
  BoundedMPSCQueue<int> queue(100);

  EXPECT_EQ(queue.capacity(), 128u);
}

TEST(BoundedMPSCQueueTest, Full_RejectsPush) {
  BoundedMPSCQueue<int> queue(4);
  for (int i = 0; i < 4; ++i) {
    ASSERT_TRUE(queue.push(int{i}));
  }

  EXPECT_FALSE(queue.push(99));

  ASSERT_TRUE(queue.try_pop().has_value());
  EXPECT_TRUE(queue.push(99));
}

TEST(BoundedMPSCQueueTest, PreservesOrderForSingleProducer) {
  BoundedMPSCQueue<std::string> queue(64);
  for (int i = 0; i < 50; ++i) {
    ASSERT_TRUE(queue.push(std::to_string(i)));
  }

  for (int i = 0; i < 50; ++i) {
    auto value = queue.try_pop();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, std::to_string(i));
  }
}

TEST(BoundedMPSCQueueTest, ConcurrentProducers_DeliverEveryValueOnce) {
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 5000;
  BoundedMPSCQueue<int> queue(1024);
  std::atomic<int> producers_done{0};

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        int value = p * kPerProducer + i;
        while (!queue.push(int{value})) {
          std::this_thread::yield();
        }
      }
      producers_done.fetch_add(1);
    });
  }

  std::set<int> seen;
  while (static_cast<int>(seen.size()) < kProducers * kPerProducer) {
    if (auto v = queue.try_pop()) {
      EXPECT_TRUE(seen.insert(*v).second) << "duplicate " << *v;
    } else if (producers_done.load() == kProducers && queue.empty()) {
      break;
    }
  }
  for (auto& t : producers) {
    t.join();
  }

  EXPECT_EQ(seen.size(), static_cast<std::size_t>(kProducers * kPerProducer));
}
