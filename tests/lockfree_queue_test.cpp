#include "maestro/core/lockfree_queue.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace maestro;

TEST(LockfreeQueueTest, BasicPushPop) {
  BoundedMPSCQueue<int> queue(8);

  EXPECT_TRUE(queue.empty());
  EXPECT_TRUE(queue.push(42));
  EXPECT_FALSE(queue.empty());

  auto value = queue.try_pop();
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, 42);
  EXPECT_FALSE(queue.try_pop().has_value());
}

TEST(LockfreeQueueTest, CapacityRoundsUpToPowerOfTwo) {
  BoundedMPSCQueue<int> queue(5);
  EXPECT_EQ(queue.capacity(), 8u);

  for (int i = 0; i < 8; ++i) {
    EXPECT_TRUE(queue.push(i));
  }
  EXPECT_FALSE(queue.push(8));

  EXPECT_EQ(queue.try_pop(), 0);
  EXPECT_TRUE(queue.push(8));
}

TEST(LockfreeQueueTest, MovesStrings) {
  BoundedMPSCQueue<std::string> queue(4);
  EXPECT_TRUE(queue.push(std::string(256, 'x')));

  auto value = queue.try_pop();
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(value->size(), 256u);
}

TEST(LockfreeQueueTest, ConcurrentProducersKeepPerProducerOrder) {
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 5000;
  BoundedMPSCQueue<int> queue(1024);

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&queue, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        while (!queue.push(p * kPerProducer + i)) {
          std::this_thread::yield();
        }
      }
    });
  }

  std::vector<int> last(kProducers, -1);
  int received = 0;
  while (received < kProducers * kPerProducer) {
    auto value = queue.try_pop();
    if (!value) {
      std::this_thread::yield();
      continue;
    }
    int producer = *value / kPerProducer;
    int seq = *value % kPerProducer;
    EXPECT_GT(seq, last[producer]);
    last[producer] = seq;
    ++received;
  }

  for (auto& t : producers) {
    t.join();
  }
  EXPECT_TRUE(queue.empty());
}
