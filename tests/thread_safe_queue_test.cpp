// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for pnlsync::ThreadSafeQueue<T>.
//
// Validates:
//   - FIFO ordering for push/pop and try_pop
//   - Bounded queues: try_push() refuses once capacity is reached
//   - pop_for() times out on an empty queue and wakes on a push
//   - drain() hands back everything in order and leaves the queue empty
//   - Multi-producer / multi-consumer delivery without loss or duplication
//
// Threading model:
//   Threads are joined before assertions, so a failing test never leaves a
//   dangling thread behind.
// =============================================================================

#include "pnlsync/concurrent/thread_safe_queue.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  pnlsync::ThreadSafeQueue<int> queue;
};

// -----------------------------------------------------------------------------
// 1. Items come back in the order they were pushed.
// Why: Orders are placed in submission order; a reordering queue would place
//      a later order first.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, FIFOOrder) {
  EXPECT_TRUE(queue.empty());
  for (int i = 0; i < 50; ++i) {
    queue.push(i);
  }
  EXPECT_EQ(queue.size(), 50u);
  for (int i = 0; i < 50; ++i) {
    EXPECT_EQ(queue.pop(), i) << "FIFO violated at index " << i;
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 2. try_pop() never blocks.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TryPopEmptyAndNonEmpty) {
  EXPECT_FALSE(queue.try_pop().has_value());
  queue.push(99);
  auto item = queue.try_pop();
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(*item, 99);
}

// -----------------------------------------------------------------------------
// 3. A bounded queue rejects the push that would exceed capacity.
// Why: The order router reports "order queue full" from this return value.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueBoundedTest, TryPushRespectsCapacity) {
  pnlsync::ThreadSafeQueue<std::string> bounded(2);
  EXPECT_EQ(bounded.capacity(), 2u);

  EXPECT_TRUE(bounded.try_push("a"));
  EXPECT_TRUE(bounded.try_push("b"));
  EXPECT_FALSE(bounded.try_push("c"));
  EXPECT_EQ(bounded.size(), 2u);

  EXPECT_EQ(bounded.pop(), "a");
  EXPECT_TRUE(bounded.try_push("c"));
}

// -----------------------------------------------------------------------------
// 4. pop_for() returns std::nullopt after the timeout on an empty queue.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PopForTimesOutWhenEmpty) {
  const auto start = std::chrono::steady_clock::now();
  auto item = queue.pop_for(std::chrono::milliseconds(30));
  const auto waited = std::chrono::steady_clock::now() - start;

  EXPECT_FALSE(item.has_value());
  EXPECT_GE(waited, std::chrono::milliseconds(25));
}

// -----------------------------------------------------------------------------
// 5. pop_for() wakes as soon as a producer pushes.
// Why: The simulated venue pump waits here; a missed wakeup would stall a
//      tick for the full interval.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PopForWakesOnPush) {
  std::optional<int> received;
  std::thread consumer([this, &received] {
    received = queue.pop_for(std::chrono::seconds(5));
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  queue.push(7);
  consumer.join();

  ASSERT_TRUE(received.has_value());
  EXPECT_EQ(*received, 7);
}

// -----------------------------------------------------------------------------
// 6. drain() returns every queued item in order.
// Why: Teardown drains pending bookings to fail each one; none may be lost.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, DrainEmptiesInOrder) {
  queue.push(1);
  queue.push(2);
  queue.push(3);

  const auto items = queue.drain();
  EXPECT_EQ(items, (std::vector<int>{1, 2, 3}));
  EXPECT_TRUE(queue.empty());
  EXPECT_TRUE(queue.drain().empty());
}

// -----------------------------------------------------------------------------
// 7. Concurrent producers and consumers see every item exactly once.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentPushPop) {
  constexpr int kProducers = 4;
  constexpr int kConsumers = 4;
  constexpr int kItemsPerProducer = 1000;
  constexpr int kTotalItems = kProducers * kItemsPerProducer;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      const int start = p * kItemsPerProducer;
      for (int i = start; i < start + kItemsPerProducer; ++i) {
        queue.push(i);
      }
    });
  }

  std::atomic<int> consumed{0};
  std::vector<std::vector<int>> per_consumer(kConsumers);
  std::vector<std::thread> consumers;
  for (int c = 0; c < kConsumers; ++c) {
    consumers.emplace_back([this, c, &consumed, &per_consumer] {
      while (consumed.load() < kTotalItems) {
        if (auto item = queue.pop_for(std::chrono::milliseconds(5))) {
          per_consumer[c].push_back(*item);
          consumed.fetch_add(1);
        }
      }
    });
  }

  for (auto& t : producers) t.join();
  for (auto& t : consumers) t.join();

  std::vector<int> all;
  for (auto& v : per_consumer) {
    all.insert(all.end(), v.begin(), v.end());
  }
  std::sort(all.begin(), all.end());

  ASSERT_EQ(static_cast<int>(all.size()), kTotalItems);
  for (int i = 0; i < kTotalItems; ++i) {
    EXPECT_EQ(all[i], i) << "Missing or duplicate item at index " << i;
  }
}
