// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for amico::ThreadSafeQueue<T>, the merged event stream between
// event sources and the agent loop.
//
// Validates:
//   - FIFO semantics across pop(), try_pop() and pop_for()
//   - try_pop() on empty and non-empty queues
//   - pop_for() timeout, delivery and wake() interruption
//   - clear() reports how many items were dropped
//   - Several producers feeding one pop_for() consumer while wake() fires
//
// All spawned threads are joined before assertions.
// =============================================================================

#include "amico/concurrent/thread_safe_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  amico::ThreadSafeQueue<int> queue;
};

// -----------------------------------------------------------------------------
// 1. FIFO holds whichever pop flavour the consumer uses.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, FIFOAcrossPopFlavours) {
  EXPECT_TRUE(queue.empty());
  for (int i = 0; i < 9; ++i) {
    queue.push(i);
  }
  EXPECT_EQ(queue.size(), 9u);

  std::vector<int> seen;
  for (int round = 0; round < 3; ++round) {
    seen.push_back(queue.pop());
    seen.push_back(queue.try_pop().value_or(-1));
    seen.push_back(queue.pop_for(1s).value_or(-1));
  }

  EXPECT_EQ(seen, (std::vector<int>{0, 1, 2, 3, 4, 5, 6, 7, 8}));
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 2. try_pop() never blocks.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TryPop) {
  EXPECT_FALSE(queue.try_pop().has_value());

  queue.push(99);
  std::optional<int> item = queue.try_pop();
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(*item, 99);
}

// -----------------------------------------------------------------------------
// 3. pop_for() on an empty queue gives up after the timeout.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PopForTimesOut) {
  const auto begin = std::chrono::steady_clock::now();
  std::optional<int> item = queue.pop_for(30ms);
  const auto waited = std::chrono::steady_clock::now() - begin;

  EXPECT_FALSE(item.has_value());
  EXPECT_GE(waited, 25ms);
}

// -----------------------------------------------------------------------------
// 4. pop_for() returns as soon as a producer pushes.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PopForReceivesPush) {
  std::thread producer([this] {
    std::this_thread::sleep_for(20ms);
    queue.push(7);
  });

  std::optional<int> item = queue.pop_for(2s);
  producer.join();

  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(*item, 7);
}

// -----------------------------------------------------------------------------
// 5. wake() releases a consumer blocked in pop_for() without an item.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, WakeInterruptsPopFor) {
  std::atomic<bool> returned{false};
  std::optional<int> item;

  std::thread consumer([&] {
    item = queue.pop_for(5s);
    returned.store(true);
  });

  std::this_thread::sleep_for(20ms);
  EXPECT_FALSE(returned.load());

  const auto begin = std::chrono::steady_clock::now();
  queue.wake();
  consumer.join();

  EXPECT_TRUE(returned.load());
  EXPECT_FALSE(item.has_value());
  EXPECT_LT(std::chrono::steady_clock::now() - begin, 2s);
}

// -----------------------------------------------------------------------------
// 6. clear() drops everything and reports the count.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ClearReportsDropped) {
  queue.push(1);
  queue.push(2);
  queue.push(3);

  EXPECT_EQ(queue.clear(), 3u);
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(queue.clear(), 0u);
}

// -----------------------------------------------------------------------------
// 7. Move-only payloads and strings pass through unchanged.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueuePayloadTest, MoveOnlyPayload) {
  amico::ThreadSafeQueue<std::unique_ptr<std::string>> q;
  q.push(std::make_unique<std::string>("payload"));

  auto item = q.try_pop();
  ASSERT_TRUE(item.has_value());
  ASSERT_NE(*item, nullptr);
  EXPECT_EQ(**item, "payload");
}

// -----------------------------------------------------------------------------
// 8. Agent-style consumer: several sources push while wake() keeps
//    interrupting pop_for(). Every item arrives once, each source's items
//    stay in order, and a wake never yields an item that was not pushed.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PopForWithWakeUnderContention) {
  constexpr int kSources = 4;
  constexpr int kItemsPerSource = 500;
  constexpr int kStride = 10000;

  std::atomic<bool> stopping{false};
  std::atomic<bool> producing{true};
  std::vector<int> received;

  std::thread loop([&] {
    while (true) {
      if (auto item = queue.pop_for(5s)) {
        received.push_back(*item);
        continue;
      }
      // Empty queue here: either a stray wake() or the final one.
      if (stopping.load()) {
        return;
      }
    }
  });

  std::thread waker([&] {
    while (producing.load()) {
      queue.wake();
      std::this_thread::sleep_for(100us);
    }
  });

  std::vector<std::thread> sources;
  for (int s = 0; s < kSources; ++s) {
    sources.emplace_back([this, s] {
      for (int i = 0; i < kItemsPerSource; ++i) {
        queue.push(s * kStride + i);
      }
    });
  }
  for (auto& t : sources) t.join();
  producing.store(false);
  waker.join();

  // pop_for() only reports empty once the queue is drained, so the loop
  // exits after the last pushed item.
  stopping.store(true);
  queue.wake();
  loop.join();

  ASSERT_EQ(received.size(),
            static_cast<std::size_t>(kSources * kItemsPerSource));
  std::vector<int> next(kSources, 0);
  for (int value : received) {
    const int source = value / kStride;
    ASSERT_GE(source, 0);
    ASSERT_LT(source, kSources);
    EXPECT_EQ(value % kStride, next[source])
        << "source " << source << " delivered out of order";
    next[source] = value % kStride + 1;
  }
  EXPECT_EQ(next, std::vector<int>(kSources, kItemsPerSource));
  EXPECT_TRUE(queue.empty());
}
