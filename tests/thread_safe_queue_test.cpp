// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for shiptrack::ThreadSafeQueue<T>, used as the transport outbox.
//
// Validates:
//   - FIFO order for a single producer
//   - try_pop() never blocks
//   - Blocking pop() wakes on push
//   - Many producers: nothing lost, and each producer's messages stay in
//     the order it pushed them (per-shipment order on the wire)
//
// Every spawned thread is joined before the assertions.
// =============================================================================

#include "shiptrack/concurrent/thread_safe_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

struct OutboxEntry {
  std::string partition_key;
  int sequence{0};
};

}  // namespace

// =============================================================================
// Test fixture: a fresh outbox per test.
// =============================================================================
class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  shiptrack::ThreadSafeQueue<OutboxEntry> outbox;
};

// -----------------------------------------------------------------------------
// 1. Items come out in push order.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, FifoOrder) {
  EXPECT_TRUE(outbox.empty());
  for (int i = 0; i < 50; ++i) {
    outbox.push(OutboxEntry{"shp-1", i});
  }
  EXPECT_EQ(outbox.size(), 50u);

  for (int i = 0; i < 50; ++i) {
    EXPECT_EQ(outbox.pop().sequence, i) << "order broken at " << i;
  }
  EXPECT_TRUE(outbox.empty());
}

// -----------------------------------------------------------------------------
// 2. try_pop() on an empty queue returns immediately.
// Why: the transport worker polls with try_pop() so it can notice stop().
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TryPopDoesNotBlock) {
  EXPECT_FALSE(outbox.try_pop().has_value());

  outbox.push(OutboxEntry{"shp-7", 3});
  const std::optional<OutboxEntry> item = outbox.try_pop();
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(item->partition_key, "shp-7");
  EXPECT_EQ(item->sequence, 3);
  EXPECT_FALSE(outbox.try_pop().has_value());
}

// -----------------------------------------------------------------------------
// 3. A consumer blocked in pop() is woken by a push.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, BlockingPopWakesOnPush) {
  std::atomic<int> received{-1};
  std::thread consumer([this, &received] { received.store(outbox.pop().sequence); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(received.load(), -1);

  outbox.push(OutboxEntry{"shp-1", 77});
  consumer.join();
  EXPECT_EQ(received.load(), 77);
}

// -----------------------------------------------------------------------------
// 4. Four committing threads, one per shipment, and one draining worker.
//    Every message arrives once and each shipment's sequence is increasing.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ProducersKeepPerKeyOrder) {
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 1000;
  constexpr int kTotal = kProducers * kPerProducer;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      const std::string key = "shp-" + std::to_string(p);
      for (int i = 0; i < kPerProducer; ++i) {
        outbox.push(OutboxEntry{key, i});
      }
    });
  }

  std::map<std::string, std::vector<int>> drained;
  std::thread worker([this, &drained] {
    for (int n = 0; n < kTotal; ++n) {
      OutboxEntry entry = outbox.pop();
      drained[entry.partition_key].push_back(entry.sequence);
    }
  });

  for (auto& t : producers) t.join();
  worker.join();

  ASSERT_EQ(drained.size(), static_cast<std::size_t>(kProducers));
  for (const auto& [key, sequences] : drained) {
    ASSERT_EQ(sequences.size(), static_cast<std::size_t>(kPerProducer)) << key;
    for (int i = 0; i < kPerProducer; ++i) {
      EXPECT_EQ(sequences[i], i) << key << " out of order at " << i;
    }
  }
  EXPECT_TRUE(outbox.empty());
}
