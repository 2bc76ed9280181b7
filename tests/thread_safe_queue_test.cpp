// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for optguard::ThreadSafeQueue<T>, the hand-off between the
// decision thread and the telemetry publisher.
//
// Validates:
//   - FIFO ordering and try_pop() on an empty queue
//   - pop() blocks until a producer pushes
//   - No loss or duplication with several producers
//   - Bounded mode evicts the oldest element and counts it
// =============================================================================

#include "optguard/concurrent/thread_safe_queue.hpp"
#include "optguard/events/event.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <set>
#include <string>
#include <thread>
#include <variant>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  optguard::ThreadSafeQueue<optguard::Event> queue;

  static optguard::Event halt(const std::string& reason) {
    return optguard::CoreHaltEvent{reason, {}};
  }

  static std::string reasonOf(const optguard::Event& e) {
    return std::get<optguard::CoreHaltEvent>(e).reason;
  }
};

TEST_F(ThreadSafeQueueTest, FifoAndNonBlockingPop) {
  EXPECT_TRUE(queue.empty());
  EXPECT_FALSE(queue.try_pop().has_value());

  queue.push(halt("first"));
  queue.push(optguard::PhaseTransitionEvent{1, 2, 41000.0, {}});
  queue.push(halt("third"));
  EXPECT_EQ(queue.size(), 3u);

  EXPECT_EQ(reasonOf(queue.pop()), "first");
  const auto second = queue.try_pop();
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(std::get<optguard::PhaseTransitionEvent>(*second).to_phase, 2);
  EXPECT_EQ(reasonOf(queue.pop()), "third");
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// pop() must wait for the producer instead of returning garbage.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PopBlocksUntilPush) {
  std::string received;
  std::thread consumer([&] { received = reasonOf(queue.pop()); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  queue.push(halt("late"));
  consumer.join();

  EXPECT_EQ(received, "late");
}

// -----------------------------------------------------------------------------
// Four producers, one consumer: every event arrives exactly once.
// Why: decision events come from whichever thread called into the core.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentProducersLoseNothing) {
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 250;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        queue.push(halt(std::to_string(p) + ":" + std::to_string(i)));
      }
    });
  }

  std::set<std::string> seen;
  for (int n = 0; n < kProducers * kPerProducer; ++n) {
    seen.insert(reasonOf(queue.pop()));
  }
  for (auto& t : producers) {
    t.join();
  }

  EXPECT_EQ(seen.size(), static_cast<std::size_t>(kProducers * kPerProducer));
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// A bounded queue keeps the newest events and counts what it evicted.
// -----------------------------------------------------------------------------
TEST(BoundedThreadSafeQueueTest, EvictsOldestWhenFull) {
  optguard::ThreadSafeQueue<int> bounded(3);
  EXPECT_TRUE(bounded.push(1));
  EXPECT_TRUE(bounded.push(2));
  EXPECT_TRUE(bounded.push(3));
  EXPECT_FALSE(bounded.push(4));
  EXPECT_FALSE(bounded.push(5));

  EXPECT_EQ(bounded.dropped(), 2u);
  const auto remaining = bounded.drain();
  ASSERT_EQ(remaining.size(), 3u);
  EXPECT_EQ(remaining.front(), 3);
  EXPECT_EQ(remaining.back(), 5);
  EXPECT_TRUE(bounded.empty());
}
