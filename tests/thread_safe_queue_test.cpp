// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for riskguard::ThreadSafeQueue<T>.
//
// Validates:
//   - FIFO ordering, including for move-only payloads
//   - try_pop() never blocks
//   - pop_for() times out on an empty queue and wakes on push
//   - Blocking pop() waits for a producer
//   - No lost or duplicated items with several producers and consumers
//
// Threads spawned by a test are joined before its assertions.
// =============================================================================

#include "riskguard/concurrent/thread_safe_queue.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

// Stand-in for the executor's job: an account and a sequence number.
struct Job {
  std::string account_id;
  int seq{0};
};

}  // namespace

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  riskguard::ThreadSafeQueue<Job> jobs;
};

// -----------------------------------------------------------------------------
// 1. Jobs come back in push order.
// Why: Events for one account are evaluated in arrival order, and the
//      enforcement worker settles requests in submission order.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PreservesPushOrder) {
  EXPECT_TRUE(jobs.empty());
  for (int i = 0; i < 50; ++i) {
    jobs.push(Job{i % 2 == 0 ? "ACC-1" : "ACC-2", i});
  }
  EXPECT_EQ(jobs.size(), 50u);

  for (int i = 0; i < 50; ++i) {
    const Job job = jobs.pop();
    EXPECT_EQ(job.seq, i);
    EXPECT_EQ(job.account_id, i % 2 == 0 ? "ACC-1" : "ACC-2");
  }
  EXPECT_TRUE(jobs.empty());
}

TEST_F(ThreadSafeQueueTest, TryPopNeverBlocks) {
  EXPECT_FALSE(jobs.try_pop().has_value());

  jobs.push(Job{"ACC-1", 7});
  const std::optional<Job> job = jobs.try_pop();
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->seq, 7);
  EXPECT_FALSE(jobs.try_pop().has_value());
}

TEST(ThreadSafeQueueMoveOnly, UniquePtrPayload) {
  riskguard::ThreadSafeQueue<std::unique_ptr<std::string>> q;
  q.push(std::make_unique<std::string>("close_all"));
  q.push(std::make_unique<std::string>("cancel_all_orders"));

  auto first = q.pop_for(10ms);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(**first, "close_all");
  EXPECT_EQ(**q.try_pop(), "cancel_all_orders");
}

// -----------------------------------------------------------------------------
// 2. pop_for() returns nullopt after the timeout, and an item as soon as one
//    is pushed.
// Why: The loop and the executor wait with pop_for() so stop() is noticed
//      within one wait without busy-polling.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PopForTimesOutWhenEmpty) {
  const auto started = std::chrono::steady_clock::now();
  EXPECT_FALSE(jobs.pop_for(30ms).has_value());
  EXPECT_GE(std::chrono::steady_clock::now() - started, 25ms);
}

TEST_F(ThreadSafeQueueTest, PopForWakesOnPush) {
  std::optional<Job> received;
  std::thread consumer([this, &received] { received = jobs.pop_for(5s); });

  std::this_thread::sleep_for(20ms);
  jobs.push(Job{"ACC-1", 42});
  consumer.join();

  ASSERT_TRUE(received.has_value());
  EXPECT_EQ(received->seq, 42);
}

TEST_F(ThreadSafeQueueTest, BlockingPopWaitsForPush) {
  std::atomic<int> received{-1};
  std::thread consumer([this, &received] { received.store(jobs.pop().seq); });

  std::this_thread::sleep_for(20ms);
  EXPECT_EQ(received.load(), -1);

  jobs.push(Job{"ACC-1", 77});
  consumer.join();
  EXPECT_EQ(received.load(), 77);
}

// -----------------------------------------------------------------------------
// 3. Several producers and consumers: every job is popped exactly once.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentProducersAndConsumers) {
  constexpr int kProducers = 4;
  constexpr int kConsumers = 3;
  constexpr int kPerProducer = 1000;
  constexpr int kTotal = kProducers * kPerProducer;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      const std::string account = "ACC-" + std::to_string(p);
      for (int i = 0; i < kPerProducer; ++i) {
        jobs.push(Job{account, p * kPerProducer + i});
      }
    });
  }

  std::atomic<int> consumed{0};
  std::vector<std::vector<int>> seen(kConsumers);
  std::vector<std::thread> consumers;
  for (int c = 0; c < kConsumers; ++c) {
    consumers.emplace_back([this, c, &consumed, &seen] {
      while (consumed.load() < kTotal) {
        if (std::optional<Job> job = jobs.pop_for(5ms)) {
          seen[c].push_back(job->seq);
          consumed.fetch_add(1);
        }
      }
    });
  }

  for (auto& t : producers) t.join();
  for (auto& t : consumers) t.join();

  std::vector<int> all;
  for (const auto& v : seen) {
    all.insert(all.end(), v.begin(), v.end());
  }
  std::sort(all.begin(), all.end());

  ASSERT_EQ(static_cast<int>(all.size()), kTotal);
  for (int i = 0; i < kTotal; ++i) {
    EXPECT_EQ(all[i], i) << "missing or duplicate job " << i;
  }
}
