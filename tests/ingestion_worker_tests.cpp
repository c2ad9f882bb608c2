#include "gtest/gtest.h"
#include "sharedict/ingestion_worker.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using sharedict::IngestionWorker;

TEST(IngestionWorkerTest, RunsTasksInOrderOnOneThread) {
  IngestionWorker worker(100);
  std::vector<int> order;
  std::set<std::thread::id> threads;
  std::mutex m;
  for (int i = 0; i < 50; ++i) {
    ASSERT_TRUE(worker.post([&, i]() {
      std::lock_guard<std::mutex> lock(m);
      order.push_back(i);
      threads.insert(std::this_thread::get_id());
    }));
  }
  worker.drain();
  ASSERT_EQ(order.size(), 50u);
  for (int i = 0; i < 50; ++i)
    EXPECT_EQ(order[i], i);
  EXPECT_EQ(threads.size(), 1u);
  EXPECT_EQ(threads.count(std::this_thread::get_id()), 0u);
  EXPECT_EQ(worker.pending(), 0u);
}

TEST(IngestionWorkerTest, RefusesWorkBeyondCapacity) {
  IngestionWorker worker(2);
  std::promise<void> release;
  std::shared_future<void> gate = release.get_future().share();

  EXPECT_TRUE(worker.post([gate]() { gate.wait(); }));
  EXPECT_TRUE(worker.post([]() {}));
  EXPECT_FALSE(worker.post([]() {}));
  EXPECT_EQ(worker.pending(), 2u);

  release.set_value();
  worker.drain();
  EXPECT_TRUE(worker.post([]() {}));
  worker.drain();
}

TEST(IngestionWorkerTest, ThrowingTaskDoesNotStopTheWorker) {
  IngestionWorker worker;
  std::atomic<bool> ran{false};
  worker.post([]() { throw std::runtime_error("boom"); });
  worker.post([&]() { ran = true; });
  worker.drain();
  EXPECT_TRUE(ran.load());
}

TEST(IngestionWorkerTest, StopFinishesQueuedWorkAndRejectsMore) {
  IngestionWorker worker;
  std::atomic<int> done{0};
  for (int i = 0; i < 10; ++i) {
    worker.post([&]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
      ++done;
    });
  }
  worker.stop();
  EXPECT_EQ(done.load(), 10);
  EXPECT_FALSE(worker.running());
  EXPECT_FALSE(worker.post([]() {}));
  worker.stop();
}

TEST(IngestionWorkerTest, ZeroCapacityIsRejected) {
  EXPECT_THROW(IngestionWorker(0), std::invalid_argument);
}

TEST(IngestionWorkerTest, StopRacingPostNeverStrandsAcceptedTasks) {
  for (int round = 0; round < 300; ++round) {
    IngestionWorker worker(4096);
    std::atomic<size_t> accepted{0};
    std::atomic<size_t> executed{0};
    std::thread poster([&]() {
      for (int i = 0; i < 500; ++i) {
        if (worker.post([&]() { ++executed; }))
          ++accepted;
      }
    });
    worker.stop();
    poster.join();

    ASSERT_EQ(worker.pending(), 0u) << "round " << round;
    ASSERT_EQ(executed.load(), accepted.load()) << "round " << round;
    worker.drain();
  }
}
