#ifndef SHAREDICT_INGESTION_WORKER_HPP
#define SHAREDICT_INGESTION_WORKER_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace sharedict {

/**
 * @brief Single background thread running posted tasks in FIFO order.
 *
 * At most @c capacity tasks may be pending (queued or running); post()
 * refuses work beyond that instead of blocking. Exceptions thrown by a task
 * are logged and swallowed so the thread keeps running.
 */
class IngestionWorker {
public:
  static constexpr size_t DEFAULT_CAPACITY = 1024;

  /** @throw std::invalid_argument If @p capacity is 0. */
  explicit IngestionWorker(size_t capacity = DEFAULT_CAPACITY);
  ~IngestionWorker();

  IngestionWorker(const IngestionWorker &) = delete;
  IngestionWorker &operator=(const IngestionWorker &) = delete;

  /** Start the worker thread. Called by the constructor. */
  void start();

  /**
   * @brief Queue @p task.
   * @return false when the queue is full or the worker is stopped.
   */
  bool post(std::function<void()> task);

  /** Block until every task posted so far has finished. */
  void drain();

  /** Finish queued work, then join the thread. Idempotent. */
  void stop();

  size_t pending() const { return pending_.load(); }
  size_t capacity() const { return capacity_; }
  bool running() const { return running_.load(); }

private:
  void finishOne();

  size_t capacity_;
  boost::asio::io_context io_;
  std::optional<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      guard_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<size_t> pending_{0};

  // Orders post() against start() and stop().
  std::mutex stateMutex_;

  std::mutex drainMutex_;
  std::condition_variable drained_;
};

} // namespace sharedict

#endif // SHAREDICT_INGESTION_WORKER_HPP
