#include "sharedict/ingestion_worker.hpp"
#include "utilities/logger.h"

#include <boost/asio/post.hpp>
#include <stdexcept>

namespace sharedict {

IngestionWorker::IngestionWorker(size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0)
    throw std::invalid_argument("IngestionWorker capacity must be positive");
  start();
}

IngestionWorker::~IngestionWorker() { stop(); }

void IngestionWorker::start() {
  std::lock_guard<std::mutex> lock(stateMutex_);
  if (running_.exchange(true))
    return;
  io_.restart();
  guard_.emplace(boost::asio::make_work_guard(io_));
  thread_ = std::thread([this]() { io_.run(); });
}

bool IngestionWorker::post(std::function<void()> task) {
  // Held until the handler is queued so stop() cannot release the work
  // guard between the running check and the post.
  std::lock_guard<std::mutex> lock(stateMutex_);
  if (!running_.load())
    return false;
  size_t cur = pending_.load();
  do {
    if (cur >= capacity_)
      return false;
  } while (!pending_.compare_exchange_weak(cur, cur + 1));

  boost::asio::post(io_, [this, task = std::move(task)]() {
    try {
      task();
    } catch (const std::exception &e) {
      Logger::getInstance().log(LogLevel::ERROR, "ingestion_worker",
                                std::string("Task failed: ") + e.what());
    }
    finishOne();
  });
  return true;
}

void IngestionWorker::finishOne() {
  std::lock_guard<std::mutex> lock(drainMutex_);
  if (pending_.fetch_sub(1) == 1)
    drained_.notify_all();
}

void IngestionWorker::drain() {
  if (thread_.get_id() == std::this_thread::get_id())
    throw std::logic_error("IngestionWorker::drain called from the worker");
  std::unique_lock<std::mutex> lock(drainMutex_);
  drained_.wait(lock, [this]() { return pending_.load() == 0; });
}

void IngestionWorker::stop() {
  {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (!running_.exchange(false))
      return;
    guard_.reset();
  }
  if (thread_.joinable())
    thread_.join();
}

} // namespace sharedict
