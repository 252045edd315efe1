#include "WorkerPool.hpp"

#include <algorithm>
#include <exception>

#include <spdlog/spdlog.h>

namespace pmp {

WorkerPool::WorkerPool(size_t threads) {
  const size_t n = std::max<size_t>(threads, 1);
  threads_.reserve(n);
  for (size_t i = 0; i < n; ++i) threads_.emplace_back([this] { loop(); });
}

WorkerPool::~WorkerPool() {
  shutdown();
}

bool WorkerPool::submit(Task task) {
  return submitAfter(std::chrono::milliseconds(0), std::move(task));
}

bool WorkerPool::submitAfter(std::chrono::milliseconds delay, Task task) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (stopping_) return false;
    queue_.push(Item{Clock::now() + delay, seq_++, std::move(task)});
  }
  wake_.notify_one();
  return true;
}

bool WorkerPool::hasDueLocked(Clock::time_point now) const {
  return !queue_.empty() && queue_.top().due <= now;
}

void WorkerPool::loop() {
  std::unique_lock<std::mutex> lock(mu_);
  for (;;) {
    if (queue_.empty()) {
      if (stopping_) return;
      wake_.wait(lock);
      continue;
    }
    const auto now = Clock::now();
    if (!hasDueLocked(now)) {
      if (stopping_) return; // not due yet: dropped on shutdown
      wake_.wait_until(lock, queue_.top().due);
      continue;
    }

    Task task = std::move(const_cast<Item&>(queue_.top()).task);
    queue_.pop();
    ++running_;
    peak_ = std::max(peak_, running_);
    lock.unlock();
    try {
      task();
    } catch (const std::exception& e) {
      spdlog::error("worker task threw: {}", e.what());
    }
    lock.lock();
    --running_;
    idle_.notify_all();
  }
}

void WorkerPool::waitIdle() {
  std::unique_lock<std::mutex> lock(mu_);
  idle_.wait(lock, [this] { return running_ == 0 && !hasDueLocked(Clock::now()); });
}

void WorkerPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (stopping_ && threads_.empty()) return;
    stopping_ = true;
  }
  wake_.notify_all();
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
  std::lock_guard<std::mutex> lock(mu_);
  threads_.clear();
  while (!queue_.empty()) queue_.pop();
  idle_.notify_all();
}

size_t WorkerPool::running() const {
  std::lock_guard<std::mutex> lock(mu_);
  return running_;
}

size_t WorkerPool::peakRunning() const {
  std::lock_guard<std::mutex> lock(mu_);
  return peak_;
}

} // namespace pmp
