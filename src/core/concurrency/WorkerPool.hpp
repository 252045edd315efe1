#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace pmp {

// Fixed number of threads running queued tasks, optionally not before a due time.
// Tasks must not throw; an escaping exception is logged and dropped.
class WorkerPool {
public:
  using Task = std::function<void()>;
  using Clock = std::chrono::steady_clock;

  explicit WorkerPool(size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // False once shutdown() has begun.
  bool submit(Task task);
  bool submitAfter(std::chrono::milliseconds delay, Task task);

  // Blocks until nothing is running and nothing is due. Delayed tasks whose
  // time has not come yet do not count.
  void waitIdle();

  // Runs everything already due, drops the rest, joins the threads.
  void shutdown();

  size_t threadCount() const { return threads_.size(); }
  size_t running() const;
  size_t peakRunning() const;

private:
  struct Item {
    Clock::time_point due;
    uint64_t          seq;
    Task              task;
    bool operator>(const Item& o) const { return due != o.due ? due > o.due : seq > o.seq; }
  };

  void loop();
  bool hasDueLocked(Clock::time_point now) const;

  mutable std::mutex mu_;
  std::condition_variable wake_;
  std::condition_variable idle_;
  std::priority_queue<Item, std::vector<Item>, std::greater<Item>> queue_;
  std::vector<std::thread> threads_;
  uint64_t seq_ = 0;
  size_t running_ = 0;
  size_t peak_ = 0;
  bool stopping_ = false;
};

} // namespace pmp
