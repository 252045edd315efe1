#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "services/maintenance/ConsistencySweep.hpp"
#include "services/maintenance/OrphanReaper.hpp"
#include "services/merge/MergeOrchestrator.hpp"

namespace pmp {

struct MaintenanceOptions {
  std::chrono::milliseconds interval{std::chrono::minutes(60)}; // 0 disables the thread
  std::chrono::milliseconds stalledMergeTimeout{std::chrono::minutes(30)};
};

// Periodic sweep, orphan reaping and stalled merge reclaim on one background
// thread. Runs never overlap, including manual runOnce() calls.
class MaintenanceScheduler {
public:
  MaintenanceScheduler(ConsistencySweep& sweep, OrphanReaper& reaper,
                       MergeOrchestrator& merges, MaintenanceOptions options);
  ~MaintenanceScheduler();

  MaintenanceScheduler(const MaintenanceScheduler&) = delete;
  MaintenanceScheduler& operator=(const MaintenanceScheduler&) = delete;

  void start();
  void stop();

  // False when another run was in progress and this call did nothing.
  bool runOnce();

  int completedRuns() const { return runs_.load(); }

private:
  void loop();

  ConsistencySweep&  sweep_;
  OrphanReaper&      reaper_;
  MergeOrchestrator& merges_;
  MaintenanceOptions options_;

  std::mutex              mu_;
  std::condition_variable wake_;
  std::thread             thread_;
  bool                    stopping_ = false;
  std::atomic<bool>       busy_{false};
  std::atomic<int>        runs_{0};
};

} // namespace pmp
