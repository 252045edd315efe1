#include "MaintenanceScheduler.hpp"

#include <spdlog/spdlog.h>

namespace pmp {

MaintenanceScheduler::MaintenanceScheduler(ConsistencySweep& sweep, OrphanReaper& reaper,
                                           MergeOrchestrator& merges, MaintenanceOptions options)
  : sweep_(sweep), reaper_(reaper), merges_(merges), options_(options) {}

MaintenanceScheduler::~MaintenanceScheduler() {
  stop();
}

void MaintenanceScheduler::start() {
  if (options_.interval.count() <= 0) {
    spdlog::info("maintenance: periodic runs disabled");
    return;
  }
  std::lock_guard<std::mutex> lk(mu_);
  if (thread_.joinable()) return;
  stopping_ = false;
  thread_ = std::thread([this] { loop(); });
  spdlog::info("maintenance: every {} s",
               std::chrono::duration_cast<std::chrono::seconds>(options_.interval).count());
}

void MaintenanceScheduler::stop() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stopping_ = true;
  }
  wake_.notify_all();
  if (thread_.joinable()) thread_.join();
}

bool MaintenanceScheduler::runOnce() {
  bool expected = false;
  if (!busy_.compare_exchange_strong(expected, true)) {
    spdlog::info("maintenance: previous run still going, skipping");
    return false;
  }

  spdlog::info("maintenance: run started");
  const SweepStats swept = sweep_.run();
  const ReapStats reaped = reaper_.run();
  int reclaimed = 0;
  try {
    reclaimed = merges_.reclaimStalled(options_.stalledMergeTimeout);
  } catch (const std::exception& e) {
    spdlog::error("maintenance: stalled merge reclaim failed: {}", e.what());
  }
  spdlog::info("maintenance: run finished ({} repaired, {} orphan(s) deleted, {} merge(s) reclaimed)",
               swept.repaired, reaped.deleted, reclaimed);

  ++runs_;
  busy_ = false;
  return true;
}

void MaintenanceScheduler::loop() {
  std::unique_lock<std::mutex> lk(mu_);
  while (!stopping_) {
    if (wake_.wait_for(lk, options_.interval, [this] { return stopping_; })) break;
    lk.unlock();
    runOnce();
    lk.lock();
  }
}

} // namespace pmp
