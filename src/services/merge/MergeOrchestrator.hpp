#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "core/concurrency/WorkerPool.hpp"
#include "core/media/Concatenator.hpp"
#include "core/metadata/SessionStore.hpp"
#include "core/model/Types.hpp"
#include "core/storage/BackendSet.hpp"
#include "core/util/Retry.hpp"

namespace pmp {

struct MergeOptions {
  std::filesystem::path     stagingRoot = "data/staging";
  size_t                    workers = 2;
  RetryPolicy               retry;
  int                       autoRetries = 3;     // automatic re-runs after transient failures
  std::chrono::milliseconds autoRetryDelay{60000};
};

// Turns a channel's segments into one published recording. Jobs run on an
// owned worker pool; the per-channel merge status in the session document is
// the only lock, moved with compare-and-set so one job wins each claim.
class MergeOrchestrator {
public:
  MergeOrchestrator(SessionStore& store, const BackendSet& backends,
                    std::shared_ptr<Concatenator> concatenator, MergeOptions options);
  ~MergeOrchestrator();

  MergeOrchestrator(const MergeOrchestrator&) = delete;
  MergeOrchestrator& operator=(const MergeOrchestrator&) = delete;

  // Moves the channel to pending when allowed and queues the job. Returns at
  // once with the status the channel is in after the call. A channel already
  // pending or processing is left alone. Completed channels are only re-merged
  // once new segments arrived.
  MergeStatus trigger(const std::string& sessionId, Channel channel,
                      const std::string& actor = "api");

  // Same transition as trigger(), but the job runs on the calling thread.
  MergeStatus mergeNow(const std::string& sessionId, Channel channel,
                       const std::string& actor = "cli");

  // Triggers every merge channel that has at least one segment.
  void onSessionTerminal(const std::string& sessionId, const std::string& actor = "api");

  std::map<Channel, MergeStatus> status(const std::string& sessionId);

  // Requeues channels left pending by a previous process.
  int resumePending();

  // Startup of the only server on a database: claims still processing belong
  // to a dead process, so they go back to pending at once, then all pending
  // work is requeued. Returns how many jobs were queued.
  int recoverAfterRestart();

  // Returns processing claims older than `timeout` to pending and requeues
  // them. Returns how many were reclaimed.
  int reclaimStalled(std::chrono::milliseconds timeout);

  void waitIdle() { pool_.waitIdle(); }
  void shutdown() { pool_.shutdown(); }
  size_t peakConcurrentJobs() const { return pool_.peakRunning(); }

private:
  // Status after the attempt, and whether this call made the transition.
  std::pair<MergeStatus, bool> markPending(const std::string& sessionId, Channel channel,
                                           const std::string& actor);
  void schedule(const std::string& sessionId, Channel channel,
                std::chrono::milliseconds delay = std::chrono::milliseconds{0});
  std::optional<MergeStatus> runJob(const std::string& sessionId, Channel channel);
  MergeStatus execute(const std::string& sessionId, Channel channel, const std::string& claimId);
  MergeStatus fail(const std::string& sessionId, Channel channel, const std::string& claimId,
                   const std::string& error, bool transient);
  void discard(const LocationRef& ref);

  SessionStore&                 store_;
  const BackendSet&             backends_;
  std::shared_ptr<Concatenator> concatenator_;
  MergeOptions                  options_;
  WorkerPool                    pool_;
};

} // namespace pmp
