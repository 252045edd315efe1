#include "MergeOrchestrator.hpp"

#include <algorithm>
#include <fstream>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/Errors.hpp"
#include "core/registry/SegmentRegistry.hpp"
#include "core/util/Ids.hpp"
#include "services/merge/StagingArea.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace pmp {

namespace {

const char* const kAutoRetryActor = "auto-retry";

// New segments since the last completed merge make it stale.
bool hasFreshInput(const ProctoringReport& report, Channel channel) {
  for (const auto& s : report.segments) {
    if (s.channel == channel && isMergeable(s) && !s.consumed) return true;
  }
  return false;
}

} // namespace

MergeOrchestrator::MergeOrchestrator(SessionStore& store, const BackendSet& backends,
                                     std::shared_ptr<Concatenator> concatenator,
                                     MergeOptions options)
  : store_(store),
    backends_(backends),
    concatenator_(std::move(concatenator)),
    options_(std::move(options)),
    pool_(options_.workers == 0 ? 1 : options_.workers) {
  if (!concatenator_) throw ConfigError("merge orchestrator needs a concatenator");
  fs::create_directories(options_.stagingRoot);
  spdlog::info("merge: {} worker(s), concatenator={}, staging={}",
               pool_.threadCount(), concatenator_->name(), options_.stagingRoot.string());
}

MergeOrchestrator::~MergeOrchestrator() {
  pool_.shutdown();
}

std::pair<MergeStatus, bool> MergeOrchestrator::markPending(const std::string& sessionId,
                                                            Channel channel,
                                                            const std::string& actor) {
  if (!isMergeChannel(channel)) {
    throw ValidationError("channel '" + to_string(channel) + "' has no merged recording");
  }

  for (int attempt = 0; attempt < 8; ++attempt) {
    const Session session = store_.getSession(sessionId);
    const MergeStatus current = session.report.statusOf(channel);

    if (current == MergeStatus::Pending || current == MergeStatus::Processing) {
      return {current, false};
    }
    if (current == MergeStatus::Completed && !hasFreshInput(session.report, channel)) {
      return {current, false};
    }

    if (store_.compareAndSetMergeStatus(sessionId, channel, current, MergeStatus::Pending)) {
      if (current == MergeStatus::Failed && actor != kAutoRetryActor) {
        store_.update(sessionId, [&](Session& s) {
          auto it = s.report.mergeDetails.find(channel);
          if (it == s.report.mergeDetails.end() || it->second.autoRetries == 0) return false;
          it->second.autoRetries = 0;
          return true;
        });
      }
      store_.appendHistory(sessionId, "MERGE_REQUESTED",
                           json{{"channel", to_string(channel)}, {"from", to_string(current)}}.dump(),
                           now_millis(), actor);
      spdlog::info("merge {}/{}: {} -> pending ({})", sessionId, to_string(channel),
                   to_string(current), actor);
      return {MergeStatus::Pending, true};
    }
    // Someone else moved the status; look again.
  }
  return {store_.getSession(sessionId).report.statusOf(channel), false};
}

MergeStatus MergeOrchestrator::trigger(const std::string& sessionId, Channel channel,
                                       const std::string& actor) {
  const auto [status, transitioned] = markPending(sessionId, channel, actor);
  if (transitioned) schedule(sessionId, channel);
  return status;
}

MergeStatus MergeOrchestrator::mergeNow(const std::string& sessionId, Channel channel,
                                        const std::string& actor) {
  const MergeStatus status = markPending(sessionId, channel, actor).first;
  if (status != MergeStatus::Pending) return status;
  if (auto done = runJob(sessionId, channel)) return *done;
  return store_.getSession(sessionId).report.statusOf(channel);
}

void MergeOrchestrator::onSessionTerminal(const std::string& sessionId, const std::string& actor) {
  const Session session = store_.getSession(sessionId);
  for (Channel ch : {Channel::Webcam, Channel::Screen}) {
    if (session.report.segmentsFor(ch).empty()) continue;
    trigger(sessionId, ch, actor);
  }
}

std::map<Channel, MergeStatus> MergeOrchestrator::status(const std::string& sessionId) {
  const Session session = store_.getSession(sessionId);
  return {
    {Channel::Webcam, session.report.statusOf(Channel::Webcam)},
    {Channel::Screen, session.report.statusOf(Channel::Screen)},
  };
}

int MergeOrchestrator::resumePending() {
  int n = 0;
  for (const auto& entry : store_.mergesInStatus(MergeStatus::Pending)) {
    schedule(entry.first, entry.second);
    ++n;
  }
  if (n > 0) spdlog::info("merge: requeued {} pending job(s)", n);
  return n;
}

int MergeOrchestrator::recoverAfterRestart() {
  for (const auto& entry : store_.mergesInStatus(MergeStatus::Processing)) {
    if (!store_.compareAndSetMergeStatus(entry.first, entry.second, MergeStatus::Processing,
                                         MergeStatus::Pending)) {
      continue;
    }
    spdlog::warn("merge {}/{}: left processing by a previous process, requeueing",
                 entry.first, to_string(entry.second));
    store_.appendHistory(entry.first, "MERGE_RECLAIMED",
                         json{{"channel", to_string(entry.second)}, {"reason", "restart"}}.dump(),
                         now_millis(), "startup");
  }
  return resumePending();
}

int MergeOrchestrator::reclaimStalled(std::chrono::milliseconds timeout) {
  const int64_t cutoff = now_millis() - timeout.count();
  int n = 0;
  for (const auto& entry : store_.mergesInStatus(MergeStatus::Processing)) {
    const std::string& sessionId = entry.first;
    const Channel channel = entry.second;

    auto session = store_.findSession(sessionId);
    if (!session) continue;
    auto it = session->report.mergeDetails.find(channel);
    const int64_t lastAttempt = it == session->report.mergeDetails.end() ? 0 : it->second.lastAttemptAt;
    if (lastAttempt > cutoff) continue;

    if (!store_.compareAndSetMergeStatus(sessionId, channel, MergeStatus::Processing,
                                         MergeStatus::Pending)) {
      continue;
    }
    spdlog::warn("merge {}/{}: processing since {} looks stalled, requeueing",
                 sessionId, to_string(channel), lastAttempt);
    store_.appendHistory(sessionId, "MERGE_RECLAIMED",
                         json{{"channel", to_string(channel)}, {"lastAttemptAt", lastAttempt}}.dump(),
                         now_millis(), "maintenance");
    schedule(sessionId, channel);
    ++n;
  }
  return n;
}

void MergeOrchestrator::schedule(const std::string& sessionId, Channel channel,
                                 std::chrono::milliseconds delay) {
  const bool queued = pool_.submitAfter(delay, [this, sessionId, channel] {
    runJob(sessionId, channel);
  });
  if (!queued) {
    spdlog::warn("merge {}/{}: pool is shutting down, job stays pending",
                 sessionId, to_string(channel));
  }
}

std::optional<MergeStatus> MergeOrchestrator::runJob(const std::string& sessionId, Channel channel) {
  if (!store_.compareAndSetMergeStatus(sessionId, channel, MergeStatus::Pending,
                                       MergeStatus::Processing)) {
    spdlog::debug("merge {}/{}: not pending, nothing to claim", sessionId, to_string(channel));
    return std::nullopt;
  }

  const std::string claimId = uuid4();
  bool stamped = false;
  store_.update(sessionId, [&](Session& s) {
    stamped = false;
    if (s.report.statusOf(channel) != MergeStatus::Processing) return false;
    auto& detail = s.report.mergeDetails[channel];
    detail.claimId = claimId;
    detail.lastAttemptAt = now_millis();
    stamped = true;
    return true;
  });
  if (!stamped) return std::nullopt;

  store_.appendHistory(sessionId, "MERGE_CLAIMED",
                       json{{"channel", to_string(channel)}, {"claimId", claimId}}.dump(),
                       now_millis(), "merge-worker");
  spdlog::info("merge {}/{}: claimed ({})", sessionId, to_string(channel), claimId);
  return execute(sessionId, channel, claimId);
}

MergeStatus MergeOrchestrator::execute(const std::string& sessionId, Channel channel,
                                       const std::string& claimId) {
  const std::string channelName = to_string(channel);
  try {
    Session session = store_.getSession(sessionId);
    const MergeInputs inputs = selectMergeInputs(session.report.segments, channel);
    if (inputs.segments.empty()) {
      throw NoValidInputError("no valid input (" + std::to_string(inputs.invalid) +
                              " segment(s) excluded)");
    }
    if (inputs.invalid > 0) {
      spdlog::warn("merge {}/{}: skipping {} invalid segment(s)", sessionId, channelName,
                   inputs.invalid);
    }

    // Every usable segment known now, including duplicates that lost the tie-break.
    std::vector<std::string> covered;
    for (const auto& s : session.report.segments) {
      if (s.channel == channel && isMergeable(s)) covered.push_back(s.segmentId);
    }

    StagingArea staging(options_.stagingRoot, sessionId + "-" + channelName);
    std::vector<StagedInput> staged;
    staged.reserve(inputs.segments.size());

    size_t index = 0;
    for (const auto& seg : inputs.segments) {
      const LocationRef loc = *seg.location();
      StorageBackend& backend = backends_.forRef(loc);
      StagedInput input{seg.segmentId, std::string(), seg.mimeType, seg.durationMs};

      if (loc.backend == BackendKind::Local) {
        const bool present = with_retry(options_.retry, "stat " + loc.str(),
                                        [&] { return backend.exists(loc); });
        if (!present) {
          throw DataLossError("segment " + seg.segmentId + " is missing at " + loc.str());
        }
        input.path = loc.key;
      } else {
        const fs::path dest = staging.file(std::to_string(index) + "-" + seg.segmentId);
        try {
          with_retry(options_.retry, "download " + loc.str(), [&] {
            std::ofstream out(dest, std::ios::binary | std::ios::trunc);
            if (!out) throw BackendError("cannot write " + dest.string());
            backend.get(loc, [&](const char* data, size_t len) {
              out.write(data, static_cast<std::streamsize>(len));
              return static_cast<bool>(out);
            });
            out.close();
            if (!out) throw BackendError("short write to " + dest.string());
          });
        } catch (const NotFoundError&) {
          throw DataLossError("segment " + seg.segmentId + " is missing at " + loc.str());
        }
        input.path = dest.string();
      }
      staged.push_back(std::move(input));
      ++index;
    }

    const std::string output = staging.file(channelName + "-merged.webm").string();
    const ConcatResult result = concatenator_->concat(staged, output);

    // The claim id keeps a reclaimed job and its successor off each other's key.
    const int64_t generation = session.report.mergeDetails[channel].generation + 1;
    const std::string key = sessionId + "/" + channelName + "-merged-" +
                            std::to_string(generation) + "-" + claimId + ".webm";
    const std::string mimeType = inputs.segments.front().mimeType;
    StorageBackend& writer = backends_.writer();
    const LocationRef published = with_retry(options_.retry, "publish " + key, [&] {
      return writer.putFile(key, output, mimeType);
    });

    bool committed = false;
    std::optional<LocationRef> previous;
    try {
      store_.update(sessionId, [&](Session& s) {
        committed = false;
        previous.reset();
        auto& detail = s.report.mergeDetails[channel];
        if (s.report.statusOf(channel) != MergeStatus::Processing || detail.claimId != claimId) {
          return false;
        }
        previous = s.report.recordingOf(channel);
        s.report.recordingUrls[channel] = published.str();
        s.report.mergeStatus[channel] = MergeStatus::Completed;
        detail.error.clear();
        detail.claimId.clear();
        detail.autoRetries = 0;
        detail.generation = generation;
        detail.sizeBytes = static_cast<int64_t>(result.sizeBytes);
        detail.durationMs = result.durationMs;
        detail.segmentCount = static_cast<int>(staged.size());
        detail.invalidSegments = inputs.invalid;
        for (auto& seg : s.report.segments) {
          if (std::find(covered.begin(), covered.end(), seg.segmentId) != covered.end()) {
            seg.consumed = true;
          }
        }
        if (previous && *previous != published && !s.report.references(*previous)) {
          s.report.orphans.push_back(Orphan{previous->str(), now_millis(), "superseded recording"});
        }
        committed = true;
        return true;
      });
    } catch (const std::exception& e) {
      // The update did not land and no other claim can produce this key.
      spdlog::error("merge {}/{}: could not record {}: {}", sessionId, channelName,
                    published.str(), e.what());
      discard(published);
      throw;
    }

    if (!committed) {
      spdlog::warn("merge {}/{}: claim {} was taken over, dropping result",
                   sessionId, channelName, claimId);
      discard(published);
      return store_.getSession(sessionId).report.statusOf(channel);
    }

    store_.appendHistory(sessionId, "MERGE_COMPLETED",
                         json{{"channel", channelName},
                              {"recording", published.str()},
                              {"segments", staged.size()},
                              {"invalidSegments", inputs.invalid},
                              {"sizeBytes", result.sizeBytes},
                              {"durationMs", result.durationMs}}.dump(),
                         now_millis(), "merge-worker");
    spdlog::info("merge {}/{}: completed {} segment(s) -> {} ({} bytes, {} ms)",
                 sessionId, channelName, staged.size(), published.str(),
                 result.sizeBytes, result.durationMs);
    return MergeStatus::Completed;
  } catch (const BackendUnavailableError& e) {
    return fail(sessionId, channel, claimId, e.what(), true);
  } catch (const std::exception& e) {
    return fail(sessionId, channel, claimId, e.what(), false);
  }
}

MergeStatus MergeOrchestrator::fail(const std::string& sessionId, Channel channel,
                                    const std::string& claimId, const std::string& error,
                                    bool transient) {
  bool applied = false;
  bool retry = false;
  store_.update(sessionId, [&](Session& s) {
    applied = false;
    retry = false;
    auto& detail = s.report.mergeDetails[channel];
    if (s.report.statusOf(channel) != MergeStatus::Processing || detail.claimId != claimId) {
      return false;
    }
    s.report.mergeStatus[channel] = MergeStatus::Failed;
    detail.error = error;
    detail.claimId.clear();
    if (transient && detail.autoRetries < options_.autoRetries) {
      ++detail.autoRetries;
      retry = true;
    }
    applied = true;
    return true;
  });

  if (!applied) {
    spdlog::warn("merge {}/{}: failed after losing claim {}: {}",
                 sessionId, to_string(channel), claimId, error);
    return store_.getSession(sessionId).report.statusOf(channel);
  }

  spdlog::error("merge {}/{}: failed: {}", sessionId, to_string(channel), error);
  store_.appendHistory(sessionId, "MERGE_FAILED",
                       json{{"channel", to_string(channel)},
                            {"error", error},
                            {"autoRetry", retry}}.dump(),
                       now_millis(), "merge-worker");

  if (retry) {
    spdlog::info("merge {}/{}: automatic retry in {} ms", sessionId, to_string(channel),
                 options_.autoRetryDelay.count());
    pool_.submitAfter(options_.autoRetryDelay, [this, sessionId, channel] {
      trigger(sessionId, channel, kAutoRetryActor);
    });
  }
  return MergeStatus::Failed;
}

void MergeOrchestrator::discard(const LocationRef& ref) {
  try {
    backends_.forRef(ref).remove(ref);
  } catch (const std::exception& e) {
    spdlog::warn("merge: could not remove unused artifact {}: {}", ref.str(), e.what());
  }
}

} // namespace pmp
