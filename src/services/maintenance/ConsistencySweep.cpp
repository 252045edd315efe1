#include "ConsistencySweep.hpp"

#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/util/Ids.hpp"

using json = nlohmann::json;

namespace pmp {

SweepStats ConsistencySweep::run() {
  SweepStats total;
  std::vector<std::string> ids;
  try {
    ids = store_.sessionIdsWithSegments();
  } catch (const std::exception& e) {
    spdlog::error("sweep: cannot list sessions: {}", e.what());
    ++total.errors;
    return total;
  }

  for (const auto& id : ids) {
    try {
      const SweepStats s = runSession(id);
      total.sessions += s.sessions;
      total.segments += s.segments;
      total.repaired += s.repaired;
      total.unrepairable += s.unrepairable;
    } catch (const std::exception& e) {
      spdlog::error("sweep: session {}: {}", id, e.what());
      ++total.errors;
    }
  }

  spdlog::info("sweep: {} session(s), {} segment(s), {} repaired, {} unrepairable, {} error(s)",
               total.sessions, total.segments, total.repaired, total.unrepairable, total.errors);
  return total;
}

SweepStats ConsistencySweep::runSession(const std::string& sessionId) {
  SweepStats stats;
  json repairs;

  store_.update(sessionId, [&](Session& s) {
    stats = SweepStats{};
    stats.sessions = 1;
    repairs = json::array();

    for (auto& seg : s.report.segments) {
      ++stats.segments;
      const bool local = seg.storageBackend == BackendKind::Local;
      const bool hasOwn = local ? seg.localPath.has_value() : seg.remoteKey.has_value();
      const bool hasStray = local ? seg.remoteKey.has_value() : seg.localPath.has_value();

      if (!hasOwn) {
        ++stats.unrepairable;
        spdlog::warn("sweep: segment {} of {} has no {} location, leaving it",
                     seg.segmentId, sessionId, to_string(seg.storageBackend));
        continue;
      }
      if (!hasStray) continue;

      json entry{{"segmentId", seg.segmentId}, {"backend", to_string(seg.storageBackend)}};
      if (local) {
        entry["clearedRemoteKey"] = *seg.remoteKey;
        seg.remoteKey.reset();
      } else {
        entry["clearedLocalPath"] = *seg.localPath;
        seg.localPath.reset();
      }
      repairs.push_back(std::move(entry));
      ++stats.repaired;
    }
    return stats.repaired > 0;
  });

  if (stats.repaired > 0) {
    spdlog::info("sweep: session {}: cleared {} stray location field(s)", sessionId, stats.repaired);
    store_.appendHistory(sessionId, "SEGMENTS_REPAIRED", json{{"repairs", repairs}}.dump(),
                         now_millis(), "maintenance");
  }
  return stats;
}

} // namespace pmp
