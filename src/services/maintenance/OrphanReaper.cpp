#include "OrphanReaper.hpp"

#include <algorithm>
#include <set>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/Errors.hpp"
#include "core/util/Ids.hpp"

using json = nlohmann::json;

namespace pmp {

ReapStats OrphanReaper::run(bool dryRun) {
  ReapStats total;
  std::vector<std::string> ids;
  try {
    ids = store_.sessionIdsWithSegments();
  } catch (const std::exception& e) {
    spdlog::error("reaper: cannot list sessions: {}", e.what());
    ++total.errors;
    return total;
  }

  for (const auto& id : ids) {
    try {
      const ReapStats s = runSession(id, dryRun);
      total.examined += s.examined;
      total.deleted += s.deleted;
      total.young += s.young;
      total.referenced += s.referenced;
      total.errors += s.errors;
    } catch (const std::exception& e) {
      spdlog::error("reaper: session {}: {}", id, e.what());
      ++total.errors;
    }
  }

  spdlog::info("reaper{}: examined {}, deleted {}, kept {} young and {} referenced, {} error(s)",
               dryRun ? " (dry run)" : "", total.examined, total.deleted, total.young,
               total.referenced, total.errors);
  return total;
}

ReapStats OrphanReaper::runSession(const std::string& sessionId, bool dryRun) {
  ReapStats stats;
  const int64_t cutoff = now_millis() - retention_.count();
  const Session session = store_.getSession(sessionId);

  std::set<std::string> done; // entries to drop from the list
  json deleted = json::array();

  for (const auto& orphan : session.report.orphans) {
    ++stats.examined;
    if (orphan.orphanedAt > cutoff) {
      ++stats.young;
      continue;
    }

    const auto ref = LocationRef::parse(orphan.location);
    if (!ref) {
      spdlog::warn("reaper: session {}: unreadable orphan location '{}', dropping entry",
                   sessionId, orphan.location);
      done.insert(orphan.location);
      continue;
    }
    if (session.report.references(*ref)) {
      ++stats.referenced;
      done.insert(orphan.location);
      continue;
    }
    if (dryRun) {
      spdlog::info("reaper (dry run): would delete {}", orphan.location);
      ++stats.deleted;
      continue;
    }

    try {
      backends_.forRef(*ref).remove(*ref);
    } catch (const NotFoundError&) {
      spdlog::debug("reaper: {} already gone", orphan.location);
    } catch (const std::exception& e) {
      spdlog::warn("reaper: could not delete {}: {}", orphan.location, e.what());
      ++stats.errors;
      continue;
    }
    ++stats.deleted;
    done.insert(orphan.location);
    deleted.push_back(orphan.location);
  }

  if (dryRun || done.empty()) return stats;

  store_.update(sessionId, [&](Session& s) {
    auto& list = s.report.orphans;
    const auto before = list.size();
    list.erase(std::remove_if(list.begin(), list.end(),
                              [&](const Orphan& o) { return done.count(o.location) > 0; }),
               list.end());
    return list.size() != before;
  });

  if (!deleted.empty()) {
    store_.appendHistory(sessionId, "ORPHANS_DELETED", json{{"locations", deleted}}.dump(),
                         now_millis(), "maintenance");
  }
  return stats;
}

} // namespace pmp
