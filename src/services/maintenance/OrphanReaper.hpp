#pragma once
#include <chrono>
#include <string>

#include "core/metadata/SessionStore.hpp"
#include "core/storage/BackendSet.hpp"

namespace pmp {

struct ReapStats {
  int examined = 0;
  int deleted = 0;      // removed from storage (or already absent)
  int young = 0;        // inside the retention window
  int referenced = 0;   // still in use, dropped from the list without deleting
  int errors = 0;
};

// Deletes bytes listed in a report's orphans once they are older than the
// retention window, then drops them from the list. Locations still referenced
// by a segment or a recording URL are never deleted.
class OrphanReaper {
public:
  OrphanReaper(SessionStore& store, const BackendSet& backends,
               std::chrono::milliseconds retention)
    : store_(store), backends_(backends), retention_(retention) {}

  // Does not throw. dryRun only counts.
  ReapStats run(bool dryRun = false);

  ReapStats runSession(const std::string& sessionId, bool dryRun = false);

private:
  SessionStore&             store_;
  const BackendSet&         backends_;
  std::chrono::milliseconds retention_;
};

} // namespace pmp
