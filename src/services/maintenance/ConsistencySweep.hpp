#pragma once
#include <string>

#include "core/metadata/SessionStore.hpp"

namespace pmp {

struct SweepStats {
  int sessions = 0;
  int segments = 0;
  int repaired = 0;      // stray location field cleared
  int unrepairable = 0;  // authoritative field missing, left as is
  int errors = 0;        // sessions the pass could not process
};

// Clears location fields that disagree with a segment's storageBackend.
// Never deletes bytes and never touches sequence or channel. Running it twice
// changes nothing the second time.
class ConsistencySweep {
public:
  explicit ConsistencySweep(SessionStore& store) : store_(store) {}

  // Does not throw; per-session failures are logged and counted.
  SweepStats run();

  SweepStats runSession(const std::string& sessionId);

private:
  SessionStore& store_;
};

} // namespace pmp
