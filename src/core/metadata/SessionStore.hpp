#pragma once
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/model/Session.hpp"

namespace pmp {

struct HistoryEntry {
  int64_t     id = 0;
  std::string sessionId;
  std::string event;
  std::string detailsJson;
  int64_t     at = 0;
  std::string actor;
};

// Session documents in SQLite. Each session row carries its proctoring report as
// JSON plus a version counter; writers use optimistic compare-and-set on that
// version so unrelated sessions never wait on each other.
class SessionStore {
public:
  explicit SessionStore(const std::string& dbPath);
  ~SessionStore();

  SessionStore(const SessionStore&) = delete;
  SessionStore& operator=(const SessionStore&) = delete;

  // Throws ValidationError if the id is taken.
  Session createSession(const std::string& id);

  std::optional<Session> findSession(const std::string& id);
  Session getSession(const std::string& id); // SessionNotFoundError when absent

  // Read-modify-write. The mutator may run several times (once per lost race),
  // so it must derive everything from the Session it is handed. Returning false
  // skips the write. Throws ConcurrentModificationError after maxAttempts.
  using Mutator = std::function<bool(Session&)>;
  Session update(const std::string& id, const Mutator& mutate, int maxAttempts = 32);

  // Single conditional UPDATE on mergeStatus[channel]. True only for the caller
  // whose update moved the status from `from` to `to`.
  bool compareAndSetMergeStatus(const std::string& id, Channel channel,
                                MergeStatus from, MergeStatus to);

  std::vector<std::string> sessionIdsWithSegments();
  std::vector<std::pair<std::string, Channel>> mergesInStatus(MergeStatus status);

  void appendHistory(const std::string& session_id,
                     const std::string& event,
                     const std::string& details_json,
                     int64_t at,
                     const std::string& actor);
  std::vector<HistoryEntry> history(const std::string& session_id);

private:
  std::optional<Session> load(const std::string& id);
  bool writeIfVersion(const Session& s, int64_t expectedVersion);

  void* db_; // sqlite3*
  std::mutex mu_;
};

} // namespace pmp
