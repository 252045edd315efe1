#include "SessionStore.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include <stdexcept>

#include "core/Errors.hpp"
#include "core/util/Ids.hpp"

using nlohmann::json;

namespace pmp {

// -------- helpers --------

namespace {

// Owns a prepared statement for the duration of one call.
class Stmt {
public:
  Stmt(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      throw std::runtime_error(std::string("prepare failed: ") + sqlite3_errmsg(db));
    }
  }
  ~Stmt() { sqlite3_finalize(st_); }
  Stmt(const Stmt&) = delete;
  Stmt& operator=(const Stmt&) = delete;

  Stmt& bind(int i, const std::string& v) {
    sqlite3_bind_text(st_, i, v.c_str(), -1, SQLITE_TRANSIENT);
    return *this;
  }
  Stmt& bind(int i, int64_t v) {
    sqlite3_bind_int64(st_, i, v);
    return *this;
  }

  // SQLITE_ROW -> true, SQLITE_DONE -> false, anything else throws.
  bool step() {
    int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw std::runtime_error(std::string("step failed: ") + sqlite3_errmsg(db_));
  }

  std::string text(int col) const {
    auto* p = sqlite3_column_text(st_, col);
    return p ? reinterpret_cast<const char*>(p) : "";
  }
  int64_t int64(int col) const { return sqlite3_column_int64(st_, col); }

private:
  sqlite3* db_;
  sqlite3_stmt* st_ = nullptr;
};

} // namespace

SessionStore::SessionStore(const std::string& dbPath) : db_(nullptr) {
  sqlite3* db = nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX,
                      nullptr) != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw std::runtime_error("failed to open db: " + msg);
  }
  sqlite3_busy_timeout(db, 5000);
  db_ = db;
}

SessionStore::~SessionStore() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

Session SessionStore::createSession(const std::string& id) {
  if (id.empty()) throw ValidationError("session id required");
  const int64_t now = now_millis();
  Session s;
  s.id = id;
  s.createdAt = now;
  s.updatedAt = now;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto* db = static_cast<sqlite3*>(db_);
    Stmt st(db, R"SQL(
      INSERT INTO sessions (id, status, report, version, created_at, updated_at)
      VALUES (?,?,?,0,?,?)
      ON CONFLICT(id) DO NOTHING
    )SQL");
    st.bind(1, id).bind(2, to_string(s.status)).bind(3, json(s.report).dump())
      .bind(4, now).bind(5, now);
    st.step();
    if (sqlite3_changes(db) != 1) throw ValidationError("session already exists: " + id);
  }
  appendHistory(id, "SESSION_CREATED", "{}", now, "api");
  return s;
}

std::optional<Session> SessionStore::load(const std::string& id) {
  std::lock_guard<std::mutex> lock(mu_);
  Stmt st(static_cast<sqlite3*>(db_),
          "SELECT id, status, report, version, created_at, updated_at FROM sessions WHERE id = ?");
  st.bind(1, id);
  if (!st.step()) return std::nullopt;

  Session s;
  s.id = st.text(0);
  s.status = parseSessionStatus(st.text(1)).value_or(SessionStatus::InProgress);
  try {
    s.report = json::parse(st.text(2)).get<ProctoringReport>();
  } catch (const json::exception& e) {
    throw std::runtime_error("corrupt report for session " + id + ": " + e.what());
  }
  s.version = st.int64(3);
  s.createdAt = st.int64(4);
  s.updatedAt = st.int64(5);
  return s;
}

std::optional<Session> SessionStore::findSession(const std::string& id) {
  return load(id);
}

Session SessionStore::getSession(const std::string& id) {
  auto s = load(id);
  if (!s) throw SessionNotFoundError("session not found: " + id);
  return *s;
}

bool SessionStore::writeIfVersion(const Session& s, int64_t expectedVersion) {
  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  Stmt st(db, R"SQL(
    UPDATE sessions
       SET status = ?, report = ?, version = version + 1, updated_at = ?
     WHERE id = ? AND version = ?
  )SQL");
  st.bind(1, to_string(s.status)).bind(2, json(s.report).dump()).bind(3, now_millis())
    .bind(4, s.id).bind(5, expectedVersion);
  st.step();
  return sqlite3_changes(db) == 1;
}

Session SessionStore::update(const std::string& id, const Mutator& mutate, int maxAttempts) {
  for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
    Session s = getSession(id);
    const int64_t seen = s.version;
    if (!mutate(s)) return s;
    if (writeIfVersion(s, seen)) {
      s.version = seen + 1;
      return s;
    }
    spdlog::debug("session {}: version {} superseded, retrying update ({}/{})",
                  id, seen, attempt, maxAttempts);
  }
  throw ConcurrentModificationError("session " + id + ": too many concurrent updates");
}

bool SessionStore::compareAndSetMergeStatus(const std::string& id, Channel channel,
                                            MergeStatus from, MergeStatus to) {
  if (!isValidTransition(from, to)) {
    throw std::logic_error("invalid merge transition " + to_string(from) + " -> " + to_string(to));
  }
  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  Stmt st(db, R"SQL(
    UPDATE sessions
       SET report = json_set(report, '$.mergeStatus.' || ?1, ?3),
           version = version + 1,
           updated_at = ?4
     WHERE id = ?5
       AND coalesce(json_extract(report, '$.mergeStatus.' || ?1), 'not_started') = ?2
  )SQL");
  st.bind(1, to_string(channel)).bind(2, to_string(from)).bind(3, to_string(to))
    .bind(4, now_millis()).bind(5, id);
  st.step();
  return sqlite3_changes(db) == 1;
}

std::vector<std::string> SessionStore::sessionIdsWithSegments() {
  std::lock_guard<std::mutex> lock(mu_);
  Stmt st(static_cast<sqlite3*>(db_), R"SQL(
    SELECT id FROM sessions
     WHERE json_array_length(report, '$.segments') > 0
     ORDER BY created_at
  )SQL");
  std::vector<std::string> out;
  while (st.step()) out.push_back(st.text(0));
  return out;
}

std::vector<std::pair<std::string, Channel>> SessionStore::mergesInStatus(MergeStatus status) {
  std::lock_guard<std::mutex> lock(mu_);
  Stmt st(static_cast<sqlite3*>(db_), R"SQL(
    SELECT id, 'webcam' FROM sessions WHERE json_extract(report, '$.mergeStatus.webcam') = ?1
    UNION ALL
    SELECT id, 'screen' FROM sessions WHERE json_extract(report, '$.mergeStatus.screen') = ?1
  )SQL");
  st.bind(1, to_string(status));
  std::vector<std::pair<std::string, Channel>> out;
  while (st.step()) {
    if (auto ch = parseChannel(st.text(1))) out.emplace_back(st.text(0), *ch);
  }
  return out;
}

void SessionStore::appendHistory(const std::string& session_id,
                                 const std::string& event,
                                 const std::string& details_json,
                                 int64_t at,
                                 const std::string& actor) {
  std::lock_guard<std::mutex> lock(mu_);
  Stmt st(static_cast<sqlite3*>(db_), R"SQL(
    INSERT INTO session_history (session_id, event, details, at, actor)
    VALUES (?,?,?,?,?)
  )SQL");
  st.bind(1, session_id).bind(2, event).bind(3, details_json).bind(4, at).bind(5, actor);
  st.step();
}

std::vector<HistoryEntry> SessionStore::history(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(mu_);
  Stmt st(static_cast<sqlite3*>(db_), R"SQL(
    SELECT id, session_id, event, details, at, actor
      FROM session_history WHERE session_id = ? ORDER BY id
  )SQL");
  st.bind(1, session_id);
  std::vector<HistoryEntry> out;
  while (st.step()) {
    out.push_back(HistoryEntry{st.int64(0), st.text(1), st.text(2), st.text(3), st.int64(4), st.text(5)});
  }
  return out;
}

} // namespace pmp
