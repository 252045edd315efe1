#include "InitDb.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>

#include "core/Errors.hpp"

namespace pmp {

namespace {

struct DbCloser {
  void operator()(sqlite3* db) const { sqlite3_close(db); }
};
using DbPtr = std::unique_ptr<sqlite3, DbCloser>;

void execAll(sqlite3* db, const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw std::runtime_error("SQLite exec failed: " + msg);
  }
}

int queryInt(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("prepare failed: ") + sqlite3_errmsg(db));
  }
  const int rc = sqlite3_step(st);
  const int v = rc == SQLITE_ROW ? sqlite3_column_int(st, 0) : 0;
  sqlite3_finalize(st);
  if (rc != SQLITE_ROW) throw std::runtime_error(std::string("query failed: ") + sqlite3_errmsg(db));
  return v;
}

std::string readSchema(const std::string& schemaPath) {
  std::ifstream in(schemaPath);
  if (!in) throw std::runtime_error("Cannot open schema file: " + schemaPath);
  std::ostringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

// Version 1 reports predate merge details and orphan tracking.
void upgradeFromV1(sqlite3* db) {
  execAll(db, R"SQL(
    UPDATE sessions SET report = json_set(report, '$.mergeDetails', json('{}'))
     WHERE json_type(report, '$.mergeDetails') IS NULL;
    UPDATE sessions SET report = json_set(report, '$.orphans', json('[]'))
     WHERE json_type(report, '$.orphans') IS NULL;
  )SQL");
}

} // namespace

bool initDatabase(const std::string& dbPath, const std::string& schemaPath) {
  const auto parent = std::filesystem::path(dbPath).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent);

  sqlite3* raw = nullptr;
  const int rc = sqlite3_open_v2(dbPath.c_str(), &raw,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
  DbPtr db(raw);
  if (rc != SQLITE_OK) {
    throw std::runtime_error("Failed to open DB: " + std::string(raw ? sqlite3_errmsg(raw) : "out of memory"));
  }

  // WAL lets the media gateway read while ingestion and merges write
  execAll(db.get(), "PRAGMA journal_mode=WAL;");
  execAll(db.get(), "PRAGMA synchronous=NORMAL;");
  execAll(db.get(), "PRAGMA foreign_keys=ON;");
  execAll(db.get(), "PRAGMA busy_timeout=5000;");

  const int found = queryInt(db.get(), "PRAGMA user_version;");
  if (found > kSchemaVersion) {
    throw ConfigError(dbPath + " has schema version " + std::to_string(found) +
                      ", this build knows up to " + std::to_string(kSchemaVersion));
  }
  const std::string schema = readSchema(schemaPath);

  execAll(db.get(), "BEGIN IMMEDIATE;");
  try {
    execAll(db.get(), schema);
    if (found == 1) upgradeFromV1(db.get());
    execAll(db.get(), "PRAGMA user_version=" + std::to_string(kSchemaVersion) + ";");
    execAll(db.get(), "COMMIT;");
  } catch (const std::exception&) {
    sqlite3_exec(db.get(), "ROLLBACK;", nullptr, nullptr, nullptr);
    throw;
  }

  const int tables = queryInt(db.get(), R"SQL(
    SELECT count(*) FROM sqlite_master
     WHERE type = 'table' AND name IN ('sessions', 'session_history')
  )SQL");
  if (tables != 2) throw ConfigError(schemaPath + " does not define the session tables");

  if (found != kSchemaVersion) {
    spdlog::info("db {}: schema version {} -> {}", dbPath, found, kSchemaVersion);
  }
  return true;
}

} // namespace pmp
