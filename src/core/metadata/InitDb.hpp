#pragma once
#include <string>

namespace pmp {

// Stored in PRAGMA user_version. 2 added merge details and orphans to reports.
constexpr int kSchemaVersion = 2;

// Opens (creating if needed) the database, sets pragmas and applies schemaPath
// in one transaction, upgrading older reports. Idempotent; safe on every start.
// ConfigError when the database is newer than this build or the schema file
// does not create the session tables.
bool initDatabase(const std::string& dbPath, const std::string& schemaPath);

} // namespace pmp
