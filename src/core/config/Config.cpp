#include "Config.hpp"

#include <cstdlib>
#include <stdexcept>

#include "core/Errors.hpp"

namespace pmp {

std::string get_env_or(const char* key, const std::string& defval) {
#ifdef _WIN32
  size_t len = 0;
  char* buf = nullptr;
  if (_dupenv_s(&buf, &len, key) == 0 && buf) {
    std::string v(buf);
    free(buf);
    return v;
  }
  return defval;
#else
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
#endif
}

static int64_t env_int(const char* key, int64_t defval, int64_t min) {
  const std::string raw = get_env_or(key, "");
  if (raw.empty()) return defval;
  int64_t v = 0;
  try {
    size_t used = 0;
    v = std::stoll(raw, &used);
    if (used != raw.size()) throw std::invalid_argument(raw);
  } catch (const std::exception&) {
    throw ConfigError(std::string(key) + ": not an integer: " + raw);
  }
  if (v < min) throw ConfigError(std::string(key) + ": must be >= " + std::to_string(min));
  return v;
}

Config Config::fromEnv() {
  Config c;
  c.dbPath     = get_env_or("PMP_DB_PATH", c.dbPath);
  c.schemaPath = get_env_or("PMP_SCHEMA_PATH", "");
  c.port       = static_cast<int>(env_int("PMP_PORT", c.port, 1));
  c.apiKey     = get_env_or("PMP_API_KEY", "");
  c.logLevel   = get_env_or("PMP_LOG_LEVEL", c.logLevel);

  const std::string backend = get_env_or("PMP_STORAGE_BACKEND", "local");
  auto kind = parseBackendKind(backend);
  if (!kind) throw ConfigError("PMP_STORAGE_BACKEND: unknown backend: " + backend);
  c.writeBackend = *kind;
  c.mediaRoot = get_env_or("PMP_MEDIA_ROOT", c.mediaRoot);

  c.objectStore.endpoint       = get_env_or("PMP_OBJECT_STORE_ENDPOINT", "");
  c.objectStore.bucket         = get_env_or("PMP_OBJECT_STORE_BUCKET", "");
  c.objectStore.prefix         = get_env_or("PMP_OBJECT_STORE_PREFIX", c.objectStore.prefix);
  c.objectStore.bearerToken    = get_env_or("PMP_OBJECT_STORE_TOKEN", "");
  c.objectStore.timeoutSeconds =
    static_cast<int>(env_int("PMP_OBJECT_STORE_TIMEOUT_SECONDS", c.objectStore.timeoutSeconds, 1));
  if (c.writeBackend == BackendKind::ObjectStore &&
      (c.objectStore.endpoint.empty() || c.objectStore.bucket.empty())) {
    throw ConfigError("PMP_STORAGE_BACKEND=object_store needs PMP_OBJECT_STORE_ENDPOINT and PMP_OBJECT_STORE_BUCKET");
  }

  c.stagingRoot  = get_env_or("PMP_STAGING_ROOT", c.stagingRoot);
  c.mergeWorkers = static_cast<size_t>(env_int("PMP_MERGE_WORKERS", static_cast<int64_t>(c.mergeWorkers), 1));

  const std::string mode = get_env_or("PMP_CONCAT_MODE", "bytes");
  if (mode == "remux")      c.concatMode = ConcatMode::Remux;
  else if (mode == "bytes") c.concatMode = ConcatMode::Bytes;
  else throw ConfigError("PMP_CONCAT_MODE: expected remux or bytes, got " + mode);

  c.retry.attempts       = static_cast<int>(env_int("PMP_RETRY_ATTEMPTS", c.retry.attempts, 1));
  c.retry.initialBackoff = std::chrono::milliseconds(env_int("PMP_RETRY_BACKOFF_MS", c.retry.initialBackoff.count(), 0));
  c.mergeAutoRetries     = static_cast<int>(env_int("PMP_MERGE_AUTO_RETRIES", c.mergeAutoRetries, 0));
  c.mergeRetryDelay      = std::chrono::seconds(env_int("PMP_MERGE_RETRY_DELAY_SECONDS", c.mergeRetryDelay.count(), 0));

  c.maxChunkBytes       = static_cast<uint64_t>(env_int("PMP_MAX_CHUNK_BYTES", static_cast<int64_t>(c.maxChunkBytes), 1));
  c.sweepInterval       = std::chrono::minutes(env_int("PMP_SWEEP_INTERVAL_MINUTES", c.sweepInterval.count(), 0));
  c.orphanRetention     = std::chrono::minutes(env_int("PMP_ORPHAN_RETENTION_MINUTES", c.orphanRetention.count(), 0));
  c.stalledMergeTimeout = std::chrono::minutes(env_int("PMP_STALLED_MERGE_MINUTES", c.stalledMergeTimeout.count(), 1));
  return c;
}

} // namespace pmp
