#pragma once
#include <chrono>
#include <cstdint>
#include <string>

#include "core/media/Concatenator.hpp"
#include "core/model/Types.hpp"
#include "core/storage/ObjectStoreBackend.hpp"
#include "core/util/Retry.hpp"

namespace pmp {

// Deployment settings, read once from PMP_* environment variables.
struct Config {
  std::string dbPath = "data/proctoring.db";
  std::string schemaPath;            // empty: search the usual places
  int         port = 8080;
  std::string apiKey;                // empty = auth disabled
  std::string logLevel = "info";

  BackendKind       writeBackend = BackendKind::Local;
  std::string       mediaRoot = "data/proctoring-media";
  ObjectStoreConfig objectStore;     // endpoint empty = not configured

  std::string stagingRoot = "data/staging";
  size_t      mergeWorkers = 2;
  ConcatMode  concatMode = ConcatMode::Bytes;
  RetryPolicy retry;
  int         mergeAutoRetries = 3;
  std::chrono::seconds mergeRetryDelay{60};

  uint64_t maxChunkBytes = 8ull * 1024 * 1024;

  std::chrono::minutes sweepInterval{60};   // 0 disables the scheduler
  std::chrono::minutes orphanRetention{120};
  std::chrono::minutes stalledMergeTimeout{30};

  bool objectStoreConfigured() const { return !objectStore.endpoint.empty(); }

  // Throws ConfigError on malformed values.
  static Config fromEnv();
};

std::string get_env_or(const char* key, const std::string& defval);

} // namespace pmp
