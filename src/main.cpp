// src/main.cpp
#include <cstdlib>
#include <string>
#include <iostream>
#include <filesystem>
#include <memory>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "core/config/Config.hpp"
#include "core/metadata/InitDb.hpp"
#include "core/metadata/SessionStore.hpp"
#include "core/registry/SegmentRegistry.hpp"
#include "core/storage/BackendSet.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "core/storage/ObjectStoreBackend.hpp"
#include "services/api/HttpServer.hpp"
#include "services/ingest/SegmentIngestor.hpp"
#include "services/maintenance/ConsistencySweep.hpp"
#include "services/maintenance/MaintenanceScheduler.hpp"
#include "services/maintenance/OrphanReaper.hpp"
#include "services/media/MediaGateway.hpp"
#include "services/merge/MergeOrchestrator.hpp"

// ---------- helpers ----------

// Look for schema.sql in PMP_SCHEMA_PATH, then CWD (the build copies it there), then the source tree.
static std::string findSchemaPath(const pmp::Config& cfg) {
  namespace fs = std::filesystem;
  if (!cfg.schemaPath.empty()) {
    if (fs::exists(cfg.schemaPath)) return cfg.schemaPath;
    throw std::runtime_error("PMP_SCHEMA_PATH does not exist: " + cfg.schemaPath);
  }
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/metadata/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw std::runtime_error("schema.sql not found (looked in CWD and src/core/metadata)");
}

static void ensure_dirs_for(const std::string& file_path) {
  namespace fs = std::filesystem;
  fs::path parent = fs::path(file_path).parent_path();
  if (!parent.empty()) fs::create_directories(parent);
}

static void init_db(const pmp::Config& cfg) {
  ensure_dirs_for(cfg.dbPath);
  pmp::initDatabase(cfg.dbPath, findSchemaPath(cfg));
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init                       # create/upgrade SQLite schema\n"
            << "  " << argv0 << " --serve                      # start HTTP server (PMP_PORT or 8080)\n"
            << "  " << argv0 << " --sweep [--dry-run]          # one consistency sweep + orphan pass\n"
            << "  " << argv0 << " --merge <sessionId> [chan]   # merge now (webcam and screen by default)\n";
}

// Everything a running pipeline needs, wired from the config.
struct Pipeline {
  explicit Pipeline(const pmp::Config& cfg)
    : store(cfg.dbPath),
      backends(std::make_shared<pmp::LocalFSBackend>(cfg.mediaRoot),
               cfg.objectStoreConfigured()
                 ? std::make_shared<pmp::ObjectStoreBackend>(cfg.objectStore)
                 : nullptr,
               cfg.writeBackend),
      registry(store),
      ingestor(registry, backends, cfg.retry, cfg.maxChunkBytes),
      merges(store, backends,
             std::shared_ptr<pmp::Concatenator>(pmp::makeConcatenator(cfg.concatMode)),
             pmp::MergeOptions{cfg.stagingRoot, cfg.mergeWorkers, cfg.retry, cfg.mergeAutoRetries,
                               std::chrono::duration_cast<std::chrono::milliseconds>(cfg.mergeRetryDelay)}),
      media(store, backends),
      sweep(store),
      reaper(store, backends, std::chrono::duration_cast<std::chrono::milliseconds>(cfg.orphanRetention)) {}

  pmp::SessionStore      store;
  pmp::BackendSet        backends;
  pmp::SegmentRegistry   registry;
  pmp::SegmentIngestor   ingestor;
  pmp::MergeOrchestrator merges;
  pmp::MediaGateway      media;
  pmp::ConsistencySweep  sweep;
  pmp::OrphanReaper      reaper;
};

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    if (argc < 2) {
      print_usage(argv[0]);
      return 1;
    }
    const std::string cmd = argv[1];
    const pmp::Config cfg = pmp::Config::fromEnv();
    spdlog::set_level(spdlog::level::from_str(cfg.logLevel));

    if (cmd == "--init") {
      init_db(cfg);
      std::cout << "DB initialized at: " << cfg.dbPath << "\n";
      return 0;
    }

    if (cmd == "--serve") {
      // Self-heal DB on startup (idempotent)
      init_db(cfg);
      Pipeline p(cfg);
      p.merges.recoverAfterRestart();

      pmp::MaintenanceScheduler maintenance(
        p.sweep, p.reaper, p.merges,
        pmp::MaintenanceOptions{
          std::chrono::duration_cast<std::chrono::milliseconds>(cfg.sweepInterval),
          std::chrono::duration_cast<std::chrono::milliseconds>(cfg.stalledMergeTimeout)});
      maintenance.start();

      pmp::ApiContext ctx{p.store, p.ingestor, p.merges, p.media, cfg.apiKey};
      const bool ok = pmp::run_http_server(ctx, cfg.port);
      maintenance.stop();
      p.merges.shutdown();
      return ok ? 0 : 1;
    }

    if (cmd == "--sweep") {
      const bool dryRun = argc > 2 && std::string(argv[2]) == "--dry-run";
      init_db(cfg);
      Pipeline p(cfg);
      const pmp::SweepStats swept = p.sweep.run();
      const pmp::ReapStats reaped = p.reaper.run(dryRun);
      std::cout << "sessions=" << swept.sessions << " repaired=" << swept.repaired
                << " unrepairable=" << swept.unrepairable << " orphans_deleted=" << reaped.deleted
                << (dryRun ? " (dry run)" : "") << "\n";
      return swept.errors + reaped.errors == 0 ? 0 : 3;
    }

    if (cmd == "--merge") {
      if (argc < 3) {
        print_usage(argv[0]);
        return 1;
      }
      const std::string sessionId = argv[2];
      init_db(cfg);
      Pipeline p(cfg);

      bool allOk = true;
      for (pmp::Channel ch : {pmp::Channel::Webcam, pmp::Channel::Screen}) {
        if (argc > 3) {
          auto only = pmp::parseChannel(argv[3]);
          if (!only) throw pmp::ValidationError(std::string("unknown channel: ") + argv[3]);
          if (*only != ch) continue;
        }
        const pmp::MergeStatus st = p.merges.mergeNow(sessionId, ch);
        std::cout << pmp::to_string(ch) << ": " << pmp::to_string(st) << "\n";
        allOk = allOk && st == pmp::MergeStatus::Completed;
      }
      p.merges.shutdown();
      return allOk ? 0 : 3;
    }

    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
