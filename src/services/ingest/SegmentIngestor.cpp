#include "SegmentIngestor.hpp"

#include <spdlog/spdlog.h>

#include <cctype>

#include "core/Errors.hpp"
#include "core/util/Ids.hpp"

namespace pmp {

static constexpr size_t kSmallChunkWarning = 1024;

static bool safe_id(const std::string& id) {
  if (id.empty() || id.size() > 128 || id == "." || id == "..") return false;
  for (unsigned char c : id) {
    if (!(std::isalnum(c) || c == '-' || c == '_' || c == '.')) return false;
  }
  return true;
}

SegmentIngestor::SegmentIngestor(SegmentRegistry& registry, const BackendSet& backends,
                                 RetryPolicy retry, uint64_t maxChunkBytes)
  : registry_(registry), backends_(backends), retry_(retry), maxChunkBytes_(maxChunkBytes) {}

Segment SegmentIngestor::ingest(const IngestRequest& req) {
  auto channel = parseChannel(req.channel);
  if (!channel) throw ValidationError("unsupported channel: " + req.channel);
  if (!req.sequence) throw ValidationError("sequence required");
  if (*req.sequence < 0) throw ValidationError("sequence must be >= 0");
  if (req.bytes.empty()) throw ValidationError("missing media payload");
  if (req.bytes.size() > maxChunkBytes_) {
    throw PayloadTooLargeError("media chunk exceeds " + std::to_string(maxChunkBytes_) + " bytes");
  }
  if (!safe_id(req.sessionId)) throw ValidationError("invalid session id");

  // fail fast before writing bytes nobody will reference
  registry_.store().getSession(req.sessionId);

  if (req.bytes.size() < kSmallChunkWarning) {
    spdlog::warn("ingest {}: very small {} chunk, sequence={} size={}",
                 req.sessionId, req.channel, *req.sequence, req.bytes.size());
  }

  Segment seg;
  seg.segmentId = make_segment_id(to_string(*channel));
  seg.channel = *channel;
  seg.sequence = req.sequence;
  seg.sizeBytes = static_cast<int64_t>(req.bytes.size());
  seg.durationMs = req.durationMs;
  seg.mimeType = (req.contentType.empty() || req.contentType == "application/octet-stream")
                   ? "video/webm" : req.contentType;
  seg.recordedAt = req.recordedAt.value_or(now_millis());

  StorageBackend& backend = backends_.writer();
  const std::string key = req.sessionId + "/" + seg.segmentId;
  const LocationRef ref = with_retry(retry_, "ingest put " + key, [&] {
    return backend.put(key, req.bytes, seg.mimeType);
  });
  seg.setLocation(ref);

  AppendResult appended;
  try {
    appended = registry_.append(req.sessionId, seg);
  } catch (const std::exception& e) {
    spdlog::error("ingest {}: registry write failed for {}: {}", req.sessionId, seg.segmentId, e.what());
    try {
      backend.remove(ref);
    } catch (const std::exception& cleanup) {
      spdlog::warn("ingest {}: could not remove unrecorded {}: {}", req.sessionId, ref.str(), cleanup.what());
    }
    throw;
  }

  if (appended.replaced) {
    spdlog::info("ingest {}: {} sequence {} replaced, {} orphaned",
                 req.sessionId, to_string(seg.channel), *seg.sequence, appended.replaced->str());
  }
  spdlog::info("ingest {}: stored {} ({} {} seq={} bytes={})", req.sessionId, seg.segmentId,
               to_string(seg.storageBackend), to_string(seg.channel), *seg.sequence, seg.sizeBytes);
  return seg;
}

} // namespace pmp
