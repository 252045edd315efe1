#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "core/model/Session.hpp"
#include "core/registry/SegmentRegistry.hpp"
#include "core/storage/BackendSet.hpp"
#include "core/util/Retry.hpp"

namespace pmp {

struct IngestRequest {
  std::string            sessionId;
  std::string            channel;
  std::optional<int64_t> sequence;
  std::string_view       bytes;
  std::string            contentType;
  std::optional<int64_t> recordedAt; // epoch millis, defaults to arrival time
  std::optional<int64_t> durationMs;
};

// Accepts one uploaded chunk: stores the bytes on the deployment's backend,
// then records the segment. Metadata is written only after the bytes are stored.
class SegmentIngestor {
public:
  SegmentIngestor(SegmentRegistry& registry, const BackendSet& backends,
                  RetryPolicy retry, uint64_t maxChunkBytes);

  // ValidationError / PayloadTooLargeError for bad input, SessionNotFoundError,
  // BackendUnavailableError once retries are spent.
  Segment ingest(const IngestRequest& req);

private:
  SegmentRegistry&  registry_;
  const BackendSet& backends_;
  RetryPolicy       retry_;
  uint64_t          maxChunkBytes_;
};

} // namespace pmp
