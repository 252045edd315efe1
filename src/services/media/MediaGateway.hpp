#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "core/metadata/SessionStore.hpp"
#include "core/model/Types.hpp"
#include "core/storage/BackendSet.hpp"

namespace pmp {

// A single "bytes=" range before the object size is known.
// No first: suffix range of the last `last` bytes.
struct RangeHeader {
  std::optional<uint64_t> first;
  std::optional<uint64_t> last;
};

// Returns nullopt for anything that is not one well-formed byte range.
std::optional<RangeHeader> parseRangeHeader(std::string_view value);

// "bytes=" with more than one range. Those are not served piecewise; the
// whole object goes out instead. Any other unparseable header is a 416.
bool isMultipartRange(std::string_view value);

// What to send for one media read.
struct MediaPlan {
  int         status = 200;   // 200, 206 or 416
  LocationRef location;
  std::string contentType;
  uint64_t    size = 0;       // whole object
  uint64_t    start = 0;
  uint64_t    length = 0;     // bytes to send
  std::string contentRange;   // set for 206 and 416
};

// Resolves segments and merged recordings to stored bytes and reads them in
// bounded chunks. Holds no locks; a recording URL read while a merge publishes
// a newer generation still names a complete artifact.
class MediaGateway {
public:
  static constexpr size_t kDefaultChunkBytes = 64 * 1024;

  MediaGateway(SessionStore& store, const BackendSet& backends,
               size_t chunkBytes = kDefaultChunkBytes);

  // NotFoundError for unknown references, ConsistencyError when a reference
  // resolves but its bytes are gone or the segment has no single location.
  MediaPlan planSegment(const std::string& sessionId, const std::string& segmentId,
                        const std::optional<std::string>& range);
  MediaPlan planRecording(const std::string& sessionId, Channel channel,
                          const std::optional<std::string>& range);

  // Reads at most one chunk (and at most maxBytes) starting `offset` bytes
  // into the planned window. Returns the bytes delivered to the sink.
  size_t readChunk(const MediaPlan& plan, uint64_t offset, uint64_t maxBytes,
                   const ChunkSink& sink);

  // Sends the whole planned window. False when the sink stopped early.
  bool stream(const MediaPlan& plan, const ChunkSink& sink);

  size_t chunkBytes() const { return chunkBytes_; }

private:
  MediaPlan plan(const LocationRef& location, const std::string& contentType,
                 const std::optional<std::string>& range);

  SessionStore&     store_;
  const BackendSet& backends_;
  size_t            chunkBytes_;
};

} // namespace pmp
