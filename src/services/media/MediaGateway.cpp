#include "MediaGateway.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace pmp {

namespace {

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

std::optional<uint64_t> parse_u64(std::string_view s) {
  if (s.empty() || s.size() > 19) return std::nullopt;
  uint64_t v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return std::nullopt;
    v = v * 10 + static_cast<uint64_t>(c - '0');
  }
  return v;
}

// The range set after a case-insensitive "bytes=", or nullopt for other units.
std::optional<std::string_view> byte_range_set(std::string_view value) {
  value = trim(value);
  constexpr std::string_view unit = "bytes=";
  if (value.size() < unit.size()) return std::nullopt;
  for (size_t i = 0; i < unit.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(value[i])) != unit[i]) return std::nullopt;
  }
  return trim(value.substr(unit.size()));
}

} // namespace

bool isMultipartRange(std::string_view value) {
  const auto set = byte_range_set(value);
  return set && set->find(',') != std::string_view::npos;
}

std::optional<RangeHeader> parseRangeHeader(std::string_view header) {
  const auto set = byte_range_set(header);
  if (!set) return std::nullopt;
  const std::string_view value = *set;
  if (value.find(',') != std::string_view::npos) return std::nullopt;

  const auto dash = value.find('-');
  if (dash == std::string_view::npos) return std::nullopt;
  const auto lhs = trim(value.substr(0, dash));
  const auto rhs = trim(value.substr(dash + 1));

  RangeHeader r;
  if (lhs.empty()) {
    r.last = parse_u64(rhs);
    if (!r.last || *r.last == 0) return std::nullopt;
    return r;
  }
  r.first = parse_u64(lhs);
  if (!r.first) return std::nullopt;
  if (!rhs.empty()) {
    r.last = parse_u64(rhs);
    if (!r.last || *r.last < *r.first) return std::nullopt;
  }
  return r;
}

MediaGateway::MediaGateway(SessionStore& store, const BackendSet& backends, size_t chunkBytes)
  : store_(store), backends_(backends), chunkBytes_(chunkBytes == 0 ? kDefaultChunkBytes : chunkBytes) {}

MediaPlan MediaGateway::planSegment(const std::string& sessionId, const std::string& segmentId,
                                    const std::optional<std::string>& range) {
  const Session session = store_.getSession(sessionId);
  const Segment* seg = session.report.findSegment(segmentId);
  if (!seg) throw NotFoundError("segment " + segmentId + " not found in session " + sessionId);

  const auto location = seg->location();
  if (!location) {
    throw ConsistencyError("segment " + segmentId + " has no single storage location");
  }
  return plan(*location, seg->mimeType, range);
}

MediaPlan MediaGateway::planRecording(const std::string& sessionId, Channel channel,
                                      const std::optional<std::string>& range) {
  const Session session = store_.getSession(sessionId);
  const auto location = session.report.recordingOf(channel);
  if (!location) {
    throw NotFoundError("no merged " + to_string(channel) + " recording for session " + sessionId);
  }
  return plan(*location, std::string(), range);
}

MediaPlan MediaGateway::plan(const LocationRef& location, const std::string& contentType,
                             const std::optional<std::string>& range) {
  ObjectInfo info;
  try {
    info = backends_.forRef(location).stat(location);
  } catch (const NotFoundError&) {
    spdlog::error("media: {} is referenced but missing", location.str());
    throw ConsistencyError("stored bytes missing for " + location.str());
  }

  MediaPlan p;
  p.location = location;
  p.size = info.size;
  p.contentType = !contentType.empty() ? contentType
                : !info.contentType.empty() ? info.contentType
                : "video/webm";
  p.status = 200;
  p.start = 0;
  p.length = info.size;

  if (!range || isMultipartRange(*range)) return p;
  const auto header = parseRangeHeader(*range);
  if (!header) {
    p.status = 416;
    p.length = 0;
    p.contentRange = "bytes */" + std::to_string(info.size);
    return p;
  }

  uint64_t first = 0;
  uint64_t last = 0;
  if (!header->first) {
    if (info.size == 0) {
      p.status = 416;
      p.length = 0;
      p.contentRange = "bytes */0";
      return p;
    }
    const uint64_t n = std::min(*header->last, info.size);
    first = info.size - n;
    last = info.size - 1;
  } else {
    first = *header->first;
    if (first >= info.size) {
      p.status = 416;
      p.length = 0;
      p.contentRange = "bytes */" + std::to_string(info.size);
      return p;
    }
    last = header->last ? std::min(*header->last, info.size - 1) : info.size - 1;
  }

  p.status = 206;
  p.start = first;
  p.length = last - first + 1;
  p.contentRange = "bytes " + std::to_string(first) + "-" + std::to_string(last) + "/" +
                   std::to_string(info.size);
  return p;
}

size_t MediaGateway::readChunk(const MediaPlan& plan, uint64_t offset, uint64_t maxBytes,
                               const ChunkSink& sink) {
  if (offset >= plan.length || maxBytes == 0) return 0;
  const uint64_t want = std::min<uint64_t>({chunkBytes_, maxBytes, plan.length - offset});
  const uint64_t from = plan.start + offset;

  size_t delivered = 0;
  try {
    backends_.forRef(plan.location).getRange(
      plan.location, ByteRange{from, from + want - 1},
      [&](const char* data, size_t len) {
        delivered += len;
        return sink(data, len);
      });
  } catch (const NotFoundError&) {
    throw ConsistencyError("stored bytes vanished while reading " + plan.location.str());
  }
  return delivered;
}

bool MediaGateway::stream(const MediaPlan& plan, const ChunkSink& sink) {
  uint64_t offset = 0;
  bool keepGoing = true;
  const ChunkSink guarded = [&](const char* data, size_t len) {
    keepGoing = sink(data, len);
    return keepGoing;
  };
  while (offset < plan.length) {
    const size_t n = readChunk(plan, offset, plan.length - offset, guarded);
    if (!keepGoing) return false;
    if (n == 0) {
      throw ConsistencyError("short read at offset " + std::to_string(plan.start + offset) +
                             " of " + plan.location.str());
    }
    offset += n;
  }
  return true;
}

} // namespace pmp
