#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "core/model/Types.hpp"

namespace pmp {

// Receives consecutive pieces of an object. Return false to stop early.
using ChunkSink = std::function<bool(const char* data, size_t len)>;

struct ObjectInfo {
  uint64_t    size = 0;
  std::string contentType;
};

// Byte range [start, end] inclusive; no end means "to the last byte".
struct ByteRange {
  uint64_t                start = 0;
  std::optional<uint64_t> end;
};

// Uniform blob store. Keys passed to put() are "<sessionId>/<name>".
// Missing locations raise NotFoundError, transient failures BackendUnavailableError.
// Implementations never retry on their own.
class StorageBackend {
public:
  virtual ~StorageBackend() = default;

  virtual BackendKind kind() const = 0;

  virtual LocationRef put(const std::string& key, std::string_view bytes,
                          const std::string& contentType) = 0;

  // Publishes an existing file without reading it into memory.
  virtual LocationRef putFile(const std::string& key, const std::string& path,
                              const std::string& contentType) = 0;

  virtual void get(const LocationRef& ref, const ChunkSink& sink) = 0;

  // A range whose start lies beyond the object raises ValidationError.
  virtual void getRange(const LocationRef& ref, const ByteRange& range, const ChunkSink& sink) = 0;

  virtual ObjectInfo stat(const LocationRef& ref) = 0;

  virtual void remove(const LocationRef& ref) = 0;

  virtual bool exists(const LocationRef& ref) = 0;
};

} // namespace pmp
