#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pmp {

struct StagedInput {
  std::string            segmentId;
  std::string            path;
  std::string            mimeType;
  std::optional<int64_t> durationMs;
};

struct ConcatResult {
  uint64_t sizeBytes = 0;
  int64_t  durationMs = 0;
};

enum class ConcatMode { Remux, Bytes };

// Joins staged inputs, in the given order, into one file without re-encoding.
// Either the whole output is produced or an exception is thrown:
// DataLossError for missing or unreadable files, IncompatibleSegmentsError for
// inputs that do not parse or cannot share one stream layout.
class Concatenator {
public:
  virtual ~Concatenator() = default;
  virtual ConcatResult concat(const std::vector<StagedInput>& inputs,
                              const std::string& outputPath) = 0;
  virtual const char* name() const = 0;
};

std::unique_ptr<Concatenator> makeConcatenator(ConcatMode mode);

} // namespace pmp
