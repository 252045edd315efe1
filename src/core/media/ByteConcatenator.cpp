#include "ByteConcatenator.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

#include "core/Errors.hpp"

namespace fs = std::filesystem;

namespace pmp {

static std::string normalized_mime(const std::string& m) {
  std::string out;
  for (unsigned char c : m) {
    if (!std::isspace(c)) out.push_back(static_cast<char>(std::tolower(c)));
  }
  return out;
}

ConcatResult ByteConcatenator::concat(const std::vector<StagedInput>& inputs,
                                      const std::string& outputPath) {
  if (inputs.empty()) throw NoValidInputError("nothing to concatenate");

  const std::string mime = normalized_mime(inputs.front().mimeType);
  for (const auto& in : inputs) {
    if (normalized_mime(in.mimeType) != mime) {
      throw IncompatibleSegmentsError("segment " + in.segmentId + " is " + in.mimeType +
                                      ", expected " + inputs.front().mimeType);
    }
    std::error_code ec;
    const auto size = fs::file_size(in.path, ec);
    if (ec || size == 0) throw DataLossError("segment " + in.segmentId + " unreadable: " + in.path);
  }

  ConcatResult result;
  std::ofstream out(outputPath, std::ios::binary | std::ios::trunc);
  if (!out) throw std::runtime_error("cannot open output: " + outputPath);

  std::vector<char> buf(64 * 1024);
  for (const auto& in : inputs) {
    std::ifstream src(in.path, std::ios::binary);
    if (!src) throw DataLossError("segment " + in.segmentId + " unreadable: " + in.path);
    while (src) {
      src.read(buf.data(), static_cast<std::streamsize>(buf.size()));
      const auto got = src.gcount();
      if (got > 0) {
        out.write(buf.data(), got);
        result.sizeBytes += static_cast<uint64_t>(got);
      }
    }
    if (!src.eof()) throw DataLossError("segment " + in.segmentId + " read error: " + in.path);
    result.durationMs += in.durationMs.value_or(0);
  }
  out.flush();
  if (!out) throw std::runtime_error("write failed: " + outputPath);
  return result;
}

} // namespace pmp
