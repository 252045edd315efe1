#pragma once
#include "core/media/Concatenator.hpp"

namespace pmp {

// Raw byte join. Matches how MediaRecorder emits a stream: only the first chunk
// carries container headers and later chunks continue its clusters, so byte
// order is the stream. Inputs must share one MIME type (codecs included).
class ByteConcatenator : public Concatenator {
public:
  ConcatResult concat(const std::vector<StagedInput>& inputs,
                      const std::string& outputPath) override;
  const char* name() const override { return "bytes"; }
};

} // namespace pmp
