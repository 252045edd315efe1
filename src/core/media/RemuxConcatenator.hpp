#pragma once
#include "core/media/ByteConcatenator.hpp"
#include "core/media/Concatenator.hpp"

namespace pmp {

// Stream-copy concatenation with libavformat: packets of every input are
// copied into one output container with timestamps shifted so each input
// starts where the previous one ended. All inputs must carry the same stream
// layout and codec parameters; this is checked before anything is written.
// MediaRecorder continuation chunks (no EBML header after a headed first
// chunk) are byte-joined instead, since only the joined stream is parseable.
class RemuxConcatenator : public Concatenator {
public:
  RemuxConcatenator();

  ConcatResult concat(const std::vector<StagedInput>& inputs,
                      const std::string& outputPath) override;
  const char* name() const override { return "remux"; }

private:
  ByteConcatenator bytes_;
};

} // namespace pmp
