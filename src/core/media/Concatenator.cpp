#include "Concatenator.hpp"

#include "core/media/ByteConcatenator.hpp"
#include "core/media/RemuxConcatenator.hpp"

namespace pmp {

std::unique_ptr<Concatenator> makeConcatenator(ConcatMode mode) {
  if (mode == ConcatMode::Remux) return std::make_unique<RemuxConcatenator>();
  return std::make_unique<ByteConcatenator>();
}

} // namespace pmp
