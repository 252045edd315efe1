#include "StagingArea.hpp"

#include <spdlog/spdlog.h>

#include "core/util/Ids.hpp"

namespace fs = std::filesystem;

namespace pmp {

StagingArea::StagingArea(const fs::path& root, const std::string& label)
  : dir_(root / (label + "-" + uuid4())) {
  fs::create_directories(dir_);
}

StagingArea::~StagingArea() {
  std::error_code ec;
  fs::remove_all(dir_, ec);
  if (ec) spdlog::warn("staging: could not remove {}: {}", dir_.string(), ec.message());
}

} // namespace pmp
