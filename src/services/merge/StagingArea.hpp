#pragma once
#include <filesystem>
#include <string>

namespace pmp {

// Scratch directory for one merge job, removed with everything in it when the
// object goes out of scope, whichever way the job ends.
class StagingArea {
public:
  StagingArea(const std::filesystem::path& root, const std::string& label);
  ~StagingArea();

  StagingArea(const StagingArea&) = delete;
  StagingArea& operator=(const StagingArea&) = delete;

  const std::filesystem::path& dir() const { return dir_; }
  std::filesystem::path file(const std::string& name) const { return dir_ / name; }

private:
  std::filesystem::path dir_;
};

} // namespace pmp
