#pragma once
#include <filesystem>
#include <string>
#include <string_view>

#include "core/storage/StorageBackend.hpp"

namespace pmp {

// Blobs as files under root/<sessionId>/<name>. Location keys are absolute paths.
class LocalFSBackend : public StorageBackend {
public:
  explicit LocalFSBackend(std::string root);

  BackendKind kind() const override { return BackendKind::Local; }

  // Writes to a temporary sibling then renames, so readers never see a partial file.
  LocationRef put(const std::string& key, std::string_view bytes,
                  const std::string& contentType) override;
  LocationRef putFile(const std::string& key, const std::string& path,
                      const std::string& contentType) override;

  void get(const LocationRef& ref, const ChunkSink& sink) override;
  void getRange(const LocationRef& ref, const ByteRange& range, const ChunkSink& sink) override;
  ObjectInfo stat(const LocationRef& ref) override;
  void remove(const LocationRef& ref) override;
  bool exists(const LocationRef& ref) override;

  const std::filesystem::path& root() const { return root_; }

private:
  std::filesystem::path pathForKey(const std::string& key) const;
  std::filesystem::path pathForRef(const LocationRef& ref) const;

  std::filesystem::path root_;
};

} // namespace pmp
