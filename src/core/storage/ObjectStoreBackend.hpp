#pragma once
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "core/storage/StorageBackend.hpp"

namespace httplib { class Client; }

namespace pmp {

struct ObjectStoreConfig {
  std::string endpoint;          // scheme://host[:port]
  std::string bucket;
  std::string prefix = "proctoring/";
  std::string bearerToken;       // optional, for a signing gateway
  int         timeoutSeconds = 30;
};

// S3-style path addressing: <endpoint>/<bucket>/<prefix><key>.
// Location keys are full object keys (prefix included).
class ObjectStoreBackend : public StorageBackend {
public:
  explicit ObjectStoreBackend(ObjectStoreConfig cfg);

  BackendKind kind() const override { return BackendKind::ObjectStore; }

  LocationRef put(const std::string& key, std::string_view bytes,
                  const std::string& contentType) override;
  LocationRef putFile(const std::string& key, const std::string& path,
                      const std::string& contentType) override;

  void get(const LocationRef& ref, const ChunkSink& sink) override;
  void getRange(const LocationRef& ref, const ByteRange& range, const ChunkSink& sink) override;
  ObjectInfo stat(const LocationRef& ref) override;
  void remove(const LocationRef& ref) override;
  bool exists(const LocationRef& ref) override;

  const ObjectStoreConfig& config() const { return cfg_; }

private:
  std::unique_ptr<httplib::Client> client() const;
  std::string urlPath(const std::string& objectKey) const;
  void fetch(const LocationRef& ref, const std::optional<ByteRange>& range, const ChunkSink& sink);

  ObjectStoreConfig cfg_;
};

} // namespace pmp
