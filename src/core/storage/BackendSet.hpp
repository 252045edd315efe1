#pragma once
#include <memory>

#include "core/storage/StorageBackend.hpp"

namespace pmp {

// The two interchangeable backends plus the deployment's choice for new writes.
// Either slot may be empty when that backend is not configured.
class BackendSet {
public:
  BackendSet(std::shared_ptr<StorageBackend> local,
             std::shared_ptr<StorageBackend> objectStore,
             BackendKind writeTo);

  // Throws BackendError when the requested backend is not configured.
  StorageBackend& get(BackendKind kind) const;
  StorageBackend& forRef(const LocationRef& ref) const { return get(ref.backend); }
  StorageBackend& writer() const { return get(writeTo_); }

  BackendKind writeTo() const { return writeTo_; }
  bool has(BackendKind kind) const;

private:
  std::shared_ptr<StorageBackend> local_;
  std::shared_ptr<StorageBackend> objectStore_;
  BackendKind writeTo_;
};

} // namespace pmp
