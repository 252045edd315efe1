#include "BackendSet.hpp"

#include "core/Errors.hpp"

namespace pmp {

BackendSet::BackendSet(std::shared_ptr<StorageBackend> local,
                       std::shared_ptr<StorageBackend> objectStore,
                       BackendKind writeTo)
  : local_(std::move(local)), objectStore_(std::move(objectStore)), writeTo_(writeTo) {
  if (!has(writeTo_)) {
    throw ConfigError("storage backend '" + to_string(writeTo_) + "' selected but not configured");
  }
}

bool BackendSet::has(BackendKind kind) const {
  return kind == BackendKind::Local ? static_cast<bool>(local_) : static_cast<bool>(objectStore_);
}

StorageBackend& BackendSet::get(BackendKind kind) const {
  const auto& b = kind == BackendKind::Local ? local_ : objectStore_;
  if (!b) throw BackendError("storage backend '" + to_string(kind) + "' is not configured");
  return *b;
}

} // namespace pmp
