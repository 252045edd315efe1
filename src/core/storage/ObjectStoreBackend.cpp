#include "ObjectStoreBackend.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>

#include "core/Errors.hpp"

namespace pmp {

// -------- helpers --------

static std::string encode_key(const std::string& key) {
  static const char* hex = "0123456789ABCDEF";
  std::string out;
  out.reserve(key.size());
  for (unsigned char c : key) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0xF]);
    }
  }
  return out;
}

static bool is_transient(int status) {
  return status == 408 || status == 429 || status >= 500;
}

// Maps a failed request or a non-2xx status onto the error taxonomy.
[[noreturn]] static void raise_for(const std::string& what, const httplib::Result& res,
                                   const LocationRef* ref) {
  if (!res) {
    throw BackendUnavailableError(what + ": " + httplib::to_string(res.error()));
  }
  const int status = res->status;
  if (status == 404) throw NotFoundError("no such object: " + (ref ? ref->str() : what));
  if (status == 416) throw ValidationError("range start beyond object size");
  if (is_transient(status)) {
    throw BackendUnavailableError(what + ": HTTP " + std::to_string(status));
  }
  throw BackendError(what + ": HTTP " + std::to_string(status));
}

static void require_object_store(const LocationRef& ref) {
  if (ref.backend != BackendKind::ObjectStore) {
    throw BackendError("object store cannot serve " + ref.str());
  }
}

// -------- backend --------

ObjectStoreBackend::ObjectStoreBackend(ObjectStoreConfig cfg) : cfg_(std::move(cfg)) {
  if (cfg_.endpoint.empty() || cfg_.bucket.empty()) {
    throw ConfigError("object store requires an endpoint and a bucket");
  }
  while (!cfg_.endpoint.empty() && cfg_.endpoint.back() == '/') cfg_.endpoint.pop_back();
}

std::unique_ptr<httplib::Client> ObjectStoreBackend::client() const {
  auto cli = std::make_unique<httplib::Client>(cfg_.endpoint);
  cli->set_connection_timeout(cfg_.timeoutSeconds, 0);
  cli->set_read_timeout(cfg_.timeoutSeconds, 0);
  cli->set_write_timeout(cfg_.timeoutSeconds, 0);
  if (!cfg_.bearerToken.empty()) cli->set_bearer_token_auth(cfg_.bearerToken);
  return cli;
}

std::string ObjectStoreBackend::urlPath(const std::string& objectKey) const {
  return "/" + cfg_.bucket + "/" + encode_key(objectKey);
}

LocationRef ObjectStoreBackend::put(const std::string& key, std::string_view bytes,
                                    const std::string& contentType) {
  const std::string objectKey = cfg_.prefix + key;
  auto res = client()->Put(urlPath(objectKey), std::string(bytes),
                           contentType.empty() ? "application/octet-stream" : contentType);
  if (!res || res->status < 200 || res->status >= 300) raise_for("PUT " + objectKey, res, nullptr);
  spdlog::debug("object store: stored {} ({} bytes)", objectKey, bytes.size());
  return LocationRef{BackendKind::ObjectStore, objectKey};
}

LocationRef ObjectStoreBackend::putFile(const std::string& key, const std::string& path,
                                        const std::string& contentType) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) throw NotFoundError("no such file: " + path);

  auto in = std::make_shared<std::ifstream>(path, std::ios::binary);
  if (!*in) throw BackendError("cannot open for read: " + path);

  const std::string objectKey = cfg_.prefix + key;
  auto res = client()->Put(
    urlPath(objectKey), static_cast<size_t>(size),
    [in](size_t offset, size_t length, httplib::DataSink& sink) {
      std::vector<char> buf(std::min<size_t>(length, 64 * 1024));
      in->seekg(static_cast<std::streamoff>(offset));
      in->read(buf.data(), static_cast<std::streamsize>(buf.size()));
      const auto got = static_cast<size_t>(in->gcount());
      if (got == 0) return false;
      return sink.write(buf.data(), got);
    },
    contentType.empty() ? "application/octet-stream" : contentType);
  if (!res || res->status < 200 || res->status >= 300) raise_for("PUT " + objectKey, res, nullptr);
  spdlog::debug("object store: published {} ({} bytes)", objectKey, size);
  return LocationRef{BackendKind::ObjectStore, objectKey};
}

void ObjectStoreBackend::fetch(const LocationRef& ref, const std::optional<ByteRange>& range,
                               const ChunkSink& sink) {
  require_object_store(ref);
  httplib::Headers headers;
  if (range) {
    std::string value = "bytes=" + std::to_string(range->start) + "-";
    if (range->end) value += std::to_string(*range->end);
    headers.emplace("Range", value);
  }

  int status = 0;
  bool stopped = false;
  uint64_t pos = 0; // offset of the next body byte when the whole object comes back
  auto res = client()->Get(
    urlPath(ref.key), headers,
    [&](const httplib::Response& r) {
      status = r.status;
      return true;
    },
    [&](const char* data, size_t len) {
      if (status != 200 && status != 206) return true; // drain error body
      if (status == 200 && range) {
        // Range ignored by the server: cut the window out of the full body.
        const uint64_t from = pos;
        pos += len;
        const uint64_t hi = range->end ? *range->end + 1 : UINT64_MAX;
        if (pos <= range->start) return true;
        if (from >= hi) {
          stopped = true;
          return false;
        }
        const uint64_t a = std::max<uint64_t>(from, range->start);
        const uint64_t b = std::min<uint64_t>(pos, hi);
        if (!sink(data + (a - from), static_cast<size_t>(b - a)) || pos >= hi) {
          stopped = true;
          return false;
        }
        return true;
      }
      if (!sink(data, len)) {
        stopped = true;
        return false;
      }
      return true;
    });
  if (stopped) return;
  if (!res || (res->status != 200 && res->status != 206)) raise_for("GET " + ref.key, res, &ref);
}

void ObjectStoreBackend::get(const LocationRef& ref, const ChunkSink& sink) {
  fetch(ref, std::nullopt, sink);
}

void ObjectStoreBackend::getRange(const LocationRef& ref, const ByteRange& range,
                                  const ChunkSink& sink) {
  fetch(ref, range, sink);
}

ObjectInfo ObjectStoreBackend::stat(const LocationRef& ref) {
  require_object_store(ref);
  auto res = client()->Head(urlPath(ref.key));
  if (!res || res->status != 200) raise_for("HEAD " + ref.key, res, &ref);
  ObjectInfo info;
  const auto len = res->get_header_value("Content-Length");
  if (!len.empty()) {
    try { info.size = std::stoull(len); }
    catch (const std::exception&) { throw BackendError("HEAD " + ref.key + ": bad Content-Length"); }
  }
  info.contentType = res->get_header_value("Content-Type");
  return info;
}

void ObjectStoreBackend::remove(const LocationRef& ref) {
  require_object_store(ref);
  auto res = client()->Delete(urlPath(ref.key));
  if (!res || res->status < 200 || res->status >= 300) raise_for("DELETE " + ref.key, res, &ref);
}

bool ObjectStoreBackend::exists(const LocationRef& ref) {
  require_object_store(ref);
  auto res = client()->Head(urlPath(ref.key));
  if (res && res->status == 200) return true;
  if (res && res->status == 404) return false;
  raise_for("HEAD " + ref.key, res, &ref);
}

} // namespace pmp
