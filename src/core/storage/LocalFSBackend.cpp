#include "LocalFSBackend.hpp"

#include <algorithm>
#include <fstream>
#include <vector>

#include "core/Errors.hpp"
#include "core/util/Ids.hpp"

namespace fs = std::filesystem;

namespace pmp {

static constexpr size_t kReadChunk = 64 * 1024;

static bool within(const fs::path& root, const fs::path& p) {
  auto r = root.begin();
  auto i = p.begin();
  for (; r != root.end(); ++r, ++i) {
    if (i == p.end() || *i != *r) return false;
  }
  return true;
}

LocalFSBackend::LocalFSBackend(std::string root) {
  fs::create_directories(root);
  root_ = fs::weakly_canonical(fs::absolute(root));
}

fs::path LocalFSBackend::pathForKey(const std::string& key) const {
  fs::path rel(key);
  if (key.empty() || rel.is_absolute()) throw ValidationError("invalid storage key: " + key);
  for (const auto& part : rel) {
    if (part == "..") throw ValidationError("storage key escapes media root: " + key);
  }
  return root_ / rel;
}

fs::path LocalFSBackend::pathForRef(const LocationRef& ref) const {
  if (ref.backend != BackendKind::Local) {
    throw BackendError("local backend cannot serve " + ref.str());
  }
  fs::path p = fs::weakly_canonical(fs::path(ref.key));
  if (!within(root_, p)) throw BackendError("path outside media root: " + ref.key);
  return p;
}

LocationRef LocalFSBackend::put(const std::string& key, std::string_view bytes,
                                const std::string& /*contentType*/) {
  fs::path file = pathForKey(key);
  fs::create_directories(file.parent_path());
  fs::path tmp = file;
  tmp += ".tmp-" + uuid4();
  {
    std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
    if (!os) throw BackendError("cannot open for write: " + tmp.string());
    os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    os.flush();
    if (!os) {
      std::error_code ec;
      fs::remove(tmp, ec);
      throw BackendError("write failed: " + tmp.string());
    }
  }
  std::error_code ec;
  fs::rename(tmp, file, ec);
  if (ec) {
    fs::remove(tmp, ec);
    throw BackendError("rename failed: " + file.string());
  }
  return LocationRef{BackendKind::Local, fs::weakly_canonical(file).string()};
}

LocationRef LocalFSBackend::putFile(const std::string& key, const std::string& path,
                                    const std::string& /*contentType*/) {
  if (!fs::is_regular_file(path)) throw NotFoundError("no such file: " + path);
  fs::path file = pathForKey(key);
  fs::create_directories(file.parent_path());
  fs::path tmp = file;
  tmp += ".tmp-" + uuid4();
  std::error_code ec;
  fs::copy_file(path, tmp, fs::copy_options::overwrite_existing, ec);
  if (ec) throw BackendError("copy failed: " + path + ": " + ec.message());
  fs::rename(tmp, file, ec);
  if (ec) {
    fs::remove(tmp, ec);
    throw BackendError("rename failed: " + file.string());
  }
  return LocationRef{BackendKind::Local, fs::weakly_canonical(file).string()};
}

void LocalFSBackend::get(const LocationRef& ref, const ChunkSink& sink) {
  getRange(ref, ByteRange{}, sink);
}

void LocalFSBackend::getRange(const LocationRef& ref, const ByteRange& range, const ChunkSink& sink) {
  fs::path p = pathForRef(ref);
  std::ifstream in(p, std::ios::binary);
  if (!in) throw NotFoundError("no such object: " + ref.str());

  const uint64_t size = fs::file_size(p);
  if (size == 0 && range.start == 0 && !range.end) return;
  if (range.start >= size) throw ValidationError("range start beyond object size");
  const uint64_t last = range.end ? std::min(*range.end, size - 1) : size - 1;
  if (last < range.start) throw ValidationError("range end before start");

  in.seekg(static_cast<std::streamoff>(range.start));
  uint64_t remaining = last - range.start + 1;
  std::vector<char> buf(kReadChunk);
  while (remaining > 0) {
    const size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, buf.size()));
    in.read(buf.data(), static_cast<std::streamsize>(want));
    const auto got = static_cast<size_t>(in.gcount());
    if (got == 0) throw BackendError("short read: " + p.string());
    remaining -= got;
    if (!sink(buf.data(), got)) return;
  }
}

ObjectInfo LocalFSBackend::stat(const LocationRef& ref) {
  fs::path p = pathForRef(ref);
  std::error_code ec;
  auto size = fs::file_size(p, ec);
  if (ec) throw NotFoundError("no such object: " + ref.str());
  const std::string ext = p.extension().string();
  return ObjectInfo{size, ext == ".webm" ? "video/webm" : ext == ".mp4" ? "video/mp4" : ""};
}

void LocalFSBackend::remove(const LocationRef& ref) {
  fs::path p = pathForRef(ref);
  std::error_code ec;
  if (!fs::remove(p, ec)) {
    if (ec) throw BackendError("remove failed: " + p.string() + ": " + ec.message());
    throw NotFoundError("no such object: " + ref.str());
  }
  // drop the session directory once it is empty
  fs::path dir = p.parent_path();
  if (dir != root_ && fs::is_empty(dir, ec)) fs::remove(dir, ec);
}

bool LocalFSBackend::exists(const LocationRef& ref) {
  std::error_code ec;
  return fs::is_regular_file(pathForRef(ref), ec);
}

} // namespace pmp
