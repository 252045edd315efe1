#include "Session.hpp"

using nlohmann::json;

namespace pmp {

bool Segment::hasSingleLocation() const {
  if (storageBackend == BackendKind::Local) {
    return localPath && !localPath->empty() && !remoteKey;
  }
  return remoteKey && !remoteKey->empty() && !localPath;
}

std::optional<LocationRef> Segment::location() const {
  if (!hasSingleLocation()) return std::nullopt;
  if (storageBackend == BackendKind::Local) return LocationRef{BackendKind::Local, *localPath};
  return LocationRef{BackendKind::ObjectStore, *remoteKey};
}

void Segment::setLocation(const LocationRef& ref) {
  storageBackend = ref.backend;
  if (ref.backend == BackendKind::Local) {
    localPath = ref.key;
    remoteKey.reset();
  } else {
    remoteKey = ref.key;
    localPath.reset();
  }
}

MergeStatus ProctoringReport::statusOf(Channel c) const {
  auto it = mergeStatus.find(c);
  return it == mergeStatus.end() ? MergeStatus::NotStarted : it->second;
}

std::optional<LocationRef> ProctoringReport::recordingOf(Channel c) const {
  auto it = recordingUrls.find(c);
  if (it == recordingUrls.end()) return std::nullopt;
  return LocationRef::parse(it->second);
}

const Segment* ProctoringReport::findSegment(const std::string& segmentId) const {
  for (const auto& s : segments) {
    if (s.segmentId == segmentId) return &s;
  }
  return nullptr;
}

std::vector<Segment> ProctoringReport::segmentsFor(Channel c) const {
  std::vector<Segment> out;
  for (const auto& s : segments) {
    if (s.channel == c) out.push_back(s);
  }
  return out;
}

bool ProctoringReport::references(const LocationRef& ref) const {
  for (const auto& s : segments) {
    if (s.localPath && ref.backend == BackendKind::Local && *s.localPath == ref.key) return true;
    if (s.remoteKey && ref.backend == BackendKind::ObjectStore && *s.remoteKey == ref.key) return true;
  }
  for (const auto& [ch, url] : recordingUrls) {
    if (url == ref.str()) return true;
  }
  return false;
}

// -------- json --------

void to_json(json& j, const Segment& s) {
  j = json{
    {"segmentId",      s.segmentId},
    {"channel",        to_string(s.channel)},
    {"storageBackend", to_string(s.storageBackend)},
    {"sizeBytes",      s.sizeBytes},
    {"mimeType",       s.mimeType},
    {"recordedAt",     s.recordedAt},
    {"consumed",       s.consumed}
  };
  if (s.sequence)   j["sequence"] = *s.sequence;
  if (s.localPath)  j["localPath"] = *s.localPath;
  if (s.remoteKey)  j["remoteKey"] = *s.remoteKey;
  if (s.durationMs) j["durationMs"] = *s.durationMs;
}

void from_json(const json& j, Segment& s) {
  s.segmentId = j.value("segmentId", std::string());
  s.channel = parseChannel(j.value("channel", std::string())).value_or(Channel::Webcam);
  s.storageBackend =
    parseBackendKind(j.value("storageBackend", std::string("local"))).value_or(BackendKind::Local);
  s.sequence.reset();
  if (j.contains("sequence") && j["sequence"].is_number_integer()) s.sequence = j["sequence"].get<int64_t>();
  s.localPath.reset();
  if (j.contains("localPath") && j["localPath"].is_string()) s.localPath = j["localPath"].get<std::string>();
  s.remoteKey.reset();
  if (j.contains("remoteKey") && j["remoteKey"].is_string()) s.remoteKey = j["remoteKey"].get<std::string>();
  s.durationMs.reset();
  if (j.contains("durationMs") && j["durationMs"].is_number()) s.durationMs = j["durationMs"].get<int64_t>();
  s.sizeBytes  = j.value("sizeBytes", int64_t{0});
  s.mimeType   = j.value("mimeType", std::string("video/webm"));
  s.recordedAt = j.value("recordedAt", int64_t{0});
  s.consumed   = j.value("consumed", false);
}

void to_json(json& j, const MergeDetail& d) {
  j = json{
    {"error",           d.error},
    {"lastAttemptAt",   d.lastAttemptAt},
    {"autoRetries",     d.autoRetries},
    {"generation",      d.generation},
    {"sizeBytes",       d.sizeBytes},
    {"durationMs",      d.durationMs},
    {"segmentCount",    d.segmentCount},
    {"invalidSegments", d.invalidSegments},
    {"claimId",         d.claimId}
  };
}

void from_json(const json& j, MergeDetail& d) {
  d.error           = j.value("error", std::string());
  d.lastAttemptAt   = j.value("lastAttemptAt", int64_t{0});
  d.autoRetries     = j.value("autoRetries", 0);
  d.generation      = j.value("generation", int64_t{0});
  d.sizeBytes       = j.value("sizeBytes", int64_t{0});
  d.durationMs      = j.value("durationMs", int64_t{0});
  d.segmentCount    = j.value("segmentCount", 0);
  d.invalidSegments = j.value("invalidSegments", 0);
  d.claimId         = j.value("claimId", std::string());
}

void to_json(json& j, const Orphan& o) {
  j = json{{"location", o.location}, {"orphanedAt", o.orphanedAt}, {"reason", o.reason}};
}

void from_json(const json& j, Orphan& o) {
  o.location   = j.value("location", std::string());
  o.orphanedAt = j.value("orphanedAt", int64_t{0});
  o.reason     = j.value("reason", std::string());
}

void to_json(json& j, const ProctoringReport& r) {
  json status = json::object();
  json urls = json::object();
  json details = json::object();
  for (const auto& [ch, st] : r.mergeStatus) status[to_string(ch)] = to_string(st);
  for (const auto& [ch, url] : r.recordingUrls) urls[to_string(ch)] = url;
  for (const auto& [ch, d] : r.mergeDetails) details[to_string(ch)] = d;
  j = json{
    {"segments",      r.segments},
    {"mergeStatus",   status},
    {"recordingUrls", urls},
    {"mergeDetails",  details},
    {"orphans",       r.orphans}
  };
}

void from_json(const json& j, ProctoringReport& r) {
  r = ProctoringReport{};
  if (j.contains("segments") && j["segments"].is_array()) {
    r.segments = j["segments"].get<std::vector<Segment>>();
  }
  if (j.contains("mergeStatus") && j["mergeStatus"].is_object()) {
    for (const auto& [k, v] : j["mergeStatus"].items()) {
      auto ch = parseChannel(k);
      auto st = v.is_string() ? parseMergeStatus(v.get<std::string>()) : std::nullopt;
      if (ch && st) r.mergeStatus[*ch] = *st;
    }
  }
  if (j.contains("recordingUrls") && j["recordingUrls"].is_object()) {
    for (const auto& [k, v] : j["recordingUrls"].items()) {
      auto ch = parseChannel(k);
      if (ch && v.is_string()) r.recordingUrls[*ch] = v.get<std::string>();
    }
  }
  if (j.contains("mergeDetails") && j["mergeDetails"].is_object()) {
    for (const auto& [k, v] : j["mergeDetails"].items()) {
      if (auto ch = parseChannel(k)) r.mergeDetails[*ch] = v.get<MergeDetail>();
    }
  }
  if (j.contains("orphans") && j["orphans"].is_array()) {
    r.orphans = j["orphans"].get<std::vector<Orphan>>();
  }
}

} // namespace pmp
