#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/model/Types.hpp"

namespace pmp {

// One uploaded chunk. Exactly one of localPath/remoteKey is set, matching storageBackend.
struct Segment {
  std::string                segmentId;
  Channel                    channel = Channel::Webcam;
  std::optional<int64_t>     sequence;
  BackendKind                storageBackend = BackendKind::Local;
  std::optional<std::string> localPath;
  std::optional<std::string> remoteKey;
  int64_t                    sizeBytes = 0;
  std::optional<int64_t>     durationMs;
  std::string                mimeType = "video/webm";
  int64_t                    recordedAt = 0;   // epoch millis
  bool                       consumed = false; // used by a completed merge

  bool hasSingleLocation() const;

  // The authoritative location when the single-location invariant holds.
  std::optional<LocationRef> location() const;

  // Builds a segment whose location fields agree with ref.backend.
  void setLocation(const LocationRef& ref);
};

struct MergeDetail {
  std::string error;
  int64_t     lastAttemptAt = 0; // epoch millis
  int         autoRetries = 0;
  int64_t     generation = 0;
  int64_t     sizeBytes = 0;
  int64_t     durationMs = 0;
  int         segmentCount = 0;
  int         invalidSegments = 0;
  std::string claimId;           // job currently holding the processing claim
};

struct Orphan {
  std::string location; // LocationRef::str()
  int64_t     orphanedAt = 0;
  std::string reason;
};

struct ProctoringReport {
  std::vector<Segment>                segments;
  std::map<Channel, MergeStatus>      mergeStatus;
  std::map<Channel, std::string>      recordingUrls;
  std::map<Channel, MergeDetail>      mergeDetails;
  std::vector<Orphan>                 orphans;

  MergeStatus statusOf(Channel c) const;
  std::optional<LocationRef> recordingOf(Channel c) const;
  const Segment* findSegment(const std::string& segmentId) const;
  std::vector<Segment> segmentsFor(Channel c) const;

  // True when the location is still referenced by a segment or a recording URL.
  bool references(const LocationRef& ref) const;
};

struct Session {
  std::string      id;
  SessionStatus    status = SessionStatus::InProgress;
  int64_t          createdAt = 0;
  int64_t          updatedAt = 0;
  int64_t          version = 0;
  ProctoringReport report;
};

void to_json(nlohmann::json& j, const Segment& s);
void from_json(const nlohmann::json& j, Segment& s);
void to_json(nlohmann::json& j, const MergeDetail& d);
void from_json(const nlohmann::json& j, MergeDetail& d);
void to_json(nlohmann::json& j, const Orphan& o);
void from_json(const nlohmann::json& j, Orphan& o);
void to_json(nlohmann::json& j, const ProctoringReport& r);
void from_json(const nlohmann::json& j, ProctoringReport& r);

} // namespace pmp
