#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace pmp {

enum class Channel { Webcam, Screen, Microphone };

enum class BackendKind { Local, ObjectStore };

// Per-(session, channel) merge state. Transitions are checked by isValidTransition().
enum class MergeStatus { NotStarted, Pending, Processing, Completed, Failed };

enum class SessionStatus { InProgress, Submitted, AutoSubmitted, Disqualified };

std::string to_string(Channel c);
std::string to_string(BackendKind b);
std::string to_string(MergeStatus s);
std::string to_string(SessionStatus s);

// Case-insensitive; nullopt on anything unrecognized.
std::optional<Channel>       parseChannel(std::string_view s);
std::optional<BackendKind>   parseBackendKind(std::string_view s);
std::optional<MergeStatus>   parseMergeStatus(std::string_view s);
std::optional<SessionStatus> parseSessionStatus(std::string_view s);

// Only webcam and screen are merged; microphone segments stay raw.
bool isMergeChannel(Channel c);
bool isTerminal(SessionStatus s);

// not_started -> pending -> processing -> {completed | failed}
// failed -> pending (retry), completed -> pending (new input), processing -> pending (reclaim)
bool isValidTransition(MergeStatus from, MergeStatus to);

// Where a blob lives. Local keys are absolute paths, object store keys are object keys.
struct LocationRef {
  BackendKind backend = BackendKind::Local;
  std::string key;

  // "local:<path>" or "object_store:<key>"
  std::string str() const;
  static std::optional<LocationRef> parse(std::string_view s);

  bool operator==(const LocationRef& o) const { return backend == o.backend && key == o.key; }
  bool operator!=(const LocationRef& o) const { return !(*this == o); }
};

} // namespace pmp
