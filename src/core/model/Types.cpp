#include "Types.hpp"

#include <algorithm>
#include <cctype>

namespace pmp {

static std::string lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string to_string(Channel c) {
  switch (c) {
    case Channel::Webcam:     return "webcam";
    case Channel::Screen:     return "screen";
    case Channel::Microphone: return "microphone";
  }
  return "unknown";
}

std::string to_string(BackendKind b) {
  return b == BackendKind::Local ? "local" : "object_store";
}

std::string to_string(MergeStatus s) {
  switch (s) {
    case MergeStatus::NotStarted: return "not_started";
    case MergeStatus::Pending:    return "pending";
    case MergeStatus::Processing: return "processing";
    case MergeStatus::Completed:  return "completed";
    case MergeStatus::Failed:     return "failed";
  }
  return "unknown";
}

std::string to_string(SessionStatus s) {
  switch (s) {
    case SessionStatus::InProgress:    return "in_progress";
    case SessionStatus::Submitted:     return "submitted";
    case SessionStatus::AutoSubmitted: return "auto_submitted";
    case SessionStatus::Disqualified:  return "disqualified";
  }
  return "unknown";
}

std::optional<Channel> parseChannel(std::string_view s) {
  const auto v = lower(s);
  if (v == "webcam")     return Channel::Webcam;
  if (v == "screen")     return Channel::Screen;
  if (v == "microphone") return Channel::Microphone;
  return std::nullopt;
}

std::optional<BackendKind> parseBackendKind(std::string_view s) {
  const auto v = lower(s);
  if (v == "local") return BackendKind::Local;
  // "r2" is what the first deployments wrote into segment records
  if (v == "object_store" || v == "r2" || v == "s3") return BackendKind::ObjectStore;
  return std::nullopt;
}

std::optional<MergeStatus> parseMergeStatus(std::string_view s) {
  const auto v = lower(s);
  if (v == "not_started") return MergeStatus::NotStarted;
  if (v == "pending")     return MergeStatus::Pending;
  if (v == "processing")  return MergeStatus::Processing;
  if (v == "completed")   return MergeStatus::Completed;
  if (v == "failed")      return MergeStatus::Failed;
  return std::nullopt;
}

std::optional<SessionStatus> parseSessionStatus(std::string_view s) {
  const auto v = lower(s);
  if (v == "in_progress")    return SessionStatus::InProgress;
  if (v == "submitted")      return SessionStatus::Submitted;
  if (v == "auto_submitted") return SessionStatus::AutoSubmitted;
  if (v == "disqualified")   return SessionStatus::Disqualified;
  return std::nullopt;
}

bool isMergeChannel(Channel c) {
  return c == Channel::Webcam || c == Channel::Screen;
}

bool isTerminal(SessionStatus s) {
  return s != SessionStatus::InProgress;
}

bool isValidTransition(MergeStatus from, MergeStatus to) {
  switch (from) {
    case MergeStatus::NotStarted: return to == MergeStatus::Pending;
    case MergeStatus::Pending:    return to == MergeStatus::Processing;
    case MergeStatus::Processing:
      return to == MergeStatus::Completed || to == MergeStatus::Failed || to == MergeStatus::Pending;
    case MergeStatus::Completed:  return to == MergeStatus::Pending;
    case MergeStatus::Failed:     return to == MergeStatus::Pending;
  }
  return false;
}

std::string LocationRef::str() const {
  return to_string(backend) + ":" + key;
}

std::optional<LocationRef> LocationRef::parse(std::string_view s) {
  const auto colon = s.find(':');
  if (colon == std::string_view::npos || colon + 1 >= s.size()) return std::nullopt;
  auto kind = parseBackendKind(s.substr(0, colon));
  if (!kind) return std::nullopt;
  return LocationRef{*kind, std::string(s.substr(colon + 1))};
}

} // namespace pmp
