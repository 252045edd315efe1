#pragma once
#include <optional>
#include <string>
#include <vector>

#include "core/metadata/SessionStore.hpp"
#include "core/model/Session.hpp"

namespace pmp {

// A segment may feed a merge only with a sequence and exactly one location.
bool isMergeable(const Segment& s);

struct MergeInputs {
  std::vector<Segment> segments; // ascending sequence, one per sequence
  int invalid = 0;               // excluded for missing sequence or bad location
  int duplicates = 0;            // same sequence, lost the tie-break
};

// Filters to mergeable segments of one channel and orders them by sequence.
// Duplicate sequences keep the later recordedAt, then the greater segmentId.
MergeInputs selectMergeInputs(const std::vector<Segment>& all, Channel channel);

struct AppendResult {
  Segment                    segment;
  std::optional<LocationRef> replaced; // bytes of the previous upload for this sequence
};

// Segment bookkeeping on top of the session documents.
class SegmentRegistry {
public:
  explicit SegmentRegistry(SessionStore& store) : store_(store) {}

  // Appends, or replaces the entry with the same (channel, sequence). The
  // replaced entry's location moves to the report's orphan list.
  AppendResult append(const std::string& sessionId, const Segment& segment);

  std::vector<Segment> segments(const std::string& sessionId);
  std::vector<Segment> segments(const std::string& sessionId, Channel channel);

  // NotFoundError when the session or segment does not exist.
  Segment find(const std::string& sessionId, const std::string& segmentId);

  SessionStore& store() { return store_; }

private:
  SessionStore& store_;
};

} // namespace pmp
