#include "SegmentRegistry.hpp"

#include <algorithm>
#include <map>

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"
#include "core/util/Ids.hpp"

using nlohmann::json;

namespace pmp {

bool isMergeable(const Segment& s) {
  return s.sequence.has_value() && s.hasSingleLocation();
}

// true when a should win over b for the same sequence
static bool preferred(const Segment& a, const Segment& b) {
  if (a.recordedAt != b.recordedAt) return a.recordedAt > b.recordedAt;
  return a.segmentId > b.segmentId;
}

MergeInputs selectMergeInputs(const std::vector<Segment>& all, Channel channel) {
  MergeInputs out;
  std::map<int64_t, Segment> bySequence;
  for (const auto& s : all) {
    if (s.channel != channel) continue;
    if (!isMergeable(s)) {
      ++out.invalid;
      continue;
    }
    auto [it, inserted] = bySequence.emplace(*s.sequence, s);
    if (!inserted) {
      ++out.duplicates;
      if (preferred(s, it->second)) it->second = s;
    }
  }
  out.segments.reserve(bySequence.size());
  for (auto& [seq, s] : bySequence) out.segments.push_back(std::move(s));
  return out;
}

AppendResult SegmentRegistry::append(const std::string& sessionId, const Segment& segment) {
  AppendResult result;
  result.segment = segment;

  store_.update(sessionId, [&](Session& s) {
    result.replaced.reset();
    auto& segs = s.report.segments;
    auto it = std::find_if(segs.begin(), segs.end(), [&](const Segment& x) {
      return x.channel == segment.channel && x.sequence && segment.sequence &&
             *x.sequence == *segment.sequence;
    });
    if (it != segs.end()) {
      result.replaced = it->location();
      if (result.replaced && result.replaced != segment.location()) {
        s.report.orphans.push_back(Orphan{result.replaced->str(), now_millis(), "replaced by " + segment.segmentId});
      }
      *it = segment;
    } else {
      segs.push_back(segment);
    }
    return true;
  });

  json details = {
    {"segmentId", segment.segmentId},
    {"channel", to_string(segment.channel)},
    {"sequence", segment.sequence.value_or(-1)},
    {"storageBackend", to_string(segment.storageBackend)}
  };
  if (result.replaced) details["replaced"] = result.replaced->str();
  store_.appendHistory(sessionId, result.replaced ? "SEGMENT_REPLACED" : "SEGMENT_INGESTED",
                       details.dump(), now_millis(), "ingest");
  return result;
}

std::vector<Segment> SegmentRegistry::segments(const std::string& sessionId) {
  return store_.getSession(sessionId).report.segments;
}

std::vector<Segment> SegmentRegistry::segments(const std::string& sessionId, Channel channel) {
  return store_.getSession(sessionId).report.segmentsFor(channel);
}

Segment SegmentRegistry::find(const std::string& sessionId, const std::string& segmentId) {
  auto session = store_.getSession(sessionId);
  const Segment* seg = session.report.findSegment(segmentId);
  if (!seg) throw NotFoundError("segment not found: " + segmentId);
  return *seg;
}

} // namespace pmp
