#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "core/Errors.hpp"
#include "core/registry/SegmentRegistry.hpp"
#include "support/TestEnv.hpp"

namespace pmp {
namespace {

Segment makeSegment(const std::string& id, Channel ch, std::optional<int64_t> seq,
                    int64_t recordedAt = 0) {
  Segment s;
  s.segmentId = id;
  s.channel = ch;
  s.sequence = seq;
  s.recordedAt = recordedAt;
  s.setLocation(LocationRef{BackendKind::Local, "/media/" + id});
  return s;
}

std::vector<std::string> ids(const std::vector<Segment>& segs) {
  std::vector<std::string> out;
  for (const auto& s : segs) out.push_back(s.segmentId);
  return out;
}

// =============================================================================
// Validity and ordering
// =============================================================================

TEST(SegmentSelectionTest, OrdersBySequenceNotArrival) {
  const std::vector<Segment> all = {
    makeSegment("c", Channel::Webcam, 2),
    makeSegment("a", Channel::Webcam, 0),
    makeSegment("b", Channel::Webcam, 1),
  };
  const auto in = selectMergeInputs(all, Channel::Webcam);
  EXPECT_EQ(ids(in.segments), (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(in.invalid, 0);
}

TEST(SegmentSelectionTest, SkipsOtherChannels) {
  const std::vector<Segment> all = {
    makeSegment("w0", Channel::Webcam, 0),
    makeSegment("s0", Channel::Screen, 0),
  };
  EXPECT_EQ(ids(selectMergeInputs(all, Channel::Screen).segments),
            (std::vector<std::string>{"s0"}));
}

TEST(SegmentSelectionTest, MissingSequenceIsInvalid) {
  const std::vector<Segment> all = {
    makeSegment("a", Channel::Webcam, 0),
    makeSegment("legacy", Channel::Webcam, std::nullopt),
  };
  const auto in = selectMergeInputs(all, Channel::Webcam);
  EXPECT_EQ(ids(in.segments), (std::vector<std::string>{"a"}));
  EXPECT_EQ(in.invalid, 1);
}

TEST(SegmentSelectionTest, TwoLocationsIsInvalid) {
  Segment both = makeSegment("both", Channel::Webcam, 1);
  both.remoteKey = "proctoring/s/both";
  Segment none = makeSegment("none", Channel::Webcam, 2);
  none.localPath.reset();

  EXPECT_FALSE(isMergeable(both));
  EXPECT_FALSE(isMergeable(none));
  const auto in = selectMergeInputs({makeSegment("a", Channel::Webcam, 0), both, none}, Channel::Webcam);
  EXPECT_EQ(ids(in.segments), (std::vector<std::string>{"a"}));
  EXPECT_EQ(in.invalid, 2);
}

TEST(SegmentSelectionTest, DuplicateSequenceKeepsLatestRecording) {
  const std::vector<Segment> all = {
    makeSegment("old", Channel::Webcam, 0, 100),
    makeSegment("new", Channel::Webcam, 0, 200),
    makeSegment("x-tie", Channel::Webcam, 1, 50),
    makeSegment("y-tie", Channel::Webcam, 1, 50),
  };
  const auto in = selectMergeInputs(all, Channel::Webcam);
  EXPECT_EQ(ids(in.segments), (std::vector<std::string>{"new", "y-tie"}));
  EXPECT_EQ(in.duplicates, 2);
}

TEST(SegmentSelectionTest, EmptyWhenNothingUsable) {
  const auto in = selectMergeInputs({makeSegment("legacy", Channel::Screen, std::nullopt)}, Channel::Screen);
  EXPECT_TRUE(in.segments.empty());
  EXPECT_EQ(in.invalid, 1);
}

// =============================================================================
// Merge status transitions and location references
// =============================================================================

TEST(MergeTransitionTest, AllowsOnlyDocumentedMoves) {
  EXPECT_TRUE(isValidTransition(MergeStatus::NotStarted, MergeStatus::Pending));
  EXPECT_TRUE(isValidTransition(MergeStatus::Pending, MergeStatus::Processing));
  EXPECT_TRUE(isValidTransition(MergeStatus::Processing, MergeStatus::Completed));
  EXPECT_TRUE(isValidTransition(MergeStatus::Processing, MergeStatus::Failed));
  EXPECT_TRUE(isValidTransition(MergeStatus::Failed, MergeStatus::Pending));
  EXPECT_TRUE(isValidTransition(MergeStatus::Completed, MergeStatus::Pending));

  EXPECT_FALSE(isValidTransition(MergeStatus::NotStarted, MergeStatus::Processing));
  EXPECT_FALSE(isValidTransition(MergeStatus::Pending, MergeStatus::Completed));
  EXPECT_FALSE(isValidTransition(MergeStatus::Completed, MergeStatus::Processing));
  EXPECT_FALSE(isValidTransition(MergeStatus::Failed, MergeStatus::Completed));
}

TEST(LocationRefTest, ParsesBothBackends) {
  auto local = LocationRef::parse("local:/srv/media/s/a.webm");
  ASSERT_TRUE(local);
  EXPECT_EQ(local->backend, BackendKind::Local);
  EXPECT_EQ(local->key, "/srv/media/s/a.webm");

  auto remote = LocationRef::parse("object_store:proctoring/s/a.webm");
  ASSERT_TRUE(remote);
  EXPECT_EQ(remote->backend, BackendKind::ObjectStore);
  EXPECT_EQ(remote->str(), "object_store:proctoring/s/a.webm");

  EXPECT_FALSE(LocationRef::parse("ftp:x"));
  EXPECT_FALSE(LocationRef::parse("local:"));
  EXPECT_FALSE(LocationRef::parse("no-colon"));
}

// =============================================================================
// Registry
// =============================================================================

class SegmentRegistryTest : public ::testing::Test {
protected:
  test::TempDir dir;
  std::unique_ptr<SessionStore> store = test::openStore(dir);
  SegmentRegistry registry{*store};

  void SetUp() override { store->createSession("s1"); }
};

TEST_F(SegmentRegistryTest, AppendsInArrivalOrder) {
  registry.append("s1", makeSegment("b", Channel::Webcam, 1));
  registry.append("s1", makeSegment("a", Channel::Webcam, 0));
  registry.append("s1", makeSegment("m", Channel::Microphone, 0));

  EXPECT_EQ(ids(registry.segments("s1")), (std::vector<std::string>{"b", "a", "m"}));
  EXPECT_EQ(ids(registry.segments("s1", Channel::Webcam)), (std::vector<std::string>{"b", "a"}));
}

TEST_F(SegmentRegistryTest, ReuploadReplacesAndOrphansOldBytes) {
  registry.append("s1", makeSegment("first", Channel::Screen, 3));
  const auto result = registry.append("s1", makeSegment("second", Channel::Screen, 3));

  ASSERT_TRUE(result.replaced);
  EXPECT_EQ(result.replaced->key, "/media/first");

  const Session s = store->getSession("s1");
  EXPECT_EQ(ids(s.report.segments), (std::vector<std::string>{"second"}));
  ASSERT_EQ(s.report.orphans.size(), 1u);
  EXPECT_EQ(s.report.orphans[0].location, "local:/media/first");

  const auto h = store->history("s1");
  EXPECT_EQ(h.back().event, "SEGMENT_REPLACED");
}

TEST_F(SegmentRegistryTest, FindUnknownSegmentIsNotFound) {
  registry.append("s1", makeSegment("a", Channel::Webcam, 0));
  EXPECT_EQ(registry.find("s1", "a").segmentId, "a");
  EXPECT_THROW(registry.find("s1", "zzz"), NotFoundError);
  EXPECT_THROW(registry.find("missing", "a"), NotFoundError);
}

} // namespace
} // namespace pmp
