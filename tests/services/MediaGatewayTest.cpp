#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <memory>
#include <string>

#include "core/Errors.hpp"
#include "core/registry/SegmentRegistry.hpp"
#include "core/storage/BackendSet.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "core/storage/ObjectStoreBackend.hpp"
#include "services/media/MediaGateway.hpp"
#include "support/FakeObjectStore.hpp"
#include "support/TestEnv.hpp"

namespace pmp {
namespace {

// =============================================================================
// Range header parsing
// =============================================================================

TEST(RangeHeaderTest, ParsesClosedOpenAndSuffixForms) {
  auto closed = parseRangeHeader("bytes=100-199");
  ASSERT_TRUE(closed);
  EXPECT_EQ(closed->first.value_or(0), 100u);
  EXPECT_EQ(closed->last.value_or(0), 199u);

  auto open = parseRangeHeader("bytes=500-");
  ASSERT_TRUE(open);
  EXPECT_EQ(open->first.value_or(0), 500u);
  EXPECT_FALSE(open->last);

  auto suffix = parseRangeHeader("bytes=-300");
  ASSERT_TRUE(suffix);
  EXPECT_FALSE(suffix->first);
  EXPECT_EQ(suffix->last.value_or(0), 300u);

  EXPECT_TRUE(parseRangeHeader(" BYTES=0-0 "));
}

TEST(RangeHeaderTest, RejectsMalformedOrMultipart) {
  EXPECT_FALSE(parseRangeHeader(""));
  EXPECT_FALSE(parseRangeHeader("items=0-10"));
  EXPECT_FALSE(parseRangeHeader("bytes=10-5"));
  EXPECT_FALSE(parseRangeHeader("bytes=abc-"));
  EXPECT_FALSE(parseRangeHeader("bytes=-0"));
  EXPECT_FALSE(parseRangeHeader("bytes=-"));
  EXPECT_FALSE(parseRangeHeader("bytes=0-10,20-30"));
}

TEST(RangeHeaderTest, RecognizesMultipartRanges) {
  EXPECT_TRUE(isMultipartRange("bytes=0-1,5-6"));
  EXPECT_TRUE(isMultipartRange("Bytes=0-1, -5"));
  EXPECT_FALSE(isMultipartRange("bytes=0-1"));
  EXPECT_FALSE(isMultipartRange("items=0-1,5-6"));
}

// =============================================================================
// Planning and streaming
// =============================================================================

class MediaGatewayTest : public ::testing::Test {
protected:
  test::TempDir dir;
  std::unique_ptr<SessionStore> store = test::openStore(dir);
  SegmentRegistry registry{*store};
  test::FakeObjectStore fake;
  std::shared_ptr<LocalFSBackend> local = std::make_shared<LocalFSBackend>(dir.str("media"));
  std::shared_ptr<ObjectStoreBackend> remote = std::make_shared<ObjectStoreBackend>(fake.config());
  BackendSet backends{local, remote, BackendKind::Local};
  MediaGateway gateway{*store, backends, 256};
  std::string artifact = test::patternBytes(1000, 77);

  void SetUp() override { store->createSession("s1"); }

  Segment addSegment(const std::string& id, const LocationRef& ref) {
    Segment s;
    s.segmentId = id;
    s.channel = Channel::Webcam;
    s.sequence = 0;
    s.sizeBytes = static_cast<int64_t>(artifact.size());
    s.setLocation(ref);
    registry.append("s1", s);
    return s;
  }

  std::string collect(const MediaPlan& plan) {
    std::string out;
    EXPECT_TRUE(gateway.stream(plan, [&](const char* d, size_t n) { out.append(d, n); return true; }));
    return out;
  }
};

TEST_F(MediaGatewayTest, PartialRangeOfLocalSegment) {
  const auto ref = local->put("s1/webcam-a.webm", artifact, "video/webm");
  addSegment("webcam-a", ref);

  const MediaPlan plan = gateway.planSegment("s1", "webcam-a", std::string("bytes=100-199"));
  EXPECT_EQ(plan.status, 206);
  EXPECT_EQ(plan.length, 100u);
  EXPECT_EQ(plan.size, 1000u);
  EXPECT_EQ(plan.contentRange, "bytes 100-199/1000");
  EXPECT_EQ(plan.contentType, "video/webm");
  EXPECT_EQ(collect(plan), artifact.substr(100, 100));
}

TEST_F(MediaGatewayTest, NoRangeServesWholeObject) {
  const auto ref = local->put("s1/webcam-a.webm", artifact, "video/webm");
  addSegment("webcam-a", ref);

  const MediaPlan plan = gateway.planSegment("s1", "webcam-a", std::nullopt);
  EXPECT_EQ(plan.status, 200);
  EXPECT_EQ(plan.length, 1000u);
  EXPECT_TRUE(plan.contentRange.empty());
  EXPECT_EQ(collect(plan), artifact);
}

TEST_F(MediaGatewayTest, ReadsNeverExceedChunkSize) {
  const auto ref = local->put("s1/webcam-a.webm", artifact, "video/webm");
  addSegment("webcam-a", ref);

  const MediaPlan plan = gateway.planSegment("s1", "webcam-a", std::nullopt);
  size_t largest = 0;
  gateway.stream(plan, [&](const char*, size_t n) { largest = std::max(largest, n); return true; });
  EXPECT_LE(largest, 256u);
}

TEST_F(MediaGatewayTest, EndIsClampedAndSuffixCountsFromEnd) {
  const auto ref = local->put("s1/webcam-a.webm", artifact, "video/webm");
  addSegment("webcam-a", ref);

  const MediaPlan clamped = gateway.planSegment("s1", "webcam-a", std::string("bytes=900-5000"));
  EXPECT_EQ(clamped.status, 206);
  EXPECT_EQ(clamped.contentRange, "bytes 900-999/1000");
  EXPECT_EQ(collect(clamped), artifact.substr(900));

  const MediaPlan suffix = gateway.planSegment("s1", "webcam-a", std::string("bytes=-10"));
  EXPECT_EQ(suffix.contentRange, "bytes 990-999/1000");
  EXPECT_EQ(collect(suffix), artifact.substr(990));
}

TEST_F(MediaGatewayTest, StartBeyondSizeIsUnsatisfiable) {
  const auto ref = local->put("s1/webcam-a.webm", artifact, "video/webm");
  addSegment("webcam-a", ref);

  const MediaPlan plan = gateway.planSegment("s1", "webcam-a", std::string("bytes=1000-"));
  EXPECT_EQ(plan.status, 416);
  EXPECT_EQ(plan.contentRange, "bytes */1000");
  EXPECT_EQ(plan.length, 0u);
}

TEST_F(MediaGatewayTest, MultipartRangeServesWholeObject) {
  const auto ref = local->put("s1/webcam-a.webm", artifact, "video/webm");
  addSegment("webcam-a", ref);

  const MediaPlan plan = gateway.planSegment("s1", "webcam-a", std::string("bytes=0-1,5-6"));
  EXPECT_EQ(plan.status, 200);
  EXPECT_EQ(plan.length, 1000u);
  EXPECT_TRUE(plan.contentRange.empty());
  EXPECT_EQ(collect(plan), artifact);
}

TEST_F(MediaGatewayTest, MalformedRangeIsUnsatisfiable) {
  const auto ref = local->put("s1/webcam-a.webm", artifact, "video/webm");
  addSegment("webcam-a", ref);

  for (const char* header : {"bytes=5-2", "bytes=abc-", "bytes=-0", "items=0-10"}) {
    const MediaPlan plan = gateway.planSegment("s1", "webcam-a", std::string(header));
    EXPECT_EQ(plan.status, 416) << header;
    EXPECT_EQ(plan.contentRange, "bytes */1000") << header;
    EXPECT_EQ(plan.length, 0u) << header;
  }
}

TEST_F(MediaGatewayTest, ServesObjectStoreRecording) {
  fake.put("proctoring/s1/webcam-merged-1.webm", artifact);
  store->update("s1", [](Session& s) {
    s.report.recordingUrls[Channel::Webcam] = "object_store:proctoring/s1/webcam-merged-1.webm";
    return true;
  });

  const MediaPlan plan = gateway.planRecording("s1", Channel::Webcam, std::string("bytes=100-199"));
  EXPECT_EQ(plan.status, 206);
  EXPECT_EQ(plan.contentRange, "bytes 100-199/1000");
  EXPECT_EQ(collect(plan), artifact.substr(100, 100));
}

TEST_F(MediaGatewayTest, UnknownReferencesAreNotFound) {
  EXPECT_THROW(gateway.planSegment("s1", "nope", std::nullopt), NotFoundError);
  EXPECT_THROW(gateway.planRecording("s1", Channel::Screen, std::nullopt), NotFoundError);
  EXPECT_THROW(gateway.planSegment("ghost", "nope", std::nullopt), SessionNotFoundError);
}

TEST_F(MediaGatewayTest, MissingBytesAreAConsistencyError) {
  const auto ref = local->put("s1/webcam-a.webm", artifact, "video/webm");
  addSegment("webcam-a", ref);
  std::filesystem::remove(ref.key);

  EXPECT_THROW(gateway.planSegment("s1", "webcam-a", std::nullopt), ConsistencyError);
}

TEST_F(MediaGatewayTest, SegmentWithTwoLocationsIsAConsistencyError) {
  const auto ref = local->put("s1/webcam-a.webm", artifact, "video/webm");
  addSegment("webcam-a", ref);
  store->update("s1", [](Session& doc) {
    doc.report.segments[0].remoteKey = "proctoring/s1/webcam-a.webm";
    return true;
  });

  EXPECT_THROW(gateway.planSegment("s1", "webcam-a", std::nullopt), ConsistencyError);
}

} // namespace
} // namespace pmp
