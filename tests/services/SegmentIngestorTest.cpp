#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "core/Errors.hpp"
#include "core/registry/SegmentRegistry.hpp"
#include "core/storage/BackendSet.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "core/storage/ObjectStoreBackend.hpp"
#include "services/ingest/SegmentIngestor.hpp"
#include "support/FakeObjectStore.hpp"
#include "support/TestEnv.hpp"

namespace pmp {
namespace {

RetryPolicy fastRetry() {
  RetryPolicy p;
  p.attempts = 3;
  p.initialBackoff = std::chrono::milliseconds(1);
  return p;
}

class SegmentIngestorTest : public ::testing::Test {
protected:
  test::TempDir dir;
  std::unique_ptr<SessionStore> store = test::openStore(dir);
  SegmentRegistry registry{*store};
  std::shared_ptr<LocalFSBackend> local = std::make_shared<LocalFSBackend>(dir.str("media"));
  BackendSet backends{local, nullptr, BackendKind::Local};
  SegmentIngestor ingestor{registry, backends, fastRetry(), 64 * 1024};
  std::string payload = test::patternBytes(4096, 11);

  void SetUp() override { store->createSession("sess-1"); }

  IngestRequest request(const std::string& channel, std::optional<int64_t> seq) {
    IngestRequest r;
    r.sessionId = "sess-1";
    r.channel = channel;
    r.sequence = seq;
    r.bytes = payload;
    r.contentType = "video/webm;codecs=vp8";
    r.durationMs = 2000;
    return r;
  }
};

// =============================================================================
// Accepted uploads
// =============================================================================

TEST_F(SegmentIngestorTest, StoresBytesThenRecordsSegment) {
  const Segment seg = ingestor.ingest(request("webcam", 0));

  EXPECT_EQ(seg.channel, Channel::Webcam);
  EXPECT_EQ(seg.sizeBytes, 4096);
  EXPECT_EQ(seg.mimeType, "video/webm;codecs=vp8");
  EXPECT_EQ(seg.storageBackend, BackendKind::Local);
  EXPECT_EQ(seg.segmentId.rfind("webcam-", 0), 0u);
  ASSERT_TRUE(seg.hasSingleLocation());
  EXPECT_EQ(test::readFile(*seg.localPath), payload);

  const auto segs = registry.segments("sess-1");
  ASSERT_EQ(segs.size(), 1u);
  EXPECT_EQ(segs[0].segmentId, seg.segmentId);
  EXPECT_EQ(segs[0].sequence.value_or(-1), 0);
}

TEST_F(SegmentIngestorTest, DefaultsMimeTypeForOctetStream) {
  auto r = request("screen", 0);
  r.contentType = "application/octet-stream";
  EXPECT_EQ(ingestor.ingest(r).mimeType, "video/webm");
}

TEST_F(SegmentIngestorTest, MicrophoneSegmentsAreAccepted) {
  EXPECT_EQ(ingestor.ingest(request("microphone", 0)).channel, Channel::Microphone);
}

TEST_F(SegmentIngestorTest, ReuploadOfSequenceReplacesEntry) {
  const Segment first = ingestor.ingest(request("webcam", 4));
  payload = test::patternBytes(5000, 12);
  const Segment second = ingestor.ingest(request("webcam", 4));

  const auto segs = registry.segments("sess-1", Channel::Webcam);
  ASSERT_EQ(segs.size(), 1u);
  EXPECT_EQ(segs[0].segmentId, second.segmentId);

  const Session s = store->getSession("sess-1");
  ASSERT_EQ(s.report.orphans.size(), 1u);
  EXPECT_EQ(s.report.orphans[0].location, first.location()->str());
}

TEST_F(SegmentIngestorTest, WritesToObjectStoreWhenSelected) {
  test::FakeObjectStore fake;
  auto remote = std::make_shared<ObjectStoreBackend>(fake.config());
  BackendSet remoteFirst{local, remote, BackendKind::ObjectStore};
  SegmentIngestor remoteIngestor{registry, remoteFirst, fastRetry(), 64 * 1024};

  fake.failNext(1, 503);
  const Segment seg = remoteIngestor.ingest(request("screen", 0));

  EXPECT_EQ(seg.storageBackend, BackendKind::ObjectStore);
  ASSERT_TRUE(seg.remoteKey);
  EXPECT_FALSE(seg.localPath);
  EXPECT_EQ(*seg.remoteKey, "proctoring/sess-1/" + seg.segmentId);
  EXPECT_EQ(fake.object(*seg.remoteKey), payload);
}

// =============================================================================
// Rejected uploads
// =============================================================================

TEST_F(SegmentIngestorTest, RejectsUnknownChannel) {
  EXPECT_THROW(ingestor.ingest(request("keyboard", 0)), ValidationError);
}

TEST_F(SegmentIngestorTest, RejectsMissingOrNegativeSequence) {
  EXPECT_THROW(ingestor.ingest(request("webcam", std::nullopt)), ValidationError);
  EXPECT_THROW(ingestor.ingest(request("webcam", -1)), ValidationError);
  EXPECT_TRUE(registry.segments("sess-1").empty());
}

TEST_F(SegmentIngestorTest, RejectsEmptyAndOversizedPayloads) {
  payload.clear();
  EXPECT_THROW(ingestor.ingest(request("webcam", 0)), ValidationError);

  payload = test::patternBytes(64 * 1024 + 1);
  EXPECT_THROW(ingestor.ingest(request("webcam", 0)), PayloadTooLargeError);
}

TEST_F(SegmentIngestorTest, UnknownSessionStoresNothing) {
  auto r = request("webcam", 0);
  r.sessionId = "ghost";
  EXPECT_THROW(ingestor.ingest(r), SessionNotFoundError);
  EXPECT_FALSE(std::filesystem::exists(local->root() / "ghost"));
}

TEST_F(SegmentIngestorTest, RejectsPathLikeSessionIds) {
  auto r = request("webcam", 0);
  r.sessionId = "../etc";
  EXPECT_THROW(ingestor.ingest(r), ValidationError);
}

TEST_F(SegmentIngestorTest, BackendOutageSurfacesAfterRetries) {
  test::FakeObjectStore fake;
  auto remote = std::make_shared<ObjectStoreBackend>(fake.config());
  BackendSet remoteOnly{local, remote, BackendKind::ObjectStore};
  SegmentIngestor remoteIngestor{registry, remoteOnly, fastRetry(), 64 * 1024};

  fake.failNext(10, 503);
  EXPECT_THROW(remoteIngestor.ingest(request("webcam", 0)), BackendUnavailableError);
  EXPECT_TRUE(registry.segments("sess-1").empty());
}

} // namespace
} // namespace pmp
