#include <gtest/gtest.h>

#include <string>

#include "core/Errors.hpp"
#include "core/storage/ObjectStoreBackend.hpp"
#include "core/util/Retry.hpp"
#include "support/FakeObjectStore.hpp"
#include "support/TestEnv.hpp"

namespace pmp {
namespace {

class ObjectStoreBackendTest : public ::testing::Test {
protected:
  test::FakeObjectStore fake;
  ObjectStoreBackend backend{fake.config()};

  std::string readAll(const LocationRef& ref) {
    std::string out;
    backend.get(ref, [&](const char* d, size_t n) { out.append(d, n); return true; });
    return out;
  }
};

TEST_F(ObjectStoreBackendTest, PutPrefixesKeyAndStoresBytes) {
  const auto bytes = test::patternBytes(4096, 7);
  const auto ref = backend.put("sess-1/screen-1.webm", bytes, "video/webm");

  EXPECT_EQ(ref.backend, BackendKind::ObjectStore);
  EXPECT_EQ(ref.key, "proctoring/sess-1/screen-1.webm");
  EXPECT_EQ(ref.str(), "object_store:proctoring/sess-1/screen-1.webm");
  EXPECT_EQ(fake.object(ref.key), bytes);
  EXPECT_EQ(readAll(ref), bytes);
}

TEST_F(ObjectStoreBackendTest, StatAndExistsUseHead) {
  const auto ref = backend.put("s/a.webm", test::patternBytes(1000), "video/webm");
  const auto info = backend.stat(ref);
  EXPECT_EQ(info.size, 1000u);
  EXPECT_EQ(info.contentType, "video/webm");
  EXPECT_TRUE(backend.exists(ref));
  EXPECT_FALSE(backend.exists(LocationRef{BackendKind::ObjectStore, "proctoring/s/none.webm"}));
}

TEST_F(ObjectStoreBackendTest, RangeReadReturnsRequestedSlice) {
  const auto bytes = test::patternBytes(1000, 8);
  const auto ref = backend.put("s/a.webm", bytes, "video/webm");

  std::string part;
  backend.getRange(ref, ByteRange{100, 199}, [&](const char* d, size_t n) { part.append(d, n); return true; });
  EXPECT_EQ(part, bytes.substr(100, 100));

  part.clear();
  backend.getRange(ref, ByteRange{900, std::nullopt}, [&](const char* d, size_t n) { part.append(d, n); return true; });
  EXPECT_EQ(part, bytes.substr(900));
}

TEST_F(ObjectStoreBackendTest, RangeReadCutsFullBodyWhenServerIgnoresRange) {
  const auto bytes = test::patternBytes(300 * 1024, 10);
  const auto ref = backend.put("s/big.webm", bytes, "video/webm");
  fake.ignoreRanges(true);

  std::string part;
  backend.getRange(ref, ByteRange{100, 199}, [&](const char* d, size_t n) { part.append(d, n); return true; });
  EXPECT_EQ(part, bytes.substr(100, 100));

  part.clear();
  backend.getRange(ref, ByteRange{200 * 1024, std::nullopt},
                   [&](const char* d, size_t n) { part.append(d, n); return true; });
  EXPECT_EQ(part, bytes.substr(200 * 1024));
}

TEST_F(ObjectStoreBackendTest, PutFileStreamsFromDisk) {
  test::TempDir dir;
  const auto bytes = test::patternBytes(200 * 1024, 9);
  const auto src = dir.path() / "merged.webm";
  test::writeFile(src, bytes);

  const auto ref = backend.putFile("s/webcam-merged-1.webm", src.string(), "video/webm");
  EXPECT_EQ(fake.object(ref.key), bytes);
}

TEST_F(ObjectStoreBackendTest, MissingObjectIsNotFound) {
  const LocationRef ref{BackendKind::ObjectStore, "proctoring/s/none.webm"};
  EXPECT_THROW(backend.stat(ref), NotFoundError);
  EXPECT_THROW(readAll(ref), NotFoundError);
  EXPECT_THROW(backend.remove(ref), NotFoundError);
}

TEST_F(ObjectStoreBackendTest, ServerErrorsAreTransient) {
  fake.failNext(1, 503);
  EXPECT_THROW(backend.put("s/a.webm", "abc", ""), BackendUnavailableError);

  fake.failNext(1, 403);
  EXPECT_THROW(backend.put("s/a.webm", "abc", ""), BackendError);

  fake.failNext(1, 429);
  EXPECT_THROW(backend.put("s/a.webm", "abc", ""), BackendUnavailableError);
}

TEST_F(ObjectStoreBackendTest, RetryRecoversFromTransientFailures) {
  fake.failNext(2, 503);
  RetryPolicy policy;
  policy.attempts = 3;
  policy.initialBackoff = std::chrono::milliseconds(1);

  const auto ref = with_retry(policy, "put", [&] { return backend.put("s/r.webm", "hello", ""); });
  EXPECT_EQ(fake.object(ref.key), "hello");
}

TEST_F(ObjectStoreBackendTest, RetryGivesUpAfterAttempts) {
  fake.failNext(5, 500);
  RetryPolicy policy;
  policy.attempts = 2;
  policy.initialBackoff = std::chrono::milliseconds(1);

  EXPECT_THROW(with_retry(policy, "put", [&] { return backend.put("s/r.webm", "hello", ""); }),
               BackendUnavailableError);
  EXPECT_FALSE(fake.has("proctoring/s/r.webm"));
}

TEST_F(ObjectStoreBackendTest, UnreachableEndpointIsTransient) {
  ObjectStoreConfig cfg = fake.config();
  cfg.endpoint = "http://127.0.0.1:1";
  cfg.timeoutSeconds = 1;
  ObjectStoreBackend dead(cfg);
  EXPECT_THROW(dead.put("s/a.webm", "abc", ""), BackendUnavailableError);
}

TEST(ObjectStoreConfigTest, EndpointAndBucketRequired) {
  EXPECT_THROW(ObjectStoreBackend(ObjectStoreConfig{}), ConfigError);
}

} // namespace
} // namespace pmp
