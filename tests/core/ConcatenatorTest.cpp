#include <gtest/gtest.h>

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
}

#include "core/Errors.hpp"
#include "core/media/ByteConcatenator.hpp"
#include "core/media/RemuxConcatenator.hpp"
#include "support/TestEnv.hpp"

namespace pmp {
namespace {

constexpr int kSampleRate = 8000;
constexpr int kPacketMs = 100;

struct OutputFree {
  void operator()(AVFormatContext* c) const {
    if (c->pb) avio_closep(&c->pb);
    avformat_free_context(c);
  }
};
struct InputFree {
  void operator()(AVFormatContext* c) const { avformat_close_input(&c); }
};
struct PacketFree {
  void operator()(AVPacket* p) const { av_packet_free(&p); }
};

// Silent mono 16-bit PCM in a Matroska container, in 100 ms packets.
void writeSilentMatroska(const std::string& path, int64_t durationMs) {
  AVFormatContext* raw = nullptr;
  ASSERT_GE(avformat_alloc_output_context2(&raw, nullptr, "matroska", path.c_str()), 0);
  std::unique_ptr<AVFormatContext, OutputFree> oc(raw);

  AVStream* st = avformat_new_stream(oc.get(), nullptr);
  ASSERT_NE(st, nullptr);
  st->codecpar->codec_type = AVMEDIA_TYPE_AUDIO;
  st->codecpar->codec_id = AV_CODEC_ID_PCM_S16LE;
  st->codecpar->sample_rate = kSampleRate;
  st->codecpar->bits_per_coded_sample = 16;
  st->codecpar->block_align = 2;
  av_channel_layout_default(&st->codecpar->ch_layout, 1);
  st->time_base = AVRational{1, kSampleRate};

  ASSERT_GE(avio_open(&oc->pb, path.c_str(), AVIO_FLAG_WRITE), 0);
  ASSERT_GE(avformat_write_header(oc.get(), nullptr), 0);

  const int samples = kSampleRate * kPacketMs / 1000;
  std::unique_ptr<AVPacket, PacketFree> pkt(av_packet_alloc());
  ASSERT_TRUE(pkt);
  for (int64_t i = 0; i < durationMs / kPacketMs; ++i) {
    ASSERT_GE(av_new_packet(pkt.get(), samples * 2), 0);
    std::memset(pkt->data, 0, static_cast<size_t>(samples) * 2);
    pkt->stream_index = 0;
    pkt->pts = pkt->dts = i * samples;
    pkt->duration = samples;
    pkt->flags |= AV_PKT_FLAG_KEY;
    av_packet_rescale_ts(pkt.get(), AVRational{1, kSampleRate}, st->time_base);
    ASSERT_GE(av_interleaved_write_frame(oc.get(), pkt.get()), 0);
  }
  ASSERT_GE(av_write_trailer(oc.get()), 0);
}

struct StreamSummary {
  int64_t durationMs = 0;
  int64_t lastEndMs = 0;   // pts + duration of the final packet
  bool    monotonic = true;
  int     packets = 0;
};

StreamSummary readBack(const std::string& path) {
  StreamSummary p;
  AVFormatContext* raw = nullptr;
  if (avformat_open_input(&raw, path.c_str(), nullptr, nullptr) < 0) return p;
  std::unique_ptr<AVFormatContext, InputFree> in(raw);
  if (avformat_find_stream_info(in.get(), nullptr) < 0) return p;
  if (in->duration != AV_NOPTS_VALUE) p.durationMs = in->duration / 1000;

  std::unique_ptr<AVPacket, PacketFree> pkt(av_packet_alloc());
  int64_t last = INT64_MIN;
  while (av_read_frame(in.get(), pkt.get()) >= 0) {
    const AVRational tb = in->streams[pkt->stream_index]->time_base;
    const int64_t pts = av_rescale_q(pkt->pts, tb, AVRational{1, 1000});
    if (pts < last) p.monotonic = false;
    last = pts;
    p.lastEndMs = pts + av_rescale_q(pkt->duration, tb, AVRational{1, 1000});
    ++p.packets;
    av_packet_unref(pkt.get());
  }
  return p;
}

class ConcatenatorTest : public ::testing::Test {
protected:
  test::TempDir dir;

  StagedInput stage(const std::string& name, const std::string& bytes,
                    const std::string& mime = "video/webm;codecs=vp8,opus",
                    std::optional<int64_t> durationMs = 2000) {
    const auto p = dir.path() / name;
    test::writeFile(p, bytes);
    return StagedInput{name, p.string(), mime, durationMs};
  }
};

// =============================================================================
// Byte join
// =============================================================================

TEST_F(ConcatenatorTest, ByteJoinKeepsInputOrder) {
  ByteConcatenator concat;
  const auto a = test::patternBytes(3000, 1);
  const auto b = test::patternBytes(70 * 1024, 2);
  const auto c = test::patternBytes(10, 3);
  const auto out = dir.str("out.webm");

  const auto r = concat.concat({stage("a", a), stage("b", b), stage("c", c)}, out);
  EXPECT_EQ(test::readFile(out), a + b + c);
  EXPECT_EQ(r.sizeBytes, a.size() + b.size() + c.size());
  EXPECT_EQ(r.durationMs, 6000);
}

TEST_F(ConcatenatorTest, ByteJoinIgnoresMimeSpacingAndCase) {
  ByteConcatenator concat;
  EXPECT_NO_THROW(concat.concat({stage("a", "xx", "video/webm;codecs=vp8,opus"),
                                 stage("b", "yy", "Video/WebM; codecs=vp8, opus")},
                                dir.str("out.webm")));
}

TEST_F(ConcatenatorTest, ByteJoinRejectsMixedFormats) {
  ByteConcatenator concat;
  EXPECT_THROW(concat.concat({stage("a", "xx", "video/webm"), stage("b", "yy", "video/mp4")},
                             dir.str("out.webm")),
               IncompatibleSegmentsError);
}

TEST_F(ConcatenatorTest, ByteJoinMissingInputIsDataLoss) {
  ByteConcatenator concat;
  StagedInput ghost{"ghost", dir.str("ghost.webm"), "video/webm", std::nullopt};
  EXPECT_THROW(concat.concat({stage("a", "xx", "video/webm"), ghost}, dir.str("out.webm")),
               DataLossError);
}

TEST_F(ConcatenatorTest, EmptyInputListIsNoValidInput) {
  ByteConcatenator concat;
  EXPECT_THROW(concat.concat({}, dir.str("out.webm")), NoValidInputError);
}

// =============================================================================
// Remux
// =============================================================================

TEST_F(ConcatenatorTest, RemuxRejectsGarbageBeforeWriting) {
  RemuxConcatenator concat;
  const auto out = dir.str("out.webm");
  EXPECT_THROW(concat.concat({stage("a", "definitely not a media container", "video/webm")}, out),
               IncompatibleSegmentsError);
  EXPECT_FALSE(std::filesystem::exists(out));
}

TEST_F(ConcatenatorTest, RemuxShiftsTimestampsAcrossInputs) {
  std::vector<StagedInput> inputs;
  for (int i = 0; i < 5; ++i) {
    const std::string name = "part" + std::to_string(i) + ".mkv";
    writeSilentMatroska(dir.str(name), 2000);
    ASSERT_FALSE(HasFatalFailure());
    inputs.push_back(StagedInput{name, dir.str(name), "video/x-matroska", 2000});
  }

  RemuxConcatenator concat;
  const auto out = dir.str("out.mkv");
  const ConcatResult r = concat.concat(inputs, out);
  EXPECT_EQ(r.durationMs, 10000);
  EXPECT_EQ(r.sizeBytes, std::filesystem::file_size(out));

  const StreamSummary p = readBack(out);
  EXPECT_EQ(p.packets, 5 * 2000 / kPacketMs);
  EXPECT_TRUE(p.monotonic);
  EXPECT_NEAR(p.lastEndMs, 10000, 1);
  EXPECT_NEAR(p.durationMs, 10000, 100);
}

TEST_F(ConcatenatorTest, RemuxByteJoinsHeaderlessContinuationChunks) {
  writeSilentMatroska(dir.str("whole.mkv"), 2000);
  ASSERT_FALSE(HasFatalFailure());
  const std::string whole = test::readFile(dir.path() / "whole.mkv");
  const size_t cut = whole.size() / 2;

  RemuxConcatenator concat;
  const auto out = dir.str("out.mkv");
  const ConcatResult r = concat.concat({stage("head", whole.substr(0, cut), "video/x-matroska"),
                                        stage("tail", whole.substr(cut), "video/x-matroska")},
                                       out);
  EXPECT_EQ(test::readFile(out), whole);
  EXPECT_EQ(r.sizeBytes, whole.size());
  EXPECT_EQ(r.durationMs, 4000); // declared durations, as for any byte join
}

TEST_F(ConcatenatorTest, FactoryHonoursMode) {
  EXPECT_STREQ(makeConcatenator(ConcatMode::Bytes)->name(), "bytes");
  EXPECT_STREQ(makeConcatenator(ConcatMode::Remux)->name(), "remux");
}

} // namespace
} // namespace pmp
