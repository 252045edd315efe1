#include "RemuxConcatenator.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/log.h>
#include <libavutil/mathematics.h>
}

namespace pmp {

namespace {

std::string av_error(int rc) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(rc, buf, sizeof(buf));
  return buf;
}

struct InputCloser {
  void operator()(AVFormatContext* c) const { avformat_close_input(&c); }
};
using InputPtr = std::unique_ptr<AVFormatContext, InputCloser>;

struct OutputCloser {
  void operator()(AVFormatContext* c) const {
    if (!c) return;
    if (c->pb && !(c->oformat->flags & AVFMT_NOFILE)) avio_closep(&c->pb);
    avformat_free_context(c);
  }
};
using OutputPtr = std::unique_ptr<AVFormatContext, OutputCloser>;

struct PacketFree {
  void operator()(AVPacket* p) const { av_packet_free(&p); }
};
using PacketPtr = std::unique_ptr<AVPacket, PacketFree>;

InputPtr open_input(const StagedInput& in) {
  AVFormatContext* ctx = nullptr;
  int rc = avformat_open_input(&ctx, in.path.c_str(), nullptr, nullptr);
  if (rc < 0) {
    throw IncompatibleSegmentsError("segment " + in.segmentId + " is not a readable container: " +
                                    av_error(rc));
  }
  InputPtr p(ctx);
  rc = avformat_find_stream_info(ctx, nullptr);
  if (rc < 0) {
    throw IncompatibleSegmentsError("segment " + in.segmentId + " has no readable streams: " +
                                    av_error(rc));
  }
  if (ctx->nb_streams == 0) {
    throw IncompatibleSegmentsError("segment " + in.segmentId + " has no streams");
  }
  return p;
}

// EBML magic at the start of every Matroska/WebM file.
bool starts_with_ebml(const StagedInput& in) {
  std::ifstream f(in.path, std::ios::binary);
  if (!f) throw DataLossError("segment " + in.segmentId + " unreadable: " + in.path);
  unsigned char magic[4] = {0, 0, 0, 0};
  f.read(reinterpret_cast<char*>(magic), sizeof(magic));
  return f.gcount() == 4 && magic[0] == 0x1A && magic[1] == 0x45 && magic[2] == 0xDF &&
         magic[3] == 0xA3;
}

// A timesliced MediaRecorder writes the EBML header once; every later chunk
// continues the first one's clusters and cannot be opened on its own.
bool is_continuation_stream(const std::vector<StagedInput>& inputs) {
  if (inputs.size() < 2 || !starts_with_ebml(inputs.front())) return false;
  for (size_t i = 1; i < inputs.size(); ++i) {
    if (!starts_with_ebml(inputs[i])) return true;
  }
  return false;
}

const char* muxer_for(const std::string& mime) {
  const auto base = mime.substr(0, mime.find(';'));
  if (base == "video/webm" || base == "audio/webm") return "webm";
  if (base == "video/mp4" || base == "audio/mp4")   return "mp4";
  if (base == "video/x-matroska")                  return "matroska";
  if (base == "audio/ogg")                         return "ogg";
  return nullptr; // let libavformat guess from the output name
}

void require_compatible(const AVFormatContext* first, const AVFormatContext* cur,
                        const StagedInput& in) {
  if (first->nb_streams != cur->nb_streams) {
    throw IncompatibleSegmentsError("segment " + in.segmentId + " has " +
                                    std::to_string(cur->nb_streams) + " streams, expected " +
                                    std::to_string(first->nb_streams));
  }
  for (unsigned i = 0; i < cur->nb_streams; ++i) {
    const AVCodecParameters* a = first->streams[i]->codecpar;
    const AVCodecParameters* b = cur->streams[i]->codecpar;
    if (a->codec_type != b->codec_type || a->codec_id != b->codec_id) {
      throw IncompatibleSegmentsError("segment " + in.segmentId + " stream " + std::to_string(i) +
                                      " codec " + avcodec_get_name(b->codec_id) + ", expected " +
                                      avcodec_get_name(a->codec_id));
    }
    if (a->codec_type == AVMEDIA_TYPE_VIDEO && (a->width != b->width || a->height != b->height)) {
      throw IncompatibleSegmentsError("segment " + in.segmentId + " is " + std::to_string(b->width) +
                                      "x" + std::to_string(b->height) + ", expected " +
                                      std::to_string(a->width) + "x" + std::to_string(a->height));
    }
    if (a->codec_type == AVMEDIA_TYPE_AUDIO && a->sample_rate != b->sample_rate) {
      throw IncompatibleSegmentsError("segment " + in.segmentId + " sample rate " +
                                      std::to_string(b->sample_rate) + ", expected " +
                                      std::to_string(a->sample_rate));
    }
  }
}

} // namespace

RemuxConcatenator::RemuxConcatenator() {
  av_log_set_level(AV_LOG_ERROR);
}

ConcatResult RemuxConcatenator::concat(const std::vector<StagedInput>& inputs,
                                       const std::string& outputPath) {
  if (inputs.empty()) throw NoValidInputError("nothing to concatenate");

  if (is_continuation_stream(inputs)) {
    spdlog::info("remux: {} header-less continuation chunk(s) after {}, joining bytes",
                 inputs.size() - 1, inputs.front().segmentId);
    return bytes_.concat(inputs, outputPath);
  }

  // Pass 1: every input must open and match the first one. Nothing is written yet.
  InputPtr first = open_input(inputs.front());
  for (size_t i = 1; i < inputs.size(); ++i) {
    InputPtr cur = open_input(inputs[i]);
    require_compatible(first.get(), cur.get(), inputs[i]);
  }

  // Pass 2: copy packets.
  AVFormatContext* raw = nullptr;
  int rc = avformat_alloc_output_context2(&raw, nullptr, muxer_for(inputs.front().mimeType),
                                          outputPath.c_str());
  if (rc < 0 || !raw) throw std::runtime_error("cannot create muxer: " + av_error(rc));
  OutputPtr out(raw);

  for (unsigned i = 0; i < first->nb_streams; ++i) {
    AVStream* os = avformat_new_stream(out.get(), nullptr);
    if (!os) throw std::runtime_error("cannot allocate output stream");
    rc = avcodec_parameters_copy(os->codecpar, first->streams[i]->codecpar);
    if (rc < 0) throw std::runtime_error("cannot copy codec parameters: " + av_error(rc));
    os->codecpar->codec_tag = 0;
    os->time_base = first->streams[i]->time_base;
  }
  first.reset();

  if (!(out->oformat->flags & AVFMT_NOFILE)) {
    rc = avio_open(&out->pb, outputPath.c_str(), AVIO_FLAG_WRITE);
    if (rc < 0) throw std::runtime_error("cannot open " + outputPath + ": " + av_error(rc));
  }
  rc = avformat_write_header(out.get(), nullptr);
  if (rc < 0) throw std::runtime_error("cannot write header: " + av_error(rc));

  PacketPtr pkt(av_packet_alloc());
  if (!pkt) throw std::runtime_error("cannot allocate packet");

  const unsigned streams = out->nb_streams;
  std::vector<int64_t> lastDts(streams, AV_NOPTS_VALUE);
  int64_t offsetUs = 0;

  for (const auto& staged : inputs) {
    InputPtr in = open_input(staged);
    const int64_t startUs = in->start_time == AV_NOPTS_VALUE ? 0 : in->start_time;
    int64_t endUs = offsetUs;

    while ((rc = av_read_frame(in.get(), pkt.get())) >= 0) {
      const auto idx = static_cast<unsigned>(pkt->stream_index);
      if (idx >= streams) {
        av_packet_unref(pkt.get());
        continue;
      }
      AVStream* is = in->streams[idx];
      AVStream* os = out->streams[idx];
      const int64_t shift = av_rescale_q(offsetUs - startUs, AV_TIME_BASE_Q, os->time_base);

      av_packet_rescale_ts(pkt.get(), is->time_base, os->time_base);
      if (pkt->pts != AV_NOPTS_VALUE) pkt->pts += shift;
      if (pkt->dts != AV_NOPTS_VALUE) pkt->dts += shift;
      // the muxer rejects non-increasing dts at input seams
      if (pkt->dts != AV_NOPTS_VALUE && lastDts[idx] != AV_NOPTS_VALUE && pkt->dts <= lastDts[idx]) {
        pkt->dts = lastDts[idx] + 1;
        if (pkt->pts != AV_NOPTS_VALUE && pkt->pts < pkt->dts) pkt->pts = pkt->dts;
      }
      if (pkt->dts != AV_NOPTS_VALUE) lastDts[idx] = pkt->dts;

      const int64_t ts = pkt->pts != AV_NOPTS_VALUE ? pkt->pts : pkt->dts;
      if (ts != AV_NOPTS_VALUE) {
        endUs = std::max(endUs, av_rescale_q(ts + pkt->duration, os->time_base, AV_TIME_BASE_Q));
      }
      pkt->pos = -1;

      rc = av_interleaved_write_frame(out.get(), pkt.get());
      if (rc < 0) throw std::runtime_error("mux failed at " + staged.segmentId + ": " + av_error(rc));
    }
    if (rc != AVERROR_EOF) {
      throw DataLossError("segment " + staged.segmentId + " truncated: " + av_error(rc));
    }
    spdlog::debug("remux: appended {} ({} ms so far)", staged.segmentId, endUs / 1000);
    offsetUs = endUs;
  }

  rc = av_write_trailer(out.get());
  if (rc < 0) throw std::runtime_error("cannot write trailer: " + av_error(rc));
  out.reset();

  ConcatResult result;
  result.sizeBytes = std::filesystem::file_size(outputPath);
  result.durationMs = offsetUs / 1000;
  return result;
}

} // namespace pmp
