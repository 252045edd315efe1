#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "core/Errors.hpp"
#include "core/metadata/SessionStore.hpp"
#include "core/util/Ids.hpp"
#include "services/ingest/SegmentIngestor.hpp"
#include "services/media/MediaGateway.hpp"
#include "services/merge/MergeOrchestrator.hpp"

using nlohmann::json;

// -------- helpers --------

static bool check_api_key(const httplib::Request& req,
                          const std::string& apiKey,
                          httplib::Response& res) {
  if (apiKey.empty()) return true; // auth disabled
  auto k = req.get_header_value("X-API-Key");
  if (k == apiKey) return true;
  res.status = 401;
  res.set_content(json({{"error", "unauthorized"}}).dump(), "application/json");
  return false;
}

static std::string param_or(const httplib::Request& req, const char* k, const std::string& def = {}) {
  if (req.has_param(k)) return req.get_param_value(k);
  return def;
}

static void send_error(httplib::Response& res, int status, const char* code, const std::string& msg) {
  res.status = status;
  res.set_content(json({{"error", code}, {"message", msg}}).dump(), "application/json");
}

static void send_json(httplib::Response& res, int status, const json& body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

// Runs a handler and turns pipeline exceptions into HTTP responses.
template <typename Fn>
static void guarded(const char* route, httplib::Response& res, Fn&& fn) {
  try {
    fn();
  } catch (const pmp::PayloadTooLargeError& e) {
    send_error(res, 413, "payload_too_large", e.what());
  } catch (const pmp::ValidationError& e) {
    send_error(res, 400, "validation_error", e.what());
  } catch (const pmp::NotFoundError& e) {
    send_error(res, 404, "not_found", e.what());
  } catch (const pmp::BackendUnavailableError& e) {
    spdlog::warn("{}: backend unavailable: {}", route, e.what());
    send_error(res, 503, "backend_unavailable", e.what());
  } catch (const pmp::ConsistencyError& e) {
    spdlog::error("{}: {}", route, e.what());
    send_error(res, 500, "consistency_error", e.what());
  } catch (const pmp::ConcurrentModificationError& e) {
    spdlog::warn("{}: {}", route, e.what());
    send_error(res, 409, "concurrent_modification", e.what());
  } catch (const json::exception& e) {
    send_error(res, 400, "invalid_json", e.what());
  } catch (const std::exception& e) {
    spdlog::error("{}: {}", route, e.what());
    send_error(res, 500, "internal_error", e.what());
  }
}

static std::optional<int64_t> opt_i64(const json& meta, const httplib::Request& req, const char* k) {
  if (meta.contains(k) && !meta[k].is_null()) {
    if (!meta[k].is_number_integer()) throw pmp::ValidationError(std::string(k) + " must be an integer");
    return meta[k].get<int64_t>();
  }
  const auto s = param_or(req, k);
  if (s.empty()) return std::nullopt;
  size_t used = 0;
  int64_t v = 0;
  try {
    v = std::stoll(s, &used);
  } catch (const std::exception&) {
    throw pmp::ValidationError(std::string(k) + " must be an integer");
  }
  if (used != s.size()) throw pmp::ValidationError(std::string(k) + " must be an integer");
  return v;
}

static std::string str_or(const json& meta, const httplib::Request& req, const char* k,
                          const std::string& def = {}) {
  if (meta.contains(k) && meta[k].is_string()) return meta[k].get<std::string>();
  return param_or(req, k, def);
}

static pmp::Channel channel_param(const std::string& s) {
  auto ch = pmp::parseChannel(s);
  if (!ch) throw pmp::ValidationError("unknown channel '" + s + "'");
  return *ch;
}

static json segment_json(const pmp::Segment& s) {
  json j = s;
  if (auto loc = s.location()) j["location"] = loc->str();
  return j;
}

// Serves exactly the planned window. The Range header is already resolved by
// the plan, so the parsed ranges are dropped to keep httplib from slicing or
// re-framing the response a second time.
static void serve_media(const httplib::Request& req, httplib::Response& res,
                        pmp::MediaGateway& media, const pmp::MediaPlan& plan) {
  const_cast<httplib::Request&>(req).ranges.clear();
  res.set_header("Accept-Ranges", "bytes");
  res.status = plan.status;
  if (!plan.contentRange.empty()) res.set_header("Content-Range", plan.contentRange);
  if (plan.status == 416) return;
  if (plan.length == 0) {
    res.set_content(std::string(), plan.contentType);
    return;
  }

  res.set_content_provider(
    static_cast<size_t>(plan.length), plan.contentType,
    [&media, plan](size_t offset, size_t length, httplib::DataSink& sink) {
      try {
        const size_t n = media.readChunk(plan, offset, length, [&](const char* data, size_t len) {
          return sink.write(data, len);
        });
        return n > 0;
      } catch (const std::exception& e) {
        spdlog::error("media: stream of {} aborted at {}: {}", plan.location.str(),
                      plan.start + offset, e.what());
        return false;
      }
    });
}

static std::optional<std::string> range_header(const httplib::Request& req) {
  if (!req.has_header("Range")) return std::nullopt;
  return req.get_header_value("Range");
}

// -------- server --------

namespace pmp {

void register_routes(httplib::Server& svr, ApiContext& ctx) {
  // Health check
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  // POST /sessions  {"id"?: string}
  svr.Post("/sessions", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, ctx.apiKey, res)) return;
    guarded("POST /sessions", res, [&] {
      json body = req.body.empty() ? json::object() : json::parse(req.body);
      std::string id = body.value("id", std::string());
      if (id.empty()) id = uuid4();
      const Session s = ctx.store.createSession(id);
      send_json(res, 201, {{"id", s.id}, {"status", to_string(s.status)}});
    });
  });

  // POST /sessions/{id}/status  {"status": "submitted" | ...}
  svr.Post(R"(/sessions/([^/]+)/status)", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, ctx.apiKey, res)) return;
    guarded("POST /sessions/:id/status", res, [&] {
      const std::string id = req.matches[1];
      const json body = json::parse(req.body);
      const auto status = parseSessionStatus(body.value("status", std::string()));
      if (!status) throw ValidationError("unknown session status");

      ctx.store.update(id, [&](Session& s) {
        if (s.status == *status) return false;
        s.status = *status;
        return true;
      });
      ctx.store.appendHistory(id, "STATUS_CHANGED", json({{"status", to_string(*status)}}).dump(),
                              now_millis(), "api");
      if (isTerminal(*status)) ctx.merges.onSessionTerminal(id);
      send_json(res, 200, {{"id", id}, {"status", to_string(*status)}});
    });
  });

  // POST /sessions/{id}/segments
  // Body: raw chunk bytes
  // Metadata: X-PMP-Meta: <JSON>  (or)  query params channel, sequence, recordedAt, durationMs, mimeType
  svr.Post(R"(/sessions/([^/]+)/segments)", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, ctx.apiKey, res)) return;
    guarded("POST /sessions/:id/segments", res, [&] {
      const std::string meta_json = req.get_header_value("X-PMP-Meta");
      json meta = json::object();
      if (!meta_json.empty()) {
        meta = json::parse(meta_json);
        if (!meta.is_object()) throw ValidationError("X-PMP-Meta must be a JSON object");
      }

      IngestRequest in;
      in.sessionId   = req.matches[1];
      in.channel     = str_or(meta, req, "channel");
      in.sequence    = opt_i64(meta, req, "sequence");
      in.recordedAt  = opt_i64(meta, req, "recordedAt");
      in.durationMs  = opt_i64(meta, req, "durationMs");
      in.contentType = str_or(meta, req, "mimeType", req.get_header_value("Content-Type"));
      in.bytes       = std::string_view(req.body);

      const Segment seg = ctx.ingestor.ingest(in);
      send_json(res, 201, {
        {"segmentId", seg.segmentId},
        {"size", seg.sizeBytes},
        {"mimeType", seg.mimeType},
        {"storageBackend", to_string(seg.storageBackend)}
      });
    });
  });

  // GET /sessions/{id}/segments
  svr.Get(R"(/sessions/([^/]+)/segments)", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, ctx.apiKey, res)) return;
    guarded("GET /sessions/:id/segments", res, [&] {
      const Session s = ctx.store.getSession(req.matches[1]);
      const std::string filter = param_or(req, "channel");
      std::optional<Channel> only;
      if (!filter.empty()) only = channel_param(filter);

      json out = json::array();
      for (const auto& seg : s.report.segments) {
        if (only && seg.channel != *only) continue;
        out.push_back(segment_json(seg));
      }
      send_json(res, 200, {{"sessionId", s.id}, {"segments", out}});
    });
  });

  // POST /sessions/{id}/merge/{channel}
  svr.Post(R"(/sessions/([^/]+)/merge/([^/]+))", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, ctx.apiKey, res)) return;
    guarded("POST /sessions/:id/merge/:channel", res, [&] {
      const Channel ch = channel_param(req.matches[2]);
      const MergeStatus st = ctx.merges.trigger(req.matches[1], ch);
      send_json(res, 202, {{"channel", to_string(ch)}, {"status", to_string(st)}});
    });
  });

  // GET /sessions/{id}/merge
  svr.Get(R"(/sessions/([^/]+)/merge)", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, ctx.apiKey, res)) return;
    guarded("GET /sessions/:id/merge", res, [&] {
      const Session s = ctx.store.getSession(req.matches[1]);
      json out = json::object();
      json details = json::object();
      for (Channel ch : {Channel::Webcam, Channel::Screen}) {
        out[to_string(ch)] = to_string(s.report.statusOf(ch));
        json d = json::object();
        if (auto it = s.report.mergeDetails.find(ch); it != s.report.mergeDetails.end()) {
          d = it->second;
          d.erase("claimId");
        }
        if (auto url = s.report.recordingUrls.find(ch); url != s.report.recordingUrls.end()) {
          d["recording"] = url->second;
        }
        details[to_string(ch)] = d;
      }
      out["details"] = details;
      send_json(res, 200, out);
    });
  });

  // GET /sessions/{id}/segments/{segmentId}/media
  svr.Get(R"(/sessions/([^/]+)/segments/([^/]+)/media)", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, ctx.apiKey, res)) return;
    guarded("GET segment media", res, [&] {
      const MediaPlan plan = ctx.media.planSegment(req.matches[1], req.matches[2], range_header(req));
      serve_media(req, res, ctx.media, plan);
    });
  });

  // GET /sessions/{id}/recordings/{channel}/media
  svr.Get(R"(/sessions/([^/]+)/recordings/([^/]+)/media)", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, ctx.apiKey, res)) return;
    guarded("GET recording media", res, [&] {
      const Channel ch = channel_param(req.matches[2]);
      const MediaPlan plan = ctx.media.planRecording(req.matches[1], ch, range_header(req));
      serve_media(req, res, ctx.media, plan);
    });
  });

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty()) res.set_content("not found", "text/plain");
  });
}

bool run_http_server(ApiContext& ctx, int port) {
  httplib::Server svr;
  register_routes(svr, ctx);

  spdlog::info("HTTP server listening on http://0.0.0.0:{}", port);
  if (!svr.listen("0.0.0.0", port)) {
    spdlog::error("Failed to bind port {}", port);
    return false;
  }
  return true;
}

} // namespace pmp
