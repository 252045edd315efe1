#pragma once
#include <string>

namespace httplib { class Server; }

namespace pmp {

class SessionStore;
class SegmentIngestor;
class MergeOrchestrator;
class MediaGateway;

struct ApiContext {
  SessionStore&      store;
  SegmentIngestor&   ingestor;
  MergeOrchestrator& merges;
  MediaGateway&      media;
  std::string        apiKey; // empty = auth disabled
};

// Installs every endpoint on svr. ctx must outlive the server.
void register_routes(httplib::Server& svr, ApiContext& ctx);

// Blocking. Returns false when the port cannot be bound.
bool run_http_server(ApiContext& ctx, int port);

} // namespace pmp
