#pragma once

#include "fleetfeast/ActionQueue.hpp"
#include "fleetfeast/AgentBridge.hpp"
#include "fleetfeast/Broadcaster.hpp"
#include "fleetfeast/Config.hpp"
#include "fleetfeast/Demand.hpp"
#include "fleetfeast/HttpServer.hpp"
#include "fleetfeast/SimulationLoop.hpp"
#include "fleetfeast/StateStore.hpp"

#include <chrono>

namespace fleetfeast {

// Everything the HTTP routes read from. Pointers may be null where a component is
// not running; the owner keeps them alive for as long as the server runs.
struct ApiContext {
  StateBroadcaster* broadcaster = nullptr;
  ActionQueue* queue = nullptr;
  StateStore* store = nullptr;
  const SimulationLoop* loop = nullptr;
  const AgentBridge* agent = nullptr;
  const SimConfig* sim = nullptr;

  DemandParams demand;

  // Comment line sent on idle SSE streams.
  std::chrono::milliseconds keepAlive{15000};
};

// GET  /health
// GET  /init                   {"city": <city config>, "game_state": <latest snapshot or null>}
// GET  /state
// GET  /stream                 text/event-stream, one "data:" event per tick
// POST /queues/<queueName>     one action object or an array
// GET  /forecast?zone=<id>&hours=<n>
void RegisterApiRoutes(HttpServer& server, const ApiContext& ctx);

// Individual handlers, exposed for tests.
HttpResponse HandleHealth(const ApiContext& ctx, const HttpRequest& req);
HttpResponse HandleInit(const ApiContext& ctx, const HttpRequest& req);
HttpResponse HandleState(const ApiContext& ctx, const HttpRequest& req);
HttpResponse HandleSubmitActions(const ApiContext& ctx, const HttpRequest& req);
HttpResponse HandleForecast(const ApiContext& ctx, const HttpRequest& req);

} // namespace fleetfeast
