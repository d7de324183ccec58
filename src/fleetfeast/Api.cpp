#include "fleetfeast/Api.hpp"

#include "fleetfeast/ConfigIO.hpp"
#include "fleetfeast/Forecast.hpp"
#include "fleetfeast/HealthCheck.hpp"
#include "fleetfeast/Log.hpp"

#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace fleetfeast {

namespace {

const char* kQueuePrefix = "/queues/";

void ServeStream(const ApiContext& ctx, const HttpServer& server, HttpStream& stream)
{
  if (!ctx.broadcaster) return;

  std::shared_ptr<Subscription> sub = ctx.broadcaster->subscribe(true);
  LogInfo("http", "stream subscriber connected (" + std::to_string(ctx.broadcaster->subscriberCount()) + " total)");

  auto lastWrite = std::chrono::steady_clock::now();
  while (!server.stopping() && stream.ok() && !sub->closed()) {
    SnapshotPtr s = sub->next(std::chrono::milliseconds(500));
    if (s) {
      if (!stream.write("data: " + s->json + "\n\n")) break;
      lastWrite = std::chrono::steady_clock::now();
      continue;
    }
    if (std::chrono::steady_clock::now() - lastWrite >= ctx.keepAlive) {
      if (!stream.write(": keep-alive\n\n")) break;
      lastWrite = std::chrono::steady_clock::now();
    }
  }

  ctx.broadcaster->unsubscribe(sub);
  if (sub->dropped() > 0) {
    LogInfo("http", "stream subscriber disconnected, " + std::to_string(sub->dropped()) + " snapshot(s) dropped");
  } else {
    LogInfo("http", "stream subscriber disconnected");
  }
}

} // namespace

HttpResponse HandleHealth(const ApiContext& ctx, const HttpRequest&)
{
  HealthInputs in;
  in.store = ctx.store;
  in.loop = ctx.loop;
  in.agent = ctx.agent;
  in.broadcaster = ctx.broadcaster;

  HealthReport report;
  const bool ok = RunHealthCheck(in, report);
  return HttpResponse::Json(ok ? 200 : 503, HealthReportToJson(report));
}

HttpResponse HandleInit(const ApiContext& ctx, const HttpRequest&)
{
  if (!ctx.sim) return HttpResponse::Error(503, "city config unavailable");

  // Both members are already serialized; splice them rather than re-parse the snapshot.
  SnapshotPtr s = ctx.broadcaster ? ctx.broadcaster->latest() : nullptr;
  std::string body = "{\"city\":" + CityConfigToJson(*ctx.sim, 0) + ",\"game_state\":";
  body += s ? s->json : std::string("null");
  body += "}";
  return HttpResponse::Json(200, body);
}

HttpResponse HandleState(const ApiContext& ctx, const HttpRequest&)
{
  SnapshotPtr s = ctx.broadcaster ? ctx.broadcaster->latest() : nullptr;
  if (!s) return HttpResponse::Error(503, "no state published yet");
  return HttpResponse::Json(200, s->json);
}

HttpResponse HandleSubmitActions(const ApiContext& ctx, const HttpRequest& req)
{
  if (!ctx.queue) return HttpResponse::Error(503, "action queue unavailable");

  const std::string name = req.path.substr(std::string(kQueuePrefix).size());
  if (name != ctx.queue->name()) return HttpResponse::Error(404, "unknown queue '" + name + "'");

  std::vector<PendingAction> actions;
  std::string err;
  if (!ParseActionSubmission(req.body, actions, err)) {
    LogWarn("http", "rejected submission: " + err);
    return HttpResponse::Error(400, err);
  }

  const std::size_t n = actions.size();
  ctx.queue->pushAll(std::move(actions));

  std::ostringstream oss;
  JsonWriter w(oss);
  w.beginObject();
  w.key("queued");
  w.intValue(static_cast<std::int64_t>(n));
  w.key("queue");
  w.stringValue(ctx.queue->name());
  w.endObject();
  return HttpResponse::Json(202, oss.str());
}

HttpResponse HandleForecast(const ApiContext& ctx, const HttpRequest& req)
{
  SnapshotPtr s = ctx.broadcaster ? ctx.broadcaster->latest() : nullptr;
  if (!s) return HttpResponse::Error(503, "no state published yet");

  const std::string zone = req.queryParam("zone");
  if (zone.empty()) return HttpResponse::Error(400, "missing query parameter 'zone'");

  const std::string hoursText = req.queryParam("hours", "1");
  char* end = nullptr;
  errno = 0;
  const long hours = std::strtol(hoursText.c_str(), &end, 10);
  if (errno != 0 || hoursText.empty() || !end || *end != '\0') {
    return HttpResponse::Error(400, "hours must be an integer");
  }
  if (hours < 1 || hours > kMaxForecastHours) {
    return HttpResponse::Error(400, "hours must be in 1.." + std::to_string(kMaxForecastHours));
  }

  ZoneForecast f;
  std::string err;
  if (!ForecastZone(s->world, ctx.demand, zone, static_cast<int>(hours), f, err)) {
    return HttpResponse::Error(s->world.findZone(zone) < 0 ? 404 : 400, err);
  }
  return HttpResponse::Json(200, ZoneForecastToJson(f));
}

void RegisterApiRoutes(HttpServer& server, const ApiContext& ctx)
{
  server.route("GET", "/health", [ctx](const HttpRequest& r) { return HandleHealth(ctx, r); });
  server.route("GET", "/init", [ctx](const HttpRequest& r) { return HandleInit(ctx, r); });
  server.route("GET", "/state", [ctx](const HttpRequest& r) { return HandleState(ctx, r); });
  server.route("GET", "/forecast", [ctx](const HttpRequest& r) { return HandleForecast(ctx, r); });
  server.routePrefix("POST", kQueuePrefix, [ctx](const HttpRequest& r) { return HandleSubmitActions(ctx, r); });

  HttpServer* srv = &server;
  server.routeStream("GET", "/stream", "text/event-stream",
                     [ctx, srv](const HttpRequest&, HttpStream& stream) { ServeStream(ctx, *srv, stream); });
}

} // namespace fleetfeast
