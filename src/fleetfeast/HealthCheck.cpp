#include "fleetfeast/HealthCheck.hpp"

#include "fleetfeast/Version.hpp"

#include <sstream>

namespace fleetfeast {

bool RunHealthCheck(const HealthInputs& in, HealthReport& out)
{
  out = HealthReport{};
  bool ok = true;

  if (in.loop) {
    out.hasLoop = true;
    out.loop = in.loop->status();
    out.consecutiveStoreFailures = out.loop.consecutiveStoreFailures;
    out.totalStoreFailures = out.loop.totalStoreFailures;
    if (out.loop.halted) ok = false;
  }

  if (in.store) {
    out.storeBackend = in.store->describe();
    std::string err;
    if (!in.store->ping(err)) {
      out.store = "unreachable";
      out.storeError = err;
      ok = false;
    } else if (out.consecutiveStoreFailures > 0) {
      out.store = "degraded";
      out.storeError = out.loop.lastStoreError;
      ok = false;
    } else {
      out.store = "connected";
    }
  }

  if (in.agent) {
    out.hasAgent = true;
    out.agent = in.agent->status();
  }
  if (in.broadcaster) out.subscribers = in.broadcaster->subscriberCount();

  out.ok = ok;
  return ok;
}

std::string HealthReportToJson(const HealthReport& r)
{
  std::ostringstream oss;
  JsonWriter w(oss);
  w.beginObject();
  w.key("status");
  w.stringValue(r.ok ? "healthy" : "unhealthy");
  w.key("store");
  w.stringValue(r.store);
  if (!r.storeBackend.empty()) {
    w.key("store_backend");
    w.stringValue(r.storeBackend);
  }
  if (!r.storeError.empty()) {
    w.key("store_error");
    w.stringValue(r.storeError);
  }
  w.key("consecutive_store_failures");
  w.intValue(r.consecutiveStoreFailures);
  w.key("total_store_failures");
  w.intValue(static_cast<std::int64_t>(r.totalStoreFailures));

  if (r.hasLoop) {
    w.key("loop");
    w.beginObject();
    w.key("running");
    w.boolValue(r.loop.running);
    w.key("halted");
    w.boolValue(r.loop.halted);
    if (r.loop.halted) {
      w.key("halt_reason");
      w.stringValue(r.loop.haltReason);
    }
    w.key("tick");
    w.intValue(r.loop.tick);
    w.key("overruns");
    w.intValue(static_cast<std::int64_t>(r.loop.overruns));
    w.endObject();
  }

  if (r.hasAgent) {
    w.key("agent");
    w.beginObject();
    w.key("running");
    w.boolValue(r.agent.running);
    w.key("in_flight");
    w.boolValue(r.agent.inFlight);
    w.key("cycles");
    w.intValue(static_cast<std::int64_t>(r.agent.cycles));
    w.key("enqueued");
    w.intValue(static_cast<std::int64_t>(r.agent.enqueued));
    w.key("holds");
    w.intValue(static_cast<std::int64_t>(r.agent.holds));
    w.key("timeouts");
    w.intValue(static_cast<std::int64_t>(r.agent.timeouts));
    w.key("failures");
    w.intValue(static_cast<std::int64_t>(r.agent.failures));
    if (!r.agent.lastError.empty()) {
      w.key("last_error");
      w.stringValue(r.agent.lastError);
    }
    w.endObject();
  }

  w.key("subscribers");
  w.intValue(static_cast<std::int64_t>(r.subscribers));
  w.key("version");
  w.stringValue(FleetFeastVersionString());
  w.endObject();
  return oss.str();
}

} // namespace fleetfeast
