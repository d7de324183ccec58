#include "fleetfeast/DecisionMaker.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <utility>

#include <sys/wait.h>
#include <unistd.h>

namespace fleetfeast {

namespace {

void WriteToolList(JsonWriter& w)
{
  static const char* kTools[] = {
      "dispatch_truck{truck_id, destination_zone, reasoning}",
      "start_serving{truck_id, reasoning}",
      "restock_inventory{truck_id, reasoning}",
      "hold_position{truck_id?, reasoning}",
      "get_zone_forecast{zone_id, hours_ahead}",
  };
  w.beginArray();
  for (const char* t : kTools) w.stringValue(t);
  w.endArray();
}

std::string ToolCall(const char* tool, const std::vector<std::pair<const char*, std::string>>& args)
{
  std::ostringstream oss;
  JsonWriter w(oss);
  w.beginObject();
  w.key("tool");
  w.stringValue(tool);
  w.key("arguments");
  w.beginObject();
  for (const auto& kv : args) {
    w.key(kv.first);
    w.stringValue(kv.second);
  }
  w.endObject();
  w.endObject();
  return oss.str();
}

const ZoneRanking* FindRanking(const std::vector<ZoneRanking>& ranking, const std::string& zoneId)
{
  for (const ZoneRanking& r : ranking) {
    if (r.zoneId == zoneId) return &r;
  }
  return nullptr;
}

} // namespace

std::string DecisionRequestToJson(const DecisionRequest& req)
{
  std::ostringstream oss;
  JsonWriter w(oss);

  w.beginObject();
  w.key("round");
  w.intValue(req.round);

  w.key("state");
  if (req.snapshot) {
    WriteWorldJson(w, req.snapshot->world);
  } else {
    w.nullValue();
  }

  w.key("forecast");
  w.beginObject();
  w.key("horizon_minutes");
  w.intValue(req.horizonMinutes);
  w.key("zones");
  WriteZoneRankingJson(w, req.ranking);
  w.endObject();

  w.key("tool_results");
  w.beginArray();
  for (const ZoneForecast& f : req.forecasts) WriteZoneForecastJson(w, f);
  w.endArray();

  w.key("tool_errors");
  w.beginArray();
  for (const std::string& e : req.toolErrors) w.stringValue(e);
  w.endArray();

  w.key("tools");
  WriteToolList(w);
  w.endObject();
  return oss.str();
}

HeuristicDecisionMaker::HeuristicDecisionMaker(HeuristicConfig cfg)
    : m_cfg(cfg)
{
}

bool HeuristicDecisionMaker::decide(const DecisionRequest& req, std::string& outReply, std::string& outError)
{
  outReply.clear();
  outError.clear();
  if (!req.snapshot) {
    outError = "no snapshot";
    return false;
  }

  const WorldState& world = req.snapshot->world;

  // 1) Restock low trucks that are sitting idle.
  for (const Truck& t : world.trucks) {
    if (t.status != TruckStatus::Idle || t.inventory >= t.maxInventory) continue;
    if (static_cast<double>(t.inventory) >= m_cfg.restockFraction * static_cast<double>(t.maxInventory)) continue;
    const Zone& zone = world.zones[static_cast<std::size_t>(t.currentZone)];
    if (world.occupancy(t.currentZone) > zone.parkingCapacity) continue;

    std::ostringstream why;
    why << "inventory " << t.inventory << "/" << t.maxInventory << " is low";
    outReply = ToolCall("restock_inventory", {{"truck_id", t.id}, {"reasoning", why.str()}});
    return true;
  }

  // Trucks already heading somewhere count against that zone's parking.
  std::vector<int> claimed(world.zones.size(), 0);
  for (std::size_t i = 0; i < world.zones.size(); ++i) claimed[i] = world.occupancy(static_cast<int>(i));
  for (const Truck& t : world.trucks) {
    if (t.status == TruckStatus::Moving && t.destinationZone >= 0) ++claimed[static_cast<std::size_t>(t.destinationZone)];
  }

  // 2) Best zone with a free spot.
  const ZoneRanking* best = nullptr;
  for (const ZoneRanking& r : req.ranking) {
    const int zi = world.findZone(r.zoneId);
    if (zi < 0 || claimed[static_cast<std::size_t>(zi)] >= r.parkingCapacity) continue;
    best = &r;
    break;
  }

  if (best) {
    const Truck* pick = nullptr;
    double pickMean = 0.0;
    for (const Truck& t : world.trucks) {
      if (t.status != TruckStatus::Idle && t.status != TruckStatus::Serving) continue;
      if (t.inventory <= 0) continue;
      const std::string& here = world.zones[static_cast<std::size_t>(t.currentZone)].id;
      if (here == best->zoneId) continue;

      const ZoneRanking* cur = FindRanking(req.ranking, here);
      const double mean = cur ? cur->meanDemand : 0.0;
      if (!pick || mean < pickMean) {
        pick = &t;
        pickMean = mean;
      }
    }

    if (pick && best->meanDemand >= pickMean * m_cfg.minGainRatio + m_cfg.minGainOrders) {
      std::ostringstream why;
      why << best->zoneId << " projects " << best->meanDemand << " orders/min vs " << pickMean << " here";
      outReply = ToolCall("dispatch_truck",
                          {{"truck_id", pick->id}, {"destination_zone", best->zoneId}, {"reasoning", why.str()}});
      return true;
    }
  }

  // 3) Nothing worth doing.
  outReply = ToolCall("hold_position", {{"reasoning", "no move beats the current positions"}});
  return true;
}

CommandDecisionMaker::CommandDecisionMaker(std::string command)
    : m_command(std::move(command))
{
}

bool CommandDecisionMaker::decide(const DecisionRequest& req, std::string& outReply, std::string& outError)
{
  outReply.clear();
  outError.clear();

  char path[] = "/tmp/fleetfeast-request-XXXXXX";
  const int fd = ::mkstemp(path);
  if (fd < 0) {
    outError = std::string("mkstemp failed: ") + std::strerror(errno);
    return false;
  }

  const std::string body = DecisionRequestToJson(req);
  std::size_t written = 0;
  while (written < body.size()) {
    const ssize_t n = ::write(fd, body.data() + written, body.size() - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      outError = std::string("writing request failed: ") + std::strerror(errno);
      ::close(fd);
      ::unlink(path);
      return false;
    }
    written += static_cast<std::size_t>(n);
  }
  ::close(fd);

  const std::string cmd = m_command + " " + path;
  FILE* pipe = ::popen(cmd.c_str(), "r");
  if (!pipe) {
    outError = std::string("popen failed: ") + std::strerror(errno);
    ::unlink(path);
    return false;
  }

  char buf[4096];
  std::size_t n = 0;
  while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0) outReply.append(buf, n);

  const int status = ::pclose(pipe);
  ::unlink(path);

  if (status == -1) {
    outError = std::string("pclose failed: ") + std::strerror(errno);
    return false;
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    std::ostringstream oss;
    oss << "agent command failed (status " << status << ")";
    outError = oss.str();
    return false;
  }
  return true;
}

bool MakeDecisionMaker(const std::string& kind, const std::string& command, std::shared_ptr<DecisionMaker>& out,
                       std::string& outError)
{
  outError.clear();
  out.reset();
  if (kind == "none") return true;
  if (kind == "heuristic") {
    out = std::make_shared<HeuristicDecisionMaker>();
    return true;
  }
  if (kind == "command") {
    if (command.empty()) {
      outError = "agent 'command' requires a command line";
      return false;
    }
    out = std::make_shared<CommandDecisionMaker>(command);
    return true;
  }
  outError = "unknown agent '" + kind + "'";
  return false;
}

} // namespace fleetfeast
