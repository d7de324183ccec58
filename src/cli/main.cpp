#include "cli/CliParse.hpp"

#include "fleetfeast/Action.hpp"
#include "fleetfeast/ActionQueue.hpp"
#include "fleetfeast/AgentBridge.hpp"
#include "fleetfeast/Broadcaster.hpp"
#include "fleetfeast/ConfigIO.hpp"
#include "fleetfeast/DecisionMaker.hpp"
#include "fleetfeast/FileSync.hpp"
#include "fleetfeast/Json.hpp"
#include "fleetfeast/Log.hpp"
#include "fleetfeast/Sim.hpp"
#include "fleetfeast/SimulationLoop.hpp"
#include "fleetfeast/Snapshot.hpp"
#include "fleetfeast/Version.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace fleetfeast;
using namespace fleetfeast::cli;

namespace {

void PrintHelp()
{
  std::cout
      << "fleetfeast_cli " << FleetFeastVersionString() << " (headless simulation runner)\n\n"
      << "Usage:\n"
      << "  fleetfeast_cli [options]\n\n"
      << "Runs the fleet simulation as fast as possible, without the tick timer or the HTTP\n"
      << "server. Two runs with the same config and the same actions end in the same state.\n\n"
      << "Options:\n"
      << "  --city <path>          City JSON (zones, trucks, sim settings) merged over the default.\n"
      << "  --seed <u64>           Demand noise seed (decimal or 0x...).\n"
      << "  --ticks <N>            Ticks to run (default: 1440, one day).\n"
      << "  --day-length <N>       Minutes per simulated day.\n"
      << "  --noise <F>            Relative demand noise amplitude in [0,1).\n"
      << "  --restock-ticks <N>    Ticks a restock takes.\n"
      << "  --actions <path>       JSON lines: {\"tick\": T, \"type\": \"dispatch\", ...}, applied at tick T.\n"
      << "  --agent <kind>         heuristic | none (default: none).\n"
      << "  --agent-every <N>      Ask the agent every N ticks (default: 30).\n"
      << "  --horizon <minutes>    Forecast horizon used to rank zones (default: 60).\n"
      << "  --out <path>           Summary JSON (default: stdout).\n"
      << "  --csv <path>           Per-tick CSV.\n"
      << "  --state <path>         Final world snapshot JSON.\n"
      << "  --dump-config <path>   Write the effective city config ('-' = stdout) and exit.\n"
      << "  --validate             Validate the config and exit (0 = ok, 2 = invalid).\n"
      << "  --log-level <level>    debug | info | warn | error | off (default: warn).\n"
      << "  --quiet                Do not print the summary to stdout.\n";
}

struct TickRow {
  TickReport report;
  int minuteOfDay = 0;
  int accepted = 0;
  int rejected = 0;
  double cumulativeRevenue = 0.0;
};

struct RunTotals {
  std::int64_t ticks = 0;
  std::int64_t sold = 0;
  double revenue = 0.0;
  double restockCost = 0.0;
  int arrivals = 0;
  int restocks = 0;
  int accepted = 0;
  int rejected = 0;
  int scripted = 0;
};

// One action per line. Blank lines and lines starting with '#' are skipped.
bool LoadActionScript(const std::string& path, std::map<std::int64_t, std::vector<PendingAction>>& out,
                      int& outCount, std::string& outError)
{
  out.clear();
  outCount = 0;

  std::string text;
  if (!ReadFileText(path, text, outError)) return false;

  std::istringstream iss(text);
  std::string line;
  int lineNo = 0;
  while (std::getline(iss, line)) {
    ++lineNo;
    const std::size_t first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos || line[first] == '#') continue;

    JsonValue v;
    std::string err;
    if (!ParseJson(line, v, err)) {
      outError = path + ":" + std::to_string(lineNo) + ": " + err;
      return false;
    }

    double tick = 0.0;
    if (!GetJsonNumber(v, "tick", tick) || tick < 0.0 || tick != static_cast<double>(static_cast<std::int64_t>(tick))) {
      outError = path + ":" + std::to_string(lineNo) + ": missing or invalid 'tick'";
      return false;
    }

    PendingAction a;
    if (!ParseActionJson(v, a, err)) {
      outError = path + ":" + std::to_string(lineNo) + ": " + err;
      return false;
    }

    out[static_cast<std::int64_t>(tick)].push_back(std::move(a));
    ++outCount;
  }
  return true;
}

bool WriteTickCsv(const std::string& path, const std::vector<TickRow>& rows)
{
  EnsureParentDir(path);
  std::ofstream f(path, std::ios::binary);
  if (!f) return false;

  f << "tick,minute_of_day,sold,revenue,cumulative_revenue,arrivals,restocks_completed,restock_cost,"
       "served_zone_demand,actions_accepted,actions_rejected\n";
  for (const TickRow& r : rows) {
    f << r.report.tick << ',' << r.minuteOfDay << ',' << r.report.sold << ',' << r.report.revenue << ','
      << r.cumulativeRevenue << ',' << r.report.arrivals << ',' << r.report.restocksCompleted << ','
      << r.report.restockCost << ',' << r.report.servedZoneDemand << ',' << r.accepted << ',' << r.rejected << '\n';
  }
  return static_cast<bool>(f);
}

std::string BuildSummaryJson(const SimConfig& cfg, const RunTotals& totals, const SnapshotPtr& finalState,
                             const AgentStatus* agent, const std::string& agentKind)
{
  std::ostringstream oss;
  JsonWriteOptions opt;
  opt.pretty = true;
  JsonWriter w(oss, opt);

  w.beginObject();
  w.key("version");
  w.stringValue(FleetFeastVersionString());
  w.key("seed");
  w.stringValue(HexU64(cfg.seed));
  w.key("day_length");
  w.intValue(cfg.dayLength);
  w.key("ticks_run");
  w.intValue(totals.ticks);

  if (finalState) {
    w.key("final_tick");
    w.intValue(finalState->tick);
    w.key("final_day");
    w.intValue(finalState->day);
    w.key("final_minute_of_day");
    w.intValue(finalState->minuteOfDay);
  }

  w.key("totals");
  w.beginObject();
  w.key("sold");
  w.intValue(totals.sold);
  w.key("revenue");
  w.numberValue(totals.revenue);
  w.key("restock_cost");
  w.numberValue(totals.restockCost);
  w.key("net");
  w.numberValue(totals.revenue - totals.restockCost);
  w.key("arrivals");
  w.intValue(totals.arrivals);
  w.key("restocks_completed");
  w.intValue(totals.restocks);
  w.key("actions_scripted");
  w.intValue(totals.scripted);
  w.key("actions_accepted");
  w.intValue(totals.accepted);
  w.key("actions_rejected");
  w.intValue(totals.rejected);
  w.endObject();

  w.key("agent");
  w.beginObject();
  w.key("kind");
  w.stringValue(agentKind);
  if (agent) {
    w.key("cycles");
    w.intValue(static_cast<std::int64_t>(agent->cycles));
    w.key("enqueued");
    w.intValue(static_cast<std::int64_t>(agent->enqueued));
    w.key("holds");
    w.intValue(static_cast<std::int64_t>(agent->holds));
    w.key("timeouts");
    w.intValue(static_cast<std::int64_t>(agent->timeouts));
    w.key("failures");
    w.intValue(static_cast<std::int64_t>(agent->failures));
  }
  w.endObject();

  w.key("trucks");
  w.beginArray();
  if (finalState) {
    const WorldState& world = finalState->world;
    for (const Truck& t : world.trucks) {
      w.beginObject();
      w.key("id");
      w.stringValue(t.id);
      w.key("status");
      w.stringValue(ToString(t.status));
      w.key("current_zone");
      w.stringValue(world.zones[static_cast<std::size_t>(t.currentZone)].id);
      w.key("inventory");
      w.intValue(t.inventory);
      w.key("total_revenue");
      w.numberValue(t.totalRevenue);
      w.endObject();
    }
  }
  w.endArray();

  w.endObject();
  oss << "\n";
  return oss.str();
}

} // namespace

int main(int argc, char** argv)
{
  SimConfig cfg;

  std::string cityPath;
  bool haveSeed = false;
  std::uint64_t seed = 0;
  int dayLength = -1;
  double noise = -1.0;
  int restockTicks = -1;

  std::int64_t ticks = 1440;
  std::string actionsPath;
  std::string agentKind = "none";
  int agentEvery = 30;
  int horizon = 60;

  std::string outPath;
  std::string csvPath;
  std::string statePath;
  std::string dumpConfigPath;
  bool validateOnly = false;
  bool quiet = false;
  LogLevel logLevel = LogLevel::Warn;

  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "-h" || a == "--help" || a == "help") {
      PrintHelp();
      return 0;
    }
    if (a == "--version") {
      std::cout << "fleetfeast_cli " << FleetFeastVersionString() << "\n";
      return 0;
    }

    if (a == "--city" && i + 1 < argc) {
      cityPath = argv[++i];
      continue;
    }
    if (a == "--seed" && i + 1 < argc) {
      if (!ParseU64(argv[++i], &seed)) {
        std::cerr << "--seed expects u64 (decimal or 0x...)\n";
        return 2;
      }
      haveSeed = true;
      continue;
    }
    if (a == "--ticks" && i + 1 < argc) {
      if (!ParseI64(argv[++i], &ticks) || ticks < 0) {
        std::cerr << "--ticks expects a non-negative integer\n";
        return 2;
      }
      continue;
    }
    if (a == "--day-length" && i + 1 < argc) {
      if (!ParseI32(argv[++i], &dayLength) || dayLength < 1) {
        std::cerr << "--day-length expects an integer >= 1\n";
        return 2;
      }
      continue;
    }
    if (a == "--noise" && i + 1 < argc) {
      if (!ParseF64(argv[++i], &noise) || noise < 0.0 || noise >= 1.0) {
        std::cerr << "--noise expects a number in [0,1)\n";
        return 2;
      }
      continue;
    }
    if (a == "--restock-ticks" && i + 1 < argc) {
      if (!ParseI32(argv[++i], &restockTicks) || restockTicks < 1) {
        std::cerr << "--restock-ticks expects an integer >= 1\n";
        return 2;
      }
      continue;
    }
    if (a == "--actions" && i + 1 < argc) {
      actionsPath = argv[++i];
      continue;
    }
    if (a == "--agent" && i + 1 < argc) {
      agentKind = argv[++i];
      if (agentKind != "heuristic" && agentKind != "none") {
        std::cerr << "--agent expects heuristic or none\n";
        return 2;
      }
      continue;
    }
    if (a == "--agent-every" && i + 1 < argc) {
      if (!ParseI32(argv[++i], &agentEvery) || agentEvery < 1) {
        std::cerr << "--agent-every expects an integer >= 1\n";
        return 2;
      }
      continue;
    }
    if (a == "--horizon" && i + 1 < argc) {
      if (!ParseI32(argv[++i], &horizon) || horizon < 1) {
        std::cerr << "--horizon expects minutes >= 1\n";
        return 2;
      }
      continue;
    }
    if (a == "--out" && i + 1 < argc) {
      outPath = argv[++i];
      continue;
    }
    if (a == "--csv" && i + 1 < argc) {
      csvPath = argv[++i];
      continue;
    }
    if (a == "--state" && i + 1 < argc) {
      statePath = argv[++i];
      continue;
    }
    if (a == "--dump-config" && i + 1 < argc) {
      dumpConfigPath = argv[++i];
      continue;
    }
    if (a == "--validate") {
      validateOnly = true;
      continue;
    }
    if (a == "--quiet") {
      quiet = true;
      continue;
    }
    if (a == "--log-level" && i + 1 < argc) {
      if (!ParseLogLevel(argv[++i], logLevel)) {
        std::cerr << "--log-level expects debug|info|warn|error|off\n";
        return 2;
      }
      continue;
    }

    std::cerr << "Unknown option: " << a << "\n";
    return 2;
  }

  SetLogLevel(logLevel);

  std::string err;
  if (!cityPath.empty()) {
    if (!LoadCityConfigJsonFile(cityPath, cfg, err)) {
      std::cerr << "City config error: " << err << "\n";
      return 2;
    }
  }
  if (haveSeed) cfg.seed = seed;
  if (dayLength > 0) cfg.dayLength = dayLength;
  if (noise >= 0.0) cfg.noiseAmplitude = noise;
  if (restockTicks > 0) cfg.restockTicks = restockTicks;

  if (!ValidateSimConfig(cfg, err)) {
    std::cerr << "Invalid config: " << err << "\n";
    return 2;
  }
  if (validateOnly) {
    std::cout << "config ok: " << cfg.city.zones.size() << " zones, " << cfg.city.trucks.size() << " trucks\n";
    return 0;
  }

  if (!dumpConfigPath.empty()) {
    const std::string text = CityConfigToJson(cfg) + "\n";
    if (dumpConfigPath == "-") {
      std::cout << text;
      return 0;
    }
    EnsureParentDir(dumpConfigPath);
    if (!WriteFileAtomic(dumpConfigPath, text, err)) {
      std::cerr << "Failed to write config: " << err << "\n";
      return 1;
    }
    return 0;
  }

  std::map<std::int64_t, std::vector<PendingAction>> script;
  RunTotals totals;
  if (!actionsPath.empty()) {
    if (!LoadActionScript(actionsPath, script, totals.scripted, err)) {
      std::cerr << "Action script error: " << err << "\n";
      return 2;
    }
  }

  WorldState world;
  if (!BuildWorld(cfg, world, err)) {
    std::cerr << "World build failed: " << err << "\n";
    return 2;
  }

  Simulator sim(cfg);
  ActionQueue queue;
  StateBroadcaster broadcaster(1);

  LoopOptions loopOpt;
  SimulationLoop loop(sim, std::move(world), queue, broadcaster, nullptr, loopOpt);
  loop.publishCurrent();

  std::unique_ptr<AgentBridge> bridge;
  if (agentKind != "none") {
    std::shared_ptr<DecisionMaker> maker;
    if (!MakeDecisionMaker(agentKind, std::string(), maker, err)) {
      std::cerr << "Agent error: " << err << "\n";
      return 2;
    }
    AgentOptions agentOpt;
    agentOpt.timeout = std::chrono::milliseconds(60000);
    agentOpt.horizonMinutes = horizon;
    agentOpt.demand = sim.demandParams();
    bridge = std::make_unique<AgentBridge>(maker, broadcaster, queue, agentOpt);
  }

  std::vector<TickRow> rows;
  if (!csvPath.empty()) rows.reserve(static_cast<std::size_t>(ticks));

  for (std::int64_t n = 0; n < ticks; ++n) {
    const std::int64_t t = loop.status().tick;

    if (bridge && t % agentEvery == 0) {
      const CycleResult r = bridge->runCycle();
      if (r.outcome == CycleOutcome::Failed || r.outcome == CycleOutcome::Timeout) {
        LogWarn("cli", std::string("agent cycle ") + ToString(r.outcome) + ": " + r.detail);
      }
    }

    auto it = script.find(t);
    if (it != script.end()) queue.pushAll(std::move(it->second));

    TickRow row;
    row.report = loop.tickOnce();
    for (const ActionOutcome& o : row.report.outcomes) {
      if (o.accepted) {
        ++row.accepted;
      } else {
        ++row.rejected;
      }
    }

    ++totals.ticks;
    totals.sold += row.report.sold;
    totals.revenue += row.report.revenue;
    totals.restockCost += row.report.restockCost;
    totals.arrivals += row.report.arrivals;
    totals.restocks += row.report.restocksCompleted;
    totals.accepted += row.accepted;
    totals.rejected += row.rejected;

    if (!csvPath.empty()) {
      row.minuteOfDay = WorldState::MinuteOfDay(row.report.tick, cfg.dayLength);
      row.cumulativeRevenue = totals.revenue;
      rows.push_back(std::move(row));
    }
  }

  const SnapshotPtr finalState = broadcaster.latest();

  if (!csvPath.empty() && !WriteTickCsv(csvPath, rows)) {
    std::cerr << "Failed to write CSV: " << csvPath << "\n";
    return 1;
  }

  if (!statePath.empty() && finalState) {
    EnsureParentDir(statePath);
    if (!WriteFileAtomic(statePath, WorldToJson(finalState->world, true) + "\n", err)) {
      std::cerr << "Failed to write state: " << err << "\n";
      return 1;
    }
  }

  AgentStatus agentStatus;
  if (bridge) agentStatus = bridge->status();
  const std::string summary = BuildSummaryJson(cfg, totals, finalState, bridge ? &agentStatus : nullptr, agentKind);

  if (!outPath.empty()) {
    EnsureParentDir(outPath);
    if (!WriteFileAtomic(outPath, summary, err)) {
      std::cerr << "Failed to write summary: " << err << "\n";
      return 1;
    }
  } else if (!quiet) {
    std::cout << summary;
  }

  return 0;
}
