#include "cli/CliParse.hpp"

#include "fleetfeast/ActionQueue.hpp"
#include "fleetfeast/AgentBridge.hpp"
#include "fleetfeast/Api.hpp"
#include "fleetfeast/Broadcaster.hpp"
#include "fleetfeast/ConfigIO.hpp"
#include "fleetfeast/DecisionMaker.hpp"
#include "fleetfeast/HttpServer.hpp"
#include "fleetfeast/Log.hpp"
#include "fleetfeast/LogTee.hpp"
#include "fleetfeast/Sim.hpp"
#include "fleetfeast/SimulationLoop.hpp"
#include "fleetfeast/StateStore.hpp"
#include "fleetfeast/Version.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace fleetfeast;

namespace {

volatile std::sig_atomic_t g_stopSignal = 0;

extern "C" void OnStopSignal(int sig)
{
  g_stopSignal = sig;
}

void PrintHelp()
{
  std::cout
      << "fleetfeast_server " << FleetFeastVersionString() << "\n\n"
      << "Usage:\n"
      << "  fleetfeast_server [options]\n\n"
      << "Runs the fleet simulation in real time, asks the agent for a dispatch decision every\n"
      << "period, and serves the state over HTTP. Settings come from FLEETFEAST_* environment\n"
      << "variables first; command-line options override them.\n\n"
      << "Options:\n"
      << "  --city <path>              City JSON merged over the built-in city.\n"
      << "  --seed <u64>               Demand noise seed.\n"
      << "  --host <addr>              HTTP bind address (default: 0.0.0.0).\n"
      << "  --port <N>                 HTTP port (default: 8000, 0 = any).\n"
      << "  --tick <dur>               Tick period, e.g. 1000, 250ms, 1s (default: 1s).\n"
      << "  --agent <kind>             heuristic | command | none (default: heuristic).\n"
      << "  --agent-command <cmd>      Decision command for --agent command.\n"
      << "  --agent-period <dur>       Time between agent cycles (default: 30s).\n"
      << "  --agent-timeout <dur>      Deadline for one agent cycle (default: 10s).\n"
      << "  --store-dir <dir>          Persist snapshots under <dir> (default: in memory).\n"
      << "  --require-durability <0|1> Stop when the store keeps failing.\n"
      << "  --log-file <path>          Copy console output into a rotated log file.\n"
      << "  --log-level <level>        debug | info | warn | error | off.\n"
      << "  --print-config             Print the effective city config and exit.\n"
      << "  --version\n";
}

bool ParseDurationFlag(const char* name, const std::string& v, int& out)
{
  if (cli::ParseDurationMs(v, &out)) return true;
  std::cerr << name << " expects a duration >= 1ms (e.g. 500, 250ms, 2s, 1m)\n";
  return false;
}

} // namespace

int main(int argc, char** argv)
{
  ServerConfig cfg;
  std::string err;

  if (!ApplyEnvironment(cfg, err)) {
    std::cerr << "Environment error: " << err << "\n";
    return 2;
  }

  bool printConfig = false;
  bool haveSeed = false;
  std::uint64_t seed = 0;

  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "-h" || a == "--help") {
      PrintHelp();
      return 0;
    }
    if (a == "--version") {
      std::cout << FleetFeastServerTag() << "\n";
      return 0;
    }
    if (a == "--print-config") {
      printConfig = true;
      continue;
    }

    if (i + 1 >= argc) {
      std::cerr << "Unknown option or missing value: " << a << "\n";
      return 2;
    }
    const std::string v = argv[++i];

    if (a == "--city") {
      cfg.cityPath = v;
    } else if (a == "--seed") {
      if (!cli::ParseU64(v, &seed)) {
        std::cerr << "--seed expects u64 (decimal or 0x...)\n";
        return 2;
      }
      haveSeed = true;
    } else if (a == "--host") {
      cfg.httpHost = v;
    } else if (a == "--port") {
      if (!cli::ParseI32(v, &cfg.httpPort)) {
        std::cerr << "--port expects an integer\n";
        return 2;
      }
    } else if (a == "--tick") {
      if (!ParseDurationFlag("--tick", v, cfg.tickMs)) return 2;
    } else if (a == "--agent") {
      cfg.agent = v;
    } else if (a == "--agent-command") {
      cfg.agentCommand = v;
    } else if (a == "--agent-period") {
      if (!ParseDurationFlag("--agent-period", v, cfg.agentPeriodMs)) return 2;
    } else if (a == "--agent-timeout") {
      if (!ParseDurationFlag("--agent-timeout", v, cfg.agentTimeoutMs)) return 2;
    } else if (a == "--store-dir") {
      cfg.storeDir = v;
    } else if (a == "--require-durability") {
      if (!cli::ParseBool01(v, &cfg.requireDurability)) {
        std::cerr << "--require-durability expects 0 or 1\n";
        return 2;
      }
    } else if (a == "--log-file") {
      cfg.logFile = v;
    } else if (a == "--log-level") {
      cfg.logLevel = v;
    } else {
      std::cerr << "Unknown option: " << a << "\n";
      return 2;
    }
  }

  if (!cfg.cityPath.empty()) {
    if (!LoadCityConfigJsonFile(cfg.cityPath, cfg.sim, err)) {
      std::cerr << "City config error: " << err << "\n";
      return 2;
    }
  }
  if (haveSeed) cfg.sim.seed = seed;

  if (!ValidateServerConfig(cfg, err)) {
    std::cerr << "Invalid configuration: " << err << "\n";
    return 2;
  }

  if (printConfig) {
    std::cout << CityConfigToJson(cfg.sim) << "\n";
    return 0;
  }

  LogLevel level = LogLevel::Info;
  ParseLogLevel(cfg.logLevel, level);
  SetLogLevel(level);

  LogTee tee;
  if (!cfg.logFile.empty()) {
    LogTeeOptions teeOpt;
    teeOpt.path = cfg.logFile;
    teeOpt.keepFiles = cfg.logKeepFiles;
    if (!tee.start(teeOpt, err)) {
      std::cerr << "Log file error: " << err << "\n";
      return 2;
    }
  }

  LogInfo("main", std::string(FleetFeastServerTag()) + " starting: " + std::to_string(cfg.sim.city.zones.size()) +
                      " zones, " + std::to_string(cfg.sim.city.trucks.size()) + " trucks, tick " +
                      std::to_string(cfg.tickMs) + "ms, seed " + cli::HexU64(cfg.sim.seed));

  if (!cfg.storeDir.empty() && !cli::EnsureDir(cfg.storeDir)) {
    LogError("main", "cannot create store directory " + cfg.storeDir);
    return 2;
  }
  std::unique_ptr<StateStore> store = MakeStateStore(cfg.storeDir);
  if (!store->ping(err)) {
    // Not fatal: the loop keeps ticking and /health reports the store as unreachable.
    LogWarn("main", "state store " + store->describe() + " unreachable: " + err);
  }

  WorldState world;
  if (!BuildWorld(cfg.sim, world, err)) {
    LogError("main", "world build failed: " + err);
    return 2;
  }

  Simulator sim(cfg.sim);
  ActionQueue queue(cfg.queueName);
  StateBroadcaster broadcaster(static_cast<std::size_t>(cfg.subscriberQueue));

  LoopOptions loopOpt;
  loopOpt.tickPeriod = std::chrono::milliseconds(cfg.tickMs);
  loopOpt.stateKey = cfg.stateKey;
  loopOpt.requireDurability = cfg.requireDurability;
  loopOpt.storeFailureLimit = cfg.storeFailureLimit;
  SimulationLoop loop(sim, std::move(world), queue, broadcaster, store.get(), loopOpt);

  std::shared_ptr<DecisionMaker> maker;
  if (!MakeDecisionMaker(cfg.agent, cfg.agentCommand, maker, err)) {
    LogError("main", "agent setup failed: " + err);
    return 2;
  }
  std::unique_ptr<AgentBridge> bridge;
  if (maker) {
    AgentOptions agentOpt;
    agentOpt.period = std::chrono::milliseconds(cfg.agentPeriodMs);
    agentOpt.timeout = std::chrono::milliseconds(cfg.agentTimeoutMs);
    agentOpt.horizonMinutes = cfg.forecastHorizonMinutes;
    agentOpt.maxToolRounds = cfg.maxToolRounds;
    agentOpt.demand = sim.demandParams();
    bridge = std::make_unique<AgentBridge>(maker, broadcaster, queue, agentOpt);
  } else {
    LogInfo("main", "agent disabled; actions arrive only through POST /queues/" + cfg.queueName);
  }

  HttpServerOptions httpOpt;
  httpOpt.host = cfg.httpHost;
  httpOpt.port = cfg.httpPort;
  HttpServer http(httpOpt);

  ApiContext api;
  api.broadcaster = &broadcaster;
  api.queue = &queue;
  api.store = store.get();
  api.loop = &loop;
  api.agent = bridge.get();
  api.sim = &cfg.sim;
  api.demand = sim.demandParams();
  RegisterApiRoutes(http, api);

  if (!loop.start(err)) {
    LogError("main", "tick loop failed to start: " + err);
    return 1;
  }
  if (bridge && !bridge->start(err)) {
    LogError("main", "agent bridge failed to start: " + err);
    loop.stop();
    return 1;
  }
  if (!http.start(err)) {
    LogError("main", "HTTP server failed to start: " + err);
    if (bridge) bridge->stop();
    loop.stop();
    return 1;
  }
  LogInfo("main", "listening on " + cfg.httpHost + ":" + std::to_string(http.port()));

  std::signal(SIGINT, OnStopSignal);
  std::signal(SIGTERM, OnStopSignal);

  int exitCode = 0;
  while (g_stopSignal == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    const LoopStatus st = loop.status();
    if (st.halted) {
      LogError("main", "tick loop halted: " + st.haltReason);
      exitCode = 1;
      break;
    }
  }
  if (g_stopSignal != 0) LogInfo("main", "signal " + std::to_string(static_cast<int>(g_stopSignal)) + ", shutting down");

  if (bridge) bridge->stop();
  broadcaster.closeAll();
  http.stop();
  loop.stop();

  const LoopStatus st = loop.status();
  LogInfo("main", "stopped at tick " + std::to_string(st.tick) + " after " + std::to_string(st.ticksRun) + " ticks");
  return exitCode;
}
