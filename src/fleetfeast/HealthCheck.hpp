#pragma once

#include "fleetfeast/AgentBridge.hpp"
#include "fleetfeast/Broadcaster.hpp"
#include "fleetfeast/SimulationLoop.hpp"
#include "fleetfeast/StateStore.hpp"

#include <cstdint>
#include <string>

namespace fleetfeast {

// Runtime health used by GET /health.
//
// Healthy means: the state store answers a ping, the last snapshot write succeeded
// and the tick loop has not halted. Any component may be null (CLI runs, tests).
struct HealthInputs {
  StateStore* store = nullptr;
  const SimulationLoop* loop = nullptr;
  const AgentBridge* agent = nullptr;
  const StateBroadcaster* broadcaster = nullptr;
};

struct HealthReport {
  bool ok = false;

  // connected | degraded | unreachable | none
  std::string store = "none";
  std::string storeBackend;
  std::string storeError;
  int consecutiveStoreFailures = 0;
  std::uint64_t totalStoreFailures = 0;

  bool hasLoop = false;
  LoopStatus loop;

  bool hasAgent = false;
  AgentStatus agent;

  std::size_t subscribers = 0;
};

// Returns report.ok.
bool RunHealthCheck(const HealthInputs& in, HealthReport& out);

// {"status": "healthy"|"unhealthy", "store": ..., "version": ..., ...}
std::string HealthReportToJson(const HealthReport& r);

} // namespace fleetfeast
