#pragma once

#include "fleetfeast/Action.hpp"
#include "fleetfeast/Config.hpp"
#include "fleetfeast/Demand.hpp"
#include "fleetfeast/Fleet.hpp"
#include "fleetfeast/World.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace fleetfeast {

// Build the initial world (tick 0) from a validated config. Demand at tick 0 is
// recorded so the first snapshot already carries one history value per zone.
bool BuildWorld(const SimConfig& cfg, WorldState& outWorld, std::string& outError);

// Summary of one step, mostly for logs, the CLI runner and tests.
struct TickReport {
  std::int64_t tick = 0; // tick the world entered

  int sold = 0;
  double revenue = 0.0;

  int arrivals = 0;
  int restocksCompleted = 0;
  double restockCost = 0.0;

  // Sum of demand at `tick` over zones with at least one serving truck.
  double servedZoneDemand = 0.0;

  std::vector<ActionOutcome> outcomes;
};

// Advances a WorldState by exactly one tick. Stateless apart from its config, so the
// same world and actions always produce the same result.
class Simulator {
public:
  explicit Simulator(SimConfig cfg = {});

  const SimConfig& config() const { return m_cfg; }

  DemandParams demandParams() const;
  FleetParams fleetParams() const;

  // One tick boundary at world.currentTick = T:
  //   1) apply `actions` at T
  //   2) record demand at T+1
  //   3) step every truck into T+1
  //   4) currentTick = T+1
  TickReport step(WorldState& world, const std::vector<PendingAction>& actions) const;

private:
  SimConfig m_cfg;
};

} // namespace fleetfeast
