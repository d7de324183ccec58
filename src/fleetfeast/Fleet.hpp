#pragma once

#include "fleetfeast/World.hpp"

#include <cstdint>
#include <vector>

namespace fleetfeast {

// Truck state machine:
//
//   IDLE -> MOVING -> SERVING -> (MOVING to restock) -> RESTOCKING -> IDLE
//
// MOVING is used both for dispatches and for the automatic return to the restock zone
// (restockBound == true). A truck is always in exactly one of these states and its
// inventory stays within [0, maxInventory].

struct FleetParams {
  int restockTicks = 10;
};

// ceil(cost / speedMultiplier), at least 1.
int TravelTicks(int cost, double speedMultiplier);

// Travel ticks between two zones for this truck.
int TravelTicks(const std::vector<Zone>& zones, const Truck& truck, int fromZone, int toZone);

// Start a leg from the truck's current zone. The truck arrives when the world enters
// tick + TravelTicks(...).
void StartMove(const std::vector<Zone>& zones, Truck& truck, int toZone, std::int64_t tick, bool restockBound);

// Rerouting keeps currentZone as the departure zone. Turning back takes the ticks
// already travelled; any other target is measured from the departure zone. The current
// destination keeps its arrival tick and stops being a restock run.
void Reroute(const std::vector<Zone>& zones, Truck& truck, int toZone, std::int64_t tick);

void StartRestocking(Truck& truck, std::int64_t tick, const FleetParams& params);

// RESTOCKING in place if already at the restock zone, else MOVING there.
void BeginRestockReturn(const std::vector<Zone>& zones, Truck& truck, std::int64_t tick, const FleetParams& params);

struct TruckStepResult {
  int sold = 0;
  double revenue = 0.0;

  bool arrived = false;

  bool restocked = false;
  int unitsRestocked = 0;
  double restockCost = 0.0;
};

// Advance one truck as the world enters tick `t`.
//
// remainingDemand holds the unsold demand per zone for this tick; serving trucks
// consume it so all trucks at a zone together never sell more than its demand.
TruckStepResult StepTruck(const std::vector<Zone>& zones, Truck& truck, std::int64_t t, const FleetParams& params,
                          std::vector<double>& remainingDemand);

} // namespace fleetfeast
