#include "fleetfeast/Fleet.hpp"

#include "fleetfeast/Demand.hpp"

#include <algorithm>
#include <cmath>

namespace fleetfeast {

namespace {

bool ValidZone(const std::vector<Zone>& zones, int z)
{
  return z >= 0 && z < static_cast<int>(zones.size());
}

void Arrive(Truck& truck)
{
  truck.currentZone = truck.destinationZone;
  truck.destinationZone = -1;
}

} // namespace

int TravelTicks(int cost, double speedMultiplier)
{
  if (cost <= 0 || !(speedMultiplier > 0.0)) return 1;
  // Small epsilon so exact quotients (15 / 0.5) do not round up.
  const double ticks = std::ceil(static_cast<double>(cost) / speedMultiplier - 1e-9);
  if (ticks >= 2147483647.0) return 2147483647;
  return std::max(1, static_cast<int>(ticks));
}

int TravelTicks(const std::vector<Zone>& zones, const Truck& truck, int fromZone, int toZone)
{
  if (!ValidZone(zones, fromZone) || !ValidZone(zones, toZone)) return 1;
  const Zone& from = zones[static_cast<std::size_t>(fromZone)];
  const int cost = (static_cast<std::size_t>(toZone) < from.travelCost.size())
                       ? from.travelCost[static_cast<std::size_t>(toZone)]
                       : 0;
  return TravelTicks(cost, truck.speedMultiplier);
}

void StartMove(const std::vector<Zone>& zones, Truck& truck, int toZone, std::int64_t tick, bool restockBound)
{
  truck.status = TruckStatus::Moving;
  truck.destinationZone = toZone;
  truck.departTick = tick;
  truck.arrivalTick = tick + TravelTicks(zones, truck, truck.currentZone, toZone);
  truck.restockBound = restockBound;
  truck.restockFinishTick = 0;
}

void Reroute(const std::vector<Zone>& zones, Truck& truck, int toZone, std::int64_t tick)
{
  // Already heading there (e.g. a restock run): keep the trip, drop the restock intent.
  if (toZone == truck.destinationZone) {
    truck.restockBound = false;
    return;
  }

  if (toZone == truck.currentZone) {
    const std::int64_t travelled = std::max<std::int64_t>(1, tick - truck.departTick);
    truck.destinationZone = toZone;
    truck.departTick = tick;
    truck.arrivalTick = tick + travelled;
    truck.restockBound = false;
    return;
  }

  StartMove(zones, truck, toZone, tick, false);
}

void StartRestocking(Truck& truck, std::int64_t tick, const FleetParams& params)
{
  truck.status = TruckStatus::Restocking;
  truck.destinationZone = -1;
  truck.restockBound = false;
  truck.restockFinishTick = tick + std::max(1, params.restockTicks);
}

void BeginRestockReturn(const std::vector<Zone>& zones, Truck& truck, std::int64_t tick, const FleetParams& params)
{
  if (truck.currentZone == truck.restockZone || !ValidZone(zones, truck.restockZone)) {
    StartRestocking(truck, tick, params);
    return;
  }
  StartMove(zones, truck, truck.restockZone, tick, true);
}

TruckStepResult StepTruck(const std::vector<Zone>& zones, Truck& truck, std::int64_t t, const FleetParams& params,
                          std::vector<double>& remainingDemand)
{
  TruckStepResult r;
  truck.lastSold = 0;

  switch (truck.status) {
  case TruckStatus::Idle:
    if (truck.inventory == 0) BeginRestockReturn(zones, truck, t, params);
    break;

  case TruckStatus::Moving: {
    if (t < truck.arrivalTick) break;

    Arrive(truck);
    r.arrived = true;

    if (truck.restockBound) {
      StartRestocking(truck, t, params);
      break;
    }

    // Decided on the zone's demand this tick, not on what other trucks left of it.
    const double demand = ValidZone(zones, truck.currentZone)
                              ? CurrentDemand(zones[static_cast<std::size_t>(truck.currentZone)])
                              : 0.0;
    if (truck.inventory == 0) {
      BeginRestockReturn(zones, truck, t, params);
    } else if (demand > 0.0) {
      truck.status = TruckStatus::Serving;
    } else {
      truck.status = TruckStatus::Idle;
    }
    break;
  }

  case TruckStatus::Serving: {
    if (truck.inventory == 0) {
      BeginRestockReturn(zones, truck, t, params);
      break;
    }
    if (!ValidZone(zones, truck.currentZone)) break;

    double& pool = remainingDemand[static_cast<std::size_t>(truck.currentZone)];
    const int orders = static_cast<int>(std::floor(std::max(0.0, pool)));
    const int sold = std::min(truck.inventory, orders);
    if (sold > 0) {
      pool -= static_cast<double>(sold);
      truck.inventory -= sold;
      truck.totalRevenue += static_cast<double>(sold) * truck.unitPrice;
      truck.lastSold = sold;
      r.sold = sold;
      r.revenue = static_cast<double>(sold) * truck.unitPrice;
    }
    break;
  }

  case TruckStatus::Restocking:
    if (t >= truck.restockFinishTick) {
      const int units = truck.maxInventory - truck.inventory;
      const double cost = truck.restockFixedFee + truck.restockPerUnitCost * static_cast<double>(units);
      truck.inventory = truck.maxInventory;
      truck.totalRevenue -= cost;
      truck.restockFinishTick = 0;
      truck.status = TruckStatus::Idle;

      r.restocked = true;
      r.unitsRestocked = units;
      r.restockCost = cost;
    }
    break;
  }

  return r;
}

} // namespace fleetfeast
