#include "fleetfeast/Sim.hpp"

#include "fleetfeast/ActionProcessor.hpp"
#include "fleetfeast/ConfigIO.hpp"

#include <utility>

namespace fleetfeast {

bool BuildWorld(const SimConfig& cfg, WorldState& outWorld, std::string& outError)
{
  if (!ValidateSimConfig(cfg, outError)) return false;

  WorldState w;
  w.currentTick = 0;
  w.dayLength = cfg.dayLength;
  w.historyCap = static_cast<std::size_t>(cfg.historyCap);
  w.actionLogCap = static_cast<std::size_t>(cfg.actionLogCap);

  const std::vector<ZoneConfig>& zcfg = cfg.city.zones;
  w.zones.reserve(zcfg.size());
  for (const ZoneConfig& zc : zcfg) {
    Zone z;
    z.id = zc.id;
    z.type = zc.type;
    z.baseMultiplier = zc.baseMultiplier;
    z.peakMultiplier = zc.peakMultiplier;
    z.maxOrders = zc.maxOrders;
    z.peakHours = zc.peakHours;
    z.parkingCapacity = zc.parkingCapacity;

    z.travelCost.assign(zcfg.size(), 0);
    for (std::size_t j = 0; j < zcfg.size(); ++j) {
      const auto it = zc.travelCost.find(zcfg[j].id);
      if (it != zc.travelCost.end()) z.travelCost[j] = it->second;
    }
    w.zones.push_back(std::move(z));
  }

  w.trucks.reserve(cfg.city.trucks.size());
  for (const TruckConfig& tc : cfg.city.trucks) {
    Truck t;
    t.id = tc.id;
    t.status = TruckStatus::Idle;
    t.currentZone = w.findZone(tc.startZone);
    t.restockZone = tc.restockZone.empty() ? t.currentZone : w.findZone(tc.restockZone);
    t.inventory = tc.inventory;
    t.maxInventory = tc.maxInventory;
    t.speedMultiplier = tc.speedMultiplier;
    t.unitPrice = tc.unitPrice;
    t.restockFixedFee = tc.restockFixedFee;
    t.restockPerUnitCost = tc.restockPerUnitCost;
    w.trucks.push_back(std::move(t));
  }

  DemandParams dp;
  dp.dayLength = cfg.dayLength;
  dp.seed = cfg.seed;
  dp.noiseAmplitude = cfg.noiseAmplitude;
  RecordDemand(w, 0, dp);

  outWorld = std::move(w);
  outError.clear();
  return true;
}

Simulator::Simulator(SimConfig cfg)
    : m_cfg(std::move(cfg))
{
}

DemandParams Simulator::demandParams() const
{
  DemandParams p;
  p.dayLength = m_cfg.dayLength;
  p.seed = m_cfg.seed;
  p.noiseAmplitude = m_cfg.noiseAmplitude;
  return p;
}

FleetParams Simulator::fleetParams() const
{
  FleetParams p;
  p.restockTicks = m_cfg.restockTicks;
  return p;
}

TickReport Simulator::step(WorldState& world, const std::vector<PendingAction>& actions) const
{
  const FleetParams fleet = fleetParams();

  TickReport report;
  report.outcomes = ApplyPendingActions(world, actions, fleet);

  const std::int64_t t = world.currentTick + 1;
  report.tick = t;

  RecordDemand(world, t, demandParams());

  std::vector<double> remaining(world.zones.size(), 0.0);
  for (std::size_t i = 0; i < world.zones.size(); ++i) remaining[i] = CurrentDemand(world.zones[i]);

  std::vector<bool> served(world.zones.size(), false);
  for (Truck& truck : world.trucks) {
    const bool wasServing = truck.status == TruckStatus::Serving;
    const TruckStepResult r = StepTruck(world.zones, truck, t, fleet, remaining);

    if (wasServing && truck.currentZone >= 0) served[static_cast<std::size_t>(truck.currentZone)] = true;
    report.sold += r.sold;
    report.revenue += r.revenue;
    if (r.arrived) ++report.arrivals;
    if (r.restocked) {
      ++report.restocksCompleted;
      report.restockCost += r.restockCost;
    }
  }

  for (std::size_t i = 0; i < world.zones.size(); ++i) {
    if (served[i]) report.servedZoneDemand += CurrentDemand(world.zones[i]);
  }

  world.currentTick = t;
  return report;
}

} // namespace fleetfeast
