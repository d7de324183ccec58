#include "fleetfeast/World.hpp"

#include <utility>

namespace fleetfeast {

const char* ToString(TruckStatus s)
{
  switch (s) {
  case TruckStatus::Idle: return "IDLE";
  case TruckStatus::Moving: return "MOVING";
  case TruckStatus::Serving: return "SERVING";
  case TruckStatus::Restocking: return "RESTOCKING";
  default: return "UNKNOWN";
  }
}

bool ParseTruckStatus(const std::string& s, TruckStatus& out)
{
  if (s == "IDLE") {
    out = TruckStatus::Idle;
  } else if (s == "MOVING") {
    out = TruckStatus::Moving;
  } else if (s == "SERVING") {
    out = TruckStatus::Serving;
  } else if (s == "RESTOCKING") {
    out = TruckStatus::Restocking;
  } else {
    return false;
  }
  return true;
}

int WorldState::findZone(const std::string& id) const
{
  for (std::size_t i = 0; i < zones.size(); ++i) {
    if (zones[i].id == id) return static_cast<int>(i);
  }
  return -1;
}

int WorldState::findTruck(const std::string& id) const
{
  for (std::size_t i = 0; i < trucks.size(); ++i) {
    if (trucks[i].id == id) return static_cast<int>(i);
  }
  return -1;
}

int WorldState::occupancy(int zoneIndex) const
{
  int n = 0;
  for (const Truck& t : trucks) {
    if (t.status != TruckStatus::Moving && t.currentZone == zoneIndex) ++n;
  }
  return n;
}

void WorldState::pushDemand(int zoneIndex, double demand)
{
  if (zoneIndex < 0 || zoneIndex >= static_cast<int>(zones.size())) return;
  std::deque<double>& h = zones[static_cast<std::size_t>(zoneIndex)].demandHistory;
  h.push_back(demand);
  while (h.size() > historyCap) h.pop_front();
}

void WorldState::recordOutcome(ActionOutcome outcome)
{
  recentActions.push_back(std::move(outcome));
  while (recentActions.size() > actionLogCap) recentActions.pop_front();
}

} // namespace fleetfeast
