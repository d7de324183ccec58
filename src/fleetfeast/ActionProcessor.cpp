#include "fleetfeast/ActionProcessor.hpp"

#include "fleetfeast/Log.hpp"

#include <optional>
#include <sstream>
#include <utility>

namespace fleetfeast {

namespace {

struct Batch {
  const WorldState& world;
  const std::vector<Truck>& start;
  std::vector<std::optional<Truck>>& next;
  const FleetParams& params;
  std::int64_t tick;
};

ActionOutcome MakeOutcome(std::int64_t tick, const PendingAction& a)
{
  ActionOutcome o;
  o.tick = tick;
  o.kind = ActionKind(a);
  o.reasoning = ActionReasoning(a);
  return o;
}

void Reject(ActionOutcome& o, std::string reason)
{
  o.accepted = false;
  o.reason = std::move(reason);
}

void Accept(ActionOutcome& o, std::string note)
{
  o.accepted = true;
  o.reason = std::move(note);
}

void ApplyDispatch(Batch& b, const DispatchAction& d, ActionOutcome& o)
{
  o.truckId = d.truckId;
  o.target = d.targetZone;

  const int ti = b.world.findTruck(d.truckId);
  if (ti < 0) return Reject(o, "unknown truck");

  Truck t = b.start[static_cast<std::size_t>(ti)];

  // No target: serve at the zone the truck stands in.
  if (d.targetZone.empty()) {
    if (t.status == TruckStatus::Moving) return Reject(o, "truck is moving");
    if (t.currentZone < 0) return Reject(o, "unknown zone");
    o.target = b.world.zones[static_cast<std::size_t>(t.currentZone)].id;
  }

  const int zi = d.targetZone.empty() ? t.currentZone : b.world.findZone(d.targetZone);
  if (zi < 0) return Reject(o, "unknown zone");

  switch (t.status) {
  case TruckStatus::Restocking:
    return Reject(o, "invalid state for dispatch");

  case TruckStatus::Idle:
  case TruckStatus::Serving:
    if (zi == t.currentZone) {
      t.status = TruckStatus::Serving;
      Accept(o, "serving at current zone");
    } else {
      StartMove(b.world.zones, t, zi, b.tick, false);
      Accept(o, "arrives at tick " + std::to_string(t.arrivalTick));
    }
    break;

  case TruckStatus::Moving:
    if (zi == t.destinationZone && !t.restockBound) {
      Accept(o, "already en route");
    } else if (zi == t.destinationZone) {
      Reroute(b.world.zones, t, zi, b.tick);
      Accept(o, "restock run cancelled, arrives at tick " + std::to_string(t.arrivalTick));
    } else {
      Reroute(b.world.zones, t, zi, b.tick);
      Accept(o, "rerouted, arrives at tick " + std::to_string(t.arrivalTick));
    }
    break;
  }

  b.next[static_cast<std::size_t>(ti)] = std::move(t);
}

void ApplyRestock(Batch& b, const RestockAction& r, ActionOutcome& o)
{
  o.truckId = r.truckId;

  const int ti = b.world.findTruck(r.truckId);
  if (ti < 0) return Reject(o, "unknown truck");

  Truck t = b.start[static_cast<std::size_t>(ti)];
  o.target = (t.currentZone >= 0) ? b.world.zones[static_cast<std::size_t>(t.currentZone)].id : std::string();

  if (t.status != TruckStatus::Idle) return Reject(o, "invalid state for restock");
  if (t.inventory >= t.maxInventory) return Reject(o, "inventory already full");

  const Zone& zone = b.world.zones[static_cast<std::size_t>(t.currentZone)];
  int occupied = 0;
  for (const Truck& other : b.start) {
    if (other.status != TruckStatus::Moving && other.currentZone == t.currentZone) ++occupied;
  }
  if (occupied > zone.parkingCapacity) return Reject(o, "no parking capacity");

  StartRestocking(t, b.tick, b.params);
  Accept(o, "restocking until tick " + std::to_string(t.restockFinishTick));
  b.next[static_cast<std::size_t>(ti)] = std::move(t);
}

// A hold naming a truck undoes whatever an earlier action in the same batch set for it.
void ApplyHold(Batch& b, const HoldAction& h, ActionOutcome& o)
{
  o.truckId = h.truckId;
  if (h.truckId.empty()) return Accept(o, "");

  const int ti = b.world.findTruck(h.truckId);
  if (ti >= 0) b.next[static_cast<std::size_t>(ti)].reset();
  Accept(o, ti >= 0 ? "" : "unknown truck");
}

void LogOutcome(const ActionOutcome& o)
{
  std::ostringstream oss;
  oss << "t=" << o.tick << " " << o.kind;
  if (!o.truckId.empty()) oss << " truck=" << o.truckId;
  if (!o.target.empty()) oss << " target=" << o.target;
  oss << (o.accepted ? " accepted" : " rejected");
  if (!o.reason.empty()) oss << ": " << o.reason;

  if (o.accepted) {
    LogInfo("actions", oss.str());
  } else {
    LogWarn("actions", oss.str());
  }
}

} // namespace

std::vector<ActionOutcome> ApplyPendingActions(WorldState& world, const std::vector<PendingAction>& actions,
                                               const FleetParams& params)
{
  std::vector<ActionOutcome> outcomes;
  if (actions.empty()) return outcomes;

  const std::vector<Truck> start = world.trucks;
  std::vector<std::optional<Truck>> next(start.size());
  Batch batch{world, start, next, params, world.currentTick};

  outcomes.reserve(actions.size());
  for (const PendingAction& a : actions) {
    ActionOutcome o = MakeOutcome(world.currentTick, a);

    if (const auto* d = std::get_if<DispatchAction>(&a)) {
      ApplyDispatch(batch, *d, o);
    } else if (const auto* r = std::get_if<RestockAction>(&a)) {
      ApplyRestock(batch, *r, o);
    } else if (const auto* f = std::get_if<ForecastAction>(&a)) {
      o.target = f->zoneId;
      Reject(o, "forecast is not queueable");
    } else if (const auto* h = std::get_if<HoldAction>(&a)) {
      ApplyHold(batch, *h, o);
    }

    LogOutcome(o);
    outcomes.push_back(std::move(o));
  }

  for (std::size_t i = 0; i < next.size(); ++i) {
    if (next[i]) world.trucks[i] = std::move(*next[i]);
  }
  for (const ActionOutcome& o : outcomes) world.recordOutcome(o);
  return outcomes;
}

} // namespace fleetfeast
