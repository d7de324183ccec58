#include "fleetfeast/Snapshot.hpp"

#include <sstream>
#include <utility>

namespace fleetfeast {

namespace {

const std::string& ZoneId(const WorldState& world, int zi)
{
  static const std::string kNone;
  if (zi < 0 || zi >= static_cast<int>(world.zones.size())) return kNone;
  return world.zones[static_cast<std::size_t>(zi)].id;
}

void WriteZone(JsonWriter& w, const WorldState& world, std::size_t i)
{
  const Zone& z = world.zones[i];
  w.beginObject();
  w.key("id");
  w.stringValue(z.id);
  w.key("type");
  w.stringValue(z.type);

  w.key("demand");
  w.beginArray();
  for (double d : z.demandHistory) w.numberValue(d);
  w.endArray();

  w.key("max_orders");
  w.numberValue(z.maxOrders);
  w.key("base_multiplier");
  w.numberValue(z.baseMultiplier);
  w.key("peak_multiplier");
  w.numberValue(z.peakMultiplier);
  w.key("num_of_parking_spots");
  w.intValue(z.parkingCapacity);
  w.key("occupancy");
  w.intValue(world.occupancy(static_cast<int>(i)));

  w.key("peak_hours");
  w.beginArray();
  for (const PeakWindow& pw : z.peakHours) {
    w.beginArray();
    w.intValue(pw.startMinute);
    w.intValue(pw.endMinute);
    w.endArray();
  }
  w.endArray();
  w.endObject();
}

void WriteTruck(JsonWriter& w, const WorldState& world, const Truck& t)
{
  w.beginObject();
  w.key("id");
  w.stringValue(t.id);
  w.key("status");
  w.stringValue(ToString(t.status));
  w.key("current_zone");
  w.stringValue(ZoneId(world, t.currentZone));
  if (t.status == TruckStatus::Moving) {
    w.key("destination_zone");
    w.stringValue(ZoneId(world, t.destinationZone));
    w.key("arrival_time");
    w.intValue(WorldState::MinuteOfDay(t.arrivalTick, world.dayLength));
    w.key("arrival_tick");
    w.intValue(t.arrivalTick);
    w.key("returning_to_restock");
    w.boolValue(t.restockBound);
  }
  if (t.status == TruckStatus::Restocking) {
    w.key("restocking_finish_time");
    w.intValue(WorldState::MinuteOfDay(t.restockFinishTick, world.dayLength));
  }
  w.key("inventory");
  w.intValue(t.inventory);
  w.key("max_inventory");
  w.intValue(t.maxInventory);
  w.key("speed_multiplier");
  w.numberValue(t.speedMultiplier);
  w.key("total_revenue");
  w.numberValue(t.totalRevenue);
  w.key("restock_zone");
  w.stringValue(ZoneId(world, t.restockZone));
  w.key("last_sold");
  w.intValue(t.lastSold);
  w.endObject();
}

} // namespace

void WriteOutcomeJson(JsonWriter& w, const ActionOutcome& o)
{
  w.beginObject();
  w.key("tick");
  w.intValue(o.tick);
  w.key("type");
  w.stringValue(o.kind);
  if (!o.truckId.empty()) {
    w.key("truck_id");
    w.stringValue(o.truckId);
  }
  if (!o.target.empty()) {
    w.key("target");
    w.stringValue(o.target);
  }
  w.key("accepted");
  w.boolValue(o.accepted);
  w.key("reason");
  w.stringValue(o.reason);
  if (!o.reasoning.empty()) {
    w.key("reasoning");
    w.stringValue(o.reasoning);
  }
  w.endObject();
}

void WriteWorldJson(JsonWriter& w, const WorldState& world)
{
  w.beginObject();
  w.key("current_time");
  w.intValue(world.minuteOfDay());
  w.key("day");
  w.intValue(world.day());
  w.key("tick");
  w.intValue(world.currentTick);
  w.key("day_length");
  w.intValue(world.dayLength);

  w.key("zones");
  w.beginArray();
  for (std::size_t i = 0; i < world.zones.size(); ++i) WriteZone(w, world, i);
  w.endArray();

  w.key("trucks");
  w.beginArray();
  for (const Truck& t : world.trucks) WriteTruck(w, world, t);
  w.endArray();

  w.key("recent_actions");
  w.beginArray();
  for (const ActionOutcome& o : world.recentActions) WriteOutcomeJson(w, o);
  w.endArray();
  w.endObject();
}

std::string WorldToJson(const WorldState& world, bool pretty)
{
  std::ostringstream oss;
  JsonWriteOptions opt;
  opt.pretty = pretty;
  JsonWriter w(oss, opt);
  WriteWorldJson(w, world);
  return oss.str();
}

SnapshotPtr MakeSnapshot(const WorldState& world)
{
  auto s = std::make_shared<WorldSnapshot>();
  s->world = world;
  s->tick = world.currentTick;
  s->minuteOfDay = world.minuteOfDay();
  s->day = world.day();
  s->json = WorldToJson(world);
  return s;
}

} // namespace fleetfeast
