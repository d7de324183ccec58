#pragma once

#include "fleetfeast/Json.hpp"
#include "fleetfeast/World.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace fleetfeast {

// Immutable copy of the world taken at publish time.
//
// Readers on any thread share one instance through shared_ptr<const WorldSnapshot>;
// the JSON document is rendered once when the snapshot is made.
struct WorldSnapshot {
  WorldState world;

  std::int64_t tick = 0;
  int minuteOfDay = 0;
  std::int64_t day = 0;

  std::string json;
};

using SnapshotPtr = std::shared_ptr<const WorldSnapshot>;

SnapshotPtr MakeSnapshot(const WorldState& world);

// Snapshot document:
//   {"current_time", "day", "tick", "day_length",
//    "zones": [{"id", "type", "demand": [...], "max_orders", "num_of_parking_spots",
//               "peak_hours": [[start, end], ...], ...}],
//    "trucks": [{"id", "status", "current_zone", "destination_zone"?, "inventory",
//                "max_inventory", "total_revenue", "arrival_time"?, ...}],
//    "recent_actions": [...]}
void WriteWorldJson(JsonWriter& w, const WorldState& world);
std::string WorldToJson(const WorldState& world, bool pretty = false);

void WriteOutcomeJson(JsonWriter& w, const ActionOutcome& o);

} // namespace fleetfeast
