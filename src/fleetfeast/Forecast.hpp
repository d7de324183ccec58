#pragma once

#include "fleetfeast/Demand.hpp"
#include "fleetfeast/Json.hpp"
#include "fleetfeast/World.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace fleetfeast {

constexpr int kMaxForecastHours = 168;

struct HourlyForecast {
  int hour = 0;        // 1-based offset from now
  int startMinute = 0; // minute of day the hour starts at
  double meanDemand = 0.0;
};

struct ZoneForecast {
  std::string zoneId;
  std::int64_t fromTick = 0;
  std::vector<HourlyForecast> hours;
};

// Hourly mean demand for the next `hoursAhead` hours (1..kMaxForecastHours), starting
// at the tick after world.currentTick. Demand is deterministic, so this is exact.
bool ForecastZone(const WorldState& world, const DemandParams& params, const std::string& zoneId, int hoursAhead,
                  ZoneForecast& out, std::string& outError);

struct ZoneRanking {
  std::string zoneId;
  double meanDemand = 0.0;
  double currentDemand = 0.0;
  int occupancy = 0;
  int parkingCapacity = 0;
};

// Zones sorted by mean projected demand over the next `horizonMinutes`, best first.
// Ties keep zone order.
std::vector<ZoneRanking> RankZones(const WorldState& world, const DemandParams& params, int horizonMinutes);

void WriteZoneForecastJson(JsonWriter& w, const ZoneForecast& f);
std::string ZoneForecastToJson(const ZoneForecast& f);

void WriteZoneRankingJson(JsonWriter& w, const std::vector<ZoneRanking>& ranking);

} // namespace fleetfeast
