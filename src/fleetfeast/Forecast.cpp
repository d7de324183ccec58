#include "fleetfeast/Forecast.hpp"

#include <algorithm>
#include <sstream>

namespace fleetfeast {

namespace {

double MeanDemand(const Zone& zone, int zoneIndex, std::int64_t firstTick, int minutes, const DemandParams& params)
{
  if (minutes <= 0) return 0.0;
  double sum = 0.0;
  for (int m = 0; m < minutes; ++m) sum += DemandAt(zone, zoneIndex, firstTick + m, params);
  return sum / static_cast<double>(minutes);
}

} // namespace

bool ForecastZone(const WorldState& world, const DemandParams& params, const std::string& zoneId, int hoursAhead,
                  ZoneForecast& out, std::string& outError)
{
  const int zi = world.findZone(zoneId);
  if (zi < 0) {
    outError = "unknown zone '" + zoneId + "'";
    return false;
  }
  if (hoursAhead < 1 || hoursAhead > kMaxForecastHours) {
    outError = "hours_ahead must be in 1.." + std::to_string(kMaxForecastHours);
    return false;
  }

  const Zone& zone = world.zones[static_cast<std::size_t>(zi)];
  out = ZoneForecast{};
  out.zoneId = zoneId;
  out.fromTick = world.currentTick + 1;

  for (int h = 0; h < hoursAhead; ++h) {
    const std::int64_t first = out.fromTick + static_cast<std::int64_t>(h) * 60;
    HourlyForecast hf;
    hf.hour = h + 1;
    hf.startMinute = WorldState::MinuteOfDay(first, params.dayLength);
    hf.meanDemand = MeanDemand(zone, zi, first, 60, params);
    out.hours.push_back(hf);
  }

  outError.clear();
  return true;
}

std::vector<ZoneRanking> RankZones(const WorldState& world, const DemandParams& params, int horizonMinutes)
{
  std::vector<ZoneRanking> out;
  out.reserve(world.zones.size());

  const int minutes = std::max(1, horizonMinutes);
  for (std::size_t i = 0; i < world.zones.size(); ++i) {
    const Zone& z = world.zones[i];
    ZoneRanking r;
    r.zoneId = z.id;
    r.meanDemand = MeanDemand(z, static_cast<int>(i), world.currentTick + 1, minutes, params);
    r.currentDemand = CurrentDemand(z);
    r.occupancy = world.occupancy(static_cast<int>(i));
    r.parkingCapacity = z.parkingCapacity;
    out.push_back(r);
  }

  std::stable_sort(out.begin(), out.end(),
                   [](const ZoneRanking& a, const ZoneRanking& b) { return a.meanDemand > b.meanDemand; });
  return out;
}

void WriteZoneForecastJson(JsonWriter& w, const ZoneForecast& f)
{
  w.beginObject();
  w.key("zone_id");
  w.stringValue(f.zoneId);
  w.key("from_tick");
  w.intValue(f.fromTick);
  w.key("hourly");
  w.beginArray();
  for (const HourlyForecast& h : f.hours) {
    w.beginObject();
    w.key("hour");
    w.intValue(h.hour);
    w.key("start_minute");
    w.intValue(h.startMinute);
    w.key("mean_demand");
    w.numberValue(h.meanDemand);
    w.endObject();
  }
  w.endArray();
  w.endObject();
}

std::string ZoneForecastToJson(const ZoneForecast& f)
{
  std::ostringstream oss;
  JsonWriter w(oss);
  WriteZoneForecastJson(w, f);
  return oss.str();
}

void WriteZoneRankingJson(JsonWriter& w, const std::vector<ZoneRanking>& ranking)
{
  w.beginArray();
  for (const ZoneRanking& r : ranking) {
    w.beginObject();
    w.key("zone_id");
    w.stringValue(r.zoneId);
    w.key("mean_demand");
    w.numberValue(r.meanDemand);
    w.key("current_demand");
    w.numberValue(r.currentDemand);
    w.key("occupancy");
    w.intValue(r.occupancy);
    w.key("num_of_parking_spots");
    w.intValue(r.parkingCapacity);
    w.endObject();
  }
  w.endArray();
}

} // namespace fleetfeast
