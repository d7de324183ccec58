#include "fleetfeast/Demand.hpp"

#include "fleetfeast/Random.hpp"

#include <algorithm>
#include <cmath>

namespace fleetfeast {

namespace {

bool InsideWindow(const PeakWindow& w, int minute)
{
  return minute >= w.startMinute && minute <= w.endMinute;
}

double PeakShape(const PeakWindow& w, int minute, int dayLength)
{
  const double centre = 0.5 * static_cast<double>(w.startMinute + w.endMinute);
  double d = std::fabs(static_cast<double>(minute) - centre);
  // Circular: a late-night window still lifts the early morning of the next day.
  d = std::min(d, static_cast<double>(dayLength) - d);

  const double len = static_cast<double>(w.endMinute - w.startMinute);
  const double sigma = std::max(30.0, 0.5 * len);
  return std::exp(-(d * d) / (2.0 * sigma * sigma));
}

} // namespace

double DemandSignal(const Zone& zone, int minuteOfDay, int dayLength)
{
  bool inPeak = false;
  double g = 0.0;
  for (const PeakWindow& w : zone.peakHours) {
    if (InsideWindow(w, minuteOfDay)) inPeak = true;
    g = std::max(g, PeakShape(w, minuteOfDay, dayLength));
  }

  const double level = inPeak ? zone.peakMultiplier : zone.baseMultiplier;
  const double smooth = zone.baseMultiplier + (zone.peakMultiplier - zone.baseMultiplier) * g;
  return zone.maxOrders * (0.5 * level + 0.5 * smooth);
}

double DemandAt(const Zone& zone, int zoneIndex, std::int64_t tick, const DemandParams& params)
{
  const int minute = WorldState::MinuteOfDay(tick, params.dayLength);
  const double signal = DemandSignal(zone, minute, params.dayLength);

  const double u = HashNoiseSigned(params.seed, static_cast<std::uint32_t>(zoneIndex), static_cast<std::uint32_t>(minute));
  const double demand = signal * (1.0 + params.noiseAmplitude * u);
  return std::max(0.0, demand);
}

void RecordDemand(WorldState& world, std::int64_t tick, const DemandParams& params)
{
  for (std::size_t i = 0; i < world.zones.size(); ++i) {
    const int zi = static_cast<int>(i);
    world.pushDemand(zi, DemandAt(world.zones[i], zi, tick, params));
  }
}

double CurrentDemand(const Zone& zone)
{
  return zone.demandHistory.empty() ? 0.0 : zone.demandHistory.back();
}

} // namespace fleetfeast
