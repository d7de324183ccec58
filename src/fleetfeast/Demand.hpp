#pragma once

#include "fleetfeast/World.hpp"

#include <cstdint>

namespace fleetfeast {

struct DemandParams {
  int dayLength = kDefaultDayLength;
  std::uint64_t seed = 1;

  // Relative noise amplitude in [0, 1).
  double noiseAmplitude = 0.10;
};

// Smooth (noise-free) intensity for a minute of day:
//   level = peakMultiplier inside any peak window, else baseMultiplier
//   g     = max over windows of exp(-d^2 / (2 sigma^2)), d = circular distance to the
//           window centre, sigma = max(30, windowLength / 2)
//   signal = maxOrders * (0.5 * level + 0.5 * (base + (peak - base) * g))
double DemandSignal(const Zone& zone, int minuteOfDay, int dayLength);

// Expected orders per minute for the zone at `tick`: DemandSignal scaled by
// (1 + a * u), u a deterministic hash of (seed, zoneIndex, minute of day).
//
// Pure: identical for the same minute on different days and never negative.
double DemandAt(const Zone& zone, int zoneIndex, std::int64_t tick, const DemandParams& params);

// Recompute demand at `tick` for every zone and append it to the histories.
void RecordDemand(WorldState& world, std::int64_t tick, const DemandParams& params);

// Latest recorded demand (0 when the history is empty).
double CurrentDemand(const Zone& zone);

} // namespace fleetfeast
