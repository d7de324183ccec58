#pragma once

#include <cstdint>

namespace fleetfeast {

// Stafford "mix13" finalizer (the SplitMix64 output stage).
inline constexpr std::uint64_t Mix64(std::uint64_t z)
{
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

// Top 53 bits as a double in [0, 1).
inline constexpr double UnitFromBits(std::uint64_t v)
{
  return static_cast<double>(v >> 11) * (1.0 / 9007199254740992.0);
}

// Deterministic (seed, zone, minute) -> [-1, 1) noise sample.
//
// Keyed by minute-of-day rather than absolute tick so the same minute of different days
// produces the same value for a fixed seed. Stateless, so any thread may sample it.
inline double HashNoiseSigned(std::uint64_t seed, std::uint32_t zoneIndex, std::uint32_t minuteOfDay)
{
  std::uint64_t key = static_cast<std::uint64_t>(zoneIndex) | (static_cast<std::uint64_t>(minuteOfDay) << 32);
  key ^= seed * 0xD6E8FEB86659FD93ULL;
  return UnitFromBits(Mix64(key)) * 2.0 - 1.0;
}

// Sequential SplitMix64 stream. Used where a run needs a reproducible sequence of draws
// (randomized action scripts in tests and replays), not for demand noise.
class RNG {
public:
  explicit RNG(std::uint64_t seed)
      : m_state(seed)
  {
  }

  std::uint64_t nextU64()
  {
    m_state += 0x9E3779B97F4A7C15ULL;
    return Mix64(m_state);
  }

  // Uniform in [0, n); 0 when n <= 1. Rejection sampled against modulo bias.
  std::uint32_t rangeU32(std::uint32_t n)
  {
    if (n <= 1u) return 0u;
    const std::uint32_t floor = static_cast<std::uint32_t>((std::uint64_t{1} << 32) % n);
    for (;;) {
      const auto r = static_cast<std::uint32_t>(nextU64() >> 32);
      if (r >= floor) return r % n;
    }
  }

  double nextF01() { return UnitFromBits(nextU64()); }

  bool chance(double p) { return nextF01() < p; }

private:
  std::uint64_t m_state = 0;
};

} // namespace fleetfeast
