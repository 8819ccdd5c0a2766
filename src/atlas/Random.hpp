#pragma once

#include <chrono>
#include <cstdint>

namespace atlas {

// Seeded SplitMix64 stream for the demo rule layer: one seed, one world.
class DemoRandom {
public:
  explicit DemoRandom(std::uint64_t seed) : m_state(seed) {}

  std::uint64_t next()
  {
    std::uint64_t z = (m_state += 0x9E3779B97F4A7C15ULL);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
  }

  // [0, n). Lemire's multiply-shift; the bias is below 2^-32 for the sizes the demo uses.
  std::uint32_t below(std::uint32_t n)
  {
    if (n <= 1u) return 0u;
    return static_cast<std::uint32_t>(((next() >> 32) * n) >> 32);
  }

  // [lo, hi]
  int between(int lo, int hi)
  {
    if (hi <= lo) return lo;
    return lo + static_cast<int>(below(static_cast<std::uint32_t>(hi - lo) + 1u));
  }

  // [0, 1) with 24 bits of precision.
  float unit() { return static_cast<float>(next() >> 40) * (1.0f / 16777216.0f); }

  bool chance(float p) { return unit() < p; }

private:
  std::uint64_t m_state;
};

// Seed for runs that did not ask for a specific world.
inline std::uint64_t TimeSeed()
{
  const auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
  return DemoRandom(static_cast<std::uint64_t>(ticks)).next();
}

} // namespace atlas
