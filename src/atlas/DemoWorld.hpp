#pragma once

#include "atlas/ColorRules.hpp"
#include "atlas/Random.hpp"
#include "atlas/TileStore.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace atlas {

struct DemoWorldConfig {
  std::uint64_t seed = 1;
  int factions = 12;
  int alliances = 3;
  int players = 40;

  // Initial territory: one blob per faction with a radius in this range (cells).
  int minRadius = 5;
  int maxRadius = 18;
};

// Stand-in rule layer for the viewer, the CLI and benchmarks.
//
// Registers factions, alliances and players, lays out initial territories with a
// few core tiles each, then keeps producing paint batches where factions push into
// neighbouring cells. Deterministic for a given seed.
class DemoWorld {
public:
  explicit DemoWorld(const DemoWorldConfig& cfg);

  // Registers metadata and writes the initial territories in one batch.
  void seed(TileStore& store, MetadataRegistry& meta);

  // Up to `paints` expansion writes based on the current store contents.
  std::vector<TileWrite> step(const TileStore& store, int paints);

  const std::vector<std::string>& factionIds() const { return m_factionIds; }
  const std::vector<std::string>& playerIds() const { return m_playerIds; }

  std::uint32_t clockSeconds() const { return m_clock; }

private:
  DemoWorldConfig m_cfg;
  DemoRandom m_rng;
  std::uint32_t m_clock = 1700000000u;

  std::vector<std::string> m_factionIds;
  std::vector<std::uint32_t> m_factionColors;
  std::vector<std::string> m_playerIds;
};

} // namespace atlas
