#pragma once

#include "atlas/TileRecord.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>

namespace atlas {

// Backing memory for an N x N grid of packed records.
//
// Cells are addressed (y * N + x) and each occupies kTileRecordWords 32-bit words.
// Every word is a relaxed atomic: the single writer may update a record while
// readers on other threads look at it, and a reader can observe a mix of old and
// new words for that one record. That staleness is tolerated; it is corrected by
// the next request that carries the newer store version.
class TileRegion {
public:
  // All cells start unowned.
  explicit TileRegion(int gridSize);

  TileRegion(const TileRegion&) = delete;
  TileRegion& operator=(const TileRegion&) = delete;

  int size() const { return m_size; }
  std::size_t cellCount() const { return m_cells; }

  bool inBounds(int x, int y) const { return x >= 0 && y >= 0 && x < m_size && y < m_size; }
  std::size_t cellIndex(int x, int y) const
  {
    return static_cast<std::size_t>(y) * static_cast<std::size_t>(m_size) + static_cast<std::size_t>(x);
  }

  std::uint32_t word(std::size_t cell, std::size_t k) const
  {
    return m_words[cell * kTileRecordWords + k].load(std::memory_order_relaxed);
  }

  TileRecord load(std::size_t cell) const;

  // Writer side only.
  void store(std::size_t cell, const TileRecord& r);

private:
  int m_size = 0;
  std::size_t m_cells = 0;
  std::unique_ptr<std::atomic<std::uint32_t>[]> m_words;
};

// Non-owning, allocation-free view of one cell inside a region.
class TileSlot {
public:
  TileSlot(const TileRegion& region, std::size_t cell) : m_region(&region), m_cell(cell) {}

  std::uint16_t factionIndex() const { return WordsFactionIndex(w(0)); }
  std::uint32_t color() const { return WordsColor(w(0), w(1)); }
  std::uint32_t paintedBy() const { return WordsPaintedBy(w(1), w(2)); }
  std::uint8_t overpaint() const { return WordsOverpaint(w(2)); }
  std::uint8_t flags() const { return WordsFlags(w(2)); }
  bool owned() const { return factionIndex() != kNoFaction; }
  bool isCore() const { return (flags() & kTileFlagCore) != 0; }

  TileRecord record() const { return m_region->load(m_cell); }

private:
  std::uint32_t w(std::size_t k) const { return m_region->word(m_cell, k); }

  const TileRegion* m_region = nullptr;
  std::size_t m_cell = 0;
};

// Read-only handle onto the store.
//
// A reader pins the region that was current when it was created; a later
// fullReplace publishes a new region without disturbing readers that still hold
// the old one. Tile writes that happen after creation are visible (the region is
// shared, not copied). `version()` is the store version observed at creation and is
// what render and analysis results get tagged with.
class TileReader {
public:
  TileReader() = default;
  TileReader(std::shared_ptr<const TileRegion> region, std::uint64_t version)
      : m_region(std::move(region)), m_version(version)
  {}

  bool valid() const { return static_cast<bool>(m_region); }
  int size() const { return m_region ? m_region->size() : 0; }
  std::uint64_t version() const { return m_version; }

  bool inBounds(int x, int y) const { return m_region && m_region->inBounds(x, y); }

  // Caller guarantees inBounds(x, y).
  TileSlot slot(int x, int y) const { return TileSlot(*m_region, m_region->cellIndex(x, y)); }

  // kNoFaction outside the grid.
  std::uint16_t factionIndexAt(int x, int y) const
  {
    if (!inBounds(x, y)) return kNoFaction;
    return WordsFactionIndex(m_region->word(m_region->cellIndex(x, y), 0));
  }

  // std::nullopt means "no tile" (out of range).
  std::optional<TileRecord> read(int x, int y) const;

  const TileRegion* region() const { return m_region.get(); }

private:
  std::shared_ptr<const TileRegion> m_region;
  std::uint64_t m_version = 0;
};

} // namespace atlas
