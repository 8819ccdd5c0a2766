#include "atlas/TileGrid.hpp"

#include <algorithm>

namespace atlas {

TileRegion::TileRegion(int gridSize)
    : m_size(std::max(0, gridSize))
    , m_cells(static_cast<std::size_t>(m_size) * static_cast<std::size_t>(m_size))
    , m_words(new std::atomic<std::uint32_t>[m_cells * kTileRecordWords])
{
  std::uint32_t blank[kTileRecordWords];
  PackTileWords(TileRecord{}, blank);

  for (std::size_t c = 0; c < m_cells; ++c) {
    for (std::size_t k = 0; k < kTileRecordWords; ++k) {
      m_words[c * kTileRecordWords + k].store(blank[k], std::memory_order_relaxed);
    }
  }
}

TileRecord TileRegion::load(std::size_t cell) const
{
  std::uint32_t w[kTileRecordWords];
  for (std::size_t k = 0; k < kTileRecordWords; ++k) w[k] = word(cell, k);
  return UnpackTileWords(w);
}

void TileRegion::store(std::size_t cell, const TileRecord& r)
{
  std::uint32_t w[kTileRecordWords];
  PackTileWords(r, w);
  for (std::size_t k = 0; k < kTileRecordWords; ++k) {
    m_words[cell * kTileRecordWords + k].store(w[k], std::memory_order_relaxed);
  }
}

std::optional<TileRecord> TileReader::read(int x, int y) const
{
  if (!inBounds(x, y)) return std::nullopt;
  return m_region->load(m_region->cellIndex(x, y));
}

} // namespace atlas
