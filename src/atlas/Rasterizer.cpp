#include "atlas/Rasterizer.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace atlas {

RasterStats RasterizePartition(const TileReader& reader, const FrameGeometry& geom, const ColorRules& rules,
                               int partitionIndex, int partitionCount, Bitmap& out)
{
  RasterStats stats;

  out.resize(geom.width, geom.height);
  out.clear(Rgba8{0, 0, 0, 0});

  if (!reader.valid() || partitionCount <= 0 || partitionIndex < 0 || partitionIndex >= partitionCount) {
    return stats;
  }

  const CellRange range = VisibleCellRange(geom, reader.size());
  if (range.empty()) return stats;

  // Keys are RGBA packed into 32 bits so the map can stay flat.
  std::unordered_map<std::uint32_t, std::vector<IRect>> batches;
  std::vector<IRect> seams;
  const bool showSeams = rules.theme().showSeams;

  // First row in this partition at or after y0.
  int y = range.y0 + ((partitionIndex - (range.y0 % partitionCount)) + partitionCount) % partitionCount;

  for (; y <= range.y1; y += partitionCount) {
    for (int x = range.x0; x <= range.x1; ++x) {
      const IRect r = CellScreenRect(geom, x, y);
      if (r.empty()) continue;

      const TileSlot slot = reader.slot(x, y);
      const Rgba8 c = rules.resolve(slot);
      const std::uint32_t key = (static_cast<std::uint32_t>(c.r) << 24) | (static_cast<std::uint32_t>(c.g) << 16) |
                                (static_cast<std::uint32_t>(c.b) << 8) | c.a;
      batches[key].push_back(r);
      ++stats.cellsDrawn;

      if (!showSeams) continue;
      const std::uint16_t fi = slot.factionIndex();
      if (fi == kNoFaction) continue;

      // Neighbours outside the grid are not seams.
      auto differs = [&](int nx, int ny) {
        return reader.inBounds(nx, ny) && reader.factionIndexAt(nx, ny) != fi;
      };
      if (differs(x, y - 1)) seams.push_back(IRect{r.x, r.y, r.w, 1});
      if (differs(x, y + 1)) seams.push_back(IRect{r.x, r.y + r.h - 1, r.w, 1});
      if (differs(x - 1, y)) seams.push_back(IRect{r.x, r.y, 1, r.h});
      if (differs(x + 1, y)) seams.push_back(IRect{r.x + r.w - 1, r.y, 1, r.h});
    }
  }

  // Deterministic fill order regardless of hash layout.
  std::vector<std::uint32_t> keys;
  keys.reserve(batches.size());
  for (const auto& kv : batches) keys.push_back(kv.first);
  std::sort(keys.begin(), keys.end());

  for (std::uint32_t key : keys) {
    const Rgba8 c{static_cast<std::uint8_t>(key >> 24), static_cast<std::uint8_t>((key >> 16) & 0xFFu),
                  static_cast<std::uint8_t>((key >> 8) & 0xFFu), static_cast<std::uint8_t>(key & 0xFFu)};
    for (const IRect& r : batches[key]) out.fillRect(r, c);
  }
  stats.colorBatches = keys.size();

  for (const IRect& s : seams) out.blendRect(s, kSeamColor);
  stats.seamSegments = seams.size();

  return stats;
}

} // namespace atlas
