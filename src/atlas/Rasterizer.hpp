#pragma once

#include "atlas/Bitmap.hpp"
#include "atlas/ColorRules.hpp"
#include "atlas/TileGrid.hpp"
#include "atlas/Viewport.hpp"

#include <cstddef>

namespace atlas {

struct RasterStats {
  std::size_t cellsDrawn = 0;
  std::size_t colorBatches = 0;
  std::size_t seamSegments = 0;
};

// Rasterizes the visible cells of rows with (row % partitionCount) == partitionIndex
// into `out`, which is resized to the frame and cleared to transparent first.
//
// Cells are grouped by resolved color and each group is filled in one pass. In seam
// mode, sides of owned cells that face a different faction get a translucent
// 1-pixel line drawn inside the cell's own rectangle, so partitions never touch each
// other's pixels and compositing order does not matter.
//
// partitionCount == 1 rasterizes every row (the single-threaded path).
RasterStats RasterizePartition(const TileReader& reader, const FrameGeometry& geom, const ColorRules& rules,
                               int partitionIndex, int partitionCount, Bitmap& out);

} // namespace atlas
