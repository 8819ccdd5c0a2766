#pragma once

#include "atlas/Types.hpp"

#include <algorithm>
#include <cmath>
#include <optional>

namespace atlas {

// Camera over the grid. (centerX, centerY) is the grid coordinate shown at the
// middle of the output; zoom scales the base tile pixel size.
struct Viewport {
  float centerX = static_cast<float>(kDefaultGridSize) * 0.5f;
  float centerY = static_cast<float>(kDefaultGridSize) * 0.5f;
  float zoom = 1.0f;
};

struct ViewportLimits {
  float baseTilePx = 16.0f;
  float minZoom = 0.1f;
  float maxZoom = 8.0f;
};

// Everything needed to map cells to pixels for one frame.
struct FrameGeometry {
  Viewport view;
  int width = 0;
  int height = 0;
  float baseTilePx = 16.0f;
};

struct ScreenPos {
  double x = 0.0;
  double y = 0.0;
};

inline float ClampZoom(float zoom, const ViewportLimits& lim)
{
  if (!std::isfinite(zoom)) return lim.minZoom;
  return std::clamp(zoom, lim.minZoom, lim.maxZoom);
}

inline double TileSizePx(const FrameGeometry& g)
{
  return static_cast<double>(g.baseTilePx) * static_cast<double>(g.view.zoom);
}

// Grid lines are drawn (cells shrink by one pixel) once tiles get large enough.
inline bool ShowGridLines(const FrameGeometry& g) { return g.view.zoom > 2.0f; }

// Screen position of grid coordinate (gx, gy). Integer inputs give cell corners.
inline ScreenPos GridToScreen(const FrameGeometry& g, double gx, double gy)
{
  const double ts = TileSizePx(g);
  return ScreenPos{g.width * 0.5 + (gx - g.view.centerX) * ts, g.height * 0.5 + (gy - g.view.centerY) * ts};
}

// Inverse of GridToScreen, floored to the containing cell. May be outside the grid.
Point ScreenToGrid(const FrameGeometry& g, double sx, double sy);

// Same, but std::nullopt when the pixel is not over a cell of an N x N grid.
std::optional<Point> ScreenToCell(const FrameGeometry& g, double sx, double sy, int gridSize);

// Pixel rectangle for cell (x, y).
//
// Both corners are floored independently (this cell's start and the next cell's
// start), so neighbouring rectangles meet exactly with no gap or overlap at any
// fractional zoom. In grid-line mode the cell is tileSize - 1 pixels wide instead.
IRect CellScreenRect(const FrameGeometry& g, int x, int y);

// Cells that can touch the output, clamped to the grid. Includes a one-cell margin.
CellRange VisibleCellRange(const FrameGeometry& g, int gridSize);

// Zoom to `newZoom` keeping the grid point under (sx, sy) fixed on screen.
Viewport ZoomAround(const FrameGeometry& g, const ViewportLimits& lim, float newZoom, double sx, double sy);

// Move the camera so content follows a drag of (dx, dy) pixels.
Viewport PanByPixels(const FrameGeometry& g, double dx, double dy);

} // namespace atlas
