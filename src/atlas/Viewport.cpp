#include "atlas/Viewport.hpp"

namespace atlas {

Point ScreenToGrid(const FrameGeometry& g, double sx, double sy)
{
  const double ts = TileSizePx(g);
  if (!(ts > 0.0)) return Point{static_cast<int>(std::floor(g.view.centerX)), static_cast<int>(std::floor(g.view.centerY))};

  const double gx = g.view.centerX + (sx - g.width * 0.5) / ts;
  const double gy = g.view.centerY + (sy - g.height * 0.5) / ts;
  return Point{static_cast<int>(std::floor(gx)), static_cast<int>(std::floor(gy))};
}

std::optional<Point> ScreenToCell(const FrameGeometry& g, double sx, double sy, int gridSize)
{
  const Point p = ScreenToGrid(g, sx, sy);
  if (p.x < 0 || p.y < 0 || p.x >= gridSize || p.y >= gridSize) return std::nullopt;
  return p;
}

IRect CellScreenRect(const FrameGeometry& g, int x, int y)
{
  const ScreenPos a = GridToScreen(g, x, y);
  const int sx = static_cast<int>(std::floor(a.x));
  const int sy = static_cast<int>(std::floor(a.y));

  if (ShowGridLines(g)) {
    const int s = std::max(1, static_cast<int>(std::floor(TileSizePx(g) - 1.0)));
    return IRect{sx, sy, s, s};
  }

  const ScreenPos b = GridToScreen(g, x + 1, y + 1);
  const int ex = static_cast<int>(std::floor(b.x));
  const int ey = static_cast<int>(std::floor(b.y));
  return IRect{sx, sy, ex - sx, ey - sy};
}

CellRange VisibleCellRange(const FrameGeometry& g, int gridSize)
{
  CellRange r;
  const double ts = TileSizePx(g);
  if (!(ts > 0.0) || g.width <= 0 || g.height <= 0 || gridSize <= 0) return r;

  const double tilesX = std::ceil(g.width / ts) + 2.0;
  const double tilesY = std::ceil(g.height / ts) + 2.0;

  const int startX = static_cast<int>(std::floor(g.view.centerX - tilesX * 0.5));
  const int startY = static_cast<int>(std::floor(g.view.centerY - tilesY * 0.5));
  const int endX = static_cast<int>(std::ceil(g.view.centerX + tilesX * 0.5));
  const int endY = static_cast<int>(std::ceil(g.view.centerY + tilesY * 0.5));

  r.x0 = std::max(0, startX);
  r.y0 = std::max(0, startY);
  r.x1 = std::min(gridSize - 1, endX);
  r.y1 = std::min(gridSize - 1, endY);
  return r;
}

Viewport ZoomAround(const FrameGeometry& g, const ViewportLimits& lim, float newZoom, double sx, double sy)
{
  Viewport v = g.view;
  const double before = TileSizePx(g);
  v.zoom = ClampZoom(newZoom, lim);
  const double after = static_cast<double>(g.baseTilePx) * v.zoom;
  if (!(before > 0.0) || !(after > 0.0)) return v;

  // Grid point under the cursor before the zoom...
  const double gx = g.view.centerX + (sx - g.width * 0.5) / before;
  const double gy = g.view.centerY + (sy - g.height * 0.5) / before;
  // ...stays under it afterwards.
  v.centerX = static_cast<float>(gx - (sx - g.width * 0.5) / after);
  v.centerY = static_cast<float>(gy - (sy - g.height * 0.5) / after);
  return v;
}

Viewport PanByPixels(const FrameGeometry& g, double dx, double dy)
{
  Viewport v = g.view;
  const double ts = TileSizePx(g);
  if (!(ts > 0.0)) return v;
  v.centerX = static_cast<float>(v.centerX - dx / ts);
  v.centerY = static_cast<float>(v.centerY - dy / ts);
  return v;
}

} // namespace atlas
