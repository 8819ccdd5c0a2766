#pragma once

namespace atlas {

// Integer cell coordinate on the world grid (x = column, y = row).
struct Point {
  int x = 0;
  int y = 0;

  bool operator==(const Point& o) const { return x == o.x && y == o.y; }
  bool operator!=(const Point& o) const { return !(*this == o); }
};

// Half-open pixel rectangle [x, x+w) x [y, y+h).
struct IRect {
  int x = 0;
  int y = 0;
  int w = 0;
  int h = 0;

  bool empty() const { return w <= 0 || h <= 0; }
};

// Inclusive cell range [x0, x1] x [y0, y1]. Empty when x1 < x0 or y1 < y0.
struct CellRange {
  int x0 = 0;
  int y0 = 0;
  int x1 = -1;
  int y1 = -1;

  bool empty() const { return x1 < x0 || y1 < y0; }
};

// Default world edge length. The store accepts other sizes (tests use toy grids).
constexpr int kDefaultGridSize = 500;
constexpr int kMaxGridSize = 4096;

} // namespace atlas
