#pragma once

#include "atlas/Color.hpp"
#include "atlas/Types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace atlas {

// Straight-alpha RGBA8 pixel buffer, row-major.
//
// Used for per-worker partial frames (start fully transparent) and for the two
// presentation surfaces owned by the compositor.
class Bitmap {
public:
  Bitmap() = default;
  Bitmap(int width, int height, Rgba8 fill = Rgba8{0, 0, 0, 0});

  int width() const { return m_width; }
  int height() const { return m_height; }
  bool empty() const { return m_width <= 0 || m_height <= 0; }

  // Reallocates only when the size changes.
  void resize(int width, int height);
  void clear(Rgba8 c);

  Rgba8 at(int x, int y) const;
  void set(int x, int y, Rgba8 c);

  // Replaces the pixels of `r` clipped to the bitmap.
  void fillRect(const IRect& r, Rgba8 c);

  // Source-over blend of `c` onto the pixels of `r` clipped to the bitmap.
  void blendRect(const IRect& r, Rgba8 c);

  // Source-over blend of a same-sized bitmap at (0,0). Fully transparent source
  // pixels leave the destination untouched.
  bool blendOver(const Bitmap& src);

  const std::vector<std::uint8_t>& pixels() const { return m_rgba; }
  std::vector<std::uint8_t>& pixels() { return m_rgba; }

  // RGB bytes with alpha dropped (for PPM export).
  std::vector<std::uint8_t> toRgb() const;

  // Number of pixels with alpha > 0.
  std::size_t coveredPixels() const;

private:
  int m_width = 0;
  int m_height = 0;
  std::vector<std::uint8_t> m_rgba;
};

Rgba8 BlendOver(Rgba8 dst, Rgba8 src);

// Binary PPM (P6). Alpha is discarded.
bool WritePpm(const std::string& path, const Bitmap& img, std::string& outError);

} // namespace atlas
