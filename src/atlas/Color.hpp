#pragma once

#include <cstdint>
#include <string>

namespace atlas {

// Raylib-free RGBA color so headless code and tests can share it with the viewer.
struct Rgba8 {
  std::uint8_t r = 0;
  std::uint8_t g = 0;
  std::uint8_t b = 0;
  std::uint8_t a = 255;

  bool operator==(const Rgba8& o) const { return r == o.r && g == o.g && b == o.b && a == o.a; }
  bool operator!=(const Rgba8& o) const { return !(*this == o); }
};

// 0x00RRGGBB <-> opaque Rgba8.
inline Rgba8 RgbaFromPacked(std::uint32_t rgb)
{
  return Rgba8{static_cast<std::uint8_t>((rgb >> 16) & 0xFFu), static_cast<std::uint8_t>((rgb >> 8) & 0xFFu),
               static_cast<std::uint8_t>(rgb & 0xFFu), 255};
}

inline std::uint32_t PackRgb(Rgba8 c)
{
  return (static_cast<std::uint32_t>(c.r) << 16) | (static_cast<std::uint32_t>(c.g) << 8) | c.b;
}

// Accepts "#rrggbb", "rrggbb" and "#rgb" (case-insensitive). Alpha is always 255.
bool ParseHexColor(const std::string& s, Rgba8& out);

// "#rrggbb" (lowercase, alpha ignored).
std::string FormatHexColor(Rgba8 c);

// h in degrees (any value, wrapped), s and l in [0, 1].
Rgba8 HslToRgb(float hDeg, float s, float l);

} // namespace atlas
