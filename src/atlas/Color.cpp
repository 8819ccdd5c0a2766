#include "atlas/Color.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace atlas {

namespace {

int HexDigit(char c)
{
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

std::uint8_t ToByte(float v)
{
  const float c = std::clamp(v, 0.0f, 1.0f);
  return static_cast<std::uint8_t>(std::lround(c * 255.0f));
}

} // namespace

bool ParseHexColor(const std::string& s, Rgba8& out)
{
  std::size_t i = 0;
  if (!s.empty() && s[0] == '#') i = 1;
  const std::size_t n = s.size() - i;
  if (n != 6 && n != 3) return false;

  int v[6] = {};
  for (std::size_t k = 0; k < n; ++k) {
    v[k] = HexDigit(s[i + k]);
    if (v[k] < 0) return false;
  }

  if (n == 3) {
    out = Rgba8{static_cast<std::uint8_t>(v[0] * 17), static_cast<std::uint8_t>(v[1] * 17),
                static_cast<std::uint8_t>(v[2] * 17), 255};
  } else {
    out = Rgba8{static_cast<std::uint8_t>(v[0] * 16 + v[1]), static_cast<std::uint8_t>(v[2] * 16 + v[3]),
                static_cast<std::uint8_t>(v[4] * 16 + v[5]), 255};
  }
  return true;
}

std::string FormatHexColor(Rgba8 c)
{
  char buf[8];
  std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", c.r, c.g, c.b);
  return std::string(buf);
}

Rgba8 HslToRgb(float hDeg, float s, float l)
{
  float h = std::fmod(hDeg, 360.0f);
  if (h < 0.0f) h += 360.0f;
  s = std::clamp(s, 0.0f, 1.0f);
  l = std::clamp(l, 0.0f, 1.0f);

  const float c = (1.0f - std::fabs(2.0f * l - 1.0f)) * s;
  const float hp = h / 60.0f;
  const float x = c * (1.0f - std::fabs(std::fmod(hp, 2.0f) - 1.0f));

  float r = 0.0f, g = 0.0f, b = 0.0f;
  if (hp < 1.0f) {
    r = c; g = x;
  } else if (hp < 2.0f) {
    r = x; g = c;
  } else if (hp < 3.0f) {
    g = c; b = x;
  } else if (hp < 4.0f) {
    g = x; b = c;
  } else if (hp < 5.0f) {
    r = x; b = c;
  } else {
    r = c; b = x;
  }

  const float m = l - c * 0.5f;
  return Rgba8{ToByte(r + m), ToByte(g + m), ToByte(b + m), 255};
}

} // namespace atlas
