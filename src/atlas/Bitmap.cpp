#include "atlas/Bitmap.hpp"

#include <algorithm>
#include <fstream>

namespace atlas {

namespace {

bool Clip(const IRect& r, int w, int h, int& x0, int& y0, int& x1, int& y1)
{
  x0 = std::max(0, r.x);
  y0 = std::max(0, r.y);
  x1 = std::min(w, r.x + r.w);
  y1 = std::min(h, r.y + r.h);
  return x0 < x1 && y0 < y1;
}

} // namespace

Rgba8 BlendOver(Rgba8 dst, Rgba8 src)
{
  if (src.a == 255) return src;
  if (src.a == 0) return dst;

  const int sa = src.a;
  const int da = dst.a;
  // outA = sa + da * (255 - sa) / 255, all in 0..255 fixed point.
  const int outA = sa + (da * (255 - sa) + 127) / 255;
  if (outA == 0) return Rgba8{0, 0, 0, 0};

  auto ch = [&](int s, int d) {
    const int num = s * sa * 255 + d * da * (255 - sa);
    return static_cast<std::uint8_t>((num + (outA * 255) / 2) / (outA * 255));
  };

  return Rgba8{ch(src.r, dst.r), ch(src.g, dst.g), ch(src.b, dst.b), static_cast<std::uint8_t>(outA)};
}

Bitmap::Bitmap(int width, int height, Rgba8 fill)
{
  resize(width, height);
  clear(fill);
}

void Bitmap::resize(int width, int height)
{
  width = std::max(0, width);
  height = std::max(0, height);
  if (width == m_width && height == m_height) return;
  m_width = width;
  m_height = height;
  m_rgba.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4u, 0u);
}

void Bitmap::clear(Rgba8 c)
{
  for (std::size_t i = 0; i + 3 < m_rgba.size(); i += 4) {
    m_rgba[i + 0] = c.r;
    m_rgba[i + 1] = c.g;
    m_rgba[i + 2] = c.b;
    m_rgba[i + 3] = c.a;
  }
}

Rgba8 Bitmap::at(int x, int y) const
{
  if (x < 0 || y < 0 || x >= m_width || y >= m_height) return Rgba8{0, 0, 0, 0};
  const std::size_t i = (static_cast<std::size_t>(y) * static_cast<std::size_t>(m_width) + static_cast<std::size_t>(x)) * 4u;
  return Rgba8{m_rgba[i], m_rgba[i + 1], m_rgba[i + 2], m_rgba[i + 3]};
}

void Bitmap::set(int x, int y, Rgba8 c)
{
  if (x < 0 || y < 0 || x >= m_width || y >= m_height) return;
  const std::size_t i = (static_cast<std::size_t>(y) * static_cast<std::size_t>(m_width) + static_cast<std::size_t>(x)) * 4u;
  m_rgba[i + 0] = c.r;
  m_rgba[i + 1] = c.g;
  m_rgba[i + 2] = c.b;
  m_rgba[i + 3] = c.a;
}

void Bitmap::fillRect(const IRect& r, Rgba8 c)
{
  int x0, y0, x1, y1;
  if (!Clip(r, m_width, m_height, x0, y0, x1, y1)) return;

  for (int y = y0; y < y1; ++y) {
    std::uint8_t* row = m_rgba.data() + (static_cast<std::size_t>(y) * static_cast<std::size_t>(m_width)) * 4u;
    for (int x = x0; x < x1; ++x) {
      std::uint8_t* p = row + static_cast<std::size_t>(x) * 4u;
      p[0] = c.r;
      p[1] = c.g;
      p[2] = c.b;
      p[3] = c.a;
    }
  }
}

void Bitmap::blendRect(const IRect& r, Rgba8 c)
{
  int x0, y0, x1, y1;
  if (!Clip(r, m_width, m_height, x0, y0, x1, y1)) return;

  for (int y = y0; y < y1; ++y) {
    for (int x = x0; x < x1; ++x) set(x, y, BlendOver(at(x, y), c));
  }
}

bool Bitmap::blendOver(const Bitmap& src)
{
  if (src.m_width != m_width || src.m_height != m_height) return false;

  for (std::size_t i = 0; i + 3 < m_rgba.size(); i += 4) {
    const std::uint8_t sa = src.m_rgba[i + 3];
    if (sa == 0) continue;
    if (sa == 255) {
      m_rgba[i + 0] = src.m_rgba[i + 0];
      m_rgba[i + 1] = src.m_rgba[i + 1];
      m_rgba[i + 2] = src.m_rgba[i + 2];
      m_rgba[i + 3] = 255;
      continue;
    }
    const Rgba8 d{m_rgba[i], m_rgba[i + 1], m_rgba[i + 2], m_rgba[i + 3]};
    const Rgba8 s{src.m_rgba[i], src.m_rgba[i + 1], src.m_rgba[i + 2], sa};
    const Rgba8 o = BlendOver(d, s);
    m_rgba[i + 0] = o.r;
    m_rgba[i + 1] = o.g;
    m_rgba[i + 2] = o.b;
    m_rgba[i + 3] = o.a;
  }
  return true;
}

std::vector<std::uint8_t> Bitmap::toRgb() const
{
  std::vector<std::uint8_t> rgb;
  rgb.reserve(static_cast<std::size_t>(m_width) * static_cast<std::size_t>(m_height) * 3u);
  for (std::size_t i = 0; i + 3 < m_rgba.size(); i += 4) {
    rgb.push_back(m_rgba[i + 0]);
    rgb.push_back(m_rgba[i + 1]);
    rgb.push_back(m_rgba[i + 2]);
  }
  return rgb;
}

std::size_t Bitmap::coveredPixels() const
{
  std::size_t n = 0;
  for (std::size_t i = 3; i < m_rgba.size(); i += 4) {
    if (m_rgba[i] != 0) ++n;
  }
  return n;
}

bool WritePpm(const std::string& path, const Bitmap& img, std::string& outError)
{
  outError.clear();

  if (img.empty()) {
    outError = "Invalid image dimensions";
    return false;
  }

  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "Failed to open file for writing";
    return false;
  }

  const std::vector<std::uint8_t> rgb = img.toRgb();
  f << "P6\n" << img.width() << " " << img.height() << "\n255\n";
  f.write(reinterpret_cast<const char*>(rgb.data()), static_cast<std::streamsize>(rgb.size()));
  if (!f) {
    outError = "Failed while writing file";
    return false;
  }
  return true;
}

} // namespace atlas
