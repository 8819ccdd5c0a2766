#include "atlas/TileRecord.hpp"

#include <cstring>

namespace atlas {

namespace {

void PutU16(std::uint8_t* p, std::uint16_t v)
{
  p[0] = static_cast<std::uint8_t>(v & 0xFFu);
  p[1] = static_cast<std::uint8_t>((v >> 8) & 0xFFu);
}

void PutU32(std::uint8_t* p, std::uint32_t v)
{
  for (int i = 0; i < 4; ++i) p[i] = static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu);
}

void PutU64(std::uint8_t* p, std::uint64_t v)
{
  for (int i = 0; i < 8; ++i) p[i] = static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu);
}

std::uint16_t GetU16(const std::uint8_t* p)
{
  return static_cast<std::uint16_t>(p[0] | (static_cast<std::uint16_t>(p[1]) << 8));
}

std::uint32_t GetU32(const std::uint8_t* p)
{
  std::uint32_t v = 0;
  for (int i = 0; i < 4; ++i) v |= static_cast<std::uint32_t>(p[i]) << (8 * i);
  return v;
}

std::uint64_t GetU64(const std::uint8_t* p)
{
  std::uint64_t v = 0;
  for (int i = 0; i < 8; ++i) v |= static_cast<std::uint64_t>(p[i]) << (8 * i);
  return v;
}

} // namespace

bool TileRecord::operator==(const TileRecord& o) const
{
  std::uint64_t a = 0;
  std::uint64_t b = 0;
  std::memcpy(&a, &expiry, sizeof(a));
  std::memcpy(&b, &o.expiry, sizeof(b));
  return factionIndex == o.factionIndex && color == o.color && paintedBy == o.paintedBy &&
         overpaint == o.overpaint && flags == o.flags && paintedAtSeconds == o.paintedAtSeconds && a == b;
}

void PackTileRecord(const TileRecord& r, std::uint8_t* out)
{
  static_assert(sizeof(double) == sizeof(std::uint64_t), "expiry must be a 64-bit IEEE double");

  std::uint64_t expiryBits = 0;
  std::memcpy(&expiryBits, &r.expiry, sizeof(expiryBits));

  PutU16(out + 0, r.factionIndex);
  PutU32(out + 2, r.color);
  PutU32(out + 6, r.paintedBy);
  out[10] = r.overpaint;
  out[11] = r.flags;
  PutU64(out + 12, expiryBits);
  PutU32(out + 20, r.paintedAtSeconds);
}

TileRecord UnpackTileRecord(const std::uint8_t* in)
{
  TileRecord r;
  r.factionIndex = GetU16(in + 0);
  r.color = GetU32(in + 2);
  r.paintedBy = GetU32(in + 6);
  r.overpaint = in[10];
  r.flags = in[11];
  const std::uint64_t expiryBits = GetU64(in + 12);
  std::memcpy(&r.expiry, &expiryBits, sizeof(r.expiry));
  r.paintedAtSeconds = GetU32(in + 20);
  return r;
}

void PackTileWords(const TileRecord& r, std::uint32_t* out)
{
  std::uint8_t bytes[kTileRecordBytes];
  PackTileRecord(r, bytes);
  for (std::size_t k = 0; k < kTileRecordWords; ++k) out[k] = GetU32(bytes + 4 * k);
}

TileRecord UnpackTileWords(const std::uint32_t* in)
{
  std::uint8_t bytes[kTileRecordBytes];
  for (std::size_t k = 0; k < kTileRecordWords; ++k) PutU32(bytes + 4 * k, in[k]);
  return UnpackTileRecord(bytes);
}

} // namespace atlas
