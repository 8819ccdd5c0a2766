#pragma once

#include <cstddef>
#include <cstdint>

namespace atlas {

// Packed per-cell ownership record.
//
// On the wire and in snapshots a record is 24 little-endian bytes:
//
//   [0,2)   factionIndex      u16  (kNoFaction = unowned)
//   [2,6)   color             u32  0x00RRGGBB
//   [6,10)  paintedBy         u32  player index, 0 = none
//   [10]    overpaint         u8   0..kMaxOverpaint
//   [11]    flags             u8   kTileFlag*
//   [12,20) expiry            f64  ms since epoch (meaning depends on the flag bit)
//   [20,24) paintedAtSeconds  u32
//
// In memory the grid keeps the same bytes as six 32-bit words per cell so that
// fields can be read in place without unpacking the whole record.
constexpr std::size_t kTileRecordBytes = 24;
constexpr std::size_t kTileRecordWords = kTileRecordBytes / 4;

constexpr std::uint16_t kNoFaction = 0xFFFFu;
constexpr std::uint32_t kNoPainter = 0u;
constexpr std::uint8_t kMaxOverpaint = 4u;

constexpr std::uint8_t kTileFlagCore = 1u << 0;
constexpr std::uint8_t kTileFlagCoreificationPending = 1u << 1;
constexpr std::uint8_t kTileFlagMask = kTileFlagCore | kTileFlagCoreificationPending;

struct TileRecord {
  std::uint16_t factionIndex = kNoFaction;
  std::uint32_t color = 0;
  std::uint32_t paintedBy = kNoPainter;
  std::uint8_t overpaint = 0;
  std::uint8_t flags = 0;
  double expiry = 0.0;
  std::uint32_t paintedAtSeconds = 0;

  bool owned() const { return factionIndex != kNoFaction; }
  bool isCore() const { return (flags & kTileFlagCore) != 0; }
  bool coreificationPending() const { return (flags & kTileFlagCoreificationPending) != 0; }

  bool operator==(const TileRecord& o) const;
  bool operator!=(const TileRecord& o) const { return !(*this == o); }
};

// Byte form (exactly kTileRecordBytes).
void PackTileRecord(const TileRecord& r, std::uint8_t* out);
TileRecord UnpackTileRecord(const std::uint8_t* in);

// Word form (exactly kTileRecordWords). Word k holds bytes [4k, 4k+4) little-endian.
void PackTileWords(const TileRecord& r, std::uint32_t* out);
TileRecord UnpackTileWords(const std::uint32_t* in);

// Field extraction straight from the word form. Used by the render and analysis hot paths.
inline std::uint16_t WordsFactionIndex(std::uint32_t w0) { return static_cast<std::uint16_t>(w0 & 0xFFFFu); }
inline std::uint32_t WordsColor(std::uint32_t w0, std::uint32_t w1) { return (w0 >> 16) | ((w1 & 0xFFFFu) << 16); }
inline std::uint32_t WordsPaintedBy(std::uint32_t w1, std::uint32_t w2) { return (w1 >> 16) | ((w2 & 0xFFFFu) << 16); }
inline std::uint8_t WordsOverpaint(std::uint32_t w2) { return static_cast<std::uint8_t>((w2 >> 16) & 0xFFu); }
inline std::uint8_t WordsFlags(std::uint32_t w2) { return static_cast<std::uint8_t>((w2 >> 24) & 0xFFu); }

} // namespace atlas
