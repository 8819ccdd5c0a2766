#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace atlas {

struct SnapshotPlayer {
  std::string id;
  std::string displayName;
};

// Complete, self-describing copy of the grid used for bulk load and persistence.
//
// Indices inside `records` are local to this snapshot: faction index i names
// factionIds[i]; painter value n+1 names players[n] (0 = nobody). TileStore::fullReplace
// remaps them onto the live intern tables.
struct GridSnapshot {
  int gridSize = 0;
  double mapVersion = 0.0;
  std::vector<std::string> factionIds;
  std::vector<SnapshotPlayer> players;
  std::vector<std::uint8_t> records; // gridSize * gridSize * kTileRecordBytes
};

// Structural validation. `expectedGridSize` <= 0 accepts any size in [1, kMaxGridSize].
// Every record is checked; nothing is modified.
bool ValidateSnapshot(const GridSnapshot& s, int expectedGridSize, std::string& outError);

// Binary "TMAP" container (format version kSnapshotFormatVersion) with a trailing CRC32.
constexpr std::uint8_t kSnapshotFormatVersion = 2;

bool EncodeSnapshot(const GridSnapshot& s, std::vector<std::uint8_t>& outBytes, std::string& outError);

// `out` is only assigned when decoding succeeds.
bool DecodeSnapshot(const std::vector<std::uint8_t>& bytes, GridSnapshot& out, std::string& outError);

bool WriteSnapshotFile(const std::string& path, const GridSnapshot& s, std::string& outError);
bool ReadSnapshotFile(const std::string& path, GridSnapshot& out, std::string& outError);

// IEEE CRC-32 (reflected, poly 0xEDB88320).
std::uint32_t SnapshotCrc32(const std::uint8_t* data, std::size_t size);

} // namespace atlas
