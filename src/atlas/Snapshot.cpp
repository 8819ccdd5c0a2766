#include "atlas/Snapshot.hpp"

#include "atlas/TileRecord.hpp"
#include "atlas/Types.hpp"

#include <array>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace atlas {

namespace {

constexpr std::uint8_t kMagic[4] = {'T', 'M', 'A', 'P'};

const std::uint32_t* Crc32Table()
{
  static const std::array<std::uint32_t, 256> table = [] {
    std::array<std::uint32_t, 256> t{};
    for (std::uint32_t i = 0; i < 256; ++i) {
      std::uint32_t c = i;
      for (int k = 0; k < 8; ++k) c = (c & 1u) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
      t[i] = c;
    }
    return t;
  }();
  return table.data();
}

struct ByteWriter {
  std::vector<std::uint8_t>& out;

  void u8(std::uint8_t v) { out.push_back(v); }
  void u16(std::uint16_t v)
  {
    out.push_back(static_cast<std::uint8_t>(v & 0xFFu));
    out.push_back(static_cast<std::uint8_t>(v >> 8));
  }
  void u32(std::uint32_t v)
  {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu));
  }
  void f64(double v)
  {
    std::uint64_t bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    for (int i = 0; i < 8; ++i) out.push_back(static_cast<std::uint8_t>((bits >> (8 * i)) & 0xFFu));
  }
  void bytes(const std::uint8_t* p, std::size_t n) { out.insert(out.end(), p, p + n); }
};

// Bounds-checked cursor. Every getter fails (and latches) once the input runs out.
struct ByteReader {
  const std::uint8_t* p = nullptr;
  std::size_t size = 0;
  std::size_t pos = 0;
  bool ok = true;

  bool need(std::size_t n)
  {
    if (!ok || size - pos < n) {
      ok = false;
      return false;
    }
    return true;
  }

  std::uint8_t u8()
  {
    if (!need(1)) return 0;
    return p[pos++];
  }
  std::uint16_t u16()
  {
    if (!need(2)) return 0;
    const std::uint16_t v = static_cast<std::uint16_t>(p[pos] | (p[pos + 1] << 8));
    pos += 2;
    return v;
  }
  std::uint32_t u32()
  {
    if (!need(4)) return 0;
    std::uint32_t v = 0;
    for (int i = 0; i < 4; ++i) v |= static_cast<std::uint32_t>(p[pos + i]) << (8 * i);
    pos += 4;
    return v;
  }
  double f64()
  {
    if (!need(8)) return 0.0;
    std::uint64_t bits = 0;
    for (int i = 0; i < 8; ++i) bits |= static_cast<std::uint64_t>(p[pos + i]) << (8 * i);
    pos += 8;
    double v = 0.0;
    std::memcpy(&v, &bits, sizeof(v));
    return v;
  }
  bool str(std::string& out)
  {
    const std::uint16_t len = u16();
    if (!need(len)) return false;
    out.assign(reinterpret_cast<const char*>(p + pos), len);
    pos += len;
    return true;
  }
};

bool CheckIds(const std::vector<std::string>& ids, const char* what, std::string& outError)
{
  std::unordered_set<std::string> seen;
  seen.reserve(ids.size());
  for (std::size_t i = 0; i < ids.size(); ++i) {
    if (ids[i].empty()) {
      outError = std::string("empty ") + what + " id at index " + std::to_string(i);
      return false;
    }
    if (ids[i].size() > 0xFFFFu) {
      outError = std::string(what) + " id too long at index " + std::to_string(i);
      return false;
    }
    if (!seen.insert(ids[i]).second) {
      outError = std::string("duplicate ") + what + " id '" + ids[i] + "'";
      return false;
    }
  }
  return true;
}

} // namespace

std::uint32_t SnapshotCrc32(const std::uint8_t* data, std::size_t size)
{
  const std::uint32_t* table = Crc32Table();
  std::uint32_t crc = 0xFFFFFFFFu;
  for (std::size_t i = 0; i < size; ++i) crc = table[(crc ^ data[i]) & 0xFFu] ^ (crc >> 8);
  return crc ^ 0xFFFFFFFFu;
}

bool ValidateSnapshot(const GridSnapshot& s, int expectedGridSize, std::string& outError)
{
  outError.clear();

  if (s.gridSize < 1 || s.gridSize > kMaxGridSize) {
    outError = "grid size out of range: " + std::to_string(s.gridSize);
    return false;
  }
  if (expectedGridSize > 0 && s.gridSize != expectedGridSize) {
    outError = "grid size mismatch: snapshot " + std::to_string(s.gridSize) + ", store " +
               std::to_string(expectedGridSize);
    return false;
  }

  const std::size_t cells = static_cast<std::size_t>(s.gridSize) * static_cast<std::size_t>(s.gridSize);
  if (s.records.size() != cells * kTileRecordBytes) {
    outError = "record bytes mismatch: expected " + std::to_string(cells * kTileRecordBytes) + ", got " +
               std::to_string(s.records.size());
    return false;
  }

  // Faction indices run 0..kNoFaction-1, so a full table holds kNoFaction ids.
  if (s.factionIds.size() > kNoFaction) {
    outError = "too many factions: " + std::to_string(s.factionIds.size());
    return false;
  }
  if (!CheckIds(s.factionIds, "faction", outError)) return false;

  std::vector<std::string> playerIds;
  playerIds.reserve(s.players.size());
  for (const SnapshotPlayer& p : s.players) playerIds.push_back(p.id);
  if (!CheckIds(playerIds, "player", outError)) return false;

  for (std::size_t c = 0; c < cells; ++c) {
    const TileRecord r = UnpackTileRecord(s.records.data() + c * kTileRecordBytes);
    const int x = static_cast<int>(c % static_cast<std::size_t>(s.gridSize));
    const int y = static_cast<int>(c / static_cast<std::size_t>(s.gridSize));
    const auto where = [x, y]() { return " at (" + std::to_string(x) + "," + std::to_string(y) + ")"; };

    if (r.factionIndex != kNoFaction && r.factionIndex >= s.factionIds.size()) {
      outError = "faction index " + std::to_string(r.factionIndex) + " out of table" + where();
      return false;
    }
    if (r.paintedBy > s.players.size()) {
      outError = "painter index " + std::to_string(r.paintedBy) + " out of table" + where();
      return false;
    }
    if (r.overpaint > kMaxOverpaint) {
      outError = "overpaint " + std::to_string(r.overpaint) + " above limit" + where();
      return false;
    }
    if ((r.flags & ~kTileFlagMask) != 0) {
      outError = "unknown flag bits" + where();
      return false;
    }
    if (!std::isfinite(r.expiry)) {
      outError = "non-finite expiry" + where();
      return false;
    }
  }

  return true;
}

bool EncodeSnapshot(const GridSnapshot& s, std::vector<std::uint8_t>& outBytes, std::string& outError)
{
  if (!ValidateSnapshot(s, 0, outError)) return false;

  std::vector<std::uint8_t> buf;
  buf.reserve(s.records.size() + 64);
  ByteWriter w{buf};

  w.bytes(kMagic, sizeof(kMagic));
  w.u8(kSnapshotFormatVersion);
  w.f64(s.mapVersion);

  w.u16(static_cast<std::uint16_t>(s.factionIds.size()));
  for (const std::string& id : s.factionIds) {
    w.u16(static_cast<std::uint16_t>(id.size()));
    w.bytes(reinterpret_cast<const std::uint8_t*>(id.data()), id.size());
  }

  w.u32(static_cast<std::uint32_t>(s.players.size()));
  for (const SnapshotPlayer& p : s.players) {
    if (p.displayName.size() > 0xFFFFu) {
      outError = "player display name too long: " + p.id;
      return false;
    }
    w.u16(static_cast<std::uint16_t>(p.id.size()));
    w.bytes(reinterpret_cast<const std::uint8_t*>(p.id.data()), p.id.size());
    w.u16(static_cast<std::uint16_t>(p.displayName.size()));
    w.bytes(reinterpret_cast<const std::uint8_t*>(p.displayName.data()), p.displayName.size());
  }

  w.u16(static_cast<std::uint16_t>(s.gridSize));
  w.u32(static_cast<std::uint32_t>(s.records.size() / kTileRecordBytes));
  w.bytes(s.records.data(), s.records.size());

  w.u32(SnapshotCrc32(buf.data(), buf.size()));

  outBytes = std::move(buf);
  return true;
}

bool DecodeSnapshot(const std::vector<std::uint8_t>& bytes, GridSnapshot& out, std::string& outError)
{
  outError.clear();

  if (bytes.size() < sizeof(kMagic) + 1 + 4) {
    outError = "snapshot truncated";
    return false;
  }
  if (std::memcmp(bytes.data(), kMagic, sizeof(kMagic)) != 0) {
    outError = "bad magic (not a TMAP snapshot)";
    return false;
  }

  const std::size_t bodySize = bytes.size() - 4;
  ByteReader crcIn{bytes.data() + bodySize, 4};
  const std::uint32_t storedCrc = crcIn.u32();
  const std::uint32_t computedCrc = SnapshotCrc32(bytes.data(), bodySize);

  ByteReader in{bytes.data(), bodySize};
  in.pos = sizeof(kMagic);

  const std::uint8_t version = in.u8();
  if (version != kSnapshotFormatVersion) {
    outError = "unsupported snapshot version " + std::to_string(version);
    return false;
  }
  if (storedCrc != computedCrc) {
    std::ostringstream oss;
    oss << "CRC mismatch (stored 0x" << std::hex << storedCrc << ", computed 0x" << computedCrc << ")";
    outError = oss.str();
    return false;
  }

  GridSnapshot s;
  s.mapVersion = in.f64();

  const std::uint16_t factionCount = in.u16();
  s.factionIds.resize(factionCount);
  for (std::string& id : s.factionIds) {
    if (!in.str(id)) break;
  }

  const std::uint32_t playerCount = in.u32();
  // Each player needs at least 4 bytes; refuse counts the remaining input can't hold.
  if (!in.ok || playerCount > (bodySize - in.pos) / 4) {
    outError = "snapshot truncated (player table)";
    return false;
  }
  s.players.resize(playerCount);
  for (SnapshotPlayer& p : s.players) {
    if (!in.str(p.id) || !in.str(p.displayName)) break;
  }

  s.gridSize = in.u16();
  const std::uint32_t recordCount = in.u32();
  if (!in.ok) {
    outError = "snapshot truncated (header)";
    return false;
  }

  const std::size_t recordBytes = static_cast<std::size_t>(recordCount) * kTileRecordBytes;
  if (!in.need(recordBytes)) {
    outError = "snapshot truncated (records)";
    return false;
  }
  s.records.assign(bytes.data() + in.pos, bytes.data() + in.pos + recordBytes);
  in.pos += recordBytes;

  if (in.pos != bodySize) {
    outError = "trailing bytes after records";
    return false;
  }

  if (!ValidateSnapshot(s, 0, outError)) return false;

  out = std::move(s);
  return true;
}

bool WriteSnapshotFile(const std::string& path, const GridSnapshot& s, std::string& outError)
{
  std::vector<std::uint8_t> bytes;
  if (!EncodeSnapshot(s, bytes, outError)) return false;

  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f) {
    outError = "failed to open for writing: " + path;
    return false;
  }
  f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!f) {
    outError = "write failed: " + path;
    return false;
  }
  return true;
}

bool ReadSnapshotFile(const std::string& path, GridSnapshot& out, std::string& outError)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open: " + path;
    return false;
  }
  std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  if (f.bad()) {
    outError = "read failed: " + path;
    return false;
  }
  return DecodeSnapshot(bytes, out, outError);
}

} // namespace atlas
