#include "atlas/TileStore.hpp"

#include <algorithm>
#include <iostream>
#include <limits>

namespace atlas {

namespace {

bool HasRoom(const InternTable& table, std::size_t extra)
{
  return static_cast<std::uint64_t>(table.firstIndex()) + table.size() + extra <= table.limit();
}

} // namespace

TileStore::TileStore(int gridSize)
    : m_size(std::clamp(gridSize, 1, kMaxGridSize))
    , m_region(std::make_shared<TileRegion>(m_size))
    , m_factions(0u, kNoFaction)
    , m_players(1u, std::numeric_limits<std::uint32_t>::max())
{
  if (m_size != gridSize) {
    std::cerr << "[store] grid size " << gridSize << " clamped to " << m_size << "\n";
  }
}

std::optional<std::uint16_t> TileStore::internFaction(const std::string& id)
{
  const auto idx = m_factions.intern(id);
  if (!idx) return std::nullopt;
  return static_cast<std::uint16_t>(*idx);
}

std::optional<std::uint32_t> TileStore::internPlayer(const std::string& id)
{
  const auto idx = m_players.intern(id);
  if (!idx) return std::nullopt;
  if (m_playerNames.size() < m_players.size()) m_playerNames.resize(m_players.size());
  return *idx;
}

void TileStore::setPlayerDisplayName(const std::string& id, const std::string& name)
{
  const auto idx = internPlayer(id);
  if (!idx) return;
  if (m_playerNames[*idx - 1u] == name) return;
  m_playerNames[*idx - 1u] = name;
  ++m_playerNamesRevision;
}

std::string TileStore::playerDisplayName(std::uint32_t playerIndex) const
{
  const std::string* id = m_players.idAt(playerIndex);
  if (!id) return std::string();
  const std::size_t slot = static_cast<std::size_t>(playerIndex - 1u);
  if (slot < m_playerNames.size() && !m_playerNames[slot].empty()) return m_playerNames[slot];
  return *id;
}

bool TileStore::apply(const TileWrite& w)
{
  if (!m_region->inBounds(w.x, w.y)) return false;

  TileRecord r;
  if (!w.clear && !w.factionId.empty()) {
    // Nothing is interned unless both identities fit.
    if (!w.paintedBy.empty() && !m_players.find(w.paintedBy) && m_players.full()) {
      std::cerr << "[store] player table full, dropping write at (" << w.x << "," << w.y << ")\n";
      return false;
    }
    const auto fi = internFaction(w.factionId);
    if (!fi) {
      std::cerr << "[store] faction table full, dropping write for '" << w.factionId << "' at (" << w.x << ","
                << w.y << ")\n";
      return false;
    }

    std::uint32_t painter = kNoPainter;
    if (!w.paintedBy.empty()) painter = *internPlayer(w.paintedBy);

    r.factionIndex = *fi;
    r.color = w.color & 0x00FFFFFFu;
    r.paintedBy = painter;
    r.overpaint = static_cast<std::uint8_t>(std::clamp(w.overpaint, 0, static_cast<int>(kMaxOverpaint)));
    r.flags = static_cast<std::uint8_t>((w.isCore ? kTileFlagCore : 0) |
                                        (w.coreificationPending ? kTileFlagCoreificationPending : 0));
    r.expiry = w.expiry;
    r.paintedAtSeconds = w.paintedAtSeconds;
  }

  m_region->store(m_region->cellIndex(w.x, w.y), r);
  return true;
}

bool TileStore::write(const TileWrite& w)
{
  if (!apply(w)) return false;
  bumpVersion();
  return true;
}

std::size_t TileStore::writeBatch(const std::vector<TileWrite>& batch)
{
  std::size_t applied = 0;
  for (const TileWrite& w : batch) {
    if (apply(w)) ++applied;
  }
  if (applied > 0) bumpVersion();
  return applied;
}

bool TileStore::clear(int x, int y)
{
  TileWrite w;
  w.x = x;
  w.y = y;
  w.clear = true;
  return write(w);
}

std::optional<TileRecord> TileStore::read(int x, int y) const
{
  if (!m_region->inBounds(x, y)) return std::nullopt;
  return m_region->load(m_region->cellIndex(x, y));
}

TileReader TileStore::reader() const
{
  return TileReader(m_region, version());
}

bool TileStore::fullReplace(const GridSnapshot& snapshot, std::string& outError)
{
  if (!ValidateSnapshot(snapshot, m_size, outError)) {
    std::cerr << "[store] fullReplace rejected: " << outError << "\n";
    return false;
  }

  // Both tables must have room before either is touched. Snapshot ids are unique.
  std::size_t newFactions = 0;
  for (const std::string& id : snapshot.factionIds) {
    if (!m_factions.find(id)) ++newFactions;
  }
  std::size_t newPlayers = 0;
  for (const SnapshotPlayer& p : snapshot.players) {
    if (!m_players.find(p.id)) ++newPlayers;
  }
  if (!HasRoom(m_factions, newFactions)) {
    outError = "faction table would overflow (" + std::to_string(m_factions.size() + newFactions) + " ids)";
    std::cerr << "[store] fullReplace rejected: " << outError << "\n";
    return false;
  }
  if (!HasRoom(m_players, newPlayers)) {
    outError = "player table would overflow (" + std::to_string(m_players.size() + newPlayers) + " ids)";
    std::cerr << "[store] fullReplace rejected: " << outError << "\n";
    return false;
  }

  std::vector<std::uint16_t> factionMap(snapshot.factionIds.size(), kNoFaction);
  for (std::size_t i = 0; i < snapshot.factionIds.size(); ++i) {
    factionMap[i] = *internFaction(snapshot.factionIds[i]);
  }

  std::vector<std::uint32_t> playerMap(snapshot.players.size() + 1, kNoPainter);
  for (std::size_t i = 0; i < snapshot.players.size(); ++i) {
    const SnapshotPlayer& p = snapshot.players[i];
    const std::uint32_t idx = *internPlayer(p.id);
    playerMap[i + 1] = idx;
    if (!p.displayName.empty() && m_playerNames[idx - 1u] != p.displayName) {
      m_playerNames[idx - 1u] = p.displayName;
      ++m_playerNamesRevision;
    }
  }

  auto region = std::make_shared<TileRegion>(m_size);
  const std::size_t cells = region->cellCount();
  for (std::size_t c = 0; c < cells; ++c) {
    TileRecord r = UnpackTileRecord(snapshot.records.data() + c * kTileRecordBytes);
    if (r.factionIndex != kNoFaction) r.factionIndex = factionMap[r.factionIndex];
    r.paintedBy = playerMap[r.paintedBy];
    region->store(c, r);
  }

  m_region = std::move(region);
  bumpVersion();

  std::cout << "[store] fullReplace applied (" << snapshot.factionIds.size() << " factions, "
            << snapshot.players.size() << " players), version " << version() << "\n";
  return true;
}

GridSnapshot TileStore::exportSnapshot(double mapVersion) const
{
  GridSnapshot s;
  s.gridSize = m_size;
  s.mapVersion = mapVersion;
  s.factionIds = m_factions.ids();

  s.players.reserve(m_players.size());
  for (std::size_t i = 0; i < m_players.size(); ++i) {
    SnapshotPlayer p;
    p.id = m_players.ids()[i];
    if (i < m_playerNames.size()) p.displayName = m_playerNames[i];
    s.players.push_back(std::move(p));
  }

  // Live indices already match the snapshot convention (factions from 0, players from 1).
  const std::size_t cells = m_region->cellCount();
  s.records.resize(cells * kTileRecordBytes);
  for (std::size_t c = 0; c < cells; ++c) {
    PackTileRecord(m_region->load(c), s.records.data() + c * kTileRecordBytes);
  }
  return s;
}

std::vector<std::uint32_t> TileStore::countTilesByFaction() const
{
  std::vector<std::uint32_t> counts(m_factions.size(), 0u);
  const std::size_t cells = m_region->cellCount();
  for (std::size_t c = 0; c < cells; ++c) {
    const std::uint16_t fi = WordsFactionIndex(m_region->word(c, 0));
    if (fi != kNoFaction && fi < counts.size()) ++counts[fi];
  }
  return counts;
}

} // namespace atlas
