#pragma once

#include "atlas/InternTable.hpp"
#include "atlas/Snapshot.hpp"
#include "atlas/TileGrid.hpp"
#include "atlas/TileRecord.hpp"
#include "atlas/Types.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace atlas {

// One incoming tile update from the rule layer, expressed with string identities.
struct TileWrite {
  int x = 0;
  int y = 0;

  // When set, the cell becomes unowned and every other field is ignored.
  bool clear = false;

  std::string factionId; // empty = unowned
  std::uint32_t color = 0;
  std::string paintedBy; // empty = nobody
  int overpaint = 0;     // clamped to [0, kMaxOverpaint]
  bool isCore = false;
  bool coreificationPending = false;
  double expiry = 0.0;
  std::uint32_t paintedAtSeconds = 0;
};

// Authoritative ownership state for the whole grid.
//
// Threading: exactly one thread (the coordinator) calls the mutating members and
// the intern-table accessors. Any thread may use a TileReader obtained from
// reader(); readers never take a lock.
class TileStore {
public:
  explicit TileStore(int gridSize = kDefaultGridSize);

  int gridSize() const { return m_size; }

  // Incremented at least once by every mutation that changed something.
  std::uint64_t version() const { return m_version.load(std::memory_order_acquire); }

  // Out-of-range coordinates and a full faction table are rejected (returns false,
  // version untouched).
  bool write(const TileWrite& w);

  // Returns the number of applied records. The version moves by one when at least
  // one record applied.
  std::size_t writeBatch(const std::vector<TileWrite>& batch);

  bool clear(int x, int y);

  // std::nullopt = no tile (out of range).
  std::optional<TileRecord> read(int x, int y) const;

  // Validates completely, then swaps in a new region. On failure the live grid and
  // intern tables are untouched and outError says why.
  bool fullReplace(const GridSnapshot& snapshot, std::string& outError);

  GridSnapshot exportSnapshot(double mapVersion = 0.0) const;

  TileReader reader() const;

  // counts[i] = tiles owned by faction index i (sized to the faction table).
  std::vector<std::uint32_t> countTilesByFaction() const;

  // Identity tables. Faction indices start at 0; player indices start at 1 so the
  // record value 0 can mean "nobody".
  const InternTable& factions() const { return m_factions; }
  const InternTable& players() const { return m_players; }

  std::optional<std::uint16_t> internFaction(const std::string& id);
  std::optional<std::uint32_t> internPlayer(const std::string& id);

  // Display names travel with snapshots; ids without a name use the id itself.
  void setPlayerDisplayName(const std::string& id, const std::string& name);
  std::string playerDisplayName(std::uint32_t playerIndex) const;
  std::uint64_t playerNamesRevision() const { return m_playerNamesRevision; }

private:
  bool apply(const TileWrite& w);
  void bumpVersion() { m_version.fetch_add(1, std::memory_order_acq_rel); }

  int m_size = 0;
  std::shared_ptr<TileRegion> m_region;
  std::atomic<std::uint64_t> m_version{0};

  InternTable m_factions;
  InternTable m_players;
  std::vector<std::string> m_playerNames; // by playerIndex - 1
  std::uint64_t m_playerNamesRevision = 0;
};

} // namespace atlas
