#pragma once

#include "atlas/Color.hpp"
#include "atlas/TileGrid.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace atlas {

class TileStore;

enum class ColorMode : std::uint8_t {
  Faction = 0,
  Player = 1,
  Overpaint = 2,
  Alliance = 3,
};

// "faction", "player", "overpaint", "alliance" (case-insensitive).
bool ParseColorMode(const std::string& s, ColorMode& out);
const char* ColorModeName(ColorMode m);

struct RenderTheme {
  ColorMode mode = ColorMode::Faction;
  Rgba8 blankTile{255, 255, 255, 255};
  bool highlightCoreOnly = false;
  bool showSeams = false;
};

constexpr Rgba8 kUnknownPlayerColor{0xCC, 0xCC, 0xCC, 255};
constexpr Rgba8 kNonCoreDimColor{0x22, 0x22, 0x33, 255};
constexpr Rgba8 kSeamColor{0, 0, 0, 102};

struct FactionMeta {
  std::string id;
  std::string displayName;
  Rgba8 color{0xAA, 0xAA, 0xAA, 255};
  bool hasAlliance = false;
  Rgba8 allianceColor{};
};

// Immutable lookup tables handed to render and analysis workers.
// Indexed by the store's interned indices.
struct RenderMetadata {
  std::uint64_t revision = 0;
  std::vector<FactionMeta> factions;      // by faction index
  std::vector<bool> playerHasColor;       // by player index (slot 0 unused)
  std::vector<Rgba8> playerColors;        // by player index (slot 0 unused)
  std::vector<std::string> playerNames;   // by player index (slot 0 unused)

  const FactionMeta* faction(std::uint16_t index) const
  {
    return index < factions.size() ? &factions[index] : nullptr;
  }
};

using RenderMetadataPtr = std::shared_ptr<const RenderMetadata>;

// Coordinator-side tables supplied by the rule layer (faction colors and names,
// alliances, player colors). snapshot() folds them together with the store's
// intern tables into a RenderMetadata and only rebuilds when either side changed.
class MetadataRegistry {
public:
  void setFaction(const std::string& id, const std::string& displayName, Rgba8 color,
                  const std::string& allianceId = std::string());
  void setAlliance(const std::string& id, const std::string& name, Rgba8 color);
  void setPlayerColor(const std::string& playerId, Rgba8 color);

  RenderMetadataPtr snapshot(const TileStore& store);

  std::uint64_t revision() const { return m_revision; }
  std::uint64_t rebuilds() const { return m_rebuilds; }

private:
  struct FactionEntry {
    std::string displayName;
    Rgba8 color;
    std::string allianceId;
  };
  struct AllianceEntry {
    std::string name;
    Rgba8 color;
  };

  std::unordered_map<std::string, FactionEntry> m_factions;
  std::unordered_map<std::string, AllianceEntry> m_alliances;
  std::unordered_map<std::string, Rgba8> m_playerColors;

  std::uint64_t m_revision = 1;
  std::uint64_t m_rebuilds = 0;

  RenderMetadataPtr m_cached;
  std::uint64_t m_cachedRevision = 0;
  std::uint64_t m_cachedFactionTable = 0;
  std::uint64_t m_cachedPlayerTable = 0;
  std::uint64_t m_cachedPlayerNames = 0;
};

// Per-frame color rule table. Cheap to build; resolve() does not allocate.
class ColorRules {
public:
  ColorRules(const RenderTheme& theme, const RenderMetadata* meta);

  Rgba8 resolve(const TileSlot& tile) const;

  const RenderTheme& theme() const { return m_theme; }

private:
  RenderTheme m_theme;
  const RenderMetadata* m_meta = nullptr;
  std::array<Rgba8, kMaxOverpaint + 1> m_overpaintRamp{};
};

// Overpaint heat ramp: hue 240 + 60r, saturation 60 + 40r %, lightness 45 + 30r %,
// r = min(count, 4) / 4.
Rgba8 OverpaintColor(int count);

} // namespace atlas
