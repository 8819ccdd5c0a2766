#include "atlas/ColorRules.hpp"

#include "atlas/TileStore.hpp"

#include <algorithm>
#include <cctype>

namespace atlas {

namespace {

std::string ToLower(std::string s)
{
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

} // namespace

bool ParseColorMode(const std::string& s, ColorMode& out)
{
  const std::string k = ToLower(s);
  if (k == "faction") {
    out = ColorMode::Faction;
  } else if (k == "player") {
    out = ColorMode::Player;
  } else if (k == "overpaint") {
    out = ColorMode::Overpaint;
  } else if (k == "alliance") {
    out = ColorMode::Alliance;
  } else {
    return false;
  }
  return true;
}

const char* ColorModeName(ColorMode m)
{
  switch (m) {
  case ColorMode::Faction: return "faction";
  case ColorMode::Player: return "player";
  case ColorMode::Overpaint: return "overpaint";
  case ColorMode::Alliance: return "alliance";
  }
  return "faction";
}

Rgba8 OverpaintColor(int count)
{
  const float r = static_cast<float>(std::clamp(count, 0, static_cast<int>(kMaxOverpaint))) /
                  static_cast<float>(kMaxOverpaint);
  return HslToRgb(240.0f + r * 60.0f, (60.0f + r * 40.0f) / 100.0f, (45.0f + r * 30.0f) / 100.0f);
}

void MetadataRegistry::setFaction(const std::string& id, const std::string& displayName, Rgba8 color,
                                  const std::string& allianceId)
{
  m_factions[id] = FactionEntry{displayName, color, allianceId};
  ++m_revision;
}

void MetadataRegistry::setAlliance(const std::string& id, const std::string& name, Rgba8 color)
{
  m_alliances[id] = AllianceEntry{name, color};
  ++m_revision;
}

void MetadataRegistry::setPlayerColor(const std::string& playerId, Rgba8 color)
{
  m_playerColors[playerId] = color;
  ++m_revision;
}

RenderMetadataPtr MetadataRegistry::snapshot(const TileStore& store)
{
  const InternTable& ft = store.factions();
  const InternTable& pt = store.players();

  if (m_cached && m_cachedRevision == m_revision && m_cachedFactionTable == ft.revision() &&
      m_cachedPlayerTable == pt.revision() && m_cachedPlayerNames == store.playerNamesRevision()) {
    return m_cached;
  }

  auto meta = std::make_shared<RenderMetadata>();
  meta->revision = ++m_rebuilds;

  meta->factions.resize(ft.size());
  for (std::size_t i = 0; i < ft.size(); ++i) {
    FactionMeta& fm = meta->factions[i];
    fm.id = ft.ids()[i];
    fm.displayName = fm.id;

    const auto it = m_factions.find(fm.id);
    if (it == m_factions.end()) continue;
    if (!it->second.displayName.empty()) fm.displayName = it->second.displayName;
    fm.color = it->second.color;

    if (!it->second.allianceId.empty()) {
      const auto al = m_alliances.find(it->second.allianceId);
      if (al != m_alliances.end()) {
        fm.hasAlliance = true;
        fm.allianceColor = al->second.color;
      }
    }
  }

  const std::size_t slots = pt.size() + 1;
  meta->playerHasColor.assign(slots, false);
  meta->playerColors.assign(slots, Rgba8{});
  meta->playerNames.assign(slots, std::string());
  for (std::size_t i = 0; i < pt.size(); ++i) {
    const std::uint32_t index = pt.firstIndex() + static_cast<std::uint32_t>(i);
    meta->playerNames[index] = store.playerDisplayName(index);
    const auto it = m_playerColors.find(pt.ids()[i]);
    if (it != m_playerColors.end()) {
      meta->playerHasColor[index] = true;
      meta->playerColors[index] = it->second;
    }
  }

  m_cached = meta;
  m_cachedRevision = m_revision;
  m_cachedFactionTable = ft.revision();
  m_cachedPlayerTable = pt.revision();
  m_cachedPlayerNames = store.playerNamesRevision();
  return m_cached;
}

ColorRules::ColorRules(const RenderTheme& theme, const RenderMetadata* meta)
    : m_theme(theme)
    , m_meta(meta)
{
  for (int i = 0; i <= static_cast<int>(kMaxOverpaint); ++i) m_overpaintRamp[static_cast<std::size_t>(i)] = OverpaintColor(i);
}

Rgba8 ColorRules::resolve(const TileSlot& tile) const
{
  const std::uint16_t fi = tile.factionIndex();
  const bool owned = fi != kNoFaction;

  Rgba8 c = m_theme.blankTile;

  switch (m_theme.mode) {
  case ColorMode::Faction:
    if (owned) c = RgbaFromPacked(tile.color());
    break;
  case ColorMode::Player: {
    const std::uint32_t p = tile.paintedBy();
    c = kUnknownPlayerColor;
    if (m_meta && p != kNoPainter && p < m_meta->playerHasColor.size() && m_meta->playerHasColor[p]) {
      c = m_meta->playerColors[p];
    }
    break;
  }
  case ColorMode::Overpaint:
    c = m_overpaintRamp[std::min<std::size_t>(tile.overpaint(), kMaxOverpaint)];
    break;
  case ColorMode::Alliance:
    if (owned && m_meta) {
      const FactionMeta* fm = m_meta->faction(fi);
      if (fm && fm->hasAlliance) c = fm->allianceColor;
    }
    break;
  }

  if (m_theme.highlightCoreOnly && owned && !tile.isCore()) c = kNonCoreDimColor;
  return c;
}

} // namespace atlas
