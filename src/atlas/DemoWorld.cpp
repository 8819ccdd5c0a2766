#include "atlas/DemoWorld.hpp"

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <utility>

namespace atlas {

namespace {

const char* const kFactionNames[] = {
    "Azure Pact",   "Crimson Court", "Verdant Hold",   "Gilded Order", "Iron Reach",    "Pale Dominion",
    "Ember League", "Tidewatch",     "Obsidian Crown", "Sable Host",   "Northmarch",    "Amber Concord",
    "Frost Vale",   "Jade Compact",  "Umber Guild",    "Silver Tide",
};

std::string Numbered(const char* prefix, int i, int width)
{
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%s%0*d", prefix, width, i);
  return buf;
}

} // namespace

DemoWorld::DemoWorld(const DemoWorldConfig& cfg)
    : m_cfg(cfg)
    , m_rng(cfg.seed)
{
  m_cfg.factions = std::clamp(m_cfg.factions, 1, 1000);
  m_cfg.alliances = std::max(0, m_cfg.alliances);
  m_cfg.players = std::max(1, m_cfg.players);
  m_cfg.minRadius = std::max(1, m_cfg.minRadius);
  m_cfg.maxRadius = std::max(m_cfg.minRadius, m_cfg.maxRadius);
}

void DemoWorld::seed(TileStore& store, MetadataRegistry& meta)
{
  const int n = store.gridSize();

  for (int a = 0; a < m_cfg.alliances; ++a) {
    const float hue = 360.0f * static_cast<float>(a) / static_cast<float>(std::max(1, m_cfg.alliances));
    meta.setAlliance(Numbered("alliance-", a, 2), "Alliance " + std::to_string(a + 1), HslToRgb(hue + 15.0f, 0.45f, 0.55f));
  }

  m_factionIds.clear();
  m_factionColors.clear();
  for (int f = 0; f < m_cfg.factions; ++f) {
    const std::string id = Numbered("faction-", f, 3);
    const int nameCount = static_cast<int>(sizeof(kFactionNames) / sizeof(kFactionNames[0]));
    std::string name = kFactionNames[f % nameCount];
    if (f >= nameCount) name += " " + std::to_string(f / nameCount + 1);

    const Rgba8 color = HslToRgb(360.0f * static_cast<float>(f) / static_cast<float>(m_cfg.factions), 0.65f, 0.5f);
    // Every (alliances + 1)-th faction stays unaligned.
    const int slot = f % (m_cfg.alliances + 1);
    const std::string alliance = slot < m_cfg.alliances ? Numbered("alliance-", slot, 2) : std::string();

    meta.setFaction(id, name, color, alliance);
    m_factionIds.push_back(id);
    m_factionColors.push_back(PackRgb(color));
  }

  m_playerIds.clear();
  for (int p = 0; p < m_cfg.players; ++p) {
    const std::string id = Numbered("player-", p, 4);
    store.setPlayerDisplayName(id, "Player " + std::to_string(p + 1));
    meta.setPlayerColor(id, HslToRgb(m_rng.unit() * 360.0f, 0.7f, 0.45f + 0.2f * m_rng.unit()));
    m_playerIds.push_back(id);
  }

  std::vector<TileWrite> batch;
  for (std::size_t f = 0; f < m_factionIds.size(); ++f) {
    const int r = m_rng.between(m_cfg.minRadius, m_cfg.maxRadius);
    const int cx = m_rng.between(0, n - 1);
    const int cy = m_rng.between(0, n - 1);
    const std::string& painter = m_playerIds[m_rng.below(static_cast<std::uint32_t>(m_playerIds.size()))];

    for (int dy = -r; dy <= r; ++dy) {
      for (int dx = -r; dx <= r; ++dx) {
        if (dx * dx + dy * dy > r * r) continue;
        const int x = cx + dx;
        const int y = cy + dy;
        if (x < 0 || y < 0 || x >= n || y >= n) continue;

        TileWrite w;
        w.x = x;
        w.y = y;
        w.factionId = m_factionIds[f];
        w.color = m_factionColors[f];
        w.paintedBy = painter;
        w.paintedAtSeconds = m_clock;
        // The centre and a sparse ring of cells hold core status.
        w.isCore = (dx == 0 && dy == 0) || (m_rng.chance(0.02f) && dx * dx + dy * dy < (r * r) / 4);
        if (w.isCore) w.expiry = static_cast<double>(m_clock) * 1000.0 + 7.0 * 24.0 * 3600.0 * 1000.0;
        batch.push_back(std::move(w));
      }
    }
  }

  const std::size_t applied = store.writeBatch(batch);
  std::cout << "[demo] seeded " << m_factionIds.size() << " factions, " << m_playerIds.size() << " players, "
            << applied << " tiles\n";
}

std::vector<TileWrite> DemoWorld::step(const TileStore& store, int paints)
{
  static constexpr int kDx[4] = {1, -1, 0, 0};
  static constexpr int kDy[4] = {0, 0, 1, -1};

  std::vector<TileWrite> out;
  if (m_factionIds.empty()) return out;

  const TileReader reader = store.reader();
  const int n = reader.size();
  m_clock += 1;

  for (int i = 0; i < paints; ++i) {
    // Find an owned cell to expand from; give up on this paint after a few misses.
    for (int attempt = 0; attempt < 16; ++attempt) {
      const int x = m_rng.between(0, n - 1);
      const int y = m_rng.between(0, n - 1);
      const TileSlot from = reader.slot(x, y);
      const std::uint16_t fi = from.factionIndex();
      if (fi == kNoFaction) continue;

      const int d = static_cast<int>(m_rng.below(4));
      const int tx = x + kDx[d];
      const int ty = y + kDy[d];
      if (!reader.inBounds(tx, ty)) break;

      const TileSlot to = reader.slot(tx, ty);
      if (to.factionIndex() == fi || to.isCore()) break;

      const std::string* id = store.factions().idAt(fi);
      if (!id) break;

      TileWrite w;
      w.x = tx;
      w.y = ty;
      w.factionId = *id;
      w.color = from.color();
      if (!m_playerIds.empty()) {
        w.paintedBy = m_playerIds[m_rng.below(static_cast<std::uint32_t>(m_playerIds.size()))];
      }
      w.overpaint = to.owned() ? static_cast<int>(to.overpaint()) + 1 : 0;
      w.paintedAtSeconds = m_clock;
      out.push_back(std::move(w));
      break;
    }
  }
  return out;
}

} // namespace atlas
