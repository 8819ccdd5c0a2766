#include "atlas/Clustering.hpp"

#include <algorithm>
#include <map>
#include <tuple>
#include <utility>

namespace atlas {

namespace {

constexpr std::uint8_t kOwned = 1u;
constexpr std::uint8_t kCore = 2u;

// Point-in-time copy of one faction's cells.
struct FactionMask {
  int n = 0;
  std::vector<std::uint8_t> bits; // kOwned | kCore per cell
  std::vector<std::size_t> cells; // row-major

  bool owned(int x, int y) const
  {
    if (x < 0 || y < 0 || x >= n || y >= n) return false;
    return (bits[static_cast<std::size_t>(y) * static_cast<std::size_t>(n) + static_cast<std::size_t>(x)] & kOwned) != 0;
  }
};

FactionMask BuildMask(const TileReader& reader, std::uint16_t factionIndex)
{
  FactionMask m;
  if (!reader.valid() || factionIndex == kNoFaction) return m;

  m.n = reader.size();
  m.bits.assign(static_cast<std::size_t>(m.n) * static_cast<std::size_t>(m.n), 0u);

  for (int y = 0; y < m.n; ++y) {
    for (int x = 0; x < m.n; ++x) {
      const TileSlot s = reader.slot(x, y);
      if (s.factionIndex() != factionIndex) continue;
      const std::size_t i = static_cast<std::size_t>(y) * static_cast<std::size_t>(m.n) + static_cast<std::size_t>(x);
      m.bits[i] = static_cast<std::uint8_t>(kOwned | (s.isCore() ? kCore : 0u));
      m.cells.push_back(i);
    }
  }
  return m;
}

std::vector<FactionCluster> ClustersFromMask(const FactionMask& m)
{
  std::vector<FactionCluster> out;
  if (m.cells.empty()) return out;

  static constexpr int kDx[8] = {0, 0, 1, -1, 1, 1, -1, -1};
  static constexpr int kDy[8] = {1, -1, 0, 0, 1, -1, 1, -1};

  const std::size_t n = static_cast<std::size_t>(m.n);
  std::vector<std::uint8_t> visited(m.bits.size(), 0u);
  std::vector<std::size_t> queue;
  queue.reserve(m.cells.size());

  for (std::size_t start : m.cells) {
    if (visited[start]) continue;

    FactionCluster c;
    c.firstCell = Point{static_cast<int>(start % n), static_cast<int>(start / n)};
    int minX = c.firstCell.x, maxX = c.firstCell.x, minY = c.firstCell.y, maxY = c.firstCell.y;
    double sumX = 0.0;
    double sumY = 0.0;

    queue.clear();
    queue.push_back(start);
    visited[start] = 1u;

    for (std::size_t head = 0; head < queue.size(); ++head) {
      const std::size_t cur = queue[head];
      const int x = static_cast<int>(cur % n);
      const int y = static_cast<int>(cur / n);

      sumX += x;
      sumY += y;
      ++c.tileCount;
      if (m.bits[cur] & kCore) c.hasCore = true;
      minX = std::min(minX, x);
      maxX = std::max(maxX, x);
      minY = std::min(minY, y);
      maxY = std::max(maxY, y);

      for (int k = 0; k < 8; ++k) {
        const int nx = x + kDx[k];
        const int ny = y + kDy[k];
        if (!m.owned(nx, ny)) continue;
        const std::size_t ni = static_cast<std::size_t>(ny) * n + static_cast<std::size_t>(nx);
        if (visited[ni]) continue;
        visited[ni] = 1u;
        queue.push_back(ni);
      }
    }

    c.centroidX = static_cast<float>(sumX / c.tileCount);
    c.centroidY = static_cast<float>(sumY / c.tileCount);
    c.bounds = IRect{minX, minY, maxX - minX + 1, maxY - minY + 1};
    out.push_back(c);
  }

  // Clusters were found in row-major order of their first cell; a stable sort keeps
  // that order among equal sizes.
  std::stable_sort(out.begin(), out.end(),
                   [](const FactionCluster& a, const FactionCluster& b) { return a.tileCount > b.tileCount; });
  return out;
}

std::vector<BorderEdge> EdgesFromMask(const FactionMask& m)
{
  std::vector<BorderEdge> out;
  const std::size_t n = static_cast<std::size_t>(m.n);

  for (std::size_t i : m.cells) {
    const int x = static_cast<int>(i % n);
    const int y = static_cast<int>(i / n);

    if (!m.owned(x, y - 1)) out.push_back(BorderEdge{Point{x, y}, Point{x + 1, y}, EdgeSide::Top});
    if (!m.owned(x, y + 1)) out.push_back(BorderEdge{Point{x, y + 1}, Point{x + 1, y + 1}, EdgeSide::Bottom});
    if (!m.owned(x - 1, y)) out.push_back(BorderEdge{Point{x, y}, Point{x, y + 1}, EdgeSide::Left});
    if (!m.owned(x + 1, y)) out.push_back(BorderEdge{Point{x + 1, y}, Point{x + 1, y + 1}, EdgeSide::Right});
  }
  return out;
}

bool Horizontal(EdgeSide s) { return s == EdgeSide::Top || s == EdgeSide::Bottom; }

} // namespace

const char* EdgeSideName(EdgeSide s)
{
  switch (s) {
  case EdgeSide::Top: return "top";
  case EdgeSide::Bottom: return "bottom";
  case EdgeSide::Left: return "left";
  case EdgeSide::Right: return "right";
  }
  return "top";
}

std::vector<FactionCluster> ComputeFactionClusters(const TileReader& reader, std::uint16_t factionIndex)
{
  return ClustersFromMask(BuildMask(reader, factionIndex));
}

std::optional<std::size_t> SelectPrimaryCluster(const std::vector<FactionCluster>& clusters)
{
  if (clusters.empty()) return std::nullopt;

  std::optional<std::size_t> bestCore;
  std::size_t bestAny = 0;
  for (std::size_t i = 0; i < clusters.size(); ++i) {
    const FactionCluster& c = clusters[i];
    if (c.hasCore && (!bestCore || c.tileCount > clusters[*bestCore].tileCount)) bestCore = i;
    if (c.tileCount > clusters[bestAny].tileCount) bestAny = i;
  }
  return bestCore ? bestCore : std::optional<std::size_t>(bestAny);
}

std::vector<BorderEdge> ExtractBorderEdges(const TileReader& reader, std::uint16_t factionIndex)
{
  return EdgesFromMask(BuildMask(reader, factionIndex));
}

std::vector<BorderEdge> MergeBorderEdges(const std::vector<BorderEdge>& edges)
{
  // Sort key: side, fixed coordinate of the line, start along the line.
  auto key = [](const BorderEdge& e) {
    return Horizontal(e.side) ? std::make_tuple(static_cast<int>(e.side), e.a.y, e.a.x)
                              : std::make_tuple(static_cast<int>(e.side), e.a.x, e.a.y);
  };

  std::vector<BorderEdge> sorted = edges;
  std::sort(sorted.begin(), sorted.end(), [&](const BorderEdge& l, const BorderEdge& r) { return key(l) < key(r); });

  std::vector<BorderEdge> out;
  for (const BorderEdge& e : sorted) {
    if (!out.empty()) {
      BorderEdge& last = out.back();
      const bool sameLine = last.side == e.side && (Horizontal(e.side) ? last.a.y == e.a.y : last.a.x == e.a.x);
      if (sameLine && last.b == e.a) {
        last.b = e.b;
        continue;
      }
    }
    out.push_back(e);
  }
  return out;
}

std::vector<Point> FindBorderTiles(const TileReader& reader, std::uint16_t factionIndex)
{
  const FactionMask m = BuildMask(reader, factionIndex);
  const std::size_t n = static_cast<std::size_t>(m.n);

  auto foreign = [&](int x, int y) {
    if (x < 0 || y < 0 || x >= m.n || y >= m.n) return false;
    return !m.owned(x, y);
  };

  std::vector<Point> out;
  for (std::size_t i : m.cells) {
    const int x = static_cast<int>(i % n);
    const int y = static_cast<int>(i / n);
    if (foreign(x, y - 1) || foreign(x, y + 1) || foreign(x - 1, y) || foreign(x + 1, y)) out.push_back(Point{x, y});
  }
  return out;
}

std::vector<FactionLabel> ComputeFactionLabels(const TileReader& reader, const RenderMetadata& meta, int minTiles)
{
  std::vector<FactionLabel> out;
  if (!reader.valid()) return out;

  // One pass to count; clustering only for factions that qualify.
  std::map<std::uint16_t, int> counts;
  const int n = reader.size();
  for (int y = 0; y < n; ++y) {
    for (int x = 0; x < n; ++x) {
      const std::uint16_t fi = reader.slot(x, y).factionIndex();
      if (fi != kNoFaction) ++counts[fi];
    }
  }

  for (const auto& [fi, count] : counts) {
    if (count < minTiles) continue;
    const FactionMeta* fm = meta.faction(fi);
    if (!fm) continue;

    const std::vector<FactionCluster> clusters = ComputeFactionClusters(reader, fi);
    const auto primary = SelectPrimaryCluster(clusters);
    if (!primary) continue;

    FactionLabel l;
    l.factionIndex = fi;
    l.factionId = fm->id;
    l.name = fm->displayName;
    l.color = fm->color;
    l.x = clusters[*primary].centroidX;
    l.y = clusters[*primary].centroidY;
    l.tileCount = count;
    out.push_back(std::move(l));
  }

  std::stable_sort(out.begin(), out.end(),
                   [](const FactionLabel& a, const FactionLabel& b) { return a.tileCount > b.tileCount; });
  return out;
}

FactionAnalysis AnalyzeFaction(const TileReader& reader, std::uint16_t factionIndex)
{
  FactionAnalysis a;
  a.factionIndex = factionIndex;
  a.version = reader.version();

  const FactionMask m = BuildMask(reader, factionIndex);
  a.tileCount = static_cast<int>(m.cells.size());
  a.clusters = ClustersFromMask(m);
  a.primary = SelectPrimaryCluster(a.clusters);
  a.edges = EdgesFromMask(m);
  return a;
}

} // namespace atlas
