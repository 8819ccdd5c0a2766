#pragma once

#include "atlas/Color.hpp"
#include "atlas/ColorRules.hpp"
#include "atlas/TileGrid.hpp"
#include "atlas/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace atlas {

// Territory shape analysis for one faction.
//
// Every entry point takes a TileReader and first copies the faction's cells into a
// private mask, so a single call works on one consistent picture even if the store
// is written concurrently. The result is tagged with reader.version(); callers
// recompute when the store version moves on.
//
// Coordinates: a cell (x, y) covers the unit square [x, x+1] x [y, y+1]. Edge
// endpoints are cell-corner coordinates on that lattice.

struct FactionCluster {
  float centroidX = 0.0f; // mean of member cell x
  float centroidY = 0.0f; // mean of member cell y
  int tileCount = 0;
  bool hasCore = false;

  Point firstCell;       // first member in row-major scan order
  IRect bounds;          // in cells
};

enum class EdgeSide : std::uint8_t {
  Top = 0,
  Bottom = 1,
  Left = 2,
  Right = 3,
};

const char* EdgeSideName(EdgeSide s);

struct BorderEdge {
  Point a;
  Point b;
  EdgeSide side = EdgeSide::Top;

  int length() const { return (a.x == b.x) ? (b.y - a.y) : (b.x - a.x); }
  bool operator==(const BorderEdge& o) const { return a == o.a && b == o.b && side == o.side; }
};

// 8-connected components of the faction's cells, largest first. Equal sizes keep
// row-major order of their first cell.
std::vector<FactionCluster> ComputeFactionClusters(const TileReader& reader, std::uint16_t factionIndex);

// Prefers core-bearing clusters (largest of those), otherwise the largest cluster.
// std::nullopt for an empty list.
std::optional<std::size_t> SelectPrimaryCluster(const std::vector<FactionCluster>& clusters);

// One unit edge per owned-cell side whose 4-neighbour is outside the grid or not
// owned by the faction. Emitted in row-major cell order, sides top/bottom/left/right.
std::vector<BorderEdge> ExtractBorderEdges(const TileReader& reader, std::uint16_t factionIndex);

// Joins collinear, touching unit edges of the same side into maximal runs.
// Output is ordered by side, then line, then start.
std::vector<BorderEdge> MergeBorderEdges(const std::vector<BorderEdge>& edges);

// Owned cells with at least one in-grid 4-neighbour not owned by the faction.
// The grid boundary alone does not make a cell a border tile.
std::vector<Point> FindBorderTiles(const TileReader& reader, std::uint16_t factionIndex);

struct FactionLabel {
  std::uint16_t factionIndex = kNoFaction;
  std::string factionId;
  std::string name;
  Rgba8 color;
  float x = 0.0f; // primary cluster centroid, cell units
  float y = 0.0f;
  int tileCount = 0; // whole faction
};

// One label per faction with at least `minTiles` cells, sorted by tile count
// (descending) then faction index. Factions missing from `meta` get no label.
std::vector<FactionLabel> ComputeFactionLabels(const TileReader& reader, const RenderMetadata& meta,
                                               int minTiles = 5);

struct FactionAnalysis {
  std::uint16_t factionIndex = kNoFaction;
  std::uint64_t version = 0;

  bool ok = true;
  std::string error;

  int tileCount = 0;
  std::vector<FactionCluster> clusters;
  std::optional<std::size_t> primary;
  std::vector<BorderEdge> edges;

  const FactionCluster* primaryCluster() const { return primary ? &clusters[*primary] : nullptr; }
};

// Clusters, primary selection and border edges from one consistent mask.
FactionAnalysis AnalyzeFaction(const TileReader& reader, std::uint16_t factionIndex);

} // namespace atlas
