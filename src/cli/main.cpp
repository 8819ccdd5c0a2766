#include "atlas/Bitmap.hpp"
#include "atlas/Clustering.hpp"
#include "atlas/ColorRules.hpp"
#include "atlas/ConfigIO.hpp"
#include "atlas/DemoWorld.hpp"
#include "atlas/Json.hpp"
#include "atlas/LogTee.hpp"
#include "atlas/RenderPipeline.hpp"
#include "atlas/Snapshot.hpp"
#include "atlas/TileStore.hpp"
#include "atlas/Viewport.hpp"
#include "cli/CliParse.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

using atlas::JsonValue;

void PrintHelp()
{
  std::cout
      << "faction_atlas_cli (headless territory tools)\n\n"
      << "Usage:\n"
      << "  faction_atlas_cli demo-snapshot <out.tmap> [--seed S] [--grid N] [--steps K] [--paints P]\n"
      << "  faction_atlas_cli render <world> --out <img.ppm> [--size WxH] [--zoom Z] [--center X,Y]\n"
      << "                    [--mode M] [--seams] [--core-only] [--workers N] [--single-threaded]\n"
      << "  faction_atlas_cli clusters <world> <factionId>\n"
      << "  faction_atlas_cli edges <world> <factionId> [--merge]\n"
      << "  faction_atlas_cli border-tiles <world> <factionId>\n"
      << "  faction_atlas_cli labels <world> [--min-tiles N]\n"
      << "  faction_atlas_cli stats <world>\n"
      << "  faction_atlas_cli bench [--grid N] [--frames F] [--size WxH] [--workers N]\n"
      << "  faction_atlas_cli config-dump [--config file.json]\n\n"
      << "<world> is a .tmap snapshot path, or --demo (with --seed/--grid/--steps/--paints).\n"
      << "Common: --config <file.json>  --log <file>  --json <out.json> (reports go to stdout otherwise)\n";
}

using atlas::cli::Args;

const atlas::cli::ArgSpec& CliSpec()
{
  static const atlas::cli::ArgSpec spec{
      {"--seed", "--grid", "--steps", "--paints", "--out", "--mode", "--zoom", "--center", "--size", "--workers",
       "--config", "--log", "--json", "--min-tiles", "--frames"},
      {"--demo", "--merge", "--seams", "--core-only", "--single-threaded"}};
  return spec;
}

struct World {
  std::unique_ptr<atlas::TileStore> store;
  atlas::MetadataRegistry meta;
  std::string source;
};

bool BuildDemoWorld(const Args& a, World& out, std::string& outError)
{
  atlas::DemoWorldConfig dc;
  int grid = atlas::kDefaultGridSize;
  int steps = 0;
  int paints = 200;

  if (!a.readSeed("--seed", dc.seed, outError) ||
      !a.readIntInRange("--grid", 1, atlas::kMaxGridSize, grid, outError) ||
      !a.readIntInRange("--steps", 0, 1000000, steps, outError) || !a.readInt("--paints", paints, outError)) {
    return false;
  }

  out.store = std::make_unique<atlas::TileStore>(grid);
  atlas::DemoWorld demo(dc);
  demo.seed(*out.store, out.meta);
  for (int i = 0; i < steps; ++i) {
    out.store->writeBatch(demo.step(*out.store, paints));
  }
  out.source = "demo:" + std::to_string(dc.seed);
  return true;
}

// positional[index] names the world unless --demo is given.
bool LoadWorld(const Args& a, std::size_t index, World& out, std::string& outError)
{
  if (a.has("--demo")) return BuildDemoWorld(a, out, outError);

  if (a.positional().size() <= index) {
    outError = "missing world (snapshot path or --demo)";
    return false;
  }
  const std::string& path = a.positional()[index];

  atlas::GridSnapshot snap;
  if (!atlas::ReadSnapshotFile(path, snap, outError)) return false;

  out.store = std::make_unique<atlas::TileStore>(snap.gridSize);
  if (!out.store->fullReplace(snap, outError)) return false;
  out.source = path;
  return true;
}

bool ResolveFaction(const World& w, const std::string& id, std::uint16_t& out, std::string& outError)
{
  const std::optional<std::uint32_t> fi = w.store->factions().find(id);
  if (!fi) {
    outError = "unknown faction: " + id;
    return false;
  }
  out = static_cast<std::uint16_t>(*fi);
  return true;
}

bool EmitReport(const Args& a, const JsonValue& report, std::string& outError)
{
  if (const std::string* path = a.value("--json")) {
    if (!atlas::cli::EnsureParentDir(*path)) {
      outError = "could not create the directory for " + *path;
      return false;
    }
    return atlas::WriteJsonFile(*path, report, outError);
  }
  std::cout << atlas::JsonStringify(report) << "\n";
  return true;
}

JsonValue PointJson(const atlas::Point& p)
{
  JsonValue v = JsonValue::MakeArray();
  v.push(JsonValue::MakeNumber(p.x));
  v.push(JsonValue::MakeNumber(p.y));
  return v;
}

JsonValue ClusterJson(const atlas::FactionCluster& c)
{
  JsonValue v = JsonValue::MakeObject();
  v.set("tiles", JsonValue::MakeNumber(c.tileCount));
  v.set("has_core", JsonValue::MakeBool(c.hasCore));
  JsonValue centroid = JsonValue::MakeArray();
  centroid.push(JsonValue::MakeNumber(c.centroidX));
  centroid.push(JsonValue::MakeNumber(c.centroidY));
  v.set("centroid", std::move(centroid));
  v.set("first_cell", PointJson(c.firstCell));

  JsonValue b = JsonValue::MakeObject();
  b.set("x", JsonValue::MakeNumber(c.bounds.x));
  b.set("y", JsonValue::MakeNumber(c.bounds.y));
  b.set("w", JsonValue::MakeNumber(c.bounds.w));
  b.set("h", JsonValue::MakeNumber(c.bounds.h));
  v.set("bounds", std::move(b));
  return v;
}

JsonValue ReportHeader(const World& w, const char* kind)
{
  JsonValue r = JsonValue::MakeObject();
  r.set("kind", JsonValue::MakeString(kind));
  r.set("world", JsonValue::MakeString(w.source));
  r.set("grid_size", JsonValue::MakeNumber(w.store->gridSize()));
  r.set("version", JsonValue::MakeNumber(static_cast<double>(w.store->version())));
  return r;
}

int CmdDemoSnapshot(const Args& a)
{
  if (a.positional().empty()) {
    std::cerr << "demo-snapshot: missing output path\n";
    return 2;
  }

  World w;
  std::string err;
  if (!BuildDemoWorld(a, w, err)) {
    std::cerr << "demo-snapshot: " << err << "\n";
    return 2;
  }

  const std::string& out = a.positional()[0];
  const atlas::GridSnapshot snap = w.store->exportSnapshot(static_cast<double>(w.store->version()));
  if (!atlas::cli::EnsureParentDir(out) || !atlas::WriteSnapshotFile(out, snap, err)) {
    std::cerr << "demo-snapshot: could not write " << out << ": " << err << "\n";
    return 1;
  }
  std::cout << "[cli] wrote " << out << " (" << snap.factionIds.size() << " factions, "
            << snap.players.size() << " players)\n";
  return 0;
}

int CmdRender(const Args& a, const atlas::AtlasConfig& cfg)
{
  World w;
  std::string err;
  if (!LoadWorld(a, 0, w, err)) {
    std::cerr << "render: " << err << "\n";
    return 2;
  }
  const std::string* out = a.value("--out");
  if (!out) {
    std::cerr << "render: --out is required\n";
    return 2;
  }

  atlas::FrameGeometry geom;
  geom.width = 1024;
  geom.height = 1024;
  geom.baseTilePx = cfg.baseTilePx;
  if (!a.readSize("--size", geom.width, geom.height, err)) {
    std::cerr << "render: " << err << "\n";
    return 2;
  }

  atlas::ViewportLimits lim;
  lim.baseTilePx = cfg.baseTilePx;
  lim.minZoom = cfg.minZoom;
  lim.maxZoom = cfg.maxZoom;

  const float n = static_cast<float>(w.store->gridSize());
  geom.view.centerX = n * 0.5f;
  geom.view.centerY = n * 0.5f;
  geom.view.zoom = atlas::ClampZoom(static_cast<float>(std::min(geom.width, geom.height)) / (n * lim.baseTilePx), lim);

  if (!a.readFloat("--zoom", geom.view.zoom, err) ||
      !a.readGridPoint("--center", geom.view.centerX, geom.view.centerY, err)) {
    std::cerr << "render: " << err << "\n";
    return 2;
  }
  geom.view.zoom = atlas::ClampZoom(geom.view.zoom, lim);

  atlas::RenderTheme theme;
  theme.mode = cfg.colorMode;
  theme.blankTile = cfg.blankTileColor;
  theme.highlightCoreOnly = cfg.highlightCoreOnly || a.has("--core-only");
  theme.showSeams = cfg.showSeams || a.has("--seams");
  if (const std::string* s = a.value("--mode")) {
    if (!atlas::ParseColorMode(*s, theme.mode)) {
      std::cerr << "render: unknown --mode: " << *s << "\n";
      return 2;
    }
  }

  atlas::RenderPipelineConfig rc;
  rc.workerCount = cfg.renderWorkers;
  rc.forceSingleThreaded = cfg.forceSingleThreaded || a.has("--single-threaded");
  rc.minIntervalMs = 0;
  if (!a.readInt("--workers", rc.workerCount, err)) {
    std::cerr << "render: " << err << "\n";
    return 2;
  }

  atlas::RenderPipeline pipeline(rc);
  pipeline.start();

  atlas::FrameRequest req;
  req.geom = geom;
  req.theme = theme;
  req.meta = w.meta.snapshot(*w.store);
  req.reader = w.store->reader();
  pipeline.requestRender(std::move(req));

  const std::uint64_t gen = pipeline.tick(atlas::RenderPipeline::Clock::now());
  if (gen == 0 || !pipeline.waitForGeneration(gen, std::chrono::seconds(30))) {
    std::cerr << "render: frame " << gen << " did not complete\n";
    pipeline.shutdown();
    return 1;
  }

  if (!atlas::cli::EnsureParentDir(*out) || !atlas::WritePpm(*out, pipeline.frontSurface(), err)) {
    std::cerr << "render: could not write " << *out << ": " << err << "\n";
    pipeline.shutdown();
    return 1;
  }

  std::cout << "[cli] wrote " << *out << " (" << geom.width << "x" << geom.height << ", "
            << atlas::ColorModeName(theme.mode) << ", " << pipeline.partitions() << " partition(s))\n";
  pipeline.shutdown();
  return 0;
}

int CmdClusters(const Args& a)
{
  World w;
  std::string err;
  const std::size_t fidPos = a.has("--demo") ? 0 : 1;
  std::uint16_t fi = atlas::kNoFaction;
  if (!LoadWorld(a, 0, w, err) || a.positional().size() <= fidPos || !ResolveFaction(w, a.positional()[fidPos], fi, err)) {
    std::cerr << "clusters: " << (err.empty() ? "missing faction id" : err) << "\n";
    return 2;
  }

  const atlas::FactionAnalysis an = atlas::AnalyzeFaction(w.store->reader(), fi);

  JsonValue r = ReportHeader(w, "clusters");
  r.set("faction", JsonValue::MakeString(a.positional()[fidPos]));
  r.set("tiles", JsonValue::MakeNumber(an.tileCount));
  r.set("primary", an.primary ? JsonValue::MakeNumber(static_cast<double>(*an.primary)) : JsonValue::MakeNull());
  JsonValue arr = JsonValue::MakeArray();
  for (const atlas::FactionCluster& c : an.clusters) arr.push(ClusterJson(c));
  r.set("clusters", std::move(arr));

  if (!EmitReport(a, r, err)) {
    std::cerr << "clusters: " << err << "\n";
    return 1;
  }
  return 0;
}

int CmdEdges(const Args& a)
{
  World w;
  std::string err;
  const std::size_t fidPos = a.has("--demo") ? 0 : 1;
  std::uint16_t fi = atlas::kNoFaction;
  if (!LoadWorld(a, 0, w, err) || a.positional().size() <= fidPos || !ResolveFaction(w, a.positional()[fidPos], fi, err)) {
    std::cerr << "edges: " << (err.empty() ? "missing faction id" : err) << "\n";
    return 2;
  }

  std::vector<atlas::BorderEdge> edges = atlas::ExtractBorderEdges(w.store->reader(), fi);
  const std::size_t unitEdges = edges.size();
  if (a.has("--merge")) edges = atlas::MergeBorderEdges(edges);

  JsonValue r = ReportHeader(w, "edges");
  r.set("faction", JsonValue::MakeString(a.positional()[fidPos]));
  r.set("unit_edges", JsonValue::MakeNumber(static_cast<double>(unitEdges)));
  r.set("merged", JsonValue::MakeBool(a.has("--merge")));
  JsonValue arr = JsonValue::MakeArray();
  for (const atlas::BorderEdge& e : edges) {
    JsonValue v = JsonValue::MakeObject();
    v.set("side", JsonValue::MakeString(atlas::EdgeSideName(e.side)));
    v.set("a", PointJson(e.a));
    v.set("b", PointJson(e.b));
    arr.push(std::move(v));
  }
  r.set("edges", std::move(arr));

  if (!EmitReport(a, r, err)) {
    std::cerr << "edges: " << err << "\n";
    return 1;
  }
  return 0;
}

int CmdBorderTiles(const Args& a)
{
  World w;
  std::string err;
  const std::size_t fidPos = a.has("--demo") ? 0 : 1;
  std::uint16_t fi = atlas::kNoFaction;
  if (!LoadWorld(a, 0, w, err) || a.positional().size() <= fidPos || !ResolveFaction(w, a.positional()[fidPos], fi, err)) {
    std::cerr << "border-tiles: " << (err.empty() ? "missing faction id" : err) << "\n";
    return 2;
  }

  const std::vector<atlas::Point> tiles = atlas::FindBorderTiles(w.store->reader(), fi);

  JsonValue r = ReportHeader(w, "border_tiles");
  r.set("faction", JsonValue::MakeString(a.positional()[fidPos]));
  JsonValue arr = JsonValue::MakeArray();
  for (const atlas::Point& p : tiles) arr.push(PointJson(p));
  r.set("tiles", std::move(arr));

  if (!EmitReport(a, r, err)) {
    std::cerr << "border-tiles: " << err << "\n";
    return 1;
  }
  return 0;
}

int CmdLabels(const Args& a, const atlas::AtlasConfig& cfg)
{
  World w;
  std::string err;
  int minTiles = cfg.labelMinTiles;
  if (!LoadWorld(a, 0, w, err) || !a.readInt("--min-tiles", minTiles, err)) {
    std::cerr << "labels: " << err << "\n";
    return 2;
  }

  const atlas::RenderMetadataPtr meta = w.meta.snapshot(*w.store);
  const std::vector<atlas::FactionLabel> labels = atlas::ComputeFactionLabels(w.store->reader(), *meta, minTiles);

  JsonValue r = ReportHeader(w, "labels");
  JsonValue arr = JsonValue::MakeArray();
  for (const atlas::FactionLabel& l : labels) {
    JsonValue v = JsonValue::MakeObject();
    v.set("faction", JsonValue::MakeString(l.factionId));
    v.set("name", JsonValue::MakeString(l.name));
    v.set("color", JsonValue::MakeString(atlas::FormatHexColor(l.color)));
    v.set("x", JsonValue::MakeNumber(l.x));
    v.set("y", JsonValue::MakeNumber(l.y));
    v.set("tiles", JsonValue::MakeNumber(l.tileCount));
    arr.push(std::move(v));
  }
  r.set("labels", std::move(arr));

  if (!EmitReport(a, r, err)) {
    std::cerr << "labels: " << err << "\n";
    return 1;
  }
  return 0;
}

int CmdStats(const Args& a)
{
  World w;
  std::string err;
  if (!LoadWorld(a, 0, w, err)) {
    std::cerr << "stats: " << err << "\n";
    return 2;
  }

  const std::vector<std::uint32_t> counts = w.store->countTilesByFaction();
  std::vector<std::size_t> order(counts.size());
  for (std::size_t i = 0; i < order.size(); ++i) order[i] = i;
  std::stable_sort(order.begin(), order.end(), [&](std::size_t x, std::size_t y) { return counts[x] > counts[y]; });

  std::uint64_t owned = 0;
  JsonValue arr = JsonValue::MakeArray();
  for (std::size_t i : order) {
    owned += counts[i];
    JsonValue v = JsonValue::MakeObject();
    v.set("faction", JsonValue::MakeString(w.store->factions().ids()[i]));
    v.set("tiles", JsonValue::MakeNumber(counts[i]));
    arr.push(std::move(v));
  }

  JsonValue r = ReportHeader(w, "stats");
  r.set("owned_tiles", JsonValue::MakeNumber(static_cast<double>(owned)));
  r.set("players", JsonValue::MakeNumber(static_cast<double>(w.store->players().size())));
  r.set("factions", std::move(arr));

  if (!EmitReport(a, r, err)) {
    std::cerr << "stats: " << err << "\n";
    return 1;
  }
  return 0;
}

// Renders a changing demo world frame after frame, then analyzes every faction.
int CmdBench(const Args& a, const atlas::AtlasConfig& cfg)
{
  using Clock = std::chrono::steady_clock;

  World w;
  std::string err;
  int frames = 60;
  atlas::RenderPipelineConfig rc;
  rc.workerCount = cfg.renderWorkers;
  rc.forceSingleThreaded = cfg.forceSingleThreaded || a.has("--single-threaded");
  rc.minIntervalMs = 0;

  atlas::FrameGeometry geom;
  geom.width = 1280;
  geom.height = 720;
  geom.baseTilePx = cfg.baseTilePx;
  if (!a.readSize("--size", geom.width, geom.height, err) || !BuildDemoWorld(a, w, err) ||
      !a.readIntInRange("--frames", 0, 100000, frames, err) || !a.readInt("--workers", rc.workerCount, err)) {
    std::cerr << "bench: " << err << "\n";
    return 2;
  }

  const float n = static_cast<float>(w.store->gridSize());
  geom.view.centerX = n * 0.5f;
  geom.view.centerY = n * 0.5f;
  geom.view.zoom = static_cast<float>(std::min(geom.width, geom.height)) / (n * geom.baseTilePx);

  atlas::RenderPipeline pipeline(rc);
  pipeline.start();

  const Clock::time_point t0 = Clock::now();
  int presented = 0;
  for (int f = 0; f < frames; ++f) {
    atlas::FrameRequest req;
    req.geom = geom;
    req.theme.mode = cfg.colorMode;
    req.meta = w.meta.snapshot(*w.store);
    req.reader = w.store->reader();
    pipeline.requestRender(std::move(req));

    const std::uint64_t gen = pipeline.tick(Clock::now());
    if (gen != 0 && pipeline.waitForGeneration(gen, std::chrono::seconds(30))) ++presented;

    // Shift the picture a little so every frame differs.
    geom.view.centerX += 0.25f;
  }
  const double renderMs = std::chrono::duration<double, std::milli>(Clock::now() - t0).count();
  pipeline.shutdown();

  const atlas::TileReader reader = w.store->reader();
  const Clock::time_point t1 = Clock::now();
  std::size_t clusters = 0;
  for (std::size_t i = 0; i < w.store->factions().size(); ++i) {
    clusters += atlas::AnalyzeFaction(reader, static_cast<std::uint16_t>(i)).clusters.size();
  }
  const double analysisMs = std::chrono::duration<double, std::milli>(Clock::now() - t1).count();

  JsonValue r = ReportHeader(w, "bench");
  r.set("partitions", JsonValue::MakeNumber(pipeline.partitions()));
  r.set("frames", JsonValue::MakeNumber(frames));
  r.set("presented", JsonValue::MakeNumber(presented));
  r.set("render_ms_total", JsonValue::MakeNumber(renderMs));
  r.set("render_ms_per_frame", JsonValue::MakeNumber(frames > 0 ? renderMs / frames : 0.0));
  r.set("analysis_ms_all_factions", JsonValue::MakeNumber(analysisMs));
  r.set("clusters", JsonValue::MakeNumber(static_cast<double>(clusters)));

  if (!EmitReport(a, r, err)) {
    std::cerr << "bench: " << err << "\n";
    return 1;
  }
  return 0;
}

int CmdConfigDump(const atlas::AtlasConfig& cfg)
{
  std::cout << atlas::AtlasConfigToJson(cfg) << "\n";
  return 0;
}

int Run(int argc, char** argv)
{
  if (argc < 2) {
    PrintHelp();
    return 2;
  }

  const std::string cmd = argv[1];
  if (cmd == "--help" || cmd == "-h" || cmd == "help") {
    PrintHelp();
    return 0;
  }

  Args args;
  std::string err;
  if (!args.parse(argc, argv, 2, CliSpec(), err)) {
    std::cerr << err << "\n";
    return 2;
  }

  atlas::AtlasConfig cfg;
  if (const std::string* path = args.value("--config")) {
    if (!atlas::LoadAtlasConfigJsonFile(*path, cfg, err)) {
      std::cerr << "config error: " << err << "\n";
      return 2;
    }
  }

  atlas::LogTee logTee;
  if (const std::string* path = args.value("--log")) {
    atlas::LogTeeOptions lopt;
    lopt.path = *path;
    lopt.keepFiles = cfg.logKeepFiles;
    if (!logTee.start(lopt, err)) {
      std::cerr << "[log] could not open " << *path << ": " << err << "\n";
    }
  }

  if (cmd == "demo-snapshot") return CmdDemoSnapshot(args);
  if (cmd == "render") return CmdRender(args, cfg);
  if (cmd == "clusters") return CmdClusters(args);
  if (cmd == "edges") return CmdEdges(args);
  if (cmd == "border-tiles") return CmdBorderTiles(args);
  if (cmd == "labels") return CmdLabels(args, cfg);
  if (cmd == "stats") return CmdStats(args);
  if (cmd == "bench") return CmdBench(args, cfg);
  if (cmd == "config-dump") return CmdConfigDump(cfg);

  std::cerr << "unknown command: " << cmd << "\n";
  PrintHelp();
  return 2;
}

} // namespace

int main(int argc, char** argv)
{
  try {
    return Run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << "\n";
    return 1;
  }
}
