#include "atlas/Viewer.hpp"

#include "atlas/Bitmap.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <future>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace atlas {

namespace {

constexpr double kLabelRefreshSeconds = 0.25;
constexpr float kWheelZoomStep = 1.15f;
constexpr float kKeyPanPx = 12.0f;
constexpr const char* kFrameExportPath = "faction_atlas_frame.ppm";

Color ToRaylib(Rgba8 c) { return Color{c.r, c.g, c.b, c.a}; }

bool Ready(const AnalysisFuture& f)
{
  return f.valid() && f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

bool SameGeometry(const FrameGeometry& a, const FrameGeometry& b)
{
  return a.width == b.width && a.height == b.height && a.baseTilePx == b.baseTilePx &&
         a.view.centerX == b.view.centerX && a.view.centerY == b.view.centerY && a.view.zoom == b.view.zoom;
}

bool SameTheme(const RenderTheme& a, const RenderTheme& b)
{
  return a.mode == b.mode && a.blankTile == b.blankTile && a.highlightCoreOnly == b.highlightCoreOnly &&
         a.showSeams == b.showSeams;
}

ColorMode NextColorMode(ColorMode m)
{
  switch (m) {
    case ColorMode::Faction: return ColorMode::Player;
    case ColorMode::Player: return ColorMode::Overpaint;
    case ColorMode::Overpaint: return ColorMode::Alliance;
    case ColorMode::Alliance: return ColorMode::Faction;
  }
  return ColorMode::Faction;
}

Vector2 ToVector(const ScreenPos& p) { return Vector2{static_cast<float>(p.x), static_cast<float>(p.y)}; }

void DrawShadowedText(const std::string& text, int x, int y, int size, Color c)
{
  DrawText(text.c_str(), x + 1, y + 1, size, Color{0, 0, 0, 180});
  DrawText(text.c_str(), x, y, size, c);
}

} // namespace

RaylibContext::RaylibContext(const AtlasConfig& cfg, const char* title)
{
  SetConfigFlags(FLAG_WINDOW_RESIZABLE | FLAG_VSYNC_HINT);
  InitWindow(cfg.windowWidth, cfg.windowHeight, title);
  if (!IsWindowReady()) {
    throw std::runtime_error("could not open a window");
  }
  SetWindowMinSize(320, 240);
  SetTargetFPS(60);
}

RaylibContext::~RaylibContext() { CloseWindow(); }

Viewer::Viewer(const AtlasConfig& cfg, const ViewerOptions& opt)
    : m_cfg(cfg)
    , m_opt(opt)
    , m_rl(cfg, "FactionAtlas")
    , m_store(cfg.gridSize)
    , m_demo(opt.demo)
    , m_render(RenderPipelineConfig{cfg.renderWorkers, cfg.forceSingleThreaded, cfg.renderMinIntervalMs,
                                    cfg.watchdogMs, Rgba8{0, 0, 0, 255}})
    , m_analysis(AnalysisServiceConfig{cfg.analysisWorkers, static_cast<std::size_t>(cfg.analysisCacheCapacity),
                                       cfg.forceSingleThreaded})
{
  SetExitKey(KEY_NULL);

  m_limits.baseTilePx = cfg.baseTilePx;
  m_limits.minZoom = cfg.minZoom;
  m_limits.maxZoom = cfg.maxZoom;

  m_theme.mode = cfg.colorMode;
  m_theme.blankTile = cfg.blankTileColor;
  m_theme.highlightCoreOnly = cfg.highlightCoreOnly;
  m_theme.showSeams = cfg.showSeams;

  if (m_opt.snapshot) {
    std::string err;
    if (!m_store.fullReplace(*m_opt.snapshot, err)) {
      throw std::runtime_error("snapshot rejected: " + err);
    }
    m_opt.snapshot.reset();
    m_demoEnabled = false;
  } else {
    m_demo.seed(m_store, m_meta);
  }

  // Fit the whole grid into the window.
  const float n = static_cast<float>(m_store.gridSize());
  m_view.centerX = n * 0.5f;
  m_view.centerY = n * 0.5f;
  const float fit = static_cast<float>(std::min(GetScreenWidth(), GetScreenHeight())) / (n * m_limits.baseTilePx);
  m_view.zoom = ClampZoom(fit, m_limits);

  m_render.start();
  m_analysis.start();

  std::cout << "[viewer] grid " << m_store.gridSize() << "x" << m_store.gridSize() << ", "
            << (m_render.parallel() ? "parallel" : "single-threaded") << " rendering with "
            << m_render.partitions() << " partition(s)\n";
}

Viewer::~Viewer()
{
  // Workers first: nothing may still be writing into surfaces we are about to drop.
  m_render.shutdown();
  m_analysis.shutdown();
  if (m_hasTexture) UnloadTexture(m_frameTex);
}

FrameGeometry Viewer::geometry() const
{
  FrameGeometry g;
  g.view = m_view;
  g.width = GetScreenWidth();
  g.height = GetScreenHeight();
  g.baseTilePx = m_limits.baseTilePx;
  return g;
}

void Viewer::run()
{
  while (!WindowShouldClose()) {
    const FrameGeometry before = geometry();
    handleInput(before);

    if (m_demoEnabled && !m_paused) {
      m_store.writeBatch(m_demo.step(m_store, m_opt.demoPaintsPerFrame));
    }

    const RenderMetadataPtr meta = m_meta.snapshot(m_store);
    const FrameGeometry geom = geometry();
    requestFrameIfNeeded(geom, meta);

    const auto now = RenderPipeline::Clock::now();
    m_render.tick(now);
    m_render.pump(now);
    if (m_render.presentedGeneration() != m_uploadedGeneration) uploadPresentedFrame();

    m_analysis.pump();
    refreshLabels(meta, GetTime());
    refreshHover(geom);

    BeginDrawing();
    ClearBackground(BLACK);
    if (m_hasTexture) DrawTexture(m_frameTex, 0, 0, WHITE);
    if (m_showLabels) drawLabels(geom);
    drawHover(geom);
    drawHud();
    EndDrawing();
  }
}

void Viewer::handleInput(const FrameGeometry& geom)
{
  const Vector2 mouse = GetMousePosition();

  const float wheel = GetMouseWheelMove();
  if (wheel != 0.0f) {
    const float target = m_view.zoom * std::pow(kWheelZoomStep, wheel);
    m_view = ZoomAround(geom, m_limits, target, mouse.x, mouse.y);
  }

  if (IsMouseButtonDown(MOUSE_BUTTON_LEFT) || IsMouseButtonDown(MOUSE_BUTTON_RIGHT)) {
    const Vector2 d = GetMouseDelta();
    if (d.x != 0.0f || d.y != 0.0f) {
      FrameGeometry g = geom;
      g.view = m_view;
      m_view = PanByPixels(g, d.x, d.y);
    }
  }

  float kx = 0.0f;
  float ky = 0.0f;
  if (IsKeyDown(KEY_LEFT)) kx += kKeyPanPx;
  if (IsKeyDown(KEY_RIGHT)) kx -= kKeyPanPx;
  if (IsKeyDown(KEY_UP)) ky += kKeyPanPx;
  if (IsKeyDown(KEY_DOWN)) ky -= kKeyPanPx;
  if (kx != 0.0f || ky != 0.0f) {
    FrameGeometry g = geom;
    g.view = m_view;
    m_view = PanByPixels(g, kx, ky);
  }

  if (IsKeyPressed(KEY_ONE)) m_theme.mode = ColorMode::Faction;
  if (IsKeyPressed(KEY_TWO)) m_theme.mode = ColorMode::Player;
  if (IsKeyPressed(KEY_THREE)) m_theme.mode = ColorMode::Overpaint;
  if (IsKeyPressed(KEY_FOUR)) m_theme.mode = ColorMode::Alliance;
  if (IsKeyPressed(KEY_M)) m_theme.mode = NextColorMode(m_theme.mode);
  if (IsKeyPressed(KEY_C)) m_theme.highlightCoreOnly = !m_theme.highlightCoreOnly;
  if (IsKeyPressed(KEY_S)) m_theme.showSeams = !m_theme.showSeams;
  if (IsKeyPressed(KEY_L)) m_showLabels = !m_showLabels;
  if (IsKeyPressed(KEY_SPACE)) m_paused = !m_paused;
  if (IsKeyPressed(KEY_F12)) exportFrame();

  if (IsKeyPressed(KEY_R)) {
    const float n = static_cast<float>(m_store.gridSize());
    m_view.centerX = n * 0.5f;
    m_view.centerY = n * 0.5f;
    m_view.zoom = ClampZoom(1.0f, m_limits);
  }
}

void Viewer::requestFrameIfNeeded(const FrameGeometry& geom, const RenderMetadataPtr& meta)
{
  const std::uint64_t version = m_store.version();
  const bool changed = m_forceRequest || version != m_requestedVersion || meta.get() != m_requestedMeta ||
                       !SameGeometry(geom, m_requestedGeom) || !SameTheme(m_theme, m_requestedTheme);
  if (!changed || geom.width <= 0 || geom.height <= 0) return;

  FrameRequest req;
  req.geom = geom;
  req.theme = m_theme;
  req.meta = meta;
  req.reader = m_store.reader();
  m_render.requestRender(std::move(req));

  m_requestedVersion = version;
  m_requestedMeta = meta.get();
  m_requestedGeom = geom;
  m_requestedTheme = m_theme;
  m_forceRequest = false;
}

void Viewer::uploadPresentedFrame()
{
  const Bitmap& surface = m_render.frontSurface();
  if (surface.empty()) return;

  if (!m_hasTexture || m_frameTex.width != surface.width() || m_frameTex.height != surface.height()) {
    if (m_hasTexture) UnloadTexture(m_frameTex);
    Image img = GenImageColor(surface.width(), surface.height(), BLANK);
    m_frameTex = LoadTextureFromImage(img);
    UnloadImage(img);
    SetTextureFilter(m_frameTex, TEXTURE_FILTER_POINT);
    m_hasTexture = true;
  }

  UpdateTexture(m_frameTex, surface.pixels().data());
  m_uploadedGeneration = m_render.presentedGeneration();
}

void Viewer::refreshLabels(const RenderMetadataPtr& meta, double now)
{
  if (!m_labelQueries.empty()) {
    collectLabels(meta);
    return;
  }

  const std::uint64_t version = m_store.version();
  if (version == m_labelsVersion) return;
  if (m_lastLabelRefresh >= 0.0 && now - m_lastLabelRefresh < kLabelRefreshSeconds) return;
  m_lastLabelRefresh = now;

  const TileReader reader = m_store.reader();
  const std::vector<std::uint32_t> counts = m_store.countTilesByFaction();
  for (std::size_t i = 0; i < counts.size(); ++i) {
    if (static_cast<int>(counts[i]) < m_cfg.labelMinTiles) continue;
    const std::uint16_t fi = static_cast<std::uint16_t>(i);
    if (!meta->faction(fi)) continue;

    LabelQuery q;
    q.factionIndex = fi;
    q.tileCount = static_cast<int>(counts[i]);
    q.future = m_analysis.query(reader, fi);
    m_labelQueries.push_back(std::move(q));
  }
  m_labelsVersion = reader.version();

  if (m_labelQueries.empty()) {
    m_labels.clear();
  } else {
    collectLabels(meta);
  }
}

void Viewer::collectLabels(const RenderMetadataPtr& meta)
{
  for (const LabelQuery& q : m_labelQueries) {
    if (!Ready(q.future)) return;
  }

  std::vector<FactionLabel> labels;
  for (const LabelQuery& q : m_labelQueries) {
    const FactionAnalysisPtr a = q.future.get();
    const FactionMeta* fm = meta->faction(q.factionIndex);
    if (!a || !a->ok || !fm) continue;
    const FactionCluster* primary = a->primaryCluster();
    if (!primary) continue;

    FactionLabel l;
    l.factionIndex = q.factionIndex;
    l.factionId = fm->id;
    l.name = fm->displayName;
    l.color = fm->color;
    l.x = primary->centroidX;
    l.y = primary->centroidY;
    l.tileCount = q.tileCount;
    labels.push_back(std::move(l));
  }

  std::stable_sort(labels.begin(), labels.end(),
                   [](const FactionLabel& a, const FactionLabel& b) { return a.tileCount > b.tileCount; });
  m_labels = std::move(labels);
  m_labelQueries.clear();
}

void Viewer::refreshHover(const FrameGeometry& geom)
{
  const Vector2 mouse = GetMousePosition();
  const TileReader reader = m_store.reader();
  m_hoverCell = ScreenToCell(geom, mouse.x, mouse.y, reader.size());

  const std::uint16_t fi = m_hoverCell ? reader.factionIndexAt(m_hoverCell->x, m_hoverCell->y) : kNoFaction;
  if (fi != m_hoverFaction) {
    m_hoverFaction = fi;
    m_hoverFuture.reset();
    m_hoverResult.reset();
    m_hoverOutline.clear();
  }
  if (fi == kNoFaction) return;

  if (m_hoverFuture && Ready(*m_hoverFuture)) {
    const FactionAnalysisPtr a = m_hoverFuture->get();
    if (a && a != m_hoverResult) {
      m_hoverResult = a;
      m_hoverOutline = MergeBorderEdges(a->edges);
    }
    // One request in flight at a time; ask again once the store moved on.
    if (!a || a->version != reader.version()) m_hoverFuture.reset();
  }

  if (!m_hoverFuture && (!m_hoverResult || m_hoverResult->version != reader.version())) {
    m_hoverFuture = m_analysis.query(reader, fi);
  }
}

void Viewer::drawLabels(const FrameGeometry& geom) const
{
  const int fontSize = std::clamp(static_cast<int>(10.0f + 4.0f * m_view.zoom), 10, 24);
  for (const FactionLabel& l : m_labels) {
    const ScreenPos p = GridToScreen(geom, l.x + 0.5, l.y + 0.5);
    if (p.x < -200.0 || p.y < -50.0 || p.x > geom.width + 200.0 || p.y > geom.height + 50.0) continue;

    const std::string& text = l.name.empty() ? l.factionId : l.name;
    const int w = MeasureText(text.c_str(), fontSize);
    const int tx = static_cast<int>(p.x) - w / 2;
    const int ty = static_cast<int>(p.y) - fontSize / 2;
    DrawRectangle(tx - fontSize / 2 - 4, ty + fontSize / 4, fontSize / 2, fontSize / 2, ToRaylib(l.color));
    DrawShadowedText(text, tx, ty, fontSize, WHITE);
  }
}

void Viewer::drawHover(const FrameGeometry& geom) const
{
  if (!m_hoverCell) return;

  for (const BorderEdge& e : m_hoverOutline) {
    const ScreenPos a = GridToScreen(geom, e.a.x, e.a.y);
    const ScreenPos b = GridToScreen(geom, e.b.x, e.b.y);
    DrawLineEx(ToVector(a), ToVector(b), 2.0f, YELLOW);
  }

  const TileReader reader = m_store.reader();
  const std::optional<TileRecord> rec = reader.read(m_hoverCell->x, m_hoverCell->y);
  if (!rec) return;

  std::ostringstream oss;
  oss << "(" << m_hoverCell->x << ", " << m_hoverCell->y << ")";
  if (rec->owned()) {
    const std::string* fid = m_store.factions().idAt(rec->factionIndex);
    oss << "\n" << (fid ? *fid : std::string("?"));
    if (rec->paintedBy != kNoPainter) oss << "\npainted by " << m_store.playerDisplayName(rec->paintedBy);
    oss << "\noverpaint " << static_cast<int>(rec->overpaint);
    if (rec->isCore()) oss << "  core";
    if (m_hoverResult && m_hoverResult->ok) {
      oss << "\n" << m_hoverResult->tileCount << " tiles, " << m_hoverResult->clusters.size() << " cluster(s)";
      if (const FactionCluster* p = m_hoverResult->primaryCluster()) {
        oss << "\nprimary " << p->tileCount << (p->hasCore ? " (core)" : "");
      }
    }
  } else {
    oss << "\nunowned";
  }

  const Vector2 mouse = GetMousePosition();
  const std::string text = oss.str();
  const Vector2 size = MeasureTextEx(GetFontDefault(), text.c_str(), 14.0f, 1.0f);
  const int x = static_cast<int>(mouse.x) + 16;
  const int y = static_cast<int>(mouse.y) + 16;
  DrawRectangle(x - 4, y - 4, static_cast<int>(size.x) + 8, static_cast<int>(size.y) + 8, Color{0, 0, 0, 170});
  DrawText(text.c_str(), x, y, 14, RAYWHITE);
}

void Viewer::drawHud() const
{
  const RenderStats& rs = m_render.stats();
  const AnalysisStats& as = m_analysis.stats();

  std::ostringstream oss;
  oss << GetFPS() << " fps  zoom " << m_view.zoom << "  mode " << ColorModeName(m_theme.mode)
      << (m_theme.highlightCoreOnly ? "  core-only" : "") << (m_theme.showSeams ? "  seams" : "")
      << (m_paused ? "  [paused]" : "") << "\n"
      << "version " << m_store.version() << "  frame " << m_render.presentedGeneration() << "/"
      << m_render.currentGeneration() << "  stale " << rs.stalePartialsDropped << "  failed " << rs.failures
      << "  coalesced " << rs.coalescedRequests << "\n"
      << "analysis: " << as.computed << " computed, " << as.cacheHits << " cached, " << m_analysis.inFlight()
      << " in flight";

  DrawShadowedText(oss.str(), 10, 10, 16, RAYWHITE);
  DrawShadowedText("wheel zoom  drag/arrows pan  1-4/M mode  C core  S seams  L labels  space pause  F12 export", 10,
                   GetScreenHeight() - 24, 14, LIGHTGRAY);
}

void Viewer::exportFrame()
{
  std::string err;
  if (!WritePpm(kFrameExportPath, m_render.frontSurface(), err)) {
    std::cerr << "[viewer] export failed: " << err << "\n";
    return;
  }
  std::cout << "[viewer] wrote " << kFrameExportPath << " (generation " << m_render.presentedGeneration() << ")\n";
}

} // namespace atlas
