#pragma once

#include "atlas/AnalysisService.hpp"
#include "atlas/Clustering.hpp"
#include "atlas/ColorRules.hpp"
#include "atlas/Config.hpp"
#include "atlas/DemoWorld.hpp"
#include "atlas/RaylibShim.hpp"
#include "atlas/RenderPipeline.hpp"
#include "atlas/Snapshot.hpp"
#include "atlas/TileStore.hpp"
#include "atlas/Viewport.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace atlas {

struct ViewerOptions {
  // Loaded into the store instead of generating a demo world. The demo painter
  // stays idle in that case.
  std::optional<GridSnapshot> snapshot;

  DemoWorldConfig demo;
  int demoPaintsPerFrame = 40;
};

// Owns the raylib window. Constructed before anything that creates GPU resources.
class RaylibContext {
public:
  RaylibContext(const AtlasConfig& cfg, const char* title);
  ~RaylibContext();

  RaylibContext(const RaylibContext&) = delete;
  RaylibContext& operator=(const RaylibContext&) = delete;
};

// Interactive front end: the coordinating thread of the render pipeline and the
// analysis service. Every frame it feeds rule-layer writes into the store, asks for a
// new render when the picture could have changed, pumps both mailboxes and draws the
// last presented surface with labels and the hovered faction's outline on top.
class Viewer {
public:
  Viewer(const AtlasConfig& cfg, const ViewerOptions& opt);
  ~Viewer();

  Viewer(const Viewer&) = delete;
  Viewer& operator=(const Viewer&) = delete;

  void run();

private:
  struct LabelQuery {
    std::uint16_t factionIndex = kNoFaction;
    int tileCount = 0;
    AnalysisFuture future;
  };

  FrameGeometry geometry() const;

  void handleInput(const FrameGeometry& geom);
  void requestFrameIfNeeded(const FrameGeometry& geom, const RenderMetadataPtr& meta);
  void uploadPresentedFrame();

  void refreshLabels(const RenderMetadataPtr& meta, double now);
  void collectLabels(const RenderMetadataPtr& meta);
  void refreshHover(const FrameGeometry& geom);

  void drawLabels(const FrameGeometry& geom) const;
  void drawHover(const FrameGeometry& geom) const;
  void drawHud() const;

  void exportFrame();

  AtlasConfig m_cfg;
  ViewerOptions m_opt;
  RaylibContext m_rl;

  TileStore m_store;
  MetadataRegistry m_meta;
  DemoWorld m_demo;
  bool m_demoEnabled = true;
  bool m_paused = false;

  RenderPipeline m_render;
  AnalysisService m_analysis;

  Viewport m_view;
  ViewportLimits m_limits;
  RenderTheme m_theme;
  bool m_showLabels = true;

  // What the last render request was made for.
  std::uint64_t m_requestedVersion = 0;
  const RenderMetadata* m_requestedMeta = nullptr;
  FrameGeometry m_requestedGeom;
  RenderTheme m_requestedTheme;
  bool m_forceRequest = true;

  Texture2D m_frameTex{};
  bool m_hasTexture = false;
  std::uint64_t m_uploadedGeneration = 0;

  std::vector<LabelQuery> m_labelQueries;
  std::vector<FactionLabel> m_labels;
  std::uint64_t m_labelsVersion = 0;
  double m_lastLabelRefresh = -1.0;

  std::optional<Point> m_hoverCell;
  std::uint16_t m_hoverFaction = kNoFaction;
  std::optional<AnalysisFuture> m_hoverFuture;
  FactionAnalysisPtr m_hoverResult;
  std::vector<BorderEdge> m_hoverOutline;
};

} // namespace atlas
