#pragma once

#include "atlas/Color.hpp"
#include "atlas/ColorRules.hpp"
#include "atlas/Types.hpp"

#include <string>

namespace atlas {

// Runtime settings shared by the viewer and the CLI.
//
// Loaded from JSON with merge semantics (see ConfigIO.hpp) and then overridden by
// command-line flags.
struct AtlasConfig {
  int gridSize = kDefaultGridSize;

  int windowWidth = 1280;
  int windowHeight = 720;

  // Camera.
  float baseTilePx = 16.0f;
  float minZoom = 0.1f;
  float maxZoom = 8.0f;

  // Render pipeline.
  int renderMinIntervalMs = 16;
  int renderWorkers = 0; // 0 = auto
  bool forceSingleThreaded = false;
  int watchdogMs = 0;    // 0 = off

  // Analysis.
  int analysisWorkers = 0; // 0 = auto
  int analysisCacheCapacity = 64;
  int labelMinTiles = 5;

  // Theme.
  Rgba8 blankTileColor{255, 255, 255, 255};
  ColorMode colorMode = ColorMode::Faction;
  bool highlightCoreOnly = false;
  bool showSeams = false;

  // Logging. Empty path = console only.
  std::string logFile;
  int logKeepFiles = 3;
};

} // namespace atlas
