#include "atlas/ConfigIO.hpp"

#include <cmath>
#include <limits>
#include <utility>

namespace atlas {

namespace {

bool ApplyBool(const JsonValue& root, const char* key, bool& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isBool()) {
    err = std::string("expected boolean for key '") + key + "'";
    return false;
  }
  io = v->boolValue;
  return true;
}

bool ApplyI32(const JsonValue& root, const char* key, int& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isNumber()) {
    err = std::string("expected number for key '") + key + "'";
    return false;
  }
  const double d = v->numberValue;
  if (!std::isfinite(d) || d != std::floor(d) || d < std::numeric_limits<int>::min() ||
      d > std::numeric_limits<int>::max()) {
    err = std::string("expected integer for key '") + key + "'";
    return false;
  }
  io = static_cast<int>(d);
  return true;
}

bool ApplyF32(const JsonValue& root, const char* key, float& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isNumber() || !std::isfinite(v->numberValue)) {
    err = std::string("expected finite number for key '") + key + "'";
    return false;
  }
  io = static_cast<float>(v->numberValue);
  return true;
}

bool ApplyString(const JsonValue& root, const char* key, std::string& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isString()) {
    err = std::string("expected string for key '") + key + "'";
    return false;
  }
  io = v->stringValue;
  return true;
}

bool ApplyColor(const JsonValue& root, const char* key, Rgba8& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  Rgba8 c;
  if (!v->isString() || !ParseHexColor(v->stringValue, c)) {
    err = std::string("expected \"#rrggbb\" color for key '") + key + "'";
    return false;
  }
  io = c;
  return true;
}

bool ApplyMode(const JsonValue& root, const char* key, ColorMode& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  ColorMode m;
  if (!v->isString() || !ParseColorMode(v->stringValue, m)) {
    err = std::string("expected faction|player|overpaint|alliance for key '") + key + "'";
    return false;
  }
  io = m;
  return true;
}

// Config floats are short decimals; keep the float->double widening out of the file.
double F32(float v)
{
  return std::round(static_cast<double>(v) * 1.0e6) / 1.0e6;
}

} // namespace

bool ValidateAtlasConfig(const AtlasConfig& cfg, std::string& outError)
{
  if (cfg.gridSize < 1 || cfg.gridSize > kMaxGridSize) {
    outError = "grid_size must be in [1, " + std::to_string(kMaxGridSize) + "]";
    return false;
  }
  if (cfg.windowWidth < 64 || cfg.windowHeight < 64) {
    outError = "window size must be at least 64x64";
    return false;
  }
  if (!(cfg.baseTilePx > 0.0f)) {
    outError = "base_tile_px must be positive";
    return false;
  }
  if (!(cfg.minZoom > 0.0f) || cfg.maxZoom < cfg.minZoom) {
    outError = "zoom range must satisfy 0 < min_zoom <= max_zoom";
    return false;
  }
  if (cfg.renderMinIntervalMs < 0 || cfg.watchdogMs < 0) {
    outError = "render intervals must not be negative";
    return false;
  }
  if (cfg.renderWorkers < 0 || cfg.analysisWorkers < 0) {
    outError = "worker counts must not be negative";
    return false;
  }
  if (cfg.analysisCacheCapacity < 1) {
    outError = "analysis_cache_capacity must be at least 1";
    return false;
  }
  if (cfg.logKeepFiles < 0) {
    outError = "log_keep_files must not be negative";
    return false;
  }
  return true;
}

bool ApplyAtlasConfigJson(const JsonValue& root, AtlasConfig& ioCfg, std::string& outError)
{
  outError.clear();
  if (!root.isObject()) {
    outError = "config root must be a JSON object";
    return false;
  }

  AtlasConfig c = ioCfg;
  std::string& e = outError;

  if (!ApplyI32(root, "grid_size", c.gridSize, e)) return false;
  if (!ApplyI32(root, "window_width", c.windowWidth, e)) return false;
  if (!ApplyI32(root, "window_height", c.windowHeight, e)) return false;
  if (!ApplyF32(root, "base_tile_px", c.baseTilePx, e)) return false;
  if (!ApplyF32(root, "min_zoom", c.minZoom, e)) return false;
  if (!ApplyF32(root, "max_zoom", c.maxZoom, e)) return false;

  if (const JsonValue* r = FindJsonMember(root, "render")) {
    if (!r->isObject()) {
      e = "expected object for key 'render'";
      return false;
    }
    if (!ApplyI32(*r, "min_interval_ms", c.renderMinIntervalMs, e)) return false;
    if (!ApplyI32(*r, "workers", c.renderWorkers, e)) return false;
    if (!ApplyBool(*r, "single_threaded", c.forceSingleThreaded, e)) return false;
    if (!ApplyI32(*r, "watchdog_ms", c.watchdogMs, e)) return false;
  }

  if (const JsonValue* a = FindJsonMember(root, "analysis")) {
    if (!a->isObject()) {
      e = "expected object for key 'analysis'";
      return false;
    }
    if (!ApplyI32(*a, "workers", c.analysisWorkers, e)) return false;
    if (!ApplyI32(*a, "cache_capacity", c.analysisCacheCapacity, e)) return false;
    if (!ApplyI32(*a, "label_min_tiles", c.labelMinTiles, e)) return false;
  }

  if (const JsonValue* t = FindJsonMember(root, "theme")) {
    if (!t->isObject()) {
      e = "expected object for key 'theme'";
      return false;
    }
    if (!ApplyColor(*t, "blank_tile_color", c.blankTileColor, e)) return false;
    if (!ApplyMode(*t, "color_mode", c.colorMode, e)) return false;
    if (!ApplyBool(*t, "highlight_core_only", c.highlightCoreOnly, e)) return false;
    if (!ApplyBool(*t, "show_seams", c.showSeams, e)) return false;
  }

  if (const JsonValue* l = FindJsonMember(root, "log")) {
    if (!l->isObject()) {
      e = "expected object for key 'log'";
      return false;
    }
    if (!ApplyString(*l, "file", c.logFile, e)) return false;
    if (!ApplyI32(*l, "keep_files", c.logKeepFiles, e)) return false;
  }

  if (!ValidateAtlasConfig(c, e)) return false;

  ioCfg = c;
  return true;
}

std::string AtlasConfigToJson(const AtlasConfig& cfg, int indentSpaces)
{
  JsonValue root = JsonValue::MakeObject();
  root.set("grid_size", JsonValue::MakeNumber(cfg.gridSize));
  root.set("window_width", JsonValue::MakeNumber(cfg.windowWidth));
  root.set("window_height", JsonValue::MakeNumber(cfg.windowHeight));
  root.set("base_tile_px", JsonValue::MakeNumber(F32(cfg.baseTilePx)));
  root.set("min_zoom", JsonValue::MakeNumber(F32(cfg.minZoom)));
  root.set("max_zoom", JsonValue::MakeNumber(F32(cfg.maxZoom)));

  JsonValue render = JsonValue::MakeObject();
  render.set("min_interval_ms", JsonValue::MakeNumber(cfg.renderMinIntervalMs));
  render.set("workers", JsonValue::MakeNumber(cfg.renderWorkers));
  render.set("single_threaded", JsonValue::MakeBool(cfg.forceSingleThreaded));
  render.set("watchdog_ms", JsonValue::MakeNumber(cfg.watchdogMs));
  root.set("render", std::move(render));

  JsonValue analysis = JsonValue::MakeObject();
  analysis.set("workers", JsonValue::MakeNumber(cfg.analysisWorkers));
  analysis.set("cache_capacity", JsonValue::MakeNumber(cfg.analysisCacheCapacity));
  analysis.set("label_min_tiles", JsonValue::MakeNumber(cfg.labelMinTiles));
  root.set("analysis", std::move(analysis));

  JsonValue theme = JsonValue::MakeObject();
  theme.set("blank_tile_color", JsonValue::MakeString(FormatHexColor(cfg.blankTileColor)));
  theme.set("color_mode", JsonValue::MakeString(ColorModeName(cfg.colorMode)));
  theme.set("highlight_core_only", JsonValue::MakeBool(cfg.highlightCoreOnly));
  theme.set("show_seams", JsonValue::MakeBool(cfg.showSeams));
  root.set("theme", std::move(theme));

  JsonValue log = JsonValue::MakeObject();
  log.set("file", JsonValue::MakeString(cfg.logFile));
  log.set("keep_files", JsonValue::MakeNumber(cfg.logKeepFiles));
  root.set("log", std::move(log));

  JsonWriteOptions opt;
  opt.pretty = indentSpaces > 0;
  opt.indent = indentSpaces;
  return JsonStringify(root, opt);
}

bool LoadAtlasConfigJsonFile(const std::string& path, AtlasConfig& ioCfg, std::string& outError)
{
  std::string text;
  if (!ReadTextFile(path, text, outError)) return false;

  JsonValue root;
  if (!ParseJson(text, root, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  if (!ApplyAtlasConfigJson(root, ioCfg, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

bool WriteAtlasConfigJsonFile(const std::string& path, const AtlasConfig& cfg, std::string& outError)
{
  std::string text = AtlasConfigToJson(cfg, 2);
  JsonValue root;
  if (!ParseJson(text, root, outError)) return false;
  return WriteJsonFile(path, root, outError);
}

} // namespace atlas
