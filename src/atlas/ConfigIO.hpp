#pragma once

#include "atlas/Config.hpp"
#include "atlas/Json.hpp"

#include <string>

namespace atlas {

// JSON form of AtlasConfig. Keys are snake_case; colors are "#rrggbb" strings and
// the color mode is one of "faction", "player", "overpaint", "alliance".
//
// Apply* uses merge semantics: keys that are missing keep the current value.
// A key with the wrong type (or an out-of-range value) fails the whole call and
// names the key in outError; ioCfg is left untouched in that case.

std::string AtlasConfigToJson(const AtlasConfig& cfg, int indentSpaces = 2);

bool ApplyAtlasConfigJson(const JsonValue& root, AtlasConfig& ioCfg, std::string& outError);

bool LoadAtlasConfigJsonFile(const std::string& path, AtlasConfig& ioCfg, std::string& outError);
bool WriteAtlasConfigJsonFile(const std::string& path, const AtlasConfig& cfg, std::string& outError);

// Range checks shared by the JSON loader and the command-line parser.
bool ValidateAtlasConfig(const AtlasConfig& cfg, std::string& outError);

} // namespace atlas
