#pragma once

#include <string>

namespace atlas {

// Forwards raylib's TraceLog into the viewer's console streams as "[raylib:LEVEL] ..." lines.
// Warnings and worse go to std::cerr, everything else to std::cout, so an active LogTee files
// them under ERR and OUT like the rest of the viewer's output.
//
// Only compiled into the interactive viewer.

// Accepts the names printed by RaylibLogLevelName, case-insensitively, plus "warning" and "off".
int ParseRaylibLogLevel(const std::string& s, int fallback);
const char* RaylibLogLevelName(int level);

// minLevel < 0 keeps raylib's own threshold.
void InstallRaylibLogCallback(int minLevel = -1);
void UninstallRaylibLogCallback();

} // namespace atlas
