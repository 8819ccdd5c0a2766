#include "atlas/RaylibLog.hpp"

#include "atlas/RaylibShim.hpp"

#include <atomic>
#include <cctype>
#include <iostream>
#include <string>

namespace atlas {

namespace {

struct LevelName {
  const char* name;
  int level;
};

// First entry per level is its canonical name.
constexpr LevelName kLevels[] = {
    {"all", LOG_ALL},         {"trace", LOG_TRACE}, {"debug", LOG_DEBUG}, {"info", LOG_INFO},
    {"warn", LOG_WARNING},    {"warning", LOG_WARNING}, {"error", LOG_ERROR}, {"fatal", LOG_FATAL},
    {"none", LOG_NONE},       {"off", LOG_NONE},
};

std::atomic<int> g_minLevel{-1};
std::atomic<bool> g_installed{false};

bool SameLetters(const std::string& a, const char* b)
{
  std::size_t i = 0;
  for (; i < a.size() && b[i] != '\0'; ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != b[i]) return false;
  }
  return i == a.size() && b[i] == '\0';
}

void ForwardTraceLog(int logLevel, const char* text, va_list args)
{
  const int minLevel = g_minLevel.load(std::memory_order_relaxed);
  if (minLevel >= 0 && logLevel < minLevel) return;

  char message[2048] = "(empty)";
  if (text) std::vsnprintf(message, sizeof(message), text, args);

  std::string line = message;
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();

  std::string level = RaylibLogLevelName(logLevel);
  for (char& c : level) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

  // One insertion per line keeps it whole under the LogTee line buffer.
  std::ostream& os = (logLevel >= LOG_WARNING) ? std::cerr : std::cout;
  os << ("[raylib:" + level + "] " + line + "\n");
}

} // namespace

int ParseRaylibLogLevel(const std::string& s, int fallback)
{
  for (const LevelName& l : kLevels) {
    if (SameLetters(s, l.name)) return l.level;
  }
  return fallback;
}

const char* RaylibLogLevelName(int level)
{
  for (const LevelName& l : kLevels) {
    if (l.level == level) return l.name;
  }
  return "log";
}

void InstallRaylibLogCallback(int minLevel)
{
  g_minLevel.store(minLevel, std::memory_order_relaxed);
  if (minLevel >= 0) SetTraceLogLevel(minLevel);
  SetTraceLogCallback(ForwardTraceLog);
  g_installed.store(true);
}

void UninstallRaylibLogCallback()
{
  // A null callback restores raylib's built-in printf logger.
  if (g_installed.exchange(false)) SetTraceLogCallback(nullptr);
}

} // namespace atlas
