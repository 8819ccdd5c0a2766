#pragma once

// Command line model shared by faction_atlas and faction_atlas_cli.
//
// Every flag a front end accepts is declared up front as either a valued flag ("--grid 500") or a
// switch ("--merge"). Anything else starting with "--" is rejected; the rest are positionals.
// Typed readers leave the target untouched when the flag is absent, and every error message names
// the offending flag.

#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace atlas::cli {

// Output surfaces larger than this on either axis are refused.
constexpr int kMaxSurfaceDim = 16384;

struct ArgSpec {
  std::set<std::string> valueFlags;
  std::set<std::string> switches;
};

namespace detail {

inline bool WholeInt(std::string_view s, int& out)
{
  if (s.size() > 1 && s.front() == '+' && s[1] != '-') s.remove_prefix(1);
  const char* end = s.data() + s.size();
  int v = 0;
  const auto res = std::from_chars(s.data(), end, v);
  if (s.empty() || res.ec != std::errc() || res.ptr != end) return false;
  out = v;
  return true;
}

inline bool WholeFloat(std::string_view s, float& out)
{
  // strtod accepts leading blanks; the command line never needs them.
  if (s.empty() || s.front() == ' ' || s.front() == '\t') return false;
  const std::string buf(s);
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(buf.c_str(), &end);
  if (errno != 0 || end != buf.c_str() + buf.size()) return false;
  if (!std::isfinite(v) || std::fabs(v) > 3.0e38) return false;
  out = static_cast<float>(v);
  return true;
}

} // namespace detail

class Args {
public:
  // Splits argv[first..argc). Fails on an undeclared "--flag" or a valued flag at the end.
  bool parse(int argc, const char* const* argv, int first, const ArgSpec& spec, std::string& outError)
  {
    for (int i = first; i < argc; ++i) {
      const std::string a = argv[i];
      if (spec.valueFlags.count(a)) {
        if (i + 1 >= argc) {
          outError = "missing value for " + a;
          return false;
        }
        m_values[a] = argv[++i];
      } else if (spec.switches.count(a)) {
        m_switches.insert(a);
      } else if (a.size() > 2 && a.compare(0, 2, "--") == 0) {
        outError = "unknown option: " + a;
        return false;
      } else {
        m_positional.push_back(a);
      }
    }
    return true;
  }

  const std::vector<std::string>& positional() const { return m_positional; }

  bool has(const std::string& sw) const { return m_switches.count(sw) != 0; }

  const std::string* value(const std::string& flag) const
  {
    const auto it = m_values.find(flag);
    return it == m_values.end() ? nullptr : &it->second;
  }

  bool readInt(const std::string& flag, int& ioValue, std::string& outError) const
  {
    const std::string* v = value(flag);
    if (!v) return true;
    if (!detail::WholeInt(*v, ioValue)) {
      outError = "invalid integer for " + flag + ": " + *v;
      return false;
    }
    return true;
  }

  bool readIntInRange(const std::string& flag, int lo, int hi, int& ioValue, std::string& outError) const
  {
    int v = ioValue;
    if (!readInt(flag, v, outError)) return false;
    if (v < lo || v > hi) {
      outError = flag + " must be in [" + std::to_string(lo) + ", " + std::to_string(hi) + "]";
      return false;
    }
    ioValue = v;
    return true;
  }

  // Demo seeds: decimal or 0x-prefixed hex.
  bool readSeed(const std::string& flag, std::uint64_t& ioValue, std::string& outError) const
  {
    const std::string* v = value(flag);
    if (!v) return true;
    std::string_view s = *v;
    int base = 10;
    if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
      s.remove_prefix(2);
      base = 16;
    }
    std::uint64_t seed = 0;
    const char* end = s.data() + s.size();
    const auto res = std::from_chars(s.data(), end, seed, base);
    if (s.empty() || res.ec != std::errc() || res.ptr != end) {
      outError = "invalid seed for " + flag + ": " + *v;
      return false;
    }
    ioValue = seed;
    return true;
  }

  bool readFloat(const std::string& flag, float& ioValue, std::string& outError) const
  {
    const std::string* v = value(flag);
    if (!v) return true;
    if (!detail::WholeFloat(*v, ioValue)) {
      outError = "invalid number for " + flag + ": " + *v;
      return false;
    }
    return true;
  }

  // "<W>x<H>" pixel size for windows and rendered images.
  bool readSize(const std::string& flag, int& ioW, int& ioH, std::string& outError) const
  {
    const std::string* v = value(flag);
    if (!v) return true;
    const std::string_view s = *v;
    const std::size_t sep = s.find_first_of("xX");
    int w = 0;
    int h = 0;
    if (sep == std::string_view::npos || !detail::WholeInt(s.substr(0, sep), w) ||
        !detail::WholeInt(s.substr(sep + 1), h) || w < 1 || h < 1 || w > kMaxSurfaceDim || h > kMaxSurfaceDim) {
      outError = "invalid " + flag + " (expected WxH, 1.." + std::to_string(kMaxSurfaceDim) + "): " + *v;
      return false;
    }
    ioW = w;
    ioH = h;
    return true;
  }

  // "<X>,<Y>" in grid units, e.g. a viewport center.
  bool readGridPoint(const std::string& flag, float& ioX, float& ioY, std::string& outError) const
  {
    const std::string* v = value(flag);
    if (!v) return true;
    const std::string_view s = *v;
    const std::size_t comma = s.find(',');
    float x = 0.0f;
    float y = 0.0f;
    if (comma == std::string_view::npos || !detail::WholeFloat(s.substr(0, comma), x) ||
        !detail::WholeFloat(s.substr(comma + 1), y)) {
      outError = "invalid " + flag + " (expected x,y): " + *v;
      return false;
    }
    ioX = x;
    ioY = y;
    return true;
  }

private:
  std::vector<std::string> m_positional;
  std::map<std::string, std::string> m_values;
  std::set<std::string> m_switches;
};

// Creates the directory an output file will land in. An empty path is an error.
inline bool EnsureParentDir(const std::filesystem::path& file)
{
  if (file.empty()) return false;
  const std::filesystem::path parent = file.parent_path();
  if (parent.empty()) return true;
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  return !ec;
}

} // namespace atlas::cli
