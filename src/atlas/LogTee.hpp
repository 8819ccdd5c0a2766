#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace atlas {

// Copies everything written to std::cout / std::cerr into a log file while still
// printing it to the console. RAII: the original stream buffers come back on stop()
// or destruction.
//
// Writes are line-buffered and serialized, so "[tag] ..." lines posted from worker
// threads never interleave mid-line in the file.

struct LogTeeOptions {
  std::filesystem::path path;

  // Rotated backups: <log>.1 ... <log>.keepFiles. 0 truncates the existing file.
  int keepFiles = 3;

  bool teeStdout = true;
  bool teeStderr = true;

  // File lines get "<UTC timestamp> [OUT|ERR] " in front. Console output is unchanged.
  bool prefixLines = true;
  bool prefixThreadId = false;
};

class LogTee {
public:
  LogTee();
  ~LogTee();

  LogTee(const LogTee&) = delete;
  LogTee& operator=(const LogTee&) = delete;

  bool start(const LogTeeOptions& opt, std::string& outError);
  void stop();

  bool active() const { return static_cast<bool>(m_impl); }
  std::filesystem::path path() const;

  // <base> -> <base>.1 -> ... -> <base>.keepFiles (the oldest is dropped).
  static bool Rotate(const std::filesystem::path& base, int keepFiles, std::string& outError);

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace atlas
