#include "atlas/LogTee.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <functional>
#include <iostream>
#include <mutex>
#include <sstream>
#include <streambuf>
#include <system_error>
#include <thread>
#include <unordered_map>

namespace atlas {

namespace {

std::filesystem::path Numbered(const std::filesystem::path& base, int n)
{
  if (n <= 0) return base;
  std::filesystem::path p = base;
  p += "." + std::to_string(n);
  return p;
}

std::string UtcStamp()
{
  using namespace std::chrono;
  const auto now = system_clock::now();
  const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count();
  const std::time_t secs = static_cast<std::time_t>(ms / 1000);

  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &secs);
#else
  gmtime_r(&secs, &tm);
#endif

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900, tm.tm_mon + 1,
                tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms % 1000));
  return buf;
}

// Shared sink for both streams.
struct Sink {
  std::mutex mutex;
  std::ofstream file;
  bool prefixLines = true;
  bool prefixThreadId = false;

  void writeLine(std::streambuf* console, const char* tag, const std::string& line)
  {
    std::lock_guard<std::mutex> lock(mutex);
    console->sputn(line.data(), static_cast<std::streamsize>(line.size()));
    console->pubsync();

    if (prefixLines) {
      file << UtcStamp() << " [" << tag << "]";
      if (prefixThreadId) {
        file << " [t=0x" << std::hex << std::hash<std::thread::id>{}(std::this_thread::get_id()) << std::dec << "]";
      }
      file << ' ';
    }
    file.write(line.data(), static_cast<std::streamsize>(line.size()));
    file.flush();
  }
};

// Collects characters per writing thread until a newline, then hands the whole line to the
// sink. Whatever is still pending when the buffer goes away is flushed as a final line.
class LineTeeBuf final : public std::streambuf {
public:
  LineTeeBuf(std::streambuf* console, Sink* sink, const char* tag)
      : m_console(console), m_sink(sink), m_tag(tag)
  {}

  ~LineTeeBuf() override { flushPending(); }

protected:
  int overflow(int ch) override
  {
    if (ch == traits_type::eof()) return traits_type::not_eof(ch);
    const char c = static_cast<char>(ch);
    xsputn(&c, 1);
    return ch;
  }

  std::streamsize xsputn(const char* s, std::streamsize n) override
  {
    std::lock_guard<std::mutex> lock(m_pendingMutex);
    const auto it = m_pending.try_emplace(std::this_thread::get_id()).first;
    std::string& pending = it->second;
    for (std::streamsize i = 0; i < n; ++i) {
      pending.push_back(s[i]);
      if (s[i] == '\n') {
        m_sink->writeLine(m_console, m_tag, pending);
        pending.clear();
      }
    }
    if (pending.empty()) m_pending.erase(it);
    return n;
  }

  // Partial lines stay pending until their newline arrives.
  int sync() override { return 0; }

private:
  void flushPending()
  {
    std::lock_guard<std::mutex> lock(m_pendingMutex);
    for (auto& entry : m_pending) {
      entry.second.push_back('\n');
      m_sink->writeLine(m_console, m_tag, entry.second);
    }
    m_pending.clear();
  }

  // Lock order: m_pendingMutex before the sink's mutex.
  std::mutex m_pendingMutex;
  std::unordered_map<std::thread::id, std::string> m_pending;

  std::streambuf* m_console = nullptr;
  Sink* m_sink = nullptr;
  const char* m_tag = "";
};

} // namespace

struct LogTee::Impl {
  std::filesystem::path path;
  Sink sink;
  std::streambuf* origOut = nullptr;
  std::streambuf* origErr = nullptr;
  std::unique_ptr<LineTeeBuf> outBuf;
  std::unique_ptr<LineTeeBuf> errBuf;
};

LogTee::LogTee() = default;

LogTee::~LogTee()
{
  stop();
}

std::filesystem::path LogTee::path() const
{
  return m_impl ? m_impl->path : std::filesystem::path();
}

bool LogTee::Rotate(const std::filesystem::path& base, int keepFiles, std::string& outError)
{
  outError.clear();
  if (keepFiles <= 0) return true;

  std::error_code ec;
  for (int i = keepFiles; i >= 1; --i) {
    const std::filesystem::path from = Numbered(base, i - 1);
    const std::filesystem::path to = Numbered(base, i);
    if (!std::filesystem::exists(from, ec)) continue;

    std::filesystem::remove(to, ec);
    std::filesystem::rename(from, to, ec);
    if (ec) {
      outError = "cannot rotate '" + from.string() + "' to '" + to.string() + "': " + ec.message();
      return false;
    }
  }
  return true;
}

bool LogTee::start(const LogTeeOptions& opt, std::string& outError)
{
  outError.clear();
  stop();

  if (opt.path.empty()) {
    outError = "log path is empty";
    return false;
  }

  std::error_code ec;
  const std::filesystem::path dir = opt.path.parent_path();
  if (!dir.empty()) {
    std::filesystem::create_directories(dir, ec);
    if (ec) {
      outError = "cannot create log directory '" + dir.string() + "': " + ec.message();
      return false;
    }
  }

  if (!Rotate(opt.path, opt.keepFiles, outError)) return false;

  auto impl = std::make_unique<Impl>();
  impl->path = opt.path;
  impl->sink.prefixLines = opt.prefixLines;
  impl->sink.prefixThreadId = opt.prefixThreadId;
  impl->sink.file.open(opt.path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!impl->sink.file) {
    outError = "cannot open log file: " + opt.path.string();
    return false;
  }

  if (opt.teeStdout) {
    std::cout.flush();
    impl->origOut = std::cout.rdbuf();
    impl->outBuf = std::make_unique<LineTeeBuf>(impl->origOut, &impl->sink, "OUT");
    std::cout.rdbuf(impl->outBuf.get());
  }
  if (opt.teeStderr) {
    impl->origErr = std::cerr.rdbuf();
    impl->errBuf = std::make_unique<LineTeeBuf>(impl->origErr, &impl->sink, "ERR");
    std::cerr.rdbuf(impl->errBuf.get());
  }

  m_impl = std::move(impl);
  return true;
}

void LogTee::stop()
{
  if (!m_impl) return;

  if (m_impl->outBuf) {
    std::cout.flush();
    if (std::cout.rdbuf() == m_impl->outBuf.get()) std::cout.rdbuf(m_impl->origOut);
  }
  if (m_impl->errBuf) {
    std::cerr.flush();
    if (std::cerr.rdbuf() == m_impl->errBuf.get()) std::cerr.rdbuf(m_impl->origErr);
  }

  m_impl->outBuf.reset();
  m_impl->errBuf.reset();
  m_impl->sink.file.flush();
  m_impl.reset();
}

} // namespace atlas
