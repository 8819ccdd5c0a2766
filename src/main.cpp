#include "atlas/ConfigIO.hpp"
#include "atlas/LogTee.hpp"
#include "atlas/Random.hpp"
#include "atlas/RaylibLog.hpp"
#include "atlas/Snapshot.hpp"
#include "atlas/Types.hpp"
#include "atlas/Viewer.hpp"
#include "cli/CliParse.hpp"

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <utility>

namespace {

void PrintHelp()
{
  std::cout << "faction_atlas (interactive territory viewer)\n\n"
            << "  --config <file.json>    load settings (flags below override it)\n"
            << "  --grid <N>              grid size for the demo world (default 500)\n"
            << "  --window <W>x<H>        window size\n"
            << "  --workers <N>           render workers (0 = auto)\n"
            << "  --single-threaded       rasterize and analyze on the main thread\n"
            << "  --mode <m>              faction | player | overpaint | alliance\n"
            << "  --log <file>            tee console output into a rotated log file\n"
            << "  --seed <u64|0xHEX>      demo world seed (default: time based)\n"
            << "  --snapshot <file.tmap>  view a saved grid instead of the demo world\n"
            << "  --raylib-log <level>    all | trace | debug | info | warn | error | none\n";
}

const atlas::cli::ArgSpec& ViewerSpec()
{
  static const atlas::cli::ArgSpec spec{
      {"--config", "--grid", "--window", "--workers", "--mode", "--log", "--seed", "--snapshot", "--raylib-log"},
      {"--single-threaded", "--help"}};
  return spec;
}

} // namespace

int main(int argc, char** argv)
{
  atlas::AtlasConfig cfg;
  atlas::ViewerOptions opt;
  std::uint64_t seed = 0;
  std::string snapshotPath;
  int raylibLevel = -1;

  atlas::cli::Args args;
  std::string err;
  if (!args.parse(argc, argv, 1, ViewerSpec(), err)) {
    std::cerr << err << "\n";
    PrintHelp();
    return 2;
  }
  if (args.has("--help") || (!args.positional().empty() && args.positional().front() == "-h")) {
    PrintHelp();
    return 0;
  }
  if (!args.positional().empty()) {
    std::cerr << "unexpected argument: " << args.positional().front() << "\n";
    PrintHelp();
    return 2;
  }

  // The config file is applied first so flags override it.
  if (const std::string* path = args.value("--config")) {
    if (!atlas::LoadAtlasConfigJsonFile(*path, cfg, err)) {
      std::cerr << "config error: " << err << "\n";
      return 2;
    }
  }

  if (args.has("--single-threaded")) cfg.forceSingleThreaded = true;
  if (!args.readIntInRange("--grid", 1, atlas::kMaxGridSize, cfg.gridSize, err) ||
      !args.readSize("--window", cfg.windowWidth, cfg.windowHeight, err) ||
      !args.readInt("--workers", cfg.renderWorkers, err) || !args.readSeed("--seed", seed, err)) {
    std::cerr << err << "\n";
    return 2;
  }
  if (const std::string* v = args.value("--mode")) {
    if (!atlas::ParseColorMode(*v, cfg.colorMode)) {
      std::cerr << "invalid value for --mode: " << *v << "\n";
      return 2;
    }
  }
  if (const std::string* v = args.value("--raylib-log")) {
    raylibLevel = atlas::ParseRaylibLogLevel(*v, -2);
    if (raylibLevel == -2) {
      std::cerr << "invalid value for --raylib-log: " << *v << "\n";
      return 2;
    }
  }
  if (const std::string* v = args.value("--log")) cfg.logFile = *v;
  if (const std::string* v = args.value("--snapshot")) snapshotPath = *v;

  atlas::LogTee logTee;
  if (!cfg.logFile.empty()) {
    atlas::LogTeeOptions lopt;
    lopt.path = cfg.logFile;
    lopt.keepFiles = cfg.logKeepFiles;
    if (!logTee.start(lopt, err)) {
      std::cerr << "[log] could not open " << cfg.logFile << ": " << err << "\n";
    }
  }

  if (!snapshotPath.empty()) {
    atlas::GridSnapshot snap;
    if (!atlas::ReadSnapshotFile(snapshotPath, snap, err)) {
      std::cerr << "could not read " << snapshotPath << ": " << err << "\n";
      return 1;
    }
    cfg.gridSize = snap.gridSize;
    opt.snapshot = std::move(snap);
  }

  if (!atlas::ValidateAtlasConfig(cfg, err)) {
    std::cerr << "config error: " << err << "\n";
    return 2;
  }

  opt.demo.seed = (seed != 0) ? seed : atlas::TimeSeed();
  atlas::InstallRaylibLogCallback(raylibLevel);

  try {
    atlas::Viewer viewer(cfg, opt);
    viewer.run();
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << "\n";
    atlas::UninstallRaylibLogCallback();
    return 1;
  } catch (...) {
    std::cerr << "Fatal error: unknown exception\n";
    atlas::UninstallRaylibLogCallback();
    return 1;
  }

  atlas::UninstallRaylibLogCallback();
  return 0;
}
