#pragma once

#include "atlas/Clustering.hpp"
#include "atlas/Mailbox.hpp"
#include "atlas/TileGrid.hpp"
#include "atlas/WorkerPool.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace atlas {

using FactionAnalysisPtr = std::shared_ptr<const FactionAnalysis>;
using AnalysisFuture = std::shared_future<FactionAnalysisPtr>;

struct AnalysisServiceConfig {
  // 0 = ComputeAnalysisWorkerCount(hardware_concurrency()).
  int workerCount = 0;

  // Factions kept in the result cache; the oldest entry is evicted first.
  std::size_t cacheCapacity = 64;

  // Run analyses on the coordinator inside pump() instead of a pool.
  bool forceSingleThreaded = false;
};

struct AnalysisStats {
  std::uint64_t queries = 0;
  std::uint64_t cacheHits = 0;
  std::uint64_t joinedInFlight = 0;
  std::uint64_t dispatched = 0;
  std::uint64_t computed = 0;
  std::uint64_t failures = 0;
  std::uint64_t evictions = 0;
};

// Coordinator-side front end for cluster and border queries.
//
// query() never blocks. It answers from the cache when the cached result was
// computed at the reader's store version, joins an identical request that is
// already running, or dispatches a new analysis to the pool. Futures are only
// fulfilled inside pump(), on the coordinator.
//
// A failed analysis resolves to the last good result for that faction when there
// is one, otherwise to a result with ok == false. Failures are never cached.
class AnalysisService {
public:
  using Analyzer = std::function<FactionAnalysis(const TileReader&, std::uint16_t)>;

  explicit AnalysisService(const AnalysisServiceConfig& cfg = AnalysisServiceConfig());
  ~AnalysisService();

  AnalysisService(const AnalysisService&) = delete;
  AnalysisService& operator=(const AnalysisService&) = delete;

  // Returns true when a worker pool is running.
  bool start();
  void shutdown();

  AnalysisFuture query(const TileReader& reader, std::uint16_t factionIndex);

  // Resolves finished requests. Returns how many futures were fulfilled.
  std::size_t pump();

  // Headless helper: pumps until `f` is ready or the timeout passes.
  bool waitFor(const AnalysisFuture& f, std::chrono::milliseconds timeout);

  // Cached result for exactly this (faction, version), if any.
  FactionAnalysisPtr cached(std::uint16_t factionIndex, std::uint64_t version) const;

  std::size_t cacheSize() const { return m_cache.size(); }
  std::size_t inFlight() const { return m_requests.size(); }
  const AnalysisStats& stats() const { return m_stats; }

  // Replaces AnalyzeFaction (instrumentation and fault injection).
  void setAnalyzer(Analyzer fn) { m_analyzer = std::move(fn); }

private:
  struct CacheEntry {
    std::uint64_t version = 0;
    std::uint64_t seq = 0;
    FactionAnalysisPtr result;
    AnalysisFuture future;
  };

  struct Request {
    std::uint16_t factionIndex = kNoFaction;
    std::uint64_t version = 0;
    std::promise<FactionAnalysisPtr> promise;
    AnalysisFuture future;
  };

  struct Reply {
    std::uint64_t requestId = 0;
    FactionAnalysisPtr result; // null on failure
    std::string error;
  };

  // Synchronous jobs queued when no pool is running; executed by pump().
  struct LocalJob {
    std::uint64_t requestId = 0;
    TileReader reader;
  };

  static void run(std::uint64_t requestId, const TileReader& reader, std::uint16_t factionIndex,
                  const Analyzer& analyzer, Mailbox<Reply>& out);
  void store(std::uint16_t factionIndex, const FactionAnalysisPtr& result, const AnalysisFuture& future);

  AnalysisServiceConfig m_cfg;
  bool m_started = false;
  bool m_parallel = false;
  Analyzer m_analyzer;

  std::map<std::uint16_t, CacheEntry> m_cache;
  std::uint64_t m_seq = 0;

  std::uint64_t m_nextRequestId = 1;
  std::map<std::uint64_t, Request> m_requests;
  std::map<std::pair<std::uint16_t, std::uint64_t>, std::uint64_t> m_requestIndex;
  std::vector<LocalJob> m_local;

  AnalysisStats m_stats;

  std::shared_ptr<Mailbox<Reply>> m_mailbox;
  WorkerPool m_pool;
};

} // namespace atlas
