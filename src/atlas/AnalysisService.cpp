#include "atlas/AnalysisService.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <thread>

namespace atlas {

AnalysisService::AnalysisService(const AnalysisServiceConfig& cfg)
    : m_cfg(cfg)
    , m_analyzer(AnalyzeFaction)
    , m_mailbox(std::make_shared<Mailbox<Reply>>())
    , m_pool("analysis")
{
  if (m_cfg.cacheCapacity == 0) m_cfg.cacheCapacity = 1;
}

AnalysisService::~AnalysisService()
{
  shutdown();
}

bool AnalysisService::start()
{
  if (m_started) return m_parallel;
  m_started = true;

  if (m_cfg.forceSingleThreaded) return false;

  const int threads =
      m_cfg.workerCount > 0 ? m_cfg.workerCount : ComputeAnalysisWorkerCount(std::thread::hardware_concurrency());
  std::string err;
  if (!m_pool.start(threads, err)) {
    std::cerr << "[analysis] worker pool unavailable (" << err << "), analysing on the coordinator\n";
    return false;
  }
  m_parallel = true;
  return true;
}

void AnalysisService::shutdown()
{
  m_pool.stop();
  m_parallel = false;
}

void AnalysisService::run(std::uint64_t requestId, const TileReader& reader, std::uint16_t factionIndex,
                          const Analyzer& analyzer, Mailbox<Reply>& out)
{
  Reply reply;
  reply.requestId = requestId;
  try {
    FactionAnalysis a = analyzer(reader, factionIndex);
    a.factionIndex = factionIndex;
    a.version = reader.version();
    if (!a.ok) {
      reply.error = a.error.empty() ? "analysis reported failure" : a.error;
    } else {
      reply.result = std::make_shared<const FactionAnalysis>(std::move(a));
    }
  } catch (const std::exception& e) {
    reply.error = e.what();
  } catch (...) {
    reply.error = "unknown error";
  }
  out.post(std::move(reply));
}

AnalysisFuture AnalysisService::query(const TileReader& reader, std::uint16_t factionIndex)
{
  if (!m_started) start();
  ++m_stats.queries;

  const std::uint64_t version = reader.version();

  const auto hit = m_cache.find(factionIndex);
  if (hit != m_cache.end() && hit->second.version == version) {
    ++m_stats.cacheHits;
    return hit->second.future;
  }

  const auto running = m_requestIndex.find({factionIndex, version});
  if (running != m_requestIndex.end()) {
    ++m_stats.joinedInFlight;
    return m_requests.at(running->second).future;
  }

  const std::uint64_t id = m_nextRequestId++;
  Request& req = m_requests[id];
  req.factionIndex = factionIndex;
  req.version = version;
  req.future = req.promise.get_future().share();
  m_requestIndex[{factionIndex, version}] = id;
  ++m_stats.dispatched;

  bool queued = false;
  if (m_parallel) {
    std::shared_ptr<Mailbox<Reply>> mailbox = m_mailbox;
    Analyzer analyzer = m_analyzer;
    queued = m_pool.submit([id, reader, factionIndex, analyzer, mailbox]() {
      run(id, reader, factionIndex, analyzer, *mailbox);
    });
  }
  if (!queued) m_local.push_back(LocalJob{id, reader});

  return req.future;
}

void AnalysisService::store(std::uint16_t factionIndex, const FactionAnalysisPtr& result, const AnalysisFuture& future)
{
  auto it = m_cache.find(factionIndex);
  if (it != m_cache.end()) {
    // An older request finishing late must not replace a newer result.
    if (it->second.version > result->version) return;
    it->second = CacheEntry{result->version, ++m_seq, result, future};
    return;
  }

  if (m_cache.size() >= m_cfg.cacheCapacity) {
    auto oldest = std::min_element(m_cache.begin(), m_cache.end(),
                                   [](const auto& a, const auto& b) { return a.second.seq < b.second.seq; });
    m_cache.erase(oldest);
    ++m_stats.evictions;
  }
  m_cache.emplace(factionIndex, CacheEntry{result->version, ++m_seq, result, future});
}

std::size_t AnalysisService::pump()
{
  if (!m_local.empty()) {
    std::vector<LocalJob> jobs;
    jobs.swap(m_local);
    for (const LocalJob& job : jobs) {
      const auto it = m_requests.find(job.requestId);
      if (it == m_requests.end()) continue;
      run(job.requestId, job.reader, it->second.factionIndex, m_analyzer, *m_mailbox);
    }
  }

  std::size_t resolved = 0;
  for (Reply& reply : m_mailbox->drain()) {
    const auto it = m_requests.find(reply.requestId);
    if (it == m_requests.end()) continue;

    Request req = std::move(it->second);
    m_requests.erase(it);
    m_requestIndex.erase({req.factionIndex, req.version});

    if (reply.result) {
      ++m_stats.computed;
      store(req.factionIndex, reply.result, req.future);
      req.promise.set_value(reply.result);
      ++resolved;
      continue;
    }

    ++m_stats.failures;
    std::cerr << "[analysis] faction " << req.factionIndex << " at version " << req.version
              << " failed: " << reply.error << "\n";

    const auto prev = m_cache.find(req.factionIndex);
    if (prev != m_cache.end()) {
      req.promise.set_value(prev->second.result);
    } else {
      auto failed = std::make_shared<FactionAnalysis>();
      failed->factionIndex = req.factionIndex;
      failed->version = req.version;
      failed->ok = false;
      failed->error = reply.error;
      req.promise.set_value(failed);
    }
    ++resolved;
  }
  return resolved;
}

bool AnalysisService::waitFor(const AnalysisFuture& f, std::chrono::milliseconds timeout)
{
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  for (;;) {
    pump();
    if (f.wait_for(std::chrono::seconds(0)) == std::future_status::ready) return true;

    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) return false;
    m_mailbox->waitFor(std::min<std::chrono::steady_clock::duration>(deadline - now, std::chrono::milliseconds(5)));
  }
}

FactionAnalysisPtr AnalysisService::cached(std::uint16_t factionIndex, std::uint64_t version) const
{
  const auto it = m_cache.find(factionIndex);
  if (it == m_cache.end() || it->second.version != version) return nullptr;
  return it->second.result;
}

} // namespace atlas
