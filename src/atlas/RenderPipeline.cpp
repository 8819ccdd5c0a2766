#include "atlas/RenderPipeline.hpp"

#include "atlas/Rasterizer.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <thread>
#include <utility>

namespace atlas {

RenderPipeline::RenderPipeline(const RenderPipelineConfig& cfg)
    : m_cfg(cfg)
    , m_compositor(cfg.background)
    , m_mailbox(std::make_shared<Mailbox<RenderMessage>>())
    , m_pool("render")
{
}

RenderPipeline::~RenderPipeline()
{
  shutdown();
}

bool RenderPipeline::start()
{
  if (m_started) return m_parallel;
  m_started = true;

  m_workers = m_cfg.workerCount > 0 ? m_cfg.workerCount : ComputeRenderWorkerCount(std::thread::hardware_concurrency());
  m_parallel = false;

  if (m_cfg.forceSingleThreaded) {
    std::cout << "[render] single-threaded rasterizer (forced by config)\n";
    return false;
  }

  std::string err;
  if (!m_pool.start(m_workers, err)) {
    std::cerr << "[render] worker pool unavailable (" << err << "), using single-threaded rasterizer\n";
    return false;
  }

  m_parallel = true;
  std::cout << "[render] " << m_workers << " render workers\n";
  return true;
}

void RenderPipeline::shutdown()
{
  m_pool.stop();
  m_parallel = false;
}

void RenderPipeline::requestRender(FrameRequest req)
{
  if (m_pending) ++m_stats.coalescedRequests;
  m_pending = std::move(req);
}

std::uint64_t RenderPipeline::tick(Clock::time_point now)
{
  if (!m_pending) return 0;
  if (!m_started) start();

  if (m_lastDispatch) {
    const auto since = std::chrono::duration_cast<std::chrono::milliseconds>(now - *m_lastDispatch);
    if (since.count() < m_cfg.minIntervalMs) return 0;
  }

  FrameRequest req = std::move(*m_pending);
  m_pending.reset();
  return dispatch(std::move(req), now);
}

std::uint64_t RenderPipeline::dispatch(FrameRequest&& req, Clock::time_point now)
{
  const std::uint64_t gen = ++m_generation;
  m_lastDispatch = now;
  m_generationStart = now;
  ++m_stats.generationsDispatched;

  auto job = std::make_shared<Job>();
  job->generation = gen;
  job->partitions = partitions();
  job->req = std::move(req);
  job->hook = m_hook;

  m_compositor.begin(gen, job->partitions, job->req.geom.width, job->req.geom.height);

  if (!m_parallel) {
    renderFallback(job);
    return gen;
  }

  std::shared_ptr<const Job> shared = job;
  std::shared_ptr<Mailbox<RenderMessage>> mailbox = m_mailbox;

  for (int p = 0; p < shared->partitions; ++p) {
    const bool queued = m_pool.submit([shared, mailbox, p]() {
      try {
        if (shared->hook) shared->hook(shared->generation, p);

        const ColorRules rules(shared->req.theme, shared->req.meta.get());
        PartialFrame part;
        part.generation = shared->generation;
        part.partition = p;
        RasterizePartition(shared->req.reader, shared->req.geom, rules, p, shared->partitions, part.bitmap);
        mailbox->post(RenderMessage(std::move(part)));
      } catch (const std::exception& e) {
        mailbox->post(RenderMessage(RenderFailure{shared->generation, p, e.what()}));
      } catch (...) {
        mailbox->post(RenderMessage(RenderFailure{shared->generation, p, "unknown error"}));
      }
    });

    if (!queued) {
      m_mailbox->post(RenderMessage(RenderFailure{gen, p, "render pool is not running"}));
    }
  }

  return gen;
}

void RenderPipeline::renderFallback(const std::shared_ptr<const Job>& job)
{
  PartialFrame part;
  part.generation = job->generation;
  part.partition = 0;

  try {
    if (job->hook) job->hook(job->generation, 0);
    const ColorRules rules(job->req.theme, job->req.meta.get());
    RasterizePartition(job->req.reader, job->req.geom, rules, 0, 1, part.bitmap);
  } catch (const std::exception& e) {
    handle(RenderMessage(RenderFailure{job->generation, 0, e.what()}));
    return;
  } catch (...) {
    handle(RenderMessage(RenderFailure{job->generation, 0, "unknown error"}));
    return;
  }

  ++m_stats.fallbackFrames;
  handle(RenderMessage(std::move(part)));
}

void RenderPipeline::handle(RenderMessage&& msg)
{
  if (RenderFailure* f = std::get_if<RenderFailure>(&msg)) {
    ++m_stats.failures;
    std::cerr << "[render] generation " << f->generation << " partition " << f->partition
              << " failed: " << f->message << "\n";
    m_compositor.markFailed(f->generation, f->partition);
    return;
  }

  PartialFrame& part = std::get<PartialFrame>(msg);
  switch (m_compositor.accept(part.generation, part.partition, std::move(part.bitmap))) {
  case FrameCompositor::Accept::Stored:
    break;
  case FrameCompositor::Accept::Stale:
  case FrameCompositor::Accept::Duplicate:
    ++m_stats.stalePartialsDropped;
    return;
  case FrameCompositor::Accept::Invalid:
    ++m_stats.invalidPartialsDropped;
    std::cerr << "[render] generation " << part.generation << " partition " << part.partition
              << " returned a bitmap that does not match the frame\n";
    return;
  }

  if (m_compositor.complete() && m_compositor.composite()) ++m_stats.framesPresented;
}

bool RenderPipeline::pump(Clock::time_point now)
{
  const std::uint64_t before = m_stats.framesPresented;

  for (RenderMessage& msg : m_mailbox->drain()) handle(std::move(msg));

  if (m_cfg.watchdogMs > 0 && m_compositor.collecting()) {
    const auto age = std::chrono::duration_cast<std::chrono::milliseconds>(now - m_generationStart);
    if (age.count() >= m_cfg.watchdogMs && m_compositor.received() > 0) {
      std::cerr << "[render] watchdog: presenting generation " << m_compositor.collectingGeneration() << " with "
                << m_compositor.received() << "/" << m_compositor.expected() << " partitions\n";
      if (m_compositor.composite()) {
        ++m_stats.framesPresented;
        ++m_stats.watchdogComposites;
      }
    }
  }

  return m_stats.framesPresented != before;
}

bool RenderPipeline::waitForGeneration(std::uint64_t generation, std::chrono::milliseconds timeout)
{
  const Clock::time_point deadline = Clock::now() + timeout;
  for (;;) {
    pump(Clock::now());
    if (presentedGeneration() >= generation) return true;

    const Clock::time_point now = Clock::now();
    if (now >= deadline) return false;
    const auto slice = std::min<Clock::duration>(deadline - now, std::chrono::milliseconds(5));
    m_mailbox->waitFor(slice);
  }
}

bool RenderPipeline::waitWorkersIdle(std::chrono::milliseconds timeout)
{
  if (!m_parallel) return true;
  return m_pool.waitIdle(timeout);
}

} // namespace atlas
