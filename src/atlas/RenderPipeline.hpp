#pragma once

#include "atlas/Bitmap.hpp"
#include "atlas/ColorRules.hpp"
#include "atlas/FrameCompositor.hpp"
#include "atlas/Mailbox.hpp"
#include "atlas/TileGrid.hpp"
#include "atlas/Viewport.hpp"
#include "atlas/WorkerPool.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace atlas {

struct RenderPipelineConfig {
  // 0 = ComputeRenderWorkerCount(hardware_concurrency()).
  int workerCount = 0;

  // Rasterize on the calling thread only.
  bool forceSingleThreaded = false;

  // Requests arriving faster than this are coalesced into the next tick.
  int minIntervalMs = 16;

  // 0 = off. Otherwise a generation still incomplete after this long is
  // composited from the partials that did arrive.
  int watchdogMs = 0;

  // Out-of-map color under the partials.
  Rgba8 background{0, 0, 0, 255};
};

// Everything a worker needs for one frame. Immutable once dispatched.
struct FrameRequest {
  FrameGeometry geom;
  RenderTheme theme;
  RenderMetadataPtr meta;
  TileReader reader;
};

struct RenderStats {
  std::uint64_t generationsDispatched = 0;
  std::uint64_t framesPresented = 0;
  std::uint64_t stalePartialsDropped = 0;
  std::uint64_t invalidPartialsDropped = 0;
  std::uint64_t failures = 0;
  std::uint64_t coalescedRequests = 0;
  std::uint64_t watchdogComposites = 0;
  std::uint64_t fallbackFrames = 0;
};

struct PartialFrame {
  std::uint64_t generation = 0;
  int partition = 0;
  Bitmap bitmap;
};

struct RenderFailure {
  std::uint64_t generation = 0;
  int partition = 0;
  std::string message;
};

using RenderMessage = std::variant<PartialFrame, RenderFailure>;

// Coordinator side of the parallel renderer.
//
// All members are called from the coordinating thread. Rows are split across W
// workers by (row % W); each worker answers with a full-size transparent bitmap
// tagged with the generation it rendered. pump() keeps only partials for the
// newest generation and presents it once all W have arrived.
//
// Starting a new generation is the only cancellation: work for older generations
// still runs but its results are dropped on arrival.
class RenderPipeline {
public:
  using Clock = std::chrono::steady_clock;

  // Called on the worker (or the coordinator in single-threaded mode) before each
  // partition is rasterized. Throwing from it reports a failure for that partition.
  using RasterHook = std::function<void(std::uint64_t generation, int partition)>;

  explicit RenderPipeline(const RenderPipelineConfig& cfg = RenderPipelineConfig());
  ~RenderPipeline();

  RenderPipeline(const RenderPipeline&) = delete;
  RenderPipeline& operator=(const RenderPipeline&) = delete;

  // Starts the worker pool, or settles on the single-threaded rasterizer when the
  // config forces it or threads cannot be created. Returns true for parallel mode.
  bool start();
  void shutdown();

  bool parallel() const { return m_parallel; }
  int partitions() const { return m_parallel ? m_workers : 1; }

  // Replaces any not-yet-dispatched request (the latest viewport wins).
  void requestRender(FrameRequest req);
  bool hasPendingRequest() const { return m_pending.has_value(); }

  // Dispatches the pending request when the minimum interval has passed.
  // Returns the dispatched generation, or 0 when nothing was dispatched.
  std::uint64_t tick(Clock::time_point now);

  // Drains worker messages. Returns true when a new frame was presented.
  bool pump(Clock::time_point now);

  // Headless helper: pumps until `generation` (or a newer one) is presented.
  bool waitForGeneration(std::uint64_t generation, std::chrono::milliseconds timeout);

  // Blocks until every queued partition has finished (used by tools and tests).
  bool waitWorkersIdle(std::chrono::milliseconds timeout);

  void setRasterHook(RasterHook hook) { m_hook = std::move(hook); }

  const Bitmap& frontSurface() const { return m_compositor.front(); }
  int frontIndex() const { return m_compositor.frontIndex(); }
  std::uint64_t presentedGeneration() const { return m_compositor.presentedGeneration(); }
  std::uint64_t currentGeneration() const { return m_generation; }
  const RenderStats& stats() const { return m_stats; }
  const RenderPipelineConfig& config() const { return m_cfg; }

private:
  struct Job {
    std::uint64_t generation = 0;
    int partitions = 1;
    FrameRequest req;
    RasterHook hook;
  };

  std::uint64_t dispatch(FrameRequest&& req, Clock::time_point now);
  void renderFallback(const std::shared_ptr<const Job>& job);
  void handle(RenderMessage&& msg);

  RenderPipelineConfig m_cfg;
  int m_workers = 1;
  bool m_parallel = false;
  bool m_started = false;

  std::optional<FrameRequest> m_pending;
  std::optional<Clock::time_point> m_lastDispatch;
  Clock::time_point m_generationStart{};
  std::uint64_t m_generation = 0;

  RasterHook m_hook;
  FrameCompositor m_compositor;
  RenderStats m_stats;

  // Declared before the pool so workers are joined before the mailbox goes away.
  std::shared_ptr<Mailbox<RenderMessage>> m_mailbox;
  WorkerPool m_pool;
};

} // namespace atlas
