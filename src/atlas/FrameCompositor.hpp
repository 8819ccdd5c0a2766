#pragma once

#include "atlas/Bitmap.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <vector>

namespace atlas {

// Collects the partial bitmaps of one render generation and presents them through
// two alternating full-size surfaces.
//
// Partials are drawn onto the hidden surface only; the front index flips after the
// hidden surface is complete, so whatever front() returns is always a whole frame.
class FrameCompositor {
public:
  enum class Accept : std::uint8_t {
    Stored = 0,
    Stale,     // generation is not the one being collected
    Duplicate, // that partition already arrived
    Invalid,   // partition index or bitmap size does not match the generation
  };

  explicit FrameCompositor(Rgba8 background = Rgba8{0, 0, 0, 255});

  // Starts collecting `generation`. Any partials held for an older generation are released.
  void begin(std::uint64_t generation, int partitions, int width, int height);

  Accept accept(std::uint64_t generation, int partition, Bitmap&& bitmap);

  // Marks a partition as failed. It will never arrive for this generation.
  void markFailed(std::uint64_t generation, int partition);

  bool collecting() const { return m_generation != 0; }
  std::uint64_t collectingGeneration() const { return m_generation; }
  int received() const { return m_received; }
  int failed() const { return m_failed; }
  int expected() const { return static_cast<int>(m_parts.size()); }
  bool complete() const { return collecting() && m_received == expected(); }

  // Draws every received partial onto the hidden surface and flips.
  // Requires at least one partial; returns false (nothing changes) otherwise.
  // After a composite the generation is finished and later partials for it are stale.
  bool composite();

  // Drops the generation being collected without presenting it.
  void abandon();

  const Bitmap& front() const { return m_surfaces[static_cast<std::size_t>(frontIndex())]; }
  const Bitmap& hidden() const { return m_surfaces[static_cast<std::size_t>(1 - frontIndex())]; }
  int frontIndex() const { return m_front.load(std::memory_order_acquire); }

  std::uint64_t presentedGeneration() const { return m_presented; }
  std::uint64_t flips() const { return m_flips; }

private:
  Rgba8 m_background;
  std::array<Bitmap, 2> m_surfaces;
  std::atomic<int> m_front{0};

  std::uint64_t m_generation = 0;
  int m_width = 0;
  int m_height = 0;
  std::vector<Bitmap> m_parts;
  std::vector<std::uint8_t> m_state; // 0 = waiting, 1 = received, 2 = failed
  int m_received = 0;
  int m_failed = 0;

  std::uint64_t m_presented = 0;
  std::uint64_t m_flips = 0;
};

} // namespace atlas
