#include "atlas/FrameCompositor.hpp"

#include <utility>

namespace atlas {

FrameCompositor::FrameCompositor(Rgba8 background)
    : m_background(background)
{
}

void FrameCompositor::begin(std::uint64_t generation, int partitions, int width, int height)
{
  m_generation = generation;
  m_width = width;
  m_height = height;
  m_parts.clear();
  m_parts.resize(static_cast<std::size_t>(partitions > 0 ? partitions : 0));
  m_state.assign(m_parts.size(), 0u);
  m_received = 0;
  m_failed = 0;
}

FrameCompositor::Accept FrameCompositor::accept(std::uint64_t generation, int partition, Bitmap&& bitmap)
{
  if (generation == 0 || generation != m_generation) return Accept::Stale;
  if (partition < 0 || partition >= expected()) return Accept::Invalid;
  if (bitmap.width() != m_width || bitmap.height() != m_height) return Accept::Invalid;

  const std::size_t i = static_cast<std::size_t>(partition);
  if (m_state[i] != 0u) return Accept::Duplicate;

  m_parts[i] = std::move(bitmap);
  m_state[i] = 1u;
  ++m_received;
  return Accept::Stored;
}

void FrameCompositor::markFailed(std::uint64_t generation, int partition)
{
  if (generation == 0 || generation != m_generation) return;
  if (partition < 0 || partition >= expected()) return;
  const std::size_t i = static_cast<std::size_t>(partition);
  if (m_state[i] != 0u) return;
  m_state[i] = 2u;
  ++m_failed;
}

bool FrameCompositor::composite()
{
  if (!collecting() || m_received == 0) return false;

  const int back = 1 - frontIndex();
  Bitmap& target = m_surfaces[static_cast<std::size_t>(back)];
  target.resize(m_width, m_height);
  target.clear(m_background);

  // Partitions cover disjoint pixels, so order does not matter.
  for (std::size_t i = 0; i < m_parts.size(); ++i) {
    if (m_state[i] == 1u) target.blendOver(m_parts[i]);
  }

  m_front.store(back, std::memory_order_release);
  m_presented = m_generation;
  ++m_flips;

  abandon();
  return true;
}

void FrameCompositor::abandon()
{
  m_generation = 0;
  m_parts.clear();
  m_state.clear();
  m_received = 0;
  m_failed = 0;
}

} // namespace atlas
