#include "atlas/InternTable.hpp"

namespace atlas {

InternTable::InternTable(std::uint32_t firstIndex, std::uint32_t limit)
    : m_first(firstIndex)
    , m_limit(limit < firstIndex ? firstIndex : limit)
{
}

std::optional<std::uint32_t> InternTable::intern(const std::string& id)
{
  if (id.empty()) return std::nullopt;

  const auto it = m_index.find(id);
  if (it != m_index.end()) return it->second;

  if (full()) return std::nullopt;

  const std::uint32_t idx = m_first + static_cast<std::uint32_t>(m_ids.size());
  m_ids.push_back(id);
  m_index.emplace(id, idx);
  ++m_revision;
  return idx;
}

std::optional<std::uint32_t> InternTable::find(const std::string& id) const
{
  const auto it = m_index.find(id);
  if (it == m_index.end()) return std::nullopt;
  return it->second;
}

const std::string* InternTable::idAt(std::uint32_t index) const
{
  if (!contains(index)) return nullptr;
  return &m_ids[static_cast<std::size_t>(index - m_first)];
}

bool InternTable::contains(std::uint32_t index) const
{
  return index >= m_first && static_cast<std::size_t>(index - m_first) < m_ids.size();
}

bool InternTable::full() const
{
  return static_cast<std::uint64_t>(m_first) + m_ids.size() >= m_limit;
}

} // namespace atlas
