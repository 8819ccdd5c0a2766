#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace atlas {

// Append-only string <-> dense index map.
//
// Tile records embed raw indices, so an index handed out once stays valid for the
// whole session: the table never shrinks, never renumbers and never reuses a slot.
//
// `firstIndex` lets a table reserve low values for a sentinel (the player table
// starts at 1 so that 0 can mean "nobody"). `limit` is the exclusive upper bound on
// indices (the faction table stops below 65535, which is the unowned sentinel).
//
// Only the coordinating thread mutates a table. Workers never see it directly; they
// receive immutable snapshots derived from it (see RenderMetadata).
class InternTable {
public:
  InternTable(std::uint32_t firstIndex, std::uint32_t limit);

  // Returns the index for `id`, interning it on first sight.
  // Returns std::nullopt for an empty id or when the table is full.
  std::optional<std::uint32_t> intern(const std::string& id);

  std::optional<std::uint32_t> find(const std::string& id) const;

  // nullptr when the index was never handed out.
  const std::string* idAt(std::uint32_t index) const;

  bool contains(std::uint32_t index) const;

  std::size_t size() const { return m_ids.size(); }
  bool full() const;

  std::uint32_t firstIndex() const { return m_first; }
  std::uint32_t limit() const { return m_limit; }

  // ids()[i] is the id whose index is firstIndex() + i.
  const std::vector<std::string>& ids() const { return m_ids; }

  // Incremented every time a new id is appended. Lets owners rebuild derived
  // snapshots only when the contents actually changed.
  std::uint64_t revision() const { return m_revision; }

private:
  std::uint32_t m_first = 0;
  std::uint32_t m_limit = 0;
  std::uint64_t m_revision = 0;
  std::vector<std::string> m_ids;
  std::unordered_map<std::string, std::uint32_t> m_index;
};

} // namespace atlas
