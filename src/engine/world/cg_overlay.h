#pragma once

#include "cg_grid.h"
#include "cg_generator.h"

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace cg
{
  struct OverlayValue
  {
    enum class Kind : uint8_t { Token = 0, ExplicitlyEmpty = 1 };

    Kind kind = Kind::ExplicitlyEmpty;
    TokenValue value = 0;

    static OverlayValue token(TokenValue v) { return { Kind::Token, v }; }
    static OverlayValue empty() { return { Kind::ExplicitlyEmpty, 0 }; }

    bool isToken() const { return kind == Kind::Token; }
    bool operator==(const OverlayValue& o) const { return kind == o.kind && value == o.value; }
    bool operator!=(const OverlayValue& o) const { return !(*this == o); }
  };

  // Sparse record of cells the player changed. Entries are never removed: a cache
  // that was picked up becomes ExplicitlyEmpty so the generator is not consulted again.
  class OverlayStore
  {
  public:
    std::optional<OverlayValue> get(const CellCoord& cell) const;
    bool contains(const CellCoord& cell) const { return m_entries.find(cell) != m_entries.end(); }

    // Rejects non-positive values.
    bool setToken(const CellCoord& cell, TokenValue value);
    void setEmpty(const CellCoord& cell);

    size_t size() const { return m_entries.size(); }
    uint64_t revision() const { return m_revision; }

    // Entries sorted by cell, for diagnostics and dumps.
    std::vector<std::pair<CellCoord, OverlayValue>> sortedEntries() const;

  private:
    std::unordered_map<CellCoord, OverlayValue, CellCoordHash> m_entries;
    uint64_t m_revision = 0;
  };
}
