#include "cg_overlay.h"

#include "cg_log.h"

#include <algorithm>

namespace cg
{
  std::optional<OverlayValue> OverlayStore::get(const CellCoord& cell) const
  {
    auto it = m_entries.find(cell);
    if (it == m_entries.end())
      return std::nullopt;
    return it->second;
  }

  bool OverlayStore::setToken(const CellCoord& cell, TokenValue value)
  {
    if (value <= 0)
    {
      cg::log(cg::LogLevel::Warn, "Overlay: rejected token %lld at (%d,%d)", (long long)value, cell.i, cell.j);
      return false;
    }
    m_entries[cell] = OverlayValue::token(value);
    m_revision++;
    return true;
  }

  void OverlayStore::setEmpty(const CellCoord& cell)
  {
    m_entries[cell] = OverlayValue::empty();
    m_revision++;
  }

  std::vector<std::pair<CellCoord, OverlayValue>> OverlayStore::sortedEntries() const
  {
    std::vector<std::pair<CellCoord, OverlayValue>> out(m_entries.begin(), m_entries.end());
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.first < b.first; });
    return out;
  }
}
