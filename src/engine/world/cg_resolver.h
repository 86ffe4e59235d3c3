#pragma once

#include "cg_generator.h"
#include "cg_overlay.h"

namespace cg
{
  struct CellContent
  {
    bool hasCache = false;
    TokenValue value = 0;

    static CellContent noCache() { return {}; }
    static CellContent cache(TokenValue v) { return { true, v }; }

    bool operator==(const CellContent& o) const { return hasCache == o.hasCache && (!hasCache || value == o.value); }
    bool operator!=(const CellContent& o) const { return !(*this == o); }
  };

  // The one place that decides what a cell holds: overlay entry if any, else baseline.
  class CellResolver
  {
  public:
    CellResolver(const Generator& generator, const OverlayStore& overlay)
      : m_generator(&generator), m_overlay(&overlay) {}

    CellContent resolve(const CellCoord& cell) const;

  private:
    const Generator* m_generator = nullptr;
    const OverlayStore* m_overlay = nullptr;
  };
}
