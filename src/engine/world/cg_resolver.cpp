#include "cg_resolver.h"

namespace cg
{
  CellContent CellResolver::resolve(const CellCoord& cell) const
  {
    if (const std::optional<OverlayValue> entry = m_overlay->get(cell))
    {
      if (entry->isToken())
        return CellContent::cache(entry->value);
      return CellContent::noCache();
    }

    const BaselineContent base = m_generator->generate(cell);
    return base.present ? CellContent::cache(base.value) : CellContent::noCache();
  }
}
