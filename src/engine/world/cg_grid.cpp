#include "cg_grid.h"

#include "cg_log.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace cg
{
  namespace
  {
    // Absorbs the rounding error of (v - origin) / size near cell edges.
    static constexpr double kEdgeEpsilon = 1e-9;

    static int32_t clampToCell(double v)
    {
      constexpr double lo = (double)std::numeric_limits<int32_t>::min();
      constexpr double hi = (double)std::numeric_limits<int32_t>::max();
      if (!(v >= lo))
        return std::numeric_limits<int32_t>::min();
      if (v > hi)
        return std::numeric_limits<int32_t>::max();
      return static_cast<int32_t>(v);
    }
  }

  size_t CellCoordHash::operator()(const CellCoord& c) const noexcept
  {
    const uint64_t i = static_cast<uint32_t>(c.i);
    const uint64_t j = static_cast<uint32_t>(c.j);
    return static_cast<size_t>((i * 73856093ull) ^ (j * 19349663ull));
  }

  int32_t cellDistance(const CellCoord& a, const CellCoord& b)
  {
    const int64_t di = std::llabs((int64_t)a.i - (int64_t)b.i);
    const int64_t dj = std::llabs((int64_t)a.j - (int64_t)b.j);
    const int64_t d = di > dj ? di : dj;
    return d > std::numeric_limits<int32_t>::max() ? std::numeric_limits<int32_t>::max() : (int32_t)d;
  }

  void collectRectDifference(const CellRect& a, const CellRect& b, std::vector<CellCoord>& out)
  {
    if (a.empty())
      return;

    auto pushSpan = [&](int32_t i, int64_t j0, int64_t j1)
    {
      for (int64_t j = j0; j <= j1; ++j)
        out.push_back({ i, (int32_t)j });
    };

    for (int64_t i = a.minI; i <= a.maxI; ++i)
    {
      const int32_t row = (int32_t)i;
      if (b.empty() || row < b.minI || row > b.maxI)
      {
        pushSpan(row, a.minJ, a.maxJ);
        continue;
      }

      const int64_t leftEnd = std::min<int64_t>(a.maxJ, (int64_t)b.minJ - 1);
      pushSpan(row, a.minJ, leftEnd);
      const int64_t rightStart = std::max<int64_t>(a.minJ, (int64_t)b.maxJ + 1);
      pushSpan(row, rightStart, a.maxJ);
    }
  }

  void GridMapping::configure(const GridMappingConfig& config)
  {
    m_config = config;
    if (!(m_config.cellSize > 0.0) || !std::isfinite(m_config.cellSize))
    {
      cg::log(cg::LogLevel::Warn, "GridMapping: invalid cell size %g, using 1e-4", config.cellSize);
      m_config.cellSize = 1e-4;
    }
  }

  int32_t GridMapping::floorToCell(double v, double origin) const
  {
    return clampToCell(std::floor((v - origin) / m_config.cellSize + kEdgeEpsilon));
  }

  int32_t GridMapping::ceilToCell(double v, double origin) const
  {
    return clampToCell(std::ceil((v - origin) / m_config.cellSize - kEdgeEpsilon));
  }

  CellCoord GridMapping::pointToCell(const GridPoint& p) const
  {
    return { floorToCell(p.y, m_config.originY), floorToCell(p.x, m_config.originX) };
  }

  CellRect GridMapping::boundsToRect(const ContinuousBounds& b) const
  {
    CellRect r{};
    r.minI = floorToCell(b.south, m_config.originY);
    r.minJ = floorToCell(b.west, m_config.originX);
    // A cell whose lower edge sits exactly on north/east is outside the bounds.
    r.maxI = saturateCell((int64_t)ceilToCell(b.north, m_config.originY) - 1);
    r.maxJ = saturateCell((int64_t)ceilToCell(b.east, m_config.originX) - 1);
    // Degenerate bounds still cover the cell they fall in.
    if (r.maxI < r.minI && b.north >= b.south) r.maxI = r.minI;
    if (r.maxJ < r.minJ && b.east >= b.west) r.maxJ = r.minJ;
    return r;
  }

  GridPoint GridMapping::cellOrigin(const CellCoord& c) const
  {
    return { m_config.originY + (double)c.i * m_config.cellSize,
             m_config.originX + (double)c.j * m_config.cellSize };
  }

  GridPoint GridMapping::cellCenter(const CellCoord& c) const
  {
    const GridPoint o = cellOrigin(c);
    return { o.y + m_config.cellSize * 0.5, o.x + m_config.cellSize * 0.5 };
  }

  ContinuousBounds GridMapping::cellBounds(const CellCoord& c) const
  {
    const GridPoint o = cellOrigin(c);
    return { o.y, o.y + m_config.cellSize, o.x, o.x + m_config.cellSize };
  }
}
