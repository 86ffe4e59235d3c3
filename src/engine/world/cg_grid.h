#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace cg
{
  struct CellCoord
  {
    int32_t i = 0;
    int32_t j = 0;

    bool operator==(const CellCoord& o) const { return i == o.i && j == o.j; }
    bool operator!=(const CellCoord& o) const { return !(*this == o); }
    // Row-major: i first, then j.
    bool operator<(const CellCoord& o) const { return i != o.i ? i < o.i : j < o.j; }
  };

  struct CellCoordHash
  {
    size_t operator()(const CellCoord& c) const noexcept;
  };

  // Clamps a widened index back onto the int32 lattice.
  inline int32_t saturateCell(int64_t v)
  {
    if (v < std::numeric_limits<int32_t>::min())
      return std::numeric_limits<int32_t>::min();
    if (v > std::numeric_limits<int32_t>::max())
      return std::numeric_limits<int32_t>::max();
    return static_cast<int32_t>(v);
  }

  // Chebyshev ("king move") distance.
  int32_t cellDistance(const CellCoord& a, const CellCoord& b);

  // Inclusive on both axes. minI > maxI (or minJ > maxJ) means empty.
  struct CellRect
  {
    int32_t minI = 0;
    int32_t maxI = -1;
    int32_t minJ = 0;
    int32_t maxJ = -1;

    bool empty() const { return minI > maxI || minJ > maxJ; }
    bool contains(const CellCoord& c) const
    {
      return c.i >= minI && c.i <= maxI && c.j >= minJ && c.j <= maxJ;
    }
    uint64_t area() const
    {
      if (empty())
        return 0;
      return (uint64_t)((int64_t)maxI - minI + 1) * (uint64_t)((int64_t)maxJ - minJ + 1);
    }

    bool operator==(const CellRect& o) const
    {
      if (empty() && o.empty())
        return true;
      return minI == o.minI && maxI == o.maxI && minJ == o.minJ && maxJ == o.maxJ;
    }
    bool operator!=(const CellRect& o) const { return !(*this == o); }

    // Clipped at the edges of the lattice.
    static CellRect around(const CellCoord& center, int32_t radius)
    {
      return { saturateCell((int64_t)center.i - radius), saturateCell((int64_t)center.i + radius),
               saturateCell((int64_t)center.j - radius), saturateCell((int64_t)center.j + radius) };
    }
  };

  // Appends the cells of a that are not in b, row-major. Work is proportional to the
  // rows of a plus the cells appended.
  void collectRectDifference(const CellRect& a, const CellRect& b, std::vector<CellCoord>& out);

  // Continuous position: y runs along i (latitude), x along j (longitude).
  struct GridPoint
  {
    double y = 0.0;
    double x = 0.0;
  };

  struct ContinuousBounds
  {
    double south = 0.0;
    double north = 0.0;
    double west = 0.0;
    double east = 0.0;
  };

  struct GridMappingConfig
  {
    double originY = 36.997936938057016;
    double originX = -122.05703507501151;
    double cellSize = 1e-4;
  };

  // Quantizes continuous positions onto the cell lattice. Cell (i, j) covers
  // [origin + i*size, origin + (i+1)*size) on each axis.
  class GridMapping
  {
  public:
    GridMapping() = default;
    explicit GridMapping(const GridMappingConfig& config) { configure(config); }

    void configure(const GridMappingConfig& config);
    const GridMappingConfig& config() const { return m_config; }

    CellCoord pointToCell(const GridPoint& p) const;
    CellRect boundsToRect(const ContinuousBounds& b) const;

    GridPoint cellOrigin(const CellCoord& c) const;
    GridPoint cellCenter(const CellCoord& c) const;
    ContinuousBounds cellBounds(const CellCoord& c) const;

  private:
    int32_t floorToCell(double v, double origin) const;
    int32_t ceilToCell(double v, double origin) const;

  private:
    GridMappingConfig m_config{};
  };
}
