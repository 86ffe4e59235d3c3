#pragma once

#include "cg_ecs.h"
#include "cg_grid.h"
#include "cg_resolver.h"

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace cg
{
  // --------------------
  // Components attached to materialized cell entities
  // --------------------
  struct GridCell
  {
    CellCoord coord{};
  };

  struct CellArea
  {
    ContinuousBounds bounds{};
  };

  // Interactive representation of a resident cache.
  struct CacheMarker
  {
    TokenValue value = 0;
  };

  // Non-interactive representation of a cell without a cache.
  struct CellPlaceholder
  {
    bool touched = false;
  };

  enum class MaterializedKind : uint8_t
  {
    Placeholder = 0,
    Cache = 1
  };

  struct CellRecord
  {
    CellCoord coord{};
    Entity entity = kInvalidEntity;
    MaterializedKind kind = MaterializedKind::Placeholder;
    TokenValue value = 0;
  };

  struct ViewportDelta
  {
    std::vector<CellCoord> entered;
    std::vector<CellCoord> left;
  };

  struct ViewportStats
  {
    CellRect region{};
    uint32_t entered = 0;
    uint32_t left = 0;
    uint32_t refreshed = 0;
    uint32_t materialized = 0;
    uint32_t caches = 0;
    uint32_t placeholders = 0;
    uint64_t updates = 0;
    float updateMs = 0.0f;
  };

  // Keeps exactly one record per cell inside the visible region. Records are derived
  // from the resolver on entry and destroyed on exit; the overlay is never written.
  class ViewportMaterializer
  {
  public:
    ViewportMaterializer(World& world, const CellResolver& resolver, const GridMapping& mapping);
    ~ViewportMaterializer();

    ViewportMaterializer(const ViewportMaterializer&) = delete;
    ViewportMaterializer& operator=(const ViewportMaterializer&) = delete;

    ViewportDelta setVisibleRegion(const CellRect& region);

    // Re-resolves a materialized cell; false when the cell is not materialized.
    bool refreshCell(const CellCoord& cell);
    uint32_t evictAll();

    bool isMaterialized(const CellCoord& cell) const { return m_records.find(cell) != m_records.end(); }
    const CellRecord* record(const CellCoord& cell) const;
    const CellRect& visibleRegion() const { return m_region; }
    uint32_t materializedCount() const { return (uint32_t)m_records.size(); }
    const std::unordered_map<CellCoord, CellRecord, CellCoordHash>& records() const { return m_records; }
    std::vector<CellCoord> sortedCells() const;

    const ViewportStats& stats() const { return m_stats; }

  private:
    void materialize(const CellCoord& cell);
    bool evict(const CellCoord& cell);
    void applyContent(CellRecord& rec, const CellContent& content);
    void publishCounts();

  private:
    World* m_world = nullptr;
    const CellResolver* m_resolver = nullptr;
    const GridMapping* m_mapping = nullptr;

    std::unordered_map<CellCoord, CellRecord, CellCoordHash> m_records;
    CellRect m_region{};
    ViewportStats m_stats{};
    uint64_t m_updateCounter = 0;
    uint32_t m_cacheCount = 0;
  };
}
