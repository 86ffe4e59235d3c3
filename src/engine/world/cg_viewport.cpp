#include "cg_viewport.h"

#include "cg_log.h"
#include "cg_time.h"

#include <algorithm>
#include <cstdio>

namespace cg
{
  ViewportMaterializer::ViewportMaterializer(World& world, const CellResolver& resolver, const GridMapping& mapping)
    : m_world(&world), m_resolver(&resolver), m_mapping(&mapping)
  {
    m_records.reserve(512);
  }

  ViewportMaterializer::~ViewportMaterializer()
  {
    evictAll();
  }

  const CellRecord* ViewportMaterializer::record(const CellCoord& cell) const
  {
    auto it = m_records.find(cell);
    if (it == m_records.end())
      return nullptr;
    return &it->second;
  }

  std::vector<CellCoord> ViewportMaterializer::sortedCells() const
  {
    std::vector<CellCoord> out;
    out.reserve(m_records.size());
    for (const auto& [coord, rec] : m_records)
    {
      (void)rec;
      out.push_back(coord);
    }
    std::sort(out.begin(), out.end());
    return out;
  }

  ViewportDelta ViewportMaterializer::setVisibleRegion(const CellRect& region)
  {
    Tick elapsed = 0;
    ViewportDelta delta{};
    {
      ScopedTimer timer(&elapsed);

      const CellRect next = region.empty() ? CellRect{} : region;
      collectRectDifference(next, m_region, delta.entered);
      collectRectDifference(m_region, next, delta.left);

      // Evict first so freed entity slots are reused by the entering cells.
      for (const CellCoord& c : delta.left)
        evict(c);
      for (const CellCoord& c : delta.entered)
        materialize(c);

      m_region = next;
    }

    m_updateCounter++;
    m_stats.region = m_region;
    m_stats.entered = (uint32_t)delta.entered.size();
    m_stats.left = (uint32_t)delta.left.size();
    m_stats.refreshed = 0;
    m_stats.updates = m_updateCounter;
    m_stats.updateMs = (float)ticksToMs(elapsed);
    publishCounts();

    if (!delta.entered.empty() || !delta.left.empty())
    {
      cg::log(cg::LogLevel::Debug, "Viewport: i[%d..%d] j[%d..%d] +%u -%u (%u live, %.3f ms)",
              m_region.minI, m_region.maxI, m_region.minJ, m_region.maxJ,
              m_stats.entered, m_stats.left, m_stats.materialized, m_stats.updateMs);
    }
    return delta;
  }

  bool ViewportMaterializer::refreshCell(const CellCoord& cell)
  {
    auto it = m_records.find(cell);
    if (it == m_records.end())
      return false;

    applyContent(it->second, m_resolver->resolve(cell));
    if (CellPlaceholder* ph = m_world->get<CellPlaceholder>(it->second.entity))
      ph->touched = true;
    m_stats.refreshed++;
    publishCounts();
    return true;
  }

  uint32_t ViewportMaterializer::evictAll()
  {
    uint32_t evicted = 0;
    for (auto& [coord, rec] : m_records)
    {
      (void)coord;
      if (m_world->destroy(rec.entity))
        evicted++;
    }
    m_records.clear();
    m_cacheCount = 0;
    m_region = CellRect{};
    m_stats.region = m_region;
    publishCounts();
    return evicted;
  }

  void ViewportMaterializer::materialize(const CellCoord& cell)
  {
    if (m_records.find(cell) != m_records.end())
    {
      cg::log(cg::LogLevel::Error, "Viewport: cell (%d,%d) already materialized", cell.i, cell.j);
      return;
    }

    CellRecord rec{};
    rec.coord = cell;
    rec.entity = m_world->create();

    m_world->add<GridCell>(rec.entity, cell);

    CellArea& area = m_world->add<CellArea>(rec.entity);
    area.bounds = m_mapping->cellBounds(cell);

    char label[Name::kMax];
    std::snprintf(label, sizeof(label), "Cell_%d_%d", cell.i, cell.j);
    setName(m_world->add<Name>(rec.entity), label);

    applyContent(rec, m_resolver->resolve(cell));
    m_records.emplace(cell, rec);
  }

  bool ViewportMaterializer::evict(const CellCoord& cell)
  {
    auto it = m_records.find(cell);
    if (it == m_records.end())
      return false;

    if (it->second.kind == MaterializedKind::Cache && m_cacheCount > 0)
      m_cacheCount--;
    m_world->destroy(it->second.entity);
    m_records.erase(it);
    return true;
  }

  void ViewportMaterializer::applyContent(CellRecord& rec, const CellContent& content)
  {
    const bool wasCache = rec.kind == MaterializedKind::Cache && m_world->has<CacheMarker>(rec.entity);

    if (content.hasCache)
    {
      m_world->remove<CellPlaceholder>(rec.entity);
      m_world->add<CacheMarker>(rec.entity, content.value);
      rec.kind = MaterializedKind::Cache;
      rec.value = content.value;
      if (!wasCache)
        m_cacheCount++;
    }
    else
    {
      m_world->remove<CacheMarker>(rec.entity);
      if (!m_world->has<CellPlaceholder>(rec.entity))
        m_world->add<CellPlaceholder>(rec.entity);
      rec.kind = MaterializedKind::Placeholder;
      rec.value = 0;
      if (wasCache && m_cacheCount > 0)
        m_cacheCount--;
    }
  }

  void ViewportMaterializer::publishCounts()
  {
    m_stats.materialized = (uint32_t)m_records.size();
    m_stats.caches = m_cacheCount;
    m_stats.placeholders = m_stats.materialized - m_cacheCount;
  }
}
