#include "cg_session.h"

#include "cg_log.h"

namespace cg
{
  GameSession::GameSession(const SessionConfig& config)
    : m_config(config)
    , m_generator(config.generator)
    , m_resolver(m_generator, m_overlay)
    , m_mapping(config.mapping)
    , m_materializer(m_world, m_resolver, m_mapping)
    , m_engine(config.inventory, m_resolver, m_overlay)
  {
    if (m_config.neighborhoodRadius < 0)
    {
      cg::log(cg::LogLevel::Warn, "Session: negative neighborhood radius %d, using 0", m_config.neighborhoodRadius);
      m_config.neighborhoodRadius = 0;
    }
    m_config.generator = m_generator.config();
    m_config.mapping = m_mapping.config();
    m_config.inventory = m_engine.config();

    m_world.reserveEntities(1024);
    m_playerPos = m_mapping.cellCenter({ 0, 0 });
    m_playerCell = m_mapping.pointToCell(m_playerPos);

    if (m_config.followPlayer)
      m_materializer.setVisibleRegion(CellRect::around(m_playerCell, m_config.neighborhoodRadius));

    cg::log(cg::LogLevel::Info, "Session started: seed=%u capacity=%u radius=%d win=%lld",
            m_config.generator.seed, m_config.inventory.capacity,
            m_config.inventory.proximityRadius, (long long)m_config.inventory.winThreshold);
  }

  ViewportDelta GameSession::reportPlayerMoved(const GridPoint& position)
  {
    m_playerPos = position;
    m_playerCell = m_mapping.pointToCell(position);

    if (!m_config.followPlayer)
      return {};
    return m_materializer.setVisibleRegion(CellRect::around(m_playerCell, m_config.neighborhoodRadius));
  }

  ViewportDelta GameSession::stepPlayer(int32_t di, int32_t dj)
  {
    const double size = m_mapping.config().cellSize;
    GridPoint next = m_playerPos;
    next.y += (double)di * size;
    next.x += (double)dj * size;
    return reportPlayerMoved(next);
  }

  ViewportDelta GameSession::reportViewportBounds(const ContinuousBounds& bounds)
  {
    return m_materializer.setVisibleRegion(m_mapping.boundsToRect(bounds));
  }

  ViewportDelta GameSession::setVisibleRegion(const CellRect& region)
  {
    return m_materializer.setVisibleRegion(region);
  }

  InteractionResult GameSession::requestPickup(const CellCoord& cell)
  {
    const InteractionResult r = m_engine.pickup(m_playerCell, cell);
    afterCellMutation(r);
    return r;
  }

  InteractionResult GameSession::requestPlace(const CellCoord& cell)
  {
    const InteractionResult r = m_engine.place(m_playerCell, cell);
    afterCellMutation(r);
    return r;
  }

  InteractionResult GameSession::requestCraft(TokenValue value)
  {
    return m_engine.craft(value);
  }

  void GameSession::afterCellMutation(const InteractionResult& result)
  {
    if (!result.ok())
    {
      cg::log(cg::LogLevel::Debug, "Rejected at (%d,%d): %s", result.cell.i, result.cell.j,
              interactionStatusName(result.status));
      return;
    }
    m_materializer.refreshCell(result.cell);
  }

  CellView GameSession::cellView(const CellCoord& cell) const
  {
    const CellContent content = m_resolver.resolve(cell);
    CellView v{};
    v.cell = cell;
    v.hasCache = content.hasCache;
    if (content.hasCache)
      v.value = content.value;
    v.interactable = m_engine.interactable(m_playerCell, cell, content);
    return v;
  }

  std::vector<CellView> GameSession::visibleCells() const
  {
    std::vector<CellView> out;
    out.reserve(m_materializer.materializedCount());
    for (const CellCoord& c : m_materializer.sortedCells())
      out.push_back(cellView(c));
    return out;
  }
}
