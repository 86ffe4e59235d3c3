#pragma once

#include "cg_ecs.h"
#include "cg_generator.h"
#include "cg_grid.h"
#include "cg_inventory.h"
#include "cg_overlay.h"
#include "cg_resolver.h"
#include "cg_viewport.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace cg
{
  struct SessionConfig
  {
    GeneratorConfig generator{};
    GridMappingConfig mapping{};
    InventoryConfig inventory{};
    // Visible cells around the player when followPlayer is set.
    int32_t neighborhoodRadius = 8;
    bool followPlayer = true;
  };

  // What the UI layer needs to draw and gate a visible cell.
  struct CellView
  {
    CellCoord cell{};
    bool hasCache = false;
    std::optional<TokenValue> value;
    bool interactable = false;
  };

  // One independent game: owns every piece of mutable state and is passed explicitly
  // to whoever drives it. Not thread-safe; calls must be serialized by the caller.
  class GameSession
  {
  public:
    explicit GameSession(const SessionConfig& config = SessionConfig{});

    GameSession(const GameSession&) = delete;
    GameSession& operator=(const GameSession&) = delete;

    // Inputs
    ViewportDelta reportPlayerMoved(const GridPoint& position);
    ViewportDelta stepPlayer(int32_t di, int32_t dj);
    ViewportDelta reportViewportBounds(const ContinuousBounds& bounds);
    ViewportDelta setVisibleRegion(const CellRect& region);

    InteractionResult requestPickup(const CellCoord& cell);
    InteractionResult requestPlace(const CellCoord& cell);
    InteractionResult requestCraft(TokenValue value);

    // Outputs
    CellView cellView(const CellCoord& cell) const;
    std::vector<CellView> visibleCells() const;
    std::optional<TokenValue> inventorySnapshot() const { return m_engine.inventory().slot(); }
    const std::vector<TokenValue>& inventoryTokens() const { return m_engine.inventory().tokens(); }
    bool wonSnapshot() const { return m_engine.won(); }

    const CellCoord& playerCell() const { return m_playerCell; }
    const GridPoint& playerPosition() const { return m_playerPos; }

    const SessionConfig& config() const { return m_config; }
    const GridMapping& mapping() const { return m_mapping; }
    const Generator& generator() const { return m_generator; }
    const CellResolver& resolver() const { return m_resolver; }
    OverlayStore& overlay() { return m_overlay; }
    const OverlayStore& overlay() const { return m_overlay; }
    World& world() { return m_world; }
    const World& world() const { return m_world; }
    const ViewportMaterializer& materializer() const { return m_materializer; }
    const CraftingEngine& engine() const { return m_engine; }

  private:
    void afterCellMutation(const InteractionResult& result);

  private:
    SessionConfig m_config{};
    Generator m_generator;
    OverlayStore m_overlay;
    CellResolver m_resolver;
    GridMapping m_mapping;
    World m_world;
    ViewportMaterializer m_materializer;
    CraftingEngine m_engine;

    GridPoint m_playerPos{};
    CellCoord m_playerCell{};
  };
}
