#include <doctest/doctest.h>

#include "test_support.h"

#include <limits>

TEST_CASE("a new session shows the neighborhood around the origin cell")
{
  cg::GameSession session(cg_test::emptyWorld());
  CHECK(session.playerCell() == cg::CellCoord{ 0, 0 });
  CHECK(session.materializer().visibleRegion() == cg::CellRect::around({ 0, 0 }, 4));
  CHECK(session.visibleCells().size() == 81);
  CHECK_FALSE(session.inventorySnapshot().has_value());
  CHECK_FALSE(session.wonSnapshot());
}

TEST_CASE("player moves recenter the visible region")
{
  cg::GameSession session(cg_test::emptyWorld());
  const cg::ViewportDelta d = session.stepPlayer(1, 0);
  CHECK(session.playerCell() == cg::CellCoord{ 1, 0 });
  CHECK(d.entered.size() == 9);
  CHECK(d.left.size() == 9);
  CHECK(session.materializer().visibleRegion() == cg::CellRect::around({ 1, 0 }, 4));

  session.reportPlayerMoved({ 20.5, -7.25 });
  CHECK(session.playerCell() == cg::CellCoord{ 20, -8 });
  CHECK(session.materializer().visibleRegion() == cg::CellRect::around({ 20, -8 }, 4));
}

TEST_CASE("without followPlayer the view is driven by reported bounds")
{
  cg::SessionConfig cfg = cg_test::emptyWorld();
  cfg.followPlayer = false;
  cg::GameSession session(cfg);
  CHECK(session.materializer().materializedCount() == 0);

  const cg::ViewportDelta d = session.reportViewportBounds({ 0.2, 3.0, -1.5, 2.5 });
  CHECK(d.entered.size() == 15);
  CHECK(session.materializer().visibleRegion() == cg::CellRect{ 0, 2, -2, 2 });

  const cg::ViewportDelta moved = session.stepPlayer(5, 5);
  CHECK(moved.entered.empty());
  CHECK(moved.left.empty());
  CHECK(session.playerCell() == cg::CellCoord{ 5, 5 });
  CHECK(session.materializer().materializedCount() == 15);
}

TEST_CASE("visibleCells reflects mutations made through the session")
{
  cg::GameSession session(cg_test::emptyWorld());
  session.overlay().setToken({ 0, 1 }, 2);
  session.overlay().setToken({ 0, 2 }, 2);
  session.setVisibleRegion(cg::CellRect{});
  session.setVisibleRegion({ -1, 1, -1, 3 });

  REQUIRE(session.requestPickup({ 0, 1 }).ok());
  REQUIRE(session.requestPlace({ 0, 2 }).ok());

  const std::vector<cg::CellView> cells = session.visibleCells();
  REQUIRE(cells.size() == 15);
  for (size_t k = 1; k < cells.size(); ++k)
    CHECK(cells[k - 1].cell < cells[k].cell);

  for (const cg::CellView& v : cells)
  {
    if (v.cell == cg::CellCoord{ 0, 2 })
    {
      CHECK(v.hasCache);
      REQUIRE(v.value.has_value());
      CHECK(*v.value == 4);
    }
    else
    {
      CHECK_FALSE(v.hasCache);
      CHECK_FALSE(v.value.has_value());
    }
  }

  const cg::CellRecord* rec = session.materializer().record({ 0, 1 });
  REQUIRE(rec != nullptr);
  CHECK(rec->kind == cg::MaterializedKind::Placeholder);
  rec = session.materializer().record({ 0, 2 });
  REQUIRE(rec != nullptr);
  CHECK(rec->kind == cg::MaterializedKind::Cache);
  CHECK(rec->value == 4);
}

TEST_CASE("mutations persist after the cell scrolls out and back")
{
  cg::GameSession session(cg_test::emptyWorld());
  session.overlay().setToken({ 0, 1 }, 1);
  REQUIRE(session.requestPickup({ 0, 1 }).ok());

  session.reportPlayerMoved({ 500.5, 500.5 });
  CHECK_FALSE(session.materializer().isMaterialized({ 0, 1 }));
  session.reportPlayerMoved({ 0.5, 0.5 });
  REQUIRE(session.materializer().isMaterialized({ 0, 1 }));
  CHECK(session.materializer().record({ 0, 1 })->kind == cg::MaterializedKind::Placeholder);
  CHECK(session.overlay().get({ 0, 1 }) == cg::OverlayValue::empty());
}

TEST_CASE("baseline caches are reproducible across sessions with the same seed")
{
  cg::SessionConfig cfg{};
  cfg.generator.seed = 77u;
  cfg.neighborhoodRadius = 6;

  cg::GameSession a(cfg);
  cg::GameSession b(cfg);
  const std::vector<cg::CellView> va = a.visibleCells();
  const std::vector<cg::CellView> vb = b.visibleCells();
  REQUIRE(va.size() == vb.size());
  for (size_t k = 0; k < va.size(); ++k)
  {
    CHECK(va[k].cell == vb[k].cell);
    CHECK(va[k].hasCache == vb[k].hasCache);
    CHECK(va[k].value == vb[k].value);
  }
}

TEST_CASE("sessions do not share state")
{
  cg::GameSession a(cg_test::emptyWorld());
  cg::GameSession b(cg_test::emptyWorld());
  a.overlay().setToken({ 0, 1 }, 8);
  REQUIRE(a.requestPickup({ 0, 1 }).ok());

  CHECK(b.overlay().size() == 0);
  CHECK_FALSE(b.inventorySnapshot().has_value());
  CHECK(b.requestPickup({ 0, 1 }).status == cg::InteractionStatus::NoCacheHere);
  CHECK(a.world().entityAliveCount() == b.world().entityAliveCount());
}

TEST_CASE("the neighborhood stays materialized at the edges of the lattice")
{
  constexpr int32_t kMax = std::numeric_limits<int32_t>::max();
  constexpr int32_t kMin = std::numeric_limits<int32_t>::min();
  cg::GameSession session(cg_test::emptyWorld());

  const cg::CellCoord corners[] = { { kMax, 0 }, { kMin, 0 }, { 0, kMax }, { kMin, kMax } };
  for (const cg::CellCoord& corner : corners)
  {
    session.reportPlayerMoved(session.mapping().cellCenter(corner));
    REQUIRE(session.playerCell() == corner);

    const cg::CellRect region = session.materializer().visibleRegion();
    CHECK_FALSE(region.empty());
    CHECK(region == cg::CellRect::around(corner, 4));
    CHECK(region.contains(corner));
    CHECK(session.materializer().isMaterialized(corner));
    CHECK(session.materializer().materializedCount() == region.area());
    CHECK(session.world().entityAliveCount() == region.area());
  }

  // Stepping past the edge keeps the player on the last cell.
  session.reportPlayerMoved(session.mapping().cellCenter({ kMax, 0 }));
  session.stepPlayer(3, 0);
  CHECK(session.playerCell() == cg::CellCoord{ kMax, 0 });
  CHECK(session.materializer().materializedCount() == 5u * 9u);
}
