#include <doctest/doctest.h>

#include "cg_inventory.h"
#include "test_support.h"

TEST_CASE("proximity: radius R is reachable, R+1 is not")
{
  cg::GameSession session(cg_test::emptyWorld(1, 3));
  session.overlay().setToken({ 3, -3 }, 1);
  session.overlay().setToken({ 4, 0 }, 1);

  const cg::InteractionResult far = session.requestPickup({ 4, 0 });
  CHECK(far.status == cg::InteractionStatus::TooFar);
  CHECK(far.distance == 4);
  CHECK(far.required == 3);
  CHECK(session.overlay().get({ 4, 0 }) == cg::OverlayValue::token(1));
  CHECK_FALSE(session.inventorySnapshot().has_value());

  const cg::InteractionResult near = session.requestPickup({ 3, -3 });
  CHECK(near.ok());
  CHECK(near.value == 1);
  REQUIRE(session.inventorySnapshot().has_value());
  CHECK(*session.inventorySnapshot() == 1);
  CHECK(session.overlay().get({ 3, -3 }) == cg::OverlayValue::empty());
}

TEST_CASE("pickup with a full slot is refused and changes nothing")
{
  cg::GameSession session(cg_test::emptyWorld());
  session.overlay().setToken({ 0, 1 }, 2);
  session.overlay().setToken({ 1, 0 }, 4);

  REQUIRE(session.requestPickup({ 0, 1 }).ok());
  const uint64_t rev = session.overlay().revision();

  const cg::InteractionResult r = session.requestPickup({ 1, 0 });
  CHECK(r.status == cg::InteractionStatus::AlreadyCarrying);
  CHECK(session.overlay().revision() == rev);
  CHECK(session.overlay().get({ 1, 0 }) == cg::OverlayValue::token(4));
  CHECK(*session.inventorySnapshot() == 2);
}

TEST_CASE("pickup from an empty cell reports NoCacheHere")
{
  cg::GameSession session(cg_test::emptyWorld());
  const cg::InteractionResult r = session.requestPickup({ 1, 1 });
  CHECK(r.status == cg::InteractionStatus::NoCacheHere);
  CHECK_FALSE(session.overlay().contains({ 1, 1 }));

  // A cell emptied by an earlier pickup stays empty.
  session.overlay().setToken({ 0, 2 }, 1);
  REQUIRE(session.requestPickup({ 0, 2 }).ok());
  REQUIRE(session.requestPlace({ 0, 2 }).status == cg::InteractionStatus::NoCacheHere);
  CHECK_FALSE(session.cellView({ 0, 2 }).hasCache);
}

TEST_CASE("too far is reported before a full slot")
{
  cg::GameSession session(cg_test::emptyWorld());
  session.overlay().setToken({ 0, 1 }, 1);
  REQUIRE(session.requestPickup({ 0, 1 }).ok());
  CHECK(session.requestPickup({ 10, 10 }).status == cg::InteractionStatus::TooFar);
  CHECK(session.requestPlace({ 10, 10 }).status == cg::InteractionStatus::TooFar);
}

TEST_CASE("placing with nothing carried is refused")
{
  cg::GameSession session(cg_test::emptyWorld());
  session.overlay().setToken({ 0, 1 }, 1);
  const cg::InteractionResult r = session.requestPlace({ 0, 1 });
  CHECK(r.status == cg::InteractionStatus::NothingCarried);
  CHECK(session.overlay().get({ 0, 1 }) == cg::OverlayValue::token(1));
}

TEST_CASE("placing onto a different value is refused and the slot is kept")
{
  cg::GameSession session(cg_test::emptyWorld());
  session.overlay().setToken({ 0, 1 }, 2);
  session.overlay().setToken({ 0, 2 }, 3);
  REQUIRE(session.requestPickup({ 0, 1 }).ok());

  const cg::InteractionResult r = session.requestPlace({ 0, 2 });
  CHECK(r.status == cg::InteractionStatus::ValueMismatch);
  CHECK(r.value == 3);
  CHECK(*session.inventorySnapshot() == 2);
  CHECK(session.overlay().get({ 0, 2 }) == cg::OverlayValue::token(3));
}

TEST_CASE("placing onto an empty cell is refused")
{
  cg::GameSession session(cg_test::emptyWorld());
  session.overlay().setToken({ 0, 1 }, 2);
  REQUIRE(session.requestPickup({ 0, 1 }).ok());
  CHECK(session.requestPlace({ 0, 1 }).status == cg::InteractionStatus::NoCacheHere);
  CHECK(*session.inventorySnapshot() == 2);
}

TEST_CASE("merges double the value and the win flag latches at the threshold")
{
  cg::GameSession session(cg_test::emptyWorld(1, 3, 5));
  cg::OverlayStore& overlay = session.overlay();
  const cg::CellCoord target{ 0, 2 };

  overlay.setToken({ 0, 1 }, 1);
  overlay.setToken(target, 1);
  REQUIRE(session.requestPickup({ 0, 1 }).ok());
  cg::InteractionResult r = session.requestPlace(target);
  REQUIRE(r.ok());
  CHECK(r.value == 2);
  CHECK_FALSE(r.wonNow);
  CHECK_FALSE(session.wonSnapshot());
  CHECK_FALSE(session.inventorySnapshot().has_value());
  CHECK(overlay.get(target) == cg::OverlayValue::token(2));

  overlay.setToken({ 1, 0 }, 2);
  REQUIRE(session.requestPickup({ 1, 0 }).ok());
  r = session.requestPlace(target);
  REQUIRE(r.ok());
  CHECK(r.value == 4);
  CHECK_FALSE(session.wonSnapshot());

  overlay.setToken({ 1, 1 }, 4);
  REQUIRE(session.requestPickup({ 1, 1 }).ok());
  r = session.requestPlace(target);
  REQUIRE(r.ok());
  CHECK(r.value == 8);
  CHECK(r.wonNow);
  CHECK(session.wonSnapshot());
  CHECK(session.engine().winningValue() == 8);

  // Latched: later actions keep it set and do not report a new win.
  REQUIRE(session.requestPickup(target).ok());
  CHECK(session.wonSnapshot());
  overlay.setToken({ -1, 0 }, 8);
  r = session.requestPlace({ -1, 0 });
  REQUIRE(r.ok());
  CHECK(r.value == 16);
  CHECK_FALSE(r.wonNow);
  CHECK(session.wonSnapshot());
}

TEST_CASE("crafting combines two equal carried tokens")
{
  cg::GameSession session(cg_test::emptyWorld(0, 3, 8));
  session.overlay().setToken({ 0, 1 }, 4);
  session.overlay().setToken({ 0, 2 }, 4);
  session.overlay().setToken({ 0, 3 }, 2);
  REQUIRE(session.requestPickup({ 0, 1 }).ok());
  REQUIRE(session.requestPickup({ 0, 2 }).ok());
  REQUIRE(session.requestPickup({ 0, 3 }).ok());
  CHECK(session.inventoryTokens().size() == 3);

  CHECK(session.requestCraft(2).status == cg::InteractionStatus::NothingToCraft);
  CHECK(session.requestCraft(0).status == cg::InteractionStatus::NothingToCraft);

  const cg::InteractionResult r = session.requestCraft(4);
  REQUIRE(r.ok());
  CHECK(r.value == 8);
  CHECK(r.wonNow);
  CHECK(session.engine().inventory().countOf(4) == 0);
  CHECK(session.engine().inventory().countOf(8) == 1);
  CHECK(session.engine().inventory().countOf(2) == 1);
}

TEST_CASE("unbounded inventory places any carried match")
{
  cg::GameSession session(cg_test::emptyWorld(0));
  session.overlay().setToken({ 0, 1 }, 1);
  session.overlay().setToken({ 0, 2 }, 2);
  session.overlay().setToken({ 0, 3 }, 2);
  REQUIRE(session.requestPickup({ 0, 1 }).ok());
  REQUIRE(session.requestPickup({ 0, 2 }).ok());

  const cg::InteractionResult r = session.requestPlace({ 0, 3 });
  REQUIRE(r.ok());
  CHECK(r.value == 4);
  REQUIRE(session.inventoryTokens().size() == 1);
  CHECK(session.inventoryTokens()[0] == 1);
}

TEST_CASE("interactable gates on reach, content and slot")
{
  cg::GameSession session(cg_test::emptyWorld());
  session.overlay().setToken({ 0, 1 }, 2);
  session.overlay().setToken({ 0, 2 }, 2);
  session.overlay().setToken({ 0, 3 }, 4);
  session.overlay().setToken({ 0, 4 }, 2);

  CHECK(session.cellView({ 0, 1 }).interactable);
  CHECK_FALSE(session.cellView({ 0, 4 }).interactable);
  CHECK_FALSE(session.cellView({ 1, 1 }).interactable);

  REQUIRE(session.requestPickup({ 0, 1 }).ok());
  CHECK_FALSE(session.cellView({ 0, 1 }).interactable);
  CHECK(session.cellView({ 0, 2 }).interactable);
  CHECK_FALSE(session.cellView({ 0, 3 }).interactable);
}

TEST_CASE("config sanitization and status text")
{
  cg::Generator gen;
  cg::OverlayStore overlay;
  cg::CellResolver resolver(gen, overlay);

  cg::InventoryConfig cfg{};
  cfg.proximityRadius = -4;
  cfg.winThreshold = 0;
  cg::CraftingEngine engine(cfg, resolver, overlay);
  CHECK(engine.config().proximityRadius == 0);
  CHECK(engine.config().winThreshold == 1);

  CHECK(std::string(cg::interactionStatusName(cg::InteractionStatus::ValueMismatch)) == "ValueMismatch");

  cg::InteractionResult far{};
  far.status = cg::InteractionStatus::TooFar;
  far.distance = 7;
  far.required = 3;
  CHECK(far.describe().find("7") != std::string::npos);
}

TEST_CASE("values that cannot be doubled are refused without side effects")
{
  const cg::TokenValue huge = cg::TokenValue(1) << 62;
  REQUIRE(huge > cg::CraftingEngine::kMaxDoublable);

  SUBCASE("merge")
  {
    cg::GameSession session(cg_test::emptyWorld());
    session.overlay().setToken({ 0, 1 }, huge);
    session.overlay().setToken({ 0, 2 }, huge);
    REQUIRE(session.requestPickup({ 0, 1 }).ok());
    const uint64_t rev = session.overlay().revision();

    const cg::InteractionResult r = session.requestPlace({ 0, 2 });
    CHECK(r.status == cg::InteractionStatus::ValueTooLarge);
    CHECK(r.value == huge);
    CHECK(session.overlay().revision() == rev);
    CHECK(session.overlay().get({ 0, 2 }) == cg::OverlayValue::token(huge));
    CHECK(session.cellView({ 0, 2 }).hasCache);
    CHECK_FALSE(session.cellView({ 0, 2 }).interactable);
    REQUIRE(session.inventorySnapshot().has_value());
    CHECK(*session.inventorySnapshot() == huge);
    CHECK_FALSE(session.wonSnapshot());
  }

  SUBCASE("craft")
  {
    cg::GameSession session(cg_test::emptyWorld(0));
    session.overlay().setToken({ 0, 1 }, huge);
    session.overlay().setToken({ 0, 2 }, huge);
    REQUIRE(session.requestPickup({ 0, 1 }).ok());
    REQUIRE(session.requestPickup({ 0, 2 }).ok());

    const cg::InteractionResult r = session.requestCraft(huge);
    CHECK(r.status == cg::InteractionStatus::ValueTooLarge);
    CHECK(session.engine().inventory().countOf(huge) == 2);
    for (cg::TokenValue v : session.inventoryTokens())
      CHECK(v > 0);
  }

  SUBCASE("the largest doublable value still merges")
  {
    const cg::TokenValue edge = cg::CraftingEngine::kMaxDoublable;
    cg::GameSession session(cg_test::emptyWorld());
    session.overlay().setToken({ 0, 1 }, edge);
    session.overlay().setToken({ 0, 2 }, edge);
    REQUIRE(session.requestPickup({ 0, 1 }).ok());
    const cg::InteractionResult r = session.requestPlace({ 0, 2 });
    REQUIRE(r.ok());
    CHECK(r.value == edge * 2);
    CHECK(r.value > 0);
  }
}

TEST_CASE("reach is judged from the player's cell at the time of each request")
{
  cg::GameSession session(cg_test::emptyWorld(1, 3));
  session.overlay().setToken({ 0, 3 }, 2);
  session.overlay().setToken({ 0, -3 }, 2);

  REQUIRE(session.requestPickup({ 0, 3 }).ok());
  CHECK(session.cellView({ 0, -3 }).interactable);

  session.stepPlayer(0, 4);
  REQUIRE(session.playerCell() == cg::CellCoord{ 0, 4 });
  CHECK_FALSE(session.cellView({ 0, -3 }).interactable);

  const cg::InteractionResult far = session.requestPlace({ 0, -3 });
  CHECK(far.status == cg::InteractionStatus::TooFar);
  CHECK(far.distance == 7);
  CHECK(far.required == 3);
  CHECK(*session.inventorySnapshot() == 2);
  CHECK(session.overlay().get({ 0, -3 }) == cg::OverlayValue::token(2));

  session.stepPlayer(0, -4);
  REQUIRE(session.playerCell() == cg::CellCoord{ 0, 0 });
  CHECK(session.cellView({ 0, -3 }).interactable);

  const cg::InteractionResult near = session.requestPlace({ 0, -3 });
  REQUIRE(near.ok());
  CHECK(near.value == 4);
}
