#include <doctest/doctest.h>

#include "cg_ecs.h"

#include <cstring>

namespace
{
  struct Counter
  {
    int value = 0;
  };

  struct Tag
  {
    bool on = false;
  };
}

TEST_CASE("EntityManager recycles indices with a new generation")
{
  cg::EntityManager em;
  const cg::Entity a = em.create();
  const cg::Entity b = em.create();
  CHECK(em.aliveCount() == 2);
  CHECK(a != b);

  CHECK(em.destroy(a));
  CHECK_FALSE(em.destroy(a));
  CHECK_FALSE(em.isAlive(a));

  const cg::Entity c = em.create();
  CHECK(c.index() == a.index());
  CHECK(c.generation() == a.generation() + 1u);
  CHECK(em.isAlive(c));
  CHECK(em.aliveCount() == 2);
  CHECK(em.capacity() == 2);
}

TEST_CASE("a stale handle does not see the new occupant's components")
{
  cg::World world;
  const cg::Entity old = world.create();
  world.add<Counter>(old, 1);
  REQUIRE(world.destroy(old));

  const cg::Entity fresh = world.create();
  REQUIRE(fresh.index() == old.index());
  world.add<Counter>(fresh, 2);

  CHECK_FALSE(world.has<Counter>(old));
  CHECK(world.get<Counter>(old) == nullptr);
  REQUIRE(world.get<Counter>(fresh) != nullptr);
  CHECK(world.get<Counter>(fresh)->value == 2);
}

TEST_CASE("World components: add, remove and destroy")
{
  cg::World world;
  const cg::Entity e = world.create();
  world.add<Counter>(e, 5);
  world.add<Tag>(e, true);
  CHECK(world.componentCount<Counter>() == 1);
  CHECK(world.has<Tag>(e));

  world.remove<Tag>(e);
  CHECK_FALSE(world.has<Tag>(e));
  CHECK(world.componentCount<Tag>() == 0);

  REQUIRE(world.destroy(e));
  CHECK(world.componentCount<Counter>() == 0);
  CHECK(world.entityAliveCount() == 0);

  const cg::EcsStatsSnapshot stats = world.statsSnapshot();
  CHECK(stats.entityAlive == 0);
  CHECK(stats.componentsTotal == 0);
}

TEST_CASE("ForEach visits entities holding every listed component")
{
  cg::World world;
  for (int k = 0; k < 6; ++k)
  {
    const cg::Entity e = world.create();
    world.add<Counter>(e, k);
    if (k % 2 == 0)
      world.add<Tag>(e, true);
  }

  int visited = 0;
  int sum = 0;
  world.ForEach<Counter, Tag>([&](cg::Entity, Counter& c, Tag& t)
  {
    CHECK(t.on);
    visited++;
    sum += c.value;
  });
  CHECK(visited == 3);
  CHECK(sum == 0 + 2 + 4);

  // Removing from the driving pool inside the callback is allowed.
  world.ForEach<Counter>([&](cg::Entity e, Counter&)
  {
    world.remove<Counter>(e);
  });
  CHECK(world.componentCount<Counter>() == 0);
}

TEST_CASE("setName truncates to the fixed buffer")
{
  cg::Name n{};
  cg::setName(n, "Cell_12_-4");
  CHECK(std::strcmp(n.value, "Cell_12_-4") == 0);

  cg::setName(n, "a_very_long_name_that_does_not_fit_the_buffer");
  CHECK(std::strlen(n.value) == cg::Name::kMax - 1u);
}
