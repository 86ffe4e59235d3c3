#include "cg_ecs.h"

#include <cstdio>

namespace cg
{
  // --------------------
  // EntityManager
  // --------------------
  Entity EntityManager::create()
  {
    if (!m_free.empty())
    {
      const uint32_t idx = m_free.back();
      m_free.pop_back();
      const uint32_t gen = m_generations[idx];
      m_aliveCount++;
      return Entity::fromParts(idx, gen);
    }

    const uint32_t idx = (uint32_t)m_generations.size();
    m_generations.push_back(0);
    m_aliveCount++;
    return Entity::fromParts(idx, 0);
  }

  bool EntityManager::destroy(Entity e)
  {
    const uint32_t idx = e.index();
    if (idx >= m_generations.size())
      return false;
    const uint32_t gen = m_generations[idx];
    if (gen != e.generation())
      return false;

    // Generation is 8 bits wide in the handle.
    m_generations[idx] = (gen + 1u) & ((1u << Entity::GENERATION_BITS) - 1u);
    m_free.push_back(idx);
    if (m_aliveCount > 0)
      m_aliveCount--;
    return true;
  }

  bool EntityManager::isAlive(Entity e) const
  {
    const uint32_t idx = e.index();
    if (idx >= m_generations.size())
      return false;
    return m_generations[idx] == e.generation();
  }

  void EntityManager::reserve(uint32_t count)
  {
    m_generations.reserve(count);
    m_free.reserve(count / 4u);
  }

  // --------------------
  // Utils
  // --------------------
  void setName(Name& n, const char* text)
  {
    if (!text) { n.value[0] = '\0'; return; }
    std::snprintf(n.value, Name::kMax, "%s", text);
  }

  uint32_t World::nextComponentTypeId()
  {
    static std::atomic<uint32_t> counter{ 0 };
    return counter.fetch_add(1, std::memory_order_relaxed);
  }

  World::~World()
  {
    for (IComponentPool* p : m_pools)
      delete p;
    m_pools.clear();
  }

  bool World::destroy(Entity e)
  {
    if (!m_entities.destroy(e))
      return false;

    for (IComponentPool* p : m_pools)
    {
      if (p) p->remove(e);
    }
    return true;
  }

  void World::reserveEntities(uint32_t count)
  {
    m_entities.reserve(count);
    for (IComponentPool* p : m_pools)
    {
      if (p) p->reserve(count);
    }
  }

  EcsStatsSnapshot World::statsSnapshot() const
  {
    EcsStatsSnapshot snap{};
    snap.entityAlive = m_entities.aliveCount();
    snap.entityCapacity = m_entities.capacity();
    for (const IComponentPool* p : m_pools)
    {
      if (!p)
        continue;
      snap.componentPools++;
      snap.componentsTotal += p->size();
    }
    return snap;
  }
}
