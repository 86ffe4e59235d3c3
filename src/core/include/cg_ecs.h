#pragma once
#include <cstdint>
#include <vector>
#include <atomic>
#include <type_traits>

namespace cg
{
  // --------------------
  // Entity
  // --------------------
  struct Entity
  {
    uint32_t value = 0;

    static constexpr uint32_t INDEX_BITS = 24;
    static constexpr uint32_t GENERATION_BITS = 8;
    static constexpr uint32_t INDEX_MASK = (1u << INDEX_BITS) - 1u;

    static Entity fromParts(uint32_t index, uint32_t generation)
    {
      Entity e{};
      e.value = (generation << INDEX_BITS) | (index & INDEX_MASK);
      return e;
    }

    uint32_t index() const { return value & INDEX_MASK; }
    uint32_t generation() const { return value >> INDEX_BITS; }

    bool operator==(const Entity& o) const { return value == o.value; }
    bool operator!=(const Entity& o) const { return value != o.value; }
  };

  static constexpr Entity kInvalidEntity{ 0xFFFFFFFFu };

  // --------------------
  // Entity Manager
  // --------------------
  class EntityManager
  {
  public:
    Entity create();
    bool destroy(Entity e);

    bool isAlive(Entity e) const;
    uint32_t aliveCount() const { return m_aliveCount; }
    uint32_t capacity() const { return (uint32_t)m_generations.size(); }

    void reserve(uint32_t count);

  private:
    std::vector<uint32_t> m_generations;
    std::vector<uint32_t> m_free;
    uint32_t m_aliveCount = 0;
  };

  // --------------------
  // Shared components
  // --------------------
  struct Name
  {
    static constexpr uint32_t kMax = 32;
    char value[kMax]{};
  };

  void setName(Name& n, const char* text);

  // --------------------
  // ECS Stats
  // --------------------
  struct EcsStatsSnapshot
  {
    uint32_t entityAlive = 0;
    uint32_t entityCapacity = 0;
    uint32_t componentPools = 0;
    uint32_t componentsTotal = 0;
  };

  // --------------------
  // Component pools (SparseSet)
  // --------------------
  struct IComponentPool
  {
    virtual ~IComponentPool() = default;
    virtual void remove(Entity e) = 0;
    virtual uint32_t size() const = 0;
    virtual void reserve(uint32_t count) = 0;
  };

  template<typename T>
  class ComponentPool final : public IComponentPool
  {
  public:
    T& add(Entity e)
    {
      const uint32_t idx = e.index();
      if (idx >= (uint32_t)m_sparse.size())
        m_sparse.resize(idx + 1u, 0u);

      uint32_t slot = m_sparse[idx];
      if (slot != 0)
        return m_data[slot - 1u];

      const uint32_t denseIndex = (uint32_t)m_denseEntities.size();
      m_denseEntities.push_back(e);
      m_data.emplace_back(T{});
      m_sparse[idx] = denseIndex + 1u;
      return m_data.back();
    }

    bool has(Entity e) const
    {
      return slotOf(e) != 0;
    }

    T* get(Entity e)
    {
      const uint32_t slot = slotOf(e);
      return slot ? &m_data[slot - 1u] : nullptr;
    }

    const T* get(Entity e) const
    {
      const uint32_t slot = slotOf(e);
      return slot ? &m_data[slot - 1u] : nullptr;
    }

    void remove(Entity e) override
    {
      const uint32_t slot = slotOf(e);
      if (slot == 0)
        return;

      const uint32_t denseIndex = slot - 1u;
      const uint32_t last = (uint32_t)m_denseEntities.size() - 1u;

      if (denseIndex != last)
      {
        m_denseEntities[denseIndex] = m_denseEntities[last];
        m_data[denseIndex] = m_data[last];
        m_sparse[m_denseEntities[denseIndex].index()] = denseIndex + 1u;
      }

      m_denseEntities.pop_back();
      m_data.pop_back();
      m_sparse[e.index()] = 0;
    }

    uint32_t size() const override { return (uint32_t)m_denseEntities.size(); }
    void reserve(uint32_t count) override
    {
      m_denseEntities.reserve(count);
      m_data.reserve(count);
    }

    const std::vector<Entity>& denseEntities() const { return m_denseEntities; }

  private:
    // Slots are keyed by index only; a stale handle whose index was recycled must not
    // alias the new occupant.
    uint32_t slotOf(Entity e) const
    {
      const uint32_t idx = e.index();
      if (idx >= (uint32_t)m_sparse.size())
        return 0;
      const uint32_t slot = m_sparse[idx];
      if (slot == 0 || m_denseEntities[slot - 1u] != e)
        return 0;
      return slot;
    }

  private:
    std::vector<Entity> m_denseEntities;
    std::vector<T> m_data;
    std::vector<uint32_t> m_sparse;
  };

  // --------------------
  // World
  // --------------------
  class World
  {
  public:
    World() = default;
    ~World();

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    Entity create() { return m_entities.create(); }
    bool destroy(Entity e);
    bool isAlive(Entity e) const { return m_entities.isAlive(e); }

    void reserveEntities(uint32_t count);

    template<typename T, typename... Args>
    T& add(Entity e, Args&&... args)
    {
      auto* pool = getPool<T>();
      T& c = pool->add(e);
      c = T{ static_cast<Args&&>(args)... };
      return c;
    }

    template<typename T>
    bool has(Entity e) const
    {
      const auto* pool = getPoolConst<T>();
      return pool ? pool->has(e) : false;
    }

    template<typename T>
    T* get(Entity e)
    {
      auto* pool = getPool<T>();
      return pool ? pool->get(e) : nullptr;
    }

    template<typename T>
    const T* get(Entity e) const
    {
      const auto* pool = getPoolConst<T>();
      return pool ? pool->get(e) : nullptr;
    }

    template<typename T>
    void remove(Entity e)
    {
      auto* pool = getPool<T>();
      if (pool) pool->remove(e);
    }

    template<typename T>
    uint32_t componentCount() const
    {
      const auto* pool = getPoolConst<T>();
      return pool ? pool->size() : 0;
    }

    uint32_t entityAliveCount() const { return m_entities.aliveCount(); }
    uint32_t entityCapacity() const { return m_entities.capacity(); }

    EcsStatsSnapshot statsSnapshot() const;

    template<typename... Ts, typename F>
    void ForEach(F&& f)
    {
      forEachImpl<Ts...>(static_cast<F&&>(f));
    }

  private:
    template<typename T>
    ComponentPool<T>* getPool()
    {
      const uint32_t id = componentTypeId<T>();
      if (id >= (uint32_t)m_pools.size())
        m_pools.resize(id + 1u, nullptr);
      if (!m_pools[id])
        m_pools[id] = new ComponentPool<T>();
      return static_cast<ComponentPool<T>*>(m_pools[id]);
    }

    template<typename T>
    const ComponentPool<T>* getPoolConst() const
    {
      const uint32_t id = componentTypeId<T>();
      if (id >= (uint32_t)m_pools.size())
        return nullptr;
      return static_cast<const ComponentPool<T>*>(m_pools[id]);
    }

    template<typename T>
    static uint32_t componentTypeId()
    {
      static uint32_t id = nextComponentTypeId();
      return id;
    }

    static uint32_t nextComponentTypeId();

    template<typename T0, typename... Ts, typename F>
    void forEachImpl(F&& f)
    {
      ComponentPool<T0>* driver = getPool<T0>();
      if (!driver || driver->size() == 0)
        return;

      // Copy: the callback may add or remove components on the driver pool.
      const std::vector<Entity> dense = driver->denseEntities();
      for (const Entity e : dense)
      {
        if ((has<T0>(e) && ... && has<Ts>(e)))
        {
          f(e, *get<T0>(e), *get<Ts>(e)...);
        }
      }
    }

  private:
    EntityManager m_entities;
    std::vector<IComponentPool*> m_pools;
  };
}
