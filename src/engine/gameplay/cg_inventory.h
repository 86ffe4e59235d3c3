#pragma once

#include "cg_grid.h"
#include "cg_resolver.h"

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace cg
{
  struct InventoryConfig
  {
    // 1 is the single carry slot; 0 means unbounded.
    uint32_t capacity = 1;
    int32_t proximityRadius = 3;
    TokenValue winThreshold = 16;
  };

  enum class InteractionStatus : uint8_t
  {
    Ok = 0,
    TooFar,
    AlreadyCarrying,
    NothingCarried,
    ValueMismatch,
    NoCacheHere,
    NothingToCraft,
    ValueTooLarge
  };

  const char* interactionStatusName(InteractionStatus status);

  struct InteractionResult
  {
    InteractionStatus status = InteractionStatus::Ok;
    CellCoord cell{};
    int32_t distance = 0;
    int32_t required = 0;
    // Picked-up value, merged result, or crafted result on success; the resident value on
    // mismatch; the value that cannot be doubled on ValueTooLarge.
    TokenValue value = 0;
    bool wonNow = false;

    bool ok() const { return status == InteractionStatus::Ok; }
    std::string describe() const;
  };

  // Carried tokens, kept in pickup order.
  class Inventory
  {
  public:
    explicit Inventory(uint32_t capacity = 1) : m_capacity(capacity) {}

    uint32_t capacity() const { return m_capacity; }
    bool empty() const { return m_tokens.empty(); }
    bool full() const { return m_capacity != 0 && m_tokens.size() >= m_capacity; }
    uint32_t size() const { return (uint32_t)m_tokens.size(); }
    const std::vector<TokenValue>& tokens() const { return m_tokens; }

    // Single-slot view: the first carried token.
    std::optional<TokenValue> slot() const;

    bool contains(TokenValue value) const;
    uint32_t countOf(TokenValue value) const;

    bool add(TokenValue value);
    bool takeOne(TokenValue value);

  private:
    uint32_t m_capacity = 1;
    std::vector<TokenValue> m_tokens;
  };

  // Carry state machine. Cell content is read through the resolver; cell mutations go
  // to the overlay and are reported through refreshed so the caller can update views.
  class CraftingEngine
  {
  public:
    CraftingEngine(const InventoryConfig& config, const CellResolver& resolver, OverlayStore& overlay);

    const InventoryConfig& config() const { return m_config; }
    const Inventory& inventory() const { return m_inventory; }
    bool won() const { return m_won; }
    TokenValue winningValue() const { return m_winningValue; }

    InteractionResult pickup(const CellCoord& player, const CellCoord& cell);
    InteractionResult place(const CellCoord& player, const CellCoord& cell);
    InteractionResult craft(TokenValue value);

    bool withinReach(const CellCoord& player, const CellCoord& cell) const;
    bool interactable(const CellCoord& player, const CellCoord& cell, const CellContent& content) const;

    // Largest token value that can still be merged or crafted.
    static constexpr TokenValue kMaxDoublable = std::numeric_limits<TokenValue>::max() / 2;

  private:
    void checkWin(TokenValue produced, InteractionResult& result);

  private:
    InventoryConfig m_config{};
    const CellResolver* m_resolver = nullptr;
    OverlayStore* m_overlay = nullptr;
    Inventory m_inventory;
    bool m_won = false;
    TokenValue m_winningValue = 0;
  };
}
