#include "cg_inventory.h"

#include "cg_log.h"

#include <algorithm>
#include <cstdio>

namespace cg
{
  const char* interactionStatusName(InteractionStatus status)
  {
    switch (status)
    {
      case InteractionStatus::Ok:              return "Ok";
      case InteractionStatus::TooFar:          return "TooFar";
      case InteractionStatus::AlreadyCarrying: return "AlreadyCarrying";
      case InteractionStatus::NothingCarried:  return "NothingCarried";
      case InteractionStatus::ValueMismatch:   return "ValueMismatch";
      case InteractionStatus::NoCacheHere:     return "NoCacheHere";
      case InteractionStatus::NothingToCraft:  return "NothingToCraft";
      case InteractionStatus::ValueTooLarge:   return "ValueTooLarge";
      default:                                 return "Unknown";
    }
  }

  std::string InteractionResult::describe() const
  {
    char buf[160];
    switch (status)
    {
      case InteractionStatus::Ok:
        std::snprintf(buf, sizeof(buf), "Done at %d,%d (value %lld).%s",
                      cell.i, cell.j, (long long)value, wonNow ? " You win!" : "");
        break;
      case InteractionStatus::TooFar:
        std::snprintf(buf, sizeof(buf), "Too far (%d cells). Move within %d cells.", distance, required);
        break;
      case InteractionStatus::AlreadyCarrying:
        std::snprintf(buf, sizeof(buf), "Your hands are full.");
        break;
      case InteractionStatus::NothingCarried:
        std::snprintf(buf, sizeof(buf), "You are not carrying a token.");
        break;
      case InteractionStatus::ValueMismatch:
        std::snprintf(buf, sizeof(buf), "No carried token matches the cache value %lld.", (long long)value);
        break;
      case InteractionStatus::NoCacheHere:
        std::snprintf(buf, sizeof(buf), "There is no cache at %d,%d.", cell.i, cell.j);
        break;
      case InteractionStatus::NothingToCraft:
        std::snprintf(buf, sizeof(buf), "Not enough tokens of value %lld to craft.", (long long)value);
        break;
      case InteractionStatus::ValueTooLarge:
        std::snprintf(buf, sizeof(buf), "A token of value %lld cannot be doubled any further.", (long long)value);
        break;
      default:
        std::snprintf(buf, sizeof(buf), "Unknown result.");
        break;
    }
    return buf;
  }

  std::optional<TokenValue> Inventory::slot() const
  {
    if (m_tokens.empty())
      return std::nullopt;
    return m_tokens.front();
  }

  bool Inventory::contains(TokenValue value) const
  {
    return std::find(m_tokens.begin(), m_tokens.end(), value) != m_tokens.end();
  }

  uint32_t Inventory::countOf(TokenValue value) const
  {
    return (uint32_t)std::count(m_tokens.begin(), m_tokens.end(), value);
  }

  bool Inventory::add(TokenValue value)
  {
    if (full())
      return false;
    m_tokens.push_back(value);
    return true;
  }

  bool Inventory::takeOne(TokenValue value)
  {
    auto it = std::find(m_tokens.begin(), m_tokens.end(), value);
    if (it == m_tokens.end())
      return false;
    m_tokens.erase(it);
    return true;
  }

  CraftingEngine::CraftingEngine(const InventoryConfig& config, const CellResolver& resolver, OverlayStore& overlay)
    : m_config(config), m_resolver(&resolver), m_overlay(&overlay), m_inventory(config.capacity)
  {
    if (m_config.proximityRadius < 0)
    {
      cg::log(cg::LogLevel::Warn, "Inventory: negative proximity radius %d, using 0", m_config.proximityRadius);
      m_config.proximityRadius = 0;
    }
    if (m_config.winThreshold < 1)
    {
      cg::log(cg::LogLevel::Warn, "Inventory: win threshold %lld raised to 1", (long long)m_config.winThreshold);
      m_config.winThreshold = 1;
    }
  }

  bool CraftingEngine::withinReach(const CellCoord& player, const CellCoord& cell) const
  {
    return cellDistance(player, cell) <= m_config.proximityRadius;
  }

  bool CraftingEngine::interactable(const CellCoord& player, const CellCoord& cell, const CellContent& content) const
  {
    if (!content.hasCache || !withinReach(player, cell))
      return false;
    return !m_inventory.full() || (m_inventory.contains(content.value) && content.value <= kMaxDoublable);
  }

  InteractionResult CraftingEngine::pickup(const CellCoord& player, const CellCoord& cell)
  {
    InteractionResult r{};
    r.cell = cell;
    r.distance = cellDistance(player, cell);
    r.required = m_config.proximityRadius;

    if (r.distance > m_config.proximityRadius)
    {
      r.status = InteractionStatus::TooFar;
      return r;
    }
    if (m_inventory.full())
    {
      r.status = InteractionStatus::AlreadyCarrying;
      return r;
    }
    const CellContent content = m_resolver->resolve(cell);
    if (!content.hasCache)
    {
      r.status = InteractionStatus::NoCacheHere;
      return r;
    }

    m_inventory.add(content.value);
    m_overlay->setEmpty(cell);
    r.value = content.value;

    cg::log(cg::LogLevel::Info, "Picked up %lld at (%d,%d)", (long long)content.value, cell.i, cell.j);
    return r;
  }

  InteractionResult CraftingEngine::place(const CellCoord& player, const CellCoord& cell)
  {
    InteractionResult r{};
    r.cell = cell;
    r.distance = cellDistance(player, cell);
    r.required = m_config.proximityRadius;

    if (r.distance > m_config.proximityRadius)
    {
      r.status = InteractionStatus::TooFar;
      return r;
    }
    if (m_inventory.empty())
    {
      r.status = InteractionStatus::NothingCarried;
      return r;
    }
    const CellContent content = m_resolver->resolve(cell);
    if (!content.hasCache)
    {
      r.status = InteractionStatus::NoCacheHere;
      return r;
    }
    if (!m_inventory.contains(content.value))
    {
      r.status = InteractionStatus::ValueMismatch;
      r.value = content.value;
      return r;
    }

    if (content.value > kMaxDoublable)
    {
      r.status = InteractionStatus::ValueTooLarge;
      r.value = content.value;
      return r;
    }

    const TokenValue merged = content.value * 2;
    if (!m_overlay->setToken(cell, merged))
    {
      cg::log(cg::LogLevel::Error, "Merge at (%d,%d) produced invalid value %lld", cell.i, cell.j, (long long)merged);
      r.status = InteractionStatus::ValueTooLarge;
      r.value = content.value;
      return r;
    }
    m_inventory.takeOne(content.value);
    r.value = merged;

    cg::log(cg::LogLevel::Info, "Merged %lld into (%d,%d) -> %lld", (long long)content.value, cell.i, cell.j, (long long)merged);
    checkWin(merged, r);
    return r;
  }

  InteractionResult CraftingEngine::craft(TokenValue value)
  {
    InteractionResult r{};
    r.value = value;

    if (value <= 0 || m_inventory.countOf(value) < 2)
    {
      r.status = InteractionStatus::NothingToCraft;
      return r;
    }
    if (value > kMaxDoublable)
    {
      r.status = InteractionStatus::ValueTooLarge;
      return r;
    }

    m_inventory.takeOne(value);
    m_inventory.takeOne(value);
    const TokenValue crafted = value * 2;
    m_inventory.add(crafted);
    r.value = crafted;

    cg::log(cg::LogLevel::Info, "Crafted %lld + %lld -> %lld", (long long)value, (long long)value, (long long)crafted);
    checkWin(crafted, r);
    return r;
  }

  void CraftingEngine::checkWin(TokenValue produced, InteractionResult& result)
  {
    if (m_won || produced < m_config.winThreshold)
      return;

    m_won = true;
    m_winningValue = produced;
    result.wonNow = true;
    cg::log(cg::LogLevel::Info, "Win threshold %lld reached with %lld", (long long)m_config.winThreshold, (long long)produced);
  }
}
