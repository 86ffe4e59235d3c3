#pragma once
#include <cstdint>
#include <string>

#include "cg_ecs.h"
#include "cg_grid.h"

struct SDL_Window;
struct SDL_Renderer;
union SDL_Event;

namespace cg
{
  class GameSession;

  // Map and status panels for a GameSession. Reports the map panel's extent back to
  // the session as viewport bounds every frame.
  class DebugUI
  {
  public:
    bool init(SDL_Window* window, SDL_Renderer* renderer);
    void shutdown();

    void processEvent(const SDL_Event& e);
    bool wantsKeyboard() const;

    void newFrame();
    void build(GameSession& session);
    void render();

    void setMessage(const std::string& text) { m_message = text; }

  private:
    void drawMapPanel(GameSession& session);
    void drawStatusPanel(GameSession& session);
    void drawCellPopup(GameSession& session);

  private:
    SDL_Window* m_window = nullptr;
    SDL_Renderer* m_renderer = nullptr;
    bool m_initialized = false;

    float m_pixelsPerCell = 28.0f;
    CellCoord m_selected{};
    bool m_openPopup = false;
    std::string m_message;

    float m_frameTimes[120]{};
    uint32_t m_frameOffset = 0;
    uint32_t m_frameCount = 0;
    uint64_t m_lastCounter = 0;
    double m_freq = 0.0;
  };
}
