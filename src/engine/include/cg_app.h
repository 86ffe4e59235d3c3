#pragma once
#include <cstdint>

struct SDL_Window;
struct SDL_Renderer;
union SDL_Event;

namespace cg
{
  struct AppConfig
  {
    const char* title = "CacheGrid";
    int width = 1280;
    int height = 720;
    bool vsync = true;
  };

  class App
  {
  public:
    using EventCallback = void(*)(const SDL_Event& e, void* user);

    bool init(const AppConfig& cfg);
    void shutdown();

    // returns false when should quit
    bool pump();
    void setEventCallback(EventCallback cb, void* user) { m_eventCb = cb; m_eventUser = user; }
    SDL_Window* window() const { return m_window; }
    SDL_Renderer* renderer() const { return m_renderer; }

    void beginFrame();
    void endFrame();

    // Seconds since the previous pump().
    float frameSeconds() const { return m_dt; }
    int width() const { return m_w; }
    int height() const { return m_h; }

  private:
    SDL_Window* m_window = nullptr;
    SDL_Renderer* m_renderer = nullptr;
    bool m_running = true;
    int m_w = 0, m_h = 0;
    uint64_t m_lastCounter = 0;
    double m_freq = 0.0;
    float m_dt = 0.0f;

    EventCallback m_eventCb = nullptr;
    void* m_eventUser = nullptr;
  };
}
