#include "cg_app.h"
#include "cg_log.h"

#include <SDL.h>

namespace cg
{
  static uint64_t now_counter() { return SDL_GetPerformanceCounter(); }
  static double   now_freq()    { return static_cast<double>(SDL_GetPerformanceFrequency()); }

  bool App::init(const AppConfig& cfg)
  {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS | SDL_INIT_TIMER) != 0)
    {
      cg::log(cg::LogLevel::Error, "SDL_Init failed: %s", SDL_GetError());
      return false;
    }

    m_window = SDL_CreateWindow(
      cfg.title,
      SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
      cfg.width, cfg.height,
      SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI
    );

    if (!m_window)
    {
      cg::log(cg::LogLevel::Error, "SDL_CreateWindow failed: %s", SDL_GetError());
      return false;
    }

    Uint32 rendererFlags = SDL_RENDERER_ACCELERATED;
    if (cfg.vsync)
      rendererFlags |= SDL_RENDERER_PRESENTVSYNC;
    m_renderer = SDL_CreateRenderer(m_window, -1, rendererFlags);
    if (!m_renderer)
    {
      cg::log(cg::LogLevel::Error, "SDL_CreateRenderer failed: %s", SDL_GetError());
      return false;
    }

    m_w = cfg.width;
    m_h = cfg.height;
    m_freq = now_freq();
    m_lastCounter = now_counter();

    cg::log(cg::LogLevel::Info, "Window created: %dx%d", cfg.width, cfg.height);
    return true;
  }

  void App::shutdown()
  {
    if (m_renderer)
    {
      SDL_DestroyRenderer(m_renderer);
      m_renderer = nullptr;
    }
    if (m_window)
    {
      SDL_DestroyWindow(m_window);
      m_window = nullptr;
    }
    SDL_Quit();
    cg::log(cg::LogLevel::Info, "Shutdown complete.");
  }

  bool App::pump()
  {
    SDL_Event e;

    while (SDL_PollEvent(&e))
    {
      if (e.type == SDL_QUIT) m_running = false;
      if (e.type == SDL_KEYDOWN && e.key.keysym.sym == SDLK_ESCAPE) m_running = false;

      if (e.type == SDL_WINDOWEVENT && e.window.event == SDL_WINDOWEVENT_SIZE_CHANGED)
      {
        m_w = e.window.data1;
        m_h = e.window.data2;
      }

      if (m_eventCb)
        m_eventCb(e, m_eventUser);
    }

    const uint64_t c = now_counter();
    m_dt = static_cast<float>(static_cast<double>(c - m_lastCounter) / m_freq);
    m_lastCounter = c;

    return m_running;
  }

  void App::beginFrame()
  {
    SDL_SetRenderDrawColor(m_renderer, 18, 20, 24, 255);
    SDL_RenderClear(m_renderer);
  }

  void App::endFrame()
  {
    SDL_RenderPresent(m_renderer);
  }
}
