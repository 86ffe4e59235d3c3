#include "cg_debug_ui.h"
#include "cg_log.h"
#include "cg_session.h"

#include <SDL.h>

#include <imgui.h>
#include <backends/imgui_impl_sdl2.h>
#include <backends/imgui_impl_sdlrenderer2.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <map>

namespace cg
{
  namespace
  {
    static const ImU32 kPlaceholderColor = IM_COL32(31, 120, 180, 90);
    static const ImU32 kTouchedColor = IM_COL32(90, 90, 90, 110);
    static const ImU32 kCacheColor = IM_COL32(227, 26, 28, 230);
    static const ImU32 kCacheReachColor = IM_COL32(51, 160, 44, 240);
    static const ImU32 kPlayerColor = IM_COL32(255, 215, 0, 255);
    static const ImU32 kReachColor = IM_COL32(255, 215, 0, 60);
  }

  bool DebugUI::init(SDL_Window* window, SDL_Renderer* renderer)
  {
    m_window = window;
    m_renderer = renderer;

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();

    ImGuiIO& io = ImGui::GetIO();
    io.IniFilename = nullptr; // no imgui.ini in runtime

    if (!ImGui_ImplSDL2_InitForSDLRenderer(m_window, m_renderer))
    {
      cg::log(cg::LogLevel::Error, "ImGui_ImplSDL2_InitForSDLRenderer failed.");
      ImGui::DestroyContext();
      return false;
    }

    if (!ImGui_ImplSDLRenderer2_Init(m_renderer))
    {
      cg::log(cg::LogLevel::Error, "ImGui_ImplSDLRenderer2_Init failed.");
      ImGui_ImplSDL2_Shutdown();
      ImGui::DestroyContext();
      return false;
    }

    m_freq = static_cast<double>(SDL_GetPerformanceFrequency());
    m_lastCounter = SDL_GetPerformanceCounter();

    m_initialized = true;
    cg::log(cg::LogLevel::Info, "DebugUI initialized.");
    return true;
  }

  void DebugUI::shutdown()
  {
    if (!m_initialized)
      return;

    ImGui_ImplSDLRenderer2_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();

    m_initialized = false;
  }

  void DebugUI::processEvent(const SDL_Event& e)
  {
    if (!m_initialized)
      return;
    ImGui_ImplSDL2_ProcessEvent(&e);
  }

  bool DebugUI::wantsKeyboard() const
  {
    return m_initialized && ImGui::GetIO().WantCaptureKeyboard;
  }

  void DebugUI::newFrame()
  {
    if (!m_initialized)
      return;

    ImGui_ImplSDLRenderer2_NewFrame();
    ImGui_ImplSDL2_NewFrame();
    ImGui::NewFrame();

    const uint64_t now = SDL_GetPerformanceCounter();
    const double dt = static_cast<double>(now - m_lastCounter) / m_freq;
    m_lastCounter = now;

    const uint32_t capacity = (uint32_t)(sizeof(m_frameTimes) / sizeof(m_frameTimes[0]));
    m_frameTimes[m_frameOffset] = static_cast<float>(dt * 1000.0);
    m_frameOffset = (m_frameOffset + 1) % capacity;
    if (m_frameCount < capacity)
      m_frameCount++;
  }

  void DebugUI::build(GameSession& session)
  {
    if (!m_initialized)
      return;

    drawMapPanel(session);
    drawStatusPanel(session);
    drawCellPopup(session);
  }

  void DebugUI::render()
  {
    if (!m_initialized)
      return;

    ImGui::Render();
#if IMGUI_VERSION_NUM >= 19040
    ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), m_renderer);
#else
    ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData());
#endif
  }

  void DebugUI::drawMapPanel(GameSession& session)
  {
    const ImGuiViewport* vp = ImGui::GetMainViewport();
    const float sideWidth = 320.0f;
    ImGui::SetNextWindowPos(vp->WorkPos);
    ImGui::SetNextWindowSize(ImVec2(std::max(64.0f, vp->WorkSize.x - sideWidth), vp->WorkSize.y));
    ImGui::Begin("Map", nullptr, ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoCollapse |
                                 ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoScrollWithMouse);

    const ImVec2 origin = ImGui::GetCursorScreenPos();
    ImVec2 size = ImGui::GetContentRegionAvail();
    size.x = std::max(size.x, 16.0f);
    size.y = std::max(size.y, 16.0f);
    ImGui::InvisibleButton("map_canvas", size);
    const bool clicked = ImGui::IsItemClicked(ImGuiMouseButton_Left);

    if (ImGui::IsItemHovered())
    {
      const float wheel = ImGui::GetIO().MouseWheel;
      if (wheel != 0.0f)
        m_pixelsPerCell = std::clamp(m_pixelsPerCell * (wheel > 0.0f ? 1.1f : 1.0f / 1.1f), 8.0f, 96.0f);
    }

    const GridMapping& mapping = session.mapping();
    const double cellSize = mapping.config().cellSize;
    const GridPoint player = session.playerPosition();
    const ImVec2 center(origin.x + size.x * 0.5f, origin.y + size.y * 0.5f);
    const double ppc = (double)m_pixelsPerCell;

    auto toScreen = [&](double y, double x)
    {
      return ImVec2(center.x + (float)((x - player.x) / cellSize * ppc),
                    center.y - (float)((y - player.y) / cellSize * ppc));
    };

    // Report what the panel can show; the session only materializes the delta.
    const double halfW = (size.x * 0.5) / ppc * cellSize;
    const double halfH = (size.y * 0.5) / ppc * cellSize;
    session.reportViewportBounds({ player.y - halfH, player.y + halfH, player.x - halfW, player.x + halfW });

    ImDrawList* dl = ImGui::GetWindowDrawList();
    dl->PushClipRect(origin, ImVec2(origin.x + size.x, origin.y + size.y), true);

    const CraftingEngine& engine = session.engine();
    const CellCoord playerCell = session.playerCell();
    World& world = session.world();

    world.ForEach<GridCell, CellArea>([&](Entity e, GridCell& cell, CellArea& area)
    {
      const ImVec2 a = toScreen(area.bounds.north, area.bounds.west);
      const ImVec2 b = toScreen(area.bounds.south, area.bounds.east);

      if (const CacheMarker* cache = world.get<CacheMarker>(e))
      {
        const bool reach = engine.interactable(playerCell, cell.coord, CellContent::cache(cache->value));
        const ImVec2 c((a.x + b.x) * 0.5f, (a.y + b.y) * 0.5f);
        dl->AddRect(a, b, kPlaceholderColor);
        dl->AddCircleFilled(c, m_pixelsPerCell * 0.3f, reach ? kCacheReachColor : kCacheColor);
        if (m_pixelsPerCell >= 20.0f)
        {
          char label[24];
          std::snprintf(label, sizeof(label), "%lld", (long long)cache->value);
          const ImVec2 ts = ImGui::CalcTextSize(label);
          dl->AddText(ImVec2(c.x - ts.x * 0.5f, c.y - ts.y * 0.5f), IM_COL32_WHITE, label);
        }
      }
      else
      {
        const CellPlaceholder* ph = world.get<CellPlaceholder>(e);
        dl->AddRect(a, b, (ph && ph->touched) ? kTouchedColor : kPlaceholderColor);
      }
    });

    const CellRect reach = CellRect::around(playerCell, engine.config().proximityRadius);
    const ContinuousBounds reachLo = mapping.cellBounds({ reach.minI, reach.minJ });
    const ContinuousBounds reachHi = mapping.cellBounds({ reach.maxI, reach.maxJ });
    dl->AddRectFilled(toScreen(reachHi.north, reachLo.west), toScreen(reachLo.south, reachHi.east), kReachColor);
    dl->AddCircleFilled(toScreen(player.y, player.x), std::max(4.0f, m_pixelsPerCell * 0.2f), kPlayerColor);
    dl->PopClipRect();

    if (clicked)
    {
      const ImVec2 m = ImGui::GetIO().MousePos;
      const GridPoint p{ player.y - (double)(m.y - center.y) / ppc * cellSize,
                         player.x + (double)(m.x - center.x) / ppc * cellSize };
      m_selected = mapping.pointToCell(p);
      m_openPopup = true;
    }

    ImGui::End();
  }

  void DebugUI::drawCellPopup(GameSession& session)
  {
    if (m_openPopup)
    {
      ImGui::OpenPopup("cell_popup");
      m_openPopup = false;
    }

    if (!ImGui::BeginPopup("cell_popup"))
      return;

    const CellView view = session.cellView(m_selected);
    ImGui::Text("Cell %d,%d  (distance %d)", m_selected.i, m_selected.j, cellDistance(session.playerCell(), m_selected));
    if (view.hasCache)
      ImGui::Text("Cache value: %lld", (long long)*view.value);
    else
      ImGui::TextUnformatted("No cache here.");

    if (view.hasCache)
    {
      if (ImGui::Button("Pick up"))
        m_message = session.requestPickup(m_selected).describe();
      ImGui::SameLine();
      if (ImGui::Button("Place"))
        m_message = session.requestPlace(m_selected).describe();
    }
    if (!m_message.empty())
      ImGui::TextWrapped("%s", m_message.c_str());

    ImGui::EndPopup();
  }

  void DebugUI::drawStatusPanel(GameSession& session)
  {
    const ImGuiViewport* vp = ImGui::GetMainViewport();
    const float sideWidth = 320.0f;
    ImGui::SetNextWindowPos(ImVec2(vp->WorkPos.x + std::max(64.0f, vp->WorkSize.x - sideWidth), vp->WorkPos.y));
    ImGui::SetNextWindowSize(ImVec2(sideWidth, vp->WorkSize.y));
    ImGui::Begin("Status", nullptr, ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoCollapse);

    float sumMs = 0.0f;
    for (uint32_t i = 0; i < m_frameCount; ++i) sumMs += m_frameTimes[i];
    const float avgMs = (m_frameCount > 0) ? (sumMs / (float)m_frameCount) : 0.0f;
    ImGui::Text("FPS: %.1f  (%.2f ms/frame)", avgMs > 0.0f ? 1000.0f / avgMs : 0.0f, avgMs);
    ImGui::Separator();

    const CellCoord pc = session.playerCell();
    ImGui::Text("Player cell: %d, %d", pc.i, pc.j);
    ImGui::TextUnformatted("Arrows/WASD move, click a cell to interact.");
    ImGui::SliderFloat("Zoom", &m_pixelsPerCell, 8.0f, 96.0f, "%.0f px/cell");
    ImGui::Separator();

    const CraftingEngine& engine = session.engine();
    const Inventory& inv = engine.inventory();
    if (inv.capacity() == 0)
      ImGui::Text("Inventory (%u, unbounded)", inv.size());
    else
      ImGui::Text("Inventory (%u / %u)", inv.size(), inv.capacity());

    if (inv.empty())
    {
      ImGui::BulletText("(empty)");
    }
    else
    {
      std::map<TokenValue, uint32_t> grouped;
      for (TokenValue v : inv.tokens())
        grouped[v]++;
      for (auto it = grouped.rbegin(); it != grouped.rend(); ++it)
      {
        ImGui::BulletText("%lld x %u", (long long)it->first, it->second);
        if (it->second >= 2)
        {
          ImGui::SameLine();
          ImGui::PushID((int)it->first);
          if (ImGui::SmallButton("Craft"))
            m_message = session.requestCraft(it->first).describe();
          ImGui::PopID();
        }
      }
    }

    ImGui::Text("Win threshold: %lld", (long long)engine.config().winThreshold);
    if (session.wonSnapshot())
      ImGui::TextColored(ImVec4(1.0f, 0.85f, 0.0f, 1.0f), "You won with %lld!", (long long)engine.winningValue());

    if (!m_message.empty())
    {
      ImGui::Separator();
      ImGui::TextWrapped("%s", m_message.c_str());
    }

    ImGui::Separator();
    const ViewportStats& vs = session.materializer().stats();
    ImGui::Text("Viewport");
    ImGui::BulletText("i [%d..%d]  j [%d..%d]", vs.region.minI, vs.region.maxI, vs.region.minJ, vs.region.maxJ);
    ImGui::BulletText("Cells: %u  (caches %u, empty %u)", vs.materialized, vs.caches, vs.placeholders);
    ImGui::BulletText("Last update: +%u -%u in %.3f ms", vs.entered, vs.left, vs.updateMs);
    ImGui::BulletText("Overlay entries: %u", (uint32_t)session.overlay().size());

    const EcsStatsSnapshot ecs = session.world().statsSnapshot();
    ImGui::Text("ECS");
    ImGui::BulletText("Entities: %u / %u", ecs.entityAlive, ecs.entityCapacity);
    ImGui::BulletText("Components: %u in %u pools", ecs.componentsTotal, ecs.componentPools);

    ImGui::End();
  }
}
