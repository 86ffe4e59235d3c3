#include "cg_app.h"
#include "cg_config.h"
#include "cg_debug_ui.h"
#include "cg_log.h"
#include "cg_session.h"

#include <SDL.h>

struct SandboxContext
{
  cg::DebugUI* ui = nullptr;
  cg::GameSession* session = nullptr;
};

static void handle_event(const SDL_Event& e, void* user)
{
  auto* ctx = static_cast<SandboxContext*>(user);
  if (!ctx)
    return;

  ctx->ui->processEvent(e);
  if (e.type != SDL_KEYDOWN || ctx->ui->wantsKeyboard())
    return;

  switch (e.key.keysym.sym)
  {
    case SDLK_UP:    case SDLK_w: ctx->session->stepPlayer(1, 0); break;
    case SDLK_DOWN:  case SDLK_s: ctx->session->stepPlayer(-1, 0); break;
    case SDLK_LEFT:  case SDLK_a: ctx->session->stepPlayer(0, -1); break;
    case SDLK_RIGHT: case SDLK_d: ctx->session->stepPlayer(0, 1); break;
    default: break;
  }
}

int main(int argc, char** argv)
{
  cg::LaunchOptions options{};
  cg::applyEnvironmentOverrides(options);
  if (!cg::parseLaunchArgs(argc, argv, options))
  {
    cg::printLaunchUsage(argv[0]);
    return 2;
  }
  if (options.showHelp)
  {
    cg::printLaunchUsage(argv[0]);
    return 0;
  }
  cg::setLogLevel(options.logLevel);

  // The map panel reports its own bounds every frame.
  options.session.followPlayer = false;

  cg::App app;
  cg::AppConfig cfg;
  cfg.title = "cg_sandbox";

  if (!app.init(cfg))
  {
    cg::log(cg::LogLevel::Error, "App init failed.");
    app.shutdown();
    return 1;
  }

  cg::DebugUI ui;
  if (!ui.init(app.window(), app.renderer()))
  {
    cg::log(cg::LogLevel::Error, "DebugUI init failed.");
    app.shutdown();
    return 1;
  }

  cg::GameSession session(options.session);

  SandboxContext ctx{};
  ctx.ui = &ui;
  ctx.session = &session;
  app.setEventCallback(handle_event, &ctx);

  bool announcedWin = false;
  while (app.pump())
  {
    ui.newFrame();
    ui.build(session);

    if (session.wonSnapshot() && !announcedWin)
    {
      announcedWin = true;
      cg::log(cg::LogLevel::Info, "Game won.");
    }

    app.beginFrame();
    ui.render();
    app.endFrame();
  }

  ui.shutdown();
  app.shutdown();
  return 0;
}
