#pragma once

#include "cg_log.h"
#include "cg_session.h"

namespace cg
{
  struct LaunchOptions
  {
    SessionConfig session{};
    LogLevel logLevel = LogLevel::Info;
    bool showHelp = false;
  };

  // Reads CG_SEED, CG_WIN_THRESHOLD and CG_LOG_LEVEL. Unparseable values are logged and ignored.
  void applyEnvironmentOverrides(LaunchOptions& options);

  // Command-line flags override the environment. Returns false on a malformed flag.
  bool parseLaunchArgs(int argc, char** argv, LaunchOptions& options);
  void printLaunchUsage(const char* argv0);
}
