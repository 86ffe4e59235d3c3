#include "cg_log.h"

#include <atomic>
#include <cstdio>
#include <cstring>

namespace cg
{
  namespace
  {
    static std::atomic<int> g_minLevel{ static_cast<int>(LogLevel::Info) };

    static const char* level_to_str(LogLevel lvl)
    {
      switch (lvl)
      {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default:              return "LOG";
      }
    }
  }

  void setLogLevel(LogLevel level)
  {
    g_minLevel.store(static_cast<int>(level), std::memory_order_relaxed);
  }

  LogLevel logLevel()
  {
    return static_cast<LogLevel>(g_minLevel.load(std::memory_order_relaxed));
  }

  bool parseLogLevel(const char* text, LogLevel& out)
  {
    if (!text)
      return false;
    if (std::strcmp(text, "debug") == 0) { out = LogLevel::Debug; return true; }
    if (std::strcmp(text, "info") == 0)  { out = LogLevel::Info;  return true; }
    if (std::strcmp(text, "warn") == 0)  { out = LogLevel::Warn;  return true; }
    if (std::strcmp(text, "error") == 0) { out = LogLevel::Error; return true; }
    return false;
  }

  void vlog(LogLevel level, const char* fmt, va_list args)
  {
    if (static_cast<int>(level) < g_minLevel.load(std::memory_order_relaxed))
      return;
    std::fprintf(stdout, "[%s] ", level_to_str(level));
    std::vfprintf(stdout, fmt, args);
    std::fprintf(stdout, "\n");
    std::fflush(stdout);
  }

  void log(LogLevel level, const char* fmt, ...)
  {
    va_list args;
    va_start(args, fmt);
    vlog(level, fmt, args);
    va_end(args);
  }
}
