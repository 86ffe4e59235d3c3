#pragma once
#include <cstdarg>

namespace cg
{
  enum class LogLevel { Debug = 0, Info, Warn, Error };

  void setLogLevel(LogLevel level);
  LogLevel logLevel();
  bool parseLogLevel(const char* text, LogLevel& out);

  void vlog(LogLevel level, const char* fmt, va_list args);
  void log(LogLevel level, const char* fmt, ...);
}
