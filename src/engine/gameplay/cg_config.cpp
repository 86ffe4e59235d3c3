#include "cg_config.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>

namespace cg
{
  namespace
  {
    static bool parseI64(const char* text, int64_t& out)
    {
      if (!text || *text == '\0')
        return false;
      char* end = nullptr;
      errno = 0;
      const long long v = std::strtoll(text, &end, 10);
      if (errno != 0 || !end || *end != '\0')
        return false;
      out = (int64_t)v;
      return true;
    }

    static bool parseU32(const char* text, uint32_t& out)
    {
      int64_t v = 0;
      if (!parseI64(text, v) || v < 0 || v > (int64_t)std::numeric_limits<uint32_t>::max())
        return false;
      out = (uint32_t)v;
      return true;
    }

    static bool parseI32(const char* text, int32_t& out)
    {
      int64_t v = 0;
      if (!parseI64(text, v) || v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max())
        return false;
      out = (int32_t)v;
      return true;
    }

    static bool parseF64(const char* text, double& out)
    {
      if (!text || *text == '\0')
        return false;
      char* end = nullptr;
      errno = 0;
      const double v = std::strtod(text, &end);
      if (errno != 0 || !end || *end != '\0')
        return false;
      out = v;
      return true;
    }

    static bool argValue(int& i, int argc, char** argv, const char*& out)
    {
      if (i + 1 >= argc)
        return false;
      out = argv[++i];
      return true;
    }
  }

  void applyEnvironmentOverrides(LaunchOptions& options)
  {
    if (const char* seed = std::getenv("CG_SEED"))
    {
      if (!parseU32(seed, options.session.generator.seed))
        cg::log(cg::LogLevel::Warn, "Ignoring CG_SEED='%s'", seed);
    }

    if (const char* win = std::getenv("CG_WIN_THRESHOLD"))
    {
      int64_t v = 0;
      if (parseI64(win, v) && v > 0)
        options.session.inventory.winThreshold = v;
      else
        cg::log(cg::LogLevel::Warn, "Ignoring CG_WIN_THRESHOLD='%s'", win);
    }

    if (const char* level = std::getenv("CG_LOG_LEVEL"))
    {
      if (!parseLogLevel(level, options.logLevel))
        cg::log(cg::LogLevel::Warn, "Ignoring CG_LOG_LEVEL='%s'", level);
    }
  }

  bool parseLaunchArgs(int argc, char** argv, LaunchOptions& options)
  {
    SessionConfig& s = options.session;

    for (int i = 1; i < argc; ++i)
    {
      const char* arg = argv[i];
      const char* value = nullptr;
      bool ok = true;

      if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0)
      {
        options.showHelp = true;
        continue;
      }
      else if (std::strcmp(arg, "--seed") == 0)
      {
        ok = argValue(i, argc, argv, value) && parseU32(value, s.generator.seed);
      }
      else if (std::strcmp(arg, "--capacity") == 0)
      {
        ok = argValue(i, argc, argv, value) && parseU32(value, s.inventory.capacity);
      }
      else if (std::strcmp(arg, "--radius") == 0)
      {
        ok = argValue(i, argc, argv, value) && parseI32(value, s.inventory.proximityRadius) && s.inventory.proximityRadius >= 0;
      }
      else if (std::strcmp(arg, "--win") == 0)
      {
        ok = argValue(i, argc, argv, value) && parseI64(value, s.inventory.winThreshold) && s.inventory.winThreshold > 0;
      }
      else if (std::strcmp(arg, "--spawn") == 0)
      {
        ok = argValue(i, argc, argv, value) && parseF64(value, s.generator.spawnProbability) &&
             s.generator.spawnProbability >= 0.0 && s.generator.spawnProbability <= 1.0;
      }
      else if (std::strcmp(arg, "--neighborhood") == 0)
      {
        ok = argValue(i, argc, argv, value) && parseI32(value, s.neighborhoodRadius) && s.neighborhoodRadius >= 0;
      }
      else if (std::strcmp(arg, "--uniform") == 0)
      {
        const char* lo = nullptr;
        const char* hi = nullptr;
        int64_t vlo = 0;
        int64_t vhi = 0;
        ok = argValue(i, argc, argv, lo) && argValue(i, argc, argv, hi) &&
             parseI64(lo, vlo) && parseI64(hi, vhi) && vlo >= 1 && vhi >= vlo;
        if (ok)
          s.generator.distribution = ValueDistribution::uniform(vlo, vhi);
        value = lo;
      }
      else if (std::strcmp(arg, "--no-follow") == 0)
      {
        s.followPlayer = false;
      }
      else if (std::strcmp(arg, "--log-level") == 0)
      {
        ok = argValue(i, argc, argv, value) && parseLogLevel(value, options.logLevel);
      }
      else
      {
        cg::log(cg::LogLevel::Error, "Unknown argument: %s", arg);
        return false;
      }

      if (!ok)
      {
        cg::log(cg::LogLevel::Error, "Invalid value for %s: %s", arg, value ? value : "(missing)");
        return false;
      }
    }
    return true;
  }

  void printLaunchUsage(const char* argv0)
  {
    std::printf(
      "Usage: %s [options]\n\n"
      "Options:\n"
      "  --seed <n>            World seed (default 0, env CG_SEED).\n"
      "  --capacity <n>        Carry capacity; 0 = unbounded (default 1).\n"
      "  --radius <n>          Interaction radius in cells (default 3).\n"
      "  --win <n>             Win threshold (default 16, env CG_WIN_THRESHOLD).\n"
      "  --spawn <p>           Cache spawn probability in [0,1] (default 0.1).\n"
      "  --uniform <lo> <hi>   Uniform cache values in [lo,hi] instead of the tier table.\n"
      "  --neighborhood <n>    Visible radius around the player (default 8).\n"
      "  --no-follow           Do not recenter the view on player moves.\n"
      "  --log-level <level>   debug|info|warn|error (env CG_LOG_LEVEL).\n"
      "  --help                Show this help.\n",
      argv0 ? argv0 : "cg");
  }
}
