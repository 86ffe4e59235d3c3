#include "cg_time.h"

#include <chrono>

namespace cg
{
  Tick nowTicks()
  {
    const auto now = std::chrono::steady_clock::now().time_since_epoch();
    return (Tick)std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
  }

  double ticksToMs(Tick ticks)
  {
    return (double)ticks * 1e-6;
  }

  ScopedTimer::ScopedTimer(Tick* accumulator)
    : m_start(nowTicks()), m_accumulator(accumulator)
  {
  }

  ScopedTimer::~ScopedTimer()
  {
    if (m_accumulator)
      *m_accumulator += nowTicks() - m_start;
  }
}
