#pragma once
#include <cstdint>

namespace cg
{
  using Tick = uint64_t;

  // Monotonic clock in nanosecond ticks.
  Tick nowTicks();
  double ticksToMs(Tick ticks);

  // Adds the elapsed ticks of its scope to *accumulator on destruction.
  class ScopedTimer
  {
  public:
    explicit ScopedTimer(Tick* accumulator);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

  private:
    Tick m_start = 0;
    Tick* m_accumulator = nullptr;
  };
}
