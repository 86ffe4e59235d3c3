#include "cg_hash.h"

namespace cg
{
  uint32_t mix32(uint32_t x) noexcept
  {
    x ^= x >> 16;
    x *= 0x7feb352du;
    x ^= x >> 15;
    x *= 0x846ca68bu;
    x ^= x >> 16;
    return x;
  }

  uint64_t fnv1a64(std::string_view text) noexcept
  {
    uint64_t hash = 1469598103934665603ull;
    for (unsigned char ch : text)
    {
      hash ^= static_cast<uint64_t>(ch);
      hash *= 1099511628211ull;
    }
    return hash;
  }
}
