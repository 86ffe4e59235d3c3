#pragma once

#include <cstdint>
#include <string_view>

namespace cg
{
  [[nodiscard]] uint32_t mix32(uint32_t x) noexcept;
  [[nodiscard]] uint64_t fnv1a64(std::string_view text) noexcept;

  // Folds a 64-bit hash down to 32 bits.
  [[nodiscard]] inline constexpr uint32_t fold64(uint64_t h) noexcept
  {
    return static_cast<uint32_t>(h ^ (h >> 32));
  }

  // Maps a 32-bit hash onto [0,1) with 24 bits of resolution.
  [[nodiscard]] inline constexpr double unitFromHash(uint32_t h) noexcept
  {
    return static_cast<double>(h >> 8) / 16777216.0;
  }
}
