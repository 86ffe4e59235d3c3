#pragma once

#include "cg_grid.h"

#include <cstdint>
#include <vector>

namespace cg
{
  using TokenValue = int64_t;

  // Value distribution for freshly generated caches.
  //
  // Tiered: a cumulative table of (value, probability) pairs. The default table is
  //   1: 0.60   2: 0.30   3: 0.07   4: 0.025   5: 0.005
  // Uniform: every integer in [uniformMin, uniformMax] is equally likely.
  //
  // Presence and value are drawn from two separately salted hash streams ("cache"
  // and "value"). Both streams hash the same (seed, i, j), so they are decorrelated
  // by the salt only; they are not independent in any stronger statistical sense.
  struct ValueTier
  {
    TokenValue value = 1;
    double probability = 0.0;
  };

  struct ValueDistribution
  {
    enum class Kind : uint8_t { Tiered = 0, Uniform = 1 };

    Kind kind = Kind::Tiered;
    std::vector<ValueTier> tiers{ { 1, 0.60 }, { 2, 0.30 }, { 3, 0.07 }, { 4, 0.025 }, { 5, 0.005 } };
    TokenValue uniformMin = 1;
    TokenValue uniformMax = 99;

    static ValueDistribution tiered(std::vector<ValueTier> table);
    static ValueDistribution uniform(TokenValue minValue, TokenValue maxValue);
  };

  struct GeneratorConfig
  {
    uint32_t seed = 0;
    double spawnProbability = 0.1;
    ValueDistribution distribution{};
  };

  struct BaselineContent
  {
    bool present = false;
    TokenValue value = 0;

    bool operator==(const BaselineContent& o) const { return present == o.present && value == o.value; }
    bool operator!=(const BaselineContent& o) const { return !(*this == o); }
  };

  // Deterministic hash in [0,1) of (seed, i, j, salt).
  double luck(uint32_t seed, const CellCoord& cell, const char* salt);

  class Generator
  {
  public:
    Generator() { configure(GeneratorConfig{}); }
    explicit Generator(const GeneratorConfig& config) { configure(config); }

    void configure(const GeneratorConfig& config);
    const GeneratorConfig& config() const { return m_config; }

    BaselineContent generate(const CellCoord& cell) const;

    // Value the distribution yields for a draw in [0,1).
    TokenValue sampleValue(double u) const;

  private:
    GeneratorConfig m_config{};
    std::vector<double> m_cumulative;
  };

  // Free-function form: identical to Generator{config with seed}.generate(cell) for the
  // default distribution and spawn probability.
  BaselineContent generate(uint32_t seed, int32_t i, int32_t j);
}
