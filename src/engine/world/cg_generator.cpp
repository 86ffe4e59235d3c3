#include "cg_generator.h"

#include "cg_hash.h"
#include "cg_log.h"

#include <cmath>

namespace cg
{
  namespace
  {
    static constexpr const char* kPresenceSalt = "cache";
    static constexpr const char* kValueSalt = "value";

    static uint32_t hashCellSeed(uint32_t seed, const CellCoord& cell, uint32_t saltHash)
    {
      uint32_t h = seed ^ saltHash;
      h ^= mix32(static_cast<uint32_t>(cell.i) * 73856093u);
      h = mix32(h + 0x9e3779b9u);
      h ^= mix32(static_cast<uint32_t>(cell.j) * 19349663u);
      h = mix32(h + 0x6d2b79f5u);
      return h;
    }
  }

  ValueDistribution ValueDistribution::tiered(std::vector<ValueTier> table)
  {
    ValueDistribution d{};
    d.kind = Kind::Tiered;
    d.tiers = std::move(table);
    return d;
  }

  ValueDistribution ValueDistribution::uniform(TokenValue minValue, TokenValue maxValue)
  {
    ValueDistribution d{};
    d.kind = Kind::Uniform;
    d.tiers.clear();
    d.uniformMin = minValue;
    d.uniformMax = maxValue;
    return d;
  }

  double luck(uint32_t seed, const CellCoord& cell, const char* salt)
  {
    const uint32_t saltHash = salt ? fold64(fnv1a64(salt)) : 0u;
    return unitFromHash(hashCellSeed(seed, cell, saltHash));
  }

  void Generator::configure(const GeneratorConfig& config)
  {
    m_config = config;

    if (!(m_config.spawnProbability >= 0.0) || m_config.spawnProbability > 1.0)
    {
      cg::log(cg::LogLevel::Warn, "Generator: spawn probability %g out of [0,1], using 0.1", config.spawnProbability);
      m_config.spawnProbability = 0.1;
    }

    ValueDistribution& dist = m_config.distribution;
    if (dist.kind == ValueDistribution::Kind::Uniform)
    {
      if (dist.uniformMin < 1)
      {
        cg::log(cg::LogLevel::Warn, "Generator: uniform minimum %lld raised to 1", (long long)dist.uniformMin);
        dist.uniformMin = 1;
      }
      if (dist.uniformMax < dist.uniformMin)
        dist.uniformMax = dist.uniformMin;
    }
    else
    {
      std::vector<ValueTier> valid;
      valid.reserve(dist.tiers.size());
      for (const ValueTier& t : dist.tiers)
      {
        if (t.value < 1 || !(t.probability > 0.0))
        {
          cg::log(cg::LogLevel::Warn, "Generator: dropping tier (value=%lld p=%g)", (long long)t.value, t.probability);
          continue;
        }
        valid.push_back(t);
      }
      if (valid.empty())
      {
        cg::log(cg::LogLevel::Warn, "Generator: empty value table, using default tiers");
        valid = ValueDistribution{}.tiers;
      }
      dist.tiers = std::move(valid);
    }

    // Normalized so the last entry is exactly 1 and every draw lands in a tier.
    m_cumulative.clear();
    if (dist.kind == ValueDistribution::Kind::Tiered)
    {
      double total = 0.0;
      for (const ValueTier& t : dist.tiers)
        total += t.probability;
      double running = 0.0;
      m_cumulative.reserve(dist.tiers.size());
      for (const ValueTier& t : dist.tiers)
      {
        running += t.probability / total;
        m_cumulative.push_back(running);
      }
      m_cumulative.back() = 1.0;
    }
  }

  TokenValue Generator::sampleValue(double u) const
  {
    const ValueDistribution& dist = m_config.distribution;
    if (dist.kind == ValueDistribution::Kind::Uniform)
    {
      const TokenValue span = dist.uniformMax - dist.uniformMin + 1;
      TokenValue offset = static_cast<TokenValue>(std::floor(u * (double)span));
      if (offset >= span) offset = span - 1;
      if (offset < 0) offset = 0;
      return dist.uniformMin + offset;
    }

    for (size_t k = 0; k < m_cumulative.size(); ++k)
    {
      if (u < m_cumulative[k])
        return dist.tiers[k].value;
    }
    return dist.tiers.back().value;
  }

  BaselineContent Generator::generate(const CellCoord& cell) const
  {
    BaselineContent out{};
    if (luck(m_config.seed, cell, kPresenceSalt) >= m_config.spawnProbability)
      return out;

    out.present = true;
    out.value = sampleValue(luck(m_config.seed, cell, kValueSalt));
    return out;
  }

  BaselineContent generate(uint32_t seed, int32_t i, int32_t j)
  {
    GeneratorConfig cfg{};
    cfg.seed = seed;
    return Generator(cfg).generate({ i, j });
  }
}
