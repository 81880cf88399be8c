/**
 * @file generator.hpp
 * @brief Normally distributed values about a mean, one engine per worker.
 */

#ifndef FARM_GENERATOR_HPP_
#define FARM_GENERATOR_HPP_

#include "farm/vocabulary.hpp"

#include <cmath>
#include <cstdint>

#include <random>
#include <vector>

namespace farm {

/// @brief Produce @p count values for @p parameter into @p out (resized by the callee).
using GenerateFn = function_ref<expected<void, FarmError>(double, uint32_t, std::vector<double>&)>;

class NormalGenerator final {
 public:
  static constexpr double kStdDev = 1.0;

  /**
   * @param base_seed 0 seeds from std::random_device; otherwise the engine
   *                  is seeded with base_seed + worker so runs are reproducible
   *                  and workers draw distinct streams.
   */
  NormalGenerator(uint64_t base_seed, WorkerId worker) : engine_(SeedFor(base_seed, worker)) {}

  /// A non-finite mean is a kGenerationFailure.
  expected<void, FarmError> operator()(double mean, uint32_t count, std::vector<double>& out) {
    if (!std::isfinite(mean)) return expected<void, FarmError>::error(FarmError::kGenerationFailure);
    std::normal_distribution<double> dist(mean, kStdDev);
    out.resize(count);
    for (uint32_t i = 0; i < count; ++i) out[i] = dist(engine_);
    return expected<void, FarmError>::success();
  }

  static uint64_t SeedFor(uint64_t base_seed, WorkerId worker) {
    if (base_seed == 0U) {
      std::random_device rd;
      return (static_cast<uint64_t>(rd()) << 32) ^ rd();
    }
    return base_seed + worker.value();
  }

 private:
  std::mt19937_64 engine_;
};

}  // namespace farm

#endif  // FARM_GENERATOR_HPP_
