// =============================================================================
// random.hpp — The simulator's single interface to non-determinism.
//
// Every random draw in the library goes through one of the helpers below,
// called with the engine-owned generator.  Any type satisfying
// std::uniform_random_bit_generator can be injected, so test harnesses can
// substitute a fixed sequence for std::mt19937_64.
//
// Draw order is part of the reproducibility contract: for a fixed seed and
// configuration the sequence of helper calls (and therefore every result)
// is identical across runs.
// =============================================================================
#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <random>
#include <type_traits>

namespace etbd {

/// Default engine.  Seeded once per run by the Simulation driver.
using DefaultRandom = std::mt19937_64;

template <typename R>
concept RandomSource = std::uniform_random_bit_generator<std::remove_cvref_t<R>>;

/// Uniform real in [0, 1).
template <RandomSource R>
[[nodiscard]] double uniform01(R& rng) {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng);
}

/// Uniform index in [0, n).  n must be > 0.
template <RandomSource R>
[[nodiscard]] std::size_t uniform_index(R& rng, std::size_t n) {
    std::uniform_int_distribution<std::size_t> dist(0, n - 1);
    return dist(rng);
}

/// Uniform integer in [lo, hi].
template <RandomSource R>
[[nodiscard]] std::size_t uniform_between(R& rng, std::size_t lo, std::size_t hi) {
    std::uniform_int_distribution<std::size_t> dist(lo, hi);
    return dist(rng);
}

/// Bernoulli trial.  p <= 0 and p >= 1 are decided without drawing.
template <RandomSource R>
[[nodiscard]] bool bernoulli(R& rng, double p) {
    if (p <= 0.0) return false;
    if (p >= 1.0) return true;
    std::bernoulli_distribution dist(p);
    return dist(rng);
}

}  // namespace etbd
