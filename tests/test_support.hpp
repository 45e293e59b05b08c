#pragma once

#include "etbd/config.hpp"
#include "etbd/genotype.hpp"
#include "etbd/population.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace etbd::test {

/**
 * URBG that replays a fixed sequence of words, cycling at the end.
 * Two sources built from the same words produce the same draws.
 */
class FixedSequenceSource {
public:
    using result_type = std::uint64_t;

    explicit FixedSequenceSource(std::vector<result_type> words) : words_{std::move(words)} {}

    static constexpr result_type min() { return 0; }
    static constexpr result_type max() { return std::numeric_limits<result_type>::max(); }

    result_type operator()()
    {
        const result_type w = words_[pos_];
        pos_ = (pos_ + 1) % words_.size();
        ++draws_;
        return w;
    }

    std::size_t draws() const { return draws_; }

    /// `count` words taken from a seeded mt19937_64.
    static FixedSequenceSource fromSeed(std::uint64_t seed, std::size_t count = 4096)
    {
        std::mt19937_64 engine(seed);
        std::vector<result_type> words(count);
        for (auto& w : words) w = engine();
        return FixedSequenceSource{std::move(words)};
    }

private:
    std::vector<result_type> words_;
    std::size_t pos_ = 0;
    std::size_t draws_ = 0;
};

/**
 * Wraps mt19937_64 and counts how many words were consumed.
 */
class CountingSource {
public:
    using result_type = std::mt19937_64::result_type;

    explicit CountingSource(std::uint64_t seed) : engine_{seed} {}

    static constexpr result_type min() { return std::mt19937_64::min(); }
    static constexpr result_type max() { return std::mt19937_64::max(); }

    result_type operator()()
    {
        ++draws_;
        return engine_();
    }

    std::size_t draws() const { return draws_; }

private:
    std::mt19937_64 engine_;
    std::size_t draws_ = 0;
};

inline Population populationOf(const std::vector<std::string>& bitStrings)
{
    std::vector<Genotype> members;
    for (const auto& s : bitStrings) members.push_back(Genotype::from_string(s));
    return Population::from_genotypes(std::move(members));
}

/// The small end-to-end configuration: L=8, N=20, G=50, mu=0.01, RI 10, seed 42.
inline SimulationConfig smallConfig()
{
    SimulationConfig cfg;
    cfg.genotype_length = 8;
    cfg.population_size = 20;
    cfg.generations = 50;
    cfg.mutation_rate = 0.01;
    cfg.mean_interval = 10.0;
    cfg.seed = 42;
    return cfg;
}

} // namespace etbd::test
