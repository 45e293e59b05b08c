// =============================================================================
// selection.hpp — Pluggable parent-selection policies.
//
// Fitness is non-increasing in distance from the reinforced target, so every
// policy here favours responses close to the target: selection probability
// rises with fitness and falls with distance.
//
// Each policy offers
//   Sampler prepare(const std::vector<Fitness>&) const;   // once per generation
//   std::size_t operator()(fitnesses, rng) const;          // one-off draw
// and a prepared Sampler is a callable `std::size_t operator()(R& rng)`.
// select_parents() prepares once and draws 2·N parents, with replacement.
//
// Provided models (SelectionPolicy variant):
//   FitnessProportionate  – roulette wheel on fitness (default)
//   RankSelection         – linear rank-based probabilities
//   TournamentSelection   – k-way tournament
//
// Degenerate inputs:
//   • all fitnesses equal, or all zero       → uniform over the population
//   • one or more +inf fitnesses (roulette)  → uniform over the +inf ones,
//                                             so a single one always wins
//   • negative or NaN fitness                → InvariantViolation
// =============================================================================
#pragma once

#include "errors.hpp"
#include "random.hpp"
#include "types.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <numeric>
#include <random>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace etbd {

namespace detail {

inline void check_fitness(const std::vector<Fitness>& fitnesses) {
    if (fitnesses.empty())
        throw InvariantViolation("selection over an empty population");
    for (std::size_t i = 0; i < fitnesses.size(); ++i) {
        if (std::isnan(fitnesses[i]) || fitnesses[i] < 0.0)
            throw InvariantViolation("fitness of individual " + std::to_string(i) +
                                     " is negative or NaN");
    }
}

}  // namespace detail

// ─────────────────────────────────────────────────────────────────────────────
// WeightedIndexSampler — draws an index from a fixed pool, either uniformly
// or with the given (finite, non-negative, positive-sum) weights.
// ─────────────────────────────────────────────────────────────────────────────
class WeightedIndexSampler {
public:
    /// Uniform over `pool`.
    explicit WeightedIndexSampler(std::vector<std::size_t> pool)
        : pool_{std::move(pool)} {}

    /// Weighted over `pool` (weights[k] belongs to pool[k]).
    WeightedIndexSampler(std::vector<std::size_t> pool, const std::vector<double>& weights)
        : pool_{std::move(pool)}
        , dist_{weights.begin(), weights.end()}
        , weighted_{true}
    {
        assert(pool_.size() == weights.size());
    }

    template <RandomSource R>
    [[nodiscard]] std::size_t operator()(R& rng) {
        if (pool_.size() == 1) return pool_.front();
        if (weighted_) return pool_[dist_(rng)];
        return pool_[uniform_index(rng, pool_.size())];
    }

private:
    std::vector<std::size_t>                pool_;
    std::discrete_distribution<std::size_t> dist_;
    bool                                    weighted_ = false;
};

inline std::vector<std::size_t> all_indices(std::size_t n) {
    std::vector<std::size_t> idx(n);
    std::iota(idx.begin(), idx.end(), std::size_t{0});
    return idx;
}

// ─────────────────────────────────────────────────────────────────────────────
// FitnessProportionate (roulette wheel)
// ─────────────────────────────────────────────────────────────────────────────
struct FitnessProportionate {
    using Sampler = WeightedIndexSampler;

    [[nodiscard]] Sampler prepare(const std::vector<Fitness>& fitnesses) const {
        detail::check_fitness(fitnesses);
        const std::size_t N = fitnesses.size();

        std::vector<std::size_t> infinite;
        for (std::size_t i = 0; i < N; ++i)
            if (std::isinf(fitnesses[i])) infinite.push_back(i);
        if (!infinite.empty()) return Sampler{std::move(infinite)};

        const bool all_equal = std::all_of(fitnesses.begin(), fitnesses.end(),
            [&](Fitness f) { return f == fitnesses.front(); });
        const double total = std::accumulate(fitnesses.begin(), fitnesses.end(), 0.0);
        if (all_equal || !(total > 0.0)) return Sampler{all_indices(N)};

        return Sampler{all_indices(N), fitnesses};
    }

    template <RandomSource R>
    [[nodiscard]] std::size_t operator()(const std::vector<Fitness>& fitnesses, R& rng) const {
        auto sampler = prepare(fitnesses);
        return sampler(rng);
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// RankSelection
// ─────────────────────────────────────────────────────────────────────────────
// Individuals are ranked by fitness; selection probability is a linear
// function of rank: P(rank r) ∝ 2 - sp + 2(sp - 1)(r - 1)/(N - 1)
// where sp ∈ [1, 2] is the "selection pressure" parameter.
//
// sp = 1 → uniform selection   sp = 2 → best individual gets 2× average
// Equal fitnesses are ranked by population index (earlier = lower rank).
// ─────────────────────────────────────────────────────────────────────────────
struct RankSelection {
    double selection_pressure = 1.5;

    using Sampler = WeightedIndexSampler;

    [[nodiscard]] Sampler prepare(const std::vector<Fitness>& fitnesses) const {
        detail::check_fitness(fitnesses);
        const std::size_t N = fitnesses.size();

        // Rank: order[0] = worst, order[N-1] = best.
        std::vector<std::size_t> order = all_indices(N);
        std::stable_sort(order.begin(), order.end(),
            [&](std::size_t a, std::size_t b) {
                return fitnesses[a] < fitnesses[b];
            });

        const double sp = std::clamp(selection_pressure, 1.0, 2.0);
        std::vector<double> weights(N);
        for (std::size_t i = 0; i < N; ++i) {
            double rank_frac = (N > 1)
                ? static_cast<double>(i) / static_cast<double>(N - 1)
                : 0.0;
            weights[i] = 2.0 - sp + 2.0 * (sp - 1.0) * rank_frac;
        }
        // sp = 2 gives the worst individual weight 0; the sum stays positive
        // for N > 1, and N == 1 short-circuits in the sampler.
        return Sampler{std::move(order), weights};
    }

    template <RandomSource R>
    [[nodiscard]] std::size_t operator()(const std::vector<Fitness>& fitnesses, R& rng) const {
        auto sampler = prepare(fitnesses);
        return sampler(rng);
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// TournamentSelection
// ─────────────────────────────────────────────────────────────────────────────
// Pick `k` individuals uniformly at random; the fittest wins, the earlier
// draw winning ties.  k=1 is equivalent to uniform selection.
// ─────────────────────────────────────────────────────────────────────────────
struct TournamentSelection {
    std::size_t tournament_size = 3;

    class Sampler {
    public:
        Sampler(std::vector<Fitness> fitnesses, std::size_t k)
            : fitnesses_{std::move(fitnesses)}, k_{std::max<std::size_t>(k, 1)} {}

        template <RandomSource R>
        [[nodiscard]] std::size_t operator()(R& rng) const {
            const std::size_t N = fitnesses_.size();
            std::size_t best = uniform_index(rng, N);
            for (std::size_t t = 1; t < k_; ++t) {
                std::size_t challenger = uniform_index(rng, N);
                if (fitnesses_[challenger] > fitnesses_[best])
                    best = challenger;
            }
            return best;
        }

    private:
        std::vector<Fitness> fitnesses_;
        std::size_t          k_;
    };

    [[nodiscard]] Sampler prepare(const std::vector<Fitness>& fitnesses) const {
        detail::check_fitness(fitnesses);
        return Sampler{fitnesses, tournament_size};
    }

    template <RandomSource R>
    [[nodiscard]] std::size_t operator()(const std::vector<Fitness>& fitnesses, R& rng) const {
        return prepare(fitnesses)(rng);
    }
};

// ── Type-erased policy ──────────────────────────────────────────────────────

using SelectionPolicy = std::variant<FitnessProportionate, RankSelection,
                                     TournamentSelection>;

/// Draw `count` parent pairs, both parents independently and with
/// replacement.  A population of one always yields (0, 0).
template <RandomSource R>
[[nodiscard]] std::vector<ParentPair>
select_parents(const SelectionPolicy& policy,
               const std::vector<Fitness>& fitnesses,
               std::size_t count,
               R& rng)
{
    return std::visit([&](const auto& p) {
        auto sampler = p.prepare(fitnesses);
        std::vector<ParentPair> pairs;
        pairs.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            const std::size_t p0 = sampler(rng);
            const std::size_t p1 = sampler(rng);
            pairs.push_back(ParentPair{p0, p1});
        }
        return pairs;
    }, policy);
}

}  // namespace etbd
