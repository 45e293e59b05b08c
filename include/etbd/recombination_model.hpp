// =============================================================================
// recombination_model.hpp — Pluggable crossover policies.
//
// Every policy turns one parent pair into exactly one offspring of the same
// length L:
//
//   Genotype operator()(const Genotype& a, const Genotype& b, RNG& rng) const;
//
// Models provided (CrossoverPolicy variant):
//
//   1. SinglePointCrossover – one uniformly random cut K in [1, L-1];
//                             offspring = a[0, K) ++ b[K, L).
//   2. MidpointCrossover    – the same with the cut fixed at K = L / 2.
//   3. MultiPointCrossover  – `points` distinct random cuts; segments
//                             alternate a, b, a, …
//   4. UniformCrossover     – each locus from a or b by a fair coin.
//
// Crossing a genotype with itself returns it unchanged under every model.
// =============================================================================
#pragma once

#include "errors.hpp"
#include "genotype.hpp"
#include "random.hpp"
#include "types.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace etbd {

namespace detail {

inline void check_parent_lengths(const Genotype& a, const Genotype& b) {
    if (a.size() != b.size())
        throw InvariantViolation("crossover of parents with lengths " +
                                 std::to_string(a.size()) + " and " +
                                 std::to_string(b.size()));
}

/// Offspring built from cut positions (sorted, unique, each in [0, L]).
/// Segment j between consecutive cuts comes from `a` when j is even.
inline Genotype splice(const Genotype& a, const Genotype& b,
                       const std::vector<LocusIndex>& cuts)
{
    const std::size_t L = a.size();
    std::vector<Bit> child(L);
    std::size_t begin = 0;
    bool from_a = true;
    for (std::size_t k = 0; k <= cuts.size(); ++k) {
        const std::size_t end = (k < cuts.size()) ? cuts[k] : L;
        const Genotype& src = from_a ? a : b;
        std::copy(src.data() + begin, src.data() + end, child.data() + begin);
        begin = end;
        from_a = !from_a;
    }
    return Genotype{std::move(child)};
}

}  // namespace detail

// ─────────────────────────────────────────────────────────────────────────────
// SinglePointCrossover
// ─────────────────────────────────────────────────────────────────────────────
struct SinglePointCrossover {
    template <RandomSource R>
    [[nodiscard]] Genotype operator()(const Genotype& a, const Genotype& b, R& rng) const {
        detail::check_parent_lengths(a, b);
        const std::size_t L = a.size();
        // Cut in [1, L-1] so both segments are non-empty.  With fewer than
        // two loci there is no interior cut, so allow either end.
        const std::size_t xp = (L >= 2) ? uniform_between(rng, 1, L - 1)
                                        : uniform_between(rng, 0, L);
        return detail::splice(a, b, {xp});
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// MidpointCrossover
// ─────────────────────────────────────────────────────────────────────────────
struct MidpointCrossover {
    template <RandomSource R>
    [[nodiscard]] Genotype operator()(const Genotype& a, const Genotype& b, R& /*rng*/) const {
        detail::check_parent_lengths(a, b);
        return detail::splice(a, b, {a.size() / 2});
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// MultiPointCrossover
// ─────────────────────────────────────────────────────────────────────────────
// Draws min(points, L-1) distinct cuts from [1, L-1] by partial Fisher–Yates
// over the interior positions.
// ─────────────────────────────────────────────────────────────────────────────
struct MultiPointCrossover {
    std::size_t points = 2;

    template <RandomSource R>
    [[nodiscard]] Genotype operator()(const Genotype& a, const Genotype& b, R& rng) const {
        detail::check_parent_lengths(a, b);
        const std::size_t L = a.size();
        if (L < 2) return a;

        std::vector<LocusIndex> interior(L - 1);
        for (std::size_t i = 0; i < interior.size(); ++i) interior[i] = i + 1;

        const std::size_t n = std::min(points, interior.size());
        for (std::size_t i = 0; i < n; ++i) {
            const std::size_t j = uniform_between(rng, i, interior.size() - 1);
            std::swap(interior[i], interior[j]);
        }
        std::vector<LocusIndex> cuts(interior.begin(), interior.begin() + n);
        std::sort(cuts.begin(), cuts.end());
        return detail::splice(a, b, cuts);
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// UniformCrossover
// ─────────────────────────────────────────────────────────────────────────────
struct UniformCrossover {
    template <RandomSource R>
    [[nodiscard]] Genotype operator()(const Genotype& a, const Genotype& b, R& rng) const {
        detail::check_parent_lengths(a, b);
        std::vector<Bit> child(a.size());
        for (std::size_t i = 0; i < child.size(); ++i)
            child[i] = bernoulli(rng, 0.5) ? a[i] : b[i];
        return Genotype{std::move(child)};
    }
};

// ── Type-erased policy ──────────────────────────────────────────────────────

using CrossoverPolicy = std::variant<SinglePointCrossover, MidpointCrossover,
                                     MultiPointCrossover, UniformCrossover>;

template <RandomSource R>
[[nodiscard]] Genotype crossover(const CrossoverPolicy& policy,
                                 const Genotype& a, const Genotype& b, R& rng)
{
    return std::visit([&](const auto& c) { return c(a, b, rng); }, policy);
}

}  // namespace etbd
