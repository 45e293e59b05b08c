// =============================================================================
// population.hpp — The genotype store: exactly N chromosomes of length L.
//
// The Population owns the current generation only.  The Simulation driver
// builds the next generation off to the side and hands it to replace(),
// which checks size and length before swapping it in, so no component ever
// sees a half-built generation.  (This replaces the front/back double buffer
// of the haplotype stores: the "back buffer" is the vector the driver fills.)
//
// There is no per-bit mutation API here.  Bits change only through random
// initialisation and through the Mutator acting on offspring.
// =============================================================================
#pragma once

#include "errors.hpp"
#include "genotype.hpp"
#include "random.hpp"
#include "types.hpp"

#include <cassert>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace etbd {

class Population {
public:
    using const_iterator = std::vector<Genotype>::const_iterator;

    // ── Construction ────────────────────────────────────────────────────────

    /// Random population of N genotypes, each of L fair-coin loci.
    template <RandomSource R>
    [[nodiscard]] static Population initialize(std::size_t N, std::size_t L, R& rng) {
        if (N == 0) throw ConfigurationError("population size must be positive");
        if (L == 0) throw ConfigurationError("genotype length must be positive");

        std::vector<Genotype> members;
        members.reserve(N);
        for (std::size_t i = 0; i < N; ++i)
            members.push_back(Genotype::random(L, rng));
        return Population{L, std::move(members)};
    }

    /// Population from explicit genotypes.  All must share one non-zero length.
    [[nodiscard]] static Population from_genotypes(std::vector<Genotype> members) {
        if (members.empty())
            throw ConfigurationError("population size must be positive");
        const std::size_t L = members.front().size();
        if (L == 0) throw ConfigurationError("genotype length must be positive");
        for (const auto& g : members) {
            if (g.size() != L)
                throw ConfigurationError("genotypes of unequal length in population");
        }
        return Population{L, std::move(members)};
    }

    // ── Accessors ───────────────────────────────────────────────────────────
    [[nodiscard]] std::size_t size()            const noexcept { return members_.size(); }
    [[nodiscard]] std::size_t genotype_length() const noexcept { return length_; }

    [[nodiscard]] const Genotype& operator[](std::size_t i) const noexcept {
        assert(i < members_.size());
        return members_[i];
    }

    [[nodiscard]] const std::vector<Genotype>& genotypes() const noexcept { return members_; }

    [[nodiscard]] const_iterator begin() const noexcept { return members_.begin(); }
    [[nodiscard]] const_iterator end()   const noexcept { return members_.end(); }

    // ── Generation turnover ─────────────────────────────────────────────────

    /// Install `next` as the current generation.  Throws InvariantViolation,
    /// leaving the current generation untouched, unless `next` holds exactly
    /// size() genotypes of exactly genotype_length() loci.
    void replace(std::vector<Genotype> next) {
        if (next.size() != members_.size())
            throw InvariantViolation("population size drifted from " +
                                     std::to_string(members_.size()) + " to " +
                                     std::to_string(next.size()));
        for (std::size_t i = 0; i < next.size(); ++i) {
            if (next[i].size() != length_)
                throw InvariantViolation("offspring " + std::to_string(i) +
                                         " has length " + std::to_string(next[i].size()) +
                                         ", expected " + std::to_string(length_));
        }
        members_.swap(next);
    }

private:
    Population(std::size_t L, std::vector<Genotype> members)
        : length_{L}, members_{std::move(members)} {}

    std::size_t           length_ = 0;
    std::vector<Genotype> members_;
};

}  // namespace etbd
