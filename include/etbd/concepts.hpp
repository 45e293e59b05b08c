// =============================================================================
// concepts.hpp — C++20 concepts for the pluggable policy seams.
//
// Each std::variant of policies in the library (PhenotypeMapping,
// FitnessKernel, SelectionPolicy, CrossoverPolicy) is closed, but the
// alternatives all share one call shape.  The concepts below spell that
// shape out so a new alternative gets a short diagnostic instead of a
// std::visit error several pages long.
//
// Concepts defined:
//   PhenotypeMappingPolicy   — Genotype → Phenotype, with a known range
//   FitnessKernelPolicy      — distance → fitness
//   ParentSamplerPolicy      — prepare(fitnesses) → sampler; sampler(rng) → index
//   CrossoverOperator<R>     — (parent, parent, rng) → offspring
//   MutationOperator<R>      — (offspring&, rng) → number of flips
// =============================================================================
#pragma once

#include "fitness_model.hpp"
#include "genotype.hpp"
#include "mutation_model.hpp"
#include "phenotype_mapper.hpp"
#include "random.hpp"
#include "recombination_model.hpp"
#include "selection.hpp"
#include "types.hpp"

#include <concepts>
#include <cstddef>
#include <vector>

namespace etbd {

// ─────────────────────────────────────────────────────────────────────────────
// PhenotypeMappingPolicy
// ─────────────────────────────────────────────────────────────────────────────
template <typename M>
concept PhenotypeMappingPolicy = requires(const M m, const Genotype& g, std::size_t L) {
    { m(g)            } -> std::convertible_to<Phenotype>;
    { m.min_value(L)  } -> std::convertible_to<Phenotype>;
    { m.max_value(L)  } -> std::convertible_to<Phenotype>;
};

// ─────────────────────────────────────────────────────────────────────────────
// FitnessKernelPolicy: must also be non-increasing in d, which no concept
// can check.
// ─────────────────────────────────────────────────────────────────────────────
template <typename K>
concept FitnessKernelPolicy = requires(const K k, double d) {
    { k(d) } -> std::convertible_to<Fitness>;
};

// ─────────────────────────────────────────────────────────────────────────────
// ParentSamplerPolicy
// ─────────────────────────────────────────────────────────────────────────────
template <typename S>
concept ParentSamplerPolicy = requires(const S s, const std::vector<Fitness>& f,
                                       typename S::Sampler sampler, DefaultRandom rng) {
    { s.prepare(f) } -> std::same_as<typename S::Sampler>;
    { sampler(rng) } -> std::convertible_to<std::size_t>;
};

// ─────────────────────────────────────────────────────────────────────────────
// CrossoverOperator<R>
// ─────────────────────────────────────────────────────────────────────────────
template <typename C, typename R>
concept CrossoverOperator = RandomSource<R> &&
    requires(const C c, const Genotype& a, const Genotype& b, R& rng) {
        { c(a, b, rng) } -> std::same_as<Genotype>;
    };

// ─────────────────────────────────────────────────────────────────────────────
// MutationOperator<R>
// ─────────────────────────────────────────────────────────────────────────────
template <typename M, typename R>
concept MutationOperator = RandomSource<R> &&
    requires(const M m, Genotype& g, R& rng) {
        { m(g, rng) } -> std::convertible_to<std::size_t>;
    };

// ── Shipped policies ────────────────────────────────────────────────────────

static_assert(PhenotypeMappingPolicy<IdentityMapping>);
static_assert(PhenotypeMappingPolicy<NormalizedMapping>);
static_assert(PhenotypeMappingPolicy<LinearRangeMapping>);

static_assert(FitnessKernelPolicy<ExponentialFitness>);
static_assert(FitnessKernelPolicy<InverseDistanceFitness>);
static_assert(FitnessKernelPolicy<InverseSquareFitness>);
static_assert(FitnessKernelPolicy<LinearFitness>);

static_assert(ParentSamplerPolicy<FitnessProportionate>);
static_assert(ParentSamplerPolicy<RankSelection>);
static_assert(ParentSamplerPolicy<TournamentSelection>);

static_assert(CrossoverOperator<SinglePointCrossover, DefaultRandom>);
static_assert(CrossoverOperator<MidpointCrossover, DefaultRandom>);
static_assert(CrossoverOperator<MultiPointCrossover, DefaultRandom>);
static_assert(CrossoverOperator<UniformCrossover, DefaultRandom>);

static_assert(MutationOperator<BitFlipMutation, DefaultRandom>);

}  // namespace etbd
