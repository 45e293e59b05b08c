// =============================================================================
// mutation_model.hpp — Per-locus bit-flip mutation.
//
// Each locus of an offspring flips independently with probability `rate`.
// The Mutator is pure with respect to the random source it is handed: for
// the same input genotype and the same generator state it returns the same
// result.  rate = 0 returns the input unchanged and rate = 1 complements
// every locus; neither consumes a draw.
//
// Unlike the infinite-alleles models of a haplotype simulator there is no
// allele registry: a binary locus can only ever flip.
// =============================================================================
#pragma once

#include "genotype.hpp"
#include "random.hpp"
#include "types.hpp"

#include <cstddef>

namespace etbd {

struct BitFlipMutation {
    double rate = 0.01;   // per-locus, per-generation flip probability

    /// Mutate `g` in place.  Returns the number of loci flipped.
    template <RandomSource R>
    std::size_t operator()(Genotype& g, R& rng) const {
        std::size_t flips = 0;
        for (std::size_t i = 0; i < g.size(); ++i) {
            if (bernoulli(rng, rate)) {
                g.flip(i);
                ++flips;
            }
        }
        return flips;
    }
};

/// Value form: the mutated copy of `g`.
template <RandomSource R>
[[nodiscard]] Genotype mutate(Genotype g, double rate, R& rng) {
    BitFlipMutation{rate}(g, rng);
    return g;
}

}  // namespace etbd
