// =============================================================================
// types.hpp — Core type aliases and constants for the ETBD simulator.
//
// Centralises every fundamental type so that width changes (e.g. moving the
// phenotype to a fixed-point representation) propagate automatically.
// =============================================================================
#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

namespace etbd {

// ── Bit representation ──────────────────────────────────────────────────────
// One locus of a binary chromosome.  Always 0 or 1.
using Bit = std::uint8_t;

// ── Locus / position index ──────────────────────────────────────────────────
using LocusIndex = std::size_t;

/// Longest genotype the phenotype mappers can decode into a 64-bit integer.
inline constexpr std::size_t kMaxGenotypeLength = 64;

// ── Generation counter ──────────────────────────────────────────────────────
using Generation = std::uint64_t;

// ── Phenotype value ─────────────────────────────────────────────────────────
// A single scalar behavioural response.  Integer-valued under the identity
// mapping, real-valued under the normalised and ranged mappings.
using Phenotype = double;

// ── Fitness value ───────────────────────────────────────────────────────────
// Non-negative.  May be +inf under InverseDistanceFitness at distance 0.
using Fitness = double;

inline constexpr double kInfinity = std::numeric_limits<double>::infinity();

/// Sentinel for "no individual" (e.g. no reinforcement this generation).
inline constexpr std::size_t kNoIndividual = std::numeric_limits<std::size_t>::max();

// ── Parent pair ─────────────────────────────────────────────────────────────
// Population indices of the two parents of one offspring.  parent0 supplies
// the leading segment under single-point crossover.
struct ParentPair {
    std::size_t parent0;
    std::size_t parent1;
};

}  // namespace etbd
