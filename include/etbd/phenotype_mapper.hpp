// =============================================================================
// phenotype_mapper.hpp — Genotype → phenotype decoding.
//
// Maps a binary chromosome to the single scalar behavioural response it
// emits.  Every mapping is a pure, total function of the bit sequence: the
// same genotype always decodes to the same value, for any L in
// [1, kMaxGenotypeLength].
//
// All mappings start from the unsigned integer reading of the bits, most
// significant bit first:
//
//     v = Σ_{i<L} bit[i] · 2^(L-1-i)          v ∈ [0, 2^L − 1]
//
// Provided mappings:
//
//   IdentityMapping     – P = v
//   NormalizedMapping   – P = v / (2^L − 1)                  P ∈ [0, 1]
//   LinearRangeMapping  – P = lo + (hi − lo) · v / (2^L − 1)  P ∈ [lo, hi]
//
// PhenotypeMapping is the runtime-selectable variant; decode() visits it.
// =============================================================================
#pragma once

#include "genotype.hpp"
#include "population.hpp"
#include "types.hpp"

#include <cassert>
#include <cmath>
#include <cstdint>
#include <variant>
#include <vector>

namespace etbd {

// ── Integer reading ─────────────────────────────────────────────────────────

/// Unsigned integer value of the bits, MSB first.  Requires L <= 64.
[[nodiscard]] inline std::uint64_t genotype_value(const Genotype& g) noexcept {
    assert(g.size() <= kMaxGenotypeLength);
    std::uint64_t v = 0;
    for (std::size_t i = 0; i < g.size(); ++i)
        v = (v << 1) | static_cast<std::uint64_t>(g[i]);
    return v;
}

/// 2^L − 1 as a double: the largest integer reading of an L-locus genotype.
[[nodiscard]] inline double max_genotype_value(std::size_t L) noexcept {
    return std::ldexp(1.0, static_cast<int>(L)) - 1.0;
}

// ── Concrete mappings ───────────────────────────────────────────────────────

struct IdentityMapping {
    [[nodiscard]] Phenotype operator()(const Genotype& g) const noexcept {
        return static_cast<Phenotype>(genotype_value(g));
    }
    [[nodiscard]] Phenotype min_value(std::size_t /*L*/) const noexcept { return 0.0; }
    [[nodiscard]] Phenotype max_value(std::size_t L) const noexcept {
        return max_genotype_value(L);
    }
};

struct NormalizedMapping {
    [[nodiscard]] Phenotype operator()(const Genotype& g) const noexcept {
        const double top = max_genotype_value(g.size());
        if (top <= 0.0) return 0.0;
        return static_cast<double>(genotype_value(g)) / top;
    }
    [[nodiscard]] Phenotype min_value(std::size_t /*L*/) const noexcept { return 0.0; }
    [[nodiscard]] Phenotype max_value(std::size_t /*L*/) const noexcept { return 1.0; }
};

/// Responses spread linearly over [lo, hi].  Requires hi > lo.
struct LinearRangeMapping {
    double lo = 0.0;
    double hi = 1.0;

    [[nodiscard]] Phenotype operator()(const Genotype& g) const noexcept {
        return lo + (hi - lo) * NormalizedMapping{}(g);
    }
    [[nodiscard]] Phenotype min_value(std::size_t /*L*/) const noexcept { return lo; }
    [[nodiscard]] Phenotype max_value(std::size_t /*L*/) const noexcept { return hi; }
};

// ── Type-erased mapping ─────────────────────────────────────────────────────

using PhenotypeMapping = std::variant<IdentityMapping, NormalizedMapping,
                                      LinearRangeMapping>;

[[nodiscard]] inline Phenotype decode(const Genotype& g,
                                      const PhenotypeMapping& mapping) noexcept
{
    return std::visit([&](const auto& m) { return m(g); }, mapping);
}

[[nodiscard]] inline Phenotype mapping_min(const PhenotypeMapping& mapping,
                                           std::size_t L) noexcept
{
    return std::visit([&](const auto& m) { return m.min_value(L); }, mapping);
}

[[nodiscard]] inline Phenotype mapping_max(const PhenotypeMapping& mapping,
                                           std::size_t L) noexcept
{
    return std::visit([&](const auto& m) { return m.max_value(L); }, mapping);
}

/// Decode every member, in population order.
[[nodiscard]] inline std::vector<Phenotype>
decode_population(const Population& pop, const PhenotypeMapping& mapping) {
    std::vector<Phenotype> out;
    out.reserve(pop.size());
    for (const auto& g : pop) out.push_back(decode(g, mapping));
    return out;
}

}  // namespace etbd
