// =============================================================================
// statistics.hpp — Population summary statistics.
//
// Implemented statistics:
//   - SummaryStats (mean, population variance, min, max) of any scalar series
//   - Per-locus frequency of the 1 allele
//   - Mean pairwise Hamming distance (the binary analogue of nucleotide
//     diversity pi), computed from per-locus counts in O(N·L)
//   - RunSummary over a finished event log (see event_log.hpp)
// =============================================================================
#pragma once

#include "population.hpp"
#include "types.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace etbd {

// ── Scalar summary ──────────────────────────────────────────────────────────
struct SummaryStats {
    double mean     = 0.0;
    double variance = 0.0;   // population variance (divide by n)
    double min_val  = 0.0;
    double max_val  = 0.0;
};

/// Summary of `values`.  An empty series yields all zeros.  A series holding
/// +inf yields mean +inf and variance NaN, as IEEE arithmetic dictates.
[[nodiscard]] inline SummaryStats compute_summary(const std::vector<double>& values) {
    SummaryStats s;
    if (values.empty()) return s;

    const double n = static_cast<double>(values.size());
    double sum = 0.0;
    s.min_val = values.front();
    s.max_val = values.front();
    for (double v : values) {
        sum += v;
        s.min_val = std::min(s.min_val, v);
        s.max_val = std::max(s.max_val, v);
    }
    s.mean = sum / n;

    double ss = 0.0;
    for (double v : values) ss += (v - s.mean) * (v - s.mean);
    s.variance = ss / n;
    return s;
}

// ── Per-locus allele frequencies ────────────────────────────────────────────

/// Number of individuals carrying a 1 at each locus.
[[nodiscard]] inline std::vector<std::size_t> ones_per_locus(const Population& pop) {
    std::vector<std::size_t> counts(pop.genotype_length(), 0);
    for (const auto& g : pop) {
        for (std::size_t l = 0; l < counts.size(); ++l) counts[l] += g[l];
    }
    return counts;
}

/// Frequency of the 1 allele at each locus.
[[nodiscard]] inline std::vector<double> bit_frequencies(const Population& pop) {
    const auto counts = ones_per_locus(pop);
    std::vector<double> freq(counts.size());
    const double n = static_cast<double>(pop.size());
    for (std::size_t l = 0; l < counts.size(); ++l)
        freq[l] = static_cast<double>(counts[l]) / n;
    return freq;
}

// ── Diversity ───────────────────────────────────────────────────────────────
// pi = (1 / C(n,2)) * sum_loci k*(n-k)
// where k is the number of 1s at the locus.  Zero for n < 2.
[[nodiscard]] inline double mean_pairwise_hamming(const Population& pop) {
    const std::size_t n = pop.size();
    if (n < 2) return 0.0;
    const auto counts = ones_per_locus(pop);
    double total = 0.0;
    for (std::size_t k : counts)
        total += static_cast<double>(k) * static_cast<double>(n - k);
    const double pairs = static_cast<double>(n) * static_cast<double>(n - 1) / 2.0;
    return total / pairs;
}

}  // namespace etbd
