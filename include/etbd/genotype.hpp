// =============================================================================
// genotype.hpp — Fixed-length binary chromosome.
//
// Layout: a contiguous std::vector<Bit>, one byte per locus, locus 0 first
// (locus 0 is the most significant bit under the integer phenotype
// mappings).  Byte-per-bit keeps recombination a pair of std::copy block
// copies and mutation a single pass, which is what the generation loop does.
//
// A Genotype is a value: offspring are built as new Genotypes and installed
// wholesale by Population::replace, never edited in place across generations.
// =============================================================================
#pragma once

#include "errors.hpp"
#include "random.hpp"
#include "types.hpp"

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <numeric>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace etbd {

class Genotype {
public:
    // ── Construction ────────────────────────────────────────────────────────
    Genotype() = default;

    /// All-zero genotype of `length` loci.
    explicit Genotype(std::size_t length) : bits_(length, Bit{0}) {}

    /// Take ownership of an explicit bit vector.  Non-zero entries become 1.
    explicit Genotype(std::vector<Bit> bits) : bits_{std::move(bits)} {
        for (auto& b : bits_) b = (b != 0) ? Bit{1} : Bit{0};
    }

    /// Parse "0110…".  Any character other than '0'/'1' is rejected.
    [[nodiscard]] static Genotype from_string(std::string_view text) {
        std::vector<Bit> bits;
        bits.reserve(text.size());
        for (char c : text) {
            if (c != '0' && c != '1')
                throw ConfigurationError(
                    "genotype string contains non-binary character '" +
                    std::string(1, c) + "'");
            bits.push_back(c == '1' ? Bit{1} : Bit{0});
        }
        return Genotype{std::move(bits)};
    }

    /// Each locus an independent fair coin.
    template <RandomSource R>
    [[nodiscard]] static Genotype random(std::size_t length, R& rng) {
        std::vector<Bit> bits(length);
        for (auto& b : bits) b = bernoulli(rng, 0.5) ? Bit{1} : Bit{0};
        return Genotype{std::move(bits)};
    }

    // ── Access ──────────────────────────────────────────────────────────────
    [[nodiscard]] std::size_t size() const noexcept { return bits_.size(); }
    [[nodiscard]] bool        empty() const noexcept { return bits_.empty(); }

    [[nodiscard]] Bit operator[](LocusIndex i) const noexcept {
        assert(i < bits_.size());
        return bits_[i];
    }

    [[nodiscard]] const Bit* data() const noexcept { return bits_.data(); }
    [[nodiscard]]       Bit* data()       noexcept { return bits_.data(); }

    [[nodiscard]] const std::vector<Bit>& bits() const noexcept { return bits_; }

    void set(LocusIndex i, Bit value) noexcept {
        assert(i < bits_.size());
        bits_[i] = (value != 0) ? Bit{1} : Bit{0};
    }

    void flip(LocusIndex i) noexcept {
        assert(i < bits_.size());
        bits_[i] ^= Bit{1};
    }

    [[nodiscard]] std::size_t count_ones() const noexcept {
        return static_cast<std::size_t>(
            std::count(bits_.begin(), bits_.end(), Bit{1}));
    }

    [[nodiscard]] std::string to_string() const {
        std::string s;
        s.reserve(bits_.size());
        for (Bit b : bits_) s.push_back(b ? '1' : '0');
        return s;
    }

    friend bool operator==(const Genotype&, const Genotype&) = default;

private:
    std::vector<Bit> bits_;
};

/// Number of loci at which `a` and `b` differ.
[[nodiscard]] inline std::size_t hamming_distance(const Genotype& a,
                                                  const Genotype& b)
{
    if (a.size() != b.size())
        throw InvariantViolation("hamming_distance on genotypes of length " +
                                 std::to_string(a.size()) + " and " +
                                 std::to_string(b.size()));
    std::size_t d = 0;
    for (std::size_t i = 0; i < a.size(); ++i) d += (a[i] != b[i]);
    return d;
}

}  // namespace etbd
