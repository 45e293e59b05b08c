// =============================================================================
// config.hpp — Simulation parameters, validation, and command-line parsing.
//
// SimulationConfig carries everything the engine needs.  Defaults follow the
// classic ETBD setup: 10-locus genotypes read as integers 0..1023, 100
// individuals, 1 % per-locus mutation, an RI 30 schedule and an exponential
// fitness density with mean 20.  The target defaults to the middle of the
// phenotype range.
//
// validate() is called by the Simulation constructor, so a bad configuration
// is always reported (as ConfigurationError) before generation 0 runs.
//
// parse_arguments() reads the driver's command line:
//
//   etbd_sim [N [L [G [mu [interval [seed]]]]]] [key=value ...]
//
// Recognised keys:
//   target tolerance mapping(identity|normalized|range) lo hi
//   fitness(exponential|inverse|inverse-square|linear) density max_distance
//   pressure selection(roulette|rank|tournament) rank_pressure tournament
//   crossover(single|midpoint|multi|uniform) points
//   schedule(exponential|geometric|fixed)
//   report csv json population
// =============================================================================
#pragma once

#include "errors.hpp"
#include "fitness_model.hpp"
#include "phenotype_mapper.hpp"
#include "recombination_model.hpp"
#include "reinforcement_schedule.hpp"
#include "selection.hpp"
#include "types.hpp"

#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

namespace etbd {

// ── Interval distribution family ────────────────────────────────────────────
enum class IntervalKind : std::uint8_t {
    Exponential = 0,
    Geometric   = 1,
    Fixed       = 2
};

[[nodiscard]] inline IntervalDistribution
make_interval_distribution(IntervalKind kind, double mean) {
    switch (kind) {
        case IntervalKind::Geometric: return GeometricInterval{mean};
        case IntervalKind::Fixed:     return FixedInterval{mean};
        case IntervalKind::Exponential: break;
    }
    return ExponentialInterval{mean};
}

// ── SimulationConfig ────────────────────────────────────────────────────────
struct SimulationConfig {
    std::size_t   genotype_length = 10;     // L
    std::size_t   population_size = 100;    // N
    Generation    generations     = 500;    // G
    double        mutation_rate   = 0.01;   // per-locus flip probability
    double        mean_interval   = 30.0;   // RI mean, in generations
    IntervalKind  interval_kind   = IntervalKind::Exponential;
    std::uint64_t seed            = 42;

    // Reinforced response class.  Without an explicit centre the target is
    // the midpoint of the mapping's phenotype range.
    std::optional<Phenotype> target_centre;
    double           target_tolerance = kInfinity;
    PhenotypeMapping mapping   = IdentityMapping{};
    FitnessKernel    fitness   = ExponentialFitness{20.0};
    double           baseline_pressure = 1.0;
    SelectionPolicy  selection = FitnessProportionate{};
    CrossoverPolicy  crossover = SinglePointCrossover{};
};

// ── Validation ──────────────────────────────────────────────────────────────

namespace detail {

struct PolicyCheck {
    // Mappings
    void operator()(const IdentityMapping&) const {}
    void operator()(const NormalizedMapping&) const {}
    void operator()(const LinearRangeMapping& m) const {
        if (!std::isfinite(m.lo) || !std::isfinite(m.hi) || !(m.hi > m.lo))
            throw ConfigurationError("range mapping needs finite lo < hi");
        if (!std::isfinite(m.hi - m.lo))
            throw ConfigurationError("range mapping width hi - lo overflows");
    }

    // Fitness kernels
    void operator()(const ExponentialFitness& k) const {
        if (!(k.density_mean > 0.0) || !std::isfinite(k.density_mean))
            throw ConfigurationError("fitness density mean must be positive and finite");
    }
    void operator()(const InverseDistanceFitness&) const {}
    void operator()(const InverseSquareFitness&) const {}
    void operator()(const LinearFitness& k) const {
        if (!(k.max_distance > 0.0) || !std::isfinite(k.max_distance))
            throw ConfigurationError("linear fitness max_distance must be positive and finite");
    }

    // Selection
    void operator()(const FitnessProportionate&) const {}
    void operator()(const RankSelection& s) const {
        if (!(s.selection_pressure >= 1.0 && s.selection_pressure <= 2.0))
            throw ConfigurationError("rank selection pressure must lie in [1, 2]");
    }
    void operator()(const TournamentSelection& s) const {
        if (s.tournament_size == 0)
            throw ConfigurationError("tournament size must be positive");
    }

    // Crossover
    void operator()(const SinglePointCrossover&) const {}
    void operator()(const MidpointCrossover&) const {}
    void operator()(const MultiPointCrossover& c) const {
        if (c.points == 0)
            throw ConfigurationError("multi-point crossover needs at least one point");
    }
    void operator()(const UniformCrossover&) const {}
};

}  // namespace detail

/// Throws ConfigurationError naming the first offending field.
inline void validate(const SimulationConfig& cfg) {
    if (cfg.genotype_length == 0)
        throw ConfigurationError("genotype_length must be positive");
    if (cfg.genotype_length > kMaxGenotypeLength)
        throw ConfigurationError("genotype_length must not exceed " +
                                 std::to_string(kMaxGenotypeLength));
    if (cfg.population_size == 0)
        throw ConfigurationError("population_size must be positive");
    if (cfg.generations == 0)
        throw ConfigurationError("generations must be positive");
    if (!(cfg.mutation_rate >= 0.0 && cfg.mutation_rate <= 1.0))
        throw ConfigurationError("mutation_rate must lie in [0, 1]");
    if (!(cfg.mean_interval > 0.0) || !std::isfinite(cfg.mean_interval))
        throw ConfigurationError("mean_interval must be positive and finite");
    if (!(cfg.baseline_pressure >= 0.0 && cfg.baseline_pressure <= 1.0))
        throw ConfigurationError("baseline_pressure must lie in [0, 1]");

    const detail::PolicyCheck check{};
    std::visit(check, cfg.mapping);
    std::visit(check, cfg.fitness);
    std::visit(check, cfg.selection);
    std::visit(check, cfg.crossover);

    if (std::isnan(cfg.target_tolerance) || cfg.target_tolerance < 0.0)
        throw ConfigurationError("target tolerance must be non-negative");
    if (cfg.target_centre) {
        const double lo = mapping_min(cfg.mapping, cfg.genotype_length);
        const double hi = mapping_max(cfg.mapping, cfg.genotype_length);
        if (!(*cfg.target_centre >= lo && *cfg.target_centre <= hi))
            throw ConfigurationError("target " + std::to_string(*cfg.target_centre) +
                                     " lies outside the phenotype range [" +
                                     std::to_string(lo) + ", " + std::to_string(hi) + "]");
    }
}

/// The target the schedule reinforces: the configured centre, or the
/// midpoint of the phenotype range when none was given.
[[nodiscard]] inline TargetRange resolve_target(const SimulationConfig& cfg) {
    const Phenotype centre = cfg.target_centre
        ? *cfg.target_centre
        : 0.5 * (mapping_min(cfg.mapping, cfg.genotype_length) +
                 mapping_max(cfg.mapping, cfg.genotype_length));
    return TargetRange{centre, cfg.target_tolerance};
}

// ── Command line ────────────────────────────────────────────────────────────

struct CommandLine {
    SimulationConfig config;
    Generation       report_interval = 10;   // 0 = silent
    std::string      csv_path;               // empty = don't write
    std::string      json_path;
    std::string      population_path;        // final population snapshot
};

namespace detail {

template <typename T>
T parse_number(std::string_view key, std::string_view text) {
    T value{};
    const char* first = text.data();
    const char* last  = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last)
        throw ConfigurationError("cannot parse " + std::string(key) +
                                 " from '" + std::string(text) + "'");
    return value;
}

}  // namespace detail

/// Parse positional N L G mu interval seed, then key=value overrides.
/// The result is not validated; the Simulation constructor does that.
[[nodiscard]] inline CommandLine parse_arguments(const std::vector<std::string>& args) {
    CommandLine cl;
    SimulationConfig& c = cl.config;

    // Policy parameters may arrive before or after the policy name, so they
    // are collected first and folded in at the end.
    double      density = 20.0, max_distance = 100.0, lo = 0.0, hi = 1.0;
    double      rank_pressure = 1.5;
    std::size_t points = 2, tournament = 3;
    std::string mapping = "identity", fitness = "exponential";
    std::string selection = "roulette", crossover = "single";

    std::size_t positional = 0;
    for (const std::string& arg : args) {
        const auto eq = arg.find('=');
        if (eq == std::string::npos) {
            switch (positional++) {
                case 0: c.population_size = detail::parse_number<std::size_t>("N", arg); break;
                case 1: c.genotype_length = detail::parse_number<std::size_t>("L", arg); break;
                case 2: c.generations     = detail::parse_number<Generation>("G", arg); break;
                case 3: c.mutation_rate   = detail::parse_number<double>("mu", arg); break;
                case 4: c.mean_interval   = detail::parse_number<double>("interval", arg); break;
                case 5: c.seed            = detail::parse_number<std::uint64_t>("seed", arg); break;
                default:
                    throw ConfigurationError("unexpected positional argument '" + arg + "'");
            }
            continue;
        }

        const std::string key   = arg.substr(0, eq);
        const std::string value = arg.substr(eq + 1);
        if      (key == "target")        c.target_centre    = detail::parse_number<double>(key, value);
        else if (key == "tolerance")     c.target_tolerance = detail::parse_number<double>(key, value);
        else if (key == "mapping")       mapping = value;
        else if (key == "lo")            lo = detail::parse_number<double>(key, value);
        else if (key == "hi")            hi = detail::parse_number<double>(key, value);
        else if (key == "fitness")       fitness = value;
        else if (key == "density")       density = detail::parse_number<double>(key, value);
        else if (key == "max_distance")  max_distance = detail::parse_number<double>(key, value);
        else if (key == "pressure")      c.baseline_pressure = detail::parse_number<double>(key, value);
        else if (key == "selection")     selection = value;
        else if (key == "rank_pressure") rank_pressure = detail::parse_number<double>(key, value);
        else if (key == "tournament")    tournament = detail::parse_number<std::size_t>(key, value);
        else if (key == "crossover")     crossover = value;
        else if (key == "points")        points = detail::parse_number<std::size_t>(key, value);
        else if (key == "schedule") {
            if      (value == "exponential") c.interval_kind = IntervalKind::Exponential;
            else if (value == "geometric")   c.interval_kind = IntervalKind::Geometric;
            else if (value == "fixed")       c.interval_kind = IntervalKind::Fixed;
            else throw ConfigurationError("unknown schedule '" + value + "'");
        }
        else if (key == "report")        cl.report_interval = detail::parse_number<Generation>(key, value);
        else if (key == "csv")           cl.csv_path = value;
        else if (key == "json")          cl.json_path = value;
        else if (key == "population")    cl.population_path = value;
        else throw ConfigurationError("unknown option '" + key + "'");
    }

    if      (mapping == "identity")   c.mapping = IdentityMapping{};
    else if (mapping == "normalized") c.mapping = NormalizedMapping{};
    else if (mapping == "range")      c.mapping = LinearRangeMapping{lo, hi};
    else throw ConfigurationError("unknown mapping '" + mapping + "'");

    if      (fitness == "exponential")    c.fitness = ExponentialFitness{density};
    else if (fitness == "inverse")        c.fitness = InverseDistanceFitness{};
    else if (fitness == "inverse-square") c.fitness = InverseSquareFitness{};
    else if (fitness == "linear")         c.fitness = LinearFitness{max_distance};
    else throw ConfigurationError("unknown fitness kernel '" + fitness + "'");

    if      (selection == "roulette")   c.selection = FitnessProportionate{};
    else if (selection == "rank")       c.selection = RankSelection{rank_pressure};
    else if (selection == "tournament") c.selection = TournamentSelection{tournament};
    else throw ConfigurationError("unknown selection policy '" + selection + "'");

    if      (crossover == "single")   c.crossover = SinglePointCrossover{};
    else if (crossover == "midpoint") c.crossover = MidpointCrossover{};
    else if (crossover == "multi")    c.crossover = MultiPointCrossover{points};
    else if (crossover == "uniform")  c.crossover = UniformCrossover{};
    else throw ConfigurationError("unknown crossover policy '" + crossover + "'");

    return cl;
}

}  // namespace etbd
