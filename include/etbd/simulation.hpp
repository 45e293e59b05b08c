// =============================================================================
// simulation.hpp — The generation loop.
//
// Simulation<Rng> owns every piece of mutable state in a run:
//   • the validated configuration,
//   • the random source (seeded once; the only source of non-determinism),
//   • the population,
//   • the reinforcement schedule,
//   • the event log.
// Components receive only what they need, as const references where they
// must not write.
//
// One generation (step()):
//   1. schedule.begin_generation   (consume reinforcer / arm)
//   2. decode phenotypes
//   3. evaluate fitness against the schedule (may deliver a reinforcer)
//   4. schedule.end_generation     (one generation of schedule time)
//   5. select N parent pairs
//   6. recombine → N offspring
//   7. mutate every offspring
//   8. install the offspring (size and length checked)
//   9. append the EventRecord
//
// A run executes until the generation counter reaches G.  A bad
// configuration throws ConfigurationError from the constructor, before any
// generation; an InvariantViolation aborts the run mid-way.  There is no
// partial-generation recovery.
//
// Given the same configuration and seed, two runs make the same sequence of
// random draws and therefore produce identical event logs.
// =============================================================================
#pragma once

#include "concepts.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "event_log.hpp"
#include "events.hpp"
#include "fitness_model.hpp"
#include "genotype.hpp"
#include "mutation_model.hpp"
#include "phenotype_mapper.hpp"
#include "population.hpp"
#include "random.hpp"
#include "recombination_model.hpp"
#include "reinforcement_schedule.hpp"
#include "selection.hpp"
#include "statistics.hpp"
#include "types.hpp"

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace etbd {

template <RandomSource Rng = DefaultRandom>
class Simulation {
public:
    using Events = SimulationEvents<Simulation>;

    /// Build a run seeded from cfg.seed.
    explicit Simulation(const SimulationConfig& cfg)
        requires std::constructible_from<Rng, std::uint64_t>
        : Simulation(cfg, Rng(cfg.seed))
    {}

    /// Build a run drawing from an injected random source.
    Simulation(SimulationConfig cfg, Rng rng)
        : config_{checked(std::move(cfg))}
        , rng_{std::move(rng)}
        , population_{Population::initialize(config_.population_size,
                                             config_.genotype_length, rng_)}
        , schedule_{make_interval_distribution(config_.interval_kind, config_.mean_interval),
                    resolve_target(config_), rng_}
        , evaluator_{config_.fitness, config_.baseline_pressure}
        , mutation_{config_.mutation_rate}
    {
        log_.reserve(static_cast<std::size_t>(config_.generations));
    }

    // ── Configuration ───────────────────────────────────────────────────────

    Simulation& set_events(Events ev) {
        events_ = std::move(ev);
        return *this;
    }

    // ── Run ─────────────────────────────────────────────────────────────────

    /// Run the remaining generations (all G on a fresh Simulation).
    const EventLog& run() {
        while (gen_ < config_.generations) {
            step();
            if (events_.should_stop && events_.should_stop(gen_ - 1, *this))
                break;
        }
        return log_;
    }

    /// Execute a single generation.
    void step() {
        const Generation  g = gen_;
        const std::size_t N = population_.size();

        // ── 1. Schedule bookkeeping ─────────────────────────────────────────
        schedule_.begin_generation(rng_);

        if (events_.on_generation_start)
            events_.on_generation_start(g, *this);

        // ── 2–3. Phenotypes & fitness ───────────────────────────────────────
        const std::vector<Phenotype> phenotypes =
            decode_population(population_, config_.mapping);
        const Evaluation ev = evaluator_.evaluate(phenotypes, schedule_, g);

        if (ev.reinforced && events_.on_reinforcement)
            events_.on_reinforcement(g, schedule_.history().back());
        if (events_.on_post_fitness)
            events_.on_post_fitness(g, ev);

        // ── 4. Advance the schedule ─────────────────────────────────────────
        schedule_.end_generation();

        EventRecord rec;
        rec.generation      = g;
        rec.population_size = N;
        rec.phenotype       = compute_summary(phenotypes);
        rec.fitness         = compute_summary(ev.fitness);
        rec.distance        = compute_summary(ev.distances);
        rec.diversity       = mean_pairwise_hamming(population_);
        rec.schedule        = schedule_.snapshot();
        rec.reinforced      = ev.reinforced;
        if (ev.reinforced) {
            rec.reinforced_index     = ev.closest;
            rec.reinforced_phenotype = phenotypes[ev.closest];
        }
        rec.cumulative_reinforcers = schedule_.reinforcement_count();

        // ── 5. Selection ────────────────────────────────────────────────────
        const std::vector<ParentPair> pairs =
            select_parents(config_.selection, ev.fitness, N, rng_);
        if (pairs.size() != N)
            throw InvariantViolation("selector returned " + std::to_string(pairs.size()) +
                                     " parent pairs for a population of " + std::to_string(N));

        // ── 6. Recombination ────────────────────────────────────────────────
        std::vector<Genotype> offspring;
        offspring.reserve(N);
        for (const ParentPair& pp : pairs)
            offspring.push_back(crossover(config_.crossover,
                                          population_[pp.parent0],
                                          population_[pp.parent1], rng_));

        // ── 7. Mutation ─────────────────────────────────────────────────────
        std::size_t flips = 0;
        for (Genotype& child : offspring)
            flips += mutation_(child, rng_);
        rec.mutations = flips;

        // ── 8. Install ──────────────────────────────────────────────────────
        population_.replace(std::move(offspring));

        // ── 9. Record ───────────────────────────────────────────────────────
        log_.append(std::move(rec));
        ++gen_;

        if (events_.on_generation_end)
            events_.on_generation_end(g, log_.back());
    }

    // ── Accessors ───────────────────────────────────────────────────────────
    [[nodiscard]] Generation generation() const noexcept { return gen_; }
    [[nodiscard]] bool finished() const noexcept { return gen_ >= config_.generations; }

    [[nodiscard]] const SimulationConfig&      config()     const noexcept { return config_; }
    [[nodiscard]] const Population&            population() const noexcept { return population_; }
    [[nodiscard]] const ReinforcementSchedule& schedule()   const noexcept { return schedule_; }
    [[nodiscard]] const EventLog&              log()        const noexcept { return log_; }
    [[nodiscard]] Events& events() noexcept { return events_; }

    /// Current phenotypes (decoded on demand; not stored).
    [[nodiscard]] std::vector<Phenotype> phenotypes() const {
        return decode_population(population_, config_.mapping);
    }

private:
    static SimulationConfig checked(SimulationConfig cfg) {
        validate(cfg);
        return cfg;
    }

    SimulationConfig      config_;
    Rng                   rng_;
    Population            population_;
    ReinforcementSchedule schedule_;
    FitnessEvaluator      evaluator_;
    BitFlipMutation       mutation_;
    EventLog              log_;
    Events                events_;
    Generation            gen_ = 0;
};

}  // namespace etbd
