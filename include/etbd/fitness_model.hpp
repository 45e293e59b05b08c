// =============================================================================
// fitness_model.hpp — Fitness of a response relative to the reinforced target.
//
// Every kernel maps the distance d = |phenotype − target| to a non-negative
// fitness and is non-increasing in d: the closer a response is to what the
// schedule reinforces, the fitter its genotype.  Selection weight is then
// proportional to fitness (see selection.hpp), i.e. inversely related to
// distance.
//
// Provided kernels (FitnessKernel variant):
//
//   ExponentialFitness      – exp(−d / density_mean)      (default)
//   InverseDistanceFitness  – 1 / d, +inf at d = 0
//   InverseSquareFitness    – 1 / (1 + d²)
//   LinearFitness           – max(0, 1 − d / max_distance)
//
// Schedule modulation: on generations in which a reinforcer was delivered the
// kernel sees d; on every other generation it sees baseline_pressure · d.
// baseline_pressure = 1 keeps selection identical across generations;
// baseline_pressure = 0 makes all responses equally fit between reinforcers.
// =============================================================================
#pragma once

#include "reinforcement_schedule.hpp"
#include "types.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>
#include <variant>
#include <vector>

namespace etbd {

// ── Kernels ─────────────────────────────────────────────────────────────────

struct ExponentialFitness {
    double density_mean = 20.0;   // smaller ⇒ stronger selection

    [[nodiscard]] Fitness operator()(double d) const noexcept {
        return std::exp(-d / density_mean);
    }
};

struct InverseDistanceFitness {
    [[nodiscard]] Fitness operator()(double d) const noexcept {
        return (d <= 0.0) ? kInfinity : 1.0 / d;
    }
};

struct InverseSquareFitness {
    [[nodiscard]] Fitness operator()(double d) const noexcept {
        return 1.0 / (1.0 + d * d);
    }
};

struct LinearFitness {
    double max_distance = 100.0;

    [[nodiscard]] Fitness operator()(double d) const noexcept {
        return std::max(0.0, 1.0 - d / max_distance);
    }
};

using FitnessKernel = std::variant<ExponentialFitness, InverseDistanceFitness,
                                   InverseSquareFitness, LinearFitness>;

[[nodiscard]] inline Fitness apply_kernel(const FitnessKernel& kernel, double d) noexcept {
    return std::visit([&](const auto& k) { return k(d); }, kernel);
}

// ── Evaluation result ───────────────────────────────────────────────────────

struct Evaluation {
    std::vector<double>  distances;               // |phenotype − target|
    std::vector<Fitness> fitness;                 // kernel output, >= 0
    std::size_t          closest = kNoIndividual; // lowest index among the nearest
    bool                 reinforced = false;      // a reinforcer was delivered
};

// ── FitnessEvaluator ────────────────────────────────────────────────────────

class FitnessEvaluator {
public:
    explicit FitnessEvaluator(FitnessKernel kernel = ExponentialFitness{},
                              double baseline_pressure = 1.0)
        : kernel_{std::move(kernel)}
        , baseline_pressure_{baseline_pressure}
    {}

    /// Fitness of one response given the schedule state after the
    /// reinforcement decision for this generation.
    [[nodiscard]] Fitness score(Phenotype p, const ScheduleSnapshot& schedule) const noexcept {
        const double d = schedule.target.distance(p);
        const bool reinforced = (schedule.state == ScheduleState::JustReinforced);
        return apply_kernel(kernel_, reinforced ? d : baseline_pressure_ * d);
    }

    /// Score a whole generation.  The closest response (ties → earliest in
    /// population order) is offered to the schedule first, so a reinforcer
    /// delivered this generation is reflected in every score.
    Evaluation evaluate(const std::vector<Phenotype>& phenotypes,
                        ReinforcementSchedule& schedule,
                        Generation g) const
    {
        Evaluation ev;
        const std::size_t N = phenotypes.size();
        ev.distances.resize(N);
        ev.fitness.resize(N);

        const TargetRange& target = schedule.target();
        for (std::size_t i = 0; i < N; ++i) {
            ev.distances[i] = target.distance(phenotypes[i]);
            if (ev.closest == kNoIndividual || ev.distances[i] < ev.distances[ev.closest])
                ev.closest = i;
        }

        if (ev.closest != kNoIndividual)
            ev.reinforced = schedule.try_reinforce(g, ev.closest, phenotypes[ev.closest]);

        const ScheduleSnapshot snap = schedule.snapshot();
        for (std::size_t i = 0; i < N; ++i)
            ev.fitness[i] = score(phenotypes[i], snap);
        return ev;
    }

    [[nodiscard]] const FitnessKernel& kernel() const noexcept { return kernel_; }
    [[nodiscard]] double baseline_pressure() const noexcept { return baseline_pressure_; }

private:
    FitnessKernel kernel_;
    double        baseline_pressure_;
};

}  // namespace etbd
