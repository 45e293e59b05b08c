// =============================================================================
// reinforcement_schedule.hpp — Random-interval (RI) reinforcement schedule.
//
// Time is measured in generations.  After each reinforcement an interval is
// drawn; once that many generations have elapsed the schedule arms, and the
// next qualifying response (the phenotype closest to the target, if it lies
// within the target tolerance) is reinforced.
//
// State machine:
//
//     Waiting ──(elapsed ≥ interval)──▶ Armed
//     Armed ──(qualifying response)──▶ JustReinforced
//     JustReinforced ──(next generation starts; new interval drawn)──▶ Waiting
//
// The clock restarts at the reinforcing generation, which counts as the first
// generation of the next interval: a fixed interval I reinforces at I, 2I, …
//
// There is no terminal state.  The Simulation driver is the only caller of
// the mutating methods; everyone else sees a const reference or a snapshot.
//
// Interval distributions (IntervalDistribution variant), all with mean `mean`:
//
//   ExponentialInterval  – continuous, the classic RI schedule (default)
//   GeometricInterval    – whole generations, support {1, 2, …}
//   FixedInterval        – always `mean` (a fixed-interval schedule)
// =============================================================================
#pragma once

#include "random.hpp"
#include "types.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <random>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace etbd {

// ── Interval distributions ──────────────────────────────────────────────────

struct ExponentialInterval {
    double mean = 30.0;

    template <RandomSource R>
    double operator()(R& rng) const {
        std::exponential_distribution<double> dist(1.0 / mean);
        return dist(rng);
    }
};

struct GeometricInterval {
    double mean = 30.0;   // >= 1; smaller values behave as 1

    template <RandomSource R>
    double operator()(R& rng) const {
        const double p = std::min(1.0, 1.0 / mean);
        std::geometric_distribution<std::uint64_t> dist(p);
        return 1.0 + static_cast<double>(dist(rng));
    }
};

struct FixedInterval {
    double mean = 30.0;

    template <RandomSource R>
    double operator()(R& /*rng*/) const noexcept { return mean; }
};

using IntervalDistribution = std::variant<ExponentialInterval, GeometricInterval,
                                          FixedInterval>;

template <RandomSource R>
double draw_interval(const IntervalDistribution& dist, R& rng) {
    return std::visit([&](const auto& d) { return d(rng); }, dist);
}

[[nodiscard]] inline double interval_mean(const IntervalDistribution& dist) noexcept {
    return std::visit([](const auto& d) { return d.mean; }, dist);
}

// ── Target ──────────────────────────────────────────────────────────────────

/// The currently reinforced response class: centre ± tolerance.
struct TargetRange {
    Phenotype centre    = 0.0;
    double    tolerance = kInfinity;

    [[nodiscard]] double distance(Phenotype p) const noexcept {
        return std::abs(p - centre);
    }
    [[nodiscard]] bool contains(Phenotype p) const noexcept {
        return distance(p) <= tolerance;
    }
};

// ── State ───────────────────────────────────────────────────────────────────

enum class ScheduleState : std::uint8_t {
    Waiting        = 0,
    Armed          = 1,
    JustReinforced = 2
};

[[nodiscard]] inline std::string_view to_string(ScheduleState s) noexcept {
    switch (s) {
        case ScheduleState::Waiting:        return "waiting";
        case ScheduleState::Armed:          return "armed";
        case ScheduleState::JustReinforced: return "reinforced";
    }
    return "unknown";
}

/// One delivered reinforcer.
struct ReinforcementEvent {
    Generation  generation = 0;
    std::size_t individual = kNoIndividual;
    Phenotype   phenotype  = 0.0;
    double      interval   = 0.0;   // the interval that had to elapse first
};

/// Read-only copy of the schedule, as recorded in the event log.
struct ScheduleSnapshot {
    ScheduleState state               = ScheduleState::Waiting;
    TargetRange   target{};
    double        interval            = 0.0;
    double        elapsed             = 0.0;
    std::size_t   reinforcement_count = 0;
};

// ── ReinforcementSchedule ───────────────────────────────────────────────────

class ReinforcementSchedule {
public:
    /// Starts Waiting with the first interval already drawn.
    template <RandomSource R>
    ReinforcementSchedule(IntervalDistribution dist, TargetRange target, R& rng)
        : dist_{std::move(dist)}
        , target_{target}
    {
        interval_ = draw_interval(dist_, rng);
    }

    // ── Transitions (Simulation only) ───────────────────────────────────────

    /// Top of generation g: consume JustReinforced (drawing a fresh interval),
    /// then arm if the current interval has elapsed.
    template <RandomSource R>
    void begin_generation(R& rng) {
        if (state_ == ScheduleState::JustReinforced) {
            interval_ = draw_interval(dist_, rng);
            state_    = ScheduleState::Waiting;
        }
        if (state_ == ScheduleState::Waiting && elapsed_ >= interval_)
            state_ = ScheduleState::Armed;
    }

    /// Offer the generation's closest response.  Reinforces it, and returns
    /// true, only if the schedule is Armed and the response is on target.
    bool try_reinforce(Generation g, std::size_t individual, Phenotype p) {
        if (state_ != ScheduleState::Armed || !target_.contains(p))
            return false;
        history_.push_back(ReinforcementEvent{g, individual, p, interval_});
        state_   = ScheduleState::JustReinforced;
        elapsed_ = 0.0;
        return true;
    }

    /// One generation of schedule time passes, in every state.
    void end_generation() noexcept { elapsed_ += 1.0; }

    // ── Queries ─────────────────────────────────────────────────────────────
    [[nodiscard]] ScheduleState state()    const noexcept { return state_; }
    [[nodiscard]] const TargetRange& target() const noexcept { return target_; }
    [[nodiscard]] double interval() const noexcept { return interval_; }
    [[nodiscard]] double elapsed()  const noexcept { return elapsed_; }
    [[nodiscard]] const IntervalDistribution& distribution() const noexcept { return dist_; }

    [[nodiscard]] const std::vector<ReinforcementEvent>& history() const noexcept {
        return history_;
    }
    [[nodiscard]] std::size_t reinforcement_count() const noexcept {
        return history_.size();
    }

    [[nodiscard]] ScheduleSnapshot snapshot() const noexcept {
        return ScheduleSnapshot{state_, target_, interval_, elapsed_, history_.size()};
    }

private:
    IntervalDistribution            dist_;
    TargetRange                     target_;
    ScheduleState                   state_    = ScheduleState::Waiting;
    double                          interval_ = 0.0;
    double                          elapsed_  = 0.0;
    std::vector<ReinforcementEvent> history_;
};

}  // namespace etbd
