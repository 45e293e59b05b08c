// =============================================================================
// events.hpp — Hook points in the generation loop.
//
// Lets a driver observe every phase of a generation without modifying the
// Simulation class.  Useful for:
//   - Logging / progress output
//   - Collecting extra time series beyond the EventLog
//   - Stopping a run on a custom convergence criterion
//
// Usage:
//   SimulationEvents<Sim> events;
//   events.on_reinforcement  = [](Generation g, const ReinforcementEvent& e) { ... };
//   events.on_generation_end = [](Generation g, const EventRecord& r) { ... };
//   sim.set_events(std::move(events));
//
// Events are optional; null callbacks are skipped.  All callbacks receive
// read-only views; the engine's state cannot be changed through them.
// =============================================================================
#pragma once

#include "event_log.hpp"
#include "fitness_model.hpp"
#include "reinforcement_schedule.hpp"
#include "types.hpp"

#include <functional>

namespace etbd {

template <typename SimType>
struct SimulationEvents {
    /// Fired at the very start of a generation, after the schedule has
    /// consumed any pending reinforcer and possibly armed.
    std::function<void(Generation, const SimType&)> on_generation_start;

    /// Fired after every individual has been scored.
    std::function<void(Generation, const Evaluation&)> on_post_fitness;

    /// Fired when the schedule delivers a reinforcer.
    std::function<void(Generation, const ReinforcementEvent&)> on_reinforcement;

    /// Fired after the new generation is installed and its record appended.
    std::function<void(Generation, const EventRecord&)> on_generation_end;

    /// Return true to end the run early.  Checked after each generation.
    /// Not set by default: a run always completes all G generations.
    std::function<bool(Generation, const SimType&)> should_stop;

    [[nodiscard]] bool empty() const noexcept {
        return !on_generation_start
            && !on_post_fitness
            && !on_reinforcement
            && !on_generation_end
            && !should_stop;
    }
};

}  // namespace etbd
