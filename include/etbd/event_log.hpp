// =============================================================================
// event_log.hpp — Per-generation event records and the run log.
//
// The Simulation appends exactly one EventRecord per completed generation.
// The log is append-only while the run is in progress and is the only
// artifact handed to analysis and plotting code afterwards: a finite,
// restartable sequence (iterate it as many times as you like).
//
// summarize() condenses a finished log into the headline numbers of a run
// (total reinforcers, reinforcement rate, drift of the mean response).
// =============================================================================
#pragma once

#include "reinforcement_schedule.hpp"
#include "statistics.hpp"
#include "types.hpp"

#include <cassert>
#include <cmath>
#include <cstddef>
#include <utility>
#include <vector>

namespace etbd {

// ── EventRecord ─────────────────────────────────────────────────────────────
struct EventRecord {
    Generation       generation      = 0;
    std::size_t      population_size = 0;

    SummaryStats     phenotype{};
    SummaryStats     fitness{};
    SummaryStats     distance{};      // |phenotype − target|
    double           diversity = 0.0; // mean pairwise Hamming distance (parents)
    std::size_t      mutations = 0;   // loci flipped while building offspring

    ScheduleSnapshot schedule{};      // after this generation's schedule advance
    bool             reinforced           = false;
    std::size_t      reinforced_index     = kNoIndividual;
    Phenotype        reinforced_phenotype = 0.0;
    std::size_t      cumulative_reinforcers = 0;
};

// ── EventLog ────────────────────────────────────────────────────────────────
class EventLog {
public:
    using const_iterator = std::vector<EventRecord>::const_iterator;

    void reserve(std::size_t n) { records_.reserve(n); }

    void append(EventRecord rec) {
        assert(records_.empty() || rec.generation == records_.back().generation + 1);
        records_.push_back(std::move(rec));
    }

    [[nodiscard]] std::size_t size()  const noexcept { return records_.size(); }
    [[nodiscard]] bool        empty() const noexcept { return records_.empty(); }

    [[nodiscard]] const EventRecord& operator[](std::size_t i) const noexcept {
        assert(i < records_.size());
        return records_[i];
    }
    [[nodiscard]] const EventRecord& back() const noexcept { return records_.back(); }

    [[nodiscard]] const std::vector<EventRecord>& records() const noexcept { return records_; }

    [[nodiscard]] const_iterator begin() const noexcept { return records_.begin(); }
    [[nodiscard]] const_iterator end()   const noexcept { return records_.end(); }

    /// Number of generations in which a reinforcer was delivered.
    [[nodiscard]] std::size_t reinforcement_count() const noexcept {
        return records_.empty() ? 0 : records_.back().cumulative_reinforcers;
    }

private:
    std::vector<EventRecord> records_;
};

// ── RunSummary ──────────────────────────────────────────────────────────────
struct RunSummary {
    std::size_t generations         = 0;
    std::size_t reinforcers         = 0;
    double      reinforcement_rate  = 0.0;   // reinforcers per generation
    double      mean_phenotype      = 0.0;   // mean over generations of the mean
    double      sd_phenotype        = 0.0;   // sd over generations of the mean
    double      first_mean_phenotype = 0.0;
    double      last_mean_phenotype  = 0.0;
    double      mean_distance       = 0.0;
    double      mean_fitness        = 0.0;
};

[[nodiscard]] inline RunSummary summarize(const EventLog& log) {
    RunSummary s;
    if (log.empty()) return s;

    std::vector<double> pheno, dist, fit;
    pheno.reserve(log.size());
    dist.reserve(log.size());
    fit.reserve(log.size());
    for (const auto& r : log) {
        pheno.push_back(r.phenotype.mean);
        dist.push_back(r.distance.mean);
        fit.push_back(r.fitness.mean);
    }
    const SummaryStats ps = compute_summary(pheno);

    s.generations          = log.size();
    s.reinforcers          = log.reinforcement_count();
    s.reinforcement_rate   = static_cast<double>(s.reinforcers) /
                             static_cast<double>(s.generations);
    s.mean_phenotype       = ps.mean;
    s.sd_phenotype         = std::sqrt(ps.variance);
    s.first_mean_phenotype = pheno.front();
    s.last_mean_phenotype  = pheno.back();
    s.mean_distance        = compute_summary(dist).mean;
    s.mean_fitness         = compute_summary(fit).mean;
    return s;
}

}  // namespace etbd
