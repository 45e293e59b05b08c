// =============================================================================
// output_formats.hpp — Export of run results for analysis and plotting.
//
//   Event log CSV    — one row per generation; the format analysis scripts
//                      read (matching-law fits, response-rate plots).
//   Event log JSON   — the same records as an array of objects.
//   Population CSV   — index, genotype bit string, phenotype.
//   Run summary      — human-readable block for the console.
//
// CSV numbers are written with a fixed precision and JSON with
// nlohmann_json's round-trip formatting, so two identical runs produce
// byte-identical files.
// =============================================================================
#pragma once

#include "event_log.hpp"
#include "phenotype_mapper.hpp"
#include "population.hpp"
#include "reinforcement_schedule.hpp"
#include "statistics.hpp"
#include "types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <string>

namespace etbd {

inline constexpr int kOutputPrecision = 10;

// ── JSON encoding ───────────────────────────────────────────────────────────
// ordered_json keeps keys in insertion order, so the output is stable.
// Non-finite numbers (an exact hit under 1/d) serialise as null.

inline void to_json(nlohmann::ordered_json& j, const SummaryStats& s) {
    j = nlohmann::ordered_json{
        {"mean", s.mean}, {"variance", s.variance}, {"min", s.min_val}, {"max", s.max_val}};
}

inline void to_json(nlohmann::ordered_json& j, const ScheduleSnapshot& s) {
    j = nlohmann::ordered_json{
        {"state", std::string(to_string(s.state))},
        {"interval", s.interval},
        {"elapsed", s.elapsed},
        {"reinforcement_count", s.reinforcement_count}};
}

inline void to_json(nlohmann::ordered_json& j, const EventRecord& r) {
    j = nlohmann::ordered_json{
        {"generation", r.generation},
        {"population_size", r.population_size},
        {"phenotype", r.phenotype},
        {"fitness", r.fitness},
        {"distance", r.distance},
        {"diversity", r.diversity},
        {"mutations", r.mutations},
        {"schedule", r.schedule},
        {"reinforced", r.reinforced}};
    if (r.reinforced) {
        j["reinforced_index"]     = r.reinforced_index;
        j["reinforced_phenotype"] = r.reinforced_phenotype;
    }
    j["cumulative_reinforcers"] = r.cumulative_reinforcers;
}

// ─────────────────────────────────────────────────────────────────────────────
// Event log CSV
// ─────────────────────────────────────────────────────────────────────────────

inline void write_event_log_csv(std::ostream& out, const EventLog& log) {
    out << "generation,population_size,"
           "mean_phenotype,var_phenotype,min_phenotype,max_phenotype,"
           "mean_fitness,var_fitness,min_fitness,max_fitness,"
           "mean_distance,min_distance,diversity,mutations,"
           "schedule_state,interval,elapsed,"
           "reinforced,reinforced_index,reinforced_phenotype,cumulative_reinforcers\n";

    const auto flags = out.flags();
    const auto prec  = out.precision();
    out << std::setprecision(kOutputPrecision);

    for (const EventRecord& r : log) {
        out << r.generation << ',' << r.population_size << ','
            << r.phenotype.mean << ',' << r.phenotype.variance << ','
            << r.phenotype.min_val << ',' << r.phenotype.max_val << ','
            << r.fitness.mean << ',' << r.fitness.variance << ','
            << r.fitness.min_val << ',' << r.fitness.max_val << ','
            << r.distance.mean << ',' << r.distance.min_val << ','
            << r.diversity << ',' << r.mutations << ','
            << to_string(r.schedule.state) << ','
            << r.schedule.interval << ',' << r.schedule.elapsed << ','
            << (r.reinforced ? 1 : 0) << ',';
        if (r.reinforced) out << r.reinforced_index << ',' << r.reinforced_phenotype;
        else              out << ',';
        out << ',' << r.cumulative_reinforcers << '\n';
    }

    out.flags(flags);
    out.precision(prec);
}

/// Returns false if `path` cannot be opened for writing.
[[nodiscard]] inline bool write_event_log_csv_file(const std::string& path, const EventLog& log) {
    std::ofstream out(path);
    if (!out) return false;
    write_event_log_csv(out, log);
    return static_cast<bool>(out);
}

// ─────────────────────────────────────────────────────────────────────────────
// Event log JSON
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] inline nlohmann::ordered_json event_log_to_json(const EventLog& log) {
    nlohmann::ordered_json records = nlohmann::ordered_json::array();
    for (const EventRecord& r : log) records.push_back(r);
    return records;
}

/// One compact JSON array, newline-terminated.
inline void write_event_log_json(std::ostream& out, const EventLog& log) {
    out << event_log_to_json(log).dump() << '\n';
}

// ─────────────────────────────────────────────────────────────────────────────
// Population snapshot
// ─────────────────────────────────────────────────────────────────────────────

inline void write_population_csv(std::ostream& out,
                                 const Population& pop,
                                 const PhenotypeMapping& mapping)
{
    const auto flags = out.flags();
    const auto prec  = out.precision();
    out << std::setprecision(kOutputPrecision);

    out << "index,genotype,phenotype\n";
    for (std::size_t i = 0; i < pop.size(); ++i)
        out << i << ',' << pop[i].to_string() << ',' << decode(pop[i], mapping) << '\n';

    out.flags(flags);
    out.precision(prec);
}

// ─────────────────────────────────────────────────────────────────────────────
// Console summary
// ─────────────────────────────────────────────────────────────────────────────

inline void print_run_summary(std::ostream& out, const RunSummary& s) {
    const auto flags = out.flags();
    const auto prec  = out.precision();

    out << "  Generations:         " << s.generations << "\n"
        << "  Reinforcers:         " << s.reinforcers << "\n"
        << std::fixed << std::setprecision(4)
        << "  Reinforcement rate:  " << s.reinforcement_rate << " per generation\n"
        << std::setprecision(2)
        << "  Mean phenotype:      " << s.mean_phenotype
        << "  (sd " << s.sd_phenotype << ")\n"
        << "  First / last mean:   " << s.first_mean_phenotype
        << " -> " << s.last_mean_phenotype << "\n"
        << "  Mean distance:       " << s.mean_distance << "\n"
        << std::setprecision(6)
        << "  Mean fitness:        " << s.mean_fitness << "\n";

    out.flags(flags);
    out.precision(prec);
}

}  // namespace etbd
