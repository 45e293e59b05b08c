// =============================================================================
// main.cpp — Command-line driver for the ETBD simulator.
//
// Runs one organism on a random-interval schedule and reports progress,
// a run summary and (optionally) CSV / JSON output files.
//
// Build (GCC/Clang):
//   g++ -O3 -std=c++20 -Iinclude -o etbd_sim src/main.cpp
//
// Run:
//   ./etbd_sim                                  # defaults
//   ./etbd_sim 100 10 500 0.01 30 42            # N L G mu interval seed
//   ./etbd_sim 20 8 50 target=200 csv=run.csv   # overrides
//
// Exit status: 0 on success, 1 for a configuration error, 2 if the run
// aborted on an internal invariant violation, 3 if an output file could
// not be written.
// =============================================================================

#include "etbd/etbd.hpp"

#include <chrono>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

// =====================================================================
// Console output
// =====================================================================
static void print_banner(const etbd::SimulationConfig& cfg, const etbd::TargetRange& target)
{
    std::cout << "+----------------------------------------------------------+\n"
              << "|  ETBD -- Evolutionary Theory of Behavior Dynamics        |\n"
              << "+----------------------------------------------------------+\n"
              << "  N=" << cfg.population_size << " L=" << cfg.genotype_length
              << " G=" << cfg.generations << " mu=" << cfg.mutation_rate
              << " RI=" << cfg.mean_interval << " seed=" << cfg.seed << "\n"
              << "  target=" << target.centre;
    if (target.tolerance != etbd::kInfinity)
        std::cout << " +/- " << target.tolerance;
    std::cout << "  baseline pressure=" << cfg.baseline_pressure << "\n\n";
}

static void print_progress(const etbd::EventRecord& r)
{
    const auto flags = std::cout.flags();
    std::cout << "gen " << std::setw(5) << r.generation
              << "  mean=" << std::fixed << std::setprecision(2) << std::setw(9)
              << r.phenotype.mean
              << "  sd=" << std::setw(8) << std::sqrt(r.phenotype.variance)
              << "  dist=" << std::setw(8) << r.distance.mean
              << "  div=" << std::setprecision(3) << r.diversity
              << "  SR=" << r.cumulative_reinforcers
              << "  [" << etbd::to_string(r.schedule.state) << "]\n";
    std::cout.flags(flags);
}

// =====================================================================
// Run
// =====================================================================
static int run(const etbd::CommandLine& cl)
{
    using namespace etbd;

    Simulation<> sim(cl.config);
    print_banner(sim.config(), sim.schedule().target());

    Simulation<>::Events events;
    if (cl.report_interval > 0) {
        const Generation every = cl.report_interval;
        const Generation last  = cl.config.generations - 1;
        events.on_generation_end = [every, last](Generation g, const EventRecord& r) {
            if (g == 0 || (g + 1) % every == 0 || g == last)
                print_progress(r);
        };
    }
    sim.set_events(std::move(events));

    const auto t0 = std::chrono::high_resolution_clock::now();
    const EventLog& log = sim.run();
    const auto t1 = std::chrono::high_resolution_clock::now();

    std::cout << "\n  Time: " << std::fixed << std::setprecision(3)
              << std::chrono::duration<double>(t1 - t0).count() << " s\n";
    std::cout.unsetf(std::ios::floatfield);
    print_run_summary(std::cout, summarize(log));

    int status = 0;
    if (!cl.csv_path.empty()) {
        if (write_event_log_csv_file(cl.csv_path, log)) {
            std::cout << "  Wrote " << cl.csv_path << "\n";
        } else {
            std::cerr << "error: cannot write " << cl.csv_path << "\n";
            status = 3;
        }
    }
    if (!cl.json_path.empty()) {
        std::ofstream out(cl.json_path);
        if (out) write_event_log_json(out, log);
        if (out) {
            std::cout << "  Wrote " << cl.json_path << "\n";
        } else {
            std::cerr << "error: cannot write " << cl.json_path << "\n";
            status = 3;
        }
    }
    if (!cl.population_path.empty()) {
        std::ofstream out(cl.population_path);
        if (out) write_population_csv(out, sim.population(), sim.config().mapping);
        if (out) {
            std::cout << "  Wrote " << cl.population_path << "\n";
        } else {
            std::cerr << "error: cannot write " << cl.population_path << "\n";
            status = 3;
        }
    }
    return status;
}

// =====================================================================
// main
// =====================================================================
int main(int argc, char* argv[])
{
    const std::vector<std::string> args(argv + 1, argv + argc);
    try {
        return run(etbd::parse_arguments(args));
    } catch (const etbd::ConfigurationError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    } catch (const etbd::InvariantViolation& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }
}
