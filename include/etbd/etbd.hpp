// =============================================================================
// etbd.hpp — Single-include convenience header for the ETBD simulator.
//
//   #include "etbd/etbd.hpp"   // everything
//
// Or pick what you need:
//
//   #include "etbd/config.hpp"
//   #include "etbd/simulation.hpp"
//   #include "etbd/output_formats.hpp"
// =============================================================================
#pragma once

// ── Core types, errors & random helpers ─────────────────────────────────────
#include "types.hpp"
#include "errors.hpp"
#include "random.hpp"

// ── Repertoire ──────────────────────────────────────────────────────────────
#include "genotype.hpp"
#include "population.hpp"
#include "phenotype_mapper.hpp"

// ── Environment ─────────────────────────────────────────────────────────────
#include "reinforcement_schedule.hpp"

// ── Policy objects ──────────────────────────────────────────────────────────
#include "fitness_model.hpp"
#include "selection.hpp"
#include "recombination_model.hpp"
#include "mutation_model.hpp"
#include "concepts.hpp"

// ── Simulation driver ───────────────────────────────────────────────────────
#include "config.hpp"
#include "events.hpp"
#include "event_log.hpp"
#include "simulation.hpp"

// ── Analysis & output ───────────────────────────────────────────────────────
#include "statistics.hpp"
#include "output_formats.hpp"
