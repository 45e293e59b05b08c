#include "etbd/errors.hpp"
#include "etbd/output_formats.hpp"
#include "etbd/simulation.hpp"
#include "test_support.hpp"
#include <cstdint>
#include <gtest/gtest.h>
#include <sstream>
#include <string>

using namespace etbd;
using etbd::test::FixedSequenceSource;
using etbd::test::smallConfig;

namespace {

std::string csvOf(const EventLog& log)
{
    std::ostringstream out;
    write_event_log_csv(out, log);
    return out.str();
}

} // namespace

TEST(SimulationTest, SmallRunProducesOneRecordPerGeneration)
{
    Simulation<> sim(smallConfig());
    const EventLog& log = sim.run();

    ASSERT_EQ(log.size(), 50u);
    for (std::size_t i = 0; i < log.size(); ++i) {
        EXPECT_EQ(log[i].generation, i);
        EXPECT_EQ(log[i].population_size, 20u);
    }
    EXPECT_GT(log.reinforcement_count(), 0u);
    EXPECT_EQ(log.reinforcement_count(), sim.schedule().reinforcement_count());
    EXPECT_TRUE(sim.finished());
    EXPECT_EQ(sim.generation(), 50u);
}

TEST(SimulationTest, SameSeedGivesIdenticalLogs)
{
    Simulation<> first(smallConfig());
    Simulation<> second(smallConfig());

    EXPECT_EQ(csvOf(first.run()), csvOf(second.run()));
    EXPECT_EQ(first.population().genotypes(), second.population().genotypes());
}

TEST(SimulationTest, DifferentSeedsDiverge)
{
    SimulationConfig other = smallConfig();
    other.seed = 43;

    Simulation<> first(smallConfig());
    Simulation<> second(other);

    EXPECT_NE(csvOf(first.run()), csvOf(second.run()));
}

TEST(SimulationTest, InjectedRandomSourceIsReproducible)
{
    Simulation<FixedSequenceSource> first(smallConfig(), FixedSequenceSource::fromSeed(5));
    Simulation<FixedSequenceSource> second(smallConfig(), FixedSequenceSource::fromSeed(5));

    EXPECT_EQ(csvOf(first.run()), csvOf(second.run()));
}

TEST(SimulationTest, PopulationShapeIsConstantEveryGeneration)
{
    SimulationConfig cfg = smallConfig();
    cfg.crossover = UniformCrossover{};
    cfg.selection = TournamentSelection{ 2 };
    Simulation<> sim(cfg);

    while (!sim.finished()) {
        sim.step();
        ASSERT_EQ(sim.population().size(), 20u);
        ASSERT_EQ(sim.population().genotype_length(), 8u);
        for (const auto& g : sim.population()) ASSERT_EQ(g.size(), 8u);
    }
}

TEST(SimulationTest, ReinforcementRecordsAgreeWithScheduleHistory)
{
    Simulation<> sim(smallConfig());
    const EventLog& log = sim.run();
    const auto& history = sim.schedule().history();

    std::size_t seen = 0;
    std::size_t previous = 0;
    for (const auto& r : log) {
        EXPECT_GE(r.cumulative_reinforcers, previous);
        previous = r.cumulative_reinforcers;
        if (!r.reinforced) continue;

        ASSERT_LT(seen, history.size());
        EXPECT_EQ(history[seen].generation, r.generation);
        EXPECT_EQ(history[seen].individual, r.reinforced_index);
        EXPECT_DOUBLE_EQ(history[seen].phenotype, r.reinforced_phenotype);
        EXPECT_EQ(r.schedule.state, ScheduleState::JustReinforced);
        EXPECT_LT(r.reinforced_index, 20u);
        ++seen;
    }
    EXPECT_EQ(seen, history.size());
}

TEST(SimulationTest, HooksFireInEveryGeneration)
{
    Simulation<> sim(smallConfig());

    std::size_t starts = 0, scored = 0, ends = 0, reinforcers = 0;
    Simulation<>::Events events;
    events.on_generation_start = [&](Generation g, const Simulation<>& s) {
        EXPECT_EQ(g, s.generation());
        ++starts;
    };
    events.on_post_fitness = [&](Generation, const Evaluation& ev) {
        EXPECT_EQ(ev.fitness.size(), 20u);
        ++scored;
    };
    events.on_reinforcement = [&](Generation g, const ReinforcementEvent& e) {
        EXPECT_EQ(e.generation, g);
        ++reinforcers;
    };
    events.on_generation_end = [&](Generation g, const EventRecord& r) {
        EXPECT_EQ(r.generation, g);
        ++ends;
    };
    sim.set_events(std::move(events));
    sim.run();

    EXPECT_EQ(starts, 50u);
    EXPECT_EQ(scored, 50u);
    EXPECT_EQ(ends, 50u);
    EXPECT_EQ(reinforcers, sim.log().reinforcement_count());
}

TEST(SimulationTest, StopHookEndsTheRunEarly)
{
    Simulation<> sim(smallConfig());
    Simulation<>::Events events;
    events.should_stop = [](Generation g, const Simulation<>&) { return g == 4; };
    sim.set_events(std::move(events));

    EXPECT_EQ(sim.run().size(), 5u);
    EXPECT_FALSE(sim.finished());
}

TEST(SimulationTest, SingleIndividualPopulationRuns)
{
    SimulationConfig cfg = smallConfig();
    cfg.population_size = 1;
    Simulation<> sim(cfg);

    const EventLog& log = sim.run();

    ASSERT_EQ(log.size(), 50u);
    for (const auto& r : log) {
        EXPECT_EQ(r.population_size, 1u);
        EXPECT_DOUBLE_EQ(r.diversity, 0.0);
    }
    EXPECT_EQ(sim.population().size(), 1u);
}

TEST(SimulationTest, ZeroMutationRateRecordsNoFlips)
{
    SimulationConfig cfg = smallConfig();
    cfg.mutation_rate = 0.0;
    Simulation<> sim(cfg);

    for (const auto& r : sim.run()) EXPECT_EQ(r.mutations, 0u);
}

TEST(SimulationTest, FullMutationRateFlipsEveryOffspringLocus)
{
    SimulationConfig cfg = smallConfig();
    cfg.mutation_rate = 1.0;
    Simulation<> sim(cfg);

    for (const auto& r : sim.run()) EXPECT_EQ(r.mutations, 20u * 8u);
}

TEST(SimulationTest, ResponsesDriftTowardTheTarget)
{
    SimulationConfig cfg = smallConfig();
    cfg.population_size = 50;
    cfg.generations = 200;
    cfg.target_centre = 200.0;
    Simulation<> sim(cfg);

    const EventLog& log = sim.run();

    double late = 0.0;
    for (std::size_t i = log.size() - 20; i < log.size(); ++i) late += log[i].distance.mean;
    late /= 20.0;
    EXPECT_LT(late, log[0].distance.mean / 2.0);
}

TEST(SimulationTest, InvalidConfigurationIsRejectedBeforeAnyGeneration)
{
    SimulationConfig cfg = smallConfig();
    cfg.genotype_length = 0;
    EXPECT_THROW(Simulation<> sim(cfg), ConfigurationError);

    cfg = smallConfig();
    cfg.mutation_rate = 2.0;
    EXPECT_THROW(Simulation<> sim(cfg), ConfigurationError);

    cfg = smallConfig();
    cfg.target_centre = 300.0;
    EXPECT_THROW(Simulation<> sim(cfg), ConfigurationError);
}

TEST(SimulationTest, ConstructionDrawsInitialStateOnly)
{
    Simulation<> sim(smallConfig());

    EXPECT_EQ(sim.generation(), 0u);
    EXPECT_TRUE(sim.log().empty());
    EXPECT_EQ(sim.population().size(), 20u);
    EXPECT_EQ(sim.schedule().state(), ScheduleState::Waiting);
    EXPECT_DOUBLE_EQ(sim.schedule().target().centre, 127.5);
    EXPECT_EQ(sim.phenotypes().size(), 20u);
}

TEST(SimulationTest, FixedIntervalReinforcesOnEveryTenthGeneration)
{
    SimulationConfig cfg = smallConfig();
    cfg.interval_kind = IntervalKind::Fixed;
    Simulation<> sim(cfg);
    sim.run();

    const auto& history = sim.schedule().history();
    ASSERT_EQ(history.size(), 4u);
    EXPECT_EQ(history[0].generation, 10u);
    EXPECT_EQ(history[1].generation, 20u);
    EXPECT_EQ(history[2].generation, 30u);
    EXPECT_EQ(history[3].generation, 40u);
}

TEST(SimulationTest, RandomIntervalRateMatchesTheMeanInterval)
{
    // Gaps are max(1, ceil(X)) with X ~ Exp(10): mean 10.51 generations, so
    // about 18.9 reinforcers land in generations 0..199.
    const int runs = 400;
    double total = 0.0;
    for (int seed = 0; seed < runs; ++seed) {
        SimulationConfig cfg = smallConfig();
        cfg.generations = 200;
        cfg.seed = static_cast<std::uint64_t>(seed) + 1;
        Simulation<> sim(cfg);
        total += static_cast<double>(sim.run().reinforcement_count());
    }
    const double mean = total / runs;
    EXPECT_GT(mean, 18.1);
    EXPECT_LT(mean, 19.7);
}
