#include "etbd/output_formats.hpp"
#include "etbd/simulation.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

using namespace etbd;
using etbd::test::populationOf;
using etbd::test::smallConfig;

namespace {

std::string csvOf(const EventLog& log)
{
    std::ostringstream out;
    write_event_log_csv(out, log);
    return out.str();
}

std::size_t lineCount(const std::string& text)
{
    return static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n'));
}

} // namespace

TEST(OutputFormatsTest, CsvHasAHeaderAndOneRowPerGeneration)
{
    Simulation<> sim(smallConfig());
    const std::string csv = csvOf(sim.run());

    EXPECT_EQ(lineCount(csv), 51u);
    EXPECT_EQ(csv.rfind("generation,population_size,", 0), 0u);
    EXPECT_NE(csv.find("\n0,20,"), std::string::npos);
    EXPECT_NE(csv.find("\n49,20,"), std::string::npos);
}

TEST(OutputFormatsTest, CsvLeavesStreamFormattingUnchanged)
{
    std::ostringstream out;
    out.precision(3);
    write_event_log_csv(out, EventLog{});
    EXPECT_EQ(out.precision(), 3);
}

TEST(OutputFormatsTest, CsvFileReportsUnwritablePath)
{
    EXPECT_FALSE(write_event_log_csv_file("/nonexistent-directory/run.csv", EventLog{}));
}

TEST(OutputFormatsTest, JsonIsAnArrayOfRecords)
{
    Simulation<> sim(smallConfig());
    std::ostringstream out;
    write_event_log_json(out, sim.run());
    const std::string json = out.str();

    EXPECT_EQ(json.front(), '[');
    EXPECT_NE(json.find("{\"generation\":0,\"population_size\":20,"), std::string::npos);
    EXPECT_NE(json.find("{\"generation\":49,"), std::string::npos);
    EXPECT_NE(json.find("\"schedule\":{\"state\":"), std::string::npos);
}

TEST(OutputFormatsTest, JsonWritesNonFiniteValuesAsNull)
{
    EventLog log;
    EventRecord r;
    r.fitness.max_val = kInfinity;
    r.fitness.mean = kInfinity;
    log.append(r);
    std::ostringstream out;

    write_event_log_json(out, log);

    EXPECT_NE(out.str().find("\"fitness\":{\"mean\":null,"), std::string::npos);
    EXPECT_EQ(out.str().find("inf,"), std::string::npos);
}

TEST(OutputFormatsTest, JsonParsesBackWithReinforcerFieldsOnlyWhereReinforced)
{
    Simulation<> sim(smallConfig());
    std::ostringstream out;
    write_event_log_json(out, sim.run());

    const nlohmann::json records = nlohmann::json::parse(out.str());
    ASSERT_TRUE(records.is_array());
    ASSERT_EQ(records.size(), 50u);

    std::size_t reinforced = 0;
    for (std::size_t i = 0; i < records.size(); ++i) {
        const nlohmann::json& r = records[i];
        EXPECT_EQ(r.at("generation").get<std::size_t>(), i);
        EXPECT_TRUE(r.at("phenotype").contains("variance"));
        EXPECT_TRUE(r.at("schedule").at("state").is_string());
        const bool wasReinforced = r.at("reinforced").get<bool>();
        EXPECT_EQ(r.contains("reinforced_index"), wasReinforced) << "record " << i;
        EXPECT_EQ(r.contains("reinforced_phenotype"), wasReinforced) << "record " << i;
        if (wasReinforced) ++reinforced;
        EXPECT_EQ(r.at("cumulative_reinforcers").get<std::size_t>(), sim.log()[i].cumulative_reinforcers);
    }
    EXPECT_EQ(reinforced, sim.log().reinforcement_count());
}

TEST(OutputFormatsTest, JsonKeysKeepRecordOrder)
{
    EventLog log;
    log.append(EventRecord{});
    const nlohmann::ordered_json records = event_log_to_json(log);

    std::vector<std::string> keys;
    for (const auto& item : records[0].items())
        keys.push_back(item.key());
    const std::vector<std::string> expected = { "generation", "population_size", "phenotype",
                                                "fitness", "distance", "diversity", "mutations",
                                                "schedule", "reinforced", "cumulative_reinforcers" };
    EXPECT_EQ(keys, expected);
}

TEST(OutputFormatsTest, PopulationCsvListsGenotypeAndPhenotype)
{
    const Population pop = populationOf({ "0011", "1000" });
    std::ostringstream out;

    write_population_csv(out, pop, IdentityMapping{});

    EXPECT_EQ(out.str(), "index,genotype,phenotype\n0,0011,3\n1,1000,8\n");
}

TEST(OutputFormatsTest, RunSummaryNamesTheHeadlineNumbers)
{
    RunSummary s;
    s.generations = 50;
    s.reinforcers = 4;
    s.reinforcement_rate = 0.08;
    std::ostringstream out;

    print_run_summary(out, s);

    EXPECT_NE(out.str().find("Reinforcers:         4"), std::string::npos);
    EXPECT_NE(out.str().find("0.0800"), std::string::npos);
}
