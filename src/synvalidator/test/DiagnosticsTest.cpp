#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include "ComparisonEngine.h"
#include "CompositeComparisonObserver.h"
#include "CsvTestResultCollector.h"
#include "StreamComparisonLogger.h"

using namespace synvalidator;
using namespace synvalidator::diagnostics;

namespace
{
    std::vector<std::string> readLines(const std::string& path)
    {
        std::ifstream in(path);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(in, line))
            lines.push_back(line);
        return lines;
    }

    bool contains(const std::string& haystack, const std::string& needle)
    {
        return haystack.find(needle) != std::string::npos;
    }
}

TEST_CASE("StreamComparisonLogger", "[Diagnostics]")
{
    std::ostringstream os;

    SECTION("Quiet mode logs only warnings and the summary")
    {
        StreamComparisonLogger logger(os);
        ComparisonEngine engine(ComparisonConfiguration(), &logger);

        engine.compareSamples(ResponseSet::fromValues({1, 2, 3, 4}), ResponseSet::fromValues({1, 2}));
        const std::string log = os.str();

        REQUIRE(contains(log, "[WARN] correlation failed: "));
        REQUIRE(contains(log, "[WARN] error_metrics failed: "));
        REQUIRE_FALSE(contains(log, "[INFO] ks_test"));
        REQUIRE(contains(log, "Overall accuracy="));
    }

    SECTION("Verbose mode logs every test with its scope")
    {
        StreamComparisonLogger logger(os, true);
        ComparisonEngine engine(ComparisonConfiguration(), &logger);

        std::vector<SurveyQuestion> synthetic = {
            SurveyQuestion("Q1", "Satisfaction", ResponseSet::fromCountVector({42, 33, 18, 7}))
        };
        std::vector<SurveyQuestion> real = {
            SurveyQuestion("Q1", "", ResponseSet::fromCountVector({40, 35, 20, 5})),
            SurveyQuestion("Q2", "Extra", ResponseSet::fromCountVector({1, 1}))
        };
        engine.compareSurveys(synthetic, real);
        const std::string log = os.str();

        REQUIRE(contains(log, "[INFO] Q1: chi_square match_score="));
        REQUIRE(contains(log, "[INFO] Question Q1 (Satisfaction): Rating Scale"));
        REQUIRE(contains(log, "[WARN] Question Q2 (Extra): Unmatched"));
        REQUIRE(contains(log, "[INFO] Overall accuracy="));
        REQUIRE(contains(log, "tier=TIER_1"));
    }

    SECTION("Input errors are warnings")
    {
        StreamComparisonLogger logger(os);
        ComparisonEngine engine(ComparisonConfiguration(), &logger);

        engine.compareSamples(ResponseSet::fromValues({}), ResponseSet::fromValues({}));

        REQUIRE(contains(os.str(), "[WARN] Input could not be compared: "));
    }
}

TEST_CASE("CsvTestResultCollector", "[Diagnostics]")
{
    const std::string path = "synvalidator_csv_collector_test.csv";
    std::remove(path.c_str());

    {
        CsvTestResultCollector collector(path);
        ComparisonEngine engine(ComparisonConfiguration(), &collector);
        engine.compareSamples(ResponseSet::fromCountVector({42, 33, 18, 7}),
                              ResponseSet::fromCountVector({40, 35, 20, 5}));
    }

    auto lines = readLines(path);
    REQUIRE(lines.size() == 4);
    REQUIRE(lines[0] == "Scope,Test,Status,MatchScore,Tier,Error,Statistics");
    REQUIRE(lines[1].rfind(",chi_square,OK,", 0) == 0);
    REQUIRE(contains(lines[1], "TIER_1"));
    REQUIRE(contains(lines[1], "dof=3"));

    SECTION("Appending to an existing file does not repeat the header")
    {
        {
            CsvTestResultCollector collector(path);
            ComparisonEngine engine(ComparisonConfiguration(), &collector);
            engine.compareSamples(ResponseSet::fromValues({1, 2, 3}), ResponseSet::fromValues({1}));
        }

        lines = readLines(path);
        REQUIRE(lines.size() == 4 + 12);
        REQUIRE(lines[4] != lines[0]);
        REQUIRE(contains(lines[5], ",ks_test,ERROR,,,"));
    }

    std::remove(path.c_str());
}

TEST_CASE("CsvTestResultCollector rejects an unwritable path", "[Diagnostics]")
{
    REQUIRE_THROWS_AS(CsvTestResultCollector("no_such_directory/diagnostics.csv"), std::runtime_error);
}

TEST_CASE("CompositeComparisonObserver fans out", "[Diagnostics]")
{
    std::ostringstream first;
    std::ostringstream second;
    StreamComparisonLogger a(first);
    StreamComparisonLogger b(second);

    CompositeComparisonObserver composite;
    composite.attach(&a);
    composite.attach(&b);
    composite.attach(nullptr);
    REQUIRE(composite.size() == 2);

    ComparisonEngine engine(ComparisonConfiguration(), &composite);
    engine.compareSamples(ResponseSet::fromValues({1, 2, 3}), ResponseSet::fromValues({2, 3, 4}));

    REQUIRE_FALSE(first.str().empty());
    REQUIRE(first.str() == second.str());

    composite.detach(&b);
    REQUIRE(composite.size() == 1);
}
