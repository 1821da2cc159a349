#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>
#include "SampleStatistics.h"
#include "Histogram.h"
#include "ProbabilityVector.h"
#include "ComparisonException.h"

using Catch::Approx;
using namespace synvalidator;

TEST_CASE("SampleStatistics moments", "[SampleStatistics]")
{
    const std::vector<double> data = {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};

    REQUIRE(SampleStatistics::mean(data) == Approx(5.0));
    REQUIRE(SampleStatistics::populationVariance(data) == Approx(4.0));
    REQUIRE(SampleStatistics::populationStdDev(data) == Approx(2.0));
    REQUIRE(SampleStatistics::sampleVariance(data) == Approx(32.0 / 7.0));

    SECTION("Empty and single element input")
    {
        REQUIRE(SampleStatistics::mean({}) == 0.0);
        REQUIRE(SampleStatistics::populationVariance({3.0}) == 0.0);
        REQUIRE(SampleStatistics::sampleVariance({3.0}) == 0.0);
    }
}

TEST_CASE("SampleStatistics median", "[SampleStatistics]")
{
    REQUIRE(SampleStatistics::median({5.0, 1.0, 3.0}) == Approx(3.0));
    REQUIRE(SampleStatistics::median({4.0, 1.0, 3.0, 2.0}) == Approx(2.5));
    REQUIRE(SampleStatistics::median({}) == 0.0);
}

TEST_CASE("SampleStatistics midranks average tied positions", "[SampleStatistics]")
{
    const auto ranked = SampleStatistics::midranks({10.0, 20.0, 10.0, 30.0, 20.0, 20.0});

    REQUIRE(ranked.ranks == std::vector<double>{1.5, 4.0, 1.5, 6.0, 4.0, 4.0});
    REQUIRE(ranked.tieGroupSizes == std::vector<std::size_t>{2, 3, 1});
}

TEST_CASE("SampleStatistics empirical CDF and counting", "[SampleStatistics]")
{
    const std::vector<double> sorted = {1.0, 2.0, 2.0, 3.0};

    REQUIRE(SampleStatistics::countBelow(sorted, 2.0) == 1);
    REQUIRE(SampleStatistics::countAtMost(sorted, 2.0) == 3);
    REQUIRE(SampleStatistics::ecdf(sorted, 2.0) == Approx(0.75));
    REQUIRE(SampleStatistics::ecdf(sorted, 0.0) == 0.0);
    REQUIRE(SampleStatistics::ecdf(sorted, 10.0) == 1.0);

    REQUIRE(SampleStatistics::isConstant({4.0, 4.0}));
    REQUIRE_FALSE(SampleStatistics::isConstant({4.0, 4.5}));

    REQUIRE(SampleStatistics::pooledDistinct({3.0, 1.0}, {1.0, 2.0}) == std::vector<double>{1.0, 2.0, 3.0});
}

TEST_CASE("CommonHistogram bins both samples on shared edges", "[Histogram]")
{
    CommonHistogram histogram(10);

    SECTION("Bin count follows the number of distinct values")
    {
        auto binned = histogram.bin({42, 33, 18, 7}, {40, 35, 20, 5});

        // eight distinct values over [5, 42]
        REQUIRE(binned.edges.size() == 9);
        REQUIRE(binned.edges.front() == Approx(5.0));
        REQUIRE(binned.edges.back() == Approx(42.0));

        // occupied bins only
        REQUIRE(binned.syntheticCounts.size() == binned.realCounts.size());
        double synTotal = 0.0;
        double realTotal = 0.0;
        for (std::size_t i = 0; i < binned.syntheticCounts.size(); ++i)
        {
            REQUIRE(binned.syntheticCounts[i] + binned.realCounts[i] > 0.0);
            synTotal += binned.syntheticCounts[i];
            realTotal += binned.realCounts[i];
        }
        REQUIRE(synTotal == 4.0);
        REQUIRE(realTotal == 4.0);
    }

    SECTION("Maximum lands in the last bin")
    {
        auto binned = histogram.bin({0.0, 1.0}, {0.0, 1.0});
        REQUIRE(binned.syntheticCounts == std::vector<double>{1.0, 1.0});
    }

    SECTION("Zero range cannot be binned")
    {
        REQUIRE_THROWS_AS(histogram.bin({3.0, 3.0}, {3.0}), ComputationError);
    }

    SECTION("Empty sample cannot be binned")
    {
        REQUIRE_THROWS_AS(histogram.bin({}, {1.0, 2.0}), ComputationError);
    }
}

TEST_CASE("normalizeWeights and padToCommonLength", "[ProbabilityVector]")
{
    auto p = normalizeWeights({1.0, 3.0}, "synthetic");
    REQUIRE(p[0] == Approx(0.25));
    REQUIRE(p[1] == Approx(0.75));

    REQUIRE_THROWS_AS(normalizeWeights({0.0, 0.0}, "synthetic"), ComputationError);
    REQUIRE_THROWS_AS(normalizeWeights({1.0, -1.0}, "real"), ComputationError);

    std::vector<double> a = {0.5, 0.5};
    std::vector<double> b = {1.0};
    padToCommonLength(a, b, 0.0);
    REQUIRE(b.size() == 2);
    REQUIRE(b[1] == 0.0);
}
