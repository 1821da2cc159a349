#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>
#include "QuestionComparator.h"

using Catch::Approx;
using namespace synvalidator;

namespace
{
    QuestionComparator makeComparator()
    {
        ComparisonConfiguration config;
        TestBattery battery(config.makeTierClassifier(), config.getBatterySettings());
        return QuestionComparator(battery, config.getBatteryComposition());
    }

    QuestionResponses countsQuestion(const std::vector<double>& syn, const std::vector<double>& real)
    {
        return QuestionResponses("Q1", "Satisfaction",
                                 ResponseSet::fromCountVector(syn),
                                 ResponseSet::fromCountVector(real));
    }
}

TEST_CASE("QuestionComparator on categorical counts", "[QuestionComparator]")
{
    auto comparator = makeComparator();

    SECTION("Identical counts")
    {
        auto q = comparator.compare(countsQuestion({42, 33, 18, 7}, {42, 33, 18, 7}));

        REQUIRE(q.getStatus() == QuestionStatus::Compared);
        REQUIRE(*q.getMatchScore() == Approx(1.0));
        REQUIRE(*q.getTier() == Tier::Tier1);
        REQUIRE(q.getTests().size() == 2);
        REQUIRE(q.getTests()[0].getKind() == TestKind::ChiSquare);
        REQUIRE(q.getTests()[1].getKind() == TestKind::JensenShannon);
    }

    SECTION("Near-identical counts")
    {
        auto q = comparator.compare(countsQuestion({42, 33, 18, 7}, {40, 35, 20, 5}));

        REQUIRE(*q.getMatchScore() == Approx(0.9533271931490677).margin(1e-6));
        REQUIRE(*q.getTier() == Tier::Tier1);
        REQUIRE(q.getSyntheticTotal() == Approx(100.0));
        REQUIRE(q.getRealTotal() == Approx(100.0));
        REQUIRE(q.getType() == QuestionType::RatingScale);
        REQUIRE(q.getOptionComparisons().size() == 4);
        REQUIRE(q.getOptionComparisons()[3] == OptionComparison{"4", 7, 5});
    }

    SECTION("Markedly different counts")
    {
        auto q = comparator.compare(countsQuestion({80, 10, 5, 5}, {40, 35, 20, 5}));

        REQUIRE(*q.getMatchScore() == Approx(0.4315822967314469).margin(1e-6));
        REQUIRE(*q.getTier() == Tier::Tier4);
    }

    SECTION("Text labels are categorical and zero-zero options are kept")
    {
        auto syn = ResponseSet::fromCounts({{"Yes", 60}, {"No", 40}, {"Unsure", 0}});
        auto real = ResponseSet::fromCounts({{"No", 45}, {"Yes", 55}});

        auto q = comparator.compare(QuestionResponses("Q2", "Recommend", syn, real));

        REQUIRE(q.getType() == QuestionType::Categorical);
        REQUIRE(q.getStatus() == QuestionStatus::Compared);
        REQUIRE(q.getOptionComparisons().size() == 3);
        REQUIRE(q.getOptionComparisons()[2] == OptionComparison{"Unsure", 0, 0});
        REQUIRE(*q.getTests()[0].getStatistic("dof") == 1.0);
    }
}

TEST_CASE("QuestionComparator falls back to Insufficient data", "[QuestionComparator]")
{
    auto comparator = makeComparator();

    SECTION("Every test fails")
    {
        auto q = comparator.compare(countsQuestion({0, 0}, {0, 0}));

        REQUIRE(q.getStatus() == QuestionStatus::InsufficientData);
        REQUIRE_FALSE(q.getMatchScore().has_value());
        REQUIRE_FALSE(q.getTier().has_value());
        REQUIRE(q.getTests().size() == 2);
        REQUIRE(q.getTests()[0].isError());
    }

    SECTION("Numeric against categorical")
    {
        QuestionResponses pair("Q3", "Age", ResponseSet::fromValues({30, 40}),
                               ResponseSet::fromCountVector({1, 2}));
        auto q = comparator.compare(pair);

        REQUIRE(q.getStatus() == QuestionStatus::InsufficientData);
        REQUIRE(q.getError().has_value());
        REQUIRE(q.getTests().empty());
    }

    SECTION("Both sides empty")
    {
        auto q = comparator.compare(countsQuestion({}, {}));
        REQUIRE(q.getStatus() == QuestionStatus::InsufficientData);
        REQUIRE(q.getError().has_value());
    }
}

TEST_CASE("QuestionComparator on numeric samples", "[QuestionComparator]")
{
    auto comparator = makeComparator();

    QuestionResponses pair("Q4", "Spend",
                           ResponseSet::fromValues({1, 2, 3, 4, 5, 6, 7, 8, 9, 10}),
                           ResponseSet::fromValues({2, 3, 3, 5, 6, 6, 7, 9, 9, 10}));
    auto q = comparator.compare(pair);

    REQUIRE(q.getType() == QuestionType::Numeric);
    REQUIRE(q.getTests().size() == 8);
    REQUIRE(q.getOptionComparisons().empty());
    REQUIRE(q.getSyntheticTotal() == 10.0);
    REQUIRE(*q.getMatchScore() == Approx(0.8826338454547721).margin(1e-6));
    REQUIRE(*q.getTier() == Tier::Tier1);
}

TEST_CASE("QuestionComparator on statistical summaries", "[QuestionComparator]")
{
    auto comparator = makeComparator();

    auto syn = ResponseSet::fromCounts({{"MEAN", 4.0}, {"MEDIAN", 4.0}, {"STD", 1.0}});
    auto real = ResponseSet::fromCounts({{"mean", 3.0}, {"std", 1.5}});

    auto q = comparator.compare(QuestionResponses("Q5", "Rating", syn, real));

    REQUIRE(q.getType() == QuestionType::StatisticalSummary);
    REQUIRE(q.getStatus() == QuestionStatus::Compared);
    REQUIRE(q.getSyntheticTotal() == 4.0);
    REQUIRE(q.getRealTotal() == 3.0);

    const auto& options = q.getOptionComparisons();
    REQUIRE(options.size() == 3);
    REQUIRE(options[0] == OptionComparison{"MEAN", 4.0, 3.0});
    REQUIRE(options[1] == OptionComparison{"MEDIAN", 4.0, 0.0});
    REQUIRE(options[2] == OptionComparison{"STD", 1.0, 1.5});

    const double expected = 1.0 - (1.0 / 3.5 + 0.5 / 1.25) / 2.0;
    REQUIRE(*q.getMatchScore() == Approx(expected));
}

TEST_CASE("QuestionComparator::classifyOptions", "[QuestionComparator]")
{
    using OC = OptionComparison;

    REQUIRE(QuestionComparator::classifyOptions({OC{"1", 1, 1}, OC{"10", 1, 1}}) == QuestionType::RatingScale);
    REQUIRE(QuestionComparator::classifyOptions({OC{"0", 1, 1}, OC{"5", 1, 1}}) == QuestionType::Categorical);
    REQUIRE(QuestionComparator::classifyOptions({OC{"11", 1, 1}}) == QuestionType::Categorical);
    REQUIRE(QuestionComparator::classifyOptions({OC{"01", 1, 1}, OC{"05", 1, 1}}) == QuestionType::RatingScale);
    REQUIRE(QuestionComparator::classifyOptions({OC{"00", 1, 1}}) == QuestionType::Categorical);
    REQUIRE(QuestionComparator::classifyOptions({OC{"+3", 1, 1}}) == QuestionType::Categorical);
    REQUIRE(QuestionComparator::classifyOptions({OC{"Yes", 1, 1}, OC{"3", 1, 1}}) == QuestionType::Categorical);
    REQUIRE(QuestionComparator::classifyOptions({}) == QuestionType::Categorical);
}

TEST_CASE("QuestionComparator::unmatched", "[QuestionComparator]")
{
    auto q = QuestionComparator::unmatched("Q9", "Only real", ResponseSet::fromCountVector({3, 4}), false);

    REQUIRE(q.getStatus() == QuestionStatus::Unmatched);
    REQUIRE(q.getSyntheticTotal() == 0.0);
    REQUIRE(q.getRealTotal() == 7.0);
    REQUIRE_FALSE(q.getMatchScore().has_value());
    REQUIRE(questionStatusToString(q.getStatus()) == "Unmatched");
    REQUIRE(questionStatusToString(QuestionStatus::InsufficientData) == "Insufficient data");
    REQUIRE(questionTypeToString(QuestionType::RatingScale) == "Rating Scale");
}
