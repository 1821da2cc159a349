#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <limits>
#include <sstream>
#include <rapidjson/document.h>
#include "ComparisonEngine.h"
#include "ReportSerializer.h"

using Catch::Approx;
using namespace synvalidator;
using synvalidator::reporting::ReportSerializer;

namespace
{
    rapidjson::Document parse(const std::string& json)
    {
        rapidjson::Document doc;
        doc.Parse(json.c_str());
        REQUIRE_FALSE(doc.HasParseError());
        REQUIRE(doc.IsObject());
        return doc;
    }
}

TEST_CASE("ReportSerializer flat report", "[ReportSerializer]")
{
    ComparisonEngine engine{ComparisonConfiguration()};
    auto report = engine.compareSamples(ResponseSet::fromCountVector({42, 33, 18, 7}),
                                        ResponseSet::fromCountVector({40, 35, 20, 5}));

    auto doc = parse(ReportSerializer::toJson(report));

    REQUIRE(doc["overall_accuracy"].GetDouble() == Approx(report.getOverallAccuracy()));
    REQUIRE(std::string(doc["overall_tier"].GetString()) == "TIER_1");
    REQUIRE_FALSE(doc["insufficient_data"].GetBool());
    REQUIRE(doc["synthetic_size"].GetDouble() == 100.0);
    REQUIRE(doc["real_size"].GetDouble() == 100.0);
    REQUIRE_FALSE(doc.HasMember("input_error"));

    const auto& dist = doc["tier_distribution"];
    REQUIRE(dist.MemberCount() == 4);
    REQUIRE(dist["TIER_1"].GetUint64() == 3);
    REQUIRE(dist["TIER_4"].GetUint64() == 0);

    const auto& summary = doc["test_summary"];
    REQUIRE(summary["total_tests"].GetUint64() == 3);
    REQUIRE(summary["successful_tests"].GetUint64() == 3);
    REQUIRE(summary["failed_tests"].GetUint64() == 0);
    REQUIRE(summary["tier_1_ratio"].GetDouble() == Approx(1.0));

    const auto& tests = doc["tests"];
    REQUIRE(tests.Size() == 3);
    REQUIRE(std::string(tests[0u]["test"].GetString()) == "chi_square");
    REQUIRE(std::string(tests[0u]["tier"].GetString()) == "TIER_1");
    REQUIRE(tests[0u]["match_score"].GetDouble() == Approx(0.9086302404653256).margin(1e-6));
    REQUIRE(tests[0u]["dof"].GetDouble() == 3.0);
    REQUIRE(tests[0u].HasMember("chi2"));
    REQUIRE(tests[0u].HasMember("p_value"));
    REQUIRE(tests[1u].HasMember("divergence"));
    REQUIRE(tests[1u].HasMember("distance"));

    REQUIRE(doc["question_comparisons"].IsArray());
    REQUIRE(doc["question_comparisons"].Empty());
}

TEST_CASE("ReportSerializer input error and failed tests", "[ReportSerializer]")
{
    ComparisonEngine engine{ComparisonConfiguration()};

    SECTION("Input error")
    {
        auto report = engine.compareSamples(ResponseSet::fromValues({}), ResponseSet::fromValues({}));
        auto doc = parse(ReportSerializer::toJson(report));

        REQUIRE(std::string(doc["overall_tier"].GetString()) == "N/A");
        REQUIRE(doc["insufficient_data"].GetBool());
        REQUIRE(doc["overall_accuracy"].GetDouble() == 0.0);
        REQUIRE(doc.HasMember("input_error"));
        REQUIRE(doc["tests"].Size() == 3);
    REQUIRE(std::string(doc["tests"][0u]["test"].GetString()) == "chi_square");
    }

    SECTION("Failed test carries error and no score")
    {
        auto report = engine.compareSamples(ResponseSet::fromValues({1, 2, 3, 4}),
                                            ResponseSet::fromValues({1, 2}));
        auto doc = parse(ReportSerializer::toJson(report));

        const auto& tests = doc["tests"];
        REQUIRE(std::string(tests[7u]["test"].GetString()) == "correlation");
        REQUIRE(tests[7u].HasMember("error"));
        REQUIRE_FALSE(tests[7u].HasMember("match_score"));
        REQUIRE_FALSE(tests[7u].HasMember("tier"));
    }
}

TEST_CASE("ReportSerializer writes non-finite numbers as null", "[ReportSerializer]")
{
    TierClassifier classifier;
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    std::vector<TestResult> tests = {
        TestResult::scored(TestKind::WelchT, {{"statistic", nan}, {"p_value", 1.0}, {"df", inf}}, 1.0, classifier)
    };
    ValidationReport report(1.0, Tier::Tier1, false, TierDistribution{1, 0, 0, 0}, tests, {},
                            TestSummary{1, 1, 0, 1.0, 0.0}, nan, 3.0, std::nullopt);

    auto doc = parse(ReportSerializer::toJson(report, true));

    REQUIRE(doc["synthetic_size"].IsNull());
    REQUIRE(doc["real_size"].GetDouble() == 3.0);
    REQUIRE(doc["tests"][0u]["statistic"].IsNull());
    REQUIRE(doc["tests"][0u]["df"].IsNull());
    REQUIRE(doc["tests"][0u]["p_value"].GetDouble() == 1.0);
}

TEST_CASE("ReportSerializer question comparisons", "[ReportSerializer]")
{
    ComparisonEngine engine{ComparisonConfiguration()};

    std::vector<SurveyQuestion> synthetic = {
        SurveyQuestion("Q1", "Satisfaction", ResponseSet::fromCountVector({42, 33, 18, 7})),
        SurveyQuestion("Q2", "Spend", ResponseSet::fromValues({1, 2, 3})),
        SurveyQuestion("Q3", "Only here", ResponseSet::fromCountVector({1, 1}))
    };
    std::vector<SurveyQuestion> real = {
        SurveyQuestion("Q1", "", ResponseSet::fromCountVector({40, 35, 20, 5})),
        SurveyQuestion("Q2", "", ResponseSet::fromCountVector({1, 2}))
    };

    auto report = engine.compareSurveys(synthetic, real);
    std::ostringstream os;
    ReportSerializer::write(report, os, true);
    auto doc = parse(os.str());

    REQUIRE(doc["tests"].Empty());

    const auto& questions = doc["question_comparisons"];
    REQUIRE(questions.Size() == 3);

    const auto& q1 = questions[0u];
    REQUIRE(std::string(q1["question_id"].GetString()) == "Q1");
    REQUIRE(std::string(q1["question_name"].GetString()) == "Satisfaction");
    REQUIRE(std::string(q1["status"].GetString()) == "Compared");
    REQUIRE(std::string(q1["type"].GetString()) == "Rating Scale");
    REQUIRE(std::string(q1["tier"].GetString()) == "TIER_1");
    REQUIRE(q1["match_score"].GetDouble() == Approx(0.9533271931490677).margin(1e-6));
    REQUIRE(q1["synthetic_total"].GetDouble() == 100.0);
    REQUIRE(q1["tests"].Size() == 2);
    REQUIRE(q1["option_comparisons"].Size() == 4);
    REQUIRE(std::string(q1["option_comparisons"][0u]["option"].GetString()) == "1");
    REQUIRE(q1["option_comparisons"][0u]["synthetic_count"].GetDouble() == 42.0);
    REQUIRE(q1["option_comparisons"][0u]["real_count"].GetDouble() == 40.0);

    const auto& q2 = questions[1u];
    REQUIRE(std::string(q2["status"].GetString()) == "Insufficient data");
    REQUIRE(q2["match_score"].IsNull());
    REQUIRE(std::string(q2["tier"].GetString()) == "N/A");
    REQUIRE(q2.HasMember("error"));

    const auto& q3 = questions[2u];
    REQUIRE(std::string(q3["status"].GetString()) == "Unmatched");
    REQUIRE(q3["real_total"].GetDouble() == 0.0);
}
