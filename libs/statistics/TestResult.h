#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "Tier.h"

namespace synvalidator
{
  /**
   * @brief Identifies one test of the comparison battery.
   */
  enum class TestKind
  {
    ChiSquare,
    KolmogorovSmirnov,
    JensenShannon,
    MannWhitney,
    WelchT,
    AndersonDarling,
    Wasserstein,
    Correlation,
    ErrorMetrics,
    DistributionSummary,
    KullbackLeibler,
    CramerVonMises,
    SummaryStatistics
  };

  /**
   * @brief Wire identifier of a test ("chi_square", "ks_test", ...).
   */
  std::string testKindToString(TestKind kind);

  /**
   * @brief Inverse of testKindToString.
   * @throws std::invalid_argument on an unknown identifier
   */
  TestKind stringToTestKind(const std::string& name);

  /**
   * @brief Every test kind, in battery order.
   */
  const std::vector<TestKind>& allTestKinds();

  /**
   * @class TestResult
   * @brief Outcome of one test on one ResponseSet pair.
   *
   * A result either carries a match score in [0,1] with its tier, or an error
   * message, never both. Native statistics (p-values, distances...) are kept
   * in insertion order under their wire names.
   */
  class TestResult
  {
  public:
    using Statistic = std::pair<std::string, double>;

    /**
     * @brief A successful result. The score is clamped into [0,1] and then
     *        classified; a non-finite score turns the result into an error.
     */
    static TestResult scored(TestKind kind,
                             std::vector<Statistic> statistics,
                             double matchScore,
                             const TierClassifier& classifier);

    static TestResult failed(TestKind kind, const std::string& error);

    TestKind getKind() const
    {
      return mKind;
    }

    std::string getName() const
    {
      return testKindToString(mKind);
    }

    bool hasScore() const
    {
      return mMatchScore.has_value();
    }

    bool isError() const
    {
      return mError.has_value();
    }

    const std::optional<double>& getMatchScore() const
    {
      return mMatchScore;
    }

    const std::optional<Tier>& getTier() const
    {
      return mTier;
    }

    const std::optional<std::string>& getError() const
    {
      return mError;
    }

    const std::vector<Statistic>& getStatistics() const
    {
      return mStatistics;
    }

    /**
     * @brief Look up a native statistic by name.
     */
    std::optional<double> getStatistic(const std::string& name) const;

    bool operator==(const TestResult& rhs) const;
    bool operator!=(const TestResult& rhs) const
    {
      return !(*this == rhs);
    }

  private:
    explicit TestResult(TestKind kind)
      : mKind(kind)
    {}

    TestKind mKind;
    std::vector<Statistic> mStatistics;
    std::optional<double> mMatchScore;
    std::optional<Tier> mTier;
    std::optional<std::string> mError;
  };
}
