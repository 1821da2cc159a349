#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "QuestionComparison.h"
#include "TestResult.h"
#include "Tier.h"

namespace synvalidator
{
  /**
   * @brief Counts and tier ratios over the items that fed the overall tier
   *        (tests in flat mode, questions in question mode).
   */
  struct TestSummary
  {
    std::size_t totalTests = 0;
    std::size_t successfulTests = 0;
    std::size_t failedTests = 0;
    double tier1Ratio = 0.0;
    double tier2Ratio = 0.0;

    bool operator==(const TestSummary& rhs) const
    {
      return totalTests == rhs.totalTests &&
        successfulTests == rhs.successfulTests &&
        failedTests == rhs.failedTests &&
        tier1Ratio == rhs.tier1Ratio &&
        tier2Ratio == rhs.tier2Ratio;
    }
  };

  /**
   * @class ValidationReport
   * @brief Final outcome of one comparison run. Built once by ReportAggregator
   *        and never modified afterwards.
   */
  class ValidationReport
  {
  public:
    ValidationReport(double overallAccuracy,
                     std::optional<Tier> overallTier,
                     bool insufficientData,
                     const TierDistribution& tierDistribution,
                     std::vector<TestResult> tests,
                     std::vector<QuestionComparison> questionComparisons,
                     const TestSummary& testSummary,
                     double syntheticSize,
                     double realSize,
                     std::optional<std::string> inputError)
      : mOverallAccuracy(overallAccuracy),
        mOverallTier(overallTier),
        mInsufficientData(insufficientData),
        mTierDistribution(tierDistribution),
        mTests(std::move(tests)),
        mQuestionComparisons(std::move(questionComparisons)),
        mTestSummary(testSummary),
        mSyntheticSize(syntheticSize),
        mRealSize(realSize),
        mInputError(std::move(inputError))
    {}

    double getOverallAccuracy() const
    {
      return mOverallAccuracy;
    }

    /**
     * @brief Absent when no item qualified; rendered as "N/A".
     */
    const std::optional<Tier>& getOverallTier() const
    {
      return mOverallTier;
    }

    bool isInsufficientData() const
    {
      return mInsufficientData;
    }

    const TierDistribution& getTierDistribution() const
    {
      return mTierDistribution;
    }

    const std::vector<TestResult>& getTests() const
    {
      return mTests;
    }

    const std::vector<QuestionComparison>& getQuestionComparisons() const
    {
      return mQuestionComparisons;
    }

    const TestSummary& getTestSummary() const
    {
      return mTestSummary;
    }

    double getSyntheticSize() const
    {
      return mSyntheticSize;
    }

    double getRealSize() const
    {
      return mRealSize;
    }

    const std::optional<std::string>& getInputError() const
    {
      return mInputError;
    }

    bool operator==(const ValidationReport& rhs) const
    {
      return mOverallAccuracy == rhs.mOverallAccuracy &&
        mOverallTier == rhs.mOverallTier &&
        mInsufficientData == rhs.mInsufficientData &&
        mTierDistribution == rhs.mTierDistribution &&
        mTests == rhs.mTests &&
        mQuestionComparisons == rhs.mQuestionComparisons &&
        mTestSummary == rhs.mTestSummary &&
        mSyntheticSize == rhs.mSyntheticSize &&
        mRealSize == rhs.mRealSize &&
        mInputError == rhs.mInputError;
    }

  private:
    double mOverallAccuracy;
    std::optional<Tier> mOverallTier;
    bool mInsufficientData;
    TierDistribution mTierDistribution;
    std::vector<TestResult> mTests;
    std::vector<QuestionComparison> mQuestionComparisons;
    TestSummary mTestSummary;
    double mSyntheticSize;
    double mRealSize;
    std::optional<std::string> mInputError;
  };
}
