#pragma once

#include <string>
#include <vector>
#include "QuestionComparison.h"
#include "TestResult.h"
#include "Tier.h"
#include "ValidationReport.h"

namespace synvalidator
{
  /**
   * @class ReportAggregator
   * @brief Builds a ValidationReport from per-test or per-question results.
   *
   * Only qualifying items contribute to the overall accuracy, the tier
   * distribution and the overall tier: tests that produced a score (flat mode)
   * or questions with status Compared (question mode). With no qualifying item
   * the report has accuracy 0, no overall tier and insufficientData set.
   */
  class ReportAggregator
  {
  public:
    explicit ReportAggregator(const TierClassifier& classifier)
      : mClassifier(classifier)
    {}

    ValidationReport fromTests(std::vector<TestResult> tests,
                               double syntheticSize,
                               double realSize) const;

    /**
     * @brief Unmatched questions are carried in the report but are neither
     *        qualifying nor counted as failed.
     *
     * pooledTests are the flat-battery results over all matched questions
     * pooled together. They are carried in the report's tests for reference
     * and take no part in accuracy, tiers or the test summary.
     */
    ValidationReport fromQuestions(std::vector<QuestionComparison> questions,
                                   double syntheticSize,
                                   double realSize,
                                   std::vector<TestResult> pooledTests = {}) const;

    /**
     * @brief Report for a pair that could not be compared at all.
     */
    ValidationReport fromInputError(const std::string& message,
                                    double syntheticSize,
                                    double realSize) const;

  private:
    TestSummary summarize(std::size_t total,
                          std::size_t successful,
                          const TierDistribution& distribution) const;

    TierClassifier mClassifier;
  };
}
