#pragma once

#include <string>
#include <vector>
#include "ComparisonConfiguration.h"
#include "QuestionComparison.h"
#include "TestBattery.h"

namespace synvalidator
{
  /**
   * @class QuestionComparator
   * @brief Rolls the tests run on one question into a QuestionComparison.
   *
   * Numeric pairs run the numeric question battery on the raw samples.
   * Categorical pairs with options on both sides are aligned by option label
   * and run the categorical question battery. Categorical pairs without
   * options on one side but with reported summary statistics on both sides
   * are compared through their MEAN and STD instead.
   *
   * The question score is the mean score of the tests that did not fail. When
   * every test fails, or the pair is unusable (numeric against categorical,
   * both sides empty), the status is Insufficient data and there is no score.
   */
  class QuestionComparator
  {
  public:
    QuestionComparator(const TestBattery& battery, const BatteryComposition& composition)
      : mBattery(battery),
        mComposition(composition)
    {}

    QuestionComparison compare(const QuestionResponses& question) const;

    /**
     * @brief A question that only one survey contains.
     */
    static QuestionComparison unmatched(const std::string& questionId,
                                        const std::string& questionName,
                                        const ResponseSet& responses,
                                        bool syntheticSide);

    /**
     * @brief Rating Scale if every option label is an integer from 1 to 10,
     *        otherwise Categorical. Labels are read as decimal digits after
     *        trimming, so zero-padded exports ("01" .. "10") count as ratings.
     */
    static QuestionType classifyOptions(const std::vector<OptionComparison>& options);

  private:
    QuestionComparison compareNumeric(const QuestionResponses& question) const;
    QuestionComparison compareCategorical(const QuestionResponses& question) const;
    QuestionComparison compareSummary(const QuestionResponses& question) const;

    QuestionComparison finish(const QuestionResponses& question,
                              std::vector<OptionComparison> options,
                              std::vector<TestResult> tests,
                              QuestionType type,
                              double syntheticTotal,
                              double realTotal) const;

    TestBattery mBattery;
    BatteryComposition mComposition;
  };
}
