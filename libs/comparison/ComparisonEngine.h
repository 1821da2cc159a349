#pragma once

#include <vector>
#include "ComparisonConfiguration.h"
#include "IComparisonObserver.h"
#include "QuestionComparator.h"
#include "QuestionComparison.h"
#include "ReportAggregator.h"
#include "ResponseSet.h"
#include "TestBattery.h"
#include "ValidationReport.h"

namespace synvalidator
{
  /**
   * @class ComparisonEngine
   * @brief Entry points of the comparison core.
   *
   * The engine holds its configuration and a non-owning observer pointer, both
   * read-only after construction, so a single instance can serve concurrent
   * callers. None of the entry points throws for bad data: unusable pairs end
   * up in the report as input errors or Insufficient data questions.
   */
  class ComparisonEngine
  {
  public:
    /**
     * @param observer notified of every test, question and report; may be
     *        nullptr. Must outlive the engine.
     */
    explicit ComparisonEngine(const ComparisonConfiguration& config,
                              diagnostics::IComparisonObserver* observer = nullptr);

    /**
     * @brief Flat mode: one synthetic and one real ResponseSet, compared with
     *        the flat numeric or flat categorical battery.
     */
    ValidationReport compareSamples(const ResponseSet& synthetic, const ResponseSet& real) const;

    /**
     * @brief Question mode over pairs that are already matched.
     *
     * Besides the per-question results, the report's tests hold the flat
     * battery run over every pair pooled together (see comparePooled).
     */
    ValidationReport compareQuestions(const std::vector<QuestionResponses>& questions) const;

    /**
     * @brief Survey mode: match the two question lists by question id.
     *
     * Ids are visited in sorted order. A question only one side has is
     * reported as Unmatched. If an id repeats within one list the last entry
     * wins; questions with an empty id are ignored.
     */
    ValidationReport compareSurveys(const std::vector<SurveyQuestion>& synthetic,
                                    const std::vector<SurveyQuestion>& real) const;

    const ComparisonConfiguration& getConfiguration() const
    {
      return mConfig;
    }

  private:
    QuestionComparison compareOne(const QuestionResponses& question) const;

    /**
     * @brief Sum the option counts of the categorical pairs by label and run
     *        the flat categorical battery on the totals. When no categorical
     *        pair has counts on both sides, the observations of the numeric
     *        pairs are concatenated and run through the flat numeric battery
     *        instead. Pairs mixing numeric and categorical data are skipped.
     */
    std::vector<TestResult> comparePooled(const std::vector<QuestionResponses>& pairs) const;
    ValidationReport finish(ValidationReport report) const;

    ComparisonConfiguration mConfig;
    TestBattery mBattery;
    QuestionComparator mComparator;
    ReportAggregator mAggregator;
    diagnostics::IComparisonObserver* mObserver;
  };
}
