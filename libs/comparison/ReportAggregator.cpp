#include "ReportAggregator.h"

namespace synvalidator
{
  TestSummary ReportAggregator::summarize(std::size_t total,
                                          std::size_t successful,
                                          const TierDistribution& distribution) const
  {
    TestSummary summary;
    summary.totalTests = total;
    summary.successfulTests = successful;
    summary.failedTests = total - successful;

    if (successful > 0)
      {
        const double n = static_cast<double>(successful);
        summary.tier1Ratio = static_cast<double>(distribution[0]) / n;
        summary.tier2Ratio = static_cast<double>(distribution[1]) / n;
      }

    return summary;
  }

  ValidationReport ReportAggregator::fromTests(std::vector<TestResult> tests,
                                               double syntheticSize,
                                               double realSize) const
  {
    std::vector<Tier> tiers;
    double sum = 0.0;

    for (const auto& t : tests)
      {
        if (t.hasScore())
          {
            sum += *t.getMatchScore();
            tiers.push_back(*t.getTier());
          }
      }

    const TierDistribution distribution = TierClassifier::distribution(tiers);
    const TestSummary summary = summarize(tests.size(), tiers.size(), distribution);
    const bool insufficient = tiers.empty();
    const double accuracy = insufficient ? 0.0 : sum / static_cast<double>(tiers.size());

    return ValidationReport(accuracy,
                            mClassifier.overallTier(distribution),
                            insufficient,
                            distribution,
                            std::move(tests),
                            {},
                            summary,
                            syntheticSize,
                            realSize,
                            std::nullopt);
  }

  ValidationReport ReportAggregator::fromQuestions(std::vector<QuestionComparison> questions,
                                                   double syntheticSize,
                                                   double realSize,
                                                   std::vector<TestResult> pooledTests) const
  {
    std::vector<Tier> tiers;
    double sum = 0.0;
    std::size_t considered = 0;

    for (const auto& q : questions)
      {
        if (q.getStatus() == QuestionStatus::Unmatched)
          continue;

        ++considered;
        if (q.isCompared())
          {
            sum += *q.getMatchScore();
            tiers.push_back(*q.getTier());
          }
      }

    const TierDistribution distribution = TierClassifier::distribution(tiers);
    const TestSummary summary = summarize(considered, tiers.size(), distribution);
    const bool insufficient = tiers.empty();
    const double accuracy = insufficient ? 0.0 : sum / static_cast<double>(tiers.size());

    return ValidationReport(accuracy,
                            mClassifier.overallTier(distribution),
                            insufficient,
                            distribution,
                            std::move(pooledTests),
                            std::move(questions),
                            summary,
                            syntheticSize,
                            realSize,
                            std::nullopt);
  }

  ValidationReport ReportAggregator::fromInputError(const std::string& message,
                                                    double syntheticSize,
                                                    double realSize) const
  {
    return ValidationReport(0.0,
                            std::nullopt,
                            true,
                            TierDistribution{},
                            {},
                            {},
                            TestSummary(),
                            syntheticSize,
                            realSize,
                            message);
  }
}
