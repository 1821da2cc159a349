#pragma once

#include <vector>

namespace synvalidator
{
  class ResponseSet;

  struct CorrelationOutcome
  {
    double pearsonR;
    double pearsonP;
    double spearmanR;
    double spearmanP;
    double averageCorrelation;
  };

  struct ErrorMetricsOutcome
  {
    double mae;
    double rmse;
    double normalizedMae;
    double normalizedRmse;
  };

  struct MomentSummary
  {
    double mean = 0.0;
    double median = 0.0;
    double stdDev = 0.0;
  };

  struct DistributionSummaryOutcome
  {
    MomentSummary synthetic;
    MomentSummary real;
    double meanDifference;
    double medianDifference;
    double stdDifference;
    double averageRelativeDifference;
  };

  struct SummaryStatisticsOutcome
  {
    double syntheticMean;
    double realMean;
    double syntheticStd;
    double realStd;
    double normalizedMeanDiff;
    double normalizedStdDiff;
  };

  /**
   * @class AgreementMetrics
   * @brief Paired and moment based agreement between two samples.
   */
  class AgreementMetrics
  {
  public:
    /**
     * @brief Pearson and Spearman correlation of two paired sequences, with
     *        two-sided p-values from the t distribution on n - 2 degrees of freedom.
     *
     * @throws ComputationError unless both sequences have the same length, at
     *         least 3 pairs and non-zero variance
     */
    static CorrelationOutcome correlation(const std::vector<double>& synthetic,
                                          const std::vector<double>& real);

    /**
     * @brief Mean absolute and root mean squared error of paired sequences,
     *        also normalised by the combined mean magnitude
     *        (sum|s| + sum|r|) / (2n).
     *
     * @throws ComputationError on unequal or zero length, or when every value
     *         on both sides is 0
     */
    static ErrorMetricsOutcome errorMetrics(const std::vector<double>& synthetic,
                                            const std::vector<double>& real);

    /**
     * @brief Mean, median and population standard deviation of each side and
     *        their relative differences |a - b| / max(|a|, |b|) (0 when both are 0).
     *
     * An empty side contributes zeros. Never throws.
     */
    static DistributionSummaryOutcome distributionSummary(const std::vector<double>& synthetic,
                                                          const std::vector<double>& real);

    /**
     * @brief Compare reported MEAN and STD summary statistics. Each absolute
     *        difference is divided by the average magnitude of the two values
     *        (0 when both are 0). A missing STD counts as 0.
     *
     * @throws ComputationError if either side carries no MEAN
     */
    static SummaryStatisticsOutcome summaryStatistics(const ResponseSet& synthetic,
                                                      const ResponseSet& real);
  };
}
