#include "AgreementMetrics.h"
#include <algorithm>
#include <cmath>
#include <string>
#include "ComparisonException.h"
#include "DistributionFunctions.h"
#include "ResponseSet.h"
#include "SampleStatistics.h"

namespace synvalidator
{
  namespace
  {
    double pearson(const std::vector<double>& x, const std::vector<double>& y)
    {
      const double mx = SampleStatistics::mean(x);
      const double my = SampleStatistics::mean(y);

      double sxy = 0.0;
      double sxx = 0.0;
      double syy = 0.0;
      for (std::size_t i = 0; i < x.size(); ++i)
        {
          const double dx = x[i] - mx;
          const double dy = y[i] - my;
          sxy += dx * dy;
          sxx += dx * dx;
          syy += dy * dy;
        }

      if (!(sxx > 0.0) || !(syy > 0.0))
        throw ComputationError("correlation: a sequence has zero variance");

      return std::clamp(sxy / std::sqrt(sxx * syy), -1.0, 1.0);
    }

    double correlationPValue(double r, std::size_t n)
    {
      if (std::fabs(r) >= 1.0)
        return 0.0;

      const double df = static_cast<double>(n - 2);
      const double t = r * std::sqrt(df / (1.0 - r * r));
      return DistributionFunctions::studentTTwoSided(t, df);
    }

    double relativeDifference(double a, double b)
    {
      const double denom = std::max(std::fabs(a), std::fabs(b));
      return denom > 0.0 ? std::fabs(a - b) / denom : 0.0;
    }

    double normalizedByAverageMagnitude(double a, double b)
    {
      const double denom = (std::fabs(a) + std::fabs(b)) / 2.0;
      return denom > 0.0 ? std::fabs(a - b) / denom : 0.0;
    }

    MomentSummary summarize(const std::vector<double>& data)
    {
      MomentSummary s;
      if (data.empty())
        return s;

      s.mean = SampleStatistics::mean(data);
      s.median = SampleStatistics::median(data);
      s.stdDev = SampleStatistics::populationStdDev(data);
      return s;
    }
  }

  CorrelationOutcome AgreementMetrics::correlation(const std::vector<double>& synthetic,
                                                   const std::vector<double>& real)
  {
    if (synthetic.size() != real.size())
      throw ComputationError("correlation: sequences differ in length (" +
                             std::to_string(synthetic.size()) + " vs " +
                             std::to_string(real.size()) + ")");

    if (synthetic.size() < 3)
      throw ComputationError("correlation: at least 3 pairs are required");

    const double rp = pearson(synthetic, real);
    const double rs = pearson(SampleStatistics::midranks(synthetic).ranks,
                              SampleStatistics::midranks(real).ranks);
    const double avg = (rp + rs) / 2.0;

    return CorrelationOutcome{ rp, correlationPValue(rp, synthetic.size()),
                               rs, correlationPValue(rs, synthetic.size()),
                               avg };
  }

  ErrorMetricsOutcome AgreementMetrics::errorMetrics(const std::vector<double>& synthetic,
                                                     const std::vector<double>& real)
  {
    if (synthetic.size() != real.size())
      throw ComputationError("error_metrics: sequences differ in length (" +
                             std::to_string(synthetic.size()) + " vs " +
                             std::to_string(real.size()) + ")");

    if (synthetic.empty())
      throw ComputationError("error_metrics: sequences are empty");

    const double n = static_cast<double>(synthetic.size());
    double absSum = 0.0;
    double sqSum = 0.0;
    for (std::size_t i = 0; i < synthetic.size(); ++i)
      {
        const double diff = synthetic[i] - real[i];
        absSum += std::fabs(diff);
        sqSum += diff * diff;
      }

    const double mae = absSum / n;
    const double rmse = std::sqrt(sqSum / n);
    const double magnitude = (SampleStatistics::sumOfAbsolute(synthetic) +
                              SampleStatistics::sumOfAbsolute(real)) / (2.0 * n);

    if (!(magnitude > 0.0))
      throw ComputationError("error_metrics: every value is zero, cannot normalise");

    return ErrorMetricsOutcome{ mae, rmse, mae / magnitude, rmse / magnitude };
  }

  DistributionSummaryOutcome AgreementMetrics::distributionSummary(const std::vector<double>& synthetic,
                                                                   const std::vector<double>& real)
  {
    DistributionSummaryOutcome outcome;
    outcome.synthetic = summarize(synthetic);
    outcome.real = summarize(real);
    outcome.meanDifference = relativeDifference(outcome.synthetic.mean, outcome.real.mean);
    outcome.medianDifference = relativeDifference(outcome.synthetic.median, outcome.real.median);
    outcome.stdDifference = relativeDifference(outcome.synthetic.stdDev, outcome.real.stdDev);
    outcome.averageRelativeDifference =
      (outcome.meanDifference + outcome.medianDifference + outcome.stdDifference) / 3.0;
    return outcome;
  }

  SummaryStatisticsOutcome AgreementMetrics::summaryStatistics(const ResponseSet& synthetic,
                                                               const ResponseSet& real)
  {
    const auto synMean = synthetic.getSummaryStatistic("MEAN");
    const auto realMean = real.getSummaryStatistic("MEAN");

    if (!synMean)
      throw ComputationError("summary_statistics: synthetic side reports no MEAN");
    if (!realMean)
      throw ComputationError("summary_statistics: real side reports no MEAN");

    const double synStd = synthetic.getSummaryStatistic("STD").value_or(0.0);
    const double realStd = real.getSummaryStatistic("STD").value_or(0.0);

    return SummaryStatisticsOutcome{ *synMean, *realMean, synStd, realStd,
                                     normalizedByAverageMagnitude(*synMean, *realMean),
                                     normalizedByAverageMagnitude(synStd, realStd) };
  }
}
