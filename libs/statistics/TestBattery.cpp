#include "TestBattery.h"
#include <algorithm>
#include <exception>
#include <string>
#include "AgreementMetrics.h"
#include "ComparisonException.h"
#include "DivergenceMeasures.h"
#include "HypothesisTests.h"

namespace synvalidator
{
  namespace
  {
    ComputationError notApplicable(TestKind kind, const char* what)
    {
      return ComputationError(testKindToString(kind) + " is not applicable to " + what);
    }
  }

  std::pair<std::vector<double>, std::vector<double>>
  TestBattery::occupiedCountVectors(const ResponseSet& synthetic, const ResponseSet& real)
  {
    std::vector<double> syn;
    std::vector<double> rl;

    for (const auto& oc : alignOptions(synthetic, real))
      {
        if (oc.syntheticCount > 0.0 || oc.realCount > 0.0)
          {
            syn.push_back(oc.syntheticCount);
            rl.push_back(oc.realCount);
          }
      }

    return std::make_pair(syn, rl);
  }

  TestResult TestBattery::run(TestKind kind, const ResponseSet& synthetic, const ResponseSet& real) const
  {
    try
      {
        if (synthetic.getKind() != real.getKind())
          throw ComputationError("cannot compare numeric responses with categorical responses");

        Statistics stats;
        double score = 0.0;

        if (kind == TestKind::SummaryStatistics)
          {
            if (!synthetic.isCategorical())
              throw notApplicable(kind, "raw numeric observations");

            score = computeSummary(synthetic, real, stats);
          }
        else if (synthetic.isNumeric())
          {
            score = computeNumeric(kind, synthetic.getValues(), real.getValues(), stats);
          }
        else
          {
            const auto counts = occupiedCountVectors(synthetic, real);
            score = computeCategorical(kind, counts.first, counts.second, stats);
          }

        return TestResult::scored(kind, std::move(stats), score, mClassifier);
      }
    catch (const ComputationError& e)
      {
        return TestResult::failed(kind, e.what());
      }
    catch (const std::exception& e)
      {
        return TestResult::failed(kind, std::string("numerical failure: ") + e.what());
      }
  }

  std::vector<TestResult> TestBattery::run(const std::vector<TestKind>& kinds,
                                           const ResponseSet& synthetic,
                                           const ResponseSet& real) const
  {
    std::vector<TestResult> results;
    results.reserve(kinds.size());

    for (TestKind kind : kinds)
      results.push_back(run(kind, synthetic, real));

    return results;
  }

  double TestBattery::computeNumeric(TestKind kind,
                                     const std::vector<double>& synthetic,
                                     const std::vector<double>& real,
                                     Statistics& stats) const
  {
    switch (kind)
      {
      case TestKind::ChiSquare:
        {
          const auto r = HypothesisTests::chiSquareBinned(synthetic, real, mSettings.maxHistogramBins);
          stats = { {"chi2", r.statistic}, {"p_value", r.pValue}, {"dof", r.degreesOfFreedom} };
          return r.pValue;
        }

      case TestKind::KolmogorovSmirnov:
        {
          const auto r = HypothesisTests::kolmogorovSmirnov(synthetic, real);
          stats = { {"ks_statistic", r.statistic}, {"p_value", r.pValue} };
          return 1.0 - r.statistic;
        }

      case TestKind::JensenShannon:
        {
          const auto r = DivergenceMeasures::jensenShannon(synthetic, real);
          stats = { {"divergence", r.divergence}, {"distance", r.distance} };
          return 1.0 - r.divergence;
        }

      case TestKind::MannWhitney:
        {
          const auto r = HypothesisTests::mannWhitneyU(synthetic, real);
          stats = { {"statistic", r.statistic}, {"p_value", r.pValue} };
          return r.pValue;
        }

      case TestKind::WelchT:
        {
          const auto r = HypothesisTests::welchT(synthetic, real);
          stats = { {"statistic", r.statistic}, {"p_value", r.pValue}, {"df", r.degreesOfFreedom} };
          return r.pValue;
        }

      case TestKind::AndersonDarling:
        {
          const auto r = HypothesisTests::andersonDarling(synthetic, real);
          stats = { {"statistic", r.statistic}, {"standardized_statistic", r.standardizedStatistic},
                    {"p_value", r.pValue} };
          return r.pValue;
        }

      case TestKind::Wasserstein:
        {
          const auto r = DivergenceMeasures::wasserstein(synthetic, real);
          stats = { {"distance", r.distance}, {"normalized_distance", r.normalizedDistance} };
          return 1.0 - std::min(r.normalizedDistance, 1.0);
        }

      case TestKind::Correlation:
        {
          const auto r = AgreementMetrics::correlation(synthetic, real);
          stats = { {"pearson_r", r.pearsonR}, {"pearson_p", r.pearsonP},
                    {"spearman_r", r.spearmanR}, {"spearman_p", r.spearmanP},
                    {"average_correlation", r.averageCorrelation} };
          return (r.averageCorrelation + 1.0) / 2.0;
        }

      case TestKind::ErrorMetrics:
        {
          const auto r = AgreementMetrics::errorMetrics(synthetic, real);
          stats = { {"mae", r.mae}, {"rmse", r.rmse},
                    {"normalized_mae", r.normalizedMae}, {"normalized_rmse", r.normalizedRmse} };
          return 1.0 - std::min(r.normalizedMae, 1.0);
        }

      case TestKind::DistributionSummary:
        {
          const auto r = AgreementMetrics::distributionSummary(synthetic, real);
          stats = { {"synthetic_mean", r.synthetic.mean}, {"synthetic_median", r.synthetic.median},
                    {"synthetic_std", r.synthetic.stdDev}, {"real_mean", r.real.mean},
                    {"real_median", r.real.median}, {"real_std", r.real.stdDev},
                    {"mean_difference", r.meanDifference}, {"median_difference", r.medianDifference},
                    {"std_difference", r.stdDifference} };
          return 1.0 - std::min(r.averageRelativeDifference, 1.0);
        }

      case TestKind::KullbackLeibler:
        {
          const auto r = DivergenceMeasures::kullbackLeibler(synthetic, real, mSettings.klEpsilon);
          stats = { {"divergence", r.divergence}, {"normalized_divergence", r.normalizedDivergence} };
          return 1.0 / (1.0 + r.divergence);
        }

      case TestKind::CramerVonMises:
        {
          const auto r = HypothesisTests::cramerVonMises(synthetic, real);
          stats = { {"statistic", r.statistic}, {"p_value", r.pValue} };
          return r.pValue;
        }

      case TestKind::SummaryStatistics:
        break;
      }

    throw notApplicable(kind, "raw numeric observations");
  }

  double TestBattery::computeCategorical(TestKind kind,
                                         const std::vector<double>& synthetic,
                                         const std::vector<double>& real,
                                         Statistics& stats) const
  {
    switch (kind)
      {
      case TestKind::ChiSquare:
        {
          const auto r = HypothesisTests::chiSquareHomogeneity(synthetic, real);
          stats = { {"chi2", r.statistic}, {"p_value", r.pValue}, {"dof", r.degreesOfFreedom} };
          return r.pValue;
        }

      case TestKind::JensenShannon:
      case TestKind::KullbackLeibler:
        return computeNumeric(kind, synthetic, real, stats);

      default:
        break;
      }

    throw notApplicable(kind, "categorical option counts");
  }

  double TestBattery::computeSummary(const ResponseSet& synthetic,
                                     const ResponseSet& real,
                                     Statistics& stats) const
  {
    const auto r = AgreementMetrics::summaryStatistics(synthetic, real);
    stats = { {"synthetic_mean", r.syntheticMean}, {"real_mean", r.realMean},
              {"synthetic_std", r.syntheticStd}, {"real_std", r.realStd},
              {"normalized_mean_diff", r.normalizedMeanDiff},
              {"normalized_std_diff", r.normalizedStdDiff} };
    return 1.0 - std::min((r.normalizedMeanDiff + r.normalizedStdDiff) / 2.0, 1.0);
  }
}
