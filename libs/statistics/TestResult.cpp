#include "TestResult.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace synvalidator
{
  std::string testKindToString(TestKind kind)
  {
    switch (kind)
      {
      case TestKind::ChiSquare:
        return "chi_square";
      case TestKind::KolmogorovSmirnov:
        return "ks_test";
      case TestKind::JensenShannon:
        return "jensen_shannon";
      case TestKind::MannWhitney:
        return "mann_whitney";
      case TestKind::WelchT:
        return "t_test";
      case TestKind::AndersonDarling:
        return "anderson_darling";
      case TestKind::Wasserstein:
        return "wasserstein_distance";
      case TestKind::Correlation:
        return "correlation";
      case TestKind::ErrorMetrics:
        return "error_metrics";
      case TestKind::DistributionSummary:
        return "distribution_summary";
      case TestKind::KullbackLeibler:
        return "kullback_leibler";
      case TestKind::CramerVonMises:
        return "cramer_von_mises";
      case TestKind::SummaryStatistics:
        return "summary_statistics";
      }

    throw std::invalid_argument("Unknown TestKind value");
  }

  const std::vector<TestKind>& allTestKinds()
  {
    static const std::vector<TestKind> kinds = {
      TestKind::ChiSquare,
      TestKind::KolmogorovSmirnov,
      TestKind::JensenShannon,
      TestKind::MannWhitney,
      TestKind::WelchT,
      TestKind::AndersonDarling,
      TestKind::Wasserstein,
      TestKind::Correlation,
      TestKind::ErrorMetrics,
      TestKind::DistributionSummary,
      TestKind::KullbackLeibler,
      TestKind::CramerVonMises,
      TestKind::SummaryStatistics
    };

    return kinds;
  }

  TestKind stringToTestKind(const std::string& name)
  {
    for (TestKind kind : allTestKinds())
      {
        if (testKindToString(kind) == name)
          return kind;
      }

    throw std::invalid_argument("Unknown test identifier: " + name);
  }

  TestResult TestResult::scored(TestKind kind,
                                std::vector<Statistic> statistics,
                                double matchScore,
                                const TierClassifier& classifier)
  {
    if (!std::isfinite(matchScore))
      return failed(kind, "match score is not a finite number");

    TestResult result(kind);
    result.mStatistics = std::move(statistics);
    const double clamped = std::clamp(matchScore, 0.0, 1.0);
    result.mMatchScore = clamped;
    result.mTier = classifier.classify(clamped);
    return result;
  }

  TestResult TestResult::failed(TestKind kind, const std::string& error)
  {
    TestResult result(kind);
    result.mError = error;
    return result;
  }

  std::optional<double> TestResult::getStatistic(const std::string& name) const
  {
    auto it = std::find_if(mStatistics.begin(), mStatistics.end(),
                           [&name](const Statistic& s) { return s.first == name; });
    if (it == mStatistics.end())
      return std::nullopt;

    return it->second;
  }

  bool TestResult::operator==(const TestResult& rhs) const
  {
    return mKind == rhs.mKind &&
      mStatistics == rhs.mStatistics &&
      mMatchScore == rhs.mMatchScore &&
      mTier == rhs.mTier &&
      mError == rhs.mError;
  }
}
