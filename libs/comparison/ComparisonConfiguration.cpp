#include "ComparisonConfiguration.h"
#include <cmath>

namespace synvalidator
{
  namespace
  {
    void requireShare(double share, const char* name)
    {
      if (!(share > 0.0 && share <= 1.0))
        throw ComparisonConfigurationException(std::string("Overall tier proportion ") + name +
                                               " must lie in (0, 1], got " + std::to_string(share));
    }

    void requirePositive(double value, const char* name)
    {
      if (!(value > 0.0) || !std::isfinite(value))
        throw ComparisonConfigurationException(std::string(name) + " must be a positive number, got " +
                                               std::to_string(value));
    }

    void requireNonEmpty(const std::vector<TestKind>& battery, const char* name)
    {
      if (battery.empty())
        throw ComparisonConfigurationException(std::string("Battery '") + name + "' lists no tests");
    }
  }

  BatteryComposition BatteryComposition::defaults()
  {
    BatteryComposition c;

    c.flatNumeric = {
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
      TestKind::CramerVonMises
    };

    c.flatCategorical = {
      TestKind::ChiSquare,
      TestKind::JensenShannon,
      TestKind::KullbackLeibler
    };

    c.questionCategorical = {
      TestKind::ChiSquare,
      TestKind::JensenShannon
    };

    c.questionNumeric = {
      TestKind::ChiSquare,
      TestKind::KolmogorovSmirnov,
      TestKind::MannWhitney,
      TestKind::WelchT,
      TestKind::AndersonDarling,
      TestKind::Wasserstein,
      TestKind::DistributionSummary,
      TestKind::CramerVonMises
    };

    c.questionSummary = {
      TestKind::SummaryStatistics
    };

    return c;
  }

  ComparisonConfiguration::ComparisonConfiguration()
    : mThresholds(),
      mOverallPolicy(),
      mBatterySettings(),
      mComposition(BatteryComposition::defaults())
  {}

  ComparisonConfiguration::ComparisonConfiguration(const TierThresholds& thresholds,
                                                   const OverallTierPolicy& overallPolicy,
                                                   const BatterySettings& batterySettings,
                                                   const BatteryComposition& composition)
    : mThresholds(thresholds),
      mOverallPolicy(overallPolicy),
      mBatterySettings(batterySettings),
      mComposition(composition)
  {
    validate(mThresholds, mOverallPolicy, mBatterySettings, mComposition);
  }

  void ComparisonConfiguration::validate(const TierThresholds& thresholds,
                                         const OverallTierPolicy& overallPolicy,
                                         const BatterySettings& batterySettings,
                                         const BatteryComposition& composition)
  {
    if (!(thresholds.tier3Cutoff >= 0.0 &&
          thresholds.tier3Cutoff < thresholds.tier2Cutoff &&
          thresholds.tier2Cutoff < thresholds.tier1Cutoff &&
          thresholds.tier1Cutoff <= 1.0))
      throw ComparisonConfigurationException("Tier cut points must satisfy 0 <= tier3 < tier2 < tier1 <= 1");

    requireShare(overallPolicy.tier1Share, "tier1");
    requireShare(overallPolicy.tier2Share, "tier2");
    requireShare(overallPolicy.tier3Share, "tier3");

    if (batterySettings.maxHistogramBins < 2)
      throw ComparisonConfigurationException("Histogram bin cap must be at least 2");

    requirePositive(batterySettings.klEpsilon, "Kullback-Leibler epsilon");
    if (batterySettings.klEpsilon >= 1.0)
      throw ComparisonConfigurationException("Kullback-Leibler epsilon must be below 1");

    requireNonEmpty(composition.flatNumeric, "flat_numeric");
    requireNonEmpty(composition.flatCategorical, "flat_categorical");
    requireNonEmpty(composition.questionCategorical, "question_categorical");
    requireNonEmpty(composition.questionNumeric, "question_numeric");
    requireNonEmpty(composition.questionSummary, "question_summary");
  }
}
