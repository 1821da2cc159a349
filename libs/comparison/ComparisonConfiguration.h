#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include "TestBattery.h"
#include "TestResult.h"
#include "Tier.h"

namespace synvalidator
{
  class ComparisonConfigurationException : public std::runtime_error
  {
  public:
    ComparisonConfigurationException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~ComparisonConfigurationException()
    {}
  };

  /**
   * @brief Which tests run in each comparison mode.
   */
  struct BatteryComposition
  {
    /// flat mode, raw numeric samples
    std::vector<TestKind> flatNumeric;

    /// flat mode, option counts
    std::vector<TestKind> flatCategorical;

    /// question mode, option counts
    std::vector<TestKind> questionCategorical;

    /// question mode, raw numeric samples
    std::vector<TestKind> questionNumeric;

    /// question mode, questions that only report MEAN / MEDIAN / STD
    std::vector<TestKind> questionSummary;

    static BatteryComposition defaults();
  };

  /**
   * @class ComparisonConfiguration
   * @brief Read-only settings shared by every comparison a ComparisonEngine runs.
   *
   * The constructor validates its arguments so an existing configuration is
   * always usable.
   */
  class ComparisonConfiguration
  {
  public:
    /**
     * @brief Default cut points, proportions, test settings and batteries.
     */
    ComparisonConfiguration();

    /**
     * @throws ComparisonConfigurationException if any setting is invalid
     */
    ComparisonConfiguration(const TierThresholds& thresholds,
                            const OverallTierPolicy& overallPolicy,
                            const BatterySettings& batterySettings,
                            const BatteryComposition& composition);

    const TierThresholds& getTierThresholds() const
    {
      return mThresholds;
    }

    const OverallTierPolicy& getOverallTierPolicy() const
    {
      return mOverallPolicy;
    }

    const BatterySettings& getBatterySettings() const
    {
      return mBatterySettings;
    }

    const BatteryComposition& getBatteryComposition() const
    {
      return mComposition;
    }

    TierClassifier makeTierClassifier() const
    {
      return TierClassifier(mThresholds, mOverallPolicy);
    }

    /**
     * @brief Check a set of settings without constructing a configuration.
     * @throws ComparisonConfigurationException describing the first problem found
     */
    static void validate(const TierThresholds& thresholds,
                         const OverallTierPolicy& overallPolicy,
                         const BatterySettings& batterySettings,
                         const BatteryComposition& composition);

  private:
    TierThresholds mThresholds;
    OverallTierPolicy mOverallPolicy;
    BatterySettings mBatterySettings;
    BatteryComposition mComposition;
  };
}
