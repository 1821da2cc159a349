#pragma once

#include <cstddef>
#include <utility>
#include <vector>
#include "ResponseSet.h"
#include "TestResult.h"
#include "Tier.h"

namespace synvalidator
{
  /**
   * @brief Numeric knobs of the individual tests.
   */
  struct BatterySettings
  {
    /// upper bound on histogram bins for chi-square over numeric samples
    std::size_t maxHistogramBins = 10;

    /// floor applied to probabilities inside Kullback-Leibler
    double klEpsilon = 1.0e-10;
  };

  /**
   * @class TestBattery
   * @brief Runs individual comparison tests on a ResponseSet pair and turns
   *        each outcome into a scored, tiered TestResult.
   *
   * Every test is isolated: ComputationError and any other std::exception
   * raised while computing a test (including Boost.Math domain errors) are
   * caught here and returned as a TestResult carrying the message. Nothing
   * escapes run().
   *
   * Numeric pairs accept every test except summary_statistics. Categorical
   * pairs are aligned on option labels first (options empty on both sides are
   * left out) and accept chi_square, jensen_shannon, kullback_leibler and
   * summary_statistics.
   */
  class TestBattery
  {
  public:
    TestBattery(const TierClassifier& classifier, const BatterySettings& settings)
      : mClassifier(classifier),
        mSettings(settings)
    {}

    TestResult run(TestKind kind, const ResponseSet& synthetic, const ResponseSet& real) const;

    /**
     * @brief Run several tests, results in the order requested.
     */
    std::vector<TestResult> run(const std::vector<TestKind>& kinds,
                                const ResponseSet& synthetic,
                                const ResponseSet& real) const;

    const TierClassifier& getClassifier() const
    {
      return mClassifier;
    }

    const BatterySettings& getSettings() const
    {
      return mSettings;
    }

    /**
     * @brief Aligned count vectors of a categorical pair with options that
     *        are zero on both sides removed.
     */
    static std::pair<std::vector<double>, std::vector<double>>
    occupiedCountVectors(const ResponseSet& synthetic, const ResponseSet& real);

  private:
    using Statistics = std::vector<TestResult::Statistic>;

    double computeNumeric(TestKind kind,
                          const std::vector<double>& synthetic,
                          const std::vector<double>& real,
                          Statistics& stats) const;

    double computeCategorical(TestKind kind,
                              const std::vector<double>& synthetic,
                              const std::vector<double>& real,
                              Statistics& stats) const;

    double computeSummary(const ResponseSet& synthetic,
                          const ResponseSet& real,
                          Statistics& stats) const;

    TierClassifier mClassifier;
    BatterySettings mSettings;
  };
}
