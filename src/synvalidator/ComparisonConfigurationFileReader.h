#pragma once

#include <stdexcept>
#include <string>
#include "ComparisonConfiguration.h"

namespace synvalidator
{
  class ComparisonConfigurationFileReaderException : public std::runtime_error
  {
  public:
    ComparisonConfigurationFileReaderException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~ComparisonConfigurationFileReaderException()
    {}
  };

  /**
   * @class ComparisonConfigurationFileReader
   * @brief Loads a ComparisonConfiguration from a JSON file.
   *
   * Every section and key is optional; anything left out keeps its default.
   *
   *   {
   *     "tier_thresholds": {"tier1": 0.85, "tier2": 0.75, "tier3": 0.50},
   *     "overall_tier":    {"tier1_share": 0.6, "tier2_share": 0.4, "tier3_share": 0.4},
   *     "tests": {"max_histogram_bins": 10, "kl_epsilon": 1e-10},
   *     "batteries": {"flat_numeric": ["ks_test", ...], "flat_categorical": [...],
   *                   "question_categorical": [...], "question_numeric": [...],
   *                   "question_summary": [...]}
   *   }
   */
  class ComparisonConfigurationFileReader
  {
  public:
    explicit ComparisonConfigurationFileReader(const std::string& configFilePath)
      : mConfigFilePath(configFilePath)
    {}

    /**
     * @throws ComparisonConfigurationFileReaderException if the file cannot be
     *         read or parsed, or holds an unknown test name
     * @throws ComparisonConfigurationException if the merged settings are invalid
     */
    ComparisonConfiguration readConfigurationFile() const;

    /**
     * @brief Apply the overrides in a JSON document to the defaults.
     */
    static ComparisonConfiguration parse(const std::string& json);

  private:
    std::string mConfigFilePath;
  };
}
