#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace synvalidator
{
  /**
   * @class ResponseSet
   * @brief One side (synthetic or real) of a survey comparison.
   *
   * A ResponseSet is either an ordered sequence of numeric observations
   * (ratings, totals...) or an ordered mapping from option label to response
   * count. Categorical sets may also carry the summary statistics that some
   * survey exports report instead of (or next to) per-option counts; labels
   * MEAN, MEDIAN, STD and TOTAL_RESPONSES (any case) are moved out of the
   * option list into the summary statistics on construction.
   *
   * ResponseSet is an immutable value type.
   */
  class ResponseSet
  {
  public:
    enum class Kind
    {
      Numeric,
      Categorical
    };

    using OptionCount = std::pair<std::string, double>;

    /**
     * @brief Numeric observations.
     * @throws std::domain_error if any observation is NaN or infinite
     */
    static ResponseSet fromValues(std::vector<double> values);

    /**
     * @brief Option label -> count, in the order given. Repeated labels are
     *        merged by summing their counts.
     * @throws std::domain_error on a negative or non-finite count, or a
     *         non-finite summary statistic
     */
    static ResponseSet fromCounts(const std::vector<OptionCount>& counts);

    /**
     * @brief Positional counts; option labels are "1", "2", ... "K".
     */
    static ResponseSet fromCountVector(const std::vector<double>& counts);

    Kind getKind() const
    {
      return mKind;
    }

    bool isNumeric() const
    {
      return mKind == Kind::Numeric;
    }

    bool isCategorical() const
    {
      return mKind == Kind::Categorical;
    }

    const std::vector<double>& getValues() const
    {
      return mValues;
    }

    const std::vector<OptionCount>& getOptionCounts() const
    {
      return mOptionCounts;
    }

    const std::map<std::string, double>& getSummaryStatistics() const
    {
      return mSummaryStatistics;
    }

    /**
     * @brief Summary statistic by upper-case name (MEAN, MEDIAN, STD, TOTAL_RESPONSES).
     */
    std::optional<double> getSummaryStatistic(const std::string& name) const;

    bool hasSummaryStatistics() const
    {
      return !mSummaryStatistics.empty();
    }

    /**
     * @brief Count recorded for an option label, 0 when the label is absent.
     */
    double getCount(const std::string& option) const;

    /**
     * @brief Sum of option counts (categorical) or number of observations (numeric).
     */
    double total() const;

    /**
     * @brief Number of observations (numeric) or options (categorical).
     */
    std::size_t size() const;

    /**
     * @brief True when the set carries no observations, no options and no
     *        summary statistics.
     */
    bool empty() const;

    /**
     * @brief True for the reserved summary-statistic labels, compared case-insensitively.
     */
    static bool isSummaryStatisticLabel(const std::string& label);

    bool operator==(const ResponseSet& rhs) const;

  private:
    explicit ResponseSet(Kind kind)
      : mKind(kind)
    {}

    Kind mKind;
    std::vector<double> mValues;
    std::vector<OptionCount> mOptionCounts;
    std::map<std::string, double> mSummaryStatistics;
  };

  /**
   * @brief Synthetic versus real count of one answer option.
   */
  struct OptionComparison
  {
    std::string option;
    double syntheticCount = 0.0;
    double realCount = 0.0;

    bool operator==(const OptionComparison& rhs) const
    {
      return option == rhs.option &&
        syntheticCount == rhs.syntheticCount &&
        realCount == rhs.realCount;
    }
  };

  /**
   * @brief Align two categorical ResponseSets on the union of their option
   *        labels: synthetic labels first in their order, then labels only the
   *        real side has. A label missing on one side counts as 0.
   */
  std::vector<OptionComparison> alignOptions(const ResponseSet& synthetic,
                                             const ResponseSet& real);

  /**
   * @brief Check that a pair can be compared at all.
   * @throws InputError when the kinds differ or both sides are empty; the
   *         message is prefixed with context
   */
  void requireComparable(const ResponseSet& synthetic,
                         const ResponseSet& real,
                         const std::string& context);
}
