#include "ResponseSet.h"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <set>
#include <stdexcept>
#include <boost/algorithm/string.hpp>
#include "ComparisonException.h"

namespace synvalidator
{
  namespace
  {
    const std::set<std::string> kSummaryLabels = {
      "MEAN", "MEDIAN", "STD", "TOTAL_RESPONSES"
    };
  }

  ResponseSet ResponseSet::fromValues(std::vector<double> values)
  {
    for (double v : values)
      {
        if (!std::isfinite(v))
          throw std::domain_error("ResponseSet: numeric observations must be finite");
      }

    ResponseSet set(Kind::Numeric);
    set.mValues = std::move(values);
    return set;
  }

  ResponseSet ResponseSet::fromCounts(const std::vector<OptionCount>& counts)
  {
    ResponseSet set(Kind::Categorical);

    for (const auto& entry : counts)
      {
        const std::string& label = entry.first;
        const double count = entry.second;

        if (!std::isfinite(count))
          throw std::domain_error("ResponseSet: count for option '" + label + "' is not finite");

        if (isSummaryStatisticLabel(label))
          {
            set.mSummaryStatistics[boost::algorithm::to_upper_copy(label)] = count;
            continue;
          }

        if (count < 0.0)
          throw std::domain_error("ResponseSet: count for option '" + label + "' is negative");

        auto it = std::find_if(set.mOptionCounts.begin(), set.mOptionCounts.end(),
                               [&label](const OptionCount& oc) { return oc.first == label; });
        if (it == set.mOptionCounts.end())
          set.mOptionCounts.emplace_back(label, count);
        else
          it->second += count;
      }

    return set;
  }

  ResponseSet ResponseSet::fromCountVector(const std::vector<double>& counts)
  {
    std::vector<OptionCount> labelled;
    labelled.reserve(counts.size());
    for (std::size_t i = 0; i < counts.size(); ++i)
      labelled.emplace_back(std::to_string(i + 1), counts[i]);

    return fromCounts(labelled);
  }

  std::optional<double> ResponseSet::getSummaryStatistic(const std::string& name) const
  {
    auto it = mSummaryStatistics.find(boost::algorithm::to_upper_copy(name));
    if (it == mSummaryStatistics.end())
      return std::nullopt;

    return it->second;
  }

  double ResponseSet::getCount(const std::string& option) const
  {
    auto it = std::find_if(mOptionCounts.begin(), mOptionCounts.end(),
                           [&option](const OptionCount& oc) { return oc.first == option; });
    return it == mOptionCounts.end() ? 0.0 : it->second;
  }

  double ResponseSet::total() const
  {
    if (isNumeric())
      return static_cast<double>(mValues.size());

    return std::accumulate(mOptionCounts.begin(), mOptionCounts.end(), 0.0,
                           [](double acc, const OptionCount& oc) { return acc + oc.second; });
  }

  std::size_t ResponseSet::size() const
  {
    return isNumeric() ? mValues.size() : mOptionCounts.size();
  }

  bool ResponseSet::empty() const
  {
    if (isNumeric())
      return mValues.empty();

    return mOptionCounts.empty() && mSummaryStatistics.empty();
  }

  bool ResponseSet::isSummaryStatisticLabel(const std::string& label)
  {
    return kSummaryLabels.count(boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(label))) > 0;
  }

  bool ResponseSet::operator==(const ResponseSet& rhs) const
  {
    return mKind == rhs.mKind &&
      mValues == rhs.mValues &&
      mOptionCounts == rhs.mOptionCounts &&
      mSummaryStatistics == rhs.mSummaryStatistics;
  }

  std::vector<OptionComparison> alignOptions(const ResponseSet& synthetic,
                                             const ResponseSet& real)
  {
    std::vector<OptionComparison> aligned;
    aligned.reserve(synthetic.size() + real.size());

    for (const auto& oc : synthetic.getOptionCounts())
      aligned.push_back(OptionComparison{oc.first, oc.second, real.getCount(oc.first)});

    for (const auto& oc : real.getOptionCounts())
      {
        auto seen = std::find_if(aligned.begin(), aligned.end(),
                                 [&oc](const OptionComparison& c) { return c.option == oc.first; });
        if (seen == aligned.end())
          aligned.push_back(OptionComparison{oc.first, 0.0, oc.second});
      }

    return aligned;
  }

  void requireComparable(const ResponseSet& synthetic,
                         const ResponseSet& real,
                         const std::string& context)
  {
    if (synthetic.getKind() != real.getKind())
      throw InputError(context + ": cannot compare numeric responses with categorical responses");

    if (synthetic.empty() && real.empty())
      throw InputError(context + ": no responses on either side");
  }
}
