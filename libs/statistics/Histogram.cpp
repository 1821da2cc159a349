#include "Histogram.h"
#include <algorithm>
#include "ComparisonException.h"
#include "SampleStatistics.h"

namespace synvalidator
{
  namespace
  {
    std::vector<double> countInto(const std::vector<double>& sample,
                                  double lo,
                                  double width,
                                  std::size_t numBins)
    {
      std::vector<double> counts(numBins, 0.0);
      for (double v : sample)
        {
          std::size_t k = static_cast<std::size_t>((v - lo) / width);
          if (k >= numBins)
            k = numBins - 1;

          counts[k] += 1.0;
        }

      return counts;
    }
  }

  BinnedPair CommonHistogram::bin(const std::vector<double>& synthetic,
                                  const std::vector<double>& real) const
  {
    if (synthetic.empty() || real.empty())
      throw ComputationError("CommonHistogram: both samples must be non-empty");

    const std::vector<double> distinct = SampleStatistics::pooledDistinct(synthetic, real);
    const double lo = distinct.front();
    const double hi = distinct.back();

    if (!(hi > lo))
      throw ComputationError("CommonHistogram: combined range is zero, cannot form bins");

    const std::size_t numBins = std::max<std::size_t>(2, std::min(mMaxBins, distinct.size()));
    const double width = (hi - lo) / static_cast<double>(numBins);

    BinnedPair result;
    result.edges.reserve(numBins + 1);
    for (std::size_t i = 0; i < numBins; ++i)
      result.edges.push_back(lo + width * static_cast<double>(i));
    result.edges.push_back(hi);

    const std::vector<double> syn = countInto(synthetic, lo, width, numBins);
    const std::vector<double> rl = countInto(real, lo, width, numBins);

    for (std::size_t i = 0; i < numBins; ++i)
      {
        if (syn[i] + rl[i] > 0.0)
          {
            result.syntheticCounts.push_back(syn[i]);
            result.realCounts.push_back(rl[i]);
          }
      }

    if (result.syntheticCounts.size() < 2)
      throw ComputationError("CommonHistogram: fewer than two occupied bins");

    return result;
  }
}
