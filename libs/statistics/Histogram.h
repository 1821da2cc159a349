#pragma once

#include <cstddef>
#include <vector>

namespace synvalidator
{
  /**
   * @brief Bin counts of two samples over one set of equal-width edges.
   */
  struct BinnedPair
  {
    std::vector<double> edges;
    std::vector<double> syntheticCounts;
    std::vector<double> realCounts;
  };

  /**
   * @class CommonHistogram
   * @brief Bins two numeric samples on common equal-width edges spanning their
   *        combined range.
   *
   * The bin count is the number of distinct pooled values, capped at maxBins
   * and never below 2. The top edge falls in the last bin. Bins that are empty
   * in both samples are removed from the counts (edges are left intact).
   */
  class CommonHistogram
  {
  public:
    explicit CommonHistogram(std::size_t maxBins)
      : mMaxBins(maxBins)
    {}

    /**
     * @throws ComputationError when either sample is empty, when the combined
     *         range is zero, or when fewer than two occupied bins remain
     */
    BinnedPair bin(const std::vector<double>& synthetic,
                   const std::vector<double>& real) const;

    std::size_t getMaxBins() const
    {
      return mMaxBins;
    }

  private:
    std::size_t mMaxBins;
  };
}
