#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>
#include "ComparisonException.h"

namespace synvalidator
{
  /**
   * @brief Scale non-negative weights so they sum to 1.
   * @throws ComputationError on a negative weight or a zero total
   */
  inline std::vector<double> normalizeWeights(const std::vector<double>& weights,
                                              const std::string& side)
  {
    double total = 0.0;
    for (double w : weights)
      {
        if (w < 0.0)
          throw ComputationError(side + " distribution has a negative weight");

        total += w;
      }

    if (!(total > 0.0))
      throw ComputationError(side + " distribution sums to zero");

    std::vector<double> p;
    p.reserve(weights.size());
    for (double w : weights)
      p.push_back(w / total);

    return p;
  }

  /**
   * @brief Extend both vectors to the longer length with the given fill value.
   */
  inline void padToCommonLength(std::vector<double>& p, std::vector<double>& q, double fill)
  {
    const std::size_t n = std::max(p.size(), q.size());
    p.resize(n, fill);
    q.resize(n, fill);
  }
}
