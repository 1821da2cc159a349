#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>
#include <vector>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include <boost/accumulators/statistics/count.hpp>

namespace synvalidator
{
  /**
   * @brief Midranks of a sample together with the sizes of its tie groups.
   *
   * ranks[i] is the average 1-based rank of values[i]; tieGroupSizes holds
   * one entry per distinct value (1 for an untied value).
   */
  struct RankedSample
  {
    std::vector<double> ranks;
    std::vector<std::size_t> tieGroupSizes;
  };

  /**
   * @struct SampleStatistics
   * @brief Descriptive statistics over plain vectors of observations.
   *
   * Empty input yields 0 for every moment, the same convention used by the
   * distribution summary test for an empty side.
   */
  struct SampleStatistics
  {
    static double mean(const std::vector<double>& data)
    {
      if (data.empty())
        return 0.0;

      using namespace boost::accumulators;
      accumulator_set<double, stats<tag::mean>> acc;
      for (double v : data)
        acc(v);

      return boost::accumulators::mean(acc);
    }

    /**
     * @brief Variance with divisor n.
     */
    static double populationVariance(const std::vector<double>& data)
    {
      if (data.size() < 2)
        return 0.0;

      using namespace boost::accumulators;
      accumulator_set<double, stats<tag::variance>> acc;
      for (double v : data)
        acc(v);

      return std::max(0.0, boost::accumulators::variance(acc));
    }

    /**
     * @brief Unbiased variance with divisor n - 1.
     */
    static double sampleVariance(const std::vector<double>& data)
    {
      const std::size_t n = data.size();
      if (n < 2)
        return 0.0;

      return populationVariance(data) * static_cast<double>(n) / static_cast<double>(n - 1);
    }

    static double populationStdDev(const std::vector<double>& data)
    {
      return std::sqrt(populationVariance(data));
    }

    static double median(std::vector<double> data)
    {
      if (data.empty())
        return 0.0;

      std::sort(data.begin(), data.end());
      return medianSorted(data);
    }

    static double medianSorted(const std::vector<double>& sorted)
    {
      if (sorted.empty())
        return 0.0;

      const std::size_t n = sorted.size();
      if (n % 2 == 0)
        return (sorted[n / 2 - 1] + sorted[n / 2]) / 2.0;

      return sorted[n / 2];
    }

    /**
     * @brief True when every observation has the same value (or there are none).
     */
    static bool isConstant(const std::vector<double>& data)
    {
      if (data.empty())
        return true;

      auto mm = std::minmax_element(data.begin(), data.end());
      return *mm.first == *mm.second;
    }

    static double sumOfAbsolute(const std::vector<double>& data)
    {
      double sum = 0.0;
      for (double v : data)
        sum += std::fabs(v);

      return sum;
    }

    /**
     * @brief Average ranks, ties sharing the mean of the ranks they span.
     */
    static RankedSample midranks(const std::vector<double>& values)
    {
      const std::size_t n = values.size();
      std::vector<std::size_t> order(n);
      for (std::size_t i = 0; i < n; ++i)
        order[i] = i;

      std::stable_sort(order.begin(), order.end(),
                       [&values](std::size_t a, std::size_t b) { return values[a] < values[b]; });

      RankedSample ranked;
      ranked.ranks.assign(n, 0.0);

      std::size_t i = 0;
      while (i < n)
        {
          std::size_t j = i + 1;
          while (j < n && values[order[j]] == values[order[i]])
            ++j;

          // positions i..j-1 (0-based) hold ranks i+1..j
          const double avg = (static_cast<double>(i + 1) + static_cast<double>(j)) / 2.0;
          for (std::size_t k = i; k < j; ++k)
            ranked.ranks[order[k]] = avg;

          ranked.tieGroupSizes.push_back(j - i);
          i = j;
        }

      return ranked;
    }

    /**
     * @brief Number of elements of a sorted sample that are <= x.
     */
    static std::size_t countAtMost(const std::vector<double>& sorted, double x)
    {
      return static_cast<std::size_t>(std::upper_bound(sorted.begin(), sorted.end(), x) - sorted.begin());
    }

    /**
     * @brief Number of elements of a sorted sample that are < x.
     */
    static std::size_t countBelow(const std::vector<double>& sorted, double x)
    {
      return static_cast<std::size_t>(std::lower_bound(sorted.begin(), sorted.end(), x) - sorted.begin());
    }

    /**
     * @brief Empirical CDF of a sorted sample evaluated at x.
     */
    static double ecdf(const std::vector<double>& sorted, double x)
    {
      if (sorted.empty())
        return 0.0;

      return static_cast<double>(countAtMost(sorted, x)) / static_cast<double>(sorted.size());
    }

    static std::vector<double> sortedCopy(std::vector<double> data)
    {
      std::sort(data.begin(), data.end());
      return data;
    }

    /**
     * @brief Sorted distinct values of the union of two samples.
     */
    static std::vector<double> pooledDistinct(const std::vector<double>& a, const std::vector<double>& b)
    {
      std::vector<double> pooled;
      pooled.reserve(a.size() + b.size());
      pooled.insert(pooled.end(), a.begin(), a.end());
      pooled.insert(pooled.end(), b.begin(), b.end());
      std::sort(pooled.begin(), pooled.end());
      pooled.erase(std::unique(pooled.begin(), pooled.end()), pooled.end());
      return pooled;
    }
  };
}
