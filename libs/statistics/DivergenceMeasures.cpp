#include "DivergenceMeasures.h"
#include <algorithm>
#include <cmath>
#include "ComparisonException.h"
#include "ProbabilityVector.h"
#include "SampleStatistics.h"

namespace synvalidator
{
  namespace
  {
    double relativeEntropyBase2(const std::vector<double>& p, const std::vector<double>& m)
    {
      double sum = 0.0;
      for (std::size_t i = 0; i < p.size(); ++i)
        {
          if (p[i] > 0.0)
            sum += p[i] * std::log2(p[i] / m[i]);
        }

      return sum;
    }
  }

  JensenShannonOutcome DivergenceMeasures::jensenShannon(const std::vector<double>& synthetic,
                                                         const std::vector<double>& real)
  {
    std::vector<double> p = normalizeWeights(synthetic, "jensen_shannon: synthetic");
    std::vector<double> q = normalizeWeights(real, "jensen_shannon: real");
    padToCommonLength(p, q, 0.0);

    std::vector<double> m(p.size());
    for (std::size_t i = 0; i < p.size(); ++i)
      m[i] = (p[i] + q[i]) / 2.0;

    const double divergence = std::clamp(0.5 * relativeEntropyBase2(p, m) +
                                         0.5 * relativeEntropyBase2(q, m),
                                         0.0, 1.0);

    return JensenShannonOutcome{ divergence, std::sqrt(divergence) };
  }

  KullbackLeiblerOutcome DivergenceMeasures::kullbackLeibler(const std::vector<double>& synthetic,
                                                             const std::vector<double>& real,
                                                             double epsilon)
  {
    std::vector<double> p = normalizeWeights(synthetic, "kullback_leibler: synthetic");
    std::vector<double> q = normalizeWeights(real, "kullback_leibler: real");
    padToCommonLength(p, q, epsilon);

    double kl = 0.0;
    for (std::size_t i = 0; i < p.size(); ++i)
      {
        const double pi = std::max(p[i], epsilon);
        const double qi = std::max(q[i], epsilon);
        kl += pi * std::log(pi / qi);
      }

    kl = std::max(kl, 0.0);
    return KullbackLeiblerOutcome{ kl, kl / (1.0 + kl) };
  }

  WassersteinOutcome DivergenceMeasures::wasserstein(const std::vector<double>& synthetic,
                                                     const std::vector<double>& real)
  {
    if (synthetic.empty() || real.empty())
      throw ComputationError("wasserstein_distance: both samples must be non-empty");

    const std::vector<double> a = SampleStatistics::sortedCopy(synthetic);
    const std::vector<double> b = SampleStatistics::sortedCopy(real);
    const std::vector<double> support = SampleStatistics::pooledDistinct(a, b);

    double distance = 0.0;
    for (std::size_t i = 0; i + 1 < support.size(); ++i)
      {
        const double width = support[i + 1] - support[i];
        distance += std::fabs(SampleStatistics::ecdf(a, support[i]) -
                              SampleStatistics::ecdf(b, support[i])) * width;
      }

    const double range = support.back() - support.front();
    const double normalized = range > 0.0 ? distance / range : 0.0;

    return WassersteinOutcome{ distance, normalized };
  }
}
