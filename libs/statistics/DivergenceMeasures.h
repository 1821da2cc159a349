#pragma once

#include <vector>

namespace synvalidator
{
  struct JensenShannonOutcome
  {
    double divergence;
    double distance;
  };

  struct KullbackLeiblerOutcome
  {
    double divergence;
    double normalizedDivergence;
  };

  struct WassersteinOutcome
  {
    double distance;
    double normalizedDistance;
  };

  /**
   * @class DivergenceMeasures
   * @brief Distances between two distributions.
   *
   * Jensen-Shannon and Kullback-Leibler treat their inputs as weight vectors
   * (option counts, or raw observations used as weights) and normalise them to
   * probability vectors first. Wasserstein works on raw samples.
   */
  class DivergenceMeasures
  {
  public:
    /**
     * @brief Jensen-Shannon divergence with base-2 logarithms, so the result
     *        lies in [0,1]. distance is its square root.
     *
     * The shorter vector is zero padded.
     *
     * @throws ComputationError if either vector has a negative weight or sums to 0
     */
    static JensenShannonOutcome jensenShannon(const std::vector<double>& synthetic,
                                              const std::vector<double>& real);

    /**
     * @brief KL(synthetic || real) in nats. Not symmetric.
     *
     * The shorter vector is padded with epsilon and every probability is
     * clipped to at least epsilon before the logarithm is taken.
     * normalizedDivergence is divergence / (1 + divergence).
     *
     * @throws ComputationError if either vector has a negative weight or sums to 0
     */
    static KullbackLeiblerOutcome kullbackLeibler(const std::vector<double>& synthetic,
                                                  const std::vector<double>& real,
                                                  double epsilon);

    /**
     * @brief First Wasserstein (earth mover's) distance between the empirical
     *        distributions of two samples, i.e. the integral of |F1 - F2|.
     *
     * normalizedDistance divides by the combined range and is 0 when the range is 0.
     *
     * @throws ComputationError if either sample is empty
     */
    static WassersteinOutcome wasserstein(const std::vector<double>& synthetic,
                                          const std::vector<double>& real);
  };
}
