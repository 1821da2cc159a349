#pragma once

namespace synvalidator
{
  /**
   * @struct DistributionFunctions
   * @brief Tail probabilities used by the hypothesis tests.
   *
   * Chi-square, Student t and normal tails, and the Bessel function in the
   * Cramer-von Mises limit, delegate to Boost.Math and therefore throw
   * std::domain_error for invalid parameters (df <= 0).
   */
  struct DistributionFunctions
  {
    /**
     * @brief P(X > x) for X ~ chi-square(df). Returns 1 for x <= 0.
     */
    static double chiSquaredSurvival(double x, double degreesOfFreedom);

    /**
     * @brief Two-sided p-value 2 * P(T > |t|) for T ~ Student t(df).
     */
    static double studentTTwoSided(double t, double degreesOfFreedom);

    /**
     * @brief P(Z > z) for Z ~ N(0,1).
     */
    static double standardNormalSurvival(double z);

    /**
     * @brief Kolmogorov distribution tail
     *
     *   Q(lambda) = 2 * sum_{j>=1} (-1)^(j-1) exp(-2 j^2 lambda^2)
     *
     * Q is 1 for lambda below 1e-3 where the series is not useful.
     */
    static double kolmogorovSurvival(double lambda);

    /**
     * @brief Asymptotic two-sample Kolmogorov-Smirnov p-value with Stephens'
     *        small-sample correction applied to the effective size
     *        en = n1 * n2 / (n1 + n2).
     */
    static double kolmogorovSmirnovPValue(double dStatistic, double n1, double n2);

    /**
     * @brief Limiting distribution of the one-sample Cramer-von Mises
     *        statistic (Csorgo and Faraway 1996, eq. 1.3), summed until a term
     *        drops below 1e-7. Returns 0 for x <= 0.
     */
    static double cramerVonMisesLimitingCdf(double x);

    /**
     * @brief Asymptotic p-value of the two-sample Cramer-von Mises statistic
     *        T for sample sizes n and m. T is standardised with its exact mean
     *        and variance under H0 and referred to the limiting distribution.
     */
    static double cramerVonMisesPValue(double t, double n, double m);
  };
}
