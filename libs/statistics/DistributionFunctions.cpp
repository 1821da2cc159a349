#include "DistributionFunctions.h"
#include <algorithm>
#include <cmath>
#include <boost/math/constants/constants.hpp>
#include <boost/math/distributions/chi_squared.hpp>
#include <boost/math/distributions/normal.hpp>
#include <boost/math/distributions/students_t.hpp>
#include <boost/math/special_functions/bessel.hpp>
#include <boost/math/special_functions/gamma.hpp>

namespace synvalidator
{
  double DistributionFunctions::chiSquaredSurvival(double x, double degreesOfFreedom)
  {
    if (x <= 0.0)
      return 1.0;

    boost::math::chi_squared_distribution<double> dist(degreesOfFreedom);
    return boost::math::cdf(boost::math::complement(dist, x));
  }

  double DistributionFunctions::studentTTwoSided(double t, double degreesOfFreedom)
  {
    if (std::isinf(t))
      return 0.0;

    boost::math::students_t_distribution<double> dist(degreesOfFreedom);
    const double tail = boost::math::cdf(boost::math::complement(dist, std::fabs(t)));
    return std::min(1.0, 2.0 * tail);
  }

  double DistributionFunctions::standardNormalSurvival(double z)
  {
    boost::math::normal_distribution<double> dist(0.0, 1.0);
    return boost::math::cdf(boost::math::complement(dist, z));
  }

  double DistributionFunctions::kolmogorovSurvival(double lambda)
  {
    const double eps1 = 1.0e-6;
    const double eps2 = 1.0e-16;

    if (lambda < 1.0e-3)
      return 1.0;

    const double a2 = -2.0 * lambda * lambda;
    double fac = 2.0;
    double sum = 0.0;
    double termPrev = 0.0;

    for (int j = 1; j <= 100; ++j)
      {
        const double term = fac * std::exp(a2 * j * j);
        sum += term;
        if (std::fabs(term) <= eps1 * termPrev || std::fabs(term) <= eps2 * sum)
          return std::clamp(sum, 0.0, 1.0);

        fac = -fac;
        termPrev = std::fabs(term);
      }

    // series failed to converge, only happens for lambda near 0
    return 1.0;
  }

  double DistributionFunctions::kolmogorovSmirnovPValue(double dStatistic, double n1, double n2)
  {
    const double en = std::sqrt(n1 * n2 / (n1 + n2));
    return kolmogorovSurvival((en + 0.12 + 0.11 / en) * dStatistic);
  }

  double DistributionFunctions::cramerVonMisesLimitingCdf(double x)
  {
    if (!(x > 0.0))
      return 0.0;

    const double pi = boost::math::constants::pi<double>();
    double total = 0.0;

    for (int k = 0; k < 200; ++k)
      {
        const double u = std::exp(boost::math::lgamma(k + 0.5) - boost::math::lgamma(k + 1.0)) /
          (std::pow(pi, 1.5) * std::sqrt(x));
        const double y = 4.0 * k + 1.0;
        const double q = y * y / (16.0 * x);
        const double term = u * std::sqrt(y) * std::exp(-q) * boost::math::cyl_bessel_k(0.25, q);

        total += term;
        if (std::fabs(term) < 1.0e-7)
          break;
      }

    return total;
  }

  double DistributionFunctions::cramerVonMisesPValue(double t, double n, double m)
  {
    const double N = n + m;
    const double k = n * m;

    // Mean and variance of T under H0 (Anderson 1962, eqs. 11 and 14)
    const double et = (1.0 + 1.0 / N) / 6.0;
    const double vt = (N + 1.0) * (4.0 * k * N - 3.0 * (n * n + m * m) - 2.0 * k) /
      (45.0 * N * N * 4.0 * k);

    const double tn = 1.0 / 6.0 + (t - et) / std::sqrt(45.0 * vt);

    // the limiting cdf is below 1e-18 here
    if (tn < 0.003)
      return 1.0;

    return std::clamp(1.0 - cramerVonMisesLimitingCdf(tn), 0.0, 1.0);
  }
}
