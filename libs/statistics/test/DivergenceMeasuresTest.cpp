#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <vector>
#include "DivergenceMeasures.h"
#include "ComparisonException.h"

using Catch::Approx;
using namespace synvalidator;

TEST_CASE("jensenShannon", "[DivergenceMeasures][js]")
{
    SECTION("Identical distributions")
    {
        auto r = DivergenceMeasures::jensenShannon({42, 33, 18, 7}, {42, 33, 18, 7});
        REQUIRE(r.divergence == Approx(0.0).margin(1e-12));
        REQUIRE(r.distance == Approx(0.0).margin(1e-6));
    }

    SECTION("Near-identical distributions")
    {
        auto r = DivergenceMeasures::jensenShannon({42, 33, 18, 7}, {40, 35, 20, 5});
        REQUIRE(r.divergence == Approx(0.001975854167190272).margin(1e-12));
        REQUIRE(r.distance == Approx(std::sqrt(0.001975854167190272)).margin(1e-9));
    }

    SECTION("Disjoint supports reach the upper bound of 1")
    {
        auto r = DivergenceMeasures::jensenShannon({1, 0}, {0, 1});
        REQUIRE(r.divergence == Approx(1.0));
    }

    SECTION("Symmetric under swap")
    {
        auto a = DivergenceMeasures::jensenShannon({80, 10, 5, 5}, {40, 35, 20, 5});
        auto b = DivergenceMeasures::jensenShannon({40, 35, 20, 5}, {80, 10, 5, 5});
        REQUIRE(a.divergence == Approx(0.1368354737419464).margin(1e-12));
        REQUIRE(a.divergence == Approx(b.divergence));
    }

    SECTION("Shorter vector is zero padded")
    {
        auto r = DivergenceMeasures::jensenShannon({1, 1}, {1, 1, 0});
        REQUIRE(r.divergence == Approx(0.0).margin(1e-12));
    }

    SECTION("Invalid weights")
    {
        REQUIRE_THROWS_AS(DivergenceMeasures::jensenShannon({0, 0}, {1, 1}), ComputationError);
        REQUIRE_THROWS_AS(DivergenceMeasures::jensenShannon({1, 1}, {-1, 3}), ComputationError);
    }
}

TEST_CASE("kullbackLeibler is directional", "[DivergenceMeasures][kl]")
{
    const double eps = 1e-10;

    SECTION("Identical distributions")
    {
        auto r = DivergenceMeasures::kullbackLeibler({42, 33, 18, 7}, {42, 33, 18, 7}, eps);
        REQUIRE(r.divergence == Approx(0.0).margin(1e-12));
        REQUIRE(r.normalizedDivergence == Approx(0.0).margin(1e-12));
    }

    SECTION("Swapping arguments changes the value")
    {
        auto forward = DivergenceMeasures::kullbackLeibler({42, 33, 18, 7}, {40, 35, 20, 5}, eps);
        auto backward = DivergenceMeasures::kullbackLeibler({40, 35, 20, 5}, {42, 33, 18, 7}, eps);

        REQUIRE(forward.divergence == Approx(0.005662667688669527).margin(1e-12));
        REQUIRE(backward.divergence == Approx(0.00532660064075853).margin(1e-12));
        REQUIRE(forward.divergence != Approx(backward.divergence).margin(1e-6));
    }

    SECTION("Markedly different distributions")
    {
        auto forward = DivergenceMeasures::kullbackLeibler({80, 10, 5, 5}, {40, 35, 20, 5}, eps);
        auto backward = DivergenceMeasures::kullbackLeibler({40, 35, 20, 5}, {80, 10, 5, 5}, eps);

        REQUIRE(1.0 / (1.0 + forward.divergence) == Approx(0.73533373).margin(1e-6));
        REQUIRE(1.0 / (1.0 + backward.divergence) == Approx(0.69518451).margin(1e-6));
    }

    SECTION("Padding with epsilon keeps the value finite")
    {
        auto r = DivergenceMeasures::kullbackLeibler({1, 1, 1}, {1, 1}, eps);
        REQUIRE(std::isfinite(r.divergence));
        REQUIRE(r.divergence == Approx(7.038769475018673).margin(1e-6));
    }

    SECTION("Zero total")
    {
        REQUIRE_THROWS_AS(DivergenceMeasures::kullbackLeibler({1, 1}, {0, 0}, eps), ComputationError);
    }
}

TEST_CASE("wasserstein", "[DivergenceMeasures][wasserstein]")
{
    SECTION("Shifted samples")
    {
        auto r = DivergenceMeasures::wasserstein({0, 1, 2}, {1, 2, 3});
        REQUIRE(r.distance == Approx(1.0));
        REQUIRE(r.normalizedDistance == Approx(1.0 / 3.0));
    }

    SECTION("Near-identical samples")
    {
        auto r = DivergenceMeasures::wasserstein({42, 33, 18, 7}, {40, 35, 20, 5});
        REQUIRE(r.distance == Approx(2.0));
        REQUIRE(r.normalizedDistance == Approx(0.05405405405405406));
    }

    SECTION("Zero combined range is a perfect match")
    {
        auto r = DivergenceMeasures::wasserstein({5}, {5, 5});
        REQUIRE(r.distance == 0.0);
        REQUIRE(r.normalizedDistance == 0.0);
    }

    SECTION("Empty side")
    {
        REQUIRE_THROWS_AS(DivergenceMeasures::wasserstein({}, {1, 2}), ComputationError);
    }
}
