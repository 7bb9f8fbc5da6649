/**
 * @file TestRandom.cpp
 * @brief Unit tests for bio::math::Rng and the Hann window.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "bio/math/Random.hpp"
#include "bio/math/Window.hpp"

namespace bio::math {

using Catch::Matchers::WithinAbs;

TEST_CASE("Rng is deterministic for a fixed seed", "[math][random]")
{
    Rng a(42);
    Rng b(42);

    for (int i = 0; i < 100; ++i) {
        REQUIRE(a.normal() == b.normal());
        REQUIRE(a.uniform(-1.0, 1.0) == b.uniform(-1.0, 1.0));
    }
    REQUIRE(a.seedValue() == 42);
}

TEST_CASE("Rng handles degenerate distributions", "[math][random]")
{
    Rng rng(7);

    REQUIRE(rng.normal(3.0, 0.0) == 3.0);
    REQUIRE(rng.uniform(2.0, 2.0) == 2.0);
    REQUIRE_FALSE(rng.bernoulli(0.0));
    REQUIRE(rng.bernoulli(1.0));
    REQUIRE(rng.uniformIndex(5, 5) == 5);
}

TEST_CASE("Rng treats a zero seed like any other", "[math][random]")
{
    Rng a(0);
    Rng b(42);
    b.seed(0);

    REQUIRE(a.seedValue() == 0);
    REQUIRE(b.seedValue() == 0);
    for (int i = 0; i < 100; ++i)
        REQUIRE(a.normal() == b.normal());
}

TEST_CASE("Rng without a seed draws one from the clock", "[math][random]")
{
    Rng rng;
    const core::u64 drawn = rng.seedValue();

    Rng replay(drawn);
    REQUIRE(rng.uniform() == replay.uniform());
}

TEST_CASE("Rng draws stay within bounds", "[math][random]")
{
    Rng rng(3);
    for (int i = 0; i < 1000; ++i) {
        const double u = rng.uniform(0.9, 1.1);
        REQUIRE(u >= 0.9);
        REQUIRE(u < 1.1);
        const auto idx = rng.uniformIndex(5, 9);
        REQUIRE(idx >= 5);
        REQUIRE(idx <= 9);
        REQUIRE(rng.exponential(2.0) >= 0.0);
    }
}

TEST_CASE("hannWindow is symmetric and tapered", "[math][window]")
{
    const auto w = hannWindow(9);

    REQUIRE(w.size() == 9);
    REQUIRE_THAT(w.front(), WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(w.back(), WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(w[4], WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(w[2], WithinAbs(w[6], 1e-12));

    REQUIRE(hannWindow(1) == std::vector<double>{1.0});
    REQUIRE(hannWindow(0).empty());
}

} // namespace bio::math
