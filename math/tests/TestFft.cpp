/**
 * @file TestFft.cpp
 * @brief Unit tests for bio::math::Fft.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "bio/math/Fft.hpp"

#include <cmath>
#include <numbers>

namespace bio::math {

using Catch::Matchers::WithinAbs;

TEST_CASE("Fft::forward of an impulse is flat", "[math][fft]")
{
    std::vector<Fft::Complex> buffer(16);
    buffer[0] = {1.0, 0.0};

    REQUIRE(Fft::forward(buffer).has_value());
    for (const auto &c : buffer) {
        REQUIRE_THAT(c.real(), WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(c.imag(), WithinAbs(0.0, 1e-12));
    }
}

TEST_CASE("Fft::forward locates a pure tone", "[math][fft]")
{
    constexpr std::size_t kN = 64;
    constexpr std::size_t kBin = 5;
    std::vector<Fft::Complex> buffer(kN);
    for (std::size_t i = 0; i < kN; ++i) {
        buffer[i] = {std::cos(2.0 * std::numbers::pi * kBin * i / kN), 0.0};
    }

    REQUIRE(Fft::forward(buffer).has_value());
    REQUIRE_THAT(std::abs(buffer[kBin]), WithinAbs(kN / 2.0, 1e-9));
    REQUIRE_THAT(std::abs(buffer[kN - kBin]), WithinAbs(kN / 2.0, 1e-9));
    REQUIRE_THAT(std::abs(buffer[kBin + 1]), WithinAbs(0.0, 1e-9));
}

TEST_CASE("Fft::inverse undoes forward", "[math][fft]")
{
    std::vector<Fft::Complex> buffer = {{1, 0}, {2, 0}, {-1, 0}, {0.5, 0}, {3, 0}, {0, 0}, {-2, 0}, {4, 0}};
    const auto original = buffer;

    REQUIRE(Fft::forward(buffer).has_value());
    REQUIRE(Fft::inverse(buffer).has_value());
    for (std::size_t i = 0; i < buffer.size(); ++i) {
        REQUIRE_THAT(buffer[i].real(), WithinAbs(original[i].real(), 1e-12));
        REQUIRE_THAT(buffer[i].imag(), WithinAbs(0.0, 1e-12));
    }
}

TEST_CASE("Fft rejects invalid buffer sizes", "[math][fft]")
{
    SECTION("empty")
    {
        std::vector<Fft::Complex> buffer;
        REQUIRE(Fft::forward(buffer).error().code == core::ErrorCode::kEmptyInput);
    }

    SECTION("not a power of two")
    {
        std::vector<Fft::Complex> buffer(12);
        REQUIRE(Fft::forward(buffer).error().code == core::ErrorCode::kSizeMismatch);
    }
}

TEST_CASE("Fft::nextPowerOfTwo", "[math][fft]")
{
    REQUIRE(Fft::nextPowerOfTwo(0) == 1);
    REQUIRE(Fft::nextPowerOfTwo(1) == 1);
    REQUIRE(Fft::nextPowerOfTwo(1000) == 1024);
    REQUIRE(Fft::nextPowerOfTwo(1024) == 1024);
}

} // namespace bio::math
