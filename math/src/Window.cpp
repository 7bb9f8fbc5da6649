/**
 * @file Window.cpp
 * @brief Implementation of the Hann window.
 */

#include "bio/math/Window.hpp"

#include <cmath>
#include <numbers>

namespace bio::math {

std::vector<core::f64> hannWindow(core::usize n)
{
    if (n == 0)
        return {};
    if (n == 1)
        return {1.0};

    std::vector<core::f64> coefficients(n);
    const auto nMinus1 = static_cast<core::f64>(n - 1);
    for (core::usize i = 0; i < n; ++i) {
        coefficients[i] = 0.5 * (1.0 - std::cos(
            2.0 * std::numbers::pi * static_cast<core::f64>(i) / nMinus1));
    }
    return coefficients;
}

} // namespace bio::math
