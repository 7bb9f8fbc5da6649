/**
 * @file Window.hpp
 * @brief Tapering windows for burst envelopes.
 */

#pragma once

#include "bio/core/Types.hpp"

#include <vector>

namespace bio::math {

/**
 * @brief Symmetric Hann window coefficients.
 *
 * w[i] = 0.5 * (1 - cos(2*pi*i / (n - 1))). A length-1 window is {1}.
 */
[[nodiscard]] std::vector<core::f64> hannWindow(core::usize n);

} // namespace bio::math
