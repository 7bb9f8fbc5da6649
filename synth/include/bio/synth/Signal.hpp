/**
 * @file Signal.hpp
 * @brief Sampled real-valued waveform and its composition helpers.
 */

#pragma once

#include "bio/core/Expected.hpp"

#include <vector>

namespace bio::synth {

/**
 * @brief One channel of samples on a uniform time grid.
 *
 * Synthesizers return Signals by value; composition helpers produce new
 * Signals and never modify their inputs.
 */
using Signal = std::vector<core::f64>;

/**
 * @brief Element-wise sum of two equally sized signals.
 * @return kSizeMismatch if the lengths differ
 */
[[nodiscard]] core::Expected<Signal> addSignals(const Signal &a, const Signal &b);

} // namespace bio::synth
