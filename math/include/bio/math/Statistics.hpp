/**
 * @file Statistics.hpp
 * @brief Statistical and spectral utilities over sampled signals.
 *
 * Moments, one-sided periodograms, log-log spectral slope fitting,
 * linear resampling and peak picking. Used by the synthesizers for
 * envelope/trajectory resampling and by the test-suite to verify the
 * spectral and temporal properties of generated signals.
 */

#pragma once

#include "bio/core/Expected.hpp"

#include <span>
#include <vector>

namespace bio::math {

/**
 * @brief Mean and population standard deviation of a sample set.
 */
struct Baseline {
    core::f64 mean = 0.0;
    core::f64 stdDev = 0.0;
};

/**
 * @brief One-sided power spectrum (DC excluded).
 */
struct Spectrum {
    std::vector<core::f64> frequencies;
    std::vector<core::f64> power;
};

/**
 * @brief Pure-function statistical utilities.
 */
class Statistics {
public:
    Statistics() = delete;

    /**
     * @brief Computes the mean and population standard deviation.
     * @return Zeroed Baseline for empty input
     */
    [[nodiscard]] static Baseline computeBaseline(std::span<const core::f64> data) noexcept;

    [[nodiscard]] static core::f64 rms(std::span<const core::f64> data) noexcept;

    [[nodiscard]] static core::f64 peakAbs(std::span<const core::f64> data) noexcept;

    /**
     * @brief Periodogram |X(f)|^2 / (fs * N) of the zero-padded signal.
     *
     * @param data       Time-domain samples
     * @param sampleRate Sampling rate in Hz
     * @return Bins 1..N/2 with their frequencies, or kEmptyInput / kInvalidParameter
     */
    [[nodiscard]] static core::Expected<Spectrum> periodogram(
        std::span<const core::f64> data,
        core::f64 sampleRate);

    /**
     * @brief Least-squares slope of log10(power) against log10(frequency).
     *
     * Only bins with minHz <= f <= maxHz and strictly positive power are
     * used. A 1/f^a spectrum yields a slope close to -a.
     *
     * @return kEmptyInput when fewer than two bins fall in range
     */
    [[nodiscard]] static core::Expected<core::f64> spectralSlope(
        const Spectrum &spectrum,
        core::f64 minHz,
        core::f64 maxHz);

    /**
     * @brief Linearly resamples @p points, taken as evenly spaced on
     *        [0, 1], onto @p count evenly spaced samples.
     *
     * @return kInvalidParameter if fewer than two points are given
     */
    [[nodiscard]] static core::Expected<std::vector<core::f64>> resampleLinear(
        std::span<const core::f64> points,
        core::usize count);

    /**
     * @brief Indices of local maxima at or above @p minHeight separated by
     *        at least @p minDistance samples. Taller peaks win ties.
     */
    [[nodiscard]] static std::vector<core::usize> findPeaks(
        std::span<const core::f64> data,
        core::f64 minHeight,
        core::usize minDistance);
};

} // namespace bio::math
