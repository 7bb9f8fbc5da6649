/**
 * @file Kernels.hpp
 * @brief Analytic pulse shapes placed by the synthesizers.
 *
 * Kernels are pure functions of their parameters and the sampling rate.
 * Centred kernels are evaluated at t in seconds over [-d/2, d/2]; with the
 * fixed width constants, P, QRS and T kernels of physiological duration
 * are broad pulses rather than spikes.
 */

#pragma once

#include "bio/synth/Signal.hpp"

namespace bio::synth {

/**
 * @brief Sampled pulse with the time of its first sample relative to its
 *        reference point (negative for centred kernels).
 */
struct WaveformKernel {
    Signal samples;
    core::f64 offset = 0.0;

    [[nodiscard]] core::usize size() const noexcept { return samples.size(); }
};

class Kernels {
public:
    Kernels() = delete;

    /**
     * @brief Motor unit action potential.
     *
     * f(t) = -t * exp(-2000 t^2) on [-2 ms, 2 ms], round(0.004 fs) samples,
     * normalized to unit peak magnitude.
     */
    [[nodiscard]] static core::Expected<WaveformKernel> muap(core::f64 samplingRate);

    /** @brief a * exp(-100 t^2), t in seconds over [-d/2, d/2]. Used for P and T waves. */
    [[nodiscard]] static core::Expected<WaveformKernel> gaussianBump(
        core::f64 amplitude, core::f64 duration, core::f64 samplingRate);

    /** @brief Three Gaussian lobes (q, r, s) at t = -d/4, 0, +d/4 with exp(-50 (t - c)^2), t in seconds. */
    [[nodiscard]] static core::Expected<WaveformKernel> qrsComplex(
        core::f64 q, core::f64 r, core::f64 s, core::f64 duration, core::f64 samplingRate);

    /** @brief pv * exp(-((t - d/3) / (0.2 d))^2) for t in [0, d). */
    [[nodiscard]] static core::Expected<WaveformKernel> saccadeVelocity(
        core::f64 duration, core::f64 peakVelocity, core::f64 samplingRate);

    /**
     * @brief Integral of the velocity profile, rescaled so that the last
     *        sample equals @p amplitude.
     */
    [[nodiscard]] static core::Expected<WaveformKernel> saccadePosition(
        core::f64 amplitude, core::f64 duration, core::f64 peakVelocity, core::f64 samplingRate);

    /**
     * @brief Asymmetric eyelid profile peaking at d/3: closing
     *        a * exp(-(t / (d/6))^2), opening a * exp(-(t / (d/3))^2),
     *        with t measured from the peak.
     */
    [[nodiscard]] static core::Expected<WaveformKernel> blink(
        core::f64 amplitude, core::f64 duration, core::f64 samplingRate);

private:
    [[nodiscard]] static core::Expected<core::usize> sampleCount(
        const char *kernel, core::f64 duration, core::f64 samplingRate);
};

} // namespace bio::synth
