/**
 * @file TimeBase.hpp
 * @brief Uniform sampling grid shared by every generator of one call.
 *
 * sampleCount = round(samplingRate * duration) and time[i] = i / samplingRate.
 * All generators composed into one output use the same TimeBase so that
 * their contributions line up sample for sample.
 */

#pragma once

#include "bio/synth/Signal.hpp"

namespace bio::synth {

class TimeBase {
public:
    /**
     * @brief Validates and builds a time base.
     * @return kInvalidParameter for non-finite or non-positive inputs, or
     *         when the rounded sample count is zero
     */
    [[nodiscard]] static core::Expected<TimeBase> make(core::f64 samplingRate, core::f64 duration);

    /** @brief Same sampling rate, different duration. */
    [[nodiscard]] core::Expected<TimeBase> withDuration(core::f64 duration) const;

    [[nodiscard]] core::f64   samplingRate() const noexcept { return _samplingRate; }
    [[nodiscard]] core::f64   duration()     const noexcept { return _duration; }
    [[nodiscard]] core::usize sampleCount()  const noexcept { return _sampleCount; }

    [[nodiscard]] core::f64 timeAt(core::usize index) const noexcept
    {
        return static_cast<core::f64>(index) / _samplingRate;
    }

    /** @brief Sample index at or before @p seconds (may be negative or past the end). */
    [[nodiscard]] core::isize indexAt(core::f64 seconds) const noexcept;

    /** @brief Number of samples spanned by @p seconds, rounded. */
    [[nodiscard]] core::usize samplesFor(core::f64 seconds) const noexcept;

    [[nodiscard]] std::vector<core::f64> time() const;

    [[nodiscard]] Signal zeros() const { return Signal(_sampleCount, 0.0); }

private:
    TimeBase(core::f64 samplingRate, core::f64 duration, core::usize sampleCount) noexcept
        : _samplingRate(samplingRate), _duration(duration), _sampleCount(sampleCount) {}

    core::f64 _samplingRate;
    core::f64 _duration;
    core::usize _sampleCount;
};

} // namespace bio::synth
