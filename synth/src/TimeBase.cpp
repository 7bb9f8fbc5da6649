/**
 * @file TimeBase.cpp
 * @brief Implementation of TimeBase.
 */

#include "bio/synth/TimeBase.hpp"

#include <cmath>
#include <sstream>

namespace bio::synth {

using core::Error;
using core::ErrorCode;

core::Expected<TimeBase> TimeBase::make(core::f64 samplingRate, core::f64 duration)
{
    if (!std::isfinite(samplingRate) || samplingRate <= 0.0) {
        std::ostringstream os;
        os << "sampling_rate must be positive, got " << samplingRate;
        return std::unexpected(Error::make(ErrorCode::kInvalidParameter, os.str()));
    }
    if (!std::isfinite(duration) || duration <= 0.0) {
        std::ostringstream os;
        os << "duration must be positive, got " << duration;
        return std::unexpected(Error::make(ErrorCode::kInvalidParameter, os.str()));
    }

    const core::f64 n = std::round(samplingRate * duration);
    if (n < 1.0) {
        std::ostringstream os;
        os << "duration " << duration << " s at " << samplingRate << " Hz yields no samples";
        return std::unexpected(Error::make(ErrorCode::kInvalidParameter, os.str()));
    }

    return TimeBase(samplingRate, duration, static_cast<core::usize>(n));
}

core::Expected<TimeBase> TimeBase::withDuration(core::f64 duration) const
{
    return make(_samplingRate, duration);
}

core::isize TimeBase::indexAt(core::f64 seconds) const noexcept
{
    // Tolerance absorbs representation error in products such as 0.3 * 1000.
    return static_cast<core::isize>(std::floor(seconds * _samplingRate + 1e-9));
}

core::usize TimeBase::samplesFor(core::f64 seconds) const noexcept
{
    if (!(seconds > 0.0))
        return 0;
    return static_cast<core::usize>(std::llround(seconds * _samplingRate));
}

std::vector<core::f64> TimeBase::time() const
{
    std::vector<core::f64> t(_sampleCount);
    for (core::usize i = 0; i < _sampleCount; ++i)
        t[i] = timeAt(i);
    return t;
}

} // namespace bio::synth
