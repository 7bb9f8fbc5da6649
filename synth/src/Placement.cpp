/**
 * @file Placement.cpp
 * @brief Kernel placement and schedule helpers.
 */

#include "bio/synth/Placement.hpp"
#include "bio/core/Assert.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace bio::synth {

using core::isize;
using core::usize;

std::string_view boundaryPolicyName(BoundaryPolicy policy) noexcept
{
    switch (policy) {
        case BoundaryPolicy::kSkip: return "skip";
        case BoundaryPolicy::kClip: return "clip";
    }
    return "unknown";
}

core::Expected<BoundaryPolicy> parseBoundaryPolicy(std::string_view name)
{
    if (name == "skip")
        return BoundaryPolicy::kSkip;
    if (name == "clip")
        return BoundaryPolicy::kClip;
    return std::unexpected(
        core::Error::make(core::ErrorCode::kUnsupportedType,
            "unknown boundary policy '" + std::string(name) + "'"));
}

bool placeKernel(
    Signal &out,
    std::span<const core::f64> kernel,
    isize start,
    core::f64 gain,
    BoundaryPolicy policy) noexcept
{
    if (kernel.empty() || out.empty())
        return false;

    const auto n = static_cast<isize>(out.size());
    const auto len = static_cast<isize>(kernel.size());
    const isize end = start + len;

    if (policy == BoundaryPolicy::kSkip && (start < 0 || end > n))
        return false;

    const isize first = std::max<isize>(start, 0);
    const isize last = std::min(end, n);
    if (first >= last)
        return false;

    BIO_ASSERT(first - start < len, "placement window starts past the kernel end");
    for (isize i = first; i < last; ++i)
        out[static_cast<usize>(i)] += gain * kernel[static_cast<usize>(i - start)];
    return true;
}

Schedule normalizeSchedule(Schedule times, core::f64 duration)
{
    const core::f64 upper = std::nextafter(duration, 0.0);
    for (auto &t : times)
        t = std::clamp(t, 0.0, std::max(upper, 0.0));
    std::sort(times.begin(), times.end());
    return times;
}

Schedule regularSchedule(core::f64 duration, core::f64 interval, core::f64 jitterStd, math::Rng &rng)
{
    Schedule times;
    if (!(interval > 0.0) || !(duration > 0.0))
        return times;

    const auto count = static_cast<usize>(std::floor(duration / interval + 1e-9));
    times.reserve(count);
    for (usize i = 0; i < count; ++i)
        times.push_back(static_cast<core::f64>(i) * interval + rng.normal(0.0, jitterStd));
    return normalizeSchedule(std::move(times), duration);
}

} // namespace bio::synth
