/**
 * @file Placement.hpp
 * @brief Additive kernel placement and event schedules.
 *
 * Every synthesizer writes into its output through placeKernel(). How a
 * kernel that straddles the end of the buffer is handled is chosen
 * explicitly by the caller through a BoundaryPolicy.
 */

#pragma once

#include "bio/core/Expected.hpp"
#include "bio/math/Random.hpp"
#include "bio/synth/Signal.hpp"

#include <span>
#include <string_view>

namespace bio::synth {

/**
 * @brief What to do with a kernel that does not fit inside the buffer.
 */
enum class BoundaryPolicy : core::u8 {
    kSkip, ///< Drop the whole kernel.
    kClip  ///< Add the in-bounds part, discard the rest.
};

[[nodiscard]] std::string_view boundaryPolicyName(BoundaryPolicy policy) noexcept;

/** @return kUnsupportedType for names other than "skip" and "clip" */
[[nodiscard]] core::Expected<BoundaryPolicy> parseBoundaryPolicy(std::string_view name);

/**
 * @brief Adds gain * kernel into out starting at sample @p start.
 * @return false when nothing was written (skipped or fully out of range)
 */
bool placeKernel(
    Signal &out,
    std::span<const core::f64> kernel,
    core::isize start,
    core::f64 gain,
    BoundaryPolicy policy) noexcept;

/// Event start times in seconds.
using Schedule = std::vector<core::f64>;

/**
 * @brief Clamps every time into [0, duration) and sorts the schedule.
 */
[[nodiscard]] Schedule normalizeSchedule(Schedule times, core::f64 duration);

/**
 * @brief t_i = i * interval + N(0, jitterStd) for i < floor(duration / interval),
 *        normalized.
 */
[[nodiscard]] Schedule regularSchedule(
    core::f64 duration,
    core::f64 interval,
    core::f64 jitterStd,
    math::Rng &rng);

} // namespace bio::synth
