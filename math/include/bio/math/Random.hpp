/**
 * @file Random.hpp
 * @brief Explicit pseudo-random generator state.
 *
 * Each simulator owns one Rng; passing it explicitly to every draw keeps
 * generation reproducible for a given seed and free of global state.
 * Every explicit seed, 0 included, is used as given; only a missing seed
 * falls back to the clock.
 */

#pragma once

#include "bio/core/Types.hpp"

#include <optional>
#include <random>

namespace bio::math {

class Rng {
public:
    /** @brief Seeds from the clock when @p seed is empty. */
    explicit Rng(std::optional<core::u64> seed = std::nullopt);

    void seed(core::u64 seed);
    void seedFromClock();

    /** @brief The seed in use, including one drawn from the clock. */
    [[nodiscard]] core::u64 seedValue() const noexcept { return _seed; }

    /** @brief Uniform draw on [lo, hi). Returns @p lo when the range is empty. */
    [[nodiscard]] core::f64 uniform(core::f64 lo = 0.0, core::f64 hi = 1.0);

    /** @brief Normal draw. A non-positive @p stddev yields @p mean exactly. */
    [[nodiscard]] core::f64 normal(core::f64 mean = 0.0, core::f64 stddev = 1.0);

    [[nodiscard]] bool bernoulli(core::f64 p);

    /** @brief Uniform integer on [lo, hi] (inclusive). */
    [[nodiscard]] core::usize uniformIndex(core::usize lo, core::usize hi);

    /** @brief Exponential inter-arrival time for a process of the given rate. */
    [[nodiscard]] core::f64 exponential(core::f64 rate);

    /** @brief +1 or -1 with equal probability. */
    [[nodiscard]] core::f64 sign();

    [[nodiscard]] std::mt19937_64 &engine() noexcept { return _engine; }

private:
    std::mt19937_64 _engine;
    core::u64 _seed{0};
};

} // namespace bio::math
