/**
 * @file Random.cpp
 * @brief Implementation of the Rng wrapper.
 */

#include "bio/math/Random.hpp"

#include <algorithm>
#include <chrono>
#include <limits>

namespace bio::math {

Rng::Rng(std::optional<core::u64> seed)
{
    if (seed)
        this->seed(*seed);
    else
        seedFromClock();
}

void Rng::seed(core::u64 seed)
{
    _seed = seed;
    _engine.seed(seed);
}

void Rng::seedFromClock()
{
    seed(static_cast<core::u64>(std::chrono::steady_clock::now().time_since_epoch().count()));
}

core::f64 Rng::uniform(core::f64 lo, core::f64 hi)
{
    if (!(hi > lo))
        return lo;
    return std::uniform_real_distribution<core::f64>(lo, hi)(_engine);
}

core::f64 Rng::normal(core::f64 mean, core::f64 stddev)
{
    if (!(stddev > 0.0))
        return mean;
    return std::normal_distribution<core::f64>(mean, stddev)(_engine);
}

bool Rng::bernoulli(core::f64 p)
{
    return std::bernoulli_distribution(std::clamp(p, 0.0, 1.0))(_engine);
}

core::usize Rng::uniformIndex(core::usize lo, core::usize hi)
{
    if (hi <= lo)
        return lo;
    return std::uniform_int_distribution<core::usize>(lo, hi)(_engine);
}

core::f64 Rng::exponential(core::f64 rate)
{
    if (!(rate > 0.0))
        return std::numeric_limits<core::f64>::infinity();
    return std::exponential_distribution<core::f64>(rate)(_engine);
}

core::f64 Rng::sign()
{
    return bernoulli(0.5) ? 1.0 : -1.0;
}

} // namespace bio::math
