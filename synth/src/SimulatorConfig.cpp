/**
 * @file SimulatorConfig.cpp
 * @brief SimulatorConfig::Builder implementation.
 */

#include "bio/synth/SimulatorConfig.hpp"

namespace bio::synth {

SimulatorConfig::Builder& SimulatorConfig::Builder::family(SignalFamily family) noexcept
{
    _family = family;
    return *this;
}

SimulatorConfig::Builder& SimulatorConfig::Builder::samplingRate(core::f64 hz) noexcept
{
    _samplingRate = hz;
    return *this;
}

SimulatorConfig::Builder& SimulatorConfig::Builder::duration(core::f64 seconds) noexcept
{
    _duration = seconds;
    return *this;
}

SimulatorConfig::Builder& SimulatorConfig::Builder::seed(core::u64 seed) noexcept
{
    _seed = seed;
    return *this;
}

SimulatorConfig::Builder& SimulatorConfig::Builder::logLevel(core::LogLevel level) noexcept
{
    _logLevel = level;
    return *this;
}

SimulatorConfig SimulatorConfig::Builder::build() const noexcept
{
    SimulatorConfig cfg;
    cfg._family       = _family;
    cfg._samplingRate = _samplingRate;
    cfg._duration     = _duration;
    cfg._seed         = _seed;
    cfg._logLevel     = _logLevel;
    return cfg;
}

} // namespace bio::synth
