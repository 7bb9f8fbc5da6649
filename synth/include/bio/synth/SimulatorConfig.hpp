// /////////////////////////////////////////////////////////////////////////////
/// @file SimulatorConfig.hpp
/// @brief Simulator configuration (Builder pattern).
///
/// Immutable configuration object constructed via a fluent Builder.
/// Validation is deferred to SimulatorFactory::create().
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include "bio/core/Constants.hpp"
#include "bio/core/Log.hpp"
#include "bio/synth/Simulator.hpp"

#include <optional>

namespace bio::synth {

/// @brief Immutable simulator configuration.
class SimulatorConfig
{
public:
    /// @brief Fluent builder for SimulatorConfig.
    class Builder
    {
    public:
        Builder& family(SignalFamily family) noexcept;
        Builder& samplingRate(core::f64 hz) noexcept;
        Builder& duration(core::f64 seconds) noexcept;
        /// Without a seed the stream is seeded from the clock.
        Builder& seed(core::u64 seed) noexcept;
        Builder& logLevel(core::LogLevel level) noexcept;

        [[nodiscard]] SimulatorConfig build() const noexcept;

    private:
        SignalFamily _family{SignalFamily::kNoise};
        core::f64 _samplingRate{core::kDefaultSamplingRate};
        core::f64 _duration{core::kDefaultDuration};
        std::optional<core::u64> _seed;
        core::LogLevel _logLevel{core::LogLevel::kInfo};
    };

    [[nodiscard]] SignalFamily   family()       const noexcept { return _family; }
    [[nodiscard]] core::f64      samplingRate() const noexcept { return _samplingRate; }
    [[nodiscard]] core::f64      duration()     const noexcept { return _duration; }
    [[nodiscard]] std::optional<core::u64> seed() const noexcept { return _seed; }
    [[nodiscard]] core::LogLevel logLevel()     const noexcept { return _logLevel; }

private:
    friend class Builder;

    SignalFamily _family{SignalFamily::kNoise};
    core::f64 _samplingRate{core::kDefaultSamplingRate};
    core::f64 _duration{core::kDefaultDuration};
    std::optional<core::u64> _seed;
    core::LogLevel _logLevel{core::LogLevel::kInfo};
};

} // namespace bio::synth
