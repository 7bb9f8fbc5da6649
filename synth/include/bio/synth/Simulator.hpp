/**
 * @file Simulator.hpp
 * @brief Abstract base shared by the EMG, ECG, EOG and noise synthesizers.
 *
 * A Simulator owns the configured TimeBase and its own random stream.
 * Derived classes implement generate(); the base provides noise and
 * artifact composition on top of any finished Signal.
 *
 * @see SimulatorFactory
 */

#pragma once

#include "bio/math/Random.hpp"
#include "bio/synth/ParamSet.hpp"
#include "bio/synth/TimeBase.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace bio::synth {

/**
 * @brief Kind of waveform a simulator produces.
 */
enum class SignalFamily : core::u8 {
    kEmg,
    kEcg,
    kEog,
    kNoise
};

[[nodiscard]] std::string_view signalFamilyName(SignalFamily family) noexcept;

/** @return kUnsupportedType for names other than emg, ecg, eog and noise */
[[nodiscard]] core::Expected<SignalFamily> parseSignalFamily(std::string_view name);

/**
 * @brief One entry of a layered noise recipe.
 *
 * @p type is any name accepted by NoiseSynthesizer::render (noise or
 * artifact type). Disabled layers are kept but not applied.
 */
struct NoiseLayer {
    std::string type;
    ParamSet params;
    bool enabled = true;
};

class Simulator {
public:
    /** @param seed Seeds the stream; empty seeds it from the clock. */
    Simulator(TimeBase timeBase, std::optional<core::u64> seed);
    virtual ~Simulator() = default;

    Simulator(const Simulator &) = delete;
    Simulator &operator=(const Simulator &) = delete;

    /**
     * @brief Produces one signal from named parameters.
     *
     * Common keys: "duration" (<= configured duration; "signal_duration"
     * for the noise synthesizer, whose "duration" is the event length) and
     * "random_seed" (reseeds this instance before rendering).
     */
    [[nodiscard]] virtual core::Expected<Signal> generate(const ParamSet &params) = 0;

    [[nodiscard]] virtual SignalFamily family() const noexcept = 0;

    /**
     * @brief Returns signal + noise of the given type.
     * @return kInvalidParameter if the signal length differs from the time base
     */
    [[nodiscard]] core::Expected<Signal> addNoise(
        const Signal &signal,
        std::string_view noiseType,
        const ParamSet &params = {});

    /**
     * @brief Returns signal with one artifact placed at @p startTime.
     *
     * Types: spike, step, electrode_pop, electrode_movement, cable_motion,
     * baseline_shift, impedance_change.
     */
    [[nodiscard]] core::Expected<Signal> addArtifact(
        const Signal &signal,
        std::string_view artifactType,
        core::f64 startTime,
        core::f64 duration,
        core::f64 amplitude);

    /** @brief Adds every enabled layer in order. */
    [[nodiscard]] core::Expected<Signal> applyNoiseLayers(
        const Signal &signal,
        std::span<const NoiseLayer> layers);

    [[nodiscard]] const TimeBase &timeBase() const noexcept { return _timeBase; }
    [[nodiscard]] core::f64 samplingRate() const noexcept { return _timeBase.samplingRate(); }
    [[nodiscard]] core::f64 duration() const noexcept { return _timeBase.duration(); }
    [[nodiscard]] core::usize sampleCount() const noexcept { return _timeBase.sampleCount(); }

    void seed(core::u64 seed) { _rng.seed(seed); }
    [[nodiscard]] math::Rng &rng() noexcept { return _rng; }

protected:
    /**
     * @brief Configured time base, shortened by the @p key parameter if present.
     * @return kInvalidParameter if the requested duration exceeds the configured one
     */
    [[nodiscard]] core::Expected<TimeBase> resolveTimeBase(
        const ParamSet &params, std::string_view key = "duration") const;

    /** @brief Reseeds from "random_seed" if present. */
    [[nodiscard]] core::ExpectedVoid applySeed(const ParamSet &params);

private:
    [[nodiscard]] core::ExpectedVoid checkLength(const Signal &signal) const;

    TimeBase _timeBase;
    math::Rng _rng;
};

} // namespace bio::synth
