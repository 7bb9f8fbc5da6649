/**
 * @file EmgSynthesizer.hpp
 * @brief Surface EMG built from a motor-unit action potential point process.
 *
 * Every contraction pattern reduces to an intensity envelope I(t) in
 * [0, 1]. At each sample a motor unit fires with probability
 * (50 + 450 I) / fs, adding a MUAP scaled by (0.7 + 0.3 I) * U(0.9, 1.1).
 * Fatigue, when enabled, multiplies the finished signal by exp(-rate t / T).
 */

#pragma once

#include "bio/synth/Simulator.hpp"

#include <span>

namespace bio::synth {

enum class EmgPattern : core::u8 {
    kIsometric,
    kDynamic,
    kRepetitive,
    kComplex
};

enum class RampType : core::u8 {
    kLinear,
    kExponential,
    kStep,
    kSine,
    kCustom
};

enum class MovementType : core::u8 {
    kIsometric,
    kDynamic,
    kRepetitive,
    kRest
};

[[nodiscard]] core::Expected<EmgPattern> parseEmgPattern(std::string_view name);
[[nodiscard]] core::Expected<RampType> parseRampType(std::string_view name);
[[nodiscard]] core::Expected<MovementType> parseMovementType(std::string_view name);

struct DynamicParams {
    RampType rampType = RampType::kLinear;
    core::f64 maxIntensity = 1.0;
    /// Modulation frequency of the sine ramp, in Hz.
    core::f64 frequency = 1.0;
    /// Intensity samples for the custom ramp, spread evenly over the segment.
    std::vector<core::f64> envelope;
};

struct RepetitiveParams {
    core::f64 frequency = 1.0;
    core::f64 dutyCycle = 0.5;
    core::f64 intensity = 0.7;
    core::f64 restIntensity = 0.1;
};

struct ComplexSegment {
    MovementType movement = MovementType::kIsometric;
    core::f64 duration = 1.0;
    core::f64 intensity = 0.5;
};

/**
 * @brief Sequence of movements. Without overlap the segments follow one
 *        another; with overlap they all start at t = 0 and are summed.
 */
struct ComplexParams {
    std::vector<ComplexSegment> segments;
    bool overlap = false;
};

class EmgSynthesizer final : public Simulator {
public:
    explicit EmgSynthesizer(TimeBase timeBase, std::optional<core::u64> seed = std::nullopt);

    /**
     * @brief Keys: pattern_type (isometric), intensity / activation_level,
     *        fatigue, fatigue_rate, plus the keys of each pattern.
     */
    [[nodiscard]] core::Expected<Signal> generate(const ParamSet &params) override;
    [[nodiscard]] SignalFamily family() const noexcept override { return SignalFamily::kEmg; }

    [[nodiscard]] core::Expected<Signal> simulateIsometric(core::f64 intensity, core::f64 fatigueRate = 0.0);
    [[nodiscard]] core::Expected<Signal> simulateDynamic(const DynamicParams &params);
    [[nodiscard]] core::Expected<Signal> simulateRepetitive(const RepetitiveParams &params);
    [[nodiscard]] core::Expected<Signal> simulateComplex(const ComplexParams &params);

    /** @brief Point process driven by a per-sample intensity envelope. */
    [[nodiscard]] static core::Expected<Signal> fromEnvelope(
        const TimeBase &timeBase, std::span<const core::f64> intensity, math::Rng &rng);

    [[nodiscard]] static core::Expected<Signal> isometric(
        const TimeBase &timeBase, core::f64 intensity, math::Rng &rng);

    [[nodiscard]] static core::Expected<Signal> dynamic(
        const TimeBase &timeBase, const DynamicParams &params, math::Rng &rng);

    [[nodiscard]] static core::Expected<Signal> repetitive(
        const TimeBase &timeBase, const RepetitiveParams &params, math::Rng &rng);

    /** @return kInvalidParameter when the segments do not fit in @p timeBase */
    [[nodiscard]] static core::Expected<Signal> complexSequence(
        const TimeBase &timeBase, const ComplexParams &params, math::Rng &rng);

    /** @brief Multiplies @p signal by exp(-rate t / T). */
    [[nodiscard]] static core::ExpectedVoid applyFatigue(
        Signal &signal, const TimeBase &timeBase, core::f64 rate);
};

} // namespace bio::synth
