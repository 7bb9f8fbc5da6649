/**
 * @file EogSynthesizer.hpp
 * @brief Eye-movement traces in degrees of gaze angle.
 *
 * Saccades integrate the asymmetric velocity kernel and follow the
 * oculomotor main sequence (duration 20 ms + 2 ms/deg, peak velocity
 * 200 deg/s + 20 deg/s per deg) unless overridden. Pursuit, fixation and
 * blinks are rendered over the whole time base.
 */

#pragma once

#include "bio/synth/Simulator.hpp"

namespace bio::synth {

enum class EyeMovement : core::u8 {
    kSaccades,
    kPursuit,
    kFixation,
    kBlinks
};

enum class GazeDirection : core::u8 {
    kHorizontal,
    kVertical,
    kUp,
    kDown ///< Vertical with the sign flipped.
};

enum class PursuitPattern : core::u8 {
    kLinear,
    kSinusoidal,
    kCircular,
    kCustom
};

[[nodiscard]] core::Expected<EyeMovement> parseEyeMovement(std::string_view name);
[[nodiscard]] core::Expected<GazeDirection> parseGazeDirection(std::string_view name);
[[nodiscard]] core::Expected<PursuitPattern> parsePursuitPattern(std::string_view name);

struct SaccadeParams {
    std::vector<core::f64> amplitudes{20.0};
    /// Empty means horizontal; a single entry applies to every saccade.
    std::vector<GazeDirection> directions;
    /// Empty means main sequence; a single entry applies to every saccade.
    std::vector<core::f64> durations;
    std::vector<core::f64> peakVelocities;
    bool holdPosition = false;
};

struct PursuitParams {
    PursuitPattern pattern = PursuitPattern::kLinear;
    core::f64 amplitude = 10.0;
    core::f64 frequency = 0.5;
    GazeDirection direction = GazeDirection::kHorizontal;
    std::vector<core::f64> trajectory;
};

struct FixationParams {
    core::f64 driftAmplitude = 0.5;
    core::f64 tremorAmplitude = 0.1;
    core::f64 microsaccadeRate = 2.0;
    core::f64 microsaccadeAmplitude = 0.2;
};

struct BlinkParams {
    core::usize count = 3;
    core::f64 duration = 0.2;
    core::f64 amplitudeMin = 0.8;
    core::f64 amplitudeMax = 1.2;
    core::f64 minInterval = 0.5;
    bool naturalVariability = true;
};

class EogSynthesizer final : public Simulator {
public:
    explicit EogSynthesizer(TimeBase timeBase, std::optional<core::u64> seed = std::nullopt);

    /**
     * @brief Keys: movement_type (saccades), amplitude (10), n_saccades (5),
     *        amplitudes, direction(s), durations, peak_velocities,
     *        hold_position, pattern, frequency, trajectory, the fixation
     *        keys, add_blinks and the blink keys (n_blinks, blink_duration,
     *        blink_amplitude_min/max, min_blink_interval,
     *        natural_blink_variability).
     */
    [[nodiscard]] core::Expected<Signal> generate(const ParamSet &params) override;
    [[nodiscard]] SignalFamily family() const noexcept override { return SignalFamily::kEog; }

    [[nodiscard]] core::Expected<Signal> simulateSaccades(const SaccadeParams &params);
    [[nodiscard]] core::Expected<Signal> simulatePursuit(const PursuitParams &params);
    [[nodiscard]] core::Expected<Signal> simulateFixation(const FixationParams &params);
    [[nodiscard]] core::Expected<Signal> simulateBlinks(const BlinkParams &params);

    /** @brief Sequential saccades with a 50 ms gap. Saccades that overrun the buffer are skipped. */
    [[nodiscard]] static core::Expected<Signal> saccades(
        const TimeBase &timeBase, const SaccadeParams &params, math::Rng &rng);

    [[nodiscard]] static core::Expected<Signal> pursuit(
        const TimeBase &timeBase, const PursuitParams &params, math::Rng &rng);

    /** @brief Random-walk drift, 80 + 160 Hz tremor and Poisson microsaccades. */
    [[nodiscard]] static core::Expected<Signal> fixation(
        const TimeBase &timeBase, const FixationParams &params, math::Rng &rng);

    /**
     * @return kInsufficientDuration when the blinks and their minimum
     *         intervals cannot fit in @p timeBase
     */
    [[nodiscard]] static core::Expected<Signal> blinks(
        const TimeBase &timeBase, const BlinkParams &params, math::Rng &rng);
};

} // namespace bio::synth
