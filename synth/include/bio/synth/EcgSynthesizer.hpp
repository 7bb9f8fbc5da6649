/**
 * @file EcgSynthesizer.hpp
 * @brief Beat-scheduled ECG with arrhythmia, ischemia and conduction variants.
 *
 * Each beat time is the QRS onset. The P wave starts pr_interval earlier
 * and the T wave starts max(qt_offset, qrs_duration + 50 ms) later. A
 * condition is a strategy function selected from a lookup table; it
 * receives the shared time base, morphology kernels and random stream and
 * adds its beats into the output. Kernels that do not fit the buffer are
 * handled by the configured BoundaryPolicy (skip by default).
 */

#pragma once

#include "bio/core/Constants.hpp"
#include "bio/synth/Placement.hpp"
#include "bio/synth/Simulator.hpp"

#include <optional>

namespace bio::synth {

enum class EcgCondition : core::u8 {
    kNormal,
    kPvc,
    kAtrialFibrillation,
    kBradycardia,
    kTachycardia,
    kHeartBlock,
    kStElevation,
    kStDepression,
    kTWaveInversion,
    kQWave,
    kLbbb,
    kRbbb,
    kWpw,
    kLafb
};

[[nodiscard]] std::string_view ecgConditionName(EcgCondition condition) noexcept;
[[nodiscard]] core::Expected<EcgCondition> parseEcgCondition(std::string_view name);

/**
 * @brief P, QRS and T wave shapes of a normal beat.
 */
struct WaveMorphology {
    core::f64 pAmplitude = 0.2;
    core::f64 pDuration = 0.1;
    core::f64 qAmplitude = -0.5;
    core::f64 rAmplitude = 1.0;
    core::f64 sAmplitude = -0.2;
    core::f64 qrsDuration = 0.1;
    core::f64 tAmplitude = 0.3;
    core::f64 tDuration = 0.14;
    core::f64 prInterval = core::kPrInterval;
    core::f64 qtOffset = core::kQtOffset;
};

struct EcgParams {
    EcgCondition condition = EcgCondition::kNormal;
    core::f64 heartRate = core::kDefaultHeartRate;
    core::f64 severity = 0.5;
    core::f64 hrvStd = 0.0;
    core::f64 pvcFrequency = 0.2;
    /// Defaults to 0.7 x heartRate.
    std::optional<core::f64> afRateMin;
    /// Defaults to 1.5 x heartRate.
    std::optional<core::f64> afRateMax;
    int heartBlockDegree = 1;
    core::f64 escapeRate = core::kDefaultEscapeRate;
    BoundaryPolicy boundaryPolicy = BoundaryPolicy::kSkip;
    WaveMorphology morphology;
};

class EcgSynthesizer final : public Simulator {
public:
    explicit EcgSynthesizer(TimeBase timeBase, std::optional<core::u64> seed = std::nullopt);

    /**
     * @brief Keys: condition, heart_rate, severity, hrv_std, pvc_frequency,
     *        af_rate_min, af_rate_max, heart_block_degree, escape_rate,
     *        boundary_policy and the morphology overrides p_amplitude,
     *        p_duration, q_amp, r_amp, s_amp, qrs_duration, t_amplitude,
     *        t_duration, pr_interval.
     */
    [[nodiscard]] core::Expected<Signal> generate(const ParamSet &params) override;
    [[nodiscard]] SignalFamily family() const noexcept override { return SignalFamily::kEcg; }

    [[nodiscard]] core::Expected<Signal> simulateNormalSinus(
        core::f64 heartRate = core::kDefaultHeartRate,
        core::f64 hrvStd = 0.0,
        const WaveMorphology &morphology = {});

    [[nodiscard]] core::Expected<Signal> simulate(const EcgParams &params);

    /**
     * @brief Validates @p params and renders them over @p timeBase.
     * @return kInvalidParameter for out-of-range rates, severities or durations
     */
    [[nodiscard]] static core::Expected<Signal> render(
        const TimeBase &timeBase, const EcgParams &params, math::Rng &rng);
};

} // namespace bio::synth
