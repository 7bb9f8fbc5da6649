/**
 * @file NoiseSynthesizer.hpp
 * @brief Background noise and transient artifact generator.
 *
 * Continuous noise (gaussian, pink, brown, powerline, baseline wander,
 * high-frequency) and twelve artifact classes grouped in three families:
 * motion, electrode and interference. Every type is dispatched through a
 * name/enum lookup table; names that are not in the table are rejected
 * with kUnsupportedType.
 *
 * Bursty artifacts draw each start time uniformly in
 * [0, signal_duration - event_duration] and are clipped at the end of
 * the buffer.
 */

#pragma once

#include "bio/synth/Simulator.hpp"

namespace bio::synth {

enum class NoiseType : core::u8 {
    kGaussian,
    kPink,
    kBrown,
    kPowerline,
    kBaselineWander,
    kHighFrequency
};

enum class ArtifactFamily : core::u8 {
    kMotion,
    kElectrode,
    kInterference
};

enum class ArtifactType : core::u8 {
    kElectrodeMovement,
    kCableMotion,
    kSubjectMovement,
    kBaselineShift,
    kPoorContact,
    kElectrodePop,
    kImpedanceChange,
    kDcOffset,
    kEmgCrosstalk,
    kEcgInterference,
    kEnvironmental,
    kDevice
};

[[nodiscard]] std::string_view noiseTypeName(NoiseType type) noexcept;
[[nodiscard]] core::Expected<NoiseType> parseNoiseType(std::string_view name);

[[nodiscard]] std::string_view artifactTypeName(ArtifactType type) noexcept;
[[nodiscard]] core::Expected<ArtifactType> parseArtifactType(std::string_view name);
[[nodiscard]] ArtifactFamily artifactFamily(ArtifactType type) noexcept;

class NoiseSynthesizer final : public Simulator {
public:
    explicit NoiseSynthesizer(TimeBase timeBase, std::optional<core::u64> seed = std::nullopt);

    /**
     * @brief Dispatches on "noise_type" (default "gaussian"), which may name
     *        a noise type or any artifact type.
     */
    [[nodiscard]] core::Expected<Signal> generate(const ParamSet &params) override;
    [[nodiscard]] SignalFamily family() const noexcept override { return SignalFamily::kNoise; }

    [[nodiscard]] core::Expected<Signal> simulateNoise(NoiseType type, const ParamSet &params = {});
    [[nodiscard]] core::Expected<Signal> simulateArtifact(ArtifactType type, const ParamSet &params = {});

    /** @brief As simulateArtifact, restricted to the motion family. */
    [[nodiscard]] core::Expected<Signal> simulateMotionArtifacts(ArtifactType type, const ParamSet &params = {});
    /** @brief As simulateArtifact, restricted to the electrode family. */
    [[nodiscard]] core::Expected<Signal> simulateElectrodeArtifacts(ArtifactType type, const ParamSet &params = {});
    /** @brief As simulateArtifact, restricted to the interference family. */
    [[nodiscard]] core::Expected<Signal> simulateInterference(ArtifactType type, const ParamSet &params = {});

    [[nodiscard]] static core::Expected<Signal> renderNoise(
        NoiseType type, const TimeBase &timeBase, const ParamSet &params, math::Rng &rng);

    [[nodiscard]] static core::Expected<Signal> renderArtifact(
        ArtifactType type, const TimeBase &timeBase, const ParamSet &params, math::Rng &rng);

    /** @brief Renders a noise or artifact type given by name. */
    [[nodiscard]] static core::Expected<Signal> render(
        std::string_view name, const TimeBase &timeBase, const ParamSet &params, math::Rng &rng);

    /**
     * @brief One burst of a bursty artifact type, @p length samples long.
     * @return kUnsupportedType for dc_offset, ecg, environmental and device
     */
    [[nodiscard]] static core::Expected<Signal> burstShape(
        ArtifactType type, core::usize length, core::f64 amplitude,
        core::f64 samplingRate, math::Rng &rng);

private:
    [[nodiscard]] core::Expected<Signal> simulateInFamily(
        ArtifactType type, ArtifactFamily family, const ParamSet &params);
    [[nodiscard]] core::Expected<Signal> run(std::string_view name, const ParamSet &params);
};

} // namespace bio::synth
