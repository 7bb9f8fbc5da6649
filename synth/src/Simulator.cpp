/**
 * @file Simulator.cpp
 * @brief Simulator base: time base resolution, seeding, noise and artifact composition.
 */

#include "bio/synth/Simulator.hpp"
#include "bio/core/Log.hpp"
#include "bio/synth/NoiseSynthesizer.hpp"
#include "bio/synth/Placement.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace bio::synth {

using core::Error;
using core::ErrorCode;
using core::f64;
using core::usize;

std::string_view signalFamilyName(SignalFamily family) noexcept
{
    switch (family) {
        case SignalFamily::kEmg:   return "emg";
        case SignalFamily::kEcg:   return "ecg";
        case SignalFamily::kEog:   return "eog";
        case SignalFamily::kNoise: return "noise";
    }
    return "unknown";
}

core::Expected<SignalFamily> parseSignalFamily(std::string_view name)
{
    for (const auto family : {SignalFamily::kEmg, SignalFamily::kEcg, SignalFamily::kEog, SignalFamily::kNoise}) {
        if (signalFamilyName(family) == name)
            return family;
    }
    return std::unexpected(
        Error::make(ErrorCode::kUnsupportedType, "unknown signal family '" + std::string(name) + "'"));
}

Simulator::Simulator(TimeBase timeBase, std::optional<core::u64> seed)
    : _timeBase(std::move(timeBase))
    , _rng(seed)
{
}

core::Expected<TimeBase> Simulator::resolveTimeBase(const ParamSet &params, std::string_view key) const
{
    const auto requested = BIO_TRY(params.optionalReal(key));
    if (!requested)
        return _timeBase;

    BIO_TRY_VOID(requirePositive(key, *requested));
    if (*requested > _timeBase.duration() + 1e-12) {
        std::ostringstream os;
        os << key << " " << *requested << " s exceeds the configured duration of "
           << _timeBase.duration() << " s";
        return std::unexpected(Error::make(ErrorCode::kInvalidParameter, os.str()));
    }
    return _timeBase.withDuration(*requested);
}

core::ExpectedVoid Simulator::applySeed(const ParamSet &params)
{
    if (!params.has("random_seed"))
        return {};

    const core::i64 seed = BIO_TRY(params.integer("random_seed", 0));
    BIO_TRY_VOID(requireNonNegative("random_seed", static_cast<f64>(seed)));
    _rng.seed(static_cast<core::u64>(seed));
    return {};
}

core::ExpectedVoid Simulator::checkLength(const Signal &signal) const
{
    if (signal.size() != _timeBase.sampleCount()) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidParameter,
                "signal has " + std::to_string(signal.size()) + " samples, expected " +
                std::to_string(_timeBase.sampleCount())));
    }
    return {};
}

core::Expected<Signal> Simulator::addNoise(
    const Signal &signal, std::string_view noiseType, const ParamSet &params)
{
    BIO_TRY_VOID(checkLength(signal));
    BIO_TRY_VOID(applySeed(params));

    const Signal noise = BIO_TRY(NoiseSynthesizer::render(noiseType, _timeBase, params, _rng));
    params.warnUnused("SIM");
    return addSignals(signal, noise);
}

core::Expected<Signal> Simulator::addArtifact(
    const Signal &signal,
    std::string_view artifactType,
    f64 startTime,
    f64 duration,
    f64 amplitude)
{
    BIO_TRY_VOID(checkLength(signal));
    BIO_TRY_VOID(requireInRange("start_time", startTime, 0.0, std::nextafter(_timeBase.duration(), 0.0)));
    BIO_TRY_VOID(requirePositive("duration", duration));
    if (!std::isfinite(amplitude)) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidParameter, "amplitude must be finite"));
    }

    const core::isize start = _timeBase.indexAt(startTime);
    if (start < 0 || static_cast<usize>(start) >= signal.size()) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidParameter, "start_time falls outside the signal"));
    }
    const usize length = std::max<usize>(_timeBase.samplesFor(duration), 1);
    Signal out(signal);

    if (artifactType == "spike") {
        out[static_cast<usize>(start)] += amplitude;
        return out;
    }
    if (artifactType == "step") {
        const Signal plateau(length, amplitude);
        placeKernel(out, plateau, start, 1.0, BoundaryPolicy::kClip);
        return out;
    }

    const auto type = parseArtifactType(artifactType);
    if (!type) {
        return std::unexpected(
            Error::make(ErrorCode::kUnsupportedType,
                "unknown artifact type '" + std::string(artifactType) + "'"));
    }

    switch (*type) {
        case ArtifactType::kElectrodePop:
        case ArtifactType::kElectrodeMovement:
        case ArtifactType::kCableMotion:
        case ArtifactType::kBaselineShift:
        case ArtifactType::kImpedanceChange:
            break;
        default:
            return std::unexpected(
                Error::make(ErrorCode::kUnsupportedType,
                    "artifact type '" + std::string(artifactType) + "' cannot be placed at a given time"));
    }

    const Signal burst = BIO_TRY(NoiseSynthesizer::burstShape(
        *type, length, amplitude, _timeBase.samplingRate(), _rng));
    placeKernel(out, burst, start, 1.0, BoundaryPolicy::kClip);
    return out;
}

core::Expected<Signal> Simulator::applyNoiseLayers(const Signal &signal, std::span<const NoiseLayer> layers)
{
    Signal out(signal);
    usize applied = 0;
    for (const auto &layer : layers) {
        if (!layer.enabled)
            continue;
        out = BIO_TRY(addNoise(out, layer.type, layer.params));
        ++applied;
    }
    core::Log::debug("SIM", "applied " + std::to_string(applied) + " noise layers");
    return out;
}

} // namespace bio::synth
