/**
 * @file EmgSynthesizer.cpp
 * @brief MUAP point process and contraction envelopes.
 */

#include "bio/synth/EmgSynthesizer.hpp"
#include "bio/core/Constants.hpp"
#include "bio/core/Log.hpp"
#include "bio/math/Statistics.hpp"
#include "bio/synth/Kernels.hpp"
#include "bio/synth/Placement.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <numbers>
#include <sstream>

namespace bio::synth {

using core::Error;
using core::ErrorCode;
using core::f64;
using core::usize;

namespace {

constexpr std::string_view kTag = "EMG";

template <typename Enum, usize N>
core::Expected<Enum> lookupName(
    const std::array<std::pair<std::string_view, Enum>, N> &table,
    std::string_view name,
    std::string_view what)
{
    for (const auto &[key, value] : table) {
        if (key == name)
            return value;
    }
    return std::unexpected(
        Error::make(ErrorCode::kUnsupportedType,
            "unknown " + std::string(what) + " '" + std::string(name) + "'"));
}

constexpr std::array<std::pair<std::string_view, RampType>, 6> kRampNames{{
    {"linear",      RampType::kLinear},
    {"ramp",        RampType::kLinear},
    {"exponential", RampType::kExponential},
    {"step",        RampType::kStep},
    {"sine",        RampType::kSine},
    {"custom",      RampType::kCustom},
}};

constexpr std::array<std::pair<std::string_view, MovementType>, 4> kMovementNames{{
    {"isometric",  MovementType::kIsometric},
    {"dynamic",    MovementType::kDynamic},
    {"repetitive", MovementType::kRepetitive},
    {"rest",       MovementType::kRest},
}};

// ─── ParamSet adapters ───────────────────────────────────────────────────────

core::Expected<f64> readIntensity(const ParamSet &params, f64 fallback)
{
    const std::string_view key = params.has("intensity") ? "intensity" : "activation_level";
    const f64 value = BIO_TRY(params.real(key, fallback));
    BIO_TRY_VOID(requireInRange("intensity", value, 0.0, 1.0));
    return value;
}

using PatternRenderer = core::Expected<Signal> (*)(const TimeBase &, const ParamSet &, math::Rng &);

core::Expected<Signal> isometricFromParams(const TimeBase &tb, const ParamSet &params, math::Rng &rng)
{
    const f64 intensity = BIO_TRY(readIntensity(params, 0.5));
    return EmgSynthesizer::isometric(tb, intensity, rng);
}

core::Expected<Signal> dynamicFromParams(const TimeBase &tb, const ParamSet &params, math::Rng &rng)
{
    DynamicParams dyn;
    const std::string ramp = BIO_TRY(params.keyword("ramp_type", "linear"));
    dyn.rampType = BIO_TRY(parseRampType(ramp));
    dyn.maxIntensity = BIO_TRY(params.real("max_intensity", dyn.maxIntensity));
    dyn.frequency = BIO_TRY(params.real("frequency", dyn.frequency));
    dyn.envelope = BIO_TRY(params.reals("envelope"));
    return EmgSynthesizer::dynamic(tb, dyn, rng);
}

core::Expected<Signal> repetitiveFromParams(const TimeBase &tb, const ParamSet &params, math::Rng &rng)
{
    RepetitiveParams rep;
    rep.frequency = BIO_TRY(params.real("frequency", rep.frequency));
    rep.dutyCycle = BIO_TRY(params.real("duty_cycle", rep.dutyCycle));
    rep.intensity = BIO_TRY(readIntensity(params, rep.intensity));
    rep.restIntensity = BIO_TRY(params.real("rest_intensity", rep.restIntensity));
    return EmgSynthesizer::repetitive(tb, rep, rng);
}

core::Expected<Signal> complexFromParams(const TimeBase &tb, const ParamSet &params, math::Rng &rng)
{
    const auto movements = BIO_TRY(params.keywords("movements"));
    const auto durations = BIO_TRY(params.reals("durations"));
    const auto intensities = BIO_TRY(params.reals("intensities"));

    if (movements.empty()) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidParameter, "complex pattern needs at least one movement"));
    }
    if (durations.size() != movements.size() || intensities.size() != movements.size()) {
        std::ostringstream os;
        os << "movements, durations and intensities must have equal lengths, got "
           << movements.size() << ", " << durations.size() << " and " << intensities.size();
        return std::unexpected(Error::make(ErrorCode::kInvalidParameter, os.str()));
    }

    ComplexParams cplx;
    cplx.overlap = BIO_TRY(params.boolean("overlap", false));
    for (usize i = 0; i < movements.size(); ++i) {
        const MovementType movement = BIO_TRY(parseMovementType(movements[i]));
        cplx.segments.push_back({movement, durations[i], intensities[i]});
    }
    return EmgSynthesizer::complexSequence(tb, cplx, rng);
}

struct PatternEntry {
    std::string_view name;
    EmgPattern pattern;
    PatternRenderer render;
};

constexpr std::array<PatternEntry, 4> kPatternTable{{
    {"isometric",  EmgPattern::kIsometric,  &isometricFromParams},
    {"dynamic",    EmgPattern::kDynamic,    &dynamicFromParams},
    {"repetitive", EmgPattern::kRepetitive, &repetitiveFromParams},
    {"complex",    EmgPattern::kComplex,    &complexFromParams},
}};

} // namespace

core::Expected<EmgPattern> parseEmgPattern(std::string_view name)
{
    for (const auto &entry : kPatternTable) {
        if (entry.name == name)
            return entry.pattern;
    }
    return std::unexpected(
        Error::make(ErrorCode::kUnsupportedType, "unknown EMG pattern '" + std::string(name) + "'"));
}

core::Expected<RampType> parseRampType(std::string_view name)
{
    return lookupName(kRampNames, name, "ramp type");
}

core::Expected<MovementType> parseMovementType(std::string_view name)
{
    return lookupName(kMovementNames, name, "movement type");
}

EmgSynthesizer::EmgSynthesizer(TimeBase timeBase, std::optional<core::u64> seed)
    : Simulator(std::move(timeBase), seed)
{
}

// ─── Static renderers ────────────────────────────────────────────────────────

core::Expected<Signal> EmgSynthesizer::fromEnvelope(
    const TimeBase &timeBase, std::span<const f64> intensity, math::Rng &rng)
{
    if (intensity.size() != timeBase.sampleCount()) {
        return std::unexpected(
            Error::make(ErrorCode::kSizeMismatch,
                "intensity envelope has " + std::to_string(intensity.size()) +
                " samples, expected " + std::to_string(timeBase.sampleCount())));
    }

    const WaveformKernel muap = BIO_TRY(Kernels::muap(timeBase.samplingRate()));
    const f64 fs = timeBase.samplingRate();

    Signal out = timeBase.zeros();
    for (usize i = 0; i < out.size(); ++i) {
        const f64 level = std::clamp(intensity[i], 0.0, 1.0);
        const f64 rate = core::kMuBaseFiringRate + core::kMuFiringRateGain * level;
        if (!rng.bernoulli(std::min(1.0, rate / fs)))
            continue;

        const f64 gain = (core::kMuapBaseAmplitude + core::kMuapAmplitudeGain * level) *
                         rng.uniform(0.9, 1.1);
        placeKernel(out, muap.samples, static_cast<core::isize>(i), gain, BoundaryPolicy::kClip);
    }
    return out;
}

core::Expected<Signal> EmgSynthesizer::isometric(const TimeBase &timeBase, f64 intensity, math::Rng &rng)
{
    BIO_TRY_VOID(requireInRange("intensity", intensity, 0.0, 1.0));
    const std::vector<f64> envelope(timeBase.sampleCount(), intensity);
    return fromEnvelope(timeBase, envelope, rng);
}

core::Expected<Signal> EmgSynthesizer::dynamic(const TimeBase &timeBase, const DynamicParams &params, math::Rng &rng)
{
    BIO_TRY_VOID(requireInRange("max_intensity", params.maxIntensity, 0.0, 1.0));

    const usize n = timeBase.sampleCount();
    const f64 T = timeBase.duration();
    const f64 peak = params.maxIntensity;
    std::vector<f64> envelope(n);

    switch (params.rampType) {
        case RampType::kLinear:
            for (usize i = 0; i < n; ++i)
                envelope[i] = peak * timeBase.timeAt(i) / T;
            break;

        case RampType::kExponential: {
            const f64 norm = std::exp(3.0) - 1.0;
            for (usize i = 0; i < n; ++i)
                envelope[i] = peak * (std::exp(3.0 * timeBase.timeAt(i) / T) - 1.0) / norm;
            break;
        }

        case RampType::kStep:
            for (usize i = 0; i < n; ++i)
                envelope[i] = timeBase.timeAt(i) < T / 2.0 ? 0.0 : peak;
            break;

        case RampType::kSine:
            BIO_TRY_VOID(requirePositive("frequency", params.frequency));
            for (usize i = 0; i < n; ++i) {
                envelope[i] = peak / 2.0 *
                    (1.0 + std::sin(2.0 * std::numbers::pi * params.frequency * timeBase.timeAt(i)));
            }
            break;

        case RampType::kCustom:
            for (const f64 v : params.envelope)
                BIO_TRY_VOID(requireInRange("envelope value", v, 0.0, 1.0));
            envelope = BIO_TRY(math::Statistics::resampleLinear(params.envelope, n));
            break;
    }

    return fromEnvelope(timeBase, envelope, rng);
}

core::Expected<Signal> EmgSynthesizer::repetitive(
    const TimeBase &timeBase, const RepetitiveParams &params, math::Rng &rng)
{
    BIO_TRY_VOID(requirePositive("frequency", params.frequency));
    BIO_TRY_VOID(requireInRange("duty_cycle", params.dutyCycle, 0.0, 1.0));
    BIO_TRY_VOID(requireInRange("intensity", params.intensity, 0.0, 1.0));
    BIO_TRY_VOID(requireInRange("rest_intensity", params.restIntensity, 0.0, 1.0));

    std::vector<f64> envelope(timeBase.sampleCount());
    for (usize i = 0; i < envelope.size(); ++i) {
        const f64 cycle = timeBase.timeAt(i) * params.frequency;
        envelope[i] = (cycle - std::floor(cycle) < params.dutyCycle)
            ? params.intensity
            : params.restIntensity;
    }
    return fromEnvelope(timeBase, envelope, rng);
}

core::Expected<Signal> EmgSynthesizer::complexSequence(
    const TimeBase &timeBase, const ComplexParams &params, math::Rng &rng)
{
    f64 total = 0.0;
    for (const auto &segment : params.segments) {
        BIO_TRY_VOID(requirePositive("segment duration", segment.duration));
        BIO_TRY_VOID(requireInRange("segment intensity", segment.intensity, 0.0, 1.0));
        total = params.overlap ? std::max(total, segment.duration) : total + segment.duration;
    }
    if (total > timeBase.duration() + 1e-9) {
        std::ostringstream os;
        os << "movement sequence lasts " << total << " s but only "
           << timeBase.duration() << " s are available";
        return std::unexpected(Error::make(ErrorCode::kInvalidParameter, os.str()));
    }

    Signal out = timeBase.zeros();
    f64 start = 0.0;
    for (const auto &segment : params.segments) {
        const TimeBase segmentBase = BIO_TRY(timeBase.withDuration(segment.duration));

        Signal piece;
        switch (segment.movement) {
            case MovementType::kIsometric:
                piece = BIO_TRY(isometric(segmentBase, segment.intensity, rng));
                break;
            case MovementType::kDynamic:
                piece = BIO_TRY(dynamic(segmentBase,
                    DynamicParams{.rampType = RampType::kLinear, .maxIntensity = segment.intensity}, rng));
                break;
            case MovementType::kRepetitive:
                piece = BIO_TRY(repetitive(segmentBase,
                    RepetitiveParams{.intensity = segment.intensity}, rng));
                break;
            case MovementType::kRest:
                break;
        }

        placeKernel(out, piece, timeBase.indexAt(start), 1.0, BoundaryPolicy::kClip);
        if (!params.overlap)
            start += segment.duration;
    }
    return out;
}

core::ExpectedVoid EmgSynthesizer::applyFatigue(Signal &signal, const TimeBase &timeBase, f64 rate)
{
    BIO_TRY_VOID(requireNonNegative("fatigue_rate", rate));
    const f64 T = timeBase.duration();
    for (usize i = 0; i < signal.size(); ++i)
        signal[i] *= std::exp(-rate * timeBase.timeAt(i) / T);
    return {};
}

// ─── Instance API ────────────────────────────────────────────────────────────

core::Expected<Signal> EmgSynthesizer::simulateIsometric(f64 intensity, f64 fatigueRate)
{
    Signal out = BIO_TRY(isometric(timeBase(), intensity, rng()));
    BIO_TRY_VOID(applyFatigue(out, timeBase(), fatigueRate));
    return out;
}

core::Expected<Signal> EmgSynthesizer::simulateDynamic(const DynamicParams &params)
{
    return dynamic(timeBase(), params, rng());
}

core::Expected<Signal> EmgSynthesizer::simulateRepetitive(const RepetitiveParams &params)
{
    return repetitive(timeBase(), params, rng());
}

core::Expected<Signal> EmgSynthesizer::simulateComplex(const ComplexParams &params)
{
    return complexSequence(timeBase(), params, rng());
}

core::Expected<Signal> EmgSynthesizer::generate(const ParamSet &params)
{
    BIO_TRY_VOID(applySeed(params));
    const TimeBase tb = BIO_TRY(resolveTimeBase(params));

    const std::string name = BIO_TRY(params.keyword("pattern_type", "isometric"));
    const EmgPattern pattern = BIO_TRY(parseEmgPattern(name));

    f64 fatigueRate = BIO_TRY(params.real("fatigue_rate", 0.0));
    const bool fatigue = BIO_TRY(params.boolean("fatigue", false));
    if (fatigue && fatigueRate == 0.0)
        fatigueRate = core::kDefaultFatigueRate;

    Signal out = BIO_TRY(kPatternTable[static_cast<usize>(pattern)].render(tb, params, rng()));
    BIO_TRY_VOID(applyFatigue(out, tb, fatigueRate));

    params.warnUnused(kTag);
    core::Log::debug(kTag, "rendered " + name + " pattern over " + std::to_string(tb.sampleCount()) + " samples");
    return out;
}

} // namespace bio::synth
