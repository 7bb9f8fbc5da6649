/**
 * @file EogSynthesizer.cpp
 * @brief Saccade kinematics, pursuit trajectories, fixational motion and blinks.
 */

#include "bio/synth/EogSynthesizer.hpp"
#include "bio/core/Constants.hpp"
#include "bio/core/Log.hpp"
#include "bio/math/Statistics.hpp"
#include "bio/synth/Kernels.hpp"
#include "bio/synth/Placement.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <numbers>
#include <sstream>

namespace bio::synth {

using core::Error;
using core::ErrorCode;
using core::f64;
using core::usize;

namespace {

constexpr std::string_view kTag = "EOG";
constexpr usize kBlinkAttemptsPerBlink = 1000;

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

constexpr std::array<std::pair<std::string_view, GazeDirection>, 4> kDirectionNames{{
    {"horizontal", GazeDirection::kHorizontal},
    {"vertical",   GazeDirection::kVertical},
    {"up",         GazeDirection::kUp},
    {"down",       GazeDirection::kDown},
}};

constexpr std::array<std::pair<std::string_view, PursuitPattern>, 4> kPursuitNames{{
    {"linear",     PursuitPattern::kLinear},
    {"sinusoidal", PursuitPattern::kSinusoidal},
    {"circular",   PursuitPattern::kCircular},
    {"custom",     PursuitPattern::kCustom},
}};

constexpr f64 directionSign(GazeDirection direction) noexcept
{
    return direction == GazeDirection::kDown ? -1.0 : 1.0;
}

f64 mainSequenceDuration(f64 amplitude) noexcept
{
    return core::kSaccadeBaseDuration + core::kSaccadeDurationSlope * std::abs(amplitude);
}

f64 mainSequenceVelocity(f64 amplitude) noexcept
{
    return core::kSaccadeBaseVelocity + core::kSaccadeVelocitySlope * std::abs(amplitude);
}

/// Per-saccade lists hold zero, one or one value per saccade.
template <typename T>
core::ExpectedVoid checkBroadcast(std::string_view name, const std::vector<T> &values, usize count)
{
    if (values.size() <= 1 || values.size() == count)
        return {};
    std::ostringstream os;
    os << name << " has " << values.size() << " entries for " << count << " saccades";
    return std::unexpected(Error::make(ErrorCode::kInvalidParameter, os.str()));
}

template <typename T>
T pick(const std::vector<T> &values, usize i, T fallback)
{
    if (values.empty())
        return fallback;
    return values.size() == 1 ? values.front() : values[i];
}

// ─── ParamSet adapters ───────────────────────────────────────────────────────

core::Expected<GazeDirection> readDirection(const ParamSet &params)
{
    const std::string name = BIO_TRY(params.keyword("direction", "horizontal"));
    return parseGazeDirection(name);
}

/// In saccade mode "pattern" names the direction shared by every saccade.
core::Expected<GazeDirection> readSaccadePattern(const ParamSet &params)
{
    const std::string name = BIO_TRY(params.keyword("pattern", "horizontal"));
    auto direction = parseGazeDirection(name);
    if (!direction) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidParameter,
                "saccade pattern '" + name + "' is not a gaze direction"));
    }
    return *direction;
}

core::Expected<BlinkParams> readBlinkParams(const ParamSet &params)
{
    BlinkParams blink;
    const core::i64 count = BIO_TRY(params.integer("n_blinks", static_cast<core::i64>(blink.count)));
    BIO_TRY_VOID(requireNonNegative("n_blinks", static_cast<f64>(count)));
    blink.count = static_cast<usize>(count);
    blink.duration = BIO_TRY(params.real("blink_duration", blink.duration));
    blink.amplitudeMin = BIO_TRY(params.real("blink_amplitude_min", blink.amplitudeMin));
    blink.amplitudeMax = BIO_TRY(params.real("blink_amplitude_max", blink.amplitudeMax));
    blink.minInterval = BIO_TRY(params.real("min_blink_interval", blink.minInterval));
    blink.naturalVariability = BIO_TRY(params.boolean("natural_blink_variability", blink.naturalVariability));
    return blink;
}

using MovementRenderer = core::Expected<Signal> (*)(const TimeBase &, const ParamSet &, math::Rng &);

core::Expected<Signal> saccadesFromParams(const TimeBase &tb, const ParamSet &params, math::Rng &rng)
{
    SaccadeParams sac;
    if (params.has("amplitudes")) {
        sac.amplitudes = BIO_TRY(params.reals("amplitudes"));
    } else {
        const f64 amplitude = BIO_TRY(params.real("amplitude", 10.0));
        const core::i64 count = BIO_TRY(params.integer("n_saccades", 5));
        BIO_TRY_VOID(requirePositive("n_saccades", static_cast<f64>(count)));
        sac.amplitudes.clear();
        for (core::i64 i = 0; i < count; ++i)
            sac.amplitudes.push_back(rng.uniform(-std::abs(amplitude), std::abs(amplitude)));
    }

    if (params.has("directions")) {
        for (const auto &name : BIO_TRY(params.keywords("directions")))
            sac.directions.push_back(BIO_TRY(parseGazeDirection(name)));
    } else if (!params.has("direction") && params.has("pattern")) {
        sac.directions.push_back(BIO_TRY(readSaccadePattern(params)));
    } else {
        sac.directions.push_back(BIO_TRY(readDirection(params)));
    }

    sac.durations = BIO_TRY(params.reals("durations"));
    sac.peakVelocities = BIO_TRY(params.reals("peak_velocities"));
    sac.holdPosition = BIO_TRY(params.boolean("hold_position", false));
    return EogSynthesizer::saccades(tb, sac, rng);
}

core::Expected<Signal> pursuitFromParams(const TimeBase &tb, const ParamSet &params, math::Rng &rng)
{
    PursuitParams pur;
    const std::string pattern = BIO_TRY(params.keyword("pattern", "linear"));
    pur.pattern = BIO_TRY(parsePursuitPattern(pattern));
    pur.amplitude = BIO_TRY(params.real("amplitude", pur.amplitude));
    pur.frequency = BIO_TRY(params.real("frequency", pur.frequency));
    pur.direction = BIO_TRY(readDirection(params));
    pur.trajectory = BIO_TRY(params.reals("trajectory"));
    return EogSynthesizer::pursuit(tb, pur, rng);
}

core::Expected<Signal> fixationFromParams(const TimeBase &tb, const ParamSet &params, math::Rng &rng)
{
    FixationParams fix;
    fix.driftAmplitude = BIO_TRY(params.real("drift_amplitude", fix.driftAmplitude));
    fix.tremorAmplitude = BIO_TRY(params.real("tremor_amplitude", fix.tremorAmplitude));
    fix.microsaccadeRate = BIO_TRY(params.real("microsaccade_rate", fix.microsaccadeRate));
    fix.microsaccadeAmplitude = BIO_TRY(params.real("microsaccade_amplitude", fix.microsaccadeAmplitude));
    return EogSynthesizer::fixation(tb, fix, rng);
}

core::Expected<Signal> blinksFromParams(const TimeBase &tb, const ParamSet &params, math::Rng &rng)
{
    const BlinkParams blink = BIO_TRY(readBlinkParams(params));
    return EogSynthesizer::blinks(tb, blink, rng);
}

struct MovementEntry {
    std::string_view name;
    EyeMovement movement;
    MovementRenderer render;
};

constexpr std::array<MovementEntry, 4> kMovementTable{{
    {"saccades", EyeMovement::kSaccades, &saccadesFromParams},
    {"pursuit",  EyeMovement::kPursuit,  &pursuitFromParams},
    {"fixation", EyeMovement::kFixation, &fixationFromParams},
    {"blinks",   EyeMovement::kBlinks,   &blinksFromParams},
}};

constexpr bool tableFollowsEnumOrder()
{
    for (usize i = 0; i < kMovementTable.size(); ++i) {
        if (static_cast<usize>(kMovementTable[i].movement) != i)
            return false;
    }
    return true;
}

static_assert(tableFollowsEnumOrder(), "movement table is indexed by enum value");

} // namespace

core::Expected<EyeMovement> parseEyeMovement(std::string_view name)
{
    for (const auto &entry : kMovementTable) {
        if (entry.name == name)
            return entry.movement;
    }
    return std::unexpected(
        Error::make(ErrorCode::kUnsupportedType, "unknown movement type '" + std::string(name) + "'"));
}

core::Expected<GazeDirection> parseGazeDirection(std::string_view name)
{
    return lookupName(kDirectionNames, name, "gaze direction");
}

core::Expected<PursuitPattern> parsePursuitPattern(std::string_view name)
{
    return lookupName(kPursuitNames, name, "pursuit pattern");
}

EogSynthesizer::EogSynthesizer(TimeBase timeBase, std::optional<core::u64> seed)
    : Simulator(std::move(timeBase), seed)
{
}

// ─── Saccades ────────────────────────────────────────────────────────────────

core::Expected<Signal> EogSynthesizer::saccades(const TimeBase &timeBase, const SaccadeParams &params, math::Rng &)
{
    const usize count = params.amplitudes.size();
    if (count == 0) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidParameter, "at least one saccade amplitude is required"));
    }
    BIO_TRY_VOID(checkBroadcast("directions", params.directions, count));
    BIO_TRY_VOID(checkBroadcast("durations", params.durations, count));
    BIO_TRY_VOID(checkBroadcast("peak_velocities", params.peakVelocities, count));

    const f64 fs = timeBase.samplingRate();
    Signal out = timeBase.zeros();
    f64 onset = 0.0;
    usize skipped = 0;

    for (usize i = 0; i < count; ++i) {
        const f64 amplitude = params.amplitudes[i];
        if (!std::isfinite(amplitude)) {
            return std::unexpected(
                Error::make(ErrorCode::kInvalidParameter, "saccade amplitude must be finite"));
        }
        const f64 duration = pick(params.durations, i, mainSequenceDuration(amplitude));
        const f64 peakVelocity = pick(params.peakVelocities, i, mainSequenceVelocity(amplitude));
        const GazeDirection direction = pick(params.directions, i, GazeDirection::kHorizontal);
        BIO_TRY_VOID(requirePositive("saccade duration", duration));
        BIO_TRY_VOID(requirePositive("peak velocity", peakVelocity));

        const f64 landing = directionSign(direction) * amplitude;
        const WaveformKernel kernel = BIO_TRY(Kernels::saccadePosition(landing, duration, peakVelocity, fs));
        const core::isize start = timeBase.indexAt(onset);

        if (placeKernel(out, kernel.samples, start, 1.0, BoundaryPolicy::kSkip)) {
            if (params.holdPosition) {
                for (usize j = static_cast<usize>(start) + kernel.size(); j < out.size(); ++j)
                    out[j] += landing;
            }
        } else {
            ++skipped;
        }
        onset += duration + core::kSaccadeGapSec;
    }

    if (skipped > 0)
        core::Log::debug(kTag, std::to_string(skipped) + " of " + std::to_string(count) + " saccades did not fit");
    return out;
}

// ─── Smooth pursuit ──────────────────────────────────────────────────────────

core::Expected<Signal> EogSynthesizer::pursuit(const TimeBase &timeBase, const PursuitParams &params, math::Rng &)
{
    const usize n = timeBase.sampleCount();
    const f64 sign = directionSign(params.direction);

    if (params.pattern == PursuitPattern::kCustom) {
        if (params.trajectory.size() < 2) {
            return std::unexpected(
                Error::make(ErrorCode::kInvalidParameter, "custom pursuit needs a trajectory of at least two points"));
        }
        Signal out = BIO_TRY(math::Statistics::resampleLinear(params.trajectory, n));
        for (auto &v : out)
            v *= sign;
        return out;
    }

    BIO_TRY_VOID(requirePositive("frequency", params.frequency));
    if (!std::isfinite(params.amplitude))
        return std::unexpected(Error::make(ErrorCode::kInvalidParameter, "amplitude must be finite"));

    const f64 amplitude = sign * params.amplitude;
    const f64 omega = 2.0 * std::numbers::pi * params.frequency;
    Signal out(n);

    for (usize i = 0; i < n; ++i) {
        const f64 t = timeBase.timeAt(i);
        switch (params.pattern) {
            case PursuitPattern::kLinear: {
                const f64 cycle = params.frequency * t;
                out[i] = amplitude * (2.0 * (cycle - std::floor(cycle)) - 1.0);
                break;
            }
            case PursuitPattern::kSinusoidal:
                out[i] = amplitude * std::sin(omega * t);
                break;
            case PursuitPattern::kCircular:
                out[i] = params.direction == GazeDirection::kHorizontal
                    ? params.amplitude * std::cos(omega * t)
                    : amplitude * std::sin(omega * t);
                break;
            case PursuitPattern::kCustom:
                break;
        }
    }

    if (params.pattern == PursuitPattern::kLinear) {
        // Catch-up saccades end on each period boundary.
        const f64 catchUp = 0.1 * amplitude;
        const WaveformKernel kernel = BIO_TRY(Kernels::saccadePosition(
            catchUp, core::kMicrosaccadeDuration, mainSequenceVelocity(catchUp), timeBase.samplingRate()));
        const usize period = timeBase.samplesFor(1.0 / params.frequency);

        for (usize i = 0; period > 0 && i + period < n; i += period) {
            const auto start = static_cast<core::isize>(i + period) - static_cast<core::isize>(kernel.size());
            placeKernel(out, kernel.samples, start, 1.0, BoundaryPolicy::kSkip);
        }
    }
    return out;
}

// ─── Fixation ────────────────────────────────────────────────────────────────

core::Expected<Signal> EogSynthesizer::fixation(const TimeBase &timeBase, const FixationParams &params, math::Rng &rng)
{
    BIO_TRY_VOID(requireNonNegative("drift_amplitude", params.driftAmplitude));
    BIO_TRY_VOID(requireNonNegative("tremor_amplitude", params.tremorAmplitude));
    BIO_TRY_VOID(requireNonNegative("microsaccade_rate", params.microsaccadeRate));
    BIO_TRY_VOID(requireNonNegative("microsaccade_amplitude", params.microsaccadeAmplitude));

    const f64 fs = timeBase.samplingRate();
    const f64 T = timeBase.duration();
    const f64 omega = 2.0 * std::numbers::pi * core::kTremorFrequency;
    Signal out(timeBase.sampleCount());

    f64 drift = 0.0;
    for (usize i = 0; i < out.size(); ++i) {
        const f64 t = timeBase.timeAt(i);
        drift += rng.normal(0.0, params.driftAmplitude / T) / fs;
        out[i] = drift
            + params.tremorAmplitude * std::sin(omega * t)
            + 0.5 * params.tremorAmplitude * std::sin(2.0 * omega * t);
    }

    usize placed = 0;
    const f64 lastOnset = T - core::kMicrosaccadeDuration;
    for (f64 onset = rng.exponential(params.microsaccadeRate); onset < lastOnset;
         onset += rng.exponential(params.microsaccadeRate)) {
        const f64 amplitude = rng.uniform(-params.microsaccadeAmplitude, params.microsaccadeAmplitude);
        const WaveformKernel kernel = BIO_TRY(Kernels::saccadePosition(
            amplitude, core::kMicrosaccadeDuration, mainSequenceVelocity(amplitude), fs));
        if (placeKernel(out, kernel.samples, timeBase.indexAt(onset), 1.0, BoundaryPolicy::kSkip))
            ++placed;
    }

    core::Log::debug(kTag, "fixation with " + std::to_string(placed) + " microsaccades");
    return out;
}

// ─── Blinks ──────────────────────────────────────────────────────────────────

core::Expected<Signal> EogSynthesizer::blinks(const TimeBase &timeBase, const BlinkParams &params, math::Rng &rng)
{
    BIO_TRY_VOID(requirePositive("blink_duration", params.duration));
    BIO_TRY_VOID(requireNonNegative("blink_amplitude_min", params.amplitudeMin));
    BIO_TRY_VOID(requireInRange("blink_amplitude_max", params.amplitudeMax, params.amplitudeMin,
                                std::numeric_limits<f64>::max()));
    BIO_TRY_VOID(requireNonNegative("min_blink_interval", params.minInterval));

    Signal out = timeBase.zeros();
    const usize n = params.count;
    if (n == 0)
        return out;

    const f64 T = timeBase.duration();
    const f64 available = T - static_cast<f64>(n) * params.duration;
    if (available < static_cast<f64>(n - 1) * params.minInterval) {
        std::ostringstream os;
        os << n << " blinks of " << params.duration << " s with " << params.minInterval
           << " s spacing do not fit in " << T << " s";
        return std::unexpected(Error::make(ErrorCode::kInsufficientDuration, os.str()));
    }

    Schedule onsets;
    onsets.reserve(n);
    const usize budget = kBlinkAttemptsPerBlink * n;
    for (usize attempt = 0; onsets.size() < n; ++attempt) {
        if (attempt == budget) {
            std::ostringstream os;
            os << "could not place " << n << " blinks " << params.minInterval
               << " s apart in " << T << " s";
            return std::unexpected(Error::make(ErrorCode::kInsufficientDuration, os.str()));
        }
        const f64 candidate = rng.uniform(0.0, T - params.duration);
        const bool spaced = std::ranges::all_of(onsets, [&](f64 existing) {
            return std::abs(candidate - existing) >= params.minInterval;
        });
        if (spaced)
            onsets.push_back(candidate);
    }
    std::ranges::sort(onsets);

    for (const f64 onset : onsets) {
        f64 duration = params.duration;
        f64 amplitude = params.amplitudeMax;
        if (params.naturalVariability) {
            duration *= rng.uniform(0.8, 1.2);
            amplitude = rng.uniform(params.amplitudeMin, params.amplitudeMax);
            if (rng.bernoulli(0.2))
                amplitude *= rng.uniform(0.3, 0.7);
        }
        const WaveformKernel kernel = BIO_TRY(Kernels::blink(amplitude, duration, timeBase.samplingRate()));
        placeKernel(out, kernel.samples, timeBase.indexAt(onset), 1.0, BoundaryPolicy::kClip);
    }
    return out;
}

// ─── Instance API ────────────────────────────────────────────────────────────

core::Expected<Signal> EogSynthesizer::simulateSaccades(const SaccadeParams &params)
{
    return saccades(timeBase(), params, rng());
}

core::Expected<Signal> EogSynthesizer::simulatePursuit(const PursuitParams &params)
{
    return pursuit(timeBase(), params, rng());
}

core::Expected<Signal> EogSynthesizer::simulateFixation(const FixationParams &params)
{
    return fixation(timeBase(), params, rng());
}

core::Expected<Signal> EogSynthesizer::simulateBlinks(const BlinkParams &params)
{
    return blinks(timeBase(), params, rng());
}

core::Expected<Signal> EogSynthesizer::generate(const ParamSet &params)
{
    BIO_TRY_VOID(applySeed(params));
    const TimeBase tb = BIO_TRY(resolveTimeBase(params));

    const std::string name = BIO_TRY(params.keyword("movement_type", "saccades"));
    const EyeMovement movement = BIO_TRY(parseEyeMovement(name));
    Signal out = BIO_TRY(kMovementTable[static_cast<usize>(movement)].render(tb, params, rng()));

    const bool addBlinks = BIO_TRY(params.boolean("add_blinks", false));
    if (addBlinks && movement != EyeMovement::kBlinks) {
        const BlinkParams blink = BIO_TRY(readBlinkParams(params));
        const Signal overlay = BIO_TRY(blinks(tb, blink, rng()));
        out = BIO_TRY(addSignals(out, overlay));
    }

    params.warnUnused(kTag);
    core::Log::debug(kTag, "rendered " + name + " over " + std::to_string(tb.sampleCount()) + " samples");
    return out;
}

} // namespace bio::synth
