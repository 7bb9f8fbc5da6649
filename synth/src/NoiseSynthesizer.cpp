/**
 * @file NoiseSynthesizer.cpp
 * @brief Noise spectra and artifact renderers.
 */

#include "bio/synth/NoiseSynthesizer.hpp"
#include "bio/core/Constants.hpp"
#include "bio/core/Log.hpp"
#include "bio/math/Fft.hpp"
#include "bio/math/Statistics.hpp"
#include "bio/math/Window.hpp"
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
using core::i64;
using core::usize;

namespace {

constexpr std::string_view kTag = "NOISE";
constexpr f64 kTwoPi = 2.0 * std::numbers::pi;

// ─── Continuous noise ────────────────────────────────────────────────────────

using NoiseRenderer = core::Expected<Signal> (*)(const TimeBase &, const ParamSet &, math::Rng &);

core::Expected<Signal> renderGaussian(const TimeBase &tb, const ParamSet &params, math::Rng &rng)
{
    const f64 stddev = BIO_TRY(params.real("std", 1.0));
    BIO_TRY_VOID(requireNonNegative("std", stddev));

    Signal out(tb.sampleCount());
    for (auto &v : out)
        v = rng.normal(0.0, stddev);
    return out;
}

/// Random-phase spectrum with |X(f)| = f^(-exponent/2), unit RMS after truncation.
core::Expected<Signal> colouredNoise(const TimeBase &tb, f64 exponent, f64 amplitude, math::Rng &rng)
{
    const usize n = tb.sampleCount();
    const usize nfft = std::max<usize>(math::Fft::nextPowerOfTwo(n), 2);
    const usize half = nfft / 2;
    const f64 df = tb.samplingRate() / static_cast<f64>(nfft);

    std::vector<math::Fft::Complex> spectrum(nfft);
    for (usize k = 1; k <= half; ++k) {
        const f64 f = static_cast<f64>(k) * df;
        const f64 magnitude = std::pow(f, -exponent / 2.0);
        const f64 phase = rng.uniform(0.0, kTwoPi);
        if (k == half) {
            spectrum[k] = {magnitude * std::cos(phase), 0.0};
        } else {
            spectrum[k] = std::polar(magnitude, phase);
            spectrum[nfft - k] = std::conj(spectrum[k]);
        }
    }

    BIO_TRY_VOID(math::Fft::inverse(spectrum));

    Signal out(n);
    for (usize i = 0; i < n; ++i)
        out[i] = spectrum[i].real();

    const f64 mean = math::Statistics::computeBaseline(out).mean;
    for (auto &v : out)
        v -= mean;

    const f64 rms = math::Statistics::rms(out);
    const f64 gain = rms > 0.0 ? amplitude / rms : 0.0;
    for (auto &v : out)
        v *= gain;
    return out;
}

core::Expected<Signal> renderPink(const TimeBase &tb, const ParamSet &params, math::Rng &rng)
{
    const f64 amplitude = BIO_TRY(params.real("amplitude", 1.0));
    BIO_TRY_VOID(requireNonNegative("amplitude", amplitude));
    return colouredNoise(tb, 1.0, amplitude, rng);
}

core::Expected<Signal> renderBrown(const TimeBase &tb, const ParamSet &params, math::Rng &rng)
{
    const f64 amplitude = BIO_TRY(params.real("amplitude", 1.0));
    BIO_TRY_VOID(requireNonNegative("amplitude", amplitude));
    return colouredNoise(tb, 2.0, amplitude, rng);
}

core::Expected<Signal> renderPowerline(const TimeBase &tb, const ParamSet &params, math::Rng &)
{
    const f64 frequency = BIO_TRY(params.real("frequency", core::kDefaultPowerlineFreq));
    const f64 amplitude = BIO_TRY(params.real("amplitude", 1.0));
    const i64 harmonics = BIO_TRY(params.integer("harmonics", 2));
    BIO_TRY_VOID(requirePositive("frequency", frequency));
    BIO_TRY_VOID(requireNonNegative("amplitude", amplitude));
    BIO_TRY_VOID(requireInRange("harmonics", static_cast<f64>(harmonics), 1.0, 100.0));

    Signal out = tb.zeros();
    for (i64 h = 1; h <= harmonics; ++h) {
        const f64 hf = static_cast<f64>(h);
        for (usize i = 0; i < out.size(); ++i)
            out[i] += (amplitude / hf) * std::sin(kTwoPi * frequency * hf * tb.timeAt(i));
    }
    return out;
}

core::Expected<Signal> renderBaselineWander(const TimeBase &tb, const ParamSet &params, math::Rng &rng)
{
    const f64 amplitude = BIO_TRY(params.real("amplitude", 1.0));
    const f64 drift = BIO_TRY(params.real("drift_frequency", 0.5));
    BIO_TRY_VOID(requireNonNegative("amplitude", amplitude));
    BIO_TRY_VOID(requirePositive("drift_frequency", drift));

    Signal out = tb.zeros();
    for (int k = 1; k <= 3; ++k) {
        const f64 f = drift / static_cast<f64>(k);
        const f64 phase = rng.uniform(0.0, kTwoPi);
        for (usize i = 0; i < out.size(); ++i)
            out[i] += (amplitude / 3.0) * std::sin(kTwoPi * f * tb.timeAt(i) + phase);
    }
    return out;
}

core::Expected<Signal> renderHighFrequency(const TimeBase &tb, const ParamSet &params, math::Rng &rng)
{
    const f64 amplitude = BIO_TRY(params.real("amplitude", 1.0));
    const f64 minFreq = BIO_TRY(params.real("min_freq", 100.0));
    const f64 maxFreq = BIO_TRY(params.real("max_freq", 500.0));
    const i64 components = BIO_TRY(params.integer("n_components", 10));
    BIO_TRY_VOID(requireNonNegative("amplitude", amplitude));
    BIO_TRY_VOID(requirePositive("min_freq", minFreq));
    BIO_TRY_VOID(requireInRange("max_freq", maxFreq, minFreq, 1e9));
    BIO_TRY_VOID(requireInRange("n_components", static_cast<f64>(components), 1.0, 1e6));

    Signal out = tb.zeros();
    const f64 gain = amplitude / static_cast<f64>(components);
    for (i64 c = 0; c < components; ++c) {
        const f64 f = rng.uniform(minFreq, maxFreq);
        const f64 phase = rng.uniform(0.0, kTwoPi);
        for (usize i = 0; i < out.size(); ++i)
            out[i] += gain * std::sin(kTwoPi * f * tb.timeAt(i) + phase);
    }
    return out;
}

struct NoiseEntry {
    std::string_view name;
    NoiseType type;
    NoiseRenderer render;
};

constexpr std::array<NoiseEntry, 6> kNoiseTable{{
    {"gaussian",        NoiseType::kGaussian,       &renderGaussian},
    {"pink",            NoiseType::kPink,           &renderPink},
    {"brown",           NoiseType::kBrown,          &renderBrown},
    {"powerline",       NoiseType::kPowerline,      &renderPowerline},
    {"baseline_wander", NoiseType::kBaselineWander, &renderBaselineWander},
    {"high_frequency",  NoiseType::kHighFrequency,  &renderHighFrequency},
}};

const NoiseEntry &noiseEntry(NoiseType type) noexcept
{
    return kNoiseTable[static_cast<usize>(type)];
}

// ─── Artifacts ───────────────────────────────────────────────────────────────

struct ArtifactEntry;
using ArtifactRenderer = core::Expected<Signal> (*)(
    const TimeBase &, const ParamSet &, math::Rng &, const ArtifactEntry &);

struct ArtifactEntry {
    std::string_view name;
    std::string_view alias;
    ArtifactType type;
    ArtifactFamily family;
    std::string_view countKey;
    i64 defaultCount;
    f64 defaultDuration;
    ArtifactRenderer render;
};

Signal decayingExponential(usize length, f64 amplitude)
{
    Signal out(length);
    const f64 step = length > 1 ? 5.0 / static_cast<f64>(length - 1) : 0.0;
    for (usize i = 0; i < length; ++i)
        out[i] = amplitude * std::exp(-step * static_cast<f64>(i));
    return out;
}

core::Expected<Signal> renderBursts(
    const TimeBase &tb, const ParamSet &params, math::Rng &rng, const ArtifactEntry &entry)
{
    const i64 count = BIO_TRY(params.integer(entry.countKey, entry.defaultCount));
    const f64 amplitude = BIO_TRY(params.real("amplitude", 1.0));
    const f64 duration = BIO_TRY(params.real("duration", entry.defaultDuration));
    BIO_TRY_VOID(requireNonNegative(entry.countKey, static_cast<f64>(count)));
    BIO_TRY_VOID(requireNonNegative("amplitude", amplitude));
    BIO_TRY_VOID(requirePositive("duration", duration));
    if (duration >= tb.duration()) {
        std::ostringstream os;
        os << entry.name << " event duration " << duration
           << " s must be shorter than the signal (" << tb.duration() << " s)";
        return std::unexpected(Error::make(ErrorCode::kInvalidParameter, os.str()));
    }

    const usize length = std::max<usize>(tb.samplesFor(duration), 1);
    Signal out = tb.zeros();
    for (i64 e = 0; e < count; ++e) {
        const f64 start = rng.uniform(0.0, tb.duration() - duration);
        const Signal burst = BIO_TRY(NoiseSynthesizer::burstShape(
            entry.type, length, amplitude, tb.samplingRate(), rng));
        placeKernel(out, burst, tb.indexAt(start), 1.0, BoundaryPolicy::kClip);
    }
    return out;
}

core::Expected<Signal> renderDcOffset(
    const TimeBase &tb, const ParamSet &params, math::Rng &rng, const ArtifactEntry &entry)
{
    const i64 count = BIO_TRY(params.integer(entry.countKey, entry.defaultCount));
    const f64 amplitude = BIO_TRY(params.real("amplitude", 1.0));
    const f64 drift = BIO_TRY(params.real("drift_frequency", 0.1));
    BIO_TRY_VOID(requireNonNegative(entry.countKey, static_cast<f64>(count)));
    BIO_TRY_VOID(requireNonNegative("amplitude", amplitude));
    BIO_TRY_VOID(requirePositive("drift_frequency", drift));

    const usize n = tb.sampleCount();
    const f64 base = rng.uniform(-amplitude, amplitude);
    Signal out(n);
    for (usize i = 0; i < n; ++i)
        out[i] = base + 0.5 * amplitude * std::sin(kTwoPi * drift * tb.timeAt(i));

    for (i64 e = 0; e < count; ++e) {
        const usize at = rng.uniformIndex(0, n - 1);
        const f64 change = rng.uniform(-0.5 * amplitude, 0.5 * amplitude);
        for (usize i = at; i < n; ++i)
            out[i] += change;
    }
    return out;
}

core::Expected<Signal> renderEcgInterference(
    const TimeBase &tb, const ParamSet &params, math::Rng &rng, const ArtifactEntry &)
{
    const f64 amplitude = BIO_TRY(params.real("amplitude", 1.0));
    const f64 heartRate = BIO_TRY(params.real("heart_rate", 60.0));
    BIO_TRY_VOID(requireNonNegative("amplitude", amplitude));
    BIO_TRY_VOID(requirePositive("heart_rate", heartRate));
    BIO_TRY_VOID(requireInRange("heart_rate", heartRate, 0.0, core::kMaxHeartRate));

    const WaveformKernel qrs = BIO_TRY(Kernels::qrsComplex(-0.5, 1.0, -0.2, 0.1, tb.samplingRate()));
    const Schedule beats = regularSchedule(tb.duration(), 60.0 / heartRate, 0.0, rng);

    Signal out = tb.zeros();
    for (const f64 t : beats)
        placeKernel(out, qrs.samples, tb.indexAt(t), amplitude, BoundaryPolicy::kClip);
    return out;
}

core::Expected<Signal> renderEnvironmental(
    const TimeBase &tb, const ParamSet &params, math::Rng &rng, const ArtifactEntry &)
{
    const f64 amplitude = BIO_TRY(params.real("amplitude", 1.0));
    const f64 frequency = BIO_TRY(params.real("frequency", core::kDefaultPowerlineFreq));
    BIO_TRY_VOID(requireNonNegative("amplitude", amplitude));
    BIO_TRY_VOID(requirePositive("frequency", frequency));

    Signal out = tb.zeros();
    for (int h = 1; h <= 3; ++h) {
        const f64 hf = static_cast<f64>(h);
        for (usize i = 0; i < out.size(); ++i)
            out[i] += (amplitude / hf) * std::sin(kTwoPi * frequency * hf * tb.timeAt(i));
    }
    for (int c = 0; c < 5; ++c) {
        const f64 f = rng.uniform(100.0, 1000.0);
        const f64 phase = rng.uniform(0.0, kTwoPi);
        for (usize i = 0; i < out.size(); ++i)
            out[i] += 0.1 * amplitude * std::sin(kTwoPi * f * tb.timeAt(i) + phase);
    }
    return out;
}

core::Expected<Signal> renderDevice(
    const TimeBase &tb, const ParamSet &params, math::Rng &rng, const ArtifactEntry &)
{
    const f64 amplitude = BIO_TRY(params.real("amplitude", 1.0));
    const f64 switching = BIO_TRY(params.real("switching_freq", 1000.0));
    const f64 dutyCycle = BIO_TRY(params.real("duty_cycle", 0.1));
    const i64 spikes = BIO_TRY(params.integer("n_spikes", 20));
    BIO_TRY_VOID(requireNonNegative("amplitude", amplitude));
    BIO_TRY_VOID(requirePositive("switching_freq", switching));
    BIO_TRY_VOID(requireInRange("duty_cycle", dutyCycle, 0.0, 1.0));
    BIO_TRY_VOID(requireNonNegative("n_spikes", static_cast<f64>(spikes)));

    const usize n = tb.sampleCount();
    Signal out(n);
    for (usize i = 0; i < n; ++i) {
        const f64 cycle = tb.timeAt(i) * switching;
        out[i] = (cycle - std::floor(cycle) < dutyCycle) ? 0.5 * amplitude : 0.0;
    }

    for (i64 s = 0; s < spikes; ++s) {
        const usize width = rng.uniformIndex(5, 9);
        if (width > n)
            break;
        const usize start = rng.uniformIndex(0, n - width);
        const f64 height = amplitude * rng.uniform(0.5, 1.0);
        for (usize i = start; i < start + width; ++i)
            out[i] += height;
    }
    return out;
}

constexpr std::array<ArtifactEntry, 12> kArtifactTable{{
    {"electrode_movement", "",                 ArtifactType::kElectrodeMovement, ArtifactFamily::kMotion,       "n_artifacts", 3, 0.2,  &renderBursts},
    {"cable_motion",       "",                 ArtifactType::kCableMotion,       ArtifactFamily::kMotion,       "n_artifacts", 3, 0.2,  &renderBursts},
    {"subject_movement",   "",                 ArtifactType::kSubjectMovement,   ArtifactFamily::kMotion,       "n_artifacts", 3, 0.2,  &renderBursts},
    {"baseline_shift",     "",                 ArtifactType::kBaselineShift,     ArtifactFamily::kMotion,       "n_artifacts", 3, 0.2,  &renderBursts},
    {"poor_contact",       "",                 ArtifactType::kPoorContact,       ArtifactFamily::kElectrode,    "n_events",    3, 0.2,  &renderBursts},
    {"electrode_pop",      "",                 ArtifactType::kElectrodePop,      ArtifactFamily::kElectrode,    "n_events",    2, 0.05, &renderBursts},
    {"impedance_change",   "",                 ArtifactType::kImpedanceChange,   ArtifactFamily::kElectrode,    "n_events",    2, 0.5,  &renderBursts},
    {"dc_offset",          "",                 ArtifactType::kDcOffset,          ArtifactFamily::kElectrode,    "n_events",    3, 0.0,  &renderDcOffset},
    {"emg",                "emg_crosstalk",    ArtifactType::kEmgCrosstalk,      ArtifactFamily::kInterference, "n_bursts",    5, 0.2,  &renderBursts},
    {"ecg",                "ecg_interference", ArtifactType::kEcgInterference,   ArtifactFamily::kInterference, "",            0, 0.0,  &renderEcgInterference},
    {"environmental",      "",                 ArtifactType::kEnvironmental,     ArtifactFamily::kInterference, "",            0, 0.0,  &renderEnvironmental},
    {"device",             "device_artifact",  ArtifactType::kDevice,            ArtifactFamily::kInterference, "",            0, 0.0,  &renderDevice},
}};

constexpr bool tablesFollowEnumOrder()
{
    for (usize i = 0; i < kNoiseTable.size(); ++i) {
        if (static_cast<usize>(kNoiseTable[i].type) != i)
            return false;
    }
    for (usize i = 0; i < kArtifactTable.size(); ++i) {
        if (static_cast<usize>(kArtifactTable[i].type) != i)
            return false;
    }
    return true;
}

static_assert(tablesFollowEnumOrder(), "lookup tables are indexed by enum value");

const ArtifactEntry &artifactEntry(ArtifactType type) noexcept
{
    return kArtifactTable[static_cast<usize>(type)];
}

std::string_view familyName(ArtifactFamily family) noexcept
{
    switch (family) {
        case ArtifactFamily::kMotion:       return "motion";
        case ArtifactFamily::kElectrode:    return "electrode";
        case ArtifactFamily::kInterference: return "interference";
    }
    return "unknown";
}

} // namespace

// ─── Name lookup ─────────────────────────────────────────────────────────────

std::string_view noiseTypeName(NoiseType type) noexcept
{
    return noiseEntry(type).name;
}

core::Expected<NoiseType> parseNoiseType(std::string_view name)
{
    for (const auto &entry : kNoiseTable) {
        if (entry.name == name)
            return entry.type;
    }
    return std::unexpected(
        Error::make(ErrorCode::kUnsupportedType, "unknown noise type '" + std::string(name) + "'"));
}

std::string_view artifactTypeName(ArtifactType type) noexcept
{
    return artifactEntry(type).name;
}

core::Expected<ArtifactType> parseArtifactType(std::string_view name)
{
    for (const auto &entry : kArtifactTable) {
        if (entry.name == name || (!entry.alias.empty() && entry.alias == name))
            return entry.type;
    }
    return std::unexpected(
        Error::make(ErrorCode::kUnsupportedType, "unknown artifact type '" + std::string(name) + "'"));
}

ArtifactFamily artifactFamily(ArtifactType type) noexcept
{
    return artifactEntry(type).family;
}

// ─── NoiseSynthesizer ────────────────────────────────────────────────────────

NoiseSynthesizer::NoiseSynthesizer(TimeBase timeBase, std::optional<core::u64> seed)
    : Simulator(std::move(timeBase), seed)
{
}

core::Expected<Signal> NoiseSynthesizer::burstShape(
    ArtifactType type, usize length, f64 amplitude, f64 samplingRate, math::Rng &rng)
{
    Signal out(length, 0.0);
    const auto timeAt = [samplingRate](usize i) { return static_cast<f64>(i) / samplingRate; };

    switch (type) {
        case ArtifactType::kElectrodeMovement:
        case ArtifactType::kElectrodePop:
            return decayingExponential(length, rng.sign() * amplitude);

        case ArtifactType::kCableMotion: {
            const f64 f = rng.uniform(10.0, 30.0);
            const auto window = math::hannWindow(length);
            for (usize i = 0; i < length; ++i)
                out[i] = amplitude * std::sin(kTwoPi * f * timeAt(i)) * window[i];
            return out;
        }

        case ArtifactType::kSubjectMovement: {
            for (const f64 f : {2.0, 5.0, 8.0}) {
                const f64 phase = rng.uniform(0.0, kTwoPi);
                for (usize i = 0; i < length; ++i)
                    out[i] += (amplitude / 3.0) * std::sin(kTwoPi * f * timeAt(i) + phase);
            }
            const f64 shift = rng.uniform(-amplitude / 2.0, amplitude / 2.0);
            for (auto &v : out)
                v += shift;
            return out;
        }

        case ArtifactType::kBaselineShift: {
            const f64 shift = rng.sign() * amplitude;
            const bool recovers = rng.bernoulli(0.5);
            for (usize i = 0; i < length; ++i) {
                const f64 remaining = length > 1
                    ? 1.0 - static_cast<f64>(i) / static_cast<f64>(length - 1)
                    : 1.0;
                out[i] = recovers ? shift * remaining : shift;
            }
            return out;
        }

        case ArtifactType::kPoorContact:
            for (auto &v : out) {
                const f64 noise = rng.normal(0.0, amplitude);
                v = rng.uniform() > 0.3 ? noise : 0.0;
            }
            return out;

        case ArtifactType::kImpedanceChange:
            for (usize i = 0; i < length; ++i) {
                const f64 ramp = length > 1 ? static_cast<f64>(i) / static_cast<f64>(length - 1) : 1.0;
                out[i] = amplitude * ramp * (1.0 + rng.normal(0.0, 0.2 * amplitude));
            }
            return out;

        case ArtifactType::kEmgCrosstalk: {
            const auto window = math::hannWindow(length);
            for (int c = 0; c < 10; ++c) {
                const f64 f = rng.uniform(20.0, 500.0);
                for (usize i = 0; i < length; ++i)
                    out[i] += 0.1 * amplitude * std::sin(kTwoPi * f * timeAt(i));
            }
            for (usize i = 0; i < length; ++i)
                out[i] *= window[i];
            return out;
        }

        case ArtifactType::kDcOffset:
        case ArtifactType::kEcgInterference:
        case ArtifactType::kEnvironmental:
        case ArtifactType::kDevice:
            break;
    }

    return std::unexpected(
        Error::make(ErrorCode::kUnsupportedType,
            "artifact type '" + std::string(artifactTypeName(type)) + "' has no burst shape"));
}

core::Expected<Signal> NoiseSynthesizer::renderNoise(
    NoiseType type, const TimeBase &timeBase, const ParamSet &params, math::Rng &rng)
{
    return noiseEntry(type).render(timeBase, params, rng);
}

core::Expected<Signal> NoiseSynthesizer::renderArtifact(
    ArtifactType type, const TimeBase &timeBase, const ParamSet &params, math::Rng &rng)
{
    const ArtifactEntry &entry = artifactEntry(type);
    return entry.render(timeBase, params, rng, entry);
}

core::Expected<Signal> NoiseSynthesizer::render(
    std::string_view name, const TimeBase &timeBase, const ParamSet &params, math::Rng &rng)
{
    if (const auto noise = parseNoiseType(name))
        return renderNoise(*noise, timeBase, params, rng);

    const auto artifact = parseArtifactType(name);
    if (!artifact) {
        return std::unexpected(
            Error::make(ErrorCode::kUnsupportedType,
                "unknown noise or artifact type '" + std::string(name) + "'"));
    }
    return renderArtifact(*artifact, timeBase, params, rng);
}

core::Expected<Signal> NoiseSynthesizer::run(std::string_view name, const ParamSet &params)
{
    BIO_TRY_VOID(applySeed(params));
    const TimeBase tb = BIO_TRY(resolveTimeBase(params, "signal_duration"));

    Signal out = BIO_TRY(render(name, tb, params, rng()));
    params.warnUnused(kTag);
    core::Log::debug(kTag, "rendered " + std::string(name) + " over " +
        std::to_string(tb.sampleCount()) + " samples");
    return out;
}

core::Expected<Signal> NoiseSynthesizer::generate(const ParamSet &params)
{
    const std::string type = BIO_TRY(params.keyword("noise_type", "gaussian"));
    return run(type, params);
}

core::Expected<Signal> NoiseSynthesizer::simulateNoise(NoiseType type, const ParamSet &params)
{
    return run(noiseTypeName(type), params);
}

core::Expected<Signal> NoiseSynthesizer::simulateArtifact(ArtifactType type, const ParamSet &params)
{
    return run(artifactTypeName(type), params);
}

core::Expected<Signal> NoiseSynthesizer::simulateInFamily(
    ArtifactType type, ArtifactFamily family, const ParamSet &params)
{
    if (artifactFamily(type) != family) {
        return std::unexpected(
            Error::make(ErrorCode::kUnsupportedType,
                "'" + std::string(artifactTypeName(type)) + "' is not a " +
                std::string(familyName(family)) + " artifact"));
    }
    return simulateArtifact(type, params);
}

core::Expected<Signal> NoiseSynthesizer::simulateMotionArtifacts(ArtifactType type, const ParamSet &params)
{
    return simulateInFamily(type, ArtifactFamily::kMotion, params);
}

core::Expected<Signal> NoiseSynthesizer::simulateElectrodeArtifacts(ArtifactType type, const ParamSet &params)
{
    return simulateInFamily(type, ArtifactFamily::kElectrode, params);
}

core::Expected<Signal> NoiseSynthesizer::simulateInterference(ArtifactType type, const ParamSet &params)
{
    return simulateInFamily(type, ArtifactFamily::kInterference, params);
}

} // namespace bio::synth
