/**
 * @file EcgSynthesizer.cpp
 * @brief Beat scheduling and condition strategies.
 */

#include "bio/synth/EcgSynthesizer.hpp"
#include "bio/core/Assert.hpp"
#include "bio/core/Log.hpp"
#include "bio/synth/Kernels.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace bio::synth {

using core::Error;
using core::ErrorCode;
using core::f64;
using core::usize;

namespace {

constexpr std::string_view kTag = "ECG";

/**
 * @brief Shared state handed to every condition strategy.
 */
struct BeatContext {
    const TimeBase &tb;
    const EcgParams &params;
    math::Rng &rng;
    WaveformKernel pWave;
    WaveformKernel qrs;
    WaveformKernel tWave;
    usize placed = 0;
    usize dropped = 0;

    [[nodiscard]] f64 tOnset(f64 qrsDuration) const noexcept
    {
        return std::max(params.morphology.qtOffset, qrsDuration + 0.05);
    }

    void place(Signal &out, std::span<const f64> kernel, f64 onset, f64 gain = 1.0)
    {
        if (placeKernel(out, kernel, tb.indexAt(onset), gain, params.boundaryPolicy))
            ++placed;
        else
            ++dropped;
    }

    /// P at beat - pr, QRS at beat, T after the QRS.
    void normalBeat(Signal &out, f64 beat, f64 pr)
    {
        place(out, pWave.samples, beat - pr);
        place(out, qrs.samples, beat);
        place(out, tWave.samples, beat + tOnset(params.morphology.qrsDuration));
    }

    [[nodiscard]] Schedule sinusSchedule(f64 heartRate) const
    {
        return regularSchedule(tb.duration(), 60.0 / heartRate, params.hrvStd, rng);
    }
};

Signal constantKernel(f64 value, f64 seconds, f64 samplingRate)
{
    const auto n = static_cast<usize>(std::max<long long>(std::llround(seconds * samplingRate), 1));
    return Signal(n, value);
}

using ConditionRenderer = core::Expected<Signal> (*)(BeatContext &);

core::Expected<Signal> sinusAt(BeatContext &ctx, f64 heartRate)
{
    Signal out = ctx.tb.zeros();
    for (const f64 beat : ctx.sinusSchedule(heartRate))
        ctx.normalBeat(out, beat, ctx.params.morphology.prInterval);
    return out;
}

core::Expected<Signal> renderNormal(BeatContext &ctx)
{
    return sinusAt(ctx, ctx.params.heartRate);
}

core::Expected<Signal> renderBradycardia(BeatContext &ctx)
{
    return sinusAt(ctx, core::kBradycardiaRate);
}

core::Expected<Signal> renderTachycardia(BeatContext &ctx)
{
    return sinusAt(ctx, core::kTachycardiaRate);
}

core::Expected<Signal> renderPvc(BeatContext &ctx)
{
    Signal out = ctx.tb.zeros();
    for (const f64 beat : ctx.sinusSchedule(ctx.params.heartRate)) {
        if (ctx.rng.bernoulli(ctx.params.pvcFrequency))
            ctx.place(out, ctx.qrs.samples, beat, core::kPvcQrsGain);
        else
            ctx.normalBeat(out, beat, ctx.params.morphology.prInterval);
    }
    return out;
}

core::Expected<Signal> renderAtrialFibrillation(BeatContext &ctx)
{
    const f64 rateMin = ctx.params.afRateMin.value_or(0.7 * ctx.params.heartRate);
    const f64 rateMax = ctx.params.afRateMax.value_or(std::min(1.5 * ctx.params.heartRate, core::kMaxHeartRate));
    BIO_TRY_VOID(requirePositive("af_rate_min", rateMin));
    BIO_TRY_VOID(requireInRange("af_rate_max", rateMax, rateMin, core::kMaxHeartRate));

    Signal out = ctx.tb.zeros();
    const f64 tOffset = ctx.tOnset(ctx.params.morphology.qrsDuration);
    for (f64 beat = 0.0; beat < ctx.tb.duration(); beat += ctx.rng.uniform(60.0 / rateMax, 60.0 / rateMin)) {
        ctx.place(out, ctx.qrs.samples, beat);
        ctx.place(out, ctx.tWave.samples, beat + tOffset);
    }
    return out;
}

core::Expected<Signal> renderHeartBlock(BeatContext &ctx)
{
    const int degree = ctx.params.heartBlockDegree;
    Signal out = ctx.tb.zeros();
    const Schedule atrial = ctx.sinusSchedule(ctx.params.heartRate);

    switch (degree) {
        case 1:
            for (const f64 beat : atrial)
                ctx.normalBeat(out, beat, 0.3);
            return out;

        case 2:
            for (usize i = 0; i < atrial.size(); ++i) {
                if (i % 2 == 0)
                    ctx.normalBeat(out, atrial[i], 0.2);
                else
                    ctx.place(out, ctx.pWave.samples, atrial[i] - 0.2);
            }
            return out;

        case 3: {
            for (const f64 beat : atrial)
                ctx.place(out, ctx.pWave.samples, beat - ctx.params.morphology.prInterval);

            const f64 interval = 60.0 / ctx.params.escapeRate;
            const f64 tOffset = ctx.tOnset(ctx.params.morphology.qrsDuration);
            for (f64 beat = ctx.rng.uniform(0.0, interval); beat < ctx.tb.duration(); beat += interval) {
                ctx.place(out, ctx.qrs.samples, beat);
                ctx.place(out, ctx.tWave.samples, beat + tOffset);
            }
            return out;
        }

        default:
            break;
    }
    BIO_UNREACHABLE("heart block degree is validated to 1..3");
}

core::Expected<Signal> renderStShift(BeatContext &ctx, f64 level)
{
    const Signal segment = constantKernel(level, core::kStSegmentDuration, ctx.tb.samplingRate());
    Signal out = ctx.tb.zeros();
    for (const f64 beat : ctx.sinusSchedule(ctx.params.heartRate)) {
        ctx.normalBeat(out, beat, ctx.params.morphology.prInterval);
        ctx.place(out, segment, beat + ctx.params.morphology.qrsDuration);
    }
    return out;
}

core::Expected<Signal> renderStElevation(BeatContext &ctx)
{
    return renderStShift(ctx, ctx.params.severity * 0.3);
}

core::Expected<Signal> renderStDepression(BeatContext &ctx)
{
    return renderStShift(ctx, -ctx.params.severity * 0.2);
}

core::Expected<Signal> renderTWaveInversion(BeatContext &ctx)
{
    const auto &m = ctx.params.morphology;
    ctx.tWave = BIO_TRY(Kernels::gaussianBump(
        -ctx.params.severity * m.tAmplitude, m.tDuration, ctx.tb.samplingRate()));
    return sinusAt(ctx, ctx.params.heartRate);
}

core::Expected<Signal> renderQWave(BeatContext &ctx)
{
    constexpr f64 kQWaveDuration = 0.04;
    const Signal notch = constantKernel(-ctx.params.severity * 0.4, kQWaveDuration, ctx.tb.samplingRate());

    Signal out = ctx.tb.zeros();
    for (const f64 beat : ctx.sinusSchedule(ctx.params.heartRate)) {
        ctx.normalBeat(out, beat, ctx.params.morphology.prInterval);
        ctx.place(out, notch, beat - kQWaveDuration);
    }
    return out;
}

core::Expected<Signal> renderWideQrs(BeatContext &ctx, f64 q, f64 r, f64 s, f64 duration)
{
    ctx.qrs = BIO_TRY(Kernels::qrsComplex(q, r, s, duration, ctx.tb.samplingRate()));

    Signal out = ctx.tb.zeros();
    const f64 pr = ctx.params.morphology.prInterval;
    for (const f64 beat : ctx.sinusSchedule(ctx.params.heartRate)) {
        ctx.place(out, ctx.pWave.samples, beat - pr);
        ctx.place(out, ctx.qrs.samples, beat);
        ctx.place(out, ctx.tWave.samples, beat + ctx.tOnset(duration));
    }
    return out;
}

core::Expected<Signal> renderLbbb(BeatContext &ctx)
{
    return renderWideQrs(ctx, 0.8, 1.0, 0.8, 0.12 + 0.08 * ctx.params.severity);
}

core::Expected<Signal> renderRbbb(BeatContext &ctx)
{
    return renderWideQrs(ctx, -0.5, 1.0, 0.7, 0.12 + 0.08 * ctx.params.severity);
}

core::Expected<Signal> renderLafb(BeatContext &ctx)
{
    return renderWideQrs(ctx, -0.2, 1.5, -0.3, 0.08 + 0.04 * ctx.params.severity);
}

core::Expected<Signal> renderWpw(BeatContext &ctx)
{
    constexpr f64 kShortPr = 0.08;
    const f64 severity = ctx.params.severity;
    const f64 deltaDuration = 0.04 * severity;
    const usize deltaSamples = ctx.tb.samplesFor(deltaDuration);

    Signal delta(deltaSamples);
    for (usize i = 0; i < deltaSamples; ++i) {
        const f64 ramp = deltaSamples > 1
            ? static_cast<f64>(i) / static_cast<f64>(deltaSamples - 1)
            : 1.0;
        delta[i] = 0.3 * severity * ramp;
    }

    Signal out = ctx.tb.zeros();
    const f64 tOffset = ctx.tOnset(ctx.params.morphology.qrsDuration);
    for (const f64 beat : ctx.sinusSchedule(ctx.params.heartRate)) {
        const f64 deltaOnset = beat - deltaDuration;
        ctx.place(out, ctx.pWave.samples, deltaOnset - kShortPr);
        if (!delta.empty())
            ctx.place(out, delta, deltaOnset);
        ctx.place(out, ctx.qrs.samples, beat);
        ctx.place(out, ctx.tWave.samples, beat + tOffset);
    }
    return out;
}

struct ConditionEntry {
    std::string_view name;
    std::string_view alias;
    EcgCondition condition;
    ConditionRenderer render;
};

constexpr std::array<ConditionEntry, 14> kConditionTable{{
    {"normal",           "none",          EcgCondition::kNormal,             &renderNormal},
    {"pvc",              "",              EcgCondition::kPvc,                &renderPvc},
    {"af",               "",              EcgCondition::kAtrialFibrillation, &renderAtrialFibrillation},
    {"brady",            "bradycardia",   EcgCondition::kBradycardia,        &renderBradycardia},
    {"tachy",            "tachycardia",   EcgCondition::kTachycardia,        &renderTachycardia},
    {"heart_block",      "",              EcgCondition::kHeartBlock,         &renderHeartBlock},
    {"st_elevation",     "",              EcgCondition::kStElevation,        &renderStElevation},
    {"st_depression",    "",              EcgCondition::kStDepression,       &renderStDepression},
    {"t_wave_inversion", "",              EcgCondition::kTWaveInversion,     &renderTWaveInversion},
    {"q_wave",           "",              EcgCondition::kQWave,              &renderQWave},
    {"lbbb",             "",              EcgCondition::kLbbb,               &renderLbbb},
    {"rbbb",             "",              EcgCondition::kRbbb,               &renderRbbb},
    {"wpw",              "",              EcgCondition::kWpw,                &renderWpw},
    {"lafb",             "",              EcgCondition::kLafb,               &renderLafb},
}};

constexpr bool tableFollowsEnumOrder()
{
    for (usize i = 0; i < kConditionTable.size(); ++i) {
        if (static_cast<usize>(kConditionTable[i].condition) != i)
            return false;
    }
    return true;
}

static_assert(tableFollowsEnumOrder(), "condition table is indexed by enum value");

core::ExpectedVoid validate(const EcgParams &params)
{
    const auto &m = params.morphology;
    BIO_TRY_VOID(requirePositive("heart_rate", params.heartRate));
    BIO_TRY_VOID(requireInRange("heart_rate", params.heartRate, 0.0, core::kMaxHeartRate));
    BIO_TRY_VOID(requireInRange("severity", params.severity, 0.0, 1.0));
    BIO_TRY_VOID(requireNonNegative("hrv_std", params.hrvStd));
    BIO_TRY_VOID(requireInRange("pvc_frequency", params.pvcFrequency, 0.0, 1.0));
    BIO_TRY_VOID(requirePositive("escape_rate", params.escapeRate));
    if (params.heartBlockDegree < 1 || params.heartBlockDegree > 3) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidParameter,
                "heart_block_degree must be 1, 2 or 3, got " + std::to_string(params.heartBlockDegree)));
    }
    BIO_TRY_VOID(requirePositive("p_duration", m.pDuration));
    BIO_TRY_VOID(requirePositive("qrs_duration", m.qrsDuration));
    BIO_TRY_VOID(requirePositive("t_duration", m.tDuration));
    BIO_TRY_VOID(requireNonNegative("pr_interval", m.prInterval));
    BIO_TRY_VOID(requirePositive("qt_offset", m.qtOffset));
    return {};
}

core::ExpectedVoid readMorphology(const ParamSet &params, WaveMorphology &m)
{
    m.pAmplitude = BIO_TRY(params.real("p_amplitude", m.pAmplitude));
    m.pDuration = BIO_TRY(params.real("p_duration", m.pDuration));
    m.qAmplitude = BIO_TRY(params.real("q_amp", m.qAmplitude));
    m.rAmplitude = BIO_TRY(params.real("r_amp", m.rAmplitude));
    m.sAmplitude = BIO_TRY(params.real("s_amp", m.sAmplitude));
    m.qrsDuration = BIO_TRY(params.real("qrs_duration", m.qrsDuration));
    m.tAmplitude = BIO_TRY(params.real("t_amplitude", m.tAmplitude));
    m.tDuration = BIO_TRY(params.real("t_duration", m.tDuration));
    m.prInterval = BIO_TRY(params.real("pr_interval", m.prInterval));
    return {};
}

} // namespace

std::string_view ecgConditionName(EcgCondition condition) noexcept
{
    return kConditionTable[static_cast<usize>(condition)].name;
}

core::Expected<EcgCondition> parseEcgCondition(std::string_view name)
{
    if (name.empty())
        return EcgCondition::kNormal;
    for (const auto &entry : kConditionTable) {
        if (entry.name == name || (!entry.alias.empty() && entry.alias == name))
            return entry.condition;
    }
    return std::unexpected(
        Error::make(ErrorCode::kUnsupportedType, "unknown ECG condition '" + std::string(name) + "'"));
}

EcgSynthesizer::EcgSynthesizer(TimeBase timeBase, std::optional<core::u64> seed)
    : Simulator(std::move(timeBase), seed)
{
}

core::Expected<Signal> EcgSynthesizer::render(const TimeBase &timeBase, const EcgParams &params, math::Rng &rng)
{
    BIO_TRY_VOID(validate(params));

    const auto &m = params.morphology;
    const f64 fs = timeBase.samplingRate();
    WaveformKernel pWave = BIO_TRY(Kernels::gaussianBump(m.pAmplitude, m.pDuration, fs));
    WaveformKernel qrs = BIO_TRY(Kernels::qrsComplex(m.qAmplitude, m.rAmplitude, m.sAmplitude, m.qrsDuration, fs));
    WaveformKernel tWave = BIO_TRY(Kernels::gaussianBump(m.tAmplitude, m.tDuration, fs));

    BeatContext ctx{
        .tb = timeBase,
        .params = params,
        .rng = rng,
        .pWave = std::move(pWave),
        .qrs = std::move(qrs),
        .tWave = std::move(tWave),
    };

    Signal out = BIO_TRY(kConditionTable[static_cast<usize>(params.condition)].render(ctx));

    if (core::Log::enabled(core::LogLevel::kDebug)) {
        core::Log::debug(kTag, std::string(ecgConditionName(params.condition)) + ": " +
            std::to_string(ctx.placed) + " waves placed, " + std::to_string(ctx.dropped) +
            " outside the buffer (" + std::string(boundaryPolicyName(params.boundaryPolicy)) + ")");
    }
    return out;
}

core::Expected<Signal> EcgSynthesizer::simulateNormalSinus(f64 heartRate, f64 hrvStd, const WaveMorphology &morphology)
{
    EcgParams params;
    params.heartRate = heartRate;
    params.hrvStd = hrvStd;
    params.morphology = morphology;
    return simulate(params);
}

core::Expected<Signal> EcgSynthesizer::simulate(const EcgParams &params)
{
    return render(timeBase(), params, rng());
}

core::Expected<Signal> EcgSynthesizer::generate(const ParamSet &params)
{
    BIO_TRY_VOID(applySeed(params));
    const TimeBase tb = BIO_TRY(resolveTimeBase(params));

    EcgParams ecg;
    const std::string condition = BIO_TRY(params.keyword("condition", "normal"));
    ecg.condition = BIO_TRY(parseEcgCondition(condition));
    ecg.heartRate = BIO_TRY(params.real("heart_rate", ecg.heartRate));
    ecg.severity = BIO_TRY(params.real("severity", ecg.severity));
    ecg.hrvStd = BIO_TRY(params.real("hrv_std", ecg.hrvStd));
    ecg.pvcFrequency = BIO_TRY(params.real("pvc_frequency", ecg.pvcFrequency));
    ecg.afRateMin = BIO_TRY(params.optionalReal("af_rate_min"));
    ecg.afRateMax = BIO_TRY(params.optionalReal("af_rate_max"));
    const core::i64 degree = BIO_TRY(params.integer("heart_block_degree", ecg.heartBlockDegree));
    BIO_TRY_VOID(requireInRange("heart_block_degree", static_cast<f64>(degree), 1.0, 3.0));
    ecg.heartBlockDegree = static_cast<int>(degree);
    ecg.escapeRate = BIO_TRY(params.real("escape_rate", ecg.escapeRate));
    const std::string policy = BIO_TRY(params.keyword("boundary_policy", "skip"));
    ecg.boundaryPolicy = BIO_TRY(parseBoundaryPolicy(policy));
    BIO_TRY_VOID(readMorphology(params, ecg.morphology));

    Signal out = BIO_TRY(render(tb, ecg, rng()));
    params.warnUnused(kTag);
    return out;
}

} // namespace bio::synth
