/**
 * @file TestSimulator.cpp
 * @brief Unit tests for the simulator facade, configuration and factory.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "bio/core/Log.hpp"
#include "bio/math/Statistics.hpp"
#include "bio/synth/SimulatorFactory.hpp"

#include <algorithm>
#include <numeric>
#include <optional>
#include <vector>

namespace bio::synth {

using Catch::Matchers::WithinAbs;

namespace {

std::unique_ptr<Simulator> makeSimulator(SignalFamily family, double fs = 1000.0, double duration = 2.0,
                                         core::u64 seed = 42)
{
    auto sim = SimulatorFactory::create(SimulatorConfig::Builder{}
        .family(family)
        .samplingRate(fs)
        .duration(duration)
        .seed(seed)
        .logLevel(core::Log::minLevel())
        .build());
    REQUIRE(sim.has_value());
    return std::move(sim.value());
}

} // namespace

TEST_CASE("SimulatorConfig defaults", "[synth][config]")
{
    const SimulatorConfig cfg = SimulatorConfig::Builder{}.build();

    REQUIRE(cfg.family() == SignalFamily::kNoise);
    REQUIRE(cfg.samplingRate() == 1000.0);
    REQUIRE(cfg.duration() == 10.0);
    REQUIRE_FALSE(cfg.seed().has_value());
    REQUIRE(cfg.logLevel() == core::LogLevel::kInfo);
}

TEST_CASE("SimulatorConfig keeps an explicit zero seed", "[synth][config]")
{
    const SimulatorConfig cfg = SimulatorConfig::Builder{}.seed(0).build();
    REQUIRE(cfg.seed() == std::optional<core::u64>{0});

    auto a = SimulatorFactory::create(cfg);
    auto b = SimulatorFactory::create(cfg);
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE((*a)->generate(ParamSet{}).value() == (*b)->generate(ParamSet{}).value());
}

TEST_CASE("SimulatorFactory builds every family", "[synth][factory]")
{
    for (const auto family : {SignalFamily::kEmg, SignalFamily::kEcg, SignalFamily::kEog, SignalFamily::kNoise}) {
        INFO(signalFamilyName(family));
        auto sim = makeSimulator(family, 500.0, 4.0);
        REQUIRE(sim->family() == family);
        REQUIRE(sim->sampleCount() == 2000);

        auto out = sim->generate(ParamSet{});
        REQUIRE(out.has_value());
        REQUIRE(out->size() == 2000);
    }
}

TEST_CASE("SimulatorFactory rejects an invalid time base", "[synth][factory]")
{
    auto sim = SimulatorFactory::create(SimulatorConfig::Builder{}.samplingRate(0.0).build());
    REQUIRE_FALSE(sim.has_value());
    REQUIRE(sim.error().code == core::ErrorCode::kInvalidParameter);
}

TEST_CASE("SimulatorFactory applies the log level", "[synth][factory]")
{
    const core::LogLevel previous = core::Log::minLevel();

    auto sim = SimulatorFactory::create(SimulatorConfig::Builder{}.logLevel(core::LogLevel::kError).build());
    REQUIRE(sim.has_value());
    REQUIRE(core::Log::minLevel() == core::LogLevel::kError);

    core::Log::setMinLevel(previous);
}

TEST_CASE("Signal family names", "[synth][factory]")
{
    REQUIRE(parseSignalFamily("ecg").value() == SignalFamily::kEcg);
    REQUIRE(signalFamilyName(SignalFamily::kEog) == "eog");

    auto bad = parseSignalFamily("eeg");
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == core::ErrorCode::kUnsupportedType);
}

TEST_CASE("addNoise overlays noise on a finished signal", "[synth][simulator]")
{
    auto sim = makeSimulator(SignalFamily::kEcg);
    const Signal flat(sim->sampleCount(), 1.0);

    auto silent = sim->addNoise(flat, "gaussian", ParamSet{}.set("std", 0.0));
    REQUIRE(silent.has_value());
    REQUIRE(*silent == flat);

    auto noisy = sim->addNoise(flat, "powerline", ParamSet{}.set("amplitude", 0.5).set("harmonics", 1));
    REQUIRE(noisy.has_value());
    REQUIRE_THAT(math::Statistics::computeBaseline(*noisy).mean, WithinAbs(1.0, 1e-9));
    REQUIRE_THAT(math::Statistics::peakAbs(*noisy), WithinAbs(1.5, 5e-3));

    auto unknown = sim->addNoise(flat, "violet");
    REQUIRE_FALSE(unknown.has_value());
    REQUIRE(unknown.error().code == core::ErrorCode::kUnsupportedType);

    auto shortSignal = sim->addNoise(Signal(10, 0.0), "gaussian");
    REQUIRE_FALSE(shortSignal.has_value());
    REQUIRE(shortSignal.error().code == core::ErrorCode::kInvalidParameter);
}

TEST_CASE("addArtifact places spikes and steps deterministically", "[synth][simulator]")
{
    auto sim = makeSimulator(SignalFamily::kEmg);
    const Signal zeros(sim->sampleCount(), 0.0);

    auto spike = sim->addArtifact(zeros, "spike", 0.5, 0.01, 3.0);
    REQUIRE(spike.has_value());
    REQUIRE((*spike)[500] == 3.0);
    REQUIRE(std::accumulate(spike->begin(), spike->end(), 0.0) == 3.0);

    auto step = sim->addArtifact(zeros, "step", 1.0, 0.1, 2.0);
    REQUIRE(step.has_value());
    REQUIRE((*step)[999] == 0.0);
    REQUIRE((*step)[1000] == 2.0);
    REQUIRE((*step)[1099] == 2.0);
    REQUIRE((*step)[1100] == 0.0);

    auto tail = sim->addArtifact(zeros, "step", 1.95, 0.2, 1.0);
    REQUIRE(tail.has_value());
    REQUIRE(tail->back() == 1.0);
}

TEST_CASE("addArtifact renders burst shapes at the requested time", "[synth][simulator]")
{
    auto sim = makeSimulator(SignalFamily::kEog);
    const Signal zeros(sim->sampleCount(), 0.0);

    for (const char *type : {"electrode_pop", "electrode_movement", "cable_motion",
                             "baseline_shift", "impedance_change"}) {
        INFO(type);
        auto out = sim->addArtifact(zeros, type, 1.0, 0.2, 1.0);
        REQUIRE(out.has_value());
        REQUIRE(std::all_of(out->begin(), out->begin() + 1000, [](double v) { return v == 0.0; }));
        REQUIRE(std::all_of(out->begin() + 1200, out->end(), [](double v) { return v == 0.0; }));
        REQUIRE(math::Statistics::peakAbs(*out) > 0.0);
    }
}

TEST_CASE("addArtifact validates its window and type", "[synth][simulator]")
{
    auto sim = makeSimulator(SignalFamily::kNoise);
    const Signal zeros(sim->sampleCount(), 0.0);

    const auto codeOf = [&](std::string_view type, double start, double duration) {
        auto out = sim->addArtifact(zeros, type, start, duration, 1.0);
        REQUIRE_FALSE(out.has_value());
        return out.error().code;
    };

    REQUIRE(codeOf("spike", -0.1, 0.1) == core::ErrorCode::kInvalidParameter);
    REQUIRE(codeOf("spike", 2.0, 0.1) == core::ErrorCode::kInvalidParameter);
    REQUIRE(codeOf("step", 0.5, 0.0) == core::ErrorCode::kInvalidParameter);
    REQUIRE(codeOf("sparkle", 0.5, 0.1) == core::ErrorCode::kUnsupportedType);
    REQUIRE(codeOf("dc_offset", 0.5, 0.1) == core::ErrorCode::kUnsupportedType);
}

TEST_CASE("applyNoiseLayers skips disabled layers", "[synth][simulator]")
{
    auto sim = makeSimulator(SignalFamily::kEcg);
    const Signal zeros(sim->sampleCount(), 0.0);

    const std::vector<NoiseLayer> layers = {
        {"powerline", ParamSet{}.set("amplitude", 0.2), true},
        {"gaussian", ParamSet{}.set("std", 5.0), false},
        {"baseline_wander", ParamSet{}.set("amplitude", 0.0), true},
    };
    auto layered = sim->applyNoiseLayers(zeros, layers);
    REQUIRE(layered.has_value());

    auto powerline = sim->addNoise(zeros, "powerline", ParamSet{}.set("amplitude", 0.2));
    REQUIRE(powerline.has_value());
    REQUIRE(*layered == *powerline);
}

TEST_CASE("Simulators with the same seed agree", "[synth][simulator]")
{
    for (const auto family : {SignalFamily::kEmg, SignalFamily::kEcg, SignalFamily::kEog, SignalFamily::kNoise}) {
        INFO(signalFamilyName(family));
        auto a = makeSimulator(family, 1000.0, 2.0, 123);
        auto b = makeSimulator(family, 1000.0, 2.0, 123);
        REQUIRE(a->generate(ParamSet{}).value() == b->generate(ParamSet{}).value());

        a->seed(9);
        b->seed(9);
        REQUIRE(a->generate(ParamSet{}).value() == b->generate(ParamSet{}).value());

        const ParamSet zero = ParamSet{}.set("random_seed", 0);
        REQUIRE(a->generate(zero).value() == b->generate(zero).value());
    }
}

} // namespace bio::synth
