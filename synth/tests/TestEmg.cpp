/**
 * @file TestEmg.cpp
 * @brief Unit tests for the EMG synthesizer.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "bio/math/Statistics.hpp"
#include "bio/synth/EmgSynthesizer.hpp"

#include <algorithm>
#include <cmath>
#include <span>

namespace bio::synth {

using Catch::Matchers::WithinAbs;

namespace {

TimeBase makeTimeBase(double fs, double duration)
{
    auto tb = TimeBase::make(fs, duration);
    REQUIRE(tb.has_value());
    return *tb;
}

double rmsOf(std::span<const double> s)
{
    return math::Statistics::rms(s);
}

} // namespace

TEST_CASE("Higher intensity gives a denser, stronger EMG", "[synth][emg]")
{
    EmgSynthesizer emg(makeTimeBase(1000.0, 2.0), 42);

    auto strong = emg.simulateIsometric(1.0);
    auto weak = emg.simulateIsometric(0.1);
    REQUIRE(strong.has_value());
    REQUIRE(weak.has_value());
    REQUIRE(strong->size() == 2000);

    const auto active = [](const Signal &s) {
        return std::count_if(s.begin(), s.end(), [](double v) { return v != 0.0; });
    };
    REQUIRE(active(*strong) > active(*weak));
    REQUIRE(rmsOf(*strong) > rmsOf(*weak));
}

TEST_CASE("Zero intensity still fires at the floor rate", "[synth][emg]")
{
    EmgSynthesizer emg(makeTimeBase(1000.0, 2.0), 17);

    auto rest = emg.generate(ParamSet{}.set("pattern_type", "isometric").set("intensity", 0.0).set("duration", 2.0));
    auto full = emg.generate(ParamSet{}.set("pattern_type", "isometric").set("intensity", 1.0).set("duration", 2.0));
    REQUIRE(rest.has_value());
    REQUIRE(full.has_value());
    REQUIRE(rest->size() == 2000);

    const auto fraction = [](const Signal &s) {
        return static_cast<double>(std::count_if(s.begin(), s.end(), [](double v) { return v != 0.0; })) /
               static_cast<double>(s.size());
    };
    REQUIRE(fraction(*rest) > 0.0);
    REQUIRE(fraction(*rest) < 0.5);
    REQUIRE(fraction(*full) > fraction(*rest));
}

TEST_CASE("Intensity outside [0, 1] is rejected", "[synth][emg]")
{
    EmgSynthesizer emg(makeTimeBase(1000.0, 1.0), 1);

    auto out = emg.simulateIsometric(1.5);
    REQUIRE_FALSE(out.has_value());
    REQUIRE(out.error().code == core::ErrorCode::kInvalidParameter);

    auto viaParams = emg.generate(ParamSet{}.set("activation_level", -0.2));
    REQUIRE_FALSE(viaParams.has_value());
    REQUIRE(viaParams.error().code == core::ErrorCode::kInvalidParameter);
}

TEST_CASE("Linear ramp grows over the recording", "[synth][emg]")
{
    EmgSynthesizer emg(makeTimeBase(1000.0, 4.0), 5);
    auto out = emg.simulateDynamic(DynamicParams{.rampType = RampType::kLinear, .maxIntensity = 1.0});
    REQUIRE(out.has_value());

    const std::span<const double> all(*out);
    REQUIRE(rmsOf(all.last(1000)) > rmsOf(all.first(1000)));
}

TEST_CASE("Custom ramp follows the supplied envelope", "[synth][emg]")
{
    EmgSynthesizer emg(makeTimeBase(1000.0, 2.0), 5);

    DynamicParams params{.rampType = RampType::kCustom};
    params.envelope = {1.0, 1.0, 0.0, 0.0};
    auto out = emg.simulateDynamic(params);
    REQUIRE(out.has_value());

    const std::span<const double> all(*out);
    REQUIRE(rmsOf(all.first(500)) > rmsOf(all.last(500)));

    params.envelope = {0.5};
    REQUIRE_FALSE(emg.simulateDynamic(params).has_value());
}

TEST_CASE("Repetitive contractions alternate with rest", "[synth][emg]")
{
    EmgSynthesizer emg(makeTimeBase(1000.0, 4.0), 9);
    auto out = emg.simulateRepetitive(RepetitiveParams{.frequency = 0.5, .dutyCycle = 0.5,
                                                       .intensity = 1.0, .restIntensity = 0.0});
    REQUIRE(out.has_value());

    const std::span<const double> all(*out);
    REQUIRE(rmsOf(all.subspan(0, 1000)) > rmsOf(all.subspan(1000, 1000)));
    REQUIRE(rmsOf(all.subspan(2000, 1000)) > rmsOf(all.subspan(3000, 1000)));
}

TEST_CASE("Complex sequence places segments back to back", "[synth][emg]")
{
    EmgSynthesizer emg(makeTimeBase(1000.0, 2.0), 3);

    ComplexParams params;
    params.segments = {
        {MovementType::kIsometric, 1.0, 0.8},
        {MovementType::kRest, 1.0, 0.0},
    };
    auto out = emg.simulateComplex(params);
    REQUIRE(out.has_value());
    REQUIRE(out->size() == 2000);

    REQUIRE(rmsOf(std::span<const double>(*out).first(1000)) > 0.0);
    REQUIRE(std::all_of(out->begin() + 1000, out->end(), [](double v) { return v == 0.0; }));
}

TEST_CASE("Complex sequence longer than the recording is rejected", "[synth][emg]")
{
    EmgSynthesizer emg(makeTimeBase(1000.0, 2.0), 3);

    auto out = emg.generate(ParamSet{}
        .set("pattern_type", "complex")
        .set("movements", std::vector<std::string>{"isometric", "dynamic"})
        .set("durations", std::vector<double>{1.5, 1.5})
        .set("intensities", std::vector<double>{0.5, 0.5}));
    REQUIRE_FALSE(out.has_value());
    REQUIRE(out.error().code == core::ErrorCode::kInvalidParameter);

    auto mismatched = emg.generate(ParamSet{}
        .set("pattern_type", "complex")
        .set("movements", std::vector<std::string>{"isometric", "rest"})
        .set("durations", std::vector<double>{0.5})
        .set("intensities", std::vector<double>{0.5, 0.5}));
    REQUIRE_FALSE(mismatched.has_value());

    auto overlapping = emg.generate(ParamSet{}
        .set("pattern_type", "complex")
        .set("movements", std::vector<std::string>{"isometric", "dynamic"})
        .set("durations", std::vector<double>{1.5, 1.5})
        .set("intensities", std::vector<double>{0.5, 0.5})
        .set("overlap", true));
    REQUIRE(overlapping.has_value());
}

TEST_CASE("Fatigue decays the signal exponentially", "[synth][emg]")
{
    const TimeBase tb = makeTimeBase(100.0, 1.0);
    Signal ones(tb.sampleCount(), 1.0);

    REQUIRE(EmgSynthesizer::applyFatigue(ones, tb, 2.0).has_value());
    REQUIRE(ones.front() == 1.0);
    REQUIRE_THAT(ones[50], WithinAbs(std::exp(-1.0), 1e-12));
    REQUIRE(std::is_sorted(ones.rbegin(), ones.rend()));

    REQUIRE_FALSE(EmgSynthesizer::applyFatigue(ones, tb, -1.0).has_value());
}

TEST_CASE("EMG generate dispatches on pattern_type", "[synth][emg]")
{
    EmgSynthesizer emg(makeTimeBase(1000.0, 1.0), 8);

    for (const char *pattern : {"isometric", "dynamic", "repetitive"}) {
        INFO(pattern);
        auto out = emg.generate(ParamSet{}.set("pattern_type", pattern).set("fatigue", true));
        REQUIRE(out.has_value());
        REQUIRE(out->size() == 1000);
    }

    auto unknown = emg.generate(ParamSet{}.set("pattern_type", "spasm"));
    REQUIRE_FALSE(unknown.has_value());
    REQUIRE(unknown.error().code == core::ErrorCode::kUnsupportedType);

    REQUIRE(parseRampType("ramp").value() == RampType::kLinear);
    REQUIRE(parseMovementType("rest").value() == MovementType::kRest);
}

} // namespace bio::synth
