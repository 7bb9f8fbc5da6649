/**
 * @file TestEog.cpp
 * @brief Unit tests for the EOG synthesizer.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "bio/math/Statistics.hpp"
#include "bio/synth/EogSynthesizer.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace bio::synth {

using Catch::Matchers::WithinAbs;

namespace {

TimeBase makeTimeBase(double fs, double duration)
{
    auto tb = TimeBase::make(fs, duration);
    REQUIRE(tb.has_value());
    return *tb;
}

bool allZero(const Signal &s)
{
    return std::all_of(s.begin(), s.end(), [](double v) { return v == 0.0; });
}

} // namespace

TEST_CASE("A 20 degree saccade peaks at 20 degrees", "[synth][eog]")
{
    EogSynthesizer eog(makeTimeBase(1000.0, 2.0), 1);
    auto out = eog.simulateSaccades(SaccadeParams{.amplitudes = {20.0},
                                                  .directions = {GazeDirection::kHorizontal}});
    REQUIRE(out.has_value());
    REQUIRE(out->size() == 2000);
    REQUIRE_THAT(math::Statistics::peakAbs(*out), WithinAbs(20.0, 1e-6));
}

TEST_CASE("Downward saccades flip the sign", "[synth][eog]")
{
    EogSynthesizer eog(makeTimeBase(1000.0, 1.0), 1);
    auto out = eog.simulateSaccades(SaccadeParams{.amplitudes = {10.0},
                                                  .directions = {GazeDirection::kDown}});
    REQUIRE(out.has_value());
    REQUIRE_THAT(*std::min_element(out->begin(), out->end()), WithinAbs(-10.0, 1e-6));
    REQUIRE(*std::max_element(out->begin(), out->end()) <= 0.0);
}

TEST_CASE("Saccades follow one another with a 50 ms gap", "[synth][eog]")
{
    EogSynthesizer eog(makeTimeBase(1000.0, 1.0), 1);

    // Main sequence: 5 deg lasts 30 ms, so the second saccade starts at 80 ms.
    auto returning = eog.simulateSaccades(SaccadeParams{.amplitudes = {5.0, 10.0}});
    REQUIRE(returning.has_value());
    REQUIRE_THAT((*returning)[29], WithinAbs(5.0, 1e-9));
    REQUIRE((*returning)[50] == 0.0);
    REQUIRE((*returning)[80] > 0.0);
    REQUIRE(returning->back() == 0.0);

    auto holding = eog.simulateSaccades(SaccadeParams{.amplitudes = {5.0, 10.0}, .holdPosition = true});
    REQUIRE(holding.has_value());
    REQUIRE_THAT((*holding)[50], WithinAbs(5.0, 1e-9));
    REQUIRE_THAT(holding->back(), WithinAbs(15.0, 1e-9));
}

TEST_CASE("Saccades that do not fit are skipped", "[synth][eog]")
{
    EogSynthesizer eog(makeTimeBase(1000.0, 0.05), 1);
    auto out = eog.simulateSaccades(SaccadeParams{.amplitudes = {20.0}});
    REQUIRE(out.has_value());
    REQUIRE(allZero(*out));
}

TEST_CASE("Per-saccade lists must match the amplitudes", "[synth][eog]")
{
    EogSynthesizer eog(makeTimeBase(1000.0, 1.0), 1);

    auto out = eog.simulateSaccades(SaccadeParams{.amplitudes = {1.0, 2.0, 3.0}, .durations = {0.03, 0.04}});
    REQUIRE_FALSE(out.has_value());
    REQUIRE(out.error().code == core::ErrorCode::kInvalidParameter);

    REQUIRE_FALSE(eog.simulateSaccades(SaccadeParams{.amplitudes = {}}).has_value());
    REQUIRE(eog.simulateSaccades(SaccadeParams{.amplitudes = {1.0, 2.0}, .durations = {0.03}}).has_value());
}

TEST_CASE("Sinusoidal and circular pursuit", "[synth][eog]")
{
    EogSynthesizer eog(makeTimeBase(1000.0, 2.0), 1);

    auto sine = eog.simulatePursuit(PursuitParams{.pattern = PursuitPattern::kSinusoidal});
    REQUIRE(sine.has_value());
    REQUIRE_THAT((*sine)[500], WithinAbs(10.0, 1e-9));
    REQUIRE_THAT(math::Statistics::peakAbs(*sine), WithinAbs(10.0, 1e-9));

    auto horizontal = eog.simulatePursuit(PursuitParams{.pattern = PursuitPattern::kCircular});
    auto vertical = eog.simulatePursuit(PursuitParams{.pattern = PursuitPattern::kCircular,
                                                      .direction = GazeDirection::kVertical});
    REQUIRE(horizontal.has_value());
    REQUIRE(vertical.has_value());
    REQUIRE_THAT(horizontal->front(), WithinAbs(10.0, 1e-12));
    REQUIRE_THAT(vertical->front(), WithinAbs(0.0, 1e-12));
}

TEST_CASE("Linear pursuit adds catch-up saccades", "[synth][eog]")
{
    EogSynthesizer eog(makeTimeBase(1000.0, 5.0), 1);
    auto out = eog.simulatePursuit(PursuitParams{.pattern = PursuitPattern::kLinear});
    REQUIRE(out.has_value());

    REQUIRE_THAT(out->front(), WithinAbs(-10.0, 1e-12));
    // Pure sawtooth is 9.95 here; the catch-up saccade ending at 2 s adds to it.
    REQUIRE((*out)[1995] > 10.05);
    REQUIRE_THAT((*out)[1000], WithinAbs(0.0, 1e-9));
}

TEST_CASE("Custom pursuit resamples the trajectory", "[synth][eog]")
{
    EogSynthesizer eog(makeTimeBase(100.0, 1.0), 1);

    auto out = eog.simulatePursuit(PursuitParams{.pattern = PursuitPattern::kCustom, .trajectory = {0.0, 1.0}});
    REQUIRE(out.has_value());
    REQUIRE(out->size() == 100);
    REQUIRE(out->front() == 0.0);
    REQUIRE_THAT(out->back(), WithinAbs(1.0, 1e-12));

    auto down = eog.simulatePursuit(PursuitParams{.pattern = PursuitPattern::kCustom,
                                                  .direction = GazeDirection::kDown,
                                                  .trajectory = {0.0, 1.0}});
    REQUIRE(down.has_value());
    REQUIRE_THAT(down->back(), WithinAbs(-1.0, 1e-12));
    REQUIRE(std::all_of(down->begin(), down->end(), [](double v) { return v <= 0.0; }));

    auto single = eog.simulatePursuit(PursuitParams{.pattern = PursuitPattern::kCustom, .trajectory = {1.0}});
    REQUIRE_FALSE(single.has_value());
    REQUIRE(single.error().code == core::ErrorCode::kInvalidParameter);
}

TEST_CASE("Fixation combines drift, tremor and microsaccades", "[synth][eog]")
{
    EogSynthesizer eog(makeTimeBase(1000.0, 2.0), 1);

    auto still = eog.simulateFixation(FixationParams{.driftAmplitude = 0.0, .tremorAmplitude = 0.0,
                                                     .microsaccadeRate = 0.0});
    REQUIRE(still.has_value());
    REQUIRE(allZero(*still));

    auto tremor = eog.simulateFixation(FixationParams{.driftAmplitude = 0.0, .tremorAmplitude = 0.1,
                                                      .microsaccadeRate = 0.0});
    REQUIRE(tremor.has_value());
    REQUIRE(math::Statistics::peakAbs(*tremor) <= 0.15 + 1e-9);
    REQUIRE(math::Statistics::peakAbs(*tremor) > 0.05);

    auto full = eog.simulateFixation(FixationParams{});
    REQUIRE(full.has_value());
    REQUIRE(full->size() == 2000);

    REQUIRE_FALSE(eog.simulateFixation(FixationParams{.microsaccadeRate = -1.0}).has_value());
}

TEST_CASE("Blinks that cannot fit are rejected up front", "[synth][eog]")
{
    EogSynthesizer eog(makeTimeBase(1000.0, 1.0), 1);

    auto out = eog.simulateBlinks(BlinkParams{.count = 5, .duration = 0.2, .minInterval = 0.5});
    REQUIRE_FALSE(out.has_value());
    REQUIRE(out.error().code == core::ErrorCode::kInsufficientDuration);

    auto viaParams = eog.generate(ParamSet{}.set("movement_type", "blinks").set("n_blinks", 4));
    REQUIRE_FALSE(viaParams.has_value());
    REQUIRE(viaParams.error().code == core::ErrorCode::kInsufficientDuration);
}

TEST_CASE("Blinks without variability reach the maximum amplitude", "[synth][eog]")
{
    EogSynthesizer eog(makeTimeBase(1000.0, 10.0), 1);

    auto out = eog.simulateBlinks(BlinkParams{.count = 3, .naturalVariability = false});
    REQUIRE(out.has_value());
    REQUIRE_THAT(*std::max_element(out->begin(), out->end()), WithinAbs(1.2, 0.01));
    REQUIRE(*std::min_element(out->begin(), out->end()) >= 0.0);

    auto none = eog.simulateBlinks(BlinkParams{.count = 0});
    REQUIRE(none.has_value());
    REQUIRE(allZero(*none));
}

TEST_CASE("EOG generate dispatches on movement_type", "[synth][eog]")
{
    EogSynthesizer eog(makeTimeBase(1000.0, 5.0), 1);

    for (const char *movement : {"saccades", "pursuit", "fixation", "blinks"}) {
        INFO(movement);
        auto out = eog.generate(ParamSet{}.set("movement_type", movement));
        REQUIRE(out.has_value());
        REQUIRE(out->size() == 5000);
    }

    auto withBlinks = eog.generate(ParamSet{}
        .set("movement_type", "pursuit")
        .set("pattern", "sinusoidal")
        .set("add_blinks", true)
        .set("n_blinks", 2));
    REQUIRE(withBlinks.has_value());

    auto saccades = eog.generate(ParamSet{}
        .set("amplitudes", std::vector<double>{8.0, -4.0})
        .set("directions", std::vector<std::string>{"horizontal", "up"}));
    REQUIRE(saccades.has_value());
    REQUIRE_THAT(math::Statistics::peakAbs(*saccades), WithinAbs(8.0, 1e-6));

    auto unknown = eog.generate(ParamSet{}.set("movement_type", "vergence"));
    REQUIRE_FALSE(unknown.has_value());
    REQUIRE(unknown.error().code == core::ErrorCode::kUnsupportedType);

    auto badDirection = eog.generate(ParamSet{}.set("direction", "sideways"));
    REQUIRE_FALSE(badDirection.has_value());
    REQUIRE(badDirection.error().code == core::ErrorCode::kUnsupportedType);
}

TEST_CASE("Saccade pattern sets the direction of every saccade", "[synth][eog]")
{
    EogSynthesizer eog(makeTimeBase(1000.0, 1.0), 1);
    const auto saccade = [](const char *pattern) {
        return ParamSet{}
            .set("movement_type", "saccades")
            .set("pattern", pattern)
            .set("amplitudes", std::vector<double>{20.0});
    };

    auto down = eog.generate(saccade("down"));
    REQUIRE(down.has_value());
    REQUIRE_THAT(*std::min_element(down->begin(), down->end()), WithinAbs(-20.0, 1e-6));
    REQUIRE(*std::max_element(down->begin(), down->end()) <= 0.0);

    auto vertical = eog.generate(saccade("vertical"));
    REQUIRE(vertical.has_value());
    REQUIRE_THAT(*std::max_element(vertical->begin(), vertical->end()), WithinAbs(20.0, 1e-6));

    auto explicitDirection = eog.generate(saccade("down").set("direction", "up"));
    REQUIRE(explicitDirection.has_value());
    REQUIRE(*std::min_element(explicitDirection->begin(), explicitDirection->end()) >= 0.0);

    auto diagonal = eog.generate(saccade("diagonal"));
    REQUIRE_FALSE(diagonal.has_value());
    REQUIRE(diagonal.error().code == core::ErrorCode::kInvalidParameter);
}

TEST_CASE("EOG output is reproducible for a fixed seed", "[synth][eog]")
{
    EogSynthesizer a(makeTimeBase(1000.0, 3.0), 5);
    EogSynthesizer b(makeTimeBase(1000.0, 3.0), 5);

    const ParamSet params = ParamSet{}.set("movement_type", "fixation").set("add_blinks", true);
    REQUIRE(a.generate(params).value() == b.generate(params).value());
}

} // namespace bio::synth
