/**
 * @file TestNoise.cpp
 * @brief Unit tests for the noise and artifact generator.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "bio/math/Statistics.hpp"
#include "bio/synth/NoiseSynthesizer.hpp"

#include <algorithm>
#include <cmath>

namespace bio::synth {

using Catch::Matchers::WithinAbs;

namespace {

TimeBase makeTimeBase(double fs, double duration)
{
    auto tb = TimeBase::make(fs, duration);
    REQUIRE(tb.has_value());
    return *tb;
}

bool allFinite(const Signal &s)
{
    return std::all_of(s.begin(), s.end(), [](double v) { return std::isfinite(v); });
}

double slopeOf(const Signal &s, double fs)
{
    auto spectrum = math::Statistics::periodogram(s, fs);
    REQUIRE(spectrum.has_value());
    auto slope = math::Statistics::spectralSlope(*spectrum, 1.0, 100.0);
    REQUIRE(slope.has_value());
    return *slope;
}

} // namespace

TEST_CASE("Gaussian noise with zero std is silent", "[synth][noise]")
{
    NoiseSynthesizer noise(makeTimeBase(1000.0, 1.0), 42);
    auto out = noise.simulateNoise(NoiseType::kGaussian, ParamSet{}.set("std", 0.0));

    REQUIRE(out.has_value());
    REQUIRE(out->size() == 1000);
    REQUIRE(std::all_of(out->begin(), out->end(), [](double v) { return v == 0.0; }));
}

TEST_CASE("Gaussian noise has the requested spread", "[synth][noise]")
{
    NoiseSynthesizer noise(makeTimeBase(1000.0, 10.0), 42);
    auto out = noise.simulateNoise(NoiseType::kGaussian, ParamSet{}.set("std", 2.0));

    REQUIRE(out.has_value());
    const auto b = math::Statistics::computeBaseline(*out);
    REQUIRE_THAT(b.mean, WithinAbs(0.0, 0.1));
    REQUIRE_THAT(b.stdDev, WithinAbs(2.0, 0.1));
}

TEST_CASE("Brown noise is steeper than pink noise", "[synth][noise]")
{
    constexpr double kFs = 1000.0;
    NoiseSynthesizer noise(makeTimeBase(kFs, 10.0), 7);

    auto pink = noise.simulateNoise(NoiseType::kPink);
    auto brown = noise.simulateNoise(NoiseType::kBrown);
    REQUIRE(pink.has_value());
    REQUIRE(brown.has_value());

    const double pinkSlope = slopeOf(*pink, kFs);
    const double brownSlope = slopeOf(*brown, kFs);

    REQUIRE(pinkSlope < 0.0);
    REQUIRE(brownSlope < pinkSlope);
    REQUIRE(pinkSlope > -1.5);
    REQUIRE(pinkSlope < -0.5);
    REQUIRE(brownSlope < -1.5);
}

TEST_CASE("Coloured noise is scaled to the requested RMS", "[synth][noise]")
{
    NoiseSynthesizer noise(makeTimeBase(500.0, 4.0), 3);
    auto pink = noise.simulateNoise(NoiseType::kPink, ParamSet{}.set("amplitude", 0.5));

    REQUIRE(pink.has_value());
    REQUIRE_THAT(math::Statistics::rms(*pink), WithinAbs(0.5, 1e-9));
    REQUIRE_THAT(math::Statistics::computeBaseline(*pink).mean, WithinAbs(0.0, 1e-9));
}

TEST_CASE("Powerline noise peaks at the mains frequency", "[synth][noise]")
{
    constexpr double kFs = 1000.0;
    NoiseSynthesizer noise(makeTimeBase(kFs, 2.0), 1);
    auto out = noise.simulateNoise(NoiseType::kPowerline,
        ParamSet{}.set("frequency", 60.0).set("harmonics", 1));
    REQUIRE(out.has_value());

    auto spectrum = math::Statistics::periodogram(*out, kFs);
    REQUIRE(spectrum.has_value());
    const auto best = std::max_element(spectrum->power.begin(), spectrum->power.end());
    const auto k = static_cast<std::size_t>(std::distance(spectrum->power.begin(), best));
    REQUIRE_THAT(spectrum->frequencies[k], WithinAbs(60.0, 0.5));
}

TEST_CASE("Every noise and artifact type renders a full-length signal", "[synth][noise]")
{
    NoiseSynthesizer noise(makeTimeBase(1000.0, 3.0), 11);

    for (const char *name : {"gaussian", "pink", "brown", "powerline", "baseline_wander", "high_frequency",
                             "electrode_movement", "cable_motion", "subject_movement", "baseline_shift",
                             "poor_contact", "electrode_pop", "impedance_change", "dc_offset",
                             "emg", "emg_crosstalk", "ecg", "ecg_interference", "environmental",
                             "device", "device_artifact"}) {
        INFO(name);
        auto out = noise.generate(ParamSet{}.set("noise_type", name));
        REQUIRE(out.has_value());
        REQUIRE(out->size() == 3000);
        REQUIRE(allFinite(*out));
    }
}

TEST_CASE("Noise type names", "[synth][noise]")
{
    REQUIRE(parseNoiseType("baseline_wander").value() == NoiseType::kBaselineWander);
    REQUIRE(noiseTypeName(NoiseType::kHighFrequency) == "high_frequency");
    REQUIRE(parseArtifactType("emg_crosstalk").value() == ArtifactType::kEmgCrosstalk);
    REQUIRE(artifactTypeName(ArtifactType::kEmgCrosstalk) == "emg");
    REQUIRE(artifactFamily(ArtifactType::kPoorContact) == ArtifactFamily::kElectrode);
    REQUIRE(artifactFamily(ArtifactType::kDevice) == ArtifactFamily::kInterference);
}

TEST_CASE("Unknown noise types are rejected", "[synth][noise]")
{
    NoiseSynthesizer noise(makeTimeBase(1000.0, 1.0), 1);
    auto out = noise.generate(ParamSet{}.set("noise_type", "violet"));

    REQUIRE_FALSE(out.has_value());
    REQUIRE(out.error().code == core::ErrorCode::kUnsupportedType);
}

TEST_CASE("Artifact family helpers reject foreign types", "[synth][noise]")
{
    NoiseSynthesizer noise(makeTimeBase(1000.0, 2.0), 1);

    REQUIRE(noise.simulateMotionArtifacts(ArtifactType::kCableMotion).has_value());
    REQUIRE(noise.simulateElectrodeArtifacts(ArtifactType::kElectrodePop).has_value());
    REQUIRE(noise.simulateInterference(ArtifactType::kEnvironmental).has_value());

    auto wrong = noise.simulateMotionArtifacts(ArtifactType::kElectrodePop);
    REQUIRE_FALSE(wrong.has_value());
    REQUIRE(wrong.error().code == core::ErrorCode::kUnsupportedType);
}

TEST_CASE("Artifact events must be shorter than the signal", "[synth][noise]")
{
    NoiseSynthesizer noise(makeTimeBase(1000.0, 2.0), 1);
    auto out = noise.simulateArtifact(ArtifactType::kCableMotion, ParamSet{}.set("duration", 2.0));

    REQUIRE_FALSE(out.has_value());
    REQUIRE(out.error().code == core::ErrorCode::kInvalidParameter);
}

TEST_CASE("Bursts without events leave the signal silent", "[synth][noise]")
{
    NoiseSynthesizer noise(makeTimeBase(1000.0, 2.0), 1);
    auto out = noise.simulateArtifact(ArtifactType::kElectrodePop, ParamSet{}.set("n_events", 0));

    REQUIRE(out.has_value());
    REQUIRE(std::all_of(out->begin(), out->end(), [](double v) { return v == 0.0; }));
}

TEST_CASE("signal_duration shortens the rendered noise", "[synth][noise]")
{
    NoiseSynthesizer noise(makeTimeBase(1000.0, 2.0), 1);

    auto shorter = noise.generate(ParamSet{}.set("signal_duration", 0.5));
    REQUIRE(shorter.has_value());
    REQUIRE(shorter->size() == 500);

    auto longer = noise.generate(ParamSet{}.set("signal_duration", 3.0));
    REQUIRE_FALSE(longer.has_value());
    REQUIRE(longer.error().code == core::ErrorCode::kInvalidParameter);
}

TEST_CASE("Noise is reproducible for a fixed seed", "[synth][noise]")
{
    NoiseSynthesizer a(makeTimeBase(1000.0, 1.0), 99);
    NoiseSynthesizer b(makeTimeBase(1000.0, 1.0), 99);
    REQUIRE(a.simulateNoise(NoiseType::kPink).value() == b.simulateNoise(NoiseType::kPink).value());

    const ParamSet seeded = ParamSet{}.set("noise_type", "brown").set("random_seed", 5);
    REQUIRE(a.generate(seeded).value() == b.generate(seeded).value());
    REQUIRE(a.generate(seeded).value() == a.generate(seeded).value());
}

TEST_CASE("A zero random_seed is as reproducible as any other", "[synth][noise]")
{
    NoiseSynthesizer a(makeTimeBase(1000.0, 1.0));
    NoiseSynthesizer b(makeTimeBase(1000.0, 1.0), 12345);

    const ParamSet zero = ParamSet{}.set("noise_type", "gaussian").set("random_seed", 0);
    const Signal first = a.generate(zero).value();
    REQUIRE(first == b.generate(zero).value());
    REQUIRE(first == a.generate(zero).value());
}

} // namespace bio::synth
