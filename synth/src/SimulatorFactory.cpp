/**
 * @file SimulatorFactory.cpp
 * @brief Implementation of the SimulatorFactory.
 */

#include "bio/synth/SimulatorFactory.hpp"
#include "bio/synth/EcgSynthesizer.hpp"
#include "bio/synth/EmgSynthesizer.hpp"
#include "bio/synth/EogSynthesizer.hpp"
#include "bio/synth/NoiseSynthesizer.hpp"

namespace bio::synth {

core::Expected<std::unique_ptr<Simulator>> SimulatorFactory::create(const SimulatorConfig &config)
{
    TimeBase tb = BIO_TRY(TimeBase::make(config.samplingRate(), config.duration()));
    core::Log::setMinLevel(config.logLevel());

    switch (config.family()) {
        case SignalFamily::kEmg:
            return std::make_unique<EmgSynthesizer>(std::move(tb), config.seed());

        case SignalFamily::kEcg:
            return std::make_unique<EcgSynthesizer>(std::move(tb), config.seed());

        case SignalFamily::kEog:
            return std::make_unique<EogSynthesizer>(std::move(tb), config.seed());

        case SignalFamily::kNoise:
            return std::make_unique<NoiseSynthesizer>(std::move(tb), config.seed());
    }

    return std::unexpected(
        core::Error::make(core::ErrorCode::kUnsupportedType, "Unknown signal family"));
}

} // namespace bio::synth
