/**
 * @file SimulatorFactory.hpp
 * @brief Creates the Simulator matching a SimulatorConfig.
 *
 * @see SimulatorConfig, Simulator
 */

#pragma once

#include "bio/synth/SimulatorConfig.hpp"

#include <memory>

namespace bio::synth {

/**
 * @brief Factory that instantiates the synthesizer for the configured family.
 *
 * @code
 *   auto cfg = SimulatorConfig::Builder{}
 *       .family(SignalFamily::kEcg)
 *       .samplingRate(500.0)
 *       .duration(10.0)
 *       .seed(42)
 *       .build();
 *   auto sim = SimulatorFactory::create(cfg);
 *   if (sim) {
 *       auto ecg = sim.value()->generate(ParamSet{}.set("condition", "af"));
 *   }
 * @endcode
 */
class SimulatorFactory {
public:
    SimulatorFactory() = delete;

    /**
     * @brief Validates the time base, applies the log level and builds the simulator.
     * @return kInvalidParameter for a non-positive sampling rate or duration
     */
    [[nodiscard]] static core::Expected<std::unique_ptr<Simulator>> create(const SimulatorConfig &config);
};

} // namespace bio::synth
