/**
 * @file Signal.cpp
 * @brief Signal composition helpers.
 */

#include "bio/synth/Signal.hpp"

#include <string>

namespace bio::synth {

core::Expected<Signal> addSignals(const Signal &a, const Signal &b)
{
    if (a.size() != b.size()) {
        return std::unexpected(
            core::Error::make(core::ErrorCode::kSizeMismatch,
                "cannot add signals of " + std::to_string(a.size()) +
                " and " + std::to_string(b.size()) + " samples"));
    }

    Signal out(a.size());
    for (core::usize i = 0; i < a.size(); ++i)
        out[i] = a[i] + b[i];
    return out;
}

} // namespace bio::synth
