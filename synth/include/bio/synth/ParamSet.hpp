/**
 * @file ParamSet.hpp
 * @brief Named generation parameters with typed, validating accessors.
 *
 * A ParamSet is a flat string-keyed map whose values are booleans,
 * integers, reals, strings or lists of reals/strings. Generators read the
 * keys they understand through the typed getters, each with a default;
 * a value of the wrong kind yields kInvalidParameter. Keys that are set
 * but never read are reported by warnUnused().
 *
 * @code
 *   ParamSet params;
 *   params.set("condition", "af").set("heart_rate", 80.0);
 *   auto ecg = synthesizer.generate(params);
 * @endcode
 */

#pragma once

#include "bio/core/Expected.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace bio::synth {

using ParamValue = std::variant<
    bool,
    core::i64,
    core::f64,
    std::string,
    std::vector<core::f64>,
    std::vector<std::string>>;

class ParamSet {
public:
    ParamSet &set(std::string key, bool value);
    ParamSet &set(std::string key, int value);
    ParamSet &set(std::string key, core::i64 value);
    ParamSet &set(std::string key, core::f64 value);
    ParamSet &set(std::string key, const char *value);
    ParamSet &set(std::string key, std::string value);
    ParamSet &set(std::string key, std::vector<core::f64> value);
    ParamSet &set(std::string key, std::vector<std::string> value);

    [[nodiscard]] bool has(std::string_view key) const;
    [[nodiscard]] core::usize size() const noexcept { return _values.size(); }

    [[nodiscard]] core::Expected<core::f64> real(std::string_view key, core::f64 fallback) const;
    [[nodiscard]] core::Expected<std::optional<core::f64>> optionalReal(std::string_view key) const;
    [[nodiscard]] core::Expected<core::i64> integer(std::string_view key, core::i64 fallback) const;
    [[nodiscard]] core::Expected<bool> boolean(std::string_view key, bool fallback) const;
    [[nodiscard]] core::Expected<std::string> string(std::string_view key, std::string fallback) const;

    /** @brief Lower-cased string, for case-insensitive type and mode names. */
    [[nodiscard]] core::Expected<std::string> keyword(std::string_view key, std::string fallback) const;

    /** @brief Lower-cased list of strings. */
    [[nodiscard]] core::Expected<std::vector<std::string>> keywords(std::string_view key) const;

    /** @brief List of reals; a scalar is accepted as a one-element list. */
    [[nodiscard]] core::Expected<std::vector<core::f64>> reals(
        std::string_view key, std::vector<core::f64> fallback = {}) const;

    /** @brief List of strings; a single string is accepted as a one-element list. */
    [[nodiscard]] core::Expected<std::vector<std::string>> strings(
        std::string_view key, std::vector<std::string> fallback = {}) const;

    /** @brief Keys that were set but never read, in lexical order. */
    [[nodiscard]] std::vector<std::string> unusedKeys() const;

    /** @brief Logs one warning per unused key under @p tag. */
    void warnUnused(std::string_view tag) const;

private:
    [[nodiscard]] const ParamValue *lookup(std::string_view key) const;

    std::map<std::string, ParamValue, std::less<>> _values;
    mutable std::set<std::string, std::less<>> _consumed;
};

// ─── Validation ──────────────────────────────────────────────────────────────

/** @brief kInvalidParameter unless lo <= value <= hi. */
[[nodiscard]] core::ExpectedVoid requireInRange(
    std::string_view name, core::f64 value, core::f64 lo, core::f64 hi);

/** @brief kInvalidParameter unless value > 0 and finite. */
[[nodiscard]] core::ExpectedVoid requirePositive(std::string_view name, core::f64 value);

/** @brief kInvalidParameter unless value >= 0 and finite. */
[[nodiscard]] core::ExpectedVoid requireNonNegative(std::string_view name, core::f64 value);

} // namespace bio::synth
