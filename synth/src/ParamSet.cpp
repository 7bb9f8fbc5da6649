/**
 * @file ParamSet.cpp
 * @brief Implementation of ParamSet and the validation helpers.
 */

#include "bio/synth/ParamSet.hpp"
#include "bio/core/Log.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace bio::synth {

using core::Error;
using core::ErrorCode;
using core::f64;
using core::i64;

namespace {

core::Error wrongKind(std::string_view key, std::string_view expected)
{
    return Error::make(ErrorCode::kInvalidParameter,
        "parameter '" + std::string(key) + "' must be " + std::string(expected));
}

std::string toLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

ParamSet &ParamSet::set(std::string key, bool value)        { _values[std::move(key)] = value; return *this; }
ParamSet &ParamSet::set(std::string key, int value)         { _values[std::move(key)] = static_cast<i64>(value); return *this; }
ParamSet &ParamSet::set(std::string key, i64 value)         { _values[std::move(key)] = value; return *this; }
ParamSet &ParamSet::set(std::string key, f64 value)         { _values[std::move(key)] = value; return *this; }
ParamSet &ParamSet::set(std::string key, const char *value) { _values[std::move(key)] = std::string(value); return *this; }
ParamSet &ParamSet::set(std::string key, std::string value) { _values[std::move(key)] = std::move(value); return *this; }

ParamSet &ParamSet::set(std::string key, std::vector<f64> value)
{
    _values[std::move(key)] = std::move(value);
    return *this;
}

ParamSet &ParamSet::set(std::string key, std::vector<std::string> value)
{
    _values[std::move(key)] = std::move(value);
    return *this;
}

bool ParamSet::has(std::string_view key) const
{
    return _values.find(key) != _values.end();
}

const ParamValue *ParamSet::lookup(std::string_view key) const
{
    const auto it = _values.find(key);
    if (it == _values.end())
        return nullptr;
    _consumed.emplace(key);
    return &it->second;
}

core::Expected<f64> ParamSet::real(std::string_view key, f64 fallback) const
{
    const auto value = BIO_TRY(optionalReal(key));
    return value.value_or(fallback);
}

core::Expected<std::optional<f64>> ParamSet::optionalReal(std::string_view key) const
{
    const ParamValue *value = lookup(key);
    if (!value)
        return std::optional<f64>{};
    if (const auto *d = std::get_if<f64>(value)) {
        if (!std::isfinite(*d))
            return std::unexpected(wrongKind(key, "a finite number"));
        return std::optional<f64>{*d};
    }
    if (const auto *i = std::get_if<i64>(value))
        return std::optional<f64>{static_cast<f64>(*i)};
    return std::unexpected(wrongKind(key, "a number"));
}

core::Expected<i64> ParamSet::integer(std::string_view key, i64 fallback) const
{
    const ParamValue *value = lookup(key);
    if (!value)
        return fallback;
    if (const auto *i = std::get_if<i64>(value))
        return *i;
    if (const auto *d = std::get_if<f64>(value)) {
        // 2^63 is exact in a double; [-2^63, 2^63) is the range i64 can hold.
        constexpr f64 kI64Limit = 9223372036854775808.0;
        if (std::isfinite(*d) && std::floor(*d) == *d) {
            if (*d >= -kI64Limit && *d < kI64Limit)
                return static_cast<i64>(*d);
            return std::unexpected(
                Error::make(ErrorCode::kInvalidParameter,
                    "parameter '" + std::string(key) + "' is outside the 64-bit integer range"));
        }
    }
    return std::unexpected(wrongKind(key, "an integer"));
}

core::Expected<bool> ParamSet::boolean(std::string_view key, bool fallback) const
{
    const ParamValue *value = lookup(key);
    if (!value)
        return fallback;
    if (const auto *b = std::get_if<bool>(value))
        return *b;
    return std::unexpected(wrongKind(key, "a boolean"));
}

core::Expected<std::string> ParamSet::string(std::string_view key, std::string fallback) const
{
    const ParamValue *value = lookup(key);
    if (!value)
        return fallback;
    if (const auto *s = std::get_if<std::string>(value))
        return *s;
    return std::unexpected(wrongKind(key, "a string"));
}

core::Expected<std::string> ParamSet::keyword(std::string_view key, std::string fallback) const
{
    std::string value = BIO_TRY(string(key, std::move(fallback)));
    return toLower(std::move(value));
}

core::Expected<std::vector<std::string>> ParamSet::keywords(std::string_view key) const
{
    std::vector<std::string> values = BIO_TRY(strings(key));
    for (auto &v : values)
        v = toLower(std::move(v));
    return values;
}

core::Expected<std::vector<f64>> ParamSet::reals(std::string_view key, std::vector<f64> fallback) const
{
    const ParamValue *value = lookup(key);
    if (!value)
        return fallback;
    if (const auto *list = std::get_if<std::vector<f64>>(value)) {
        for (const f64 v : *list) {
            if (!std::isfinite(v))
                return std::unexpected(wrongKind(key, "a list of finite numbers"));
        }
        return *list;
    }
    if (const auto *d = std::get_if<f64>(value))
        return std::vector<f64>{*d};
    if (const auto *i = std::get_if<i64>(value))
        return std::vector<f64>{static_cast<f64>(*i)};
    return std::unexpected(wrongKind(key, "a list of numbers"));
}

core::Expected<std::vector<std::string>> ParamSet::strings(
    std::string_view key, std::vector<std::string> fallback) const
{
    const ParamValue *value = lookup(key);
    if (!value)
        return fallback;
    if (const auto *list = std::get_if<std::vector<std::string>>(value))
        return *list;
    if (const auto *s = std::get_if<std::string>(value))
        return std::vector<std::string>{*s};
    return std::unexpected(wrongKind(key, "a list of strings"));
}

std::vector<std::string> ParamSet::unusedKeys() const
{
    std::vector<std::string> unused;
    for (const auto &[key, value] : _values) {
        if (!_consumed.contains(key))
            unused.push_back(key);
    }
    return unused;
}

void ParamSet::warnUnused(std::string_view tag) const
{
    for (const auto &key : unusedKeys())
        core::Log::warn(tag, "ignoring unknown parameter '" + key + "'");
}

core::ExpectedVoid requireInRange(std::string_view name, f64 value, f64 lo, f64 hi)
{
    if (!(value >= lo && value <= hi)) {
        std::ostringstream os;
        os << name << " must be in [" << lo << ", " << hi << "], got " << value;
        return std::unexpected(Error::make(ErrorCode::kInvalidParameter, os.str()));
    }
    return {};
}

core::ExpectedVoid requirePositive(std::string_view name, f64 value)
{
    if (!(value > 0.0) || !std::isfinite(value)) {
        std::ostringstream os;
        os << name << " must be positive, got " << value;
        return std::unexpected(Error::make(ErrorCode::kInvalidParameter, os.str()));
    }
    return {};
}

core::ExpectedVoid requireNonNegative(std::string_view name, f64 value)
{
    if (!(value >= 0.0) || !std::isfinite(value)) {
        std::ostringstream os;
        os << name << " must be non-negative, got " << value;
        return std::unexpected(Error::make(ErrorCode::kInvalidParameter, os.str()));
    }
    return {};
}

} // namespace bio::synth
