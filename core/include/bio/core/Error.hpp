/**
 * @file Error.hpp
 * @brief Structured error values for the synthesis engine.
 *
 * Every fallible operation returns Expected<T> carrying either its value
 * or an Error. Validation runs before any buffer is touched, so a failed
 * call never leaves a partially written Signal behind.
 *
 * @version 0.1.0
 */
#pragma once

#ifndef BIO_CORE_ERROR_HPP
    #define BIO_CORE_ERROR_HPP

    #include "Types.hpp"

    #include <source_location>
    #include <string>
    #include <string_view>
    #include <utility>

namespace bio::core {

/**
 * @brief Catalog of failure conditions.
 */
enum class ErrorCode : u8 {
    /// Out-of-range or malformed numeric/list parameter.
    kInvalidParameter,
    /// Unknown noise, artifact, pattern, condition or movement name.
    kUnsupportedType,
    /// Requested events cannot fit the available signal duration.
    kInsufficientDuration,
    kSizeMismatch,
    kEmptyInput
};

/**
 * @brief Returns a short human-readable label for the given error code.
 */
[[nodiscard]] constexpr std::string_view errorCodeName(ErrorCode code) noexcept
{
    switch (code) {
        case ErrorCode::kInvalidParameter:     return "InvalidParameter";
        case ErrorCode::kUnsupportedType:      return "UnsupportedType";
        case ErrorCode::kInsufficientDuration: return "InsufficientDuration";
        case ErrorCode::kSizeMismatch:         return "SizeMismatch";
        case ErrorCode::kEmptyInput:           return "EmptyInput";
    }
    return "Unknown";
}

/**
 * @brief Error with code, message, and the source location that raised it.
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::source_location location;

    /**
     * @brief Builds an Error at the call site.
     *
     * @code
     *   return std::unexpected(Error::make(ErrorCode::kInvalidParameter, "severity must be in [0, 1]"));
     * @endcode
     */
    [[nodiscard]] static Error make(
        ErrorCode code,
        std::string message,
        std::source_location loc = std::source_location::current())
    {
        return Error{code, std::move(message), loc};
    }

    /**
     * @brief Formats the error as "[Code] message (file:line)".
     */
    [[nodiscard]] std::string format() const;
};

} // namespace bio::core

#endif // BIO_CORE_ERROR_HPP
