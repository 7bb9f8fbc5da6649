/**
 * @file Expected.hpp
 * @brief Result types returned by every fallible synthesis call.
 *
 * A generator either yields its Signal or an Error describing the first
 * rejected parameter; no partial output is ever returned. BIO_TRY and
 * BIO_TRY_VOID use GNU statement expressions (GCC and Clang).
 *
 * @version 0.1.0
 */
#pragma once

#ifndef BIO_CORE_EXPECTED_HPP
    #define BIO_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace bio::core {

/** @brief Value of type @p T or the Error that prevented producing it. */
template <typename T>
using Expected = std::expected<T, Error>;

/** @brief Result of validation steps that produce nothing on success. */
using ExpectedVoid = Expected<void>;

} // namespace bio::core

/**
 * @brief Unwraps @p expr or returns its Error from the enclosing function.
 *
 * @code
 *   const TimeBase tb = BIO_TRY(TimeBase::make(fs, duration));
 * @endcode
 */
#define BIO_TRY(expr)                                                     \
    ({                                                                     \
        auto &&_bio_result = (expr);                                       \
        if (!_bio_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_bio_result.error()));         \
        std::move(_bio_result.value());                                    \
    })

/** @brief Statement form of BIO_TRY for ExpectedVoid checks. */
#define BIO_TRY_VOID(expr)                                                \
    do {                                                                    \
        auto &&_bio_result = (expr);                                       \
        if (!_bio_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_bio_result.error()));         \
    } while (false)

#endif // BIO_CORE_EXPECTED_HPP
