/**
 * @file Platform.hpp
 * @brief Compiler detection and branch-hint macros.
 *
 * @version 0.1.0
 */
#pragma once

#ifndef BIO_CORE_PLATFORM_HPP
    #define BIO_CORE_PLATFORM_HPP

// ─── Compiler ────────────────────────────────────────────────────────────────

    #if defined(__clang__)
        #define BIO_COMPILER_CLANG 1
    #elif defined(__GNUC__)
        #define BIO_COMPILER_GCC   1
    #elif defined(_MSC_VER)
        #define BIO_COMPILER_MSVC  1
    #else
        #define BIO_COMPILER_UNKNOWN 1
    #endif

// ─── Hints ───────────────────────────────────────────────────────────────────

    #if defined(BIO_COMPILER_GCC) || defined(BIO_COMPILER_CLANG)
        #define BIO_LIKELY(x)       __builtin_expect(!!(x), 1)
        #define BIO_UNLIKELY(x)     __builtin_expect(!!(x), 0)
        #define BIO_UNREACHABLE_HINT() __builtin_unreachable()
    #else
        #define BIO_LIKELY(x)       (x)
        #define BIO_UNLIKELY(x)     (x)
        #define BIO_UNREACHABLE_HINT() __assume(0)
    #endif

// ─── Build ───────────────────────────────────────────────────────────────────

    #if !defined(NDEBUG) && !defined(BIO_DEBUG)
        #define BIO_DEBUG 1
    #endif

#endif // BIO_CORE_PLATFORM_HPP
