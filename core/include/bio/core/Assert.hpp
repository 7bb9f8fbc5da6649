/**
 * @file Assert.hpp
 * @brief Internal invariant checks.
 *
 * Parameter errors are reported through Expected<T>; these macros only
 * guard conditions that validation has already established. BIO_ASSERT is
 * compiled out unless BIO_DEBUG is set.
 *
 * @version 0.1.0
 */
#pragma once

#ifndef BIO_CORE_ASSERT_HPP
    #define BIO_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace bio::core::detail {

/** @brief Reports a broken invariant and terminates. */
[[noreturn]] inline void assertFail(
    const char *what,
    const char *detail,
    std::source_location loc = std::source_location::current())
{
    std::fprintf(stderr, "[BIO ASSERT] %s (%s) at %s:%u, %s\n",
        what, detail, loc.file_name(), static_cast<unsigned>(loc.line()), loc.function_name());
    std::abort();
}

} // namespace bio::core::detail

    #ifdef BIO_DEBUG
        #define BIO_ASSERT(cond, msg)                                          \
            do {                                                                \
                if (BIO_UNLIKELY(!(cond)))                                      \
                    ::bio::core::detail::assertFail(#cond, (msg));              \
            } while (false)
    #else
        #define BIO_ASSERT(cond, msg) ((void)0)
    #endif

    /** Marks a branch that validated input can never reach. */
    #define BIO_UNREACHABLE(msg)                                               \
        do {                                                                    \
            ::bio::core::detail::assertFail("unreachable", (msg));              \
            BIO_UNREACHABLE_HINT();                                             \
        } while (false)

#endif // BIO_CORE_ASSERT_HPP
