/**
 * @file Assert.hpp
 * @brief Contract-checking macros with source location.
 *
 * FDP_ASSERT is debug-only, FDP_VERIFY is always evaluated.  Both report
 * the failing expression with file, line and function before aborting.
 * They guard invariants that no caller input can break; anything a peer
 * can send is reported through Expected instead.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef FDP_CORE_ASSERT_HPP
    #define FDP_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace fdp::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[FDP ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), loc.line(), loc.function_name(), expr
    );
    std::abort();
}

} // namespace fdp::core::detail

    #ifdef FDP_DEBUG
        #define FDP_ASSERT(cond)                                          \
            do {                                                           \
                if (FDP_UNLIKELY(!(cond)))                                 \
                    ::fdp::core::detail::assertFail(#cond);                \
            } while (false)
    #else
        #define FDP_ASSERT(cond) ((void)0)
    #endif

    #define FDP_VERIFY(cond)                                              \
        do {                                                               \
            if (FDP_UNLIKELY(!(cond)))                                     \
                ::fdp::core::detail::assertFail(#cond);                    \
        } while (false)

#endif // FDP_CORE_ASSERT_HPP
