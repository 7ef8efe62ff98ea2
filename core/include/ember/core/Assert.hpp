/**
 * @file Assert.hpp
 * @brief Debug assertions for internal invariants.
 *
 * EMBER_ASSERT is compiled only when EMBER_DEBUG is defined; it never
 * guards user input, which is reported through Expected instead.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef EMBER_CORE_ASSERT_HPP
    #define EMBER_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace ember::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[EMBER ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), static_cast<unsigned>(loc.line()), loc.function_name(), expr
    );
    std::abort();
}

} // namespace ember::core::detail

    #ifdef EMBER_DEBUG
        #define EMBER_ASSERT(cond)                                        \
            do {                                                           \
                if (EMBER_UNLIKELY(!(cond)))                               \
                    ::ember::core::detail::assertFail(#cond);              \
            } while (false)
    #else
        #define EMBER_ASSERT(cond) ((void)0)
    #endif

#endif // EMBER_CORE_ASSERT_HPP
