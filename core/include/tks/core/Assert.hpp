/**
 * @file Assert.hpp
 * @brief Contract checks: TKS_VERIFY (always on), TKS_ASSERT (TKS_DEBUG only).
 *
 * A failed check is logged at fatal level under the "ASSERT" tag, with
 * the current log context, then aborts. Malformed network input never
 * reaches these macros; it is reported through Expected.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TKS_CORE_ASSERT_HPP
    #define TKS_CORE_ASSERT_HPP

    #include "Log.hpp"

    #include <cstdlib>
    #include <format>
    #include <source_location>

    #if defined(__GNUC__) || defined(__clang__)
        #define TKS_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #else
        #define TKS_UNLIKELY(x) (x)
    #endif

namespace tks::core::detail {

[[noreturn]] inline void contractFailed(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    Log::fatal("ASSERT", std::format("{}:{} in {}: \"{}\" failed",
                                     loc.file_name(), loc.line(), loc.function_name(), expr));
    std::abort();
}

} // namespace tks::core::detail

    #ifdef TKS_DEBUG
        #define TKS_ASSERT(cond)                                          \
            do {                                                           \
                if (TKS_UNLIKELY(!(cond)))                                 \
                    ::tks::core::detail::contractFailed(#cond);            \
            } while (false)
    #else
        #define TKS_ASSERT(cond) ((void)0)
    #endif

    #define TKS_VERIFY(cond)                                              \
        do {                                                               \
            if (TKS_UNLIKELY(!(cond)))                                     \
                ::tks::core::detail::contractFailed(#cond);                \
        } while (false)

#endif // TKS_CORE_ASSERT_HPP
