/**
 * @file Expected.hpp
 * @brief Expected<T> result type and the early-return helpers built on it.
 *
 * Decoders, registries and transports return Expected so a malformed
 * payload from a peer costs one dropped packet, never the process.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TKS_CORE_EXPECTED_HPP
    #define TKS_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>
    #include <utility>

namespace tks::core {

template <typename T>
using Expected = std::expected<T, Error>;

using ExpectedVoid = Expected<void>;

} // namespace tks::core

/**
 * @brief Yield the value of @p expr or return its error from the caller.
 *
 * @p expr is evaluated once. Relies on GNU statement expressions.
 */
#define TKS_TRY(expr)                                                     \
    ({                                                                     \
        auto &&_tks_result = (expr);                                       \
        if (!_tks_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_tks_result.error()));        \
        std::move(_tks_result.value());                                    \
    })

/// TKS_TRY for expressions of type ExpectedVoid.
#define TKS_TRY_VOID(expr)                                                \
    do {                                                                    \
        auto &&_tks_result = (expr);                                       \
        if (!_tks_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_tks_result.error()));        \
    } while (false)

/**
 * @brief TKS_TRY_VOID that prefixes the propagated message with @p context.
 *
 * @p context is only evaluated on failure.
 */
#define TKS_TRY_WITHIN(expr, context)                                     \
    do {                                                                    \
        auto &&_tks_result = (expr);                                       \
        if (!_tks_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_tks_result.error()).within(context)); \
    } while (false)

#endif // TKS_CORE_EXPECTED_HPP
