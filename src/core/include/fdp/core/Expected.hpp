/**
 * @file Expected.hpp
 * @brief Monadic error-handling type built on std::expected.
 *
 * Provides Expected<T> as an alias for std::expected<T, Error> and the
 * FDP_TRY / FDP_TRY_VOID macros for early-return propagation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef FDP_CORE_EXPECTED_HPP
    #define FDP_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace fdp::core {

/**
 * @brief Alias for an expected value or a structured Error.
 * @tparam T The success-path value type.
 */
template <typename T>
using Expected = std::expected<T, Error>;

/**
 * @brief Alias for operations that succeed with no value.
 */
using ExpectedVoid = Expected<void>;

} // namespace fdp::core

/**
 * @brief Propagate an error from an Expected expression.
 *
 * Evaluates @p expr once.  If the result holds an error, the enclosing
 * function immediately returns that error wrapped in an unexpected.
 * Otherwise the macro yields the contained value.
 *
 * Works with any std::expected whose error type matches the enclosing
 * function's, so it also serves PacketResult<T>.
 *
 * @param expr An expression of type std::expected<U, E>.
 */
#define FDP_TRY(expr)                                                     \
    ({                                                                     \
        auto &&_fdp_result = (expr);                                       \
        if (!_fdp_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_fdp_result.error()));         \
        std::move(_fdp_result.value());                                    \
    })

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type std::expected<void, E>.
 */
#define FDP_TRY_VOID(expr)                                                \
    do {                                                                    \
        auto &&_fdp_result = (expr);                                       \
        if (!_fdp_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_fdp_result.error()));         \
    } while (false)

#endif // FDP_CORE_EXPECTED_HPP
