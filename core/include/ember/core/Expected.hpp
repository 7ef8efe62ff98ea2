/**
 * @file Expected.hpp
 * @brief Error-handling alias built on std::expected.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef EMBER_CORE_EXPECTED_HPP
    #define EMBER_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace ember::core {

/**
 * @brief Alias for an expected value or a structured Error.
 * @tparam T The success-path value type.
 */
template <typename T>
using Expected = std::expected<T, Error>;

using ExpectedVoid = Expected<void>;

} // namespace ember::core

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type ember::core::Expected<void>.
 */
#define EMBER_TRY_VOID(expr)                                              \
    do {                                                                    \
        auto &&_ember_result = (expr);                                     \
        if (!_ember_result.has_value()) [[unlikely]]                       \
            return std::unexpected(std::move(_ember_result.error()));       \
    } while (false)

#endif // EMBER_CORE_EXPECTED_HPP
