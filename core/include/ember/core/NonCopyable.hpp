/**
 * @file NonCopyable.hpp
 * @brief CRTP base class that deletes copy operations.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef EMBER_CORE_NON_COPYABLE_HPP
    #define EMBER_CORE_NON_COPYABLE_HPP

namespace ember::core {

/**
 * @brief Inherit to disable copy construction and assignment.
 *
 * Move operations stay defaulted; classes owning raw handles must still
 * provide their own move operations.
 *
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class NonCopyable {
protected:
    NonCopyable()  = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &)            = delete;
    NonCopyable &operator=(const NonCopyable &) = delete;

    NonCopyable(NonCopyable &&)                 = default;
    NonCopyable &operator=(NonCopyable &&)      = default;
};

} // namespace ember::core

#endif // EMBER_CORE_NON_COPYABLE_HPP
