/**
 * @file Color.hpp
 * @brief 8-bit RGBA colour.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef EMBER_RENDER_COLOR_HPP
    #define EMBER_RENDER_COLOR_HPP

#include "ember/core/Types.hpp"

namespace ember::render {

struct Color
{
    core::u8 r{255};
    core::u8 g{255};
    core::u8 b{255};
    core::u8 a{255};

    constexpr bool operator==(const Color&) const noexcept = default;
};

namespace colors {

inline constexpr Color kWhite{255, 255, 255, 255};
inline constexpr Color kBlack{0, 0, 0, 255};
inline constexpr Color kRed{230, 41, 55, 255};
inline constexpr Color kGreen{0, 228, 48, 255};
inline constexpr Color kYellow{253, 249, 0, 255};
inline constexpr Color kDarkGrey{24, 24, 28, 255};

} // namespace colors

} // namespace ember::render

#endif // EMBER_RENDER_COLOR_HPP
