/**
 * @file TestGameState.hpp
 * @brief State layout shared by the hot-reload test modules.
 */
#pragma once

#include <cstdint>

namespace ember::testing {

struct TestGameState
{
    std::uint32_t sentinel;
    std::uint32_t moduleTag;
    std::uint32_t initCalls;
    std::uint32_t updateCalls;
    std::uint32_t renderCalls;
    std::uint32_t shutdownCalls;
    std::uint32_t reloadCalls;
    float         elapsed;
};

inline constexpr std::uint32_t kModuleATag = 0xA;
inline constexpr std::uint32_t kModuleBTag = 0xB;

} // namespace ember::testing
