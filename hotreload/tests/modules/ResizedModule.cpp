/**
 * @file ResizedModule.cpp
 * @brief Test game module reporting a larger state than TestGameState.
 */

#include "TestGameState.hpp"

#include "ember/core/Platform.hpp"

#include <cstddef>

namespace ember::engine { class Engine; }

EMBER_MODULE_EXPORT std::size_t game_state_size()
{
    return sizeof(ember::testing::TestGameState) + 64;
}

EMBER_MODULE_EXPORT void game_init(void*, ember::engine::Engine*) {}

EMBER_MODULE_EXPORT void game_update(void*, ember::engine::Engine*, float) {}
