/**
 * @file ValidModuleA.cpp
 * @brief Test game module tagging its updates with kModuleATag.
 */

#include "TestGameState.hpp"

#include "ember/core/Platform.hpp"

#include <cstddef>

namespace ember::engine { class Engine; }

namespace {

ember::testing::TestGameState* asState(void* state)
{
    return static_cast<ember::testing::TestGameState*>(state);
}

} // namespace

EMBER_MODULE_EXPORT std::size_t game_state_size()
{
    return sizeof(ember::testing::TestGameState);
}

EMBER_MODULE_EXPORT void game_init(void* state, ember::engine::Engine*)
{
    ++asState(state)->initCalls;
    asState(state)->moduleTag = ember::testing::kModuleATag;
}

EMBER_MODULE_EXPORT void game_update(void* state, ember::engine::Engine*, float dt)
{
    auto* s = asState(state);
    ++s->updateCalls;
    s->moduleTag = ember::testing::kModuleATag;
    s->elapsed += dt;
}

EMBER_MODULE_EXPORT void game_render(void* state, ember::engine::Engine*)
{
    ++asState(state)->renderCalls;
}

EMBER_MODULE_EXPORT void game_shutdown(void* state, ember::engine::Engine*)
{
    ++asState(state)->shutdownCalls;
}
