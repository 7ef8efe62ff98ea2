/**
 * @file WorldFixture.hpp
 * @brief World wired to a MockPhysicsBackend and a recording log sink.
 */
#pragma once

#include "MockPhysicsBackend.hpp"
#include "RecordingLogger.hpp"
#include "ember/world/World.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>

namespace ember::testing {

struct WorldFixture
{
    RecordingLogger     sink;
    core::Logger        logger{&sink, core::LogLevel::kDebug};
    MockPhysicsBackend *mock{nullptr};
    world::World        world{makeBackend(), logger};

    WorldFixture()
    {
        REQUIRE(world.init(math::Vec2{0.0f, 900.0f}, 40.0f).has_value());
    }

private:
    std::unique_ptr<physics::IPhysicsBackend> makeBackend()
    {
        auto backend = std::make_unique<MockPhysicsBackend>();
        mock = backend.get();
        return backend;
    }
};

} // namespace ember::testing
