/**
 * @file System.hpp
 * @brief System entry and scheduling phase definitions.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef EMBER_ECS_SYSTEM_HPP
    #define EMBER_ECS_SYSTEM_HPP

#include "ember/core/Types.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <variant>

namespace ember::world { class World; }

namespace ember::ecs {

/**
 * @enum SchedulePhase
 * @brief The five phases of a frame, in execution order.
 *
 * FixedUpdate may run zero, one or several times per frame; the other
 * phases run exactly once.
 */
enum class SchedulePhase : core::u8
{
    PreUpdate   = 0,
    Update      = 1,
    FixedUpdate = 2,
    PostUpdate  = 3,
    Render      = 4,

    Count
};

inline constexpr core::usize kSchedulePhaseCount = static_cast<core::usize>(SchedulePhase::Count);

[[nodiscard]] constexpr std::string_view toString(SchedulePhase phase) noexcept
{
    switch (phase)
    {
        case SchedulePhase::PreUpdate:   return "PreUpdate";
        case SchedulePhase::Update:      return "Update";
        case SchedulePhase::FixedUpdate: return "FixedUpdate";
        case SchedulePhase::PostUpdate:  return "PostUpdate";
        case SchedulePhase::Render:      return "Render";
        case SchedulePhase::Count:       break;
    }
    return "Unknown";
}

/** @brief Update-style callback: runs with the phase delta-time. */
using UpdateCallback = std::function<void(world::World&, core::f32 dt)>;

/** @brief Render-style callback: runs once per frame in the Render phase. */
using RenderCallback = std::function<void(world::World&)>;

/**
 * @struct SystemStats
 * @brief Rolling timings of one system, in milliseconds.
 *
 * avgMs is an exponential moving average so a single spike does not
 * dominate the reported figure.
 */
struct SystemStats
{
    core::f64 lastMs{0.0};
    core::f64 avgMs{0.0};
    core::f64 maxMs{0.0};
    core::u64 callCount{0};
};

/**
 * @struct SystemEntry
 * @brief One registered system.  Entries are never removed, only disabled.
 */
struct SystemEntry
{
    std::string                                 name;
    SchedulePhase                               phase{SchedulePhase::Update};
    std::variant<UpdateCallback, RenderCallback> callback;
    bool                                        enabled{true};
    core::i32                                   priority{0};
    SystemStats                                 stats{};

    [[nodiscard]] bool isRender() const noexcept
    {
        return std::holds_alternative<RenderCallback>(callback);
    }
};

} // namespace ember::ecs

#endif // EMBER_ECS_SYSTEM_HPP
