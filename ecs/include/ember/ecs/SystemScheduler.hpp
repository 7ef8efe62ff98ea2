/**
 * @file SystemScheduler.hpp
 * @brief Phase-bucketed, priority-ordered system scheduler.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef EMBER_ECS_SYSTEMSCHEDULER_HPP
    #define EMBER_ECS_SYSTEMSCHEDULER_HPP

#include "ember/ecs/System.hpp"
#include "ember/core/NonCopyable.hpp"
#include "ember/core/Types.hpp"

#include <array>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ember::ecs {

/**
 * @class SystemScheduler
 * @brief Keeps systems grouped by phase and runs each phase in ascending
 *        priority order, ties broken by registration order.
 *
 * Usage:
 * @code
 *   SystemScheduler scheduler;
 *   scheduler.addSystem("player.move", SchedulePhase::Update, moveFn);
 *   scheduler.addSystem("physics.step", SchedulePhase::FixedUpdate, stepFn, 100);
 *   scheduler.addRenderSystem("sprites", drawFn);
 *
 *   scheduler.runPhase(world, dt, SchedulePhase::Update);
 *   scheduler.runRender(world);
 * @endcode
 *
 * Registration only appends and marks the order dirty; the per-phase order
 * is rebuilt lazily on the next run with a stable insertion sort.
 */
class SystemScheduler final : public core::NonCopyable<SystemScheduler>
{
public:
    SystemScheduler() = default;

    // --------------------------------------------------------------------- //
    //  Registration                                                          //
    // --------------------------------------------------------------------- //

    /**
     * @brief Registers an update-style system in @p phase.
     *
     * In the Render phase it only runs through runPhase(); the Engine does
     * that once per frame, before runRender().
     */
    void addSystem(std::string name, SchedulePhase phase, UpdateCallback callback, core::i32 priority = 0);

    /** @brief Registers a render-style system (always in the Render phase). */
    void addRenderSystem(std::string name, RenderCallback callback, core::i32 priority = 0);

    // --------------------------------------------------------------------- //
    //  Execution                                                             //
    // --------------------------------------------------------------------- //

    /**
     * @brief Runs every enabled update-style system of @p phase.
     *
     * Render-style entries are skipped.  The caller decides how many times
     * a phase runs per frame.
     */
    void runPhase(world::World& world, core::f32 dt, SchedulePhase phase);

    /** @brief Runs every enabled render-style system of the Render phase. */
    void runRender(world::World& world);

    // --------------------------------------------------------------------- //
    //  Toggles & profiling                                                   //
    // --------------------------------------------------------------------- //

    /** @return False (and no-op) when no system has that name. */
    bool setSystemEnabled(std::string_view name, bool enabled) noexcept;
    bool enableSystem(std::string_view name) noexcept  { return setSystemEnabled(name, true); }
    bool disableSystem(std::string_view name) noexcept { return setSystemEnabled(name, false); }

    [[nodiscard]] bool isSystemEnabled(std::string_view name) const noexcept;

    void setProfilingEnabled(bool enabled) noexcept { _profiling = enabled; }
    [[nodiscard]] bool profilingEnabled() const noexcept { return _profiling; }

    /** @return The stats of @p name, or nullptr for an unknown name. */
    [[nodiscard]] const SystemStats* stats(std::string_view name) const noexcept;

    void resetStats() noexcept;

    [[nodiscard]] std::span<const SystemEntry> systems() const noexcept { return _entries; }
    [[nodiscard]] core::usize systemCount() const noexcept { return _entries.size(); }

    /** @brief Names of @p phase's systems in execution order. */
    [[nodiscard]] std::vector<std::string_view> executionOrder(SchedulePhase phase);

private:
    template <typename Invoke>
    void runEntry(core::u32 index, Invoke&& invoke);

    void rebuildOrder();
    [[nodiscard]] const SystemEntry* find(std::string_view name) const noexcept;

    std::vector<SystemEntry>                                   _entries;
    std::array<std::vector<core::u32>, kSchedulePhaseCount>    _order{};
    bool                                                       _dirty{false};
    bool                                                       _profiling{false};
};

} // namespace ember::ecs

#endif // EMBER_ECS_SYSTEMSCHEDULER_HPP
