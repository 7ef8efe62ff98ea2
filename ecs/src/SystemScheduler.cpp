/**
 * @file SystemScheduler.cpp
 * @brief Phase-bucketed scheduler with lazy stable ordering and profiling.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include "ember/ecs/SystemScheduler.hpp"
#include "ember/core/Constants.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

namespace ember::ecs {

// ========================================================================== //
//  Registration                                                              //
// ========================================================================== //

void SystemScheduler::addSystem(std::string name, SchedulePhase phase, UpdateCallback callback,
                                core::i32 priority)
{
    SystemEntry entry;
    entry.name     = std::move(name);
    entry.phase    = phase;
    entry.callback = std::move(callback);
    entry.priority = priority;
    _entries.push_back(std::move(entry));
    _dirty = true;
}

void SystemScheduler::addRenderSystem(std::string name, RenderCallback callback, core::i32 priority)
{
    SystemEntry entry;
    entry.name     = std::move(name);
    entry.phase    = SchedulePhase::Render;
    entry.callback = std::move(callback);
    entry.priority = priority;
    _entries.push_back(std::move(entry));
    _dirty = true;
}

// ========================================================================== //
//  Ordering                                                                  //
// ========================================================================== //

void SystemScheduler::rebuildOrder()
{
    for (auto& bucket : _order)
    {
        bucket.clear();
    }

    for (core::u32 i = 0; i < static_cast<core::u32>(_entries.size()); ++i)
    {
        _order[static_cast<core::usize>(_entries[i].phase)].push_back(i);
    }

    // Insertion sort: equal priorities keep their registration order.
    for (auto& bucket : _order)
    {
        for (core::usize i = 1; i < bucket.size(); ++i)
        {
            const core::u32 current = bucket[i];
            const core::i32 key     = _entries[current].priority;
            core::usize j = i;
            while (j > 0 && _entries[bucket[j - 1]].priority > key)
            {
                bucket[j] = bucket[j - 1];
                --j;
            }
            bucket[j] = current;
        }
    }

    _dirty = false;
}

std::vector<std::string_view> SystemScheduler::executionOrder(SchedulePhase phase)
{
    if (_dirty)
    {
        rebuildOrder();
    }

    std::vector<std::string_view> names;
    for (const core::u32 index : _order[static_cast<core::usize>(phase)])
    {
        names.emplace_back(_entries[index].name);
    }
    return names;
}

// ========================================================================== //
//  Execution                                                                 //
// ========================================================================== //

template <typename Invoke>
void SystemScheduler::runEntry(core::u32 index, Invoke&& invoke)
{
    if (!_profiling)
    {
        invoke();
        return;
    }

    using Clock = std::chrono::steady_clock;
    const auto start = Clock::now();
    invoke();
    const core::f64 sample = std::chrono::duration<core::f64, std::milli>(Clock::now() - start).count();

    // Re-indexed: the system may have grown _entries while it ran.
    auto& stats   = _entries[index].stats;
    stats.lastMs  = sample;
    stats.avgMs   = core::kProfileSmoothing * sample + (1.0 - core::kProfileSmoothing) * stats.avgMs;
    stats.maxMs   = std::max(stats.maxMs, sample);
    ++stats.callCount;
}

void SystemScheduler::runPhase(world::World& world, core::f32 dt, SchedulePhase phase)
{
    if (_dirty)
    {
        rebuildOrder();
    }

    // Index-based walk: a system may register another one mid-phase, which
    // only takes effect on the next run.
    const std::vector<core::u32> order = _order[static_cast<core::usize>(phase)];
    for (const core::u32 index : order)
    {
        if (!_entries[index].enabled)
        {
            continue;
        }
        auto* callback = std::get_if<UpdateCallback>(&_entries[index].callback);
        if (!callback || !*callback)
        {
            continue;
        }
        // Copy: the callback must outlive a reallocation of _entries.
        const UpdateCallback fn = *callback;
        runEntry(index, [&] { fn(world, dt); });
    }
}

void SystemScheduler::runRender(world::World& world)
{
    if (_dirty)
    {
        rebuildOrder();
    }

    const std::vector<core::u32> order = _order[static_cast<core::usize>(SchedulePhase::Render)];
    for (const core::u32 index : order)
    {
        if (!_entries[index].enabled)
        {
            continue;
        }
        auto* callback = std::get_if<RenderCallback>(&_entries[index].callback);
        if (!callback || !*callback)
        {
            continue;
        }
        const RenderCallback fn = *callback;
        runEntry(index, [&] { fn(world); });
    }
}

// ========================================================================== //
//  Toggles & profiling                                                       //
// ========================================================================== //

const SystemEntry* SystemScheduler::find(std::string_view name) const noexcept
{
    const auto it = std::find_if(_entries.begin(), _entries.end(),
                                 [name](const SystemEntry& e) { return e.name == name; });
    return it == _entries.end() ? nullptr : &*it;
}

bool SystemScheduler::setSystemEnabled(std::string_view name, bool enabled) noexcept
{
    bool found = false;
    for (auto& entry : _entries)
    {
        if (entry.name == name)
        {
            entry.enabled = enabled;
            found = true;
        }
    }
    return found;
}

bool SystemScheduler::isSystemEnabled(std::string_view name) const noexcept
{
    const SystemEntry* entry = find(name);
    return entry && entry->enabled;
}

const SystemStats* SystemScheduler::stats(std::string_view name) const noexcept
{
    const SystemEntry* entry = find(name);
    return entry ? &entry->stats : nullptr;
}

void SystemScheduler::resetStats() noexcept
{
    for (auto& entry : _entries)
    {
        entry.stats = SystemStats{};
    }
}

} // namespace ember::ecs
