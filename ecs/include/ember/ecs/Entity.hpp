/**
 * @file Entity.hpp
 * @brief Entity identifier: packed generation + slot index.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef EMBER_ECS_ENTITY_HPP
    #define EMBER_ECS_ENTITY_HPP

#include "ember/core/Constants.hpp"
#include "ember/core/Types.hpp"

#include <compare>
#include <cstddef>
#include <functional>
#include <limits>

namespace ember::ecs {

/**
 * @class EntityId
 * @brief 32-bit handle: generation in the high bits, slot in the low bits.
 *
 * Destroying an entity bumps its slot's generation, so an id kept past
 * the destruction no longer matches and Registry::isAlive() rejects it.
 */
class EntityId final
{
public:
    static constexpr core::u32 kSlotMask       = (1u << core::kSlotBits) - 1u;
    static constexpr core::u32 kGenerationMask = (1u << core::kGenerationBits) - 1u;
    static constexpr core::u32 kMaxSlots       = kSlotMask;
    static constexpr core::u32 kNull           = std::numeric_limits<core::u32>::max();

    constexpr EntityId() noexcept = default;
    constexpr explicit EntityId(core::u32 raw) noexcept : _raw{raw} {}
    constexpr EntityId(core::u32 generation, core::u32 slot) noexcept : _raw{pack(generation, slot)} {}

    [[nodiscard]] constexpr core::u32 slot() const noexcept { return _raw & kSlotMask; }
    [[nodiscard]] constexpr core::u32 generation() const noexcept { return (_raw >> core::kSlotBits) & kGenerationMask; }
    [[nodiscard]] constexpr core::u32 raw() const noexcept { return _raw; }

    /** @brief False for the null id only; a non-null id may still be stale. */
    [[nodiscard]] constexpr bool isValid() const noexcept { return _raw != kNull; }

    constexpr auto operator<=>(const EntityId&) const noexcept = default;

private:
    [[nodiscard]] static constexpr core::u32 pack(core::u32 generation, core::u32 slot) noexcept
    {
        return ((generation & kGenerationMask) << core::kSlotBits) | (slot & kSlotMask);
    }

    core::u32 _raw{kNull};
};

inline constexpr EntityId kNullEntity{};

} // namespace ember::ecs

template <>
struct std::hash<ember::ecs::EntityId>
{
    [[nodiscard]] std::size_t operator()(ember::ecs::EntityId id) const noexcept
    {
        return std::hash<ember::core::u32>{}(id.raw());
    }
};

#endif // EMBER_ECS_ENTITY_HPP
