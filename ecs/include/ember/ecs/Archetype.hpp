/**
 * @file Archetype.hpp
 * @brief Archetype: the set of component types attached to an entity.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef EMBER_ECS_ARCHETYPE_HPP
    #define EMBER_ECS_ARCHETYPE_HPP

#include "ember/core/Constants.hpp"
#include "ember/core/Types.hpp"

#include <bitset>

namespace ember::ecs {

/**
 * @class Archetype
 * @brief Fixed-size bitset where bit N is the component pool registered
 *        N-th in the owning Registry.
 */
class Archetype final
{
public:
    static constexpr core::usize kMaxComponents = core::kMaxComponentTypes;

    using Mask = std::bitset<kMaxComponents>;

    Archetype() noexcept = default;

    void add(core::u32 poolIndex) noexcept;
    void remove(core::u32 poolIndex) noexcept;

    [[nodiscard]] bool has(core::u32 poolIndex) const noexcept;

    /** @brief Tests whether this archetype is a superset of @p other. */
    [[nodiscard]] bool contains(const Archetype& other) const noexcept;

    [[nodiscard]] const Mask& mask() const noexcept { return _mask; }
    [[nodiscard]] core::usize count() const noexcept { return _mask.count(); }
    [[nodiscard]] bool empty() const noexcept { return _mask.none(); }

    void clear() noexcept { _mask.reset(); }

    [[nodiscard]] bool operator==(const Archetype& other) const noexcept = default;

private:
    Mask _mask{};
};

} // namespace ember::ecs

#include "Archetype.inl"

#endif // EMBER_ECS_ARCHETYPE_HPP
