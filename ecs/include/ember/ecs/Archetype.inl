/**
 * @file Archetype.inl
 * @brief Inline implementation of Archetype.
 * @see   Archetype.hpp
 */

#ifndef EMBER_ECS_ARCHETYPE_INL
    #define EMBER_ECS_ARCHETYPE_INL

namespace ember::ecs {

inline void Archetype::add(core::u32 poolIndex) noexcept
{
    if (poolIndex < kMaxComponents)
        _mask.set(poolIndex);
}

inline void Archetype::remove(core::u32 poolIndex) noexcept
{
    if (poolIndex < kMaxComponents)
        _mask.reset(poolIndex);
}

inline bool Archetype::has(core::u32 poolIndex) const noexcept
{
    return poolIndex < kMaxComponents && _mask.test(poolIndex);
}

inline bool Archetype::contains(const Archetype& other) const noexcept
{
    return (_mask & other._mask) == other._mask;
}

} // namespace ember::ecs

#endif // EMBER_ECS_ARCHETYPE_INL
