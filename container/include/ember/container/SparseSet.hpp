/**
 * @file SparseSet.hpp
 * @brief Growable sparse set with O(1) lookup and swap-and-pop removal.
 *
 * Maps entity slot indices to dense storage indices.  The dense array is
 * always compact, enabling cache-friendly iteration; the sparse array
 * grows on demand to the highest slot ever inserted.
 *
 * @tparam T Payload type stored in the dense array.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef EMBER_CONTAINER_SPARSE_SET_HPP
    #define EMBER_CONTAINER_SPARSE_SET_HPP

    #include "ember/core/Types.hpp"

    #include <span>
    #include <vector>

namespace ember::container {

template <typename T>
class SparseSet final {
public:
    SparseSet() = default;

    /**
     * @brief Insert an element for a slot.
     * @return Pointer to the stored value, or nullptr if the slot is taken.
     */
    T *insert(core::u32 slot, T val);

    /**
     * @brief Remove the element of a slot (swap-and-pop).
     * @return True if found and removed.
     */
    bool remove(core::u32 slot);

    [[nodiscard]] T       *find(core::u32 slot);
    [[nodiscard]] const T *find(core::u32 slot) const;

    [[nodiscard]] bool contains(core::u32 slot) const noexcept;

    void clear() noexcept;

    [[nodiscard]] core::u32 size()  const noexcept { return static_cast<core::u32>(_dense.size()); }
    [[nodiscard]] bool      empty() const noexcept { return _dense.empty(); }

    /** @brief Dense payloads, in storage order. */
    [[nodiscard]] std::span<T>       values() noexcept { return _dense; }
    [[nodiscard]] std::span<const T> values() const noexcept { return _dense; }

    /** @brief Slot of each dense payload, parallel to values(). */
    [[nodiscard]] std::span<const core::u32> slots() const noexcept { return _denseToSparse; }

private:
    static constexpr core::u32 kInvalid = ~core::u32{0};

    std::vector<core::u32> _sparse;
    std::vector<T>         _dense;
    std::vector<core::u32> _denseToSparse;
};

} // namespace ember::container

    #include "SparseSet.inl"

#endif // EMBER_CONTAINER_SPARSE_SET_HPP
