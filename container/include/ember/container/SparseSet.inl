/**
 * @file SparseSet.inl
 * @brief Template implementation of the growable sparse set.
 * @see   SparseSet.hpp
 */

#ifndef EMBER_CONTAINER_SPARSE_SET_INL
    #define EMBER_CONTAINER_SPARSE_SET_INL

    #include <utility>

namespace ember::container {

template <typename T>
T *SparseSet<T>::insert(core::u32 slot, T val)
{
    if (slot >= _sparse.size())
        _sparse.resize(static_cast<core::usize>(slot) + 1, kInvalid);
    if (_sparse[slot] != kInvalid)
        return nullptr;

    _sparse[slot] = static_cast<core::u32>(_dense.size());
    _dense.push_back(std::move(val));
    _denseToSparse.push_back(slot);
    return &_dense.back();
}

template <typename T>
bool SparseSet<T>::remove(core::u32 slot)
{
    if (slot >= _sparse.size())
        return false;

    const core::u32 denseIdx = _sparse[slot];
    if (denseIdx == kInvalid)
        return false;

    const core::u32 lastDenseIdx = static_cast<core::u32>(_dense.size()) - 1;
    if (denseIdx != lastDenseIdx) {
        const core::u32 lastSlot   = _denseToSparse[lastDenseIdx];
        _dense[denseIdx]         = std::move(_dense[lastDenseIdx]);
        _denseToSparse[denseIdx] = lastSlot;
        _sparse[lastSlot]        = denseIdx;
    }

    _dense.pop_back();
    _denseToSparse.pop_back();
    _sparse[slot] = kInvalid;
    return true;
}

template <typename T>
T *SparseSet<T>::find(core::u32 slot)
{
    if (slot >= _sparse.size())
        return nullptr;

    const core::u32 denseIdx = _sparse[slot];
    if (denseIdx == kInvalid)
        return nullptr;

    return &_dense[denseIdx];
}

template <typename T>
const T *SparseSet<T>::find(core::u32 slot) const
{
    return const_cast<SparseSet *>(this)->find(slot);
}

template <typename T>
bool SparseSet<T>::contains(core::u32 slot) const noexcept
{
    return slot < _sparse.size() && _sparse[slot] != kInvalid;
}

template <typename T>
void SparseSet<T>::clear() noexcept
{
    _sparse.clear();
    _dense.clear();
    _denseToSparse.clear();
}

} // namespace ember::container

#endif // EMBER_CONTAINER_SPARSE_SET_INL
