/*
 * Copyright 2021-2022 Brennan Shacklett and contributors
 *
 * Use of this source code is governed by an MIT-style
 * license that can be found in the LICENSE file or at
 * https://opensource.org/licenses/MIT.
 */
#pragma once

#include <algorithm>
#include <cstring>
#include <memory>
#include <type_traits>
#include <utility>

#include <densemap/memory.hpp>
#include <densemap/types.hpp>

namespace densemap {

// Growable contiguous array. Capacity doubles on expansion. Trivially
// copyable items are relocated with memcpy. Everything else is moved into
// the new allocation, or copied if T's move constructor can throw, so a
// failed expansion leaves the array as it was.
template <typename T, typename A = DefaultAlloc>
class DynArray {
public:
    using RefT = std::add_lvalue_reference_t<T>;
    using ConstRefT = std::add_lvalue_reference_t<const T>;

    explicit DynArray(CountT init_capacity, A alloc = DefaultAlloc())
        : alloc_(std::move(alloc)),
          ptr_(init_capacity > 0 ?
                   alloc_.template allocN<T>(init_capacity) : nullptr),
          n_(0),
          capacity_(init_capacity)
    {}

    DynArray(const DynArray &) = delete;
    DynArray(DynArray &&o)
        : alloc_(std::move(o.alloc_)),
          ptr_(o.ptr_),
          n_(o.n_),
          capacity_(o.capacity_)
    {
        o.ptr_ = nullptr;
        o.n_ = 0;
        o.capacity_ = 0;
    }

    ~DynArray()
    {
        if (ptr_ == nullptr) return;

        release();
    }

    DynArray & operator=(const DynArray &) = delete;
    DynArray & operator=(DynArray &&o)
    {
        if (this == &o) {
            return *this;
        }

        if (ptr_ != nullptr) {
            release();
        }

        alloc_ = std::move(o.alloc_);
        ptr_ = o.ptr_;
        n_ = o.n_;
        capacity_ = o.capacity_;

        o.ptr_ = nullptr;
        o.n_ = 0;
        o.capacity_ = 0;

        return *this;
    }

    // Destroys all items, keeps the allocation.
    void clear()
    {
        if constexpr (!std::is_trivially_destructible_v<T>) {
            for (CountT i = 0; i < n_; i++) {
                ptr_[i].~T();
            }
        }
        n_ = 0;
    }

    // Destroys all items and frees the allocation.
    void release()
    {
        clear();
        alloc_.dealloc(ptr_);

        ptr_ = nullptr;
        capacity_ = 0;
    }

    void reserve(CountT new_capacity)
    {
        if (new_capacity > capacity_) {
            T *new_ptr = alloc_.template allocN<T>(new_capacity);
            try {
                relocate(new_ptr, new_capacity);
            } catch (...) {
                alloc_.dealloc(new_ptr);
                throw;
            }
        }
    }

    template <typename... Args>
    RefT emplace_back(Args &&...args)
    {
        if (n_ == capacity_) [[unlikely]] {
            // args may reference an item in the old allocation, construct
            // the new item before relocating the old ones
            CountT new_capacity =
                std::max(capacity_ * expansion_factor_, n_ + 1);
            T *new_ptr = alloc_.template allocN<T>(new_capacity);
            try {
                std::construct_at(&new_ptr[n_], std::forward<Args>(args)...);
            } catch (...) {
                alloc_.dealloc(new_ptr);
                throw;
            }

            try {
                relocate(new_ptr, new_capacity);
            } catch (...) {
                new_ptr[n_].~T();
                alloc_.dealloc(new_ptr);
                throw;
            }
        } else {
            std::construct_at(&ptr_[n_], std::forward<Args>(args)...);
        }

        return ptr_[n_++];
    }

    RefT push_back(const T &v)
    {
        return emplace_back(v);
    }

    RefT push_back(T &&v)
    {
        return emplace_back(std::move(v));
    }

    void pop_back()
    {
        ptr_[--n_].~T();
    }

    // Removes item idx in O(1) by relocating the last item into its slot.
    // Returns the removed item. If moving an item throws, the array keeps
    // all n items.
    T swap_remove(CountT idx)
    {
        CountT last = n_ - 1;

        T removed(std::move(ptr_[idx]));

        if (idx != last) {
            if constexpr (std::is_nothrow_move_constructible_v<T>) {
                ptr_[idx].~T();
                std::construct_at(&ptr_[idx], std::move(ptr_[last]));
            } else {
                ptr_[idx] = std::move(ptr_[last]);
            }
        }

        pop_back();

        return removed;
    }

    // Element-wise copy with the same capacity
    DynArray clone() const
    {
        DynArray copy(capacity_, alloc_);
        for (CountT i = 0; i < n_; i++) {
            copy.emplace_back(ptr_[i]);
        }

        return copy;
    }

    RefT operator[](CountT idx) { return ptr_[idx]; }
    ConstRefT operator[](CountT idx) const { return ptr_[idx]; }

    T *data() { return ptr_; }
    const T *data() const { return ptr_; }

    T *begin() { return ptr_; }
    T *end() { return ptr_ + n_; }
    const T *begin() const { return ptr_; }
    const T *end() const { return ptr_ + n_; }

    RefT back() { return ptr_[n_ - 1]; }
    ConstRefT back() const { return ptr_[n_ - 1]; }

    CountT size() const { return n_; }
    CountT capacity() const { return capacity_; }

private:
    // Transfers all items into new_ptr and frees the old allocation. If
    // constructing an item throws, the items already built in new_ptr are
    // destroyed and the array is unchanged. new_ptr stays owned by the
    // caller in that case.
    void relocate(T *new_ptr, CountT new_capacity)
    {
        if (ptr_) {
            if constexpr (std::is_trivially_copyable_v<T>) {
                memcpy((void *)new_ptr, (const void *)ptr_, sizeof(T) * n_);
            } else {
                CountT num_built = 0;
                try {
                    for (; num_built < n_; num_built++) {
                        std::construct_at(&new_ptr[num_built],
                            std::move_if_noexcept(ptr_[num_built]));
                    }
                } catch (...) {
                    for (CountT i = 0; i < num_built; i++) {
                        new_ptr[i].~T();
                    }
                    throw;
                }

                for (CountT i = 0; i < n_; i++) {
                    ptr_[i].~T();
                }
            }

            alloc_.dealloc(ptr_);
        }

        ptr_ = new_ptr;
        capacity_ = new_capacity;
    }

    [[no_unique_address]] A alloc_;
    T *ptr_;
    CountT n_;
    CountT capacity_;

    static constexpr CountT expansion_factor_ = 2;
};

}
