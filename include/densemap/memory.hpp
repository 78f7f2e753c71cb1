/*
 * Copyright 2021-2022 Brennan Shacklett and contributors
 *
 * Use of this source code is governed by an MIT-style
 * license that can be found in the LICENSE file or at
 * https://opensource.org/licenses/MIT.
 */
#pragma once

#include <cstddef>
#include <cstdlib>
#include <cstdint>

namespace densemap {

inline void * rawAllocAligned(size_t num_bytes, size_t alignment);
inline void rawDeallocAligned(void *ptr);

// Allocator base class, CRTP. Allocators are stateless unless a derived
// class adds state; containers store them with [[no_unique_address]].
template <typename A>
class Allocator {
public:
    template <typename T>
    inline T * allocN(size_t num_elems);
};

// Cache line aligned heap allocations. Allocation failure is fatal.
class DefaultAlloc : public Allocator<DefaultAlloc> {
public:
    inline void * alloc(size_t num_bytes);
    inline void dealloc(void *ptr);
};

}

#include "memory.inl"
