/*
 * Copyright 2021-2022 Brennan Shacklett and contributors
 *
 * Use of this source code is governed by an MIT-style
 * license that can be found in the LICENSE file or at
 * https://opensource.org/licenses/MIT.
 */
#include <densemap/crash.hpp>
#include <densemap/macros.hpp>
#include <densemap/utils.hpp>

#if defined(DENSEMAP_MSVC)
#include <malloc.h>
#endif

namespace densemap {

void * rawAllocAligned(size_t num_bytes, size_t alignment)
{
#if defined(DENSEMAP_MSVC)
    return _aligned_malloc(num_bytes, alignment);
#else
    return std::aligned_alloc(alignment, num_bytes);
#endif
}

void rawDeallocAligned(void *ptr)
{
#if defined(DENSEMAP_MSVC)
    _aligned_free(ptr);
#else
    std::free(ptr);
#endif
}

template <typename A>
template <typename T>
T * Allocator<A>::allocN(size_t num_elems)
{
    return (T *)static_cast<A *>(this)->alloc(num_elems * sizeof(T));
}

void * DefaultAlloc::alloc(size_t num_bytes)
{
    // aligned_alloc requires a non-zero size that is a multiple of the
    // alignment
    void *ptr = rawAllocAligned(
        utils::roundUpPow2(num_bytes == 0 ? 1 : num_bytes,
                           DENSEMAP_CACHE_LINE),
        DENSEMAP_CACHE_LINE);

    if (ptr == nullptr) [[unlikely]] {
        FATAL("Failed to allocate %zu bytes", num_bytes);
    }

    return ptr;
}

void DefaultAlloc::dealloc(void *ptr)
{
    rawDeallocAligned(ptr);
}

}
