/*
 * Copyright 2021-2022 Brennan Shacklett and contributors
 *
 * Use of this source code is governed by an MIT-style
 * license that can be found in the LICENSE file or at
 * https://opensource.org/licenses/MIT.
 */
#pragma once

#include <cstdint>

namespace densemap {

inline constexpr uint32_t operator "" _u32(unsigned long long v)
{
    return uint32_t(v);
}

inline constexpr uint64_t operator "" _u64(unsigned long long v)
{
    return uint64_t(v);
}

// Row counts and positions. Signed so reverse loops and "last - 1" math
// never wrap.
using CountT = int64_t;

}
