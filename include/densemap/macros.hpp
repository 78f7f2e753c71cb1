/*
 * Copyright 2021-2022 Brennan Shacklett and contributors
 *
 * Use of this source code is governed by an MIT-style
 * license that can be found in the LICENSE file or at
 * https://opensource.org/licenses/MIT.
 */
#pragma once

#if defined(_MSC_VER)
#define DENSEMAP_MSVC (1)
#elif defined(__clang__)
#define DENSEMAP_CLANG (1)
#elif !defined(__GNUC__)
#error "Unsupported compiler"
#endif

#if defined(__APPLE__)
#define DENSEMAP_MACOS (1)
#endif

#if defined(__clang__) or defined(__GNUC__)
#define DENSEMAP_COMPILER_FUNCTION_NAME __PRETTY_FUNCTION__
#elif defined(_MSC_VER)
#define DENSEMAP_COMPILER_FUNCTION_NAME __FUNCSIG__
#endif

#if (defined(__arm64__) || defined(_M_ARM64)) && defined(DENSEMAP_MACOS)
#define DENSEMAP_CACHE_LINE (128)
#else
#define DENSEMAP_CACHE_LINE (64)
#endif

#if defined(DENSEMAP_CLANG)
#define DENSEMAP_UNROLL _Pragma("unroll")
#else
#define DENSEMAP_UNROLL
#endif
