/*
 * Copyright 2021-2022 Brennan Shacklett and contributors
 *
 * Use of this source code is governed by an MIT-style
 * license that can be found in the LICENSE file or at
 * https://opensource.org/licenses/MIT.
 */
#include <densemap/crash.hpp>

#include <array>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>

using namespace std;

namespace densemap {

void fatal(const char *file, int line, const char *funcname,
           const char *fmt, ...)
{
    // Fixed size so a crash caused by allocation failure can still be
    // reported.
    static array<char, 4096> buffer;

    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer.data(), buffer.size(), fmt, args);
    va_end(args);

    fatal(CrashInfo {
        file,
        line,
        funcname,
        buffer.data(),
    });
}

void fatal(const CrashInfo &crash)
{
    fprintf(stderr, "Error at %s:%d in %s\n", crash.file, crash.line,
            crash.funcname);
    if (crash.msg) {
        fprintf(stderr, "%s\n", crash.msg);
    }

    fflush(stderr);
    abort();
}

}
