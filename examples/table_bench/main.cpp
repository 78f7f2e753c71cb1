/*
 * Copyright 2021-2022 Brennan Shacklett and contributors
 *
 * Use of this source code is governed by an MIT-style
 * license that can be found in the LICENSE file or at
 * https://opensource.org/licenses/MIT.
 */
#include <densemap/table.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

using namespace densemap;

namespace TableBench {

// Keeps the optimizer from discarding benchmarked results
static volatile uint64_t sink;

template <typename Fn>
static void timeOp(const char *name, int64_t num_iters, Fn &&fn)
{
    auto start = std::chrono::steady_clock::now();
    for (int64_t i = 0; i < num_iters; i++) {
        fn(i);
    }
    auto end = std::chrono::steady_clock::now();

    double duration = std::chrono::duration<double>(end - start).count();

    printf("%-14s %10.2f ns/op, Elapsed: %f\n", name,
           duration * 1e9 / (double)num_iters, duration);
}

static void launch(int64_t num_iters, uint32_t seed)
{
    {
        Table<int32_t> tbl(ICfg::defaultTableCapacity, UUIDGenerator(seed));
        timeOp("add", num_iters, [&](int64_t i) {
            tbl.add((int32_t)i);
        });

        printf("  %lld rows, first key %s\n", (long long)tbl.size(),
               (*tbl.begin()).key.toString().c_str());
    }

    {
        Table<int32_t> tbl(ICfg::defaultTableCapacity, UUIDGenerator(seed));
        UUID fixed { 123, 0 };
        timeOp("insertOrAssign", num_iters, [&](int64_t i) {
            tbl.insertOrAssign(fixed, (int32_t)i);
        });
    }

    {
        Table<int32_t> tbl(ICfg::defaultTableCapacity, UUIDGenerator(seed));
        UUID key = tbl.add(42);
        timeOp("get", num_iters, [&](int64_t) {
            sink = sink + (uint64_t)*tbl.get(key);
        });

        timeOp("remove", num_iters, [&](int64_t) {
            Optional<int32_t> removed = tbl.remove(key);
            if (removed.has_value()) {
                sink = sink + (uint64_t)*removed;
            }
        });

        timeOp("size", num_iters, [&](int64_t) {
            sink = sink + (uint64_t)tbl.size();
        });
    }

    {
        Table<int32_t> tbl(num_iters, UUIDGenerator(seed));
        for (int64_t i = 0; i < num_iters; i++) {
            tbl.add((int32_t)i);
        }

        auto start = std::chrono::steady_clock::now();
        uint64_t total = 0;
        for (int32_t v : tbl.values()) {
            total += (uint64_t)v;
        }
        auto end = std::chrono::steady_clock::now();
        sink = total;

        double duration = std::chrono::duration<double>(end - start).count();
        printf("%-14s %10.2f ns/row, Elapsed: %f\n", "values",
               duration * 1e9 / (double)num_iters, duration);
    }
}

}

int main(int argc, char *argv[])
{
    int64_t num_iters = 1'000'000;
    uint32_t seed = 0;

    for (int i = 1; i < argc; i++) {
        if (!strcmp(argv[i], "--bench") && i + 1 < argc) {
            num_iters = std::stoll(argv[++i]);
        } else if (!strcmp(argv[i], "--seed") && i + 1 < argc) {
            seed = (uint32_t)std::stoul(argv[++i]);
        } else {
            fprintf(stderr, "Usage: %s [--bench NUM_ITERS] [--seed SEED]\n",
                    argv[0]);
            return EXIT_FAILURE;
        }
    }

    if (num_iters <= 0 || num_iters > ICfg::maxRowsPerTable) {
        fprintf(stderr, "%s: NUM_ITERS must be in [1, %lld]\n", argv[0],
                (long long)ICfg::maxRowsPerTable);
        return EXIT_FAILURE;
    }

    TableBench::launch(num_iters, seed);

    return EXIT_SUCCESS;
}
