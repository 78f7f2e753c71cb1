/*
 * Copyright 2021-2022 Brennan Shacklett and contributors
 *
 * Use of this source code is governed by an MIT-style
 * license that can be found in the LICENSE file or at
 * https://opensource.org/licenses/MIT.
 */
#include <densemap/utils.hpp>

#include <utility>

namespace densemap {

size_t UUIDHash::operator()(UUID id) const
{
    return (size_t)utils::hashCombine(utils::int64Hash(id.lo), id.hi);
}

template <typename SourceT>
BasicUUIDGenerator<SourceT>::BasicUUIDGenerator(SourceT src)
    : src_(std::move(src))
{}

template <typename SourceT>
UUID BasicUUIDGenerator<SourceT>::sample()
{
    uint64_t lo = src_.sampleU64();
    uint64_t hi = src_.sampleU64();

    return UUID {
        lo,
        hi,
    };
}

template <typename SourceT>
template <typename Fn>
UUID BasicUUIDGenerator<SourceT>::generate(Fn &&is_live)
{
    UUID id = sample();
    while (is_live(id)) [[unlikely]] {
        id = sample();
    }

    return id;
}

}
