/*
 * Copyright 2021-2022 Brennan Shacklett and contributors
 *
 * Use of this source code is governed by an MIT-style
 * license that can be found in the LICENSE file or at
 * https://opensource.org/licenses/MIT.
 */
#pragma once

#include <densemap/types.hpp>

#include <type_traits>

namespace densemap {

// Non-owning view of a contiguous range. Valid until the owning container
// is structurally modified.
template <typename T>
class Span {
public:
    Span() : ptr_(nullptr), n_(0) {}

    Span(T *ptr, CountT num_elems)
        : ptr_(ptr), n_(num_elems)
    {}

    // Span<T> -> Span<const T>
    template <typename U>
    Span(Span<U> o)
            requires(std::is_const_v<T> &&
                     std::is_same_v<std::remove_cv_t<T>, U>)
        : ptr_(o.data()),
          n_(o.size())
    {}

    constexpr T * data() const { return ptr_; }

    constexpr CountT size() const { return n_; }
    constexpr bool empty() const { return n_ == 0; }

    T & operator[](CountT idx) const { return ptr_[idx]; }

    T * begin() const { return ptr_; }
    T * end() const { return ptr_ + n_; }

private:
    T *ptr_;
    CountT n_;
};

}
