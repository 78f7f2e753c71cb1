/*
 * Copyright 2021-2022 Brennan Shacklett and contributors
 *
 * Use of this source code is governed by an MIT-style
 * license that can be found in the LICENSE file or at
 * https://opensource.org/licenses/MIT.
 */
#pragma once

#include <memory>
#include <type_traits>
#include <utility>

namespace densemap {

// Owning optional value. Trivially copyable / movable / destructible
// exactly when T is, so Optional<uint64_t> etc. stay POD-like.
template <typename T>
class Optional {
public:
    static constexpr Optional<T> none()
    {
        return Optional<T>();
    }

    template <typename... Args>
    static constexpr Optional<T> make(Args && ...args)
    {
        return Optional<T>(std::in_place, std::forward<Args>(args)...);
    }

    template <typename U = T>
    constexpr explicit(!std::is_convertible_v<U&&, T>) Optional(U &&v)
        requires(std::is_constructible_v<T, U&&> &&
                 !std::is_same_v<std::remove_cvref_t<U>, Optional<T>>)
        : value_(std::forward<U>(v)),
          initialized_(true)
    {}

    constexpr Optional(const Optional<T> &o)
        requires (std::is_trivially_copy_constructible_v<T>) = default;

    constexpr Optional(const Optional<T> &o)
        requires (std::is_copy_constructible_v<T> &&
                  !std::is_trivially_copy_constructible_v<T>)
        : initialized_(o.initialized_)
    {
        if (initialized_) {
            construct(o.value_);
        }
    }

    constexpr Optional(Optional<T> &&o)
        requires (std::is_trivially_move_constructible_v<T>) = default;

    constexpr Optional(Optional<T> &&o)
        requires (std::is_move_constructible_v<T> &&
                  !std::is_trivially_move_constructible_v<T>)
        : initialized_(o.initialized_)
    {
        if (initialized_) {
            construct(std::move(o.value_));
        }
    }

    constexpr ~Optional()
        requires (std::is_trivially_destructible_v<T>) = default;

    constexpr ~Optional()
        requires (!std::is_trivially_destructible_v<T>)
    {
        destruct();
    }

    constexpr Optional<T> & operator=(const Optional<T> &o)
        requires (std::is_trivially_copy_assignable_v<T> &&
                  std::is_trivially_copy_constructible_v<T> &&
                  std::is_trivially_destructible_v<T>) = default;

    constexpr Optional<T> & operator=(const Optional<T> &o)
        requires (std::is_copy_assignable_v<T> &&
                  std::is_copy_constructible_v<T> && !(
                      std::is_trivially_copy_assignable_v<T> &&
                      std::is_trivially_copy_constructible_v<T> &&
                      std::is_trivially_destructible_v<T>))
    {
        assign(o.initialized_, o.value_);
        return *this;
    }

    constexpr Optional<T> & operator=(Optional<T> &&o)
        requires (std::is_trivially_move_assignable_v<T> &&
                  std::is_trivially_move_constructible_v<T> &&
                  std::is_trivially_destructible_v<T>) = default;

    constexpr Optional<T> & operator=(Optional<T> &&o)
        requires (std::is_move_assignable_v<T> &&
                  std::is_move_constructible_v<T> && !(
                      std::is_trivially_move_assignable_v<T> &&
                      std::is_trivially_move_constructible_v<T> &&
                      std::is_trivially_destructible_v<T>))
    {
        assign(o.initialized_, std::move(o.value_));
        return *this;
    }

    template <typename... Args>
    T & emplace(Args && ...args)
    {
        destruct();

        construct(std::forward<Args>(args)...);
        initialized_ = true;

        return value_;
    }

    void reset()
    {
        destruct();
        initialized_ = false;
    }

    constexpr bool has_value() const { return initialized_; }

    constexpr const T & operator*() const & { return value_; }
    constexpr T & operator*() & { return value_; }
    constexpr T && operator*() && { return std::move(value_); }

    constexpr const T * operator->() const { return &value_; }
    constexpr T * operator->() { return &value_; }

private:
    constexpr Optional()
        : empty_(),
          initialized_(false)
    {}

    template <typename... Args>
    constexpr Optional(std::in_place_t, Args && ...args)
        : value_(std::forward<Args>(args)...),
          initialized_(true)
    {}

    template <typename U>
    constexpr void assign(bool o_initialized, U &&o_value)
    {
        if (initialized_) {
            if (o_initialized) {
                value_ = std::forward<U>(o_value);
            } else {
                destruct();
                initialized_ = false;
            }
        } else if (o_initialized) {
            construct(std::forward<U>(o_value));
            initialized_ = true;
        }
    }

    constexpr void destruct()
    {
        if constexpr (!std::is_trivially_destructible_v<T>) {
            if (initialized_) {
                value_.~T();
            }
        }
    }

    template <typename... Args>
    constexpr void construct(Args && ...args)
    {
        std::construct_at(&value_, std::forward<Args>(args)...);
    }

    struct Empty {};
    union {
        Empty empty_;
        T value_;
    };
    bool initialized_;
};

}
