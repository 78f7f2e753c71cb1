/*
 * Copyright 2021-2022 Brennan Shacklett and contributors
 *
 * Use of this source code is governed by an MIT-style
 * license that can be found in the LICENSE file or at
 * https://opensource.org/licenses/MIT.
 */
#pragma once

#include <densemap/dyn_array.hpp>
#include <densemap/optional.hpp>
#include <densemap/span.hpp>
#include <densemap/types.hpp>
#include <densemap/uuid.hpp>

#include <cstddef>
#include <iterator>
#include <type_traits>
#include <unordered_map>

namespace densemap {

namespace ICfg {
inline constexpr CountT defaultTableCapacity = 32;
inline constexpr CountT maxRowsPerTable = CountT(1) << 32;
}

enum class TableStatus : uint32_t {
    Success,
    DuplicateKey,
};

struct InsertResult {
    TableStatus status;
    UUID key;

    inline bool ok() const;
};

// Dense storage of T addressed by UUID.
//
// Values live in one contiguous array and the UUID of row i lives at
// keys_[i]. index_ maps every live UUID back to its row, so lookups and
// removals are O(1) and iteration walks contiguous memory. Removal moves
// the last row into the hole, so row order only matches insertion order
// until the first removal.
//
// Not internally synchronized. Any number of concurrent readers, or one
// writer. Inserting or removing while iterating is not allowed.
template <typename T, typename GenT = UUIDGenerator>
class Table {
public:
    struct Row {
        UUID key;
        T &value;
    };

    struct ConstRow {
        UUID key;
        const T &value;
    };

    template <bool is_const>
    class RowIter {
    public:
        using TableT = std::conditional_t<is_const, const Table, Table>;
        using RowT = std::conditional_t<is_const, ConstRow, Row>;

        // Rows are yielded by value: a legacy input iterator, a C++20
        // forward iterator.
        using iterator_category = std::input_iterator_tag;
        using iterator_concept = std::forward_iterator_tag;
        using value_type = RowT;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = RowT;

        RowIter()
            : tbl_(nullptr),
              row_(0)
        {}

        RowIter(TableT *tbl, CountT row)
            : tbl_(tbl),
              row_(row)
        {}

        RowT operator*() const
        {
            return RowT {
                tbl_->keys_[row_],
                tbl_->values_[row_],
            };
        }

        RowIter & operator++()
        {
            row_++;
            return *this;
        }

        RowIter operator++(int)
        {
            RowIter prev = *this;
            row_++;
            return prev;
        }

        bool operator==(const RowIter &o) const
        {
            return tbl_ == o.tbl_ && row_ == o.row_;
        }

    private:
        TableT *tbl_;
        CountT row_;
    };

    using Iter = RowIter<false>;
    using ConstIter = RowIter<true>;

    Table();
    // init_capacity must be in [0, ICfg::maxRowsPerTable]
    explicit Table(CountT init_capacity, GenT gen = GenT());

    Table(const Table &) = delete;
    Table(Table &&) = default;
    Table & operator=(const Table &) = delete;
    Table & operator=(Table &&) = default;

    // Copies every row under the same keys. The copy draws new keys from
    // gen, independently of this table.
    Table clone(GenT gen = GenT()) const
        requires std::is_copy_constructible_v<T>;

    // Insert under a freshly generated key.
    UUID add(T value);

    template <typename... Args>
    UUID emplace(Args &&...args);

    // Insert under a caller supplied key. Returns DuplicateKey and leaves
    // the table untouched if key is already live.
    TableStatus addWithKey(UUID key, T value);

    // Generates a key if key is none.
    InsertResult insert(Optional<UUID> key, T value);

    // Replaces the value stored under key, or appends it if key is not
    // live. Returns true if a new row was created.
    bool insertOrAssign(UUID key, T value);

    inline T * get(UUID key);
    inline const T * get(UUID key) const;

    // key must be live
    T & at(UUID key);
    const T & at(UUID key) const;

    inline bool contains(UUID key) const;

    Optional<T> remove(UUID key);

    inline CountT size() const;
    inline bool isEmpty() const;
    inline CountT capacity() const;

    // num_rows must be in [0, ICfg::maxRowsPerTable]
    void reserve(CountT num_rows);

    // Destroys every value. Previously issued keys are simply absent
    // afterwards.
    void clear();

    inline Span<T> values();
    inline Span<const T> values() const;

    inline Iter begin();
    inline Iter end();
    inline ConstIter begin() const;
    inline ConstIter end() const;

    // O(n) consistency check of the value array, key array and index
    bool verify() const;

private:
    Table(DynArray<T> &&values, DynArray<UUID> &&keys, GenT &&gen);

    static CountT checkCapacity(CountT num_rows);

    inline CountT lookup(UUID key) const;

    template <typename... Args>
    void append(UUID key, Args &&...args);

    using IndexMap = std::unordered_map<UUID, CountT, UUIDHash>;

    DynArray<T> values_;
    DynArray<UUID> keys_;
    IndexMap index_;
    GenT gen_;
};

}

#include "table.inl"
