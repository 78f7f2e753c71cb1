/*
 * Copyright 2021-2022 Brennan Shacklett and contributors
 *
 * Use of this source code is governed by an MIT-style
 * license that can be found in the LICENSE file or at
 * https://opensource.org/licenses/MIT.
 */
#include <densemap/crash.hpp>

#include <new>
#include <utility>

namespace densemap {

bool InsertResult::ok() const
{
    return status == TableStatus::Success;
}

template <typename T, typename GenT>
Table<T, GenT>::Table()
    : Table(ICfg::defaultTableCapacity)
{}

template <typename T, typename GenT>
Table<T, GenT>::Table(CountT init_capacity, GenT gen)
    : values_(checkCapacity(init_capacity)),
      keys_(init_capacity),
      index_(),
      gen_(std::move(gen))
{
    try {
        index_.reserve((size_t)init_capacity);
    } catch (const std::bad_alloc &) {
        FATAL("Table: out of memory reserving %lld index entries",
              (long long)init_capacity);
    }
}

template <typename T, typename GenT>
Table<T, GenT>::Table(DynArray<T> &&values, DynArray<UUID> &&keys,
                      GenT &&gen)
    : values_(std::move(values)),
      keys_(std::move(keys)),
      index_(),
      gen_(std::move(gen))
{}

template <typename T, typename GenT>
Table<T, GenT> Table<T, GenT>::clone(GenT gen) const
    requires std::is_copy_constructible_v<T>
{
    Table copy(values_.clone(), keys_.clone(), std::move(gen));

    try {
        copy.index_ = index_;
    } catch (const std::bad_alloc &) {
        FATAL("Table: out of memory copying %lld index entries",
              (long long)size());
    }

    return copy;
}

template <typename T, typename GenT>
UUID Table<T, GenT>::add(T value)
{
    return emplace(std::move(value));
}

template <typename T, typename GenT>
template <typename... Args>
UUID Table<T, GenT>::emplace(Args &&...args)
{
    UUID key = gen_.generate([this](UUID candidate) {
        return contains(candidate);
    });

    append(key, std::forward<Args>(args)...);

    return key;
}

template <typename T, typename GenT>
TableStatus Table<T, GenT>::addWithKey(UUID key, T value)
{
    if (contains(key)) {
        return TableStatus::DuplicateKey;
    }

    append(key, std::move(value));

    return TableStatus::Success;
}

template <typename T, typename GenT>
InsertResult Table<T, GenT>::insert(Optional<UUID> key, T value)
{
    if (!key.has_value()) {
        return InsertResult {
            TableStatus::Success,
            add(std::move(value)),
        };
    }

    return InsertResult {
        addWithKey(*key, std::move(value)),
        *key,
    };
}

template <typename T, typename GenT>
bool Table<T, GenT>::insertOrAssign(UUID key, T value)
{
    CountT row = lookup(key);
    if (row != -1) {
        values_[row] = std::move(value);
        return false;
    }

    append(key, std::move(value));

    return true;
}

template <typename T, typename GenT>
T * Table<T, GenT>::get(UUID key)
{
    CountT row = lookup(key);
    if (row == -1) {
        return nullptr;
    }

    return &values_[row];
}

template <typename T, typename GenT>
const T * Table<T, GenT>::get(UUID key) const
{
    CountT row = lookup(key);
    if (row == -1) {
        return nullptr;
    }

    return &values_[row];
}

template <typename T, typename GenT>
T & Table<T, GenT>::at(UUID key)
{
    T *v = get(key);
    if (v == nullptr) {
        FATAL("Table: no row with key %s", key.toString().c_str());
    }

    return *v;
}

template <typename T, typename GenT>
const T & Table<T, GenT>::at(UUID key) const
{
    const T *v = get(key);
    if (v == nullptr) {
        FATAL("Table: no row with key %s", key.toString().c_str());
    }

    return *v;
}

template <typename T, typename GenT>
bool Table<T, GenT>::contains(UUID key) const
{
    return index_.contains(key);
}

template <typename T, typename GenT>
Optional<T> Table<T, GenT>::remove(UUID key)
{
    auto iter = index_.find(key);
    if (iter == index_.end()) {
        return Optional<T>::none();
    }

    CountT delete_row = iter->second;
    CountT last_row = keys_.size() - 1;

    // Only moving T can throw, so the value array goes first and the keys
    // and index are left untouched if it does.
    T removed = values_.swap_remove(delete_row);

    // The last row moves into delete_row, its key is the only index entry
    // that changes
    if (delete_row != last_row) {
        UUID moved_key = keys_[last_row];
        index_.find(moved_key)->second = delete_row;
    }

    keys_.swap_remove(delete_row);
    index_.erase(iter);

    return Optional<T>::make(std::move(removed));
}

template <typename T, typename GenT>
CountT Table<T, GenT>::size() const
{
    return values_.size();
}

template <typename T, typename GenT>
bool Table<T, GenT>::isEmpty() const
{
    return values_.size() == 0;
}

template <typename T, typename GenT>
CountT Table<T, GenT>::capacity() const
{
    return values_.capacity();
}

template <typename T, typename GenT>
void Table<T, GenT>::reserve(CountT num_rows)
{
    checkCapacity(num_rows);

    values_.reserve(num_rows);
    keys_.reserve(num_rows);

    try {
        index_.reserve((size_t)num_rows);
    } catch (const std::bad_alloc &) {
        FATAL("Table: out of memory reserving %lld index entries",
              (long long)num_rows);
    }
}

template <typename T, typename GenT>
void Table<T, GenT>::clear()
{
    values_.clear();
    keys_.clear();
    index_.clear();
}

template <typename T, typename GenT>
Span<T> Table<T, GenT>::values()
{
    return Span<T>(values_.data(), values_.size());
}

template <typename T, typename GenT>
Span<const T> Table<T, GenT>::values() const
{
    return Span<const T>(values_.data(), values_.size());
}

template <typename T, typename GenT>
typename Table<T, GenT>::Iter Table<T, GenT>::begin()
{
    return Iter(this, 0);
}

template <typename T, typename GenT>
typename Table<T, GenT>::Iter Table<T, GenT>::end()
{
    return Iter(this, size());
}

template <typename T, typename GenT>
typename Table<T, GenT>::ConstIter Table<T, GenT>::begin() const
{
    return ConstIter(this, 0);
}

template <typename T, typename GenT>
typename Table<T, GenT>::ConstIter Table<T, GenT>::end() const
{
    return ConstIter(this, size());
}

template <typename T, typename GenT>
bool Table<T, GenT>::verify() const
{
    if (keys_.size() != values_.size() ||
            (CountT)index_.size() != values_.size()) {
        return false;
    }

    // Every row's key resolves back to that row. With equal sizes this
    // also rules out duplicate keys and stale index entries.
    for (CountT row = 0; row < keys_.size(); row++) {
        auto iter = index_.find(keys_[row]);
        if (iter == index_.end() || iter->second != row) {
            return false;
        }
    }

    return true;
}

template <typename T, typename GenT>
CountT Table<T, GenT>::checkCapacity(CountT num_rows)
{
    if (num_rows < 0 || num_rows > ICfg::maxRowsPerTable) {
        FATAL("Table: invalid capacity %lld, must be in [0, %lld]",
              (long long)num_rows, (long long)ICfg::maxRowsPerTable);
    }

    return num_rows;
}

template <typename T, typename GenT>
CountT Table<T, GenT>::lookup(UUID key) const
{
    auto iter = index_.find(key);
    if (iter == index_.end()) {
        return -1;
    }

    return iter->second;
}

template <typename T, typename GenT>
template <typename... Args>
void Table<T, GenT>::append(UUID key, Args &&...args)
{
    CountT row = values_.size();
    if (row == ICfg::maxRowsPerTable) [[unlikely]] {
        FATAL("Table: exceeded %lld rows", (long long)ICfg::maxRowsPerTable);
    }

    // Index entry first, rolled back if constructing T throws. The arrays
    // allocate through DefaultAlloc, which never throws.
    typename IndexMap::iterator index_iter;
    try {
        index_iter = index_.emplace(key, row).first;
    } catch (const std::bad_alloc &) {
        FATAL("Table: out of memory growing the index past %lld rows",
              (long long)row);
    }

    try {
        values_.emplace_back(std::forward<Args>(args)...);
    } catch (...) {
        index_.erase(index_iter);
        throw;
    }

    keys_.push_back(key);
}

}
