// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <susu/core/assert.h>
#include <susu/execution/core/contract/storage_variable.hpp>

#include <intx/intx.hpp>

#include <cstdint>
#include <vector>

SUSU_NAMESPACE_BEGIN

/// Dynamic array in storage: the length lives in the slot at `slot`, the
/// elements follow it back to back.
template <typename T>
    requires std::has_unique_object_representations_v<T>
class StorageArray
{
    State &state_;
    Address const address_;
    StorageVariable<u64_be> length_;
    uint256_t const start_index_;

    static constexpr size_t SLOT_PER_ELEM = StorageVariable<T>::N;

    StorageVariable<T> at(uint64_t const index) const noexcept
    {
        uint256_t const offset = start_index_ + index * SLOT_PER_ELEM;
        return StorageVariable<T>{state_, address_, offset};
    }

public:
    StorageArray(State &state, Address const &address, bytes32_t const &slot)
        : state_{state}
        , address_{address}
        , length_{state, address, slot}
        , start_index_{intx::be::load<uint256_t>(slot) + 1}
    {
    }

    uint64_t length() const noexcept
    {
        return length_.load().native();
    }

    bool empty() const noexcept
    {
        return length() == 0;
    }

    StorageVariable<T> get(uint64_t const index) const noexcept
    {
        SUSU_ASSERT(index < length());
        return at(index);
    }

    void push(T const &value)
    {
        auto const len = length();
        at(len).store(value);
        length_.store(len + 1);
    }

    T pop()
    {
        uint64_t len = length();
        SUSU_ASSERT(len > 0);
        len = len - 1;
        auto var = at(len);
        T const value = var.load();
        var.clear();
        length_.store(len);
        return value;
    }

    // Removes the element at `index`, shifting the tail down by one so the
    // relative order of the remaining elements is preserved.
    void erase(uint64_t const index)
    {
        uint64_t const len = length();
        SUSU_ASSERT(index < len);
        for (uint64_t i = index; i + 1 < len; ++i) {
            at(i).store(at(i + 1).load());
        }
        (void)pop();
    }

    void clear()
    {
        while (!empty()) {
            (void)pop();
        }
    }

    std::vector<T> load_all() const
    {
        uint64_t const len = length();
        std::vector<T> out;
        out.reserve(len);
        for (uint64_t i = 0; i < len; ++i) {
            out.push_back(at(i).load());
        }
        return out;
    }

    void store_all(std::vector<T> const &values)
    {
        clear();
        for (auto const &value : values) {
            push(value);
        }
    }
};

SUSU_NAMESPACE_END
