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

#include <susu/execution/rosca/config.hpp>

#include <bit>
#include <cstdint>

SUSU_ROSCA_NAMESPACE_BEGIN

// Roster bitmaps: bit i belongs to the member at roster position i.

constexpr uint64_t bit_of(uint64_t const index) noexcept
{
    return uint64_t{1} << index;
}

constexpr bool test_bit(uint64_t const bits, uint64_t const index) noexcept
{
    return (bits & bit_of(index)) != 0;
}

// lowest n bits set
constexpr uint64_t low_mask(uint64_t const n) noexcept
{
    return n >= 64 ? ~uint64_t{0} : bit_of(n) - 1;
}

constexpr uint64_t count_bits(uint64_t const bits) noexcept
{
    return static_cast<uint64_t>(std::popcount(bits));
}

// Drops bit `index` and shifts every higher bit down by one, mirroring the
// removal of a roster entry.
constexpr uint64_t erase_bit(uint64_t const bits, uint64_t const index) noexcept
{
    uint64_t const low = bits & low_mask(index);
    uint64_t const high = index >= 63 ? 0 : (bits >> (index + 1)) << index;
    return low | high;
}

static_assert(erase_bit(0b1011, 1) == 0b101);
static_assert(erase_bit(0b1011, 0) == 0b101);
static_assert(erase_bit(0b1011, 3) == 0b011);
static_assert(erase_bit(~uint64_t{0}, 63) == low_mask(63));

SUSU_ROSCA_NAMESPACE_END
