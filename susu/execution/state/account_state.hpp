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

#include <susu/core/bytes.hpp>
#include <susu/core/config.hpp>
#include <susu/core/int.hpp>
#include <susu/execution/core/address.hpp>

#include <ankerl/unordered_dense.h>

SUSU_NAMESPACE_BEGIN

/// Everything the engine tracks for one account: its contract storage and
/// the amount it holds of each asset.
struct AccountState
{
    template <typename K, typename V>
    using Map = ankerl::unordered_dense::segmented_map<K, V>;

    Map<bytes32_t, bytes32_t> storage_{};
    Map<Address, uint256_t> balances_{};
};

SUSU_NAMESPACE_END
