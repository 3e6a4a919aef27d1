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

#include <susu/core/int.hpp>
#include <susu/core/result.hpp>
#include <susu/execution/rosca/config.hpp>

#include <cstdint>

SUSU_ROSCA_NAMESPACE_BEGIN

struct FeeSplit
{
    uint256_t net;
    uint256_t fee;
};

/// Amounts collected by one contribution.
struct DepositBreakdown
{
    uint256_t base;
    uint256_t late_fee;
    uint256_t insurance_fee;
    uint256_t total;
};

// floor(amount * bps / 10000); InvalidFeeConfig when bps > 10000
Result<uint256_t> basis_points_of(uint256_t const &amount, uint32_t bps);

Result<FeeSplit> split_protocol_fee(uint256_t const &gross, uint32_t fee_bps);

Result<DepositBreakdown> compute_deposit(
    uint256_t const &contribution, uint32_t late_fee_bps,
    uint32_t insurance_fee_bps, bool is_late);

SUSU_ROSCA_NAMESPACE_END
