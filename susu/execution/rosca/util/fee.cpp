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

#include <susu/core/likely.h>
#include <susu/execution/core/contract/checked_math.hpp>
#include <susu/execution/rosca/util/constants.hpp>
#include <susu/execution/rosca/util/fee.hpp>
#include <susu/execution/rosca/util/rosca_error.hpp>

#include <boost/outcome/try.hpp>

SUSU_ROSCA_NAMESPACE_BEGIN

Result<uint256_t> basis_points_of(uint256_t const &amount, uint32_t const bps)
{
    if (SUSU_UNLIKELY(bps > MAX_BASIS_POINTS)) {
        return RoscaError::InvalidFeeConfig;
    }
    if (bps == 0) {
        return uint256_t{0};
    }
    return checked_mul_div(amount, bps, MAX_BASIS_POINTS);
}

Result<FeeSplit>
split_protocol_fee(uint256_t const &gross, uint32_t const fee_bps)
{
    BOOST_OUTCOME_TRY(auto const fee, basis_points_of(gross, fee_bps));
    BOOST_OUTCOME_TRY(auto const net, checked_sub(gross, fee));
    return FeeSplit{.net = net, .fee = fee};
}

Result<DepositBreakdown> compute_deposit(
    uint256_t const &contribution, uint32_t const late_fee_bps,
    uint32_t const insurance_fee_bps, bool const is_late)
{
    DepositBreakdown out{
        .base = contribution, .late_fee = 0, .insurance_fee = 0, .total = 0};
    // late fee is charged on the base contribution only
    if (is_late) {
        BOOST_OUTCOME_TRY(
            out.late_fee, basis_points_of(contribution, late_fee_bps));
    }
    BOOST_OUTCOME_TRY(
        out.insurance_fee, basis_points_of(contribution, insurance_fee_bps));
    BOOST_OUTCOME_TRY(out.total, checked_add(out.base, out.late_fee));
    BOOST_OUTCOME_TRY(out.total, checked_add(out.total, out.insurance_fee));
    return out;
}

SUSU_ROSCA_NAMESPACE_END
