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

#include <susu/core/int.hpp>
#include <susu/execution/core/fmt/int_fmt.hpp> // NOLINT
#include <susu/execution/rosca/util/bitset.hpp>
#include <susu/execution/rosca/util/fee.hpp>
#include <susu/execution/rosca/util/rosca_error.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <limits>

using namespace susu;
using namespace susu::rosca;
using namespace intx::literals;

TEST(Fee, basis_points)
{
    EXPECT_EQ(basis_points_of(10'000, 1).value(), 1);
    EXPECT_EQ(basis_points_of(100, 250).value(), 2);
    EXPECT_EQ(basis_points_of(100, 10'000).value(), 100);
    EXPECT_EQ(
        basis_points_of(100, 10'001).assume_error(),
        RoscaError::InvalidFeeConfig);
}

TEST(Fee, zero_bps_is_exact)
{
    auto const split = split_protocol_fee(12345, 0);
    ASSERT_FALSE(split.has_error());
    EXPECT_EQ(split.value().fee, 0);
    EXPECT_EQ(split.value().net, 12345);
}

TEST(Fee, split_floors_fee)
{
    auto const split = split_protocol_fee(999, 100);
    ASSERT_FALSE(split.has_error());
    EXPECT_EQ(split.value().fee, 9);
    EXPECT_EQ(split.value().net, 990);
}

TEST(Fee, split_does_not_overflow)
{
    auto const gross = std::numeric_limits<uint256_t>::max();
    auto const split = split_protocol_fee(gross, 5'000);
    ASSERT_FALSE(split.has_error());
    EXPECT_EQ(split.value().fee + split.value().net, gross);
    EXPECT_EQ(split.value().fee, gross / 2);
}

TEST(Fee, deposit_on_time)
{
    auto const d = compute_deposit(100, 1'000, 500, false);
    ASSERT_FALSE(d.has_error());
    EXPECT_EQ(d.value().base, 100);
    EXPECT_EQ(d.value().late_fee, 0);
    EXPECT_EQ(d.value().insurance_fee, 5);
    EXPECT_EQ(d.value().total, 105);
}

TEST(Fee, late_fee_on_base_only)
{
    auto const d = compute_deposit(1'000, 1'000, 5'000, true);
    ASSERT_FALSE(d.has_error());
    EXPECT_EQ(d.value().late_fee, 100);
    EXPECT_EQ(d.value().insurance_fee, 500);
    EXPECT_EQ(d.value().total, 1'600);
}

TEST(Bitset, erase_bit_compacts)
{
    EXPECT_EQ(erase_bit(0b10110, 2), 0b1010);
    EXPECT_EQ(erase_bit(0b1, 0), 0);
    EXPECT_EQ(count_bits(low_mask(50)), 50);
    EXPECT_TRUE(test_bit(bit_of(63), 63));
}
