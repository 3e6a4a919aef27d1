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
#include <susu/execution/core/address.hpp>
#include <susu/execution/core/fmt/int_fmt.hpp> // NOLINT
#include <susu/execution/rosca/state_asset_ledger.hpp>
#include <susu/execution/rosca/util/constants.hpp>
#include <susu/execution/rosca/util/rosca_error.hpp>
#include <susu/execution/state/state.hpp>

#include <gtest/gtest.h>

using namespace susu;
using namespace susu::rosca;

namespace
{
    constexpr Address TOKEN = 0x70c3e4_address;
    constexpr Address HOLDER = 0xdeadbeef_address;
    constexpr Address OTHER = 0xcafebabe_address;
}

struct Ledger : public ::testing::Test
{
    State state;
    StateAssetLedger ledger{state};
};

TEST_F(Ledger, pull_requires_allowance)
{
    ledger.mint(TOKEN, HOLDER, 100);

    auto res = ledger.transfer(TOKEN, HOLDER, SUSU_CA, 60);
    EXPECT_EQ(res.assume_error(), RoscaError::InsufficientAllowance);

    ledger.approve(TOKEN, HOLDER, 80);
    res = ledger.transfer(TOKEN, HOLDER, SUSU_CA, 60);
    EXPECT_FALSE(res.has_error());
    EXPECT_EQ(ledger.allowance(TOKEN, HOLDER), 20);
    EXPECT_EQ(ledger.balance_of(TOKEN, HOLDER), 40);
    EXPECT_EQ(ledger.balance_of(TOKEN, SUSU_CA), 60);
}

TEST_F(Ledger, insufficient_balance)
{
    ledger.mint(TOKEN, HOLDER, 10);
    ledger.approve(TOKEN, HOLDER, 100);
    state.push();
    auto const res = ledger.transfer(TOKEN, HOLDER, OTHER, 50);
    EXPECT_EQ(res.assume_error(), RoscaError::InsufficientBalance);
    state.pop_reject();
    // the allowance decrement is undone with the checkpoint
    EXPECT_EQ(ledger.allowance(TOKEN, HOLDER), 100);
}

TEST_F(Ledger, spender_moves_own_funds)
{
    ledger.mint(TOKEN, SUSU_CA, 30);
    EXPECT_FALSE(ledger.transfer(TOKEN, SUSU_CA, OTHER, 30).has_error());
    EXPECT_EQ(ledger.balance_of(TOKEN, OTHER), 30);
    EXPECT_EQ(ledger.balance_of(TOKEN, SUSU_CA), 0);
}

TEST_F(Ledger, zero_transfer_is_noop)
{
    EXPECT_FALSE(ledger.transfer(TOKEN, HOLDER, OTHER, 0).has_error());
    EXPECT_EQ(ledger.balance_of(TOKEN, OTHER), 0);
}

TEST_F(Ledger, rejected_checkpoint_undoes_transfer)
{
    ledger.mint(TOKEN, SUSU_CA, 30);
    state.push();
    EXPECT_FALSE(ledger.transfer(TOKEN, SUSU_CA, OTHER, 30).has_error());
    EXPECT_EQ(ledger.balance_of(TOKEN, OTHER), 30);
    state.pop_reject();
    EXPECT_EQ(ledger.balance_of(TOKEN, OTHER), 0);
    EXPECT_EQ(ledger.balance_of(TOKEN, SUSU_CA), 30);
}

TEST_F(Ledger, allowances_are_per_asset)
{
    constexpr Address OTHER_TOKEN = 0x07e4_address;
    ledger.approve(TOKEN, HOLDER, 5);
    EXPECT_EQ(ledger.allowance(TOKEN, HOLDER), 5);
    EXPECT_EQ(ledger.allowance(OTHER_TOKEN, HOLDER), 0);
}
