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
#include <susu/execution/core/contract/mapping_slot.hpp>
#include <susu/execution/rosca/state_asset_ledger.hpp>
#include <susu/execution/rosca/util/rosca_error.hpp>
#include <susu/execution/state/state.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

SUSU_ROSCA_ANONYMOUS_NAMESPACE_BEGIN

enum Namespace : uint8_t
{
    NSAllowance = 0x01,
};

SUSU_ROSCA_ANONYMOUS_NAMESPACE_END

SUSU_ROSCA_NAMESPACE_BEGIN

StateAssetLedger::StateAssetLedger(State &state, Address const &spender)
    : state_{state}
    , spender_{spender}
{
}

StorageVariable<u256_be> StateAssetLedger::allowance_slot(
    Address const &asset, Address const &owner) const
{
    struct
    {
        Address owner;
        Address spender;
    } const key{.owner = owner, .spender = spender_};

    return {
        state_,
        asset,
        keccak_mapping_slot(
            NSAllowance,
            byte_string_view{
                reinterpret_cast<unsigned char const *>(&key), sizeof(key)})};
}

void StateAssetLedger::mint(
    Address const &asset, Address const &to, uint256_t const &amount)
{
    state_.add_to_balance(asset, to, amount);
}

void StateAssetLedger::approve(
    Address const &asset, Address const &owner, uint256_t const &amount)
{
    allowance_slot(asset, owner).store(amount);
}

uint256_t StateAssetLedger::balance_of(
    Address const &asset, Address const &holder) const
{
    return state_.get_balance(asset, holder);
}

uint256_t
StateAssetLedger::allowance(Address const &asset, Address const &owner) const
{
    return allowance_slot(asset, owner).load().native();
}

Result<void> StateAssetLedger::transfer(
    Address const &asset, Address const &from, Address const &to,
    uint256_t const &amount)
{
    if (SUSU_UNLIKELY(amount == 0)) {
        return outcome::success();
    }

    if (from != spender_) {
        auto slot = allowance_slot(asset, from);
        uint256_t const allowed = slot.load().native();
        if (SUSU_UNLIKELY(allowed < amount)) {
            return RoscaError::InsufficientAllowance;
        }
        BOOST_OUTCOME_TRY(auto const remaining, checked_sub(allowed, amount));
        slot.store(remaining);
    }

    if (SUSU_UNLIKELY(state_.get_balance(asset, from) < amount)) {
        return RoscaError::InsufficientBalance;
    }

    state_.subtract_from_balance(asset, from, amount);
    state_.add_to_balance(asset, to, amount);
    return outcome::success();
}

SUSU_ROSCA_NAMESPACE_END
