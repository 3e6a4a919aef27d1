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
#include <susu/execution/core/address.hpp>
#include <susu/execution/core/contract/big_endian.hpp>
#include <susu/execution/core/contract/storage_variable.hpp>
#include <susu/execution/rosca/config.hpp>
#include <susu/execution/rosca/host.hpp>
#include <susu/execution/rosca/util/constants.hpp>

SUSU_NAMESPACE_BEGIN

class State;

SUSU_NAMESPACE_END

SUSU_ROSCA_NAMESPACE_BEGIN

/// Reference asset ledger whose balances live in `State`. Because it
/// shares the engine's checkpoints, a rejected call also undoes the
/// transfers it made. Moving funds out of any account other than the
/// spender requires a prior `approve` to the spender.
class StateAssetLedger final : public AssetLedger
{
    State &state_;
    Address const spender_;

    StorageVariable<u256_be>
    allowance_slot(Address const &asset, Address const &owner) const;

public:
    explicit StateAssetLedger(State &, Address const &spender = SUSU_CA);

    void mint(Address const &asset, Address const &to, uint256_t const &);

    void
    approve(Address const &asset, Address const &owner, uint256_t const &);

    uint256_t balance_of(Address const &asset, Address const &holder) const;

    uint256_t allowance(Address const &asset, Address const &owner) const;

    Result<void> transfer(
        Address const &asset, Address const &from, Address const &to,
        uint256_t const &amount) override;
};

SUSU_ROSCA_NAMESPACE_END
