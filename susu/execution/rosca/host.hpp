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

#include <susu/core/byte_string.hpp>
#include <susu/core/int.hpp>
#include <susu/core/result.hpp>
#include <susu/execution/core/address.hpp>
#include <susu/execution/rosca/config.hpp>

#include <cstdint>
#include <vector>

SUSU_ROSCA_NAMESPACE_BEGIN

/// Caller-supplied evidence that a call is made on behalf of `principal`.
/// The engine never interprets `signature`; only the `Authorizer` does.
struct Proof
{
    Address principal{};
    byte_string signature{};
};

class Authorizer
{
public:
    virtual ~Authorizer() = default;

    virtual bool verify(Proof const &) = 0;
};

/// Value-transfer primitive for fungible assets. The engine calls it after
/// its own state is committed and never implements transfers itself.
class AssetLedger
{
public:
    virtual ~AssetLedger() = default;

    virtual Result<void> transfer(
        Address const &asset, Address const &from, Address const &to,
        uint256_t const &amount) = 0;
};

// Seconds, monotonic
class Clock
{
public:
    virtual ~Clock() = default;

    virtual uint64_t now() = 0;
};

/// Secure permutation source for randomized payout queues.
class Shuffler
{
public:
    virtual ~Shuffler() = default;

    virtual std::vector<Address> permute(std::vector<Address> members) = 0;
};

struct Host
{
    Authorizer &authorizer;
    AssetLedger &ledger;
    Clock &clock;
    Shuffler &shuffler;
};

SUSU_ROSCA_NAMESPACE_END
