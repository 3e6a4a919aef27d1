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
#include <susu/core/int.hpp>
#include <susu/execution/core/address.hpp>
#include <susu/execution/core/contract/big_endian.hpp>
#include <susu/execution/core/contract/storage_array.hpp>
#include <susu/execution/core/contract/storage_variable.hpp>
#include <susu/execution/rosca/config.hpp>
#include <susu/execution/rosca/util/constants.hpp>

#include <intx/intx.hpp>

#include <cstddef>
#include <cstdint>

SUSU_NAMESPACE_BEGIN

class State;

SUSU_NAMESPACE_END

SUSU_ROSCA_NAMESPACE_BEGIN

/// One roster entry. The position of the slot in `Circle::members()` is the
/// member's index, which addresses its bit in every roster bitmap.
struct MemberSlot
{
    Address address;
    u8_be status;
    u32_be contribution_count;
    u64_be last_contribution_time;
    // running total paid in, for pro-rata refunds
    u256_be contributions_paid;
    // gross payouts received over all cycles
    u256_be payouts_received;
};

static_assert(sizeof(MemberSlot) == 97);
static_assert(StorageVariable<MemberSlot>::N == 4);

// Net amount the circle still owes the member, never negative.
inline uint256_t net_position(MemberSlot const &slot) noexcept
{
    uint256_t const paid = slot.contributions_paid.native();
    uint256_t const received = slot.payouts_received.native();
    return paid > received ? paid - received : 0;
}

class Circle
{
    State &state_;
    Address const &address_;
    uint256_t const key_;

public:
    ///////////////////
    // Compact slots //
    ///////////////////
    struct AdminFlags
    {
        Address admin;
        u64_be flags;
    };

    static_assert(StorageVariable<AdminFlags>::N == 1);

    struct Terms
    {
        u64_be cycle_duration;
        u32_be max_members;
        u32_be late_fee_bps;
        u32_be insurance_fee_bps;
        // pending governance value, meaningful while the proposal flag is set
        u32_be proposed_late_fee_bps;
    };

    static_assert(StorageVariable<Terms>::N == 1);

    struct Cycle
    {
        u64_be number;
        u64_be current_payout_index;
        u64_be deadline;
    };

    static_assert(StorageVariable<Cycle>::N == 1);

    struct Bitmaps
    {
        u64_be has_received_payout;
        u64_be dissolution_votes;
        u64_be proposal_votes;
    };

    static_assert(StorageVariable<Bitmaps>::N == 1);

    ////////////
    // Layout //
    ////////////
    using Token_t = Address;
    using Contribution_t = u256_be;
    using Amount_t = u256_be;

    struct Offsets
    {
        static constexpr size_t admin_flags = 0;
        static constexpr size_t token =
            admin_flags + StorageVariable<AdminFlags>::N;
        static constexpr size_t contribution =
            token + StorageVariable<Token_t>::N;
        static constexpr size_t terms =
            contribution + StorageVariable<Contribution_t>::N;
        static constexpr size_t cycle = terms + StorageVariable<Terms>::N;
        static constexpr size_t total_volume_distributed =
            cycle + StorageVariable<Cycle>::N;
        static constexpr size_t custody_balance =
            total_volume_distributed + StorageVariable<Amount_t>::N;
        static constexpr size_t reserve_balance =
            custody_balance + StorageVariable<Amount_t>::N;
        static constexpr size_t insurance_balance =
            reserve_balance + StorageVariable<Amount_t>::N;
        static constexpr size_t bitmaps =
            insurance_balance + StorageVariable<Amount_t>::N;
        // length slot followed by up to MAX_MEMBERS member slots
        static constexpr size_t members =
            bitmaps + StorageVariable<Bitmaps>::N;
        static constexpr size_t payout_queue =
            members + 1 + MAX_MEMBERS * StorageVariable<MemberSlot>::N;
    };

    Circle(State &state, Address const &address, bytes32_t const key);

    /////////////
    // Getters //
    /////////////

    // Circle admin and lifecycle flags packed into a single slot
    auto admin_flags() noexcept
    {
        return StorageVariable<AdminFlags>{
            state_, address_, key_ + Offsets::admin_flags};
    }

    // Immutable: asset contributed and paid out by this circle
    auto token() noexcept
    {
        return StorageVariable<Token_t>{state_, address_, key_ + Offsets::token};
    }

    // Immutable: amount owed by each member per cycle
    auto contribution() noexcept
    {
        return StorageVariable<Contribution_t>{
            state_, address_, key_ + Offsets::contribution};
    }

    auto terms() noexcept
    {
        return StorageVariable<Terms>{state_, address_, key_ + Offsets::terms};
    }

    auto cycle() noexcept
    {
        return StorageVariable<Cycle>{state_, address_, key_ + Offsets::cycle};
    }

    // Sum of gross payouts made in the current cycle
    auto total_volume_distributed() noexcept
    {
        return StorageVariable<Amount_t>{
            state_, address_, key_ + Offsets::total_volume_distributed};
    }

    // Contributions held by the engine for this circle. Every payout and
    // refund is checked against it before any funds move.
    auto custody_balance() noexcept
    {
        return StorageVariable<Amount_t>{
            state_, address_, key_ + Offsets::custody_balance};
    }

    // Late fees, and kick penalties when no treasury is configured
    auto reserve_balance() noexcept
    {
        return StorageVariable<Amount_t>{
            state_, address_, key_ + Offsets::reserve_balance};
    }

    auto insurance_balance() noexcept
    {
        return StorageVariable<Amount_t>{
            state_, address_, key_ + Offsets::insurance_balance};
    }

    auto bitmaps() noexcept
    {
        return StorageVariable<Bitmaps>{
            state_, address_, key_ + Offsets::bitmaps};
    }

    // Roster in join order
    StorageArray<MemberSlot> members() noexcept;

    // Payout order, empty until finalization
    StorageArray<Address> payout_queue() noexcept;

    /////////////
    // Helpers //
    /////////////

    bool exists() const noexcept;

    Address admin() const noexcept;

    uint64_t get_flags() const noexcept;

    bool has_flag(uint64_t flag) const noexcept;

    void set_flag(uint64_t flag) noexcept;

    void clear_flag(uint64_t flag) noexcept;
};

SUSU_ROSCA_NAMESPACE_END
