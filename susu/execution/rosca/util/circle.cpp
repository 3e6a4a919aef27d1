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

#include <susu/execution/rosca/util/circle.hpp>
#include <susu/execution/state/state.hpp>

#include <intx/intx.hpp>

SUSU_ROSCA_NAMESPACE_BEGIN

Circle::Circle(State &state, Address const &address, bytes32_t const key)
    : state_{state}
    , address_{address}
    , key_{intx::be::load<uint256_t>(key)}
{
}

StorageArray<MemberSlot> Circle::members() noexcept
{
    return {
        state_, address_, intx::be::store<bytes32_t>(key_ + Offsets::members)};
}

StorageArray<Address> Circle::payout_queue() noexcept
{
    return {
        state_,
        address_,
        intx::be::store<bytes32_t>(key_ + Offsets::payout_queue)};
}

bool Circle::exists() const noexcept
{
    return StorageVariable<AdminFlags>{
        state_, address_, key_ + Offsets::admin_flags}
        .load_checked()
        .has_value();
}

Address Circle::admin() const noexcept
{
    return StorageVariable<AdminFlags>{
        state_, address_, key_ + Offsets::admin_flags}
        .load()
        .admin;
}

uint64_t Circle::get_flags() const noexcept
{
    return StorageVariable<AdminFlags>{
        state_, address_, key_ + Offsets::admin_flags}
        .load()
        .flags.native();
}

bool Circle::has_flag(uint64_t const flag) const noexcept
{
    return (get_flags() & flag) != 0;
}

void Circle::set_flag(uint64_t const flag) noexcept
{
    auto af = admin_flags().load();
    af.flags = af.flags.native() | flag;
    admin_flags().store(af);
}

void Circle::clear_flag(uint64_t const flag) noexcept
{
    auto af = admin_flags().load();
    af.flags = af.flags.native() & ~flag;
    admin_flags().store(af);
}

SUSU_ROSCA_NAMESPACE_END
