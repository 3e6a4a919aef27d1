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

#include <susu/core/assert.h>
#include <susu/core/bytes.hpp>
#include <susu/core/int.hpp>
#include <susu/core/likely.h>
#include <susu/core/susu_exception.hpp>
#include <susu/execution/core/address.hpp>
#include <susu/execution/core/log.hpp>
#include <susu/execution/state/account_state.hpp>
#include <susu/execution/state/state.hpp>

#include <limits>
#include <vector>

SUSU_NAMESPACE_BEGIN

AccountState const *
State::recent_account_state(Address const &address) const
{
    auto const it = current_.find(address);
    if (it == current_.end()) {
        return nullptr;
    }
    return &it->second.recent();
}

AccountState &State::current_account_state(Address const &address)
{
    auto it = current_.find(address);
    if (SUSU_UNLIKELY(it == current_.end())) {
        it = current_.try_emplace(address, AccountState{}, version_).first;
    }
    return it->second.current(version_);
}

unsigned State::version() const
{
    return version_;
}

void State::push()
{
    ++version_;
}

void State::pop_accept()
{
    SUSU_ASSERT(version_);

    for (auto &it : current_) {
        it.second.pop_accept(version_);
    }

    logs_.pop_accept(version_);

    --version_;
}

void State::pop_reject()
{
    SUSU_ASSERT(version_);

    std::vector<Address> removals;

    for (auto &it : current_) {
        if (it.second.pop_reject(version_)) {
            removals.push_back(it.first);
        }
    }

    logs_.pop_reject(version_);

    while (removals.size()) {
        current_.erase(removals.back());
        removals.pop_back();
    }

    --version_;
}

bytes32_t
State::get_storage(Address const &address, bytes32_t const &key) const
{
    auto const *const account_state = recent_account_state(address);
    if (account_state == nullptr) {
        return {};
    }
    auto const it = account_state->storage_.find(key);
    if (it == account_state->storage_.end()) {
        return {};
    }
    return it->second;
}

void State::set_storage(
    Address const &address, bytes32_t const &key, bytes32_t const &value)
{
    auto &storage = current_account_state(address).storage_;
    if (value == bytes32_t{}) {
        storage.erase(key);
    }
    else {
        storage.insert_or_assign(key, value);
    }
}

uint256_t
State::get_balance(Address const &asset, Address const &holder) const
{
    auto const *const account_state = recent_account_state(holder);
    if (account_state == nullptr) {
        return 0;
    }
    auto const it = account_state->balances_.find(asset);
    if (it == account_state->balances_.end()) {
        return 0;
    }
    return it->second;
}

void State::add_to_balance(
    Address const &asset, Address const &holder, uint256_t const &delta)
{
    auto &balance = current_account_state(holder).balances_[asset];

    SUSU_ASSERT_THROW(
        std::numeric_limits<uint256_t>::max() - delta >= balance,
        "balance overflow");

    balance += delta;
}

void State::subtract_from_balance(
    Address const &asset, Address const &holder, uint256_t const &delta)
{
    auto &balance = current_account_state(holder).balances_[asset];

    SUSU_ASSERT_THROW(delta <= balance, "balance underflow");

    balance -= delta;
}

void State::store_log(Log const &log)
{
    logs_.current(version_).push_back(log);
}

std::vector<Log> const &State::logs() const
{
    return logs_.recent();
}

SUSU_NAMESPACE_END
