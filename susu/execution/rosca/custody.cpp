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
#include <susu/execution/core/address.hpp>
#include <susu/execution/core/contract/checked_math.hpp>
#include <susu/execution/core/fmt/address_fmt.hpp>
#include <susu/execution/core/fmt/int_fmt.hpp>
#include <susu/execution/rosca/rosca_contract.hpp>
#include <susu/execution/state/state.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

SUSU_ROSCA_NAMESPACE_BEGIN

Result<uint256_t>
RoscaContract::withdraw_pro_rata(Proof const &member, uint64_t const circle_id)
{
    auto circle = vars.circle(circle_id);
    if (SUSU_UNLIKELY(!circle.exists())) {
        return RoscaError::CircleNotFound;
    }
    BOOST_OUTCOME_TRY(auto const caller, authenticate(member));
    if (SUSU_UNLIKELY(!circle.has_flag(CircleFlagDissolved))) {
        return RoscaError::NotDissolved;
    }
    BOOST_OUTCOME_TRY(
        auto const index,
        require_member(circle_id, caller, RoscaError::NotMember));

    auto var = circle.members().get(index);
    auto slot = var.load();
    uint256_t const amount = net_position(slot);
    if (amount == 0) {
        return uint256_t{0};
    }

    slot.contributions_paid = uint256_t{0};
    slot.payouts_received = uint256_t{0};
    var.store(slot);
    BOOST_OUTCOME_TRY(debit_custody(circle_id, circle, amount));

    LOG_INFO(
        "{} withdrew {} from dissolved circle {}", caller, amount, circle_id);
    BOOST_OUTCOME_TRY(send(circle.token().load(), caller, amount));
    return amount;
}

Result<void> RoscaContract::deposit(
    Proof const &user, Address const &token, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(auto const caller, authenticate(user));
    if (SUSU_UNLIKELY(amount == 0)) {
        return RoscaError::InvalidContribution;
    }

    BOOST_OUTCOME_TRY(credit(vars.user_balance(token, caller), amount));
    return host_.ledger.transfer(token, caller, SUSU_CA, amount);
}

Result<uint256_t>
RoscaContract::emergency_withdraw(Proof const &user, Address const &token)
{
    BOOST_OUTCOME_TRY(auto const caller, authenticate(user));

    uint64_t const now = host_.clock.now();
    uint64_t const last_active = vars.last_active_timestamp.load().native();
    if (SUSU_UNLIKELY(
            now <= saturating_add(last_active, EMERGENCY_WITHDRAWAL_DELAY))) {
        return RoscaError::EmergencyWithdrawalNotAvailable;
    }

    auto balance = vars.user_balance(token, caller);
    uint256_t const amount = balance.load().native();
    balance.clear();

    LOG_WARNING(
        "emergency withdrawal of {} by {}, protocol idle since {}",
        amount,
        caller,
        last_active);
    BOOST_OUTCOME_TRY(send(token, caller, amount));
    return amount;
}

SUSU_ROSCA_NAMESPACE_END
