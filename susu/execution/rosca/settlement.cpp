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
#include <susu/execution/rosca/util/bitset.hpp>
#include <susu/execution/state/state.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <utility>
#include <vector>

SUSU_ROSCA_NAMESPACE_BEGIN

Result<void>
RoscaContract::finalize_circle(Proof const &admin, uint64_t const circle_id)
{
    auto circle = vars.circle(circle_id);
    if (SUSU_UNLIKELY(!circle.exists())) {
        return RoscaError::CircleNotFound;
    }
    BOOST_OUTCOME_TRY(require_circle_admin(circle, admin));
    if (SUSU_UNLIKELY(circle.has_flag(CircleFlagDissolved))) {
        return RoscaError::AlreadyDissolved;
    }

    if (circle.has_flag(CircleFlagFinalized)) {
        return outcome::success();
    }

    std::vector<Address> roster;
    for (auto const &slot : circle.members().load_all()) {
        roster.push_back(slot.address);
    }
    if (SUSU_UNLIKELY(roster.empty())) {
        return RoscaError::InvalidCircleState;
    }

    if (circle.has_flag(CircleFlagRandomQueue)) {
        auto order = host_.shuffler.permute(roster);
        auto expected = roster;
        auto actual = order;
        std::sort(expected.begin(), expected.end());
        std::sort(actual.begin(), actual.end());
        if (SUSU_UNLIKELY(expected != actual)) {
            LOG_WARNING(
                "circle {} shuffler returned {} entries that are not a "
                "permutation of {} members",
                circle_id,
                order.size(),
                roster.size());
            return RoscaError::InvalidCircleState;
        }
        roster = std::move(order);
    }

    circle.payout_queue().store_all(roster);
    circle.set_flag(CircleFlagFinalized);
    LOG_INFO(
        "circle {} finalized with {} members, {} queue",
        circle_id,
        roster.size(),
        circle.has_flag(CircleFlagRandomQueue) ? "random" : "sequential");
    return outcome::success();
}

Result<void>
RoscaContract::contribute(Proof const &member, uint64_t const circle_id)
{
    auto circle = vars.circle(circle_id);
    if (SUSU_UNLIKELY(!circle.exists())) {
        return RoscaError::CircleNotFound;
    }
    BOOST_OUTCOME_TRY(auto const caller, authenticate(member));
    if (SUSU_UNLIKELY(circle.has_flag(CircleFlagDissolved))) {
        return RoscaError::AlreadyDissolved;
    }
    BOOST_OUTCOME_TRY(
        auto const index,
        require_member(circle_id, caller, RoscaError::NotMember));

    auto var = circle.members().get(index);
    auto slot = var.load();
    if (SUSU_UNLIKELY(
            slot.status.native() ==
            static_cast<uint8_t>(MemberStatus::Ejected))) {
        return RoscaError::MemberInactive;
    }

    uint64_t const now = host_.clock.now();
    auto const terms = circle.terms().load();
    auto cycle = circle.cycle().load();
    bool const is_late = now > cycle.deadline.native();

    BOOST_OUTCOME_TRY(
        auto const deposit,
        compute_deposit(
            circle.contribution().load().native(),
            terms.late_fee_bps.native(),
            terms.insurance_fee_bps.native(),
            is_late));

    BOOST_OUTCOME_TRY(credit(circle.custody_balance(), deposit.base));
    BOOST_OUTCOME_TRY(credit(circle.reserve_balance(), deposit.late_fee));
    BOOST_OUTCOME_TRY(
        credit(circle.insurance_balance(), deposit.insurance_fee));

    BOOST_OUTCOME_TRY(
        auto const paid,
        checked_add(slot.contributions_paid.native(), deposit.base));
    slot.contributions_paid = paid;
    slot.contribution_count = slot.contribution_count.native() + 1;
    slot.last_contribution_time = now;
    var.store(slot);

    // the window rolls forward on every deposit, late or not
    cycle.deadline = saturating_add(now, terms.cycle_duration.native());
    circle.cycle().store(cycle);

    emit_contributed_event(circle_id, caller, deposit);
    LOG_DEBUG(
        "circle {} contribution from {}: base {} late {} insurance {}",
        circle_id,
        caller,
        deposit.base,
        deposit.late_fee,
        deposit.insurance_fee);

    return host_.ledger.transfer(
        circle.token().load(), caller, SUSU_CA, deposit.total);
}

Result<void> RoscaContract::process_payout(
    Proof const &admin, uint64_t const circle_id, Address const &recipient)
{
    auto circle = vars.circle(circle_id);
    if (SUSU_UNLIKELY(!circle.exists())) {
        return RoscaError::CircleNotFound;
    }
    BOOST_OUTCOME_TRY(require_circle_admin(circle, admin));
    if (SUSU_UNLIKELY(circle.has_flag(CircleFlagDissolved))) {
        return RoscaError::AlreadyDissolved;
    }
    if (SUSU_UNLIKELY(!circle.has_flag(CircleFlagFinalized))) {
        return RoscaError::CircleNotFinalized;
    }
    BOOST_OUTCOME_TRY(
        auto const index,
        require_member(circle_id, recipient, RoscaError::NotMember));

    auto var = circle.members().get(index);
    auto slot = var.load();
    if (SUSU_UNLIKELY(
            slot.status.native() ==
            static_cast<uint8_t>(MemberStatus::Ejected))) {
        return RoscaError::MemberInactive;
    }
    auto bitmaps = circle.bitmaps().load();
    if (SUSU_UNLIKELY(
            test_bit(bitmaps.has_received_payout.native(), index))) {
        return RoscaError::PayoutAlreadyReceived;
    }

    // checks
    uint256_t const gross = circle.contribution().load().native();
    auto const config = vars.load_protocol_config();
    BOOST_OUTCOME_TRY(auto const split, split_protocol_fee(gross, config.fee_bps));
    if (SUSU_UNLIKELY(split.fee != 0 && !config.treasury.has_value())) {
        return RoscaError::InvalidFeeConfig;
    }

    // effects
    BOOST_OUTCOME_TRY(debit_custody(circle_id, circle, gross));

    bitmaps.has_received_payout =
        bitmaps.has_received_payout.native() | bit_of(index);
    circle.bitmaps().store(bitmaps);

    auto cycle = circle.cycle().load();
    cycle.current_payout_index = cycle.current_payout_index.native() + 1;
    circle.cycle().store(cycle);

    BOOST_OUTCOME_TRY(credit(circle.total_volume_distributed(), gross));

    BOOST_OUTCOME_TRY(
        auto const received,
        checked_add(slot.payouts_received.native(), gross));
    slot.payouts_received = received;
    var.store(slot);

    emit_payout_event(circle_id, recipient, split);
    if (is_cycle_complete(circle)) {
        auto const total = circle.total_volume_distributed().load();
        emit_cycle_completed_event(circle_id, total);
        LOG_INFO(
            "circle {} completed cycle {}, distributed {}",
            circle_id,
            cycle.number.native(),
            total.native());
    }

    // interactions
    Address const token = circle.token().load();
    BOOST_OUTCOME_TRY(send(token, recipient, split.net));
    if (split.fee != 0) {
        BOOST_OUTCOME_TRY(send(token, config.treasury.value(), split.fee));
    }
    return outcome::success();
}

Result<void>
RoscaContract::rollover_group(Proof const &admin, uint64_t const circle_id)
{
    auto circle = vars.circle(circle_id);
    if (SUSU_UNLIKELY(!circle.exists())) {
        return RoscaError::CircleNotFound;
    }
    BOOST_OUTCOME_TRY(require_circle_admin(circle, admin));
    if (SUSU_UNLIKELY(circle.has_flag(CircleFlagDissolved))) {
        return RoscaError::AlreadyDissolved;
    }
    if (SUSU_UNLIKELY(!circle.has_flag(CircleFlagFinalized))) {
        return RoscaError::CircleNotFinalized;
    }
    if (SUSU_UNLIKELY(!is_cycle_complete(circle))) {
        return RoscaError::CycleNotComplete;
    }

    auto cycle = circle.cycle().load();
    cycle.number = cycle.number.native() + 1;
    cycle.current_payout_index = 0;
    circle.cycle().store(cycle);
    circle.total_volume_distributed().clear();

    auto bitmaps = circle.bitmaps().load();
    bitmaps.has_received_payout = 0;
    circle.bitmaps().store(bitmaps);
    circle.clear_flag(CircleFlagInsuranceUsed);

    emit_group_rollover_event(circle_id, cycle.number);
    LOG_INFO("circle {} rolled over to cycle {}", circle_id, cycle.number.native());
    return outcome::success();
}

Result<void> RoscaContract::trigger_insurance_coverage(
    Proof const &admin, uint64_t const circle_id, Address const &member)
{
    auto circle = vars.circle(circle_id);
    if (SUSU_UNLIKELY(!circle.exists())) {
        return RoscaError::CircleNotFound;
    }
    BOOST_OUTCOME_TRY(require_circle_admin(circle, admin));
    if (SUSU_UNLIKELY(circle.has_flag(CircleFlagDissolved))) {
        return RoscaError::AlreadyDissolved;
    }
    BOOST_OUTCOME_TRY(
        auto const index,
        require_member(circle_id, member, RoscaError::MemberNotFound));

    auto var = circle.members().get(index);
    auto slot = var.load();
    if (SUSU_UNLIKELY(
            slot.status.native() ==
            static_cast<uint8_t>(MemberStatus::Ejected))) {
        return RoscaError::MemberInactive;
    }
    if (SUSU_UNLIKELY(circle.has_flag(CircleFlagInsuranceUsed))) {
        return RoscaError::InsuranceAlreadyUsed;
    }

    uint256_t const contribution = circle.contribution().load().native();
    uint256_t const pool = circle.insurance_balance().load().native();
    if (SUSU_UNLIKELY(pool < contribution)) {
        return RoscaError::InsufficientBalance;
    }

    circle.insurance_balance().store(pool - contribution);
    BOOST_OUTCOME_TRY(credit(circle.custody_balance(), contribution));

    BOOST_OUTCOME_TRY(
        auto const paid,
        checked_add(slot.contributions_paid.native(), contribution));
    slot.contributions_paid = paid;
    slot.contribution_count = slot.contribution_count.native() + 1;
    var.store(slot);

    circle.set_flag(CircleFlagInsuranceUsed);
    LOG_INFO(
        "circle {} insurance covered {} for {}", circle_id, contribution, member);
    return outcome::success();
}

SUSU_ROSCA_NAMESPACE_END
