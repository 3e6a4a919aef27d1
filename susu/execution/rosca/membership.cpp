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

SUSU_ROSCA_NAMESPACE_BEGIN

Result<void>
RoscaContract::join_circle(Proof const &member, uint64_t const circle_id)
{
    auto circle = vars.circle(circle_id);
    if (SUSU_UNLIKELY(!circle.exists())) {
        return RoscaError::CircleNotFound;
    }
    BOOST_OUTCOME_TRY(auto const caller, authenticate(member));
    if (SUSU_UNLIKELY(circle.has_flag(CircleFlagDissolved))) {
        return RoscaError::AlreadyDissolved;
    }
    // the queue is a fixed permutation of the roster once built
    if (SUSU_UNLIKELY(circle.has_flag(CircleFlagFinalized))) {
        return RoscaError::InvalidCircleState;
    }
    if (SUSU_UNLIKELY(find_member(circle_id, caller).has_value())) {
        return RoscaError::AlreadyJoined;
    }

    auto members = circle.members();
    uint64_t const count = members.length();
    if (SUSU_UNLIKELY(count >= circle.terms().load().max_members.native())) {
        return RoscaError::MaxMembersReached;
    }

    members.push(MemberSlot{
        .address = caller,
        .status = static_cast<uint8_t>(MemberStatus::Active),
        .contribution_count = 0,
        .last_contribution_time = 0,
        .contributions_paid = uint256_t{0},
        .payouts_received = uint256_t{0}});
    vars.member_index(circle_id, caller).store(count + 1);

    LOG_DEBUG("{} joined circle {} at position {}", caller, circle_id, count);
    return outcome::success();
}

Result<void> RoscaContract::kick_member(
    Proof const &admin, uint64_t const circle_id, Address const &member,
    uint256_t const &penalty)
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

    // removing a paid member would desynchronize the queue and the payout
    // flags of the running cycle
    uint64_t const paid_bits =
        circle.bitmaps().load().has_received_payout.native();
    if (SUSU_UNLIKELY(test_bit(paid_bits, index))) {
        return RoscaError::InvalidCircleState;
    }

    auto const slot = circle.members().get(index).load();
    uint256_t const total = net_position(slot);
    if (SUSU_UNLIKELY(penalty > total)) {
        return RoscaError::PenaltyExceedsContribution;
    }
    uint256_t const refund = total - penalty;

    BOOST_OUTCOME_TRY(debit_custody(circle_id, circle, total));

    auto const config = vars.load_protocol_config();
    if (!config.treasury.has_value()) {
        BOOST_OUTCOME_TRY(credit(circle.reserve_balance(), penalty));
    }

    bool const was_complete = is_cycle_complete(circle);
    remove_member_at(circle_id, circle, index);
    evaluate_dissolution(circle_id, circle);
    evaluate_penalty_proposal(circle_id, circle);

    emit_kicked_event(circle_id, member, refund, penalty);
    emit_if_cycle_closed(circle_id, circle, was_complete);
    LOG_INFO(
        "circle {} kicked {}, refund {} penalty {}",
        circle_id,
        member,
        refund,
        penalty);

    Address const token = circle.token().load();
    BOOST_OUTCOME_TRY(send(token, member, refund));
    if (config.treasury.has_value()) {
        BOOST_OUTCOME_TRY(send(token, config.treasury.value(), penalty));
    }
    return outcome::success();
}

Result<void> RoscaContract::swap_in_place(
    uint64_t const circle_id, Circle &circle, Address const &old_member,
    Address const &new_member)
{
    if (SUSU_UNLIKELY(circle.has_flag(CircleFlagDissolved))) {
        return RoscaError::AlreadyDissolved;
    }
    BOOST_OUTCOME_TRY(
        auto const index,
        require_member(circle_id, old_member, RoscaError::MemberNotFound));
    if (new_member == old_member) {
        return outcome::success();
    }
    if (SUSU_UNLIKELY(new_member == Address{})) {
        return RoscaError::Unauthorized;
    }
    if (SUSU_UNLIKELY(find_member(circle_id, new_member).has_value())) {
        return RoscaError::MemberAlreadyExists;
    }

    // the incoming identity inherits the seat together with its ledger
    auto slot = circle.members().get(index).load();
    slot.address = new_member;
    replace_member_at(circle_id, circle, index, slot);

    auto af = circle.admin_flags().load();
    if (af.admin == old_member) {
        af.admin = new_member;
        circle.admin_flags().store(af);
    }

    LOG_INFO(
        "circle {} swapped {} for {} at position {}",
        circle_id,
        old_member,
        new_member,
        index);
    return outcome::success();
}

Result<void> RoscaContract::swap_member(
    Proof const &old_member, Proof const &new_member, uint64_t const circle_id)
{
    auto circle = vars.circle(circle_id);
    if (SUSU_UNLIKELY(!circle.exists())) {
        return RoscaError::CircleNotFound;
    }
    BOOST_OUTCOME_TRY(auto const from, authenticate(old_member));
    BOOST_OUTCOME_TRY(auto const to, authenticate(new_member));
    return swap_in_place(circle_id, circle, from, to);
}

Result<void> RoscaContract::swap_member_by_admin(
    Proof const &admin, uint64_t const circle_id, Address const &old_member,
    Address const &new_member)
{
    auto circle = vars.circle(circle_id);
    if (SUSU_UNLIKELY(!circle.exists())) {
        return RoscaError::CircleNotFound;
    }
    BOOST_OUTCOME_TRY(require_circle_admin(circle, admin));
    return swap_in_place(circle_id, circle, old_member, new_member);
}

Result<void> RoscaContract::eject_member(
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
        return RoscaError::InvalidCircleState;
    }
    bool const was_complete = is_cycle_complete(circle);
    slot.status = static_cast<uint8_t>(MemberStatus::Ejected);
    var.store(slot);

    auto bitmaps = circle.bitmaps().load();
    bitmaps.dissolution_votes =
        bitmaps.dissolution_votes.native() & ~bit_of(index);
    bitmaps.proposal_votes = bitmaps.proposal_votes.native() & ~bit_of(index);
    circle.bitmaps().store(bitmaps);

    // a smaller electorate can carry a pending vote over the line
    evaluate_dissolution(circle_id, circle);
    evaluate_penalty_proposal(circle_id, circle);
    emit_if_cycle_closed(circle_id, circle, was_complete);

    LOG_INFO("circle {} ejected {}", circle_id, member);
    return outcome::success();
}

Result<void>
RoscaContract::request_exit(Proof const &member, uint64_t const circle_id)
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
            slot.status.native() !=
            static_cast<uint8_t>(MemberStatus::Active))) {
        return RoscaError::InvalidCircleState;
    }
    slot.status = static_cast<uint8_t>(MemberStatus::AwaitingReplacement);
    var.store(slot);

    LOG_DEBUG("{} requested exit from circle {}", caller, circle_id);
    return outcome::success();
}

Result<void> RoscaContract::fill_vacancy(
    Proof const &new_member, uint64_t const circle_id, Address const &exiting)
{
    auto circle = vars.circle(circle_id);
    if (SUSU_UNLIKELY(!circle.exists())) {
        return RoscaError::CircleNotFound;
    }
    BOOST_OUTCOME_TRY(auto const caller, authenticate(new_member));
    if (SUSU_UNLIKELY(circle.has_flag(CircleFlagDissolved))) {
        return RoscaError::AlreadyDissolved;
    }
    BOOST_OUTCOME_TRY(
        auto const index,
        require_member(circle_id, exiting, RoscaError::MemberNotFound));

    auto const old_slot = circle.members().get(index).load();
    if (SUSU_UNLIKELY(
            old_slot.status.native() !=
            static_cast<uint8_t>(MemberStatus::AwaitingReplacement))) {
        return RoscaError::InvalidCircleState;
    }
    if (SUSU_UNLIKELY(find_member(circle_id, caller).has_value())) {
        return RoscaError::AlreadyJoined;
    }

    uint256_t const refund = net_position(old_slot);
    BOOST_OUTCOME_TRY(debit_custody(circle_id, circle, refund));

    replace_member_at(
        circle_id,
        circle,
        index,
        MemberSlot{
            .address = caller,
            .status = static_cast<uint8_t>(MemberStatus::Active),
            .contribution_count = 0,
            .last_contribution_time = 0,
            .contributions_paid = uint256_t{0},
            .payouts_received = uint256_t{0}});

    auto af = circle.admin_flags().load();
    if (af.admin == exiting) {
        af.admin = caller;
        circle.admin_flags().store(af);
    }

    LOG_INFO(
        "circle {} seat {} passed from {} to {}, refund {}",
        circle_id,
        index,
        exiting,
        caller,
        refund);

    return send(circle.token().load(), exiting, refund);
}

SUSU_ROSCA_NAMESPACE_END
