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
#include <susu/execution/core/fmt/address_fmt.hpp>
#include <susu/execution/rosca/rosca_contract.hpp>
#include <susu/execution/rosca/util/bitset.hpp>
#include <susu/execution/state/state.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

SUSU_ROSCA_ANONYMOUS_NAMESPACE_BEGIN

bool is_ejected(MemberSlot const &slot)
{
    return slot.status.native() == static_cast<uint8_t>(MemberStatus::Ejected);
}

SUSU_ROSCA_ANONYMOUS_NAMESPACE_END

SUSU_ROSCA_NAMESPACE_BEGIN

Result<void>
RoscaContract::propose_dissolution(Proof const &member, uint64_t const circle_id)
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
    if (SUSU_UNLIKELY(is_ejected(circle.members().get(index).load()))) {
        return RoscaError::MemberInactive;
    }

    // proposing counts as the proposer's vote; proposing twice is harmless
    auto bitmaps = circle.bitmaps().load();
    bitmaps.dissolution_votes = bitmaps.dissolution_votes.native() | bit_of(index);
    circle.bitmaps().store(bitmaps);

    LOG_DEBUG("{} proposed dissolving circle {}", caller, circle_id);
    evaluate_dissolution(circle_id, circle);
    return outcome::success();
}

Result<void>
RoscaContract::vote_dissolve(Proof const &member, uint64_t const circle_id)
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
    if (SUSU_UNLIKELY(is_ejected(circle.members().get(index).load()))) {
        return RoscaError::MemberInactive;
    }

    auto bitmaps = circle.bitmaps().load();
    if (SUSU_UNLIKELY(test_bit(bitmaps.dissolution_votes.native(), index))) {
        return RoscaError::AlreadyVoted;
    }
    bitmaps.dissolution_votes = bitmaps.dissolution_votes.native() | bit_of(index);
    circle.bitmaps().store(bitmaps);

    evaluate_dissolution(circle_id, circle);
    return outcome::success();
}

Result<void> RoscaContract::propose_penalty_change(
    Proof const &member, uint64_t const circle_id, uint32_t const new_bps)
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
    if (SUSU_UNLIKELY(is_ejected(circle.members().get(index).load()))) {
        return RoscaError::MemberInactive;
    }
    if (SUSU_UNLIKELY(new_bps > MAX_BASIS_POINTS)) {
        return RoscaError::InvalidFeeConfig;
    }

    // a new proposal replaces any open one and restarts the tally
    auto terms = circle.terms().load();
    terms.proposed_late_fee_bps = new_bps;
    circle.terms().store(terms);

    auto bitmaps = circle.bitmaps().load();
    bitmaps.proposal_votes = bit_of(index);
    circle.bitmaps().store(bitmaps);
    circle.set_flag(CircleFlagPenaltyProposal);

    LOG_INFO(
        "{} proposed late fee {} bps for circle {}", caller, new_bps, circle_id);
    evaluate_penalty_proposal(circle_id, circle);
    return outcome::success();
}

Result<void>
RoscaContract::vote_penalty_change(Proof const &member, uint64_t const circle_id)
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
    if (SUSU_UNLIKELY(is_ejected(circle.members().get(index).load()))) {
        return RoscaError::MemberInactive;
    }
    if (SUSU_UNLIKELY(!circle.has_flag(CircleFlagPenaltyProposal))) {
        return RoscaError::NoActiveProposal;
    }

    auto bitmaps = circle.bitmaps().load();
    if (SUSU_UNLIKELY(test_bit(bitmaps.proposal_votes.native(), index))) {
        return RoscaError::AlreadyVoted;
    }
    bitmaps.proposal_votes = bitmaps.proposal_votes.native() | bit_of(index);
    circle.bitmaps().store(bitmaps);

    evaluate_penalty_proposal(circle_id, circle);
    return outcome::success();
}

SUSU_ROSCA_NAMESPACE_END
