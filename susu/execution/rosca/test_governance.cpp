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

#include <susu/core/int.hpp>
#include <susu/execution/core/address.hpp>
#include <susu/execution/core/fmt/address_fmt.hpp> // NOLINT
#include <susu/execution/core/fmt/int_fmt.hpp> // NOLINT
#include <susu/execution/rosca/rosca_contract.hpp>
#include <susu/execution/rosca/test_rosca_fixture.hpp>
#include <susu/execution/rosca/util/constants.hpp>
#include <susu/execution/rosca/util/rosca_error.hpp>

#include <gtest/gtest.h>

using namespace susu;
using namespace susu::rosca;
using namespace susu::rosca::test;

struct Governance : public RoscaTest
{
    bool dissolved(uint64_t const id)
    {
        return contract.get_circle(id).value().is_dissolved;
    }

    Result<void> propose_fee(
        Address const &who, uint64_t const id, uint32_t const bps)
    {
        return call([&] {
            return contract.propose_penalty_change(proof(who), id, bps);
        });
    }

    Result<void> vote_fee(Address const &who, uint64_t const id)
    {
        return call(
            [&] { return contract.vote_penalty_change(proof(who), id); });
    }

    Result<uint256_t> withdraw(Address const &who, uint64_t const id)
    {
        return call(
            [&] { return contract.withdraw_pro_rata(proof(who), id); });
    }
};

TEST_F(Governance, dissolution_needs_strict_majority)
{
    auto const id = setup_circle({ALICE, BOB, CAROL, DAVE, ERIN}, 100);

    EXPECT_FALSE(vote_dissolve(ALICE, id).has_error());
    EXPECT_FALSE(vote_dissolve(BOB, id).has_error());
    // 2 * 2 = 4 is not more than 5
    EXPECT_FALSE(dissolved(id));
    EXPECT_EQ(contract.get_circle(id).value().dissolution_votes, 2);

    auto const logs_before = state.logs().size();
    EXPECT_FALSE(vote_dissolve(CAROL, id).has_error());
    EXPECT_TRUE(dissolved(id));
    EXPECT_EQ(state.logs().size(), logs_before + 1);

    EXPECT_EQ(vote_dissolve(DAVE, id).assume_error(), RoscaError::AlreadyDissolved);
    EXPECT_EQ(contribute(ALICE, id).assume_error(), RoscaError::AlreadyDissolved);
}

TEST_F(Governance, vote_once)
{
    auto const id = setup_circle({ALICE, BOB, CAROL}, 100);
    EXPECT_FALSE(vote_dissolve(ALICE, id).has_error());
    EXPECT_EQ(vote_dissolve(ALICE, id).assume_error(), RoscaError::AlreadyVoted);
    EXPECT_EQ(vote_dissolve(FRANK, id).assume_error(), RoscaError::NotMember);
}

TEST_F(Governance, propose_counts_as_vote)
{
    auto const id = setup_circle({ALICE, BOB, CAROL}, 100);
    auto const propose = [&](Address const &who) {
        return call(
            [&] { return contract.propose_dissolution(proof(who), id); });
    };

    EXPECT_FALSE(propose(ALICE).has_error());
    EXPECT_FALSE(propose(ALICE).has_error());
    EXPECT_EQ(contract.get_circle(id).value().dissolution_votes, 1);
    EXPECT_EQ(vote_dissolve(ALICE, id).assume_error(), RoscaError::AlreadyVoted);

    EXPECT_FALSE(vote_dissolve(BOB, id).has_error());
    EXPECT_TRUE(dissolved(id));
}

TEST_F(Governance, ejection_can_complete_quorum)
{
    auto const id = setup_circle({ALICE, BOB, CAROL, DAVE}, 100);
    EXPECT_FALSE(vote_dissolve(ALICE, id).has_error());
    EXPECT_FALSE(vote_dissolve(BOB, id).has_error());
    EXPECT_FALSE(dissolved(id));

    EXPECT_FALSE(call([&] {
                     return contract.eject_member(proof(ADMIN), id, DAVE);
                 }).has_error());
    EXPECT_TRUE(dissolved(id));
}

TEST_F(Governance, kick_can_complete_quorum)
{
    auto const id = setup_circle({ALICE, BOB, CAROL, DAVE}, 100);
    EXPECT_FALSE(vote_dissolve(ALICE, id).has_error());
    EXPECT_FALSE(vote_dissolve(BOB, id).has_error());

    EXPECT_FALSE(call([&] {
                     return contract.kick_member(proof(ADMIN), id, DAVE, 0);
                 }).has_error());
    EXPECT_TRUE(dissolved(id));
}

TEST_F(Governance, kicked_voter_loses_vote)
{
    auto const id = setup_circle({ALICE, BOB, CAROL, DAVE, ERIN}, 100);
    EXPECT_FALSE(vote_dissolve(ALICE, id).has_error());
    EXPECT_FALSE(vote_dissolve(ERIN, id).has_error());

    EXPECT_FALSE(call([&] {
                     return contract.kick_member(proof(ADMIN), id, ERIN, 0);
                 }).has_error());
    // one vote left out of four members
    EXPECT_EQ(contract.get_circle(id).value().dissolution_votes, 1);
    EXPECT_FALSE(vote_dissolve(BOB, id).has_error());
    EXPECT_FALSE(dissolved(id));
    EXPECT_FALSE(vote_dissolve(CAROL, id).has_error());
    EXPECT_TRUE(dissolved(id));
}

TEST_F(Governance, late_fee_proposal)
{
    auto const created = create(ADMIN, 100, false, 10, 100);
    ASSERT_FALSE(created.has_error());
    auto const id = created.value();
    for (auto const &m : {ALICE, BOB, CAROL}) {
        ASSERT_FALSE(join(m, id).has_error());
    }

    EXPECT_EQ(vote_fee(BOB, id).assume_error(), RoscaError::NoActiveProposal);
    EXPECT_EQ(
        propose_fee(ALICE, id, 10'001).assume_error(),
        RoscaError::InvalidFeeConfig);

    EXPECT_FALSE(propose_fee(ALICE, id, 500).has_error());
    auto info = contract.get_circle(id).value();
    EXPECT_EQ(info.proposed_late_fee_bps, 500);
    EXPECT_EQ(info.proposal_votes, 1);
    EXPECT_EQ(info.late_fee_bps, 100);

    EXPECT_EQ(vote_fee(ALICE, id).assume_error(), RoscaError::AlreadyVoted);
    EXPECT_FALSE(vote_fee(BOB, id).has_error());

    info = contract.get_circle(id).value();
    EXPECT_EQ(info.late_fee_bps, 500);
    EXPECT_FALSE(info.proposed_late_fee_bps.has_value());
    EXPECT_EQ(info.proposal_votes, 0);
    EXPECT_EQ(vote_fee(CAROL, id).assume_error(), RoscaError::NoActiveProposal);
}

TEST_F(Governance, new_proposal_restarts_tally)
{
    auto const id = setup_circle({ALICE, BOB, CAROL, DAVE, ERIN}, 100);
    EXPECT_FALSE(propose_fee(ALICE, id, 300).has_error());
    EXPECT_FALSE(vote_fee(BOB, id).has_error());
    EXPECT_FALSE(propose_fee(CAROL, id, 700).has_error());

    auto const info = contract.get_circle(id).value();
    EXPECT_EQ(info.proposed_late_fee_bps, 700);
    EXPECT_EQ(info.proposal_votes, 1);
    EXPECT_EQ(info.late_fee_bps, 0);
}

TEST_F(Governance, pro_rata_withdrawal)
{
    auto const id = setup_circle({ALICE, BOB, CAROL}, 100, 1, true);
    contribute_all(id, {ALICE, BOB, CAROL});
    ASSERT_FALSE(payout(id, ALICE).has_error());

    EXPECT_EQ(withdraw(BOB, id).assume_error(), RoscaError::NotDissolved);

    EXPECT_FALSE(vote_dissolve(ALICE, id).has_error());
    EXPECT_FALSE(vote_dissolve(BOB, id).has_error());
    ASSERT_TRUE(dissolved(id));
    EXPECT_EQ(payout(id, BOB).assume_error(), RoscaError::AlreadyDissolved);

    EXPECT_EQ(withdraw(FRANK, id).assume_error(), RoscaError::NotMember);

    // ALICE already received a full payout
    auto const alice = withdraw(ALICE, id);
    ASSERT_FALSE(alice.has_error());
    EXPECT_EQ(alice.value(), 0);

    auto const bob = withdraw(BOB, id);
    ASSERT_FALSE(bob.has_error());
    EXPECT_EQ(bob.value(), 100);
    EXPECT_EQ(balance(BOB), 100);

    auto const again = withdraw(BOB, id);
    ASSERT_FALSE(again.has_error());
    EXPECT_EQ(again.value(), 0);
    EXPECT_EQ(balance(BOB), 100);

    EXPECT_EQ(withdraw(CAROL, id).value(), 100);
    EXPECT_EQ(
        contract.vars.circle(id).custody_balance().load().native(), 0);
}
