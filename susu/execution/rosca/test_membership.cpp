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
#include <susu/execution/core/contract/abi_encode.hpp>
#include <susu/execution/core/fmt/address_fmt.hpp> // NOLINT
#include <susu/execution/core/fmt/int_fmt.hpp> // NOLINT
#include <susu/execution/rosca/rosca_contract.hpp>
#include <susu/execution/rosca/test_rosca_fixture.hpp>
#include <susu/execution/rosca/util/constants.hpp>
#include <susu/execution/rosca/util/rosca_error.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <vector>

using namespace susu;
using namespace susu::rosca;
using namespace susu::rosca::test;

struct Membership : public RoscaTest
{
    Result<void> kick(
        uint64_t const id, Address const &member, uint256_t const &penalty,
        Address const &admin = ADMIN)
    {
        return call([&] {
            return contract.kick_member(proof(admin), id, member, penalty);
        });
    }

    Result<void> eject(uint64_t const id, Address const &member)
    {
        return call(
            [&] { return contract.eject_member(proof(ADMIN), id, member); });
    }

    uint256_t custody(uint64_t const id)
    {
        return contract.vars.circle(id).custody_balance().load().native();
    }
};

TEST_F(Membership, join_in_order)
{
    auto const id = setup_circle({ALICE, BOB, CAROL}, 100);

    auto const members = contract.get_members(id);
    ASSERT_FALSE(members.has_error());
    EXPECT_EQ(members.value(), (std::vector<Address>{ALICE, BOB, CAROL}));

    auto const bob = contract.get_member(id, BOB);
    ASSERT_FALSE(bob.has_error());
    EXPECT_EQ(bob.value().index, 1);
    EXPECT_EQ(bob.value().status, MemberStatus::Active);
    EXPECT_EQ(bob.value().contributions_paid, 0);
    EXPECT_EQ(bob.value().contribution_count, 0);
    EXPECT_FALSE(bob.value().has_received_payout);
}

TEST_F(Membership, join_twice)
{
    auto const id = setup_circle({ALICE}, 100);
    EXPECT_EQ(join(ALICE, id).assume_error(), RoscaError::AlreadyJoined);
}

TEST_F(Membership, join_full_circle)
{
    auto const id = create(ADMIN, 100, false, 2);
    ASSERT_FALSE(id.has_error());
    EXPECT_FALSE(join(ALICE, id.value()).has_error());
    EXPECT_FALSE(join(BOB, id.value()).has_error());
    EXPECT_EQ(
        join(CAROL, id.value()).assume_error(), RoscaError::MaxMembersReached);
}

TEST_F(Membership, join_after_finalize)
{
    auto const id = setup_circle({ALICE, BOB}, 100, 1, true);
    EXPECT_EQ(join(CAROL, id).assume_error(), RoscaError::InvalidCircleState);
}

TEST_F(Membership, join_with_forged_proof)
{
    auto const id = setup_circle({}, 100);
    auto const res =
        call([&] { return contract.join_circle(forged(ALICE), id); });
    EXPECT_EQ(res.assume_error(), RoscaError::Unauthorized);
}

TEST_F(Membership, kick_refunds_net_of_penalty)
{
    auto const id = setup_circle({ALICE, BOB, CAROL}, 100);
    contribute_all(id, {ALICE, BOB, CAROL});
    EXPECT_EQ(custody(id), 300);
    EXPECT_EQ(balance(BOB), 0);

    EXPECT_EQ(kick(id, BOB, 30, ALICE).assume_error(), RoscaError::Unauthorized);
    EXPECT_EQ(
        kick(id, BOB, 101).assume_error(),
        RoscaError::PenaltyExceedsContribution);
    EXPECT_EQ(kick(id, DAVE, 0).assume_error(), RoscaError::MemberNotFound);

    EXPECT_FALSE(kick(id, BOB, 30).has_error());
    EXPECT_EQ(balance(BOB), 70);
    EXPECT_EQ(custody(id), 200);
    // no treasury configured, the penalty stays with the circle
    EXPECT_EQ(
        contract.vars.circle(id).reserve_balance().load().native(), 30);

    EXPECT_EQ(
        contract.get_members(id).value(),
        (std::vector<Address>{ALICE, CAROL}));
    EXPECT_EQ(contract.get_member(id, CAROL).value().index, 1);
    EXPECT_EQ(
        contract.get_member(id, BOB).assume_error(),
        RoscaError::MemberNotFound);

    auto const &kicked = state.logs().back();
    ASSERT_EQ(kicked.topics.size(), 3);
    EXPECT_EQ(kicked.topics[2], abi_encode_address(BOB));
}

TEST_F(Membership, kick_penalty_to_treasury)
{
    ASSERT_FALSE(
        call([&] { return contract.initialize(proof(ADMIN)); }).has_error());
    ASSERT_FALSE(call([&] {
                     return contract.set_protocol_fee(
                         proof(ADMIN), 0, TREASURY);
                 }).has_error());

    auto const id = setup_circle({ALICE, BOB}, 100);
    contribute_all(id, {ALICE, BOB});

    EXPECT_FALSE(kick(id, BOB, 40).has_error());
    EXPECT_EQ(balance(BOB), 60);
    EXPECT_EQ(balance(TREASURY), 40);
    EXPECT_EQ(contract.vars.circle(id).reserve_balance().load().native(), 0);
    EXPECT_EQ(custody(id), 100);
}

TEST_F(Membership, kick_paid_member_refused)
{
    auto const id = setup_circle({ALICE, BOB, CAROL}, 100, 1, true);
    contribute_all(id, {ALICE, BOB, CAROL});
    ASSERT_FALSE(payout(id, ALICE).has_error());

    EXPECT_EQ(kick(id, ALICE, 0).assume_error(), RoscaError::InvalidCircleState);
}

TEST_F(Membership, kick_compacts_queue_and_flags)
{
    auto const id = setup_circle({ALICE, BOB, CAROL}, 100, 1, true);
    contribute_all(id, {ALICE, BOB, CAROL});
    ASSERT_FALSE(payout(id, CAROL).has_error());

    EXPECT_FALSE(kick(id, BOB, 0).has_error());
    EXPECT_EQ(
        contract.get_payout_queue(id).value(),
        (std::vector<Address>{ALICE, CAROL}));
    EXPECT_EQ(
        contract.get_payout_status(id).value(),
        (std::vector<bool>{false, true}));
    EXPECT_EQ(
        contract.get_member(id, CAROL).value().has_received_payout, true);
}

TEST_F(Membership, swap_keeps_position_and_ledger)
{
    auto const id = setup_circle({ALICE, BOB, CAROL}, 100, 1, true);
    contribute_all(id, {ALICE, BOB, CAROL});

    EXPECT_FALSE(call([&] {
                     return contract.swap_member(proof(BOB), proof(DAVE), id);
                 }).has_error());

    EXPECT_EQ(
        contract.get_payout_queue(id).value(),
        (std::vector<Address>{ALICE, DAVE, CAROL}));
    auto const dave = contract.get_member(id, DAVE);
    ASSERT_FALSE(dave.has_error());
    EXPECT_EQ(dave.value().index, 1);
    EXPECT_EQ(dave.value().contributions_paid, 100);
    EXPECT_EQ(
        contract.get_member(id, BOB).assume_error(),
        RoscaError::MemberNotFound);
}

TEST_F(Membership, swap_requires_both_parties)
{
    auto const id = setup_circle({ALICE, BOB}, 100);

    EXPECT_EQ(
        call([&] {
            return contract.swap_member(proof(BOB), forged(DAVE), id);
        }).assume_error(),
        RoscaError::Unauthorized);
    EXPECT_EQ(
        call([&] {
            return contract.swap_member(proof(ALICE), proof(BOB), id);
        }).assume_error(),
        RoscaError::MemberAlreadyExists);
    EXPECT_EQ(
        call([&] {
            return contract.swap_member(proof(CAROL), proof(DAVE), id);
        }).assume_error(),
        RoscaError::MemberNotFound);
}

TEST_F(Membership, swap_by_admin)
{
    auto const id = setup_circle({ALICE, BOB}, 100);

    EXPECT_EQ(
        call([&] {
            return contract.swap_member_by_admin(proof(BOB), id, ALICE, ERIN);
        }).assume_error(),
        RoscaError::Unauthorized);
    EXPECT_FALSE(call([&] {
                     return contract.swap_member_by_admin(
                         proof(ADMIN), id, ALICE, ERIN);
                 }).has_error());
    EXPECT_EQ(
        contract.get_members(id).value(), (std::vector<Address>{ERIN, BOB}));
}

TEST_F(Membership, swap_circle_admin_moves_admin_role)
{
    auto const created = create(ALICE, 100);
    ASSERT_FALSE(created.has_error());
    auto const id = created.value();
    ASSERT_FALSE(join(ALICE, id).has_error());

    EXPECT_FALSE(call([&] {
                     return contract.swap_member(proof(ALICE), proof(FRANK), id);
                 }).has_error());
    EXPECT_EQ(contract.get_circle(id).value().admin, FRANK);
}

TEST_F(Membership, ejected_member_is_inactive)
{
    auto const id = setup_circle({ALICE, BOB, CAROL}, 100, 1, true);

    EXPECT_FALSE(eject(id, BOB).has_error());
    EXPECT_EQ(
        contract.get_member(id, BOB).value().status, MemberStatus::Ejected);
    EXPECT_EQ(eject(id, BOB).assume_error(), RoscaError::InvalidCircleState);

    EXPECT_EQ(contribute(BOB, id).assume_error(), RoscaError::MemberInactive);
    contribute_all(id, {ALICE, CAROL});
    EXPECT_EQ(payout(id, BOB).assume_error(), RoscaError::MemberInactive);

    // the cycle completes without the ejected member
    EXPECT_FALSE(payout(id, ALICE).has_error());
    EXPECT_FALSE(payout(id, CAROL).has_error());
    EXPECT_FALSE(rollover(id).has_error());
}

TEST_F(Membership, finalized_queue_is_not_rebuilt)
{
    auto const id = setup_circle({ALICE, BOB}, 100, 1, true);

    EXPECT_FALSE(kick(id, ALICE, 0).has_error());
    EXPECT_FALSE(kick(id, BOB, 0).has_error());
    EXPECT_TRUE(contract.get_payout_queue(id).value().empty());
    EXPECT_TRUE(contract.get_circle(id).value().is_finalized);

    EXPECT_EQ(join(CAROL, id).assume_error(), RoscaError::InvalidCircleState);
    EXPECT_FALSE(finalize(id).has_error());
    EXPECT_TRUE(contract.get_payout_queue(id).value().empty());
    EXPECT_TRUE(contract.get_members(id).value().empty());
}

TEST_F(Membership, eject_last_unpaid_completes_cycle)
{
    auto const id = setup_circle({ALICE, BOB, CAROL}, 100, 1, true);
    contribute_all(id, {ALICE, BOB, CAROL});
    ASSERT_FALSE(payout(id, ALICE).has_error());
    ASSERT_FALSE(payout(id, BOB).has_error());
    auto const logs_before = state.logs().size();

    EXPECT_FALSE(eject(id, CAROL).has_error());

    ASSERT_EQ(state.logs().size(), logs_before + 1);
    auto const &completed = state.logs().back();
    ASSERT_EQ(completed.topics.size(), 2);
    EXPECT_EQ(completed.topics[1], abi_encode_uint(u64_be{id}));
    ASSERT_EQ(completed.data.size(), 32);
    EXPECT_EQ(intx::be::unsafe::load<uint256_t>(completed.data.data()), 200);

    EXPECT_FALSE(rollover(id).has_error());
}

TEST_F(Membership, kick_last_unpaid_completes_cycle)
{
    auto const id = setup_circle({ALICE, BOB, CAROL}, 100, 1, true);
    contribute_all(id, {ALICE, BOB, CAROL});
    ASSERT_FALSE(payout(id, ALICE).has_error());
    ASSERT_FALSE(payout(id, BOB).has_error());
    auto const logs_before = state.logs().size();

    EXPECT_FALSE(kick(id, CAROL, 0).has_error());
    EXPECT_EQ(balance(CAROL), 100);

    // Kicked, then CycleCompleted
    ASSERT_EQ(state.logs().size(), logs_before + 2);
    EXPECT_EQ(state.logs()[logs_before].topics.size(), 3);
    EXPECT_EQ(state.logs().back().topics.size(), 2);
    EXPECT_FALSE(rollover(id).has_error());
}

TEST_F(Membership, cycle_with_no_participants_never_completes)
{
    auto const id = setup_circle({ALICE, BOB}, 100, 1, true);
    auto const logs_before = state.logs().size();

    EXPECT_FALSE(eject(id, ALICE).has_error());
    EXPECT_FALSE(eject(id, BOB).has_error());

    EXPECT_EQ(state.logs().size(), logs_before);
    EXPECT_EQ(rollover(id).assume_error(), RoscaError::CycleNotComplete);
    EXPECT_EQ(contract.get_cycle_info(id).value().cycle_number, 1);
}

TEST_F(Membership, graceful_exit)
{
    auto const id = setup_circle({ALICE, BOB, CAROL}, 100, 1, true);
    contribute_all(id, {ALICE, BOB, CAROL});

    auto const fill = [&](Address const &who, Address const &exiting) {
        return call([&] {
            return contract.fill_vacancy(proof(who), id, exiting);
        });
    };

    EXPECT_EQ(fill(DAVE, BOB).assume_error(), RoscaError::InvalidCircleState);

    EXPECT_FALSE(
        call([&] { return contract.request_exit(proof(BOB), id); })
            .has_error());
    EXPECT_EQ(
        contract.get_member(id, BOB).value().status,
        MemberStatus::AwaitingReplacement);
    EXPECT_EQ(
        call([&] { return contract.request_exit(proof(BOB), id); })
            .assume_error(),
        RoscaError::InvalidCircleState);

    EXPECT_EQ(fill(CAROL, BOB).assume_error(), RoscaError::AlreadyJoined);

    EXPECT_FALSE(fill(DAVE, BOB).has_error());
    EXPECT_EQ(balance(BOB), 100);
    EXPECT_EQ(custody(id), 200);

    auto const dave = contract.get_member(id, DAVE);
    ASSERT_FALSE(dave.has_error());
    EXPECT_EQ(dave.value().index, 1);
    EXPECT_EQ(dave.value().status, MemberStatus::Active);
    EXPECT_EQ(dave.value().contributions_paid, 0);
    EXPECT_EQ(
        contract.get_payout_queue(id).value(),
        (std::vector<Address>{ALICE, DAVE, CAROL}));
    EXPECT_EQ(
        contract.get_member(id, BOB).assume_error(),
        RoscaError::MemberNotFound);
}
