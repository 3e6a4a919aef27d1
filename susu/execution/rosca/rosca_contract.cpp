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
#include <susu/execution/core/contract/abi_encode.hpp>
#include <susu/execution/core/contract/abi_signatures.hpp>
#include <susu/execution/core/contract/checked_math.hpp>
#include <susu/execution/core/contract/events.hpp>
#include <susu/execution/core/contract/mapping_slot.hpp>
#include <susu/execution/core/fmt/address_fmt.hpp>
#include <susu/execution/core/fmt/int_fmt.hpp>
#include <susu/execution/rosca/rosca_contract.hpp>
#include <susu/execution/rosca/util/bitset.hpp>
#include <susu/execution/state/state.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <optional>
#include <vector>

SUSU_ROSCA_NAMESPACE_BEGIN

RoscaContract::RoscaContract(State &state, Host &host)
    : state_{state}
    , host_{host}
    , vars{state}
{
}

ProtocolConfig RoscaContract::Variables::load_protocol_config() const
{
    return ProtocolConfig{
        .admin = admin.load_checked(),
        .fee_bps = fee_basis_points.load().native(),
        .treasury = treasury.load_checked()};
}

StorageVariable<u256_be> RoscaContract::Variables::user_balance(
    Address const &token, Address const &user) noexcept
{
    struct
    {
        Address token;
        Address user;
    } const key{.token = token, .user = user};

    return {
        state_,
        SUSU_CA,
        keccak_mapping_slot(
            NSUserBalance,
            byte_string_view{
                reinterpret_cast<unsigned char const *>(&key), sizeof(key)})};
}

/////////////
// Events //
/////////////
void RoscaContract::emit_log(Log const &log)
{
    state_.store_log(log);
}

void RoscaContract::emit_cycle_completed_event(
    u64_be const circle_id, u256_be const &total)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("CycleCompleted(uint64,uint256)");

    auto const event = EventBuilder(SUSU_CA, signature)
                           .add_topic(abi_encode_uint(circle_id))
                           .add_data(abi_encode_uint(total))
                           .build();
    emit_log(event);
}

void RoscaContract::emit_group_rollover_event(
    u64_be const circle_id, u64_be const cycle_number)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("GroupRollover(uint64,uint64)");

    auto const event = EventBuilder(SUSU_CA, signature)
                           .add_topic(abi_encode_uint(circle_id))
                           .add_data(abi_encode_uint(cycle_number))
                           .build();
    emit_log(event);
}

void RoscaContract::emit_payout_event(
    u64_be const circle_id, Address const &recipient, FeeSplit const &split)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("Payout(uint64,address,uint256,uint256)");

    auto const event = EventBuilder(SUSU_CA, signature)
                           .add_topic(abi_encode_uint(circle_id))
                           .add_topic(abi_encode_address(recipient))
                           .add_data(abi_encode_uint(u256_be{split.net}))
                           .add_data(abi_encode_uint(u256_be{split.fee}))
                           .build();
    emit_log(event);
}

void RoscaContract::emit_kicked_event(
    u64_be const circle_id, Address const &member, u256_be const &refund,
    u256_be const &penalty)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("Kicked(uint64,address,uint256,uint256)");

    auto const event = EventBuilder(SUSU_CA, signature)
                           .add_topic(abi_encode_uint(circle_id))
                           .add_topic(abi_encode_address(member))
                           .add_data(abi_encode_uint(refund))
                           .add_data(abi_encode_uint(penalty))
                           .build();
    emit_log(event);
}

void RoscaContract::emit_contributed_event(
    u64_be const circle_id, Address const &member,
    DepositBreakdown const &deposit)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "Contributed(uint64,address,uint256,uint256,uint256)");

    auto const event =
        EventBuilder(SUSU_CA, signature)
            .add_topic(abi_encode_uint(circle_id))
            .add_topic(abi_encode_address(member))
            .add_data(abi_encode_uint(u256_be{deposit.base}))
            .add_data(abi_encode_uint(u256_be{deposit.late_fee}))
            .add_data(abi_encode_uint(u256_be{deposit.insurance_fee}))
            .build();
    emit_log(event);
}

void RoscaContract::emit_circle_dissolved_event(u64_be const circle_id)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("CircleDissolved(uint64)");

    auto const event = EventBuilder(SUSU_CA, signature)
                           .add_topic(abi_encode_uint(circle_id))
                           .build();
    emit_log(event);
}

void RoscaContract::emit_late_fee_changed_event(
    u64_be const circle_id, u32_be const old_bps, u32_be const new_bps)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("LateFeeChanged(uint64,uint32,uint32)");

    auto const event = EventBuilder(SUSU_CA, signature)
                           .add_topic(abi_encode_uint(circle_id))
                           .add_data(abi_encode_uint(old_bps))
                           .add_data(abi_encode_uint(new_bps))
                           .build();
    emit_log(event);
}

//////////////
// Helpers //
//////////////

Result<Address> RoscaContract::authenticate(Proof const &proof)
{
    if (SUSU_UNLIKELY(
            proof.principal == Address{} ||
            !host_.authorizer.verify(proof))) {
        return RoscaError::Unauthorized;
    }
    return proof.principal;
}

Result<ProtocolConfig> RoscaContract::require_protocol_admin(Proof const &proof)
{
    BOOST_OUTCOME_TRY(auto const caller, authenticate(proof));
    auto const config = vars.load_protocol_config();
    if (SUSU_UNLIKELY(!config.admin.has_value())) {
        return RoscaError::NotInitialized;
    }
    if (SUSU_UNLIKELY(caller != config.admin.value())) {
        return RoscaError::Unauthorized;
    }
    return config;
}

Result<void>
RoscaContract::require_circle_admin(Circle &circle, Proof const &proof)
{
    BOOST_OUTCOME_TRY(auto const caller, authenticate(proof));
    if (SUSU_UNLIKELY(caller != circle.admin())) {
        return RoscaError::Unauthorized;
    }
    return outcome::success();
}

void RoscaContract::touch_last_active()
{
    vars.last_active_timestamp.store(host_.clock.now());
}

std::optional<uint64_t> RoscaContract::find_member(
    uint64_t const circle_id, Address const &member) noexcept
{
    auto const index = vars.member_index(circle_id, member).load().native();
    if (index == 0) {
        return std::nullopt;
    }
    return index - 1;
}

Result<uint64_t> RoscaContract::require_member(
    uint64_t const circle_id, Address const &member, RoscaError const error)
{
    auto const index = find_member(circle_id, member);
    if (SUSU_UNLIKELY(!index.has_value())) {
        return error;
    }
    return index.value();
}

uint64_t RoscaContract::participant_mask(Circle &circle) noexcept
{
    auto members = circle.members();
    uint64_t mask = 0;
    for (uint64_t i = 0; i < members.length(); ++i) {
        auto const status = members.get(i).load().status.native();
        if (status != static_cast<uint8_t>(MemberStatus::Ejected)) {
            mask |= bit_of(i);
        }
    }
    return mask;
}

bool RoscaContract::is_cycle_complete(Circle &circle) noexcept
{
    uint64_t const mask = participant_mask(circle);
    if (mask == 0) {
        return false;
    }
    uint64_t const paid = circle.bitmaps().load().has_received_payout.native();
    return (paid & mask) == mask;
}

// Emits CycleCompleted when a roster change, rather than a payout, leaves
// every remaining participant paid.
void RoscaContract::emit_if_cycle_closed(
    uint64_t const circle_id, Circle &circle, bool const was_complete)
{
    if (was_complete || !circle.has_flag(CircleFlagFinalized) ||
        circle.has_flag(CircleFlagDissolved) || !is_cycle_complete(circle)) {
        return;
    }
    auto const total = circle.total_volume_distributed().load();
    emit_cycle_completed_event(circle_id, total);
    LOG_INFO(
        "circle {} completed cycle {} after a roster change, distributed {}",
        circle_id,
        circle.cycle().load().number.native(),
        total.native());
}

bool RoscaContract::evaluate_dissolution(uint64_t const circle_id, Circle &circle)
{
    if (circle.has_flag(CircleFlagDissolved)) {
        return true;
    }
    uint64_t const mask = participant_mask(circle);
    uint64_t const votes =
        count_bits(circle.bitmaps().load().dissolution_votes.native() & mask);
    if (votes * 2 > count_bits(mask)) {
        circle.set_flag(CircleFlagDissolved);
        emit_circle_dissolved_event(circle_id);
        LOG_INFO(
            "circle {} dissolved with {} of {} votes",
            circle_id,
            votes,
            count_bits(mask));
        return true;
    }
    return false;
}

bool RoscaContract::evaluate_penalty_proposal(
    uint64_t const circle_id, Circle &circle)
{
    if (!circle.has_flag(CircleFlagPenaltyProposal)) {
        return false;
    }
    uint64_t const mask = participant_mask(circle);
    auto bitmaps = circle.bitmaps().load();
    uint64_t const votes = count_bits(bitmaps.proposal_votes.native() & mask);
    if (votes * 2 <= count_bits(mask)) {
        return false;
    }

    auto terms = circle.terms().load();
    u32_be const old_bps = terms.late_fee_bps;
    terms.late_fee_bps = terms.proposed_late_fee_bps;
    terms.proposed_late_fee_bps = 0;
    circle.terms().store(terms);

    bitmaps.proposal_votes = 0;
    circle.bitmaps().store(bitmaps);
    circle.clear_flag(CircleFlagPenaltyProposal);

    emit_late_fee_changed_event(circle_id, old_bps, terms.late_fee_bps);
    LOG_INFO(
        "circle {} late fee changed from {} to {} bps",
        circle_id,
        old_bps.native(),
        terms.late_fee_bps.native());
    return true;
}

Result<void> RoscaContract::debit_custody(
    uint64_t const circle_id, Circle &circle, uint256_t const &amount)
{
    auto custody = circle.custody_balance();
    uint256_t const balance = custody.load().native();
    if (SUSU_UNLIKELY(balance < amount)) {
        LOG_WARNING(
            "circle {} custody {} cannot cover {}", circle_id, balance, amount);
        return RoscaError::InsufficientBalance;
    }
    BOOST_OUTCOME_TRY(auto const remaining, checked_sub(balance, amount));
    custody.store(remaining);
    return outcome::success();
}

Result<void> RoscaContract::credit(
    StorageVariable<u256_be> var, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(
        auto const total, checked_add(var.load().native(), amount));
    var.store(total);
    return outcome::success();
}

// Drops roster entry `index` and compacts every structure addressed by
// roster position so that positions stay dense.
void RoscaContract::remove_member_at(
    uint64_t const circle_id, Circle &circle, uint64_t const index)
{
    auto members = circle.members();
    Address const removed = members.get(index).load().address;
    members.erase(index);

    vars.member_index(circle_id, removed).clear();
    for (uint64_t i = index; i < members.length(); ++i) {
        vars.member_index(circle_id, members.get(i).load().address)
            .store(i + 1);
    }

    auto bitmaps = circle.bitmaps().load();
    bitmaps.has_received_payout =
        erase_bit(bitmaps.has_received_payout.native(), index);
    bitmaps.dissolution_votes =
        erase_bit(bitmaps.dissolution_votes.native(), index);
    bitmaps.proposal_votes = erase_bit(bitmaps.proposal_votes.native(), index);
    circle.bitmaps().store(bitmaps);

    auto queue = circle.payout_queue();
    for (uint64_t i = 0; i < queue.length(); ++i) {
        if (queue.get(i).load() == removed) {
            queue.erase(i);
            break;
        }
    }
}

// Seats `slot` at roster position `index` in place of the current occupant.
// Queue position and payout flag stay with the position; votes do not.
void RoscaContract::replace_member_at(
    uint64_t const circle_id, Circle &circle, uint64_t const index,
    MemberSlot const &slot)
{
    auto members = circle.members();
    auto var = members.get(index);
    Address const previous = var.load().address;
    var.store(slot);

    vars.member_index(circle_id, previous).clear();
    vars.member_index(circle_id, slot.address).store(index + 1);

    auto queue = circle.payout_queue();
    for (uint64_t i = 0; i < queue.length(); ++i) {
        auto entry = queue.get(i);
        if (entry.load() == previous) {
            entry.store(slot.address);
            break;
        }
    }

    auto bitmaps = circle.bitmaps().load();
    bitmaps.dissolution_votes =
        bitmaps.dissolution_votes.native() & ~bit_of(index);
    bitmaps.proposal_votes = bitmaps.proposal_votes.native() & ~bit_of(index);
    circle.bitmaps().store(bitmaps);
}

Result<void> RoscaContract::send(
    Address const &token, Address const &to, uint256_t const &amount)
{
    if (amount == 0) {
        return outcome::success();
    }
    return host_.ledger.transfer(token, SUSU_CA, to, amount);
}

//////////////
// Protocol //
//////////////

Result<void> RoscaContract::initialize(Proof const &admin)
{
    BOOST_OUTCOME_TRY(auto const caller, authenticate(admin));
    if (SUSU_UNLIKELY(vars.admin.load_checked().has_value())) {
        return RoscaError::AlreadyInitialized;
    }

    vars.admin.store(caller);
    vars.fee_basis_points.store(0);
    vars.treasury.clear();
    touch_last_active();

    LOG_INFO("protocol initialized, admin {}", caller);
    return outcome::success();
}

Result<void> RoscaContract::set_protocol_fee(
    Proof const &admin, uint32_t const fee_bps, Address const &treasury)
{
    BOOST_OUTCOME_TRY(require_protocol_admin(admin));
    if (SUSU_UNLIKELY(fee_bps > MAX_BASIS_POINTS)) {
        return RoscaError::InvalidFeeConfig;
    }

    vars.fee_basis_points.store(fee_bps);
    vars.treasury.store(treasury);
    touch_last_active();
    return outcome::success();
}

Result<void> RoscaContract::admin_action(Proof const &admin)
{
    BOOST_OUTCOME_TRY(require_protocol_admin(admin));
    touch_last_active();
    return outcome::success();
}

//////////////
// Registry //
//////////////

Result<uint64_t>
RoscaContract::create_circle(Proof const &creator, CircleParams const &params)
{
    BOOST_OUTCOME_TRY(auto const admin, authenticate(creator));
    if (SUSU_UNLIKELY(params.contribution == 0)) {
        return RoscaError::InvalidContribution;
    }
    if (SUSU_UNLIKELY(
            params.max_members == 0 || params.max_members > MAX_MEMBERS)) {
        return RoscaError::MemberLimitExceeded;
    }
    if (SUSU_UNLIKELY(
            params.late_fee_bps > MAX_BASIS_POINTS ||
            params.insurance_fee_bps > MAX_BASIS_POINTS)) {
        return RoscaError::InvalidFeeConfig;
    }

    uint64_t const id = vars.last_circle_id.load().native() + 1;
    vars.last_circle_id.store(id);

    auto circle = vars.circle(id);
    circle.admin_flags().store(Circle::AdminFlags{
        .admin = admin,
        .flags = static_cast<uint64_t>(
            params.is_random_queue ? CircleFlagRandomQueue : 0)});
    circle.token().store(params.token);
    circle.contribution().store(params.contribution);
    circle.terms().store(Circle::Terms{
        .cycle_duration = params.cycle_duration,
        .max_members = params.max_members,
        .late_fee_bps = params.late_fee_bps,
        .insurance_fee_bps = params.insurance_fee_bps,
        .proposed_late_fee_bps = 0});
    circle.cycle().store(Circle::Cycle{
        .number = 1,
        .current_payout_index = 0,
        .deadline = saturating_add(host_.clock.now(), params.cycle_duration)});

    LOG_INFO(
        "circle {} created by {}, contribution {}, {} queue",
        id,
        admin,
        params.contribution,
        params.is_random_queue ? "random" : "sequential");
    return id;
}

///////////
// Views //
///////////

Result<CircleInfo> RoscaContract::get_circle(uint64_t const circle_id)
{
    auto circle = vars.circle(circle_id);
    if (SUSU_UNLIKELY(!circle.exists())) {
        return RoscaError::CircleNotFound;
    }

    auto const af = circle.admin_flags().load();
    auto const terms = circle.terms().load();
    auto const cycle = circle.cycle().load();
    auto const bitmaps = circle.bitmaps().load();
    uint64_t const flags = af.flags.native();

    CircleInfo info{
        .id = circle_id,
        .admin = af.admin,
        .token = circle.token().load(),
        .contribution = circle.contribution().load().native(),
        .max_members = terms.max_members.native(),
        .is_random_queue = (flags & CircleFlagRandomQueue) != 0,
        .is_finalized = (flags & CircleFlagFinalized) != 0,
        .is_dissolved = (flags & CircleFlagDissolved) != 0,
        .is_insurance_used = (flags & CircleFlagInsuranceUsed) != 0,
        .cycle_number = cycle.number.native(),
        .current_payout_index = cycle.current_payout_index.native(),
        .total_volume_distributed =
            circle.total_volume_distributed().load().native(),
        .cycle_duration = terms.cycle_duration.native(),
        .deadline = cycle.deadline.native(),
        .late_fee_bps = terms.late_fee_bps.native(),
        .insurance_fee_bps = terms.insurance_fee_bps.native(),
        .proposed_late_fee_bps =
            (flags & CircleFlagPenaltyProposal) != 0
                ? std::optional<uint32_t>{terms.proposed_late_fee_bps.native()}
                : std::nullopt,
        .custody_balance = circle.custody_balance().load().native(),
        .reserve_balance = circle.reserve_balance().load().native(),
        .insurance_balance = circle.insurance_balance().load().native(),
        .dissolution_votes = count_bits(bitmaps.dissolution_votes.native()),
        .proposal_votes = count_bits(bitmaps.proposal_votes.native()),
        .members = {},
        .payout_queue = circle.payout_queue().load_all(),
        .has_received_payout = {},
        .contributions_paid = {}};

    for (auto const &slot : circle.members().load_all()) {
        info.has_received_payout.push_back(test_bit(
            bitmaps.has_received_payout.native(), info.members.size()));
        info.members.push_back(slot.address);
        info.contributions_paid.push_back(slot.contributions_paid.native());
    }
    return info;
}

Result<std::vector<Address>>
RoscaContract::get_members(uint64_t const circle_id)
{
    auto circle = vars.circle(circle_id);
    if (SUSU_UNLIKELY(!circle.exists())) {
        return RoscaError::CircleNotFound;
    }
    std::vector<Address> out;
    for (auto const &slot : circle.members().load_all()) {
        out.push_back(slot.address);
    }
    return out;
}

Result<std::vector<Address>>
RoscaContract::get_payout_queue(uint64_t const circle_id)
{
    auto circle = vars.circle(circle_id);
    if (SUSU_UNLIKELY(!circle.exists())) {
        return RoscaError::CircleNotFound;
    }
    return circle.payout_queue().load_all();
}

Result<std::vector<bool>>
RoscaContract::get_payout_status(uint64_t const circle_id)
{
    auto circle = vars.circle(circle_id);
    if (SUSU_UNLIKELY(!circle.exists())) {
        return RoscaError::CircleNotFound;
    }
    uint64_t const paid = circle.bitmaps().load().has_received_payout.native();
    uint64_t const n = circle.members().length();
    std::vector<bool> out(n);
    for (uint64_t i = 0; i < n; ++i) {
        out[i] = test_bit(paid, i);
    }
    return out;
}

Result<CycleInfo> RoscaContract::get_cycle_info(uint64_t const circle_id)
{
    auto circle = vars.circle(circle_id);
    if (SUSU_UNLIKELY(!circle.exists())) {
        return RoscaError::CircleNotFound;
    }
    auto const cycle = circle.cycle().load();
    return CycleInfo{
        .cycle_number = cycle.number.native(),
        .current_payout_index = cycle.current_payout_index.native(),
        .total_volume_distributed =
            circle.total_volume_distributed().load().native()};
}

Result<MemberInfo>
RoscaContract::get_member(uint64_t const circle_id, Address const &member)
{
    auto circle = vars.circle(circle_id);
    if (SUSU_UNLIKELY(!circle.exists())) {
        return RoscaError::CircleNotFound;
    }
    BOOST_OUTCOME_TRY(
        auto const index,
        require_member(circle_id, member, RoscaError::MemberNotFound));
    auto const slot = circle.members().get(index).load();
    uint64_t const paid = circle.bitmaps().load().has_received_payout.native();
    return MemberInfo{
        .address = slot.address,
        .index = index,
        .status = static_cast<MemberStatus>(slot.status.native()),
        .contribution_count = slot.contribution_count.native(),
        .last_contribution_time = slot.last_contribution_time.native(),
        .contributions_paid = slot.contributions_paid.native(),
        .payouts_received = slot.payouts_received.native(),
        .has_received_payout = test_bit(paid, index)};
}

uint32_t RoscaContract::fee_basis_points()
{
    return vars.fee_basis_points.load().native();
}

std::optional<Address> RoscaContract::treasury_address()
{
    return vars.treasury.load_checked();
}

std::optional<Address> RoscaContract::protocol_admin()
{
    return vars.admin.load_checked();
}

uint64_t RoscaContract::get_last_active_timestamp()
{
    return vars.last_active_timestamp.load().native();
}

uint256_t
RoscaContract::get_user_balance(Address const &token, Address const &user)
{
    return vars.user_balance(token, user).load().native();
}

SUSU_ROSCA_NAMESPACE_END
