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
#include <susu/core/config.hpp>
#include <susu/core/int.hpp>
#include <susu/core/result.hpp>
#include <susu/execution/core/address.hpp>
#include <susu/execution/core/log.hpp>
#include <susu/execution/core/contract/big_endian.hpp>
#include <susu/execution/core/contract/storage_variable.hpp>
#include <susu/execution/rosca/config.hpp>
#include <susu/execution/rosca/host.hpp>
#include <susu/execution/rosca/util/circle.hpp>
#include <susu/execution/rosca/util/constants.hpp>
#include <susu/execution/rosca/util/fee.hpp>
#include <susu/execution/rosca/util/rosca_error.hpp>

#include <bit>
#include <cstdint>
#include <optional>
#include <vector>

SUSU_NAMESPACE_BEGIN

class State;

SUSU_NAMESPACE_END

SUSU_ROSCA_NAMESPACE_BEGIN

struct CircleParams
{
    uint256_t contribution{0};
    bool is_random_queue{false};
    Address token{};
    uint32_t max_members{MAX_MEMBERS};
    // seconds a member has after each deposit before the next one is late
    uint64_t cycle_duration{0};
    uint32_t late_fee_bps{0};
    uint32_t insurance_fee_bps{0};
};

struct ProtocolConfig
{
    std::optional<Address> admin;
    uint32_t fee_bps{0};
    std::optional<Address> treasury;
};

struct CycleInfo
{
    uint64_t cycle_number;
    uint64_t current_payout_index;
    uint256_t total_volume_distributed;
};

struct MemberInfo
{
    Address address;
    uint64_t index;
    MemberStatus status;
    uint32_t contribution_count;
    uint64_t last_contribution_time;
    uint256_t contributions_paid;
    uint256_t payouts_received;
    bool has_received_payout;
};

struct CircleInfo
{
    uint64_t id;
    Address admin;
    Address token;
    uint256_t contribution;
    uint32_t max_members;
    bool is_random_queue;
    bool is_finalized;
    bool is_dissolved;
    bool is_insurance_used;
    uint64_t cycle_number;
    uint64_t current_payout_index;
    uint256_t total_volume_distributed;
    uint64_t cycle_duration;
    uint64_t deadline;
    uint32_t late_fee_bps;
    uint32_t insurance_fee_bps;
    std::optional<uint32_t> proposed_late_fee_bps;
    uint256_t custody_balance;
    uint256_t reserve_balance;
    uint256_t insurance_balance;
    uint64_t dissolution_votes;
    uint64_t proposal_votes;
    std::vector<Address> members;
    std::vector<Address> payout_queue;
    std::vector<bool> has_received_payout;
    std::vector<uint256_t> contributions_paid;
};

/// Circle lifecycle and settlement engine. Each public operation is a
/// complete unit of work: preconditions are re-read from `State`, all engine
/// state is written, and only then are assets moved through the host's
/// `AssetLedger`. The caller brackets every operation with a `State`
/// checkpoint (see `execute_call`) so that an error leaves no trace.
class RoscaContract
{
    State &state_;
    Host &host_;

public:
    RoscaContract(State &, Host &);

    //////////////////////////
    // Rosca Storage Variables
    //////////////////////////
    class Variables
    {
        State &state_;

        // Single slot constants all under namespace 0x0
        static constexpr auto AddressAdmin{
            0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};
        static constexpr auto AddressFeeBasisPoints{
            0x0000000000000000000000000000000000000000000000000000000000000002_bytes32};
        static constexpr auto AddressTreasury{
            0x0000000000000000000000000000000000000000000000000000000000000003_bytes32};
        static constexpr auto AddressLastCircleId{
            0x0000000000000000000000000000000000000000000000000000000000000004_bytes32};
        static constexpr auto AddressLastActive{
            0x0000000000000000000000000000000000000000000000000000000000000005_bytes32};

        // Namespaces for mappings. Each mapping "owns" all the address space
        // under the namespace byte.
        enum Namespace : uint8_t
        {
            NSCircle = 0x01,
            NSMemberIndex = 0x02,
            NSUserBalance = 0x03,
        };

    public:
        explicit Variables(State &state)
            : state_{state}
        {
        }

        ////////////////
        //  Constants //
        ////////////////

        StorageVariable<Address> admin{state_, SUSU_CA, AddressAdmin};

        StorageVariable<u32_be> fee_basis_points{
            state_, SUSU_CA, AddressFeeBasisPoints};

        // Zero when no treasury is configured
        StorageVariable<Address> treasury{state_, SUSU_CA, AddressTreasury};

        // Increments every time a circle is created. First circle ID is 1.
        StorageVariable<u64_be> last_circle_id{
            state_, SUSU_CA, AddressLastCircleId};

        // Time of the last protocol admin call. Gates emergency withdrawal.
        StorageVariable<u64_be> last_active_timestamp{
            state_, SUSU_CA, AddressLastActive};

        ProtocolConfig load_protocol_config() const;

        ////////////////
        //  Mappings  //
        ////////////////

        // mapping(uint64 => Circle) circle
        Circle circle(u64_be const id) noexcept
        {
            struct
            {
                uint8_t ns;
                u64_be circle_id;
                uint8_t slots[23];
            } key{.ns = NSCircle, .circle_id = id, .slots = {}};

            return {state_, SUSU_CA, std::bit_cast<bytes32_t>(key)};
        }

        // mapping(uint64 => mapping(address => uint64)) member_index
        //
        // Roster position + 1, zero when the address is not on the roster.
        StorageVariable<u64_be>
        member_index(u64_be const circle_id, Address const &member) noexcept
        {
            struct
            {
                uint8_t ns;
                u64_be circle_id;
                Address address;
                uint8_t slots[3];
            } key{
                .ns = NSMemberIndex,
                .circle_id = circle_id,
                .address = member,
                .slots = {}};

            return {state_, SUSU_CA, std::bit_cast<bytes32_t>(key)};
        }

        // mapping(address => mapping(address => uint256)) user_balance
        //
        // Protocol level custody ledger backing deposit/emergency_withdraw.
        StorageVariable<u256_be>
        user_balance(Address const &token, Address const &user) noexcept;
    };

    Variables vars;

private:
    ////////////
    // Events //
    ////////////
    void emit_log(Log const &);
    void emit_cycle_completed_event(u64_be circle_id, u256_be const &total);
    void emit_group_rollover_event(u64_be circle_id, u64_be cycle_number);
    void emit_payout_event(
        u64_be circle_id, Address const &recipient, FeeSplit const &);
    void emit_kicked_event(
        u64_be circle_id, Address const &member, u256_be const &refund,
        u256_be const &penalty);
    void emit_contributed_event(
        u64_be circle_id, Address const &member, DepositBreakdown const &);
    void emit_circle_dissolved_event(u64_be circle_id);
    void emit_late_fee_changed_event(
        u64_be circle_id, u32_be old_bps, u32_be new_bps);

    /////////////
    // Helpers //
    /////////////
    Result<Address> authenticate(Proof const &);
    Result<ProtocolConfig> require_protocol_admin(Proof const &);
    Result<void> require_circle_admin(Circle &, Proof const &);
    void touch_last_active();

    std::optional<uint64_t>
    find_member(uint64_t circle_id, Address const &) noexcept;
    Result<uint64_t>
    require_member(uint64_t circle_id, Address const &, RoscaError);

    // bits of roster entries that are not ejected
    uint64_t participant_mask(Circle &) noexcept;
    bool is_cycle_complete(Circle &) noexcept;
    void emit_if_cycle_closed(
        uint64_t circle_id, Circle &, bool was_complete);
    bool evaluate_dissolution(uint64_t circle_id, Circle &);
    bool evaluate_penalty_proposal(uint64_t circle_id, Circle &);

    Result<void> debit_custody(uint64_t circle_id, Circle &, uint256_t const &);
    Result<void> credit(StorageVariable<u256_be>, uint256_t const &amount);

    void remove_member_at(uint64_t circle_id, Circle &, uint64_t index);
    void replace_member_at(
        uint64_t circle_id, Circle &, uint64_t index, MemberSlot const &);
    Result<void> swap_in_place(
        uint64_t circle_id, Circle &, Address const &old_member,
        Address const &new_member);

    Result<void> send(
        Address const &token, Address const &to, uint256_t const &amount);

public:
    //////////////
    // Protocol //
    //////////////
    Result<void> initialize(Proof const &admin);
    Result<void> set_protocol_fee(
        Proof const &admin, uint32_t fee_bps, Address const &treasury);
    Result<void> admin_action(Proof const &admin);

    //////////////
    // Registry //
    //////////////
    Result<uint64_t>
    create_circle(Proof const &creator, CircleParams const &params);

    ////////////////
    // Membership //
    ////////////////
    Result<void> join_circle(Proof const &member, uint64_t circle_id);
    Result<void> kick_member(
        Proof const &admin, uint64_t circle_id, Address const &member,
        uint256_t const &penalty);
    Result<void> swap_member(
        Proof const &old_member, Proof const &new_member, uint64_t circle_id);
    Result<void> swap_member_by_admin(
        Proof const &admin, uint64_t circle_id, Address const &old_member,
        Address const &new_member);
    Result<void> eject_member(
        Proof const &admin, uint64_t circle_id, Address const &member);
    Result<void> request_exit(Proof const &member, uint64_t circle_id);
    Result<void> fill_vacancy(
        Proof const &new_member, uint64_t circle_id, Address const &exiting);

    ////////////////
    // Settlement //
    ////////////////
    Result<void> finalize_circle(Proof const &admin, uint64_t circle_id);
    Result<void> contribute(Proof const &member, uint64_t circle_id);
    Result<void> process_payout(
        Proof const &admin, uint64_t circle_id, Address const &recipient);
    Result<void> rollover_group(Proof const &admin, uint64_t circle_id);
    Result<void> trigger_insurance_coverage(
        Proof const &admin, uint64_t circle_id, Address const &member);

    ////////////////
    // Governance //
    ////////////////
    Result<void> propose_dissolution(Proof const &member, uint64_t circle_id);
    Result<void> vote_dissolve(Proof const &member, uint64_t circle_id);
    Result<void> propose_penalty_change(
        Proof const &member, uint64_t circle_id, uint32_t new_bps);
    Result<void> vote_penalty_change(Proof const &member, uint64_t circle_id);

    /////////////
    // Custody //
    /////////////
    Result<uint256_t> withdraw_pro_rata(Proof const &member, uint64_t circle_id);
    Result<void> deposit(
        Proof const &user, Address const &token, uint256_t const &amount);
    Result<uint256_t> emergency_withdraw(Proof const &user, Address const &token);

    ///////////
    // Views //
    ///////////
    Result<CircleInfo> get_circle(uint64_t circle_id);
    Result<std::vector<Address>> get_members(uint64_t circle_id);
    Result<std::vector<Address>> get_payout_queue(uint64_t circle_id);
    Result<std::vector<bool>> get_payout_status(uint64_t circle_id);
    Result<CycleInfo> get_cycle_info(uint64_t circle_id);
    Result<MemberInfo> get_member(uint64_t circle_id, Address const &member);
    uint32_t fee_basis_points();
    std::optional<Address> treasury_address();
    std::optional<Address> protocol_admin();
    uint64_t get_last_active_timestamp();
    uint256_t get_user_balance(Address const &token, Address const &user);
};

SUSU_ROSCA_NAMESPACE_END
