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

#include <susu/execution/rosca/config.hpp>

#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

SUSU_ROSCA_NAMESPACE_BEGIN

enum class RoscaError
{
    Success = 0,
    InternalError,
    CircleNotFound,
    Unauthorized,
    AlreadyJoined,
    MaxMembersReached,
    MemberNotFound,
    MemberAlreadyExists,
    AlreadyVoted,
    NotMember,
    AlreadyDissolved,
    NotDissolved,
    InvalidFeeConfig,
    PenaltyExceedsContribution,
    PayoutAlreadyReceived,
    CycleNotComplete,
    InsufficientBalance,
    InsufficientAllowance,
    EmergencyWithdrawalNotAvailable,
    InvalidCircleState,
    MemberLimitExceeded,
    CircleNotFinalized,
    AlreadyInitialized,
    NotInitialized,
    InvalidContribution,
    MemberInactive,
    NoActiveProposal,
    InsuranceAlreadyUsed,
};

SUSU_ROSCA_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<susu::rosca::RoscaError>
    : quick_status_code_from_enum_defaults<susu::rosca::RoscaError>
{
    static constexpr auto const domain_name = "Rosca Error";
    static constexpr auto const domain_uuid =
        "8c3e61f2-9b47-4d05-a1e8-52f7c0d93b6a";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
