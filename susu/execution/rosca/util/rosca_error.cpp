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

#include <susu/execution/rosca/util/rosca_error.hpp>

#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<susu::rosca::RoscaError>::mapping> const &
quick_status_code_from_enum<susu::rosca::RoscaError>::value_mappings()
{
    using susu::rosca::RoscaError;

    static std::initializer_list<mapping> const v = {
        {RoscaError::Success, "success", {errc::success}},
        {RoscaError::InternalError, "internal error", {}},
        {RoscaError::CircleNotFound, "circle not found", {}},
        {RoscaError::Unauthorized, "unauthorized", {errc::permission_denied}},
        {RoscaError::AlreadyJoined, "already joined", {}},
        {RoscaError::MaxMembersReached, "max members reached", {}},
        {RoscaError::MemberNotFound, "member not found", {}},
        {RoscaError::MemberAlreadyExists, "member already exists", {}},
        {RoscaError::AlreadyVoted, "already voted", {}},
        {RoscaError::NotMember, "not a member", {}},
        {RoscaError::AlreadyDissolved, "circle already dissolved", {}},
        {RoscaError::NotDissolved, "circle not dissolved", {}},
        {RoscaError::InvalidFeeConfig, "invalid fee config", {}},
        {RoscaError::PenaltyExceedsContribution,
         "penalty exceeds contribution",
         {}},
        {RoscaError::PayoutAlreadyReceived, "payout already received", {}},
        {RoscaError::CycleNotComplete, "cycle not complete", {}},
        {RoscaError::InsufficientBalance, "insufficient balance", {}},
        {RoscaError::InsufficientAllowance, "insufficient allowance", {}},
        {RoscaError::EmergencyWithdrawalNotAvailable,
         "emergency withdrawal not available",
         {}},
        {RoscaError::InvalidCircleState, "invalid circle state", {}},
        {RoscaError::MemberLimitExceeded, "member limit exceeded", {}},
        {RoscaError::CircleNotFinalized, "circle not finalized", {}},
        {RoscaError::AlreadyInitialized, "already initialized", {}},
        {RoscaError::NotInitialized, "not initialized", {}},
        {RoscaError::InvalidContribution, "invalid contribution", {}},
        {RoscaError::MemberInactive, "member inactive", {}},
        {RoscaError::NoActiveProposal, "no active proposal", {}},
        {RoscaError::InsuranceAlreadyUsed, "insurance already used", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
