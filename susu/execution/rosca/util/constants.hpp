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

#include <susu/core/int.hpp>
#include <susu/execution/core/address.hpp>
#include <susu/execution/rosca/config.hpp>

#include <cstdint>

SUSU_ROSCA_NAMESPACE_BEGIN

// Address of the engine account. All engine storage lives under it, and it
// is the custodian of every circle's funds.
inline constexpr Address SUSU_CA{0x5005};

inline constexpr uint64_t MAX_MEMBERS{50};
inline constexpr uint64_t MAX_BASIS_POINTS{10'000};

// seconds without protocol admin activity before users may reclaim deposits
inline constexpr uint64_t EMERGENCY_WITHDRAWAL_DELAY{7 * 24 * 60 * 60};

// roster bitmaps are a single 64-bit word
static_assert(MAX_MEMBERS <= 64);

enum class MemberStatus : uint8_t
{
    Active = 0,
    AwaitingReplacement = 1,
    Ejected = 2,
};

enum
{
    CircleFlagRandomQueue = (1 << 0),
    CircleFlagDissolved = (1 << 1),
    CircleFlagInsuranceUsed = (1 << 2),
    CircleFlagPenaltyProposal = (1 << 3),
    CircleFlagFinalized = (1 << 4),
};

SUSU_ROSCA_NAMESPACE_END
