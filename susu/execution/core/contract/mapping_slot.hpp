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

#include <susu/core/byte_string.hpp>
#include <susu/core/bytes.hpp>
#include <susu/execution/core/contract/abi_signatures.hpp>

#include <bit>
#include <cstdint>
#include <span>

SUSU_NAMESPACE_BEGIN

// Slot of a nested mapping entry: keccak256 of the packed key fields with
// the top byte replaced by the mapping's namespace.
inline bytes32_t
keccak_mapping_slot(uint8_t const ns, byte_string_view const preimage)
{
    auto const h = cthash::keccak_256{}
                       .update(std::span<unsigned char const>{
                           preimage.data(), preimage.size()})
                       .final();
    auto slot = std::bit_cast<bytes32_t>(h);
    slot.bytes[0] = ns;
    return slot;
}

SUSU_NAMESPACE_END
