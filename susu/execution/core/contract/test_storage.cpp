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

#include <susu/core/bytes.hpp>
#include <susu/execution/core/address.hpp>
#include <susu/execution/core/contract/big_endian.hpp>
#include <susu/execution/core/contract/storage_array.hpp>
#include <susu/execution/core/contract/storage_variable.hpp>
#include <susu/execution/state/state.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

using namespace susu;
using namespace intx::literals;

struct Storage : public ::testing::Test
{
    static constexpr auto ADDRESS{
        0x36928500bc1dcd7af6a2b4008875cc336b927d57_address};
    State state;
};

TEST_F(Storage, variable)
{
    StorageVariable<u256_be> var(state, ADDRESS, bytes32_t{6000});
    ASSERT_FALSE(var.load_checked().has_value());
    var.store(5_u256);
    ASSERT_TRUE(var.load_checked().has_value());
    EXPECT_EQ(var.load().native(), 5_u256);
    var.store(2000_u256);
    EXPECT_EQ(var.load().native(), 2000_u256);
    var.clear();
    EXPECT_FALSE(var.load_checked().has_value());
}

TEST_F(Storage, multi_slot_record)
{
    struct Record
    {
        Address who;
        u8_be status;
        u32_be count;
        u64_be when;
        u256_be amount;
    };

    static_assert(StorageVariable<Record>::N == 3);

    StorageVariable<Record> var(state, ADDRESS, bytes32_t{42});
    ASSERT_FALSE(var.load_checked().has_value());

    var.store(Record{
        .who = ADDRESS, .status = 2, .count = 7, .when = 99, .amount = 1_u256});
    Record r = var.load();
    EXPECT_EQ(r.who, ADDRESS);
    EXPECT_EQ(r.status.native(), 2);
    EXPECT_EQ(r.count.native(), 7);
    EXPECT_EQ(r.when.native(), 99);
    EXPECT_EQ(r.amount.native(), 1_u256);

    // neighbouring variable starts after the record's slots
    StorageVariable<u64_be> next(state, ADDRESS, bytes32_t{45});
    EXPECT_FALSE(next.load_checked().has_value());

    var.clear();
    EXPECT_FALSE(var.load_checked().has_value());
}

TEST_F(Storage, array)
{
    struct SomeType
    {
        u256_be blob;
        u32_be counter;
    };

    StorageArray<SomeType> arr(state, ADDRESS, bytes32_t{100});
    EXPECT_TRUE(arr.empty());

    for (uint32_t i = 0; i < 20; ++i) {
        arr.push(SomeType{.blob = 2000_u256, .counter = i});
        EXPECT_EQ(arr.length(), i + 1);
    }

    for (uint32_t i = 0; i < 20; ++i) {
        auto const res = arr.get(i);
        ASSERT_TRUE(res.load_checked().has_value())
            << "Could not load at index: " << i << std::endl;
        EXPECT_EQ(res.load().counter.native(), i);
    }

    for (uint32_t i = 20; i > 0; --i) {
        EXPECT_EQ(arr.pop().counter.native(), i - 1);
        EXPECT_EQ(arr.length(), i - 1);
    }
}

TEST_F(Storage, array_erase_keeps_order)
{
    StorageArray<Address> arr(state, ADDRESS, bytes32_t{7});
    std::vector<Address> const addrs{
        Address{1}, Address{2}, Address{3}, Address{4}};
    arr.store_all(addrs);
    EXPECT_EQ(arr.load_all(), addrs);

    arr.erase(1);
    EXPECT_EQ(arr.load_all(), (std::vector<Address>{addrs[0], addrs[2], addrs[3]}));

    arr.erase(2);
    EXPECT_EQ(arr.load_all(), (std::vector<Address>{addrs[0], addrs[2]}));

    // the vacated tail slot is zeroed
    StorageVariable<Address> stale(state, ADDRESS, bytes32_t{10});
    EXPECT_FALSE(stale.load_checked().has_value());

    arr.clear();
    EXPECT_TRUE(arr.empty());
}

TEST_F(Storage, rejected_writes_are_rolled_back)
{
    StorageVariable<u64_be> var(state, ADDRESS, bytes32_t{1});
    var.store(10);

    state.push();
    var.store(11);
    EXPECT_EQ(var.load().native(), 11);
    state.pop_reject();

    EXPECT_EQ(var.load().native(), 10);
}
