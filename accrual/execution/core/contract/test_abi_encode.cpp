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

#include <accrual/core/byte_string.hpp>
#include <accrual/core/int.hpp>
#include <accrual/execution/core/address.hpp>
#include <accrual/execution/core/contract/abi_encode.hpp>
#include <accrual/execution/core/contract/abi_signatures.hpp>
#include <accrual/execution/core/contract/big_endian.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace accrual;
using namespace intx::literals;

TEST(AbiEncode, boolean)
{
    constexpr auto expected_false =
        evmc::from_hex<bytes32_t>(
            "0000000000000000000000000000000000000000000000000000000000000000")
            .value();
    constexpr auto expected_true =
        evmc::from_hex<bytes32_t>(
            "0000000000000000000000000000000000000000000000000000000000000001")
            .value();
    constexpr auto abi_true = abi_encode_bool(true);
    constexpr auto abi_false = abi_encode_bool(false);
    EXPECT_EQ(abi_true, expected_true);
    EXPECT_EQ(abi_false, expected_false);
}

TEST(AbiEncode, address_is_left_padded)
{
    constexpr auto word =
        abi_encode_address(0x5353535353535353535353535353535353535353_address);
    constexpr auto expected =
        evmc::from_hex<bytes32_t>(
            "0000000000000000000000005353535353535353535353535353535353535353")
            .value();
    static_assert(word == expected);
    EXPECT_EQ(word, expected);
}

TEST(AbiEncode, u8)
{
    constexpr auto word = abi_encode_uint(u8_be{0xab});
    EXPECT_EQ(word.bytes[31], 0xab);
    for (size_t i = 0; i < 31; ++i) {
        EXPECT_EQ(word.bytes[i], 0);
    }
}

TEST(AbiEncode, u64)
{
    constexpr u64_be input{86400};
    constexpr auto expected =
        evmc::from_hex<bytes32_t>(
            "0000000000000000000000000000000000000000000000000000000000015180")
            .value();
    constexpr auto actual = abi_encode_uint(input);
    EXPECT_EQ(actual, expected);
}

TEST(AbiEncode, u256)
{
    constexpr u256_be input{15355346523654236542356453_u256};
    constexpr auto expected =
        evmc::from_hex<bytes32_t>(
            "0x0000000000000000000000000000000000000000000cb3"
            "9f00c54ee156444be5")
            .value();
    constexpr auto actual = abi_encode_uint(input);
    EXPECT_EQ(actual, expected);
}

TEST(AbiEncode, address)
{
    constexpr Address input{0xDEADBEEF000000000000000000F00D0000000100_address};
    constexpr auto expected =
        evmc::from_hex<bytes32_t>(
            "000000000000000000000000deadbeef000000000000000000f00d0000000100")
            .value();
    constexpr auto actual = abi_encode_address(input);
    EXPECT_EQ(actual, expected);
}

TEST(AbiEncode, selector)
{
    static_assert(
        abi_encode_selector("deposit(address,uint256)") == 0x47e7ef24);
    static_assert(
        abi_encode_selector("transfer(address,uint256)") == 0xa9059cbb);
    static_assert(
        abi_encode_event_signature("Transfer(address,address,uint256)") ==
        0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef_bytes32);
}

TEST(AbiEncode, calldata)
{
    byte_string const expected =
        evmc::from_hex(
            "0x47e7ef24"
            "00000000000000000000000000000000000000000000000000000000000000a1"
            "00000000000000000000000000000000000000000000003635c9adc5dea00000")
            .value();

    AbiEncoder encoder{abi_encode_selector("deposit(address,uint256)")};
    encoder.add_address(0x00000000000000000000000000000000000000a1_address);
    encoder.add_uint<u256_be>(1000000000000000000000_u256);
    auto const output = encoder.encode_final();
    EXPECT_EQ(output, expected);
}

TEST(AbiEncode, custom_error)
{
    // Staking__EarlyClaim(uint256) with a timestamp argument
    byte_string const expected =
        evmc::from_hex(
            "0xdd9d4c3f"
            "0000000000000000000000000000000000000000000000000000000000015180")
            .value();

    AbiEncoder encoder{abi_encode_selector("Staking__EarlyClaim(uint256)")};
    encoder.add_uint<u64_be>(86400);
    EXPECT_EQ(encoder.encode_final(), expected);
}
