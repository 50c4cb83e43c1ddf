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

#include <accrual/core/byte_string.hpp>
#include <accrual/core/bytes.hpp>
#include <accrual/core/config.hpp>
#include <accrual/core/int.hpp>
#include <accrual/execution/core/address.hpp>
#include <accrual/execution/core/contract/big_endian.hpp>

#include <algorithm>
#include <array>
#include <bit>
#include <cstdint>

ACCRUAL_NAMESPACE_BEGIN

// Static values sit at the low-order end of their word, zero padded
template <typename T>
constexpr bytes32_t abi_encode_word(T const &value)
{
    static_assert(sizeof(T) <= sizeof(bytes32_t));

    constexpr size_t offset = sizeof(bytes32_t) - sizeof(T);
    bytes32_t output{};
    std::ranges::copy(
        std::bit_cast<std::array<unsigned char, sizeof(T)>>(value),
        &output.bytes[offset]);
    return output;
}

constexpr bytes32_t abi_encode_address(Address const &address)
{
    return abi_encode_word(address);
}

template <BigEndianType I>
constexpr bytes32_t abi_encode_uint(I const &i)
{
    return abi_encode_word(i);
}

constexpr bytes32_t abi_encode_bool(bool const b)
{
    u64_be as_int = b ? 1 : 0;
    return abi_encode_uint(as_int);
}

// Head-only encoder for static argument lists. When constructed with a
// selector the output is calldata (or custom error data): the 4 byte big
// endian selector followed by the words.
class AbiEncoder
{
    byte_string out_;

public:
    AbiEncoder() = default;

    explicit AbiEncoder(uint32_t const selector)
    {
        u64_be const be{selector};
        out_.append(&be.bytes[4], 4);
    }

    void add_address(Address const &address)
    {
        out_ += abi_encode_address(address);
    }

    template <BigEndianType I>
    void add_uint(I const &i)
    {
        out_ += abi_encode_uint(i);
    }

    void add_bool(bool const b)
    {
        out_ += abi_encode_bool(b);
    }

    void add_bytes32(bytes32_t const &word)
    {
        out_ += word;
    }

    byte_string encode_final()
    {
        return std::move(out_);
    }
};

ACCRUAL_NAMESPACE_END
