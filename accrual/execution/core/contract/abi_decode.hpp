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
#include <accrual/core/likely.h>
#include <accrual/core/result.hpp>
#include <accrual/execution/core/address.hpp>
#include <accrual/execution/core/contract/abi_decode_error.hpp>
#include <accrual/execution/core/contract/big_endian.hpp>

#include <algorithm>
#include <concepts>
#include <cstring>

#include <boost/outcome/try.hpp>

ACCRUAL_NAMESPACE_BEGIN

// Consumes one 32 byte head word. Values narrower than a word are right
// aligned and the bytes to their left must be zero.
template <typename T>
    requires(
        BigEndianType<T> || std::same_as<T, Address> ||
        std::same_as<T, bytes32_t>)
Result<T> abi_decode_fixed(byte_string_view &enc)
{
    static_assert(sizeof(T) <= 32);
    if (ACCRUAL_UNLIKELY(enc.size() < 32)) {
        return AbiDecodeError::InputTooShort;
    }

    constexpr size_t offset = 32 - sizeof(T);
    if (ACCRUAL_UNLIKELY(!std::all_of(
            enc.data(), enc.data() + offset, [](unsigned char const b) {
                return b == 0;
            }))) {
        return AbiDecodeError::InvalidPadding;
    }

    T output{};
    std::memcpy(&output, enc.data() + offset, sizeof(T));
    enc.remove_prefix(32);
    return output;
}

inline Result<bool> abi_decode_bool(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const word, abi_decode_fixed<u8_be>(enc));
    if (ACCRUAL_UNLIKELY(word.native() > 1)) {
        return AbiDecodeError::InvalidPadding;
    }
    return word.native() == 1;
}

ACCRUAL_NAMESPACE_END
