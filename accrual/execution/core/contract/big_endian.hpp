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

#include <accrual/core/config.hpp>
#include <accrual/core/int.hpp>

#include <intx/intx.hpp>

#include <algorithm>
#include <array>
#include <bit>
#include <type_traits>

ACCRUAL_NAMESPACE_BEGIN

// Integer held in storage byte order. Having alignment one lets records of
// these be bit_cast to and from storage slots without padding.
template <typename T>
    requires(unsigned_integral<T>)
struct BigEndian
{
    using native_type = T;

    unsigned char bytes[sizeof(T)];

    BigEndian() = default;

    constexpr BigEndian(T const &x) noexcept
    {
        store(x);
    }

    constexpr bool operator==(BigEndian<T> const &other) const noexcept
    {
        return std::ranges::equal(bytes, other.bytes);
    }

    [[nodiscard]] constexpr native_type native() const noexcept
    {
        return intx::to_big_endian(std::bit_cast<native_type>(bytes));
    }

    [[nodiscard]] constexpr bool is_zero() const noexcept
    {
        return std::ranges::all_of(
            bytes, [](unsigned char const b) { return b == 0; });
    }

    constexpr BigEndian<T> &operator=(T const &x) noexcept
    {
        store(x);
        return *this;
    }

private:
    constexpr void store(T const &x) noexcept
    {
        std::ranges::copy(
            std::bit_cast<std::array<unsigned char, sizeof(T)>>(
                intx::to_big_endian(x)),
            bytes);
    }
};

using u8_be = BigEndian<uint8_t>;
using u64_be = BigEndian<uint64_t>;
using u256_be = BigEndian<uint256_t>;

static_assert(sizeof(u8_be) == sizeof(uint8_t));
static_assert(alignof(u8_be) == 1);
static_assert(sizeof(u64_be) == sizeof(uint64_t));
static_assert(alignof(u64_be) == 1);
static_assert(sizeof(u256_be) == sizeof(uint256_t));
static_assert(alignof(u256_be) == 1);

template <typename T>
struct is_big_endian_wrapper : std::false_type
{
};

template <typename U>
struct is_big_endian_wrapper<BigEndian<U>> : std::true_type
{
};

template <typename T>
concept BigEndianType = is_big_endian_wrapper<T>::value;

ACCRUAL_NAMESPACE_END
