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

#include <accrual/core/bytes.hpp>
#include <accrual/core/config.hpp>
#include <accrual/core/keccak.hpp>
#include <accrual/execution/core/address.hpp>
#include <accrual/execution/core/contract/big_endian.hpp>
#include <accrual/execution/state/state.hpp>

#include <intx/intx.hpp>

#include <array>
#include <bit>
#include <cstring>
#include <optional>
#include <type_traits>

ACCRUAL_NAMESPACE_BEGIN

// Slot of a mapping entry whose key material is wider than a slot: the
// keccak of the packed key, as Solidity does for nested mappings.
template <typename Key>
    requires std::has_unique_object_representations_v<Key>
bytes32_t hashed_storage_key(Key const &key)
{
    auto const packed =
        std::bit_cast<std::array<unsigned char, sizeof(Key)>>(key);
    return to_bytes(keccak256(to_byte_string_view(packed)));
}

// A value of type T kept in N consecutive slots of a contract's storage.
// An all zero value is indistinguishable from an absent one.
template <typename T>
    requires std::has_unique_object_representations_v<T>
class StorageVariable
{
public:
    static constexpr size_t N =
        (sizeof(T) + sizeof(bytes32_t) - 1) / sizeof(bytes32_t);
    using Slots = std::array<bytes32_t, N>;

    static Slots to_slots(T const &t)
    {
        Slots slots{}; // zero-pad the tail
        std::memcpy(&slots[0].bytes, &t, sizeof(T));
        return slots;
    }

    static T from_slots(Slots const &slots)
    {
        T t;
        std::memcpy(&t, &slots[0].bytes, sizeof(T));
        return t;
    }

private:
    State &state_;
    Address address_;
    uint256_t offset_;

    bytes32_t slot_key(size_t const i) const noexcept
    {
        return intx::be::store<bytes32_t>(offset_ + i);
    }

    Slots load_slots() const noexcept
    {
        Slots slots;
        for (size_t i = 0; i < N; ++i) {
            slots[i] = state_.get_storage(address_, slot_key(i));
        }
        return slots;
    }

    void store_(Slots const &slots)
    {
        for (size_t i = 0; i < N; ++i) {
            state_.set_storage(address_, slot_key(i), slots[i]);
        }
    }

public:
    StorageVariable(State &state, Address const &address, bytes32_t const &key)
        : state_{state}
        , address_{address}
        , offset_{intx::be::load<uint256_t>(key)}
    {
    }

    T load() const noexcept
    {
        return from_slots(load_slots());
    }

    std::optional<T> load_checked() const noexcept
    {
        Slots const slots = load_slots();
        bool has_data = false;
        for (auto const &slot : slots) {
            has_data |= (slot != bytes32_t{});
        }
        return has_data ? from_slots(slots) : std::optional<T>{};
    }

    void store(T const &value)
    {
        store_(to_slots(value));
    }

    void clear()
    {
        store_(Slots{}); // zero all blocks
    }
};

ACCRUAL_NAMESPACE_END
