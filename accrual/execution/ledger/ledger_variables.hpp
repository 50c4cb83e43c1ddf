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
#include <accrual/execution/core/address.hpp>
#include <accrual/execution/core/contract/big_endian.hpp>
#include <accrual/execution/core/contract/storage_variable.hpp>
#include <accrual/execution/ledger/config.hpp>
#include <accrual/execution/ledger/util/constants.hpp>

#include <bit>
#include <cstdint>

ACCRUAL_LEDGER_NAMESPACE_BEGIN

// A position of one account in one asset. All zero when no position is open.
struct StakeRecord
{
    u256_be balance;
    u64_be stake_timestamp;
    u64_be last_claim_timestamp;
};

static_assert(sizeof(StakeRecord) == 48);
static_assert(alignof(StakeRecord) == 1);

/////////////////////////////
// Ledger Storage Variables
/////////////////////////////
class LedgerVariables
{
    State &state_;

    // Single slot parameters, all under namespace 0x0
    static constexpr auto AddressRewardRate{
        0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};
    static constexpr auto AddressClaimLockTime{
        0x0000000000000000000000000000000000000000000000000000000000000002_bytes32};
    static constexpr auto AddressSchemaVersion{
        0x0000000000000000000000000000000000000000000000000000000000000003_bytes32};
    static constexpr auto AddressReentrancyFlag{
        0x0000000000000000000000000000000000000000000000000000000000000004_bytes32};

    // Namespaces for mappings. Keys wider than a slot are hashed together
    // with their namespace byte.
    enum Namespace : uint8_t
    {
        NSStake = 0x02,
        NSReferrer = 0x03,
        NSRole = 0x04,
    };

public:
    explicit LedgerVariables(State &state)
        : state_{state}
    {
    }

    ////////////////
    //  Constants //
    ////////////////

    // Reward units per 1000 staked, per cycle
    StorageVariable<u256_be> reward_rate{state_, LEDGER_CA, AddressRewardRate};

    // Length of one reward cycle in seconds
    StorageVariable<u256_be> claim_lock_time{
        state_, LEDGER_CA, AddressClaimLockTime};

    // Version of the storage layout. Zero until initialized.
    StorageVariable<u64_be> schema_version{
        state_, LEDGER_CA, AddressSchemaVersion};

    // Set while a guarded operation is running
    StorageVariable<bool> reentrancy_flag{
        state_, LEDGER_CA, AddressReentrancyFlag};

    ////////////////
    //  Mappings  //
    ////////////////

    // mapping(address => mapping(address => StakeRecord)) stakes
    StorageVariable<StakeRecord>
    stake(Address const &account, Address const &asset) noexcept
    {
        struct Key
        {
            uint8_t ns;
            Address account;
            Address asset;
        };

        Key const key{.ns = NSStake, .account = account, .asset = asset};
        return {state_, LEDGER_CA, hashed_storage_key(key)};
    }

    // mapping(address => address) referralToReferrer
    //
    // Write once. One link covers deposits of every asset.
    StorageVariable<Address> referrer(Address const &referral) noexcept
    {
        struct
        {
            uint8_t ns;
            Address referral;
            uint8_t slots[11];
        } key{.ns = NSReferrer, .referral = referral, .slots = {}};

        return {state_, LEDGER_CA, std::bit_cast<bytes32_t>(key)};
    }

    // mapping(bytes32 => mapping(address => bool)) roles
    StorageVariable<bool>
    role_member(bytes32_t const &role, Address const &account) noexcept
    {
        struct Key
        {
            uint8_t ns;
            bytes32_t role;
            Address account;
        };

        Key const key{.ns = NSRole, .role = role, .account = account};
        return {state_, LEDGER_CA, hashed_storage_key(key)};
    }
};

ACCRUAL_LEDGER_NAMESPACE_END
