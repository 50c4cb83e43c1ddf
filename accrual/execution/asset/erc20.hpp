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
#include <accrual/core/int.hpp>
#include <accrual/core/result.hpp>
#include <accrual/execution/asset/asset.hpp>
#include <accrual/execution/asset/token_error.hpp>
#include <accrual/execution/core/address.hpp>
#include <accrual/execution/core/contract/big_endian.hpp>
#include <accrual/execution/core/contract/storage_variable.hpp>

#include <bit>
#include <cstdint>

ACCRUAL_NAMESPACE_BEGIN

// ERC-20 style fungible token kept in the storage of its own address on a
// shared State, so its balances roll back together with whatever call moved
// them.
class Erc20Token final : public Asset
{
    State &state_;
    Address address_;

    static constexpr auto AddressTotalSupply{
        0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};

    enum Namespace : uint8_t
    {
        NSBalance = 0x01,
        NSAllowance = 0x02,
    };

    StorageVariable<u256_be> total_supply_() const noexcept
    {
        return {state_, address_, AddressTotalSupply};
    }

    // mapping(address => uint256) balances
    StorageVariable<u256_be> balance_(Address const &account) const noexcept
    {
        struct
        {
            uint8_t ns;
            Address account;
            uint8_t slots[11];
        } key{.ns = NSBalance, .account = account, .slots = {}};

        return {state_, address_, std::bit_cast<bytes32_t>(key)};
    }

    // mapping(address => mapping(address => uint256)) allowances
    StorageVariable<u256_be>
    allowance_(Address const &owner, Address const &spender) const noexcept
    {
        struct Key
        {
            uint8_t ns;
            Address owner;
            Address spender;
        };

        Key const key{.ns = NSAllowance, .owner = owner, .spender = spender};
        return {state_, address_, hashed_storage_key(key)};
    }

    // event Transfer(
    //     address indexed from,
    //     address indexed to,
    //     uint256         value);
    void emit_transfer_event(
        Address const &from, Address const &to, uint256_t const &value);

    // event Approval(
    //     address indexed owner,
    //     address indexed spender,
    //     uint256         value);
    void emit_approval_event(
        Address const &owner, Address const &spender, uint256_t const &value);

    Result<void>
    move(Address const &from, Address const &to, uint256_t const &amount);

public:
    Erc20Token(State &, Address const &);

    Address const &address() const noexcept
    {
        return address_;
    }

    uint256_t total_supply() const;
    uint256_t balance_of(Address const &) const;
    uint256_t allowance(Address const &owner, Address const &spender) const;

    // Creates `amount` new tokens owned by `to`, as the deployment of the
    // token does with its initial supply
    Result<void> mint(Address const &to, uint256_t const &amount);

    Result<void> approve(
        Address const &owner, Address const &spender, uint256_t const &amount);

    Result<void> transfer(
        Address const &sender, Address const &to,
        uint256_t const &amount) override;

    Result<void> transfer_from(
        Address const &spender, Address const &owner, Address const &to,
        uint256_t const &amount) override;
};

ACCRUAL_NAMESPACE_END
