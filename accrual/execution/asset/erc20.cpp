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

#include <accrual/core/likely.h>
#include <accrual/execution/asset/erc20.hpp>
#include <accrual/execution/asset/token_error.hpp>
#include <accrual/execution/core/contract/abi_encode.hpp>
#include <accrual/execution/core/contract/abi_signatures.hpp>
#include <accrual/execution/core/contract/checked_math.hpp>
#include <accrual/execution/core/contract/events.hpp>
#include <accrual/execution/state/state.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

ACCRUAL_NAMESPACE_BEGIN

Erc20Token::Erc20Token(State &state, Address const &address)
    : state_{state}
    , address_{address}
{
}

/////////////
// Events //
/////////////

void Erc20Token::emit_transfer_event(
    Address const &from, Address const &to, uint256_t const &value)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("Transfer(address,address,uint256)");
    static_assert(
        signature ==
        0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef_bytes32);

    auto const event = EventBuilder(address_, signature)
                           .add_topic(from)
                           .add_topic(to)
                           .add_data(abi_encode_uint(u256_be{value}))
                           .build();
    state_.store_log(event);
}

void Erc20Token::emit_approval_event(
    Address const &owner, Address const &spender, uint256_t const &value)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("Approval(address,address,uint256)");
    static_assert(
        signature ==
        0x8c5be1e5ebec7d5bd14f71427d1e84f3dd0314c0f7b2291e5b200ac8c7c3b925_bytes32);

    auto const event = EventBuilder(address_, signature)
                           .add_topic(owner)
                           .add_topic(spender)
                           .add_data(abi_encode_uint(u256_be{value}))
                           .build();
    state_.store_log(event);
}

/////////////
// Queries //
/////////////

uint256_t Erc20Token::total_supply() const
{
    return total_supply_().load().native();
}

uint256_t Erc20Token::balance_of(Address const &account) const
{
    return balance_(account).load().native();
}

uint256_t
Erc20Token::allowance(Address const &owner, Address const &spender) const
{
    return allowance_(owner, spender).load().native();
}

///////////////
// Mutations //
///////////////

Result<void>
Erc20Token::move(Address const &from, Address const &to, uint256_t const &amount)
{
    if (ACCRUAL_UNLIKELY(to == Address{})) {
        return TokenError::InvalidReceiver;
    }

    auto from_balance = balance_(from);
    uint256_t const available = from_balance.load().native();
    if (ACCRUAL_UNLIKELY(available < amount)) {
        return TokenError::InsufficientBalance;
    }
    from_balance.store(available - amount);

    // cannot overflow, every balance is bounded by the total supply
    auto to_balance = balance_(to);
    to_balance.store(to_balance.load().native() + amount);

    emit_transfer_event(from, to, amount);
    return outcome::success();
}

Result<void> Erc20Token::mint(Address const &to, uint256_t const &amount)
{
    if (ACCRUAL_UNLIKELY(to == Address{})) {
        return TokenError::InvalidReceiver;
    }

    auto supply = total_supply_();
    BOOST_OUTCOME_TRY(
        auto const new_supply, checked_add(supply.load().native(), amount));
    supply.store(new_supply);

    auto balance = balance_(to);
    balance.store(balance.load().native() + amount);

    emit_transfer_event(Address{}, to, amount);
    return outcome::success();
}

Result<void> Erc20Token::approve(
    Address const &owner, Address const &spender, uint256_t const &amount)
{
    if (ACCRUAL_UNLIKELY(spender == Address{})) {
        return TokenError::InvalidSpender;
    }

    allowance_(owner, spender).store(amount);
    emit_approval_event(owner, spender, amount);
    return outcome::success();
}

Result<void> Erc20Token::transfer(
    Address const &sender, Address const &to, uint256_t const &amount)
{
    return move(sender, to, amount);
}

Result<void> Erc20Token::transfer_from(
    Address const &spender, Address const &owner, Address const &to,
    uint256_t const &amount)
{
    auto allowed = allowance_(owner, spender);
    uint256_t const current = allowed.load().native();
    if (ACCRUAL_UNLIKELY(current < amount)) {
        return TokenError::InsufficientAllowance;
    }

    BOOST_OUTCOME_TRY(move(owner, to, amount));

    // an unlimited allowance is never spent down
    if (current != UINT256_MAX) {
        allowed.store(current - amount);
    }
    return outcome::success();
}

ACCRUAL_NAMESPACE_END
