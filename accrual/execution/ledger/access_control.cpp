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

#include <accrual/execution/core/contract/abi_signatures.hpp>
#include <accrual/execution/core/contract/events.hpp>
#include <accrual/execution/ledger/access_control.hpp>
#include <accrual/execution/ledger/util/constants.hpp>
#include <accrual/execution/state/state.hpp>

ACCRUAL_LEDGER_NAMESPACE_BEGIN

AccessControl::AccessControl(State &state, LedgerVariables &vars)
    : state_{state}
    , vars_{vars}
{
}

void AccessControl::emit_role_granted_event(
    bytes32_t const &role, Address const &account, Address const &sender)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("RoleGranted(bytes32,address,address)");
    static_assert(
        signature ==
        0x2f8788117e7eff1d82e926ec794901d17c78024a50270940304540a733656f0d_bytes32);

    auto const event = EventBuilder(LEDGER_CA, signature)
                           .add_topic(role)
                           .add_topic(account)
                           .add_topic(sender)
                           .build();
    state_.store_log(event);
}

void AccessControl::emit_role_revoked_event(
    bytes32_t const &role, Address const &account, Address const &sender)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("RoleRevoked(bytes32,address,address)");
    static_assert(
        signature ==
        0xf6391f5c32d9c69d2a47ea670b442974b53935d1edc7fd64eb21e047a839171b_bytes32);

    auto const event = EventBuilder(LEDGER_CA, signature)
                           .add_topic(role)
                           .add_topic(account)
                           .add_topic(sender)
                           .build();
    state_.store_log(event);
}

bool AccessControl::has_role(bytes32_t const &role, Address const &account)
{
    return vars_.role_member(role, account).load();
}

bytes32_t const &AccessControl::role_admin(bytes32_t const &) noexcept
{
    return DEFAULT_ADMIN_ROLE;
}

bool AccessControl::grant_role(
    bytes32_t const &role, Address const &account, Address const &sender)
{
    auto member = vars_.role_member(role, account);
    if (member.load()) {
        return false;
    }
    member.store(true);
    emit_role_granted_event(role, account, sender);
    return true;
}

bool AccessControl::revoke_role(
    bytes32_t const &role, Address const &account, Address const &sender)
{
    auto member = vars_.role_member(role, account);
    if (!member.load()) {
        return false;
    }
    member.clear();
    emit_role_revoked_event(role, account, sender);
    return true;
}

ACCRUAL_LEDGER_NAMESPACE_END
