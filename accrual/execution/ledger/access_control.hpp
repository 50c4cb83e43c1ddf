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
#include <accrual/execution/ledger/config.hpp>
#include <accrual/execution/ledger/ledger_variables.hpp>

ACCRUAL_NAMESPACE_BEGIN

class State;

ACCRUAL_NAMESPACE_END

ACCRUAL_LEDGER_NAMESPACE_BEGIN

// Role membership of ledger accounts. Authorization of who may change
// membership is decided by the caller; this only records it and emits the
// events.
class AccessControl
{
    State &state_;
    LedgerVariables &vars_;

    // event RoleGranted(
    //     bytes32 indexed role,
    //     address indexed account,
    //     address indexed sender);
    void emit_role_granted_event(
        bytes32_t const &role, Address const &account, Address const &sender);

    // event RoleRevoked(
    //     bytes32 indexed role,
    //     address indexed account,
    //     address indexed sender);
    void emit_role_revoked_event(
        bytes32_t const &role, Address const &account, Address const &sender);

public:
    AccessControl(State &, LedgerVariables &);

    bool has_role(bytes32_t const &role, Address const &account);

    // Every role, DEFAULT_ADMIN_ROLE included, is administered by
    // DEFAULT_ADMIN_ROLE
    static bytes32_t const &role_admin(bytes32_t const &role) noexcept;

    // Both return whether membership changed. No event when it did not.
    bool grant_role(
        bytes32_t const &role, Address const &account, Address const &sender);
    bool revoke_role(
        bytes32_t const &role, Address const &account, Address const &sender);
};

ACCRUAL_LEDGER_NAMESPACE_END
