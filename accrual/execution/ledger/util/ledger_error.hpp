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
#include <accrual/core/int.hpp>
#include <accrual/core/result.hpp>
#include <accrual/execution/core/address.hpp>
#include <accrual/execution/ledger/config.hpp>

#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>
#include <variant>

ACCRUAL_LEDGER_NAMESPACE_BEGIN

enum class LedgerError
{
    Success = 0,
    InternalError,
    MethodNotSupported,
    InvalidInput,
    ValueNonZero,
    ZeroAmount,
    EarlyClaim,
    NothingToClaim,
    NothingToUnstake,
    ZeroReferrerBalance,
    SelfReferring,
    ReferrerAlreadySet,
    Unauthorized,
    BadConfirmation,
    ReentrantCall,
    AlreadyInitialized,
    InvalidSchemaVersion,
    UnknownAsset,
};

// Arguments of the failures that carry any. The ledger records them next to
// the error it returns.
struct EarlyClaimRevert
{
    uint256_t next_claim_timestamp;
};

struct ReferrerAlreadySetRevert
{
    Address referrer;
};

struct UnauthorizedRevert
{
    Address account;
    bytes32_t role;
};

using RevertArgs = std::variant<
    std::monostate, EarlyClaimRevert, ReferrerAlreadySetRevert,
    UnauthorizedRevert>;

// Revert output of a failed call. Ledger errors become Solidity custom
// errors, selector of e.g. "Staking__EarlyClaim(uint256)" followed by the
// arguments.
// Anything else reverts with its message text.
byte_string
encode_revert(Result<void>::error_type const &, RevertArgs const &);

ACCRUAL_LEDGER_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<accrual::ledger::LedgerError>
    : quick_status_code_from_enum_defaults<accrual::ledger::LedgerError>
{
    static constexpr auto const domain_name = "Ledger Error";
    static constexpr auto const domain_uuid =
        "32834e18-3dd5-4045-a95d-8484f9125ab9";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
