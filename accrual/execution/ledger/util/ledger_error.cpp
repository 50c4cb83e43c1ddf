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

#include <accrual/execution/core/contract/abi_encode.hpp>
#include <accrual/execution/core/contract/abi_signatures.hpp>
#include <accrual/execution/core/contract/big_endian.hpp>
#include <accrual/execution/ledger/util/ledger_error.hpp>

#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
#else
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
#endif

#include <cstdint>
#include <type_traits>

ACCRUAL_LEDGER_ANONYMOUS_NAMESPACE_BEGIN

struct CustomError
{
    LedgerError error;
    uint32_t selector;
};

constexpr CustomError custom_errors[] = {
    {LedgerError::InternalError, abi_encode_selector("InternalError()")},
    {LedgerError::MethodNotSupported,
     abi_encode_selector("MethodNotSupported()")},
    {LedgerError::InvalidInput, abi_encode_selector("InvalidInput()")},
    {LedgerError::ValueNonZero, abi_encode_selector("ValueNonZero()")},
    {LedgerError::ZeroAmount, abi_encode_selector("Staking__ZeroValue()")},
    {LedgerError::EarlyClaim,
     abi_encode_selector("Staking__EarlyClaim(uint256)")},
    {LedgerError::NothingToClaim,
     abi_encode_selector("Staking__NothingToClaim()")},
    {LedgerError::NothingToUnstake,
     abi_encode_selector("Staking__NothingToUnstake()")},
    {LedgerError::ZeroReferrerBalance,
     abi_encode_selector("Staking__ZeroReferrerBalance()")},
    {LedgerError::SelfReferring,
     abi_encode_selector("Staking__SelfReferringError()")},
    {LedgerError::ReferrerAlreadySet,
     abi_encode_selector("Staking__ReferrerAlreadySetted(address)")},
    {LedgerError::Unauthorized,
     abi_encode_selector("Unauthorized(address,bytes32)")},
    {LedgerError::BadConfirmation, abi_encode_selector("BadConfirmation()")},
    {LedgerError::ReentrantCall, abi_encode_selector("ReentrantCall()")},
    {LedgerError::AlreadyInitialized,
     abi_encode_selector("AlreadyInitialized()")},
    {LedgerError::InvalidSchemaVersion,
     abi_encode_selector("InvalidSchemaVersion()")},
    {LedgerError::UnknownAsset, abi_encode_selector("UnknownAsset()")},
};

static_assert(custom_errors[4].selector == 0xf1a2d31e);
static_assert(custom_errors[5].selector == 0xdd9d4c3f);
static_assert(custom_errors[10].selector == 0x0fa53516);
static_assert(custom_errors[11].selector == 0x245329c6);
static_assert(custom_errors[13].selector == 0x37ed32e8);

ACCRUAL_LEDGER_ANONYMOUS_NAMESPACE_END

ACCRUAL_LEDGER_NAMESPACE_BEGIN

byte_string encode_revert(
    Result<void>::error_type const &error, RevertArgs const &args)
{
    for (auto const &custom : custom_errors) {
        if (error != custom.error) {
            continue;
        }
        AbiEncoder encoder{custom.selector};
        // arguments left over from an unrelated failure are not encoded
        std::visit(
            [&encoder, &custom](auto const &a) {
                using T = std::decay_t<decltype(a)>;
                if constexpr (std::is_same_v<T, EarlyClaimRevert>) {
                    if (custom.error == LedgerError::EarlyClaim) {
                        encoder.add_uint(u256_be{a.next_claim_timestamp});
                    }
                }
                else if constexpr (std::is_same_v<
                                       T,
                                       ReferrerAlreadySetRevert>) {
                    if (custom.error == LedgerError::ReferrerAlreadySet) {
                        encoder.add_address(a.referrer);
                    }
                }
                else if constexpr (std::is_same_v<T, UnauthorizedRevert>) {
                    if (custom.error == LedgerError::Unauthorized) {
                        encoder.add_address(a.account);
                        encoder.add_bytes32(a.role);
                    }
                }
            },
            args);
        return encoder.encode_final();
    }

    auto const message = error.message();
    return byte_string{
        reinterpret_cast<uint8_t const *>(message.data()), message.size()};
}

ACCRUAL_LEDGER_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<accrual::ledger::LedgerError>::mapping> const &
quick_status_code_from_enum<accrual::ledger::LedgerError>::value_mappings()
{
    using accrual::ledger::LedgerError;

    static std::initializer_list<mapping> const v = {
        {LedgerError::Success, "success", {errc::success}},
        {LedgerError::InternalError, "internal error", {}},
        {LedgerError::MethodNotSupported, "method not supported", {}},
        {LedgerError::InvalidInput, "invalid input", {}},
        {LedgerError::ValueNonZero, "value is nonzero", {}},
        {LedgerError::ZeroAmount, "zero amount", {}},
        {LedgerError::EarlyClaim, "claim before a full cycle elapsed", {}},
        {LedgerError::NothingToClaim, "nothing to claim", {}},
        {LedgerError::NothingToUnstake, "nothing to unstake", {}},
        {LedgerError::ZeroReferrerBalance, "referrer has no stake", {}},
        {LedgerError::SelfReferring, "self referring", {}},
        {LedgerError::ReferrerAlreadySet, "referrer already set", {}},
        {LedgerError::Unauthorized, "unauthorized", {}},
        {LedgerError::BadConfirmation, "bad confirmation", {}},
        {LedgerError::ReentrantCall, "reentrant call", {}},
        {LedgerError::AlreadyInitialized, "already initialized", {}},
        {LedgerError::InvalidSchemaVersion, "invalid schema version", {}},
        {LedgerError::UnknownAsset, "unknown asset", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
