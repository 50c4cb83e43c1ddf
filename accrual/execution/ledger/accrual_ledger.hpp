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
#include <accrual/execution/asset/asset.hpp>
#include <accrual/execution/core/address.hpp>
#include <accrual/execution/core/contract/big_endian.hpp>
#include <accrual/execution/ledger/access_control.hpp>
#include <accrual/execution/ledger/config.hpp>
#include <accrual/execution/ledger/ledger_variables.hpp>
#include <accrual/execution/ledger/util/constants.hpp>
#include <accrual/execution/ledger/util/ledger_error.hpp>
#include <accrual/execution/ledger/util/schema_migration.hpp>

#include <evmc/evmc.h>

#include <cstdint>
#include <span>

ACCRUAL_NAMESPACE_BEGIN

class State;

ACCRUAL_NAMESPACE_END

ACCRUAL_LEDGER_NAMESPACE_BEGIN

// Per-account, per-asset deposits earning a fixed rate per elapsed cycle,
// with a one level referral bonus paid out of ledger reserves.
//
// A handle is cheap and bound to one call: `timestamp` is the current time
// of that call. All durable data lives in `State` under LEDGER_CA, so any
// number of handles over the same State see the same ledger. Operations do
// not undo partial effects on failure; callers run each one inside a State
// checkpoint and reject it on error, as call_ledger() does.
class AccrualLedger
{
    State &state_;
    AssetRegistry &assets_;
    uint64_t timestamp_;
    RevertArgs revert_args_{};

public:
    LedgerVariables vars;

private:
    AccessControl roles_;

public:
    struct Reward
    {
        uint256_t amount;
        uint256_t cycles;
    };

    AccrualLedger(State &, AssetRegistry &, uint64_t timestamp);
    AccrualLedger(AccrualLedger const &) = delete;
    AccrualLedger &operator=(AccrualLedger const &) = delete;

    uint64_t timestamp() const noexcept
    {
        return timestamp_;
    }

    // Arguments of the most recent failure that carries any: EarlyClaim,
    // ReferrerAlreadySet and Unauthorized
    RevertArgs const &revert_args() const noexcept
    {
        return revert_args_;
    }

    ////////////////
    // Operations //
    ////////////////

    Result<void> deposit(
        Address const &sender, Address const &asset, uint256_t const &amount);

    Result<void> claim(Address const &sender, Address const &asset);

    // Returns the whole balance together with the accrued reward
    Result<void> unstake(Address const &sender, Address const &asset);

    // `sender` becomes the referrer of `referral`. Requires an open position
    // of `sender` in `asset`.
    Result<void> set_referrer(
        Address const &sender, Address const &referral, Address const &asset);

    // No bounds are enforced on either parameter. A zero lock time makes
    // every elapsed second one cycle.
    Result<void> set_reward_rate(Address const &sender, uint256_t const &);
    Result<void> set_claim_lock_time(Address const &sender, uint256_t const &);

    Result<void> initialize(Address const &sender, Address const &admin);

    Result<void> upgrade_schema(
        Address const &sender, uint64_t target,
        std::span<SchemaMigration const> = builtin_migrations());

    Result<void> grant_role(
        Address const &sender, bytes32_t const &role, Address const &account);
    Result<void> revoke_role(
        Address const &sender, bytes32_t const &role, Address const &account);
    Result<void> renounce_role(
        Address const &sender, bytes32_t const &role,
        Address const &confirmation);

    /////////////
    // Queries //
    /////////////

    uint256_t reward_rate();
    uint256_t claim_lock_time();
    uint64_t schema_version();
    StakeRecord stake(Address const &account, Address const &asset);
    Address referrer(Address const &referral);
    bool has_role(bytes32_t const &role, Address const &account);

    // Pure: whole cycles elapsed since the last claim (or the deposit) and
    // the reward they earned
    Result<Reward>
    calculate_current_reward(Address const &account, Address const &asset);

private:
    /////////////
    // Events //
    /////////////

    // event Stake(
    //     address indexed account,
    //     address indexed asset,
    //     uint256         amount,
    //     uint256         timestamp);
    void emit_stake_event(
        Address const &account, Address const &asset, uint256_t const &amount);

    // event Claim(
    //     address indexed account,
    //     address indexed asset,
    //     uint256         amount);
    void emit_claim_event(
        Address const &account, Address const &asset, uint256_t const &amount);

    // event Unstake(
    //     address indexed account,
    //     address indexed asset);
    void emit_unstake_event(Address const &account, Address const &asset);

    // event ReferrerSet(
    //     address indexed referral,
    //     address indexed referrer);
    void
    emit_referrer_set_event(Address const &referral, Address const &referrer);

    // event RewardRateUpdated(uint256 oldRate, uint256 newRate);
    void emit_reward_rate_updated_event(
        u256_be const &old_rate, u256_be const &new_rate);

    // event ClaimLockTimeUpdated(uint256 oldLockTime, uint256 newLockTime);
    void emit_claim_lock_time_updated_event(
        u256_be const &old_lock_time, u256_be const &new_lock_time);

    // event Initialized(uint64 version);
    void emit_initialized_event(u64_be version);

    // event SchemaUpgraded(uint64 fromVersion, uint64 toVersion);
    void emit_schema_upgraded_event(u64_be from, u64_be to);

    /////////////
    // Helpers //
    /////////////

    Result<Asset *> resolve_asset(Address const &);

    // Sends `amount` of `asset` out of ledger custody
    Result<void> send_tokens(
        Address const &asset, Address const &to, uint256_t const &amount);

    // Pulls `amount` of `asset` from `from` into ledger custody
    Result<void> pull_tokens(
        Address const &asset, Address const &from, uint256_t const &amount);

    Result<void> check_role(bytes32_t const &role, Address const &account);

    uint256_t cycle_length();

    Result<Reward> compute_reward(StakeRecord const &);

public:
    using PrecompileFunc = Result<byte_string> (AccrualLedger::*)(
        byte_string_view, evmc_address const &, evmc_uint256be const &);

    /////////////////
    // Precompiles //
    /////////////////

    // Consumes the selector from `input`
    static PrecompileFunc precompile_dispatch(byte_string_view &input);

    Result<byte_string> precompile_deposit(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_claim(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_unstake(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_set_refer(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_set_new_reward_rate(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_set_new_claim_lock_time(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_initialize(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_upgrade_schema(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_grant_role(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_revoke_role(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_renounce_role(
        byte_string_view, evmc_address const &, evmc_uint256be const &);

    Result<byte_string> precompile_reward_rate(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_claim_lock_time(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_stakes(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_referral_to_referrer(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_calculate_current_reward(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_has_role(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_default_admin_role(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_upgrader_role(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_schema_version(
        byte_string_view, evmc_address const &, evmc_uint256be const &);

    Result<byte_string> precompile_fallback(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
};

ACCRUAL_LEDGER_NAMESPACE_END
