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

#include <accrual/core/byte_string.hpp>
#include <accrual/core/int.hpp>
#include <accrual/core/likely.h>
#include <accrual/execution/core/address.hpp>
#include <accrual/execution/core/contract/abi_decode.hpp>
#include <accrual/execution/core/contract/abi_encode.hpp>
#include <accrual/execution/core/contract/abi_signatures.hpp>
#include <accrual/execution/core/contract/checked_math.hpp>
#include <accrual/execution/core/contract/events.hpp>
#include <accrual/execution/core/fmt/address_fmt.hpp> // NOLINT
#include <accrual/execution/core/fmt/int_fmt.hpp> // NOLINT
#include <accrual/execution/ledger/accrual_ledger.hpp>
#include <accrual/execution/ledger/util/reentrancy_guard.hpp>
#include <accrual/execution/state/state.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>

ACCRUAL_LEDGER_ANONYMOUS_NAMESPACE_BEGIN

////////////////////////
// Function Selectors //
////////////////////////

struct PrecompileSelector
{
    static constexpr uint32_t DEPOSIT =
        abi_encode_selector("deposit(address,uint256)");
    static constexpr uint32_t CLAIM = abi_encode_selector("claim(address)");
    static constexpr uint32_t UNSTAKE = abi_encode_selector("unstake(address)");
    static constexpr uint32_t SET_REFER =
        abi_encode_selector("setRefer(address,address)");
    static constexpr uint32_t SET_NEW_REWARD_RATE =
        abi_encode_selector("setNewRewardRate(uint256)");
    static constexpr uint32_t SET_NEW_CLAIM_LOCK_TIME =
        abi_encode_selector("setNewClaimLockTime(uint256)");
    static constexpr uint32_t INITIALIZE =
        abi_encode_selector("initialize(address)");
    static constexpr uint32_t UPGRADE_SCHEMA =
        abi_encode_selector("upgradeSchema(uint64)");
    static constexpr uint32_t GRANT_ROLE =
        abi_encode_selector("grantRole(bytes32,address)");
    static constexpr uint32_t REVOKE_ROLE =
        abi_encode_selector("revokeRole(bytes32,address)");
    static constexpr uint32_t RENOUNCE_ROLE =
        abi_encode_selector("renounceRole(bytes32,address)");
    static constexpr uint32_t REWARD_RATE = abi_encode_selector("rewardRate()");
    static constexpr uint32_t CLAIM_LOCK_TIME =
        abi_encode_selector("claimLockTime()");
    static constexpr uint32_t STAKES =
        abi_encode_selector("stakes(address,address)");
    static constexpr uint32_t REFERRAL_TO_REFERRER =
        abi_encode_selector("referralToReferrer(address)");
    static constexpr uint32_t CALCULATE_CURRENT_REWARD =
        abi_encode_selector("calculateCurrentReward(address,address)");
    static constexpr uint32_t HAS_ROLE =
        abi_encode_selector("hasRole(bytes32,address)");
    static constexpr uint32_t DEFAULT_ADMIN_ROLE =
        abi_encode_selector("DEFAULT_ADMIN_ROLE()");
    static constexpr uint32_t UPGRADER_ROLE =
        abi_encode_selector("UPGRADER_ROLE()");
    static constexpr uint32_t SCHEMA_VERSION =
        abi_encode_selector("schemaVersion()");
};

static_assert(PrecompileSelector::DEPOSIT == 0x47e7ef24);
static_assert(PrecompileSelector::CLAIM == 0x1e83409a);
static_assert(PrecompileSelector::UNSTAKE == 0xf2888dbb);
static_assert(PrecompileSelector::SET_REFER == 0x93c88f83);
static_assert(PrecompileSelector::SET_NEW_REWARD_RATE == 0x61710aaa);
static_assert(PrecompileSelector::SET_NEW_CLAIM_LOCK_TIME == 0x4725d6d6);
static_assert(PrecompileSelector::INITIALIZE == 0xc4d66de8);
static_assert(PrecompileSelector::UPGRADE_SCHEMA == 0x8c82350c);
static_assert(PrecompileSelector::GRANT_ROLE == 0x2f2ff15d);
static_assert(PrecompileSelector::REVOKE_ROLE == 0xd547741f);
static_assert(PrecompileSelector::RENOUNCE_ROLE == 0x36568abe);
static_assert(PrecompileSelector::REWARD_RATE == 0x7b0a47ee);
static_assert(PrecompileSelector::CLAIM_LOCK_TIME == 0x8b738a21);
static_assert(PrecompileSelector::STAKES == 0xa4e47b66);
static_assert(PrecompileSelector::REFERRAL_TO_REFERRER == 0xdeaf0fa1);
static_assert(PrecompileSelector::CALCULATE_CURRENT_REWARD == 0x37d65645);
static_assert(PrecompileSelector::HAS_ROLE == 0x91d14854);
static_assert(PrecompileSelector::DEFAULT_ADMIN_ROLE == 0xa217fddf);
static_assert(PrecompileSelector::UPGRADER_ROLE == 0xf72c0d8b);
static_assert(PrecompileSelector::SCHEMA_VERSION == 0x4e2ce6d3);

Result<void> function_not_payable(evmc_uint256be const &value)
{
    bool const all_zero = std::all_of(
        value.bytes,
        value.bytes + sizeof(evmc_uint256be),
        [](uint8_t const byte) { return byte == 0; });

    if (ACCRUAL_UNLIKELY(!all_zero)) {
        return LedgerError::ValueNonZero;
    }
    return outcome::success();
}

Result<void> expect_consumed(byte_string_view const input)
{
    if (ACCRUAL_UNLIKELY(!input.empty())) {
        return LedgerError::InvalidInput;
    }
    return outcome::success();
}

ACCRUAL_LEDGER_ANONYMOUS_NAMESPACE_END

ACCRUAL_LEDGER_NAMESPACE_BEGIN

AccrualLedger::AccrualLedger(
    State &state, AssetRegistry &assets, uint64_t const timestamp)
    : state_{state}
    , assets_{assets}
    , timestamp_{timestamp}
    , vars{state}
    , roles_{state, vars}
{
}

/////////////
// Events //
/////////////

void AccrualLedger::emit_stake_event(
    Address const &account, Address const &asset, uint256_t const &amount)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("Stake(address,address,uint256,uint256)");
    static_assert(
        signature ==
        0x63602d0ecc7b3a0ef7ff1a116e23056662d64280355ba8031b6d0d767c4b4458_bytes32);

    auto const event = EventBuilder(LEDGER_CA, signature)
                           .add_topic(account)
                           .add_topic(asset)
                           .add_data(abi_encode_uint(u256_be{amount}))
                           .add_data(abi_encode_uint(u64_be{timestamp_}))
                           .build();
    state_.store_log(event);
}

void AccrualLedger::emit_claim_event(
    Address const &account, Address const &asset, uint256_t const &amount)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("Claim(address,address,uint256)");
    static_assert(
        signature ==
        0x70eb43c4a8ae8c40502dcf22436c509c28d6ff421cf07c491be56984bd987068_bytes32);

    auto const event = EventBuilder(LEDGER_CA, signature)
                           .add_topic(account)
                           .add_topic(asset)
                           .add_data(abi_encode_uint(u256_be{amount}))
                           .build();
    state_.store_log(event);
}

void AccrualLedger::emit_unstake_event(
    Address const &account, Address const &asset)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("Unstake(address,address)");
    static_assert(
        signature ==
        0x5f29108e674363437824f677d43735dc48a3956bbf8045b2989fc094b6b741a9_bytes32);

    auto const event = EventBuilder(LEDGER_CA, signature)
                           .add_topic(account)
                           .add_topic(asset)
                           .build();
    state_.store_log(event);
}

void AccrualLedger::emit_referrer_set_event(
    Address const &referral, Address const &referrer)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("ReferrerSet(address,address)");
    static_assert(
        signature ==
        0x5f7165288eef601591cf549e15ff19ef9060b7f71b9c115be946fa1fe7ebf68a_bytes32);

    auto const event = EventBuilder(LEDGER_CA, signature)
                           .add_topic(referral)
                           .add_topic(referrer)
                           .build();
    state_.store_log(event);
}

void AccrualLedger::emit_reward_rate_updated_event(
    u256_be const &old_rate, u256_be const &new_rate)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("RewardRateUpdated(uint256,uint256)");
    static_assert(
        signature ==
        0xc390a98ace15a7bb6bab611eedfdbb2685043b241a869420043cdfb23ccfee50_bytes32);

    auto const event = EventBuilder(LEDGER_CA, signature)
                           .add_data(abi_encode_uint(old_rate))
                           .add_data(abi_encode_uint(new_rate))
                           .build();
    state_.store_log(event);
}

void AccrualLedger::emit_claim_lock_time_updated_event(
    u256_be const &old_lock_time, u256_be const &new_lock_time)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("ClaimLockTimeUpdated(uint256,uint256)");
    static_assert(
        signature ==
        0x34820a8a3b83f1a28b0dac1d87890a1cf40948d0bf8377c4e2e357d34f6dbb1e_bytes32);

    auto const event = EventBuilder(LEDGER_CA, signature)
                           .add_data(abi_encode_uint(old_lock_time))
                           .add_data(abi_encode_uint(new_lock_time))
                           .build();
    state_.store_log(event);
}

void AccrualLedger::emit_initialized_event(u64_be const version)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("Initialized(uint64)");
    static_assert(
        signature ==
        0xc7f505b2f371ae2175ee4913f4499e1f2633a7b5936321eed1cdaeb6115181d2_bytes32);

    auto const event = EventBuilder(LEDGER_CA, signature)
                           .add_data(abi_encode_uint(version))
                           .build();
    state_.store_log(event);
}

void AccrualLedger::emit_schema_upgraded_event(
    u64_be const from, u64_be const to)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("SchemaUpgraded(uint64,uint64)");
    static_assert(
        signature ==
        0x6f96c032f7c9c0293fc4c9c655b83cff802a21ea37ee8ebbabafcb7cb3a1b0f8_bytes32);

    auto const event = EventBuilder(LEDGER_CA, signature)
                           .add_data(abi_encode_uint(from))
                           .add_data(abi_encode_uint(to))
                           .build();
    state_.store_log(event);
}

//////////////
// Helpers //
//////////////

Result<Asset *> AccrualLedger::resolve_asset(Address const &id)
{
    Asset *const asset = assets_.find(id);
    if (ACCRUAL_UNLIKELY(asset == nullptr)) {
        return LedgerError::UnknownAsset;
    }
    return asset;
}

Result<void> AccrualLedger::send_tokens(
    Address const &asset, Address const &to, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(auto *const a, resolve_asset(asset));
    return a->transfer(LEDGER_CA, to, amount);
}

Result<void> AccrualLedger::pull_tokens(
    Address const &asset, Address const &from, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(auto *const a, resolve_asset(asset));
    return a->transfer_from(LEDGER_CA, from, LEDGER_CA, amount);
}

Result<void>
AccrualLedger::check_role(bytes32_t const &role, Address const &account)
{
    if (ACCRUAL_UNLIKELY(!roles_.has_role(role, account))) {
        revert_args_ = UnauthorizedRevert{.account = account, .role = role};
        return LedgerError::Unauthorized;
    }
    return outcome::success();
}

uint256_t AccrualLedger::cycle_length()
{
    uint256_t const lock = vars.claim_lock_time.load().native();
    return lock == 0 ? MIN_CYCLE_LENGTH : lock;
}

Result<AccrualLedger::Reward>
AccrualLedger::compute_reward(StakeRecord const &record)
{
    uint64_t const last = record.last_claim_timestamp.native();
    uint64_t const since = last != 0 ? last : record.stake_timestamp.native();
    if (since == 0) {
        return Reward{.amount = 0, .cycles = 0};
    }

    BOOST_OUTCOME_TRY(
        auto const elapsed,
        checked_sub(uint256_t{timestamp_}, uint256_t{since}));
    uint256_t const cycles = elapsed / cycle_length();

    // balance * rate must fit, the product with cycles is carried wide
    BOOST_OUTCOME_TRY(
        auto const per_cycle,
        checked_mul(
            record.balance.native(), vars.reward_rate.load().native()));
    BOOST_OUTCOME_TRY(
        auto const amount,
        checked_mul_div(per_cycle, cycles, REWARD_RATE_DENOMINATOR));

    return Reward{.amount = amount, .cycles = cycles};
}

////////////////
// Operations //
////////////////

Result<void> AccrualLedger::deposit(
    Address const &sender, Address const &asset, uint256_t const &amount)
{
    ReentrancyGuard guard{vars.reentrancy_flag};
    BOOST_OUTCOME_TRY(guard.enter());

    if (ACCRUAL_UNLIKELY(amount == 0)) {
        return LedgerError::ZeroAmount;
    }

    auto position = vars.stake(sender, asset);
    auto record = position.load();
    BOOST_OUTCOME_TRY(
        auto const new_balance, checked_add(record.balance.native(), amount));

    // an open position is paid out first and restarts its cycle at now
    if (!record.balance.is_zero()) {
        BOOST_OUTCOME_TRY(auto const reward, compute_reward(record));
        if (reward.amount != 0) {
            BOOST_OUTCOME_TRY(send_tokens(asset, sender, reward.amount));
        }
    }

    if (auto const referrer = vars.referrer(sender).load_checked()) {
        BOOST_OUTCOME_TRY(
            auto const bonus,
            checked_mul_div(
                amount, REFERRAL_BONUS, REFERRAL_BONUS_DENOMINATOR));
        if (bonus != 0) {
            LOG_DEBUG(
                "AccrualLedger: referral bonus {} to {} for deposit of {}",
                bonus,
                *referrer,
                sender);
            BOOST_OUTCOME_TRY(send_tokens(asset, *referrer, bonus));
        }
    }

    BOOST_OUTCOME_TRY(pull_tokens(asset, sender, amount));

    record.balance = new_balance;
    record.stake_timestamp = timestamp_;
    record.last_claim_timestamp = timestamp_;
    position.store(record);

    emit_stake_event(sender, asset, amount);
    return outcome::success();
}

Result<void> AccrualLedger::claim(Address const &sender, Address const &asset)
{
    ReentrancyGuard guard{vars.reentrancy_flag};
    BOOST_OUTCOME_TRY(guard.enter());

    auto position = vars.stake(sender, asset);
    auto record = position.load();
    BOOST_OUTCOME_TRY(auto const reward, compute_reward(record));

    uint256_t const last = record.last_claim_timestamp.native();
    uint256_t const cycle = cycle_length();
    if (reward.cycles < 1) {
        BOOST_OUTCOME_TRY(auto const next, checked_add(last, cycle));
        revert_args_ = EarlyClaimRevert{.next_claim_timestamp = next};
        return LedgerError::EarlyClaim;
    }
    if (reward.amount == 0) {
        return LedgerError::NothingToClaim;
    }

    BOOST_OUTCOME_TRY(send_tokens(asset, sender, reward.amount));

    // advance by whole cycles only, the remainder counts toward the next one
    uint256_t const since =
        last != 0 ? last : uint256_t{record.stake_timestamp.native()};
    BOOST_OUTCOME_TRY(auto const advance, checked_mul(reward.cycles, cycle));
    BOOST_OUTCOME_TRY(auto const new_last, checked_add(since, advance));
    record.last_claim_timestamp = static_cast<uint64_t>(new_last);
    position.store(record);

    emit_claim_event(sender, asset, reward.amount);
    return outcome::success();
}

Result<void> AccrualLedger::unstake(Address const &sender, Address const &asset)
{
    ReentrancyGuard guard{vars.reentrancy_flag};
    BOOST_OUTCOME_TRY(guard.enter());

    auto position = vars.stake(sender, asset);
    auto const record = position.load();
    if (ACCRUAL_UNLIKELY(record.balance.is_zero())) {
        return LedgerError::NothingToUnstake;
    }

    BOOST_OUTCOME_TRY(auto const reward, compute_reward(record));
    BOOST_OUTCOME_TRY(
        auto const payout, checked_add(record.balance.native(), reward.amount));
    BOOST_OUTCOME_TRY(send_tokens(asset, sender, payout));

    position.clear();

    emit_unstake_event(sender, asset);
    return outcome::success();
}

Result<void> AccrualLedger::set_referrer(
    Address const &sender, Address const &referral, Address const &asset)
{
    ReentrancyGuard guard{vars.reentrancy_flag};
    BOOST_OUTCOME_TRY(guard.enter());

    if (ACCRUAL_UNLIKELY(sender == referral)) {
        return LedgerError::SelfReferring;
    }

    auto link = vars.referrer(referral);
    if (auto const existing = link.load_checked()) {
        revert_args_ = ReferrerAlreadySetRevert{.referrer = *existing};
        return LedgerError::ReferrerAlreadySet;
    }

    if (ACCRUAL_UNLIKELY(vars.stake(sender, asset).load().balance.is_zero())) {
        return LedgerError::ZeroReferrerBalance;
    }

    link.store(sender);
    emit_referrer_set_event(referral, sender);
    return outcome::success();
}

Result<void> AccrualLedger::set_reward_rate(
    Address const &sender, uint256_t const &new_rate)
{
    BOOST_OUTCOME_TRY(check_role(DEFAULT_ADMIN_ROLE, sender));

    u256_be const old_rate = vars.reward_rate.load();
    vars.reward_rate.store(new_rate);
    emit_reward_rate_updated_event(old_rate, new_rate);
    return outcome::success();
}

Result<void> AccrualLedger::set_claim_lock_time(
    Address const &sender, uint256_t const &new_lock_time)
{
    BOOST_OUTCOME_TRY(check_role(DEFAULT_ADMIN_ROLE, sender));

    u256_be const old_lock_time = vars.claim_lock_time.load();
    vars.claim_lock_time.store(new_lock_time);
    emit_claim_lock_time_updated_event(old_lock_time, new_lock_time);
    return outcome::success();
}

Result<void>
AccrualLedger::initialize(Address const &sender, Address const &admin)
{
    if (ACCRUAL_UNLIKELY(vars.schema_version.load().native() != 0)) {
        return LedgerError::AlreadyInitialized;
    }

    roles_.grant_role(DEFAULT_ADMIN_ROLE, admin, sender);
    roles_.grant_role(UPGRADER_ROLE, admin, sender);

    constexpr uint64_t initial_version = 1;
    BOOST_OUTCOME_TRY(
        migrate_schema(vars, initial_version, builtin_migrations()));

    LOG_INFO("AccrualLedger: initialized with admin {}", admin);
    emit_initialized_event(initial_version);
    return outcome::success();
}

Result<void> AccrualLedger::upgrade_schema(
    Address const &sender, uint64_t const target,
    std::span<SchemaMigration const> const migrations)
{
    BOOST_OUTCOME_TRY(check_role(UPGRADER_ROLE, sender));

    uint64_t const from = vars.schema_version.load().native();
    BOOST_OUTCOME_TRY(migrate_schema(vars, target, migrations));

    LOG_INFO(
        "AccrualLedger: schema upgraded from version {} to {}", from, target);
    emit_schema_upgraded_event(from, target);
    return outcome::success();
}

Result<void> AccrualLedger::grant_role(
    Address const &sender, bytes32_t const &role, Address const &account)
{
    BOOST_OUTCOME_TRY(check_role(AccessControl::role_admin(role), sender));
    roles_.grant_role(role, account, sender);
    return outcome::success();
}

Result<void> AccrualLedger::revoke_role(
    Address const &sender, bytes32_t const &role, Address const &account)
{
    BOOST_OUTCOME_TRY(check_role(AccessControl::role_admin(role), sender));
    roles_.revoke_role(role, account, sender);
    return outcome::success();
}

Result<void> AccrualLedger::renounce_role(
    Address const &sender, bytes32_t const &role, Address const &confirmation)
{
    if (ACCRUAL_UNLIKELY(confirmation != sender)) {
        return LedgerError::BadConfirmation;
    }
    roles_.revoke_role(role, sender, sender);
    return outcome::success();
}

/////////////
// Queries //
/////////////

uint256_t AccrualLedger::reward_rate()
{
    return vars.reward_rate.load().native();
}

uint256_t AccrualLedger::claim_lock_time()
{
    return vars.claim_lock_time.load().native();
}

uint64_t AccrualLedger::schema_version()
{
    return vars.schema_version.load().native();
}

StakeRecord AccrualLedger::stake(Address const &account, Address const &asset)
{
    return vars.stake(account, asset).load();
}

Address AccrualLedger::referrer(Address const &referral)
{
    return vars.referrer(referral).load();
}

bool AccrualLedger::has_role(bytes32_t const &role, Address const &account)
{
    return roles_.has_role(role, account);
}

Result<AccrualLedger::Reward> AccrualLedger::calculate_current_reward(
    Address const &account, Address const &asset)
{
    return compute_reward(vars.stake(account, asset).load());
}

///////////////////
//  Precompiles  //
///////////////////

AccrualLedger::PrecompileFunc
AccrualLedger::precompile_dispatch(byte_string_view &input)
{
    if (ACCRUAL_UNLIKELY(input.size() < 4)) {
        return &AccrualLedger::precompile_fallback;
    }

    auto const signature =
        intx::be::unsafe::load<uint32_t>(input.substr(0, 4).data());
    input.remove_prefix(4);

    switch (signature) {
    case PrecompileSelector::DEPOSIT:
        return &AccrualLedger::precompile_deposit;
    case PrecompileSelector::CLAIM:
        return &AccrualLedger::precompile_claim;
    case PrecompileSelector::UNSTAKE:
        return &AccrualLedger::precompile_unstake;
    case PrecompileSelector::SET_REFER:
        return &AccrualLedger::precompile_set_refer;
    case PrecompileSelector::SET_NEW_REWARD_RATE:
        return &AccrualLedger::precompile_set_new_reward_rate;
    case PrecompileSelector::SET_NEW_CLAIM_LOCK_TIME:
        return &AccrualLedger::precompile_set_new_claim_lock_time;
    case PrecompileSelector::INITIALIZE:
        return &AccrualLedger::precompile_initialize;
    case PrecompileSelector::UPGRADE_SCHEMA:
        return &AccrualLedger::precompile_upgrade_schema;
    case PrecompileSelector::GRANT_ROLE:
        return &AccrualLedger::precompile_grant_role;
    case PrecompileSelector::REVOKE_ROLE:
        return &AccrualLedger::precompile_revoke_role;
    case PrecompileSelector::RENOUNCE_ROLE:
        return &AccrualLedger::precompile_renounce_role;
    case PrecompileSelector::REWARD_RATE:
        return &AccrualLedger::precompile_reward_rate;
    case PrecompileSelector::CLAIM_LOCK_TIME:
        return &AccrualLedger::precompile_claim_lock_time;
    case PrecompileSelector::STAKES:
        return &AccrualLedger::precompile_stakes;
    case PrecompileSelector::REFERRAL_TO_REFERRER:
        return &AccrualLedger::precompile_referral_to_referrer;
    case PrecompileSelector::CALCULATE_CURRENT_REWARD:
        return &AccrualLedger::precompile_calculate_current_reward;
    case PrecompileSelector::HAS_ROLE:
        return &AccrualLedger::precompile_has_role;
    case PrecompileSelector::DEFAULT_ADMIN_ROLE:
        return &AccrualLedger::precompile_default_admin_role;
    case PrecompileSelector::UPGRADER_ROLE:
        return &AccrualLedger::precompile_upgrader_role;
    case PrecompileSelector::SCHEMA_VERSION:
        return &AccrualLedger::precompile_schema_version;
    default:
        return &AccrualLedger::precompile_fallback;
    }
}

Result<byte_string> AccrualLedger::precompile_deposit(
    byte_string_view input, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));

    BOOST_OUTCOME_TRY(auto const asset, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(auto const amount, abi_decode_fixed<u256_be>(input));
    BOOST_OUTCOME_TRY(expect_consumed(input));

    BOOST_OUTCOME_TRY(deposit(msg_sender, asset, amount.native()));
    return byte_string{abi_encode_bool(true)};
}

Result<byte_string> AccrualLedger::precompile_claim(
    byte_string_view input, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));

    BOOST_OUTCOME_TRY(auto const asset, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(expect_consumed(input));

    BOOST_OUTCOME_TRY(claim(msg_sender, asset));
    return byte_string{abi_encode_bool(true)};
}

Result<byte_string> AccrualLedger::precompile_unstake(
    byte_string_view input, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));

    BOOST_OUTCOME_TRY(auto const asset, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(expect_consumed(input));

    BOOST_OUTCOME_TRY(unstake(msg_sender, asset));
    return byte_string{abi_encode_bool(true)};
}

Result<byte_string> AccrualLedger::precompile_set_refer(
    byte_string_view input, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));

    BOOST_OUTCOME_TRY(auto const referral, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(auto const asset, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(expect_consumed(input));

    BOOST_OUTCOME_TRY(set_referrer(msg_sender, referral, asset));
    return byte_string{abi_encode_bool(true)};
}

Result<byte_string> AccrualLedger::precompile_set_new_reward_rate(
    byte_string_view input, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));

    BOOST_OUTCOME_TRY(auto const rate, abi_decode_fixed<u256_be>(input));
    BOOST_OUTCOME_TRY(expect_consumed(input));

    BOOST_OUTCOME_TRY(set_reward_rate(msg_sender, rate.native()));
    return byte_string{abi_encode_bool(true)};
}

Result<byte_string> AccrualLedger::precompile_set_new_claim_lock_time(
    byte_string_view input, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));

    BOOST_OUTCOME_TRY(auto const lock_time, abi_decode_fixed<u256_be>(input));
    BOOST_OUTCOME_TRY(expect_consumed(input));

    BOOST_OUTCOME_TRY(set_claim_lock_time(msg_sender, lock_time.native()));
    return byte_string{abi_encode_bool(true)};
}

Result<byte_string> AccrualLedger::precompile_initialize(
    byte_string_view input, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));

    BOOST_OUTCOME_TRY(auto const admin, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(expect_consumed(input));

    BOOST_OUTCOME_TRY(initialize(msg_sender, admin));
    return byte_string{abi_encode_bool(true)};
}

Result<byte_string> AccrualLedger::precompile_upgrade_schema(
    byte_string_view input, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));

    BOOST_OUTCOME_TRY(auto const target, abi_decode_fixed<u64_be>(input));
    BOOST_OUTCOME_TRY(expect_consumed(input));

    BOOST_OUTCOME_TRY(upgrade_schema(msg_sender, target.native()));
    return byte_string{abi_encode_bool(true)};
}

Result<byte_string> AccrualLedger::precompile_grant_role(
    byte_string_view input, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));

    BOOST_OUTCOME_TRY(auto const role, abi_decode_fixed<bytes32_t>(input));
    BOOST_OUTCOME_TRY(auto const account, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(expect_consumed(input));

    BOOST_OUTCOME_TRY(grant_role(msg_sender, role, account));
    return byte_string{abi_encode_bool(true)};
}

Result<byte_string> AccrualLedger::precompile_revoke_role(
    byte_string_view input, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));

    BOOST_OUTCOME_TRY(auto const role, abi_decode_fixed<bytes32_t>(input));
    BOOST_OUTCOME_TRY(auto const account, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(expect_consumed(input));

    BOOST_OUTCOME_TRY(revoke_role(msg_sender, role, account));
    return byte_string{abi_encode_bool(true)};
}

Result<byte_string> AccrualLedger::precompile_renounce_role(
    byte_string_view input, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));

    BOOST_OUTCOME_TRY(auto const role, abi_decode_fixed<bytes32_t>(input));
    BOOST_OUTCOME_TRY(
        auto const confirmation, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(expect_consumed(input));

    BOOST_OUTCOME_TRY(renounce_role(msg_sender, role, confirmation));
    return byte_string{abi_encode_bool(true)};
}

Result<byte_string> AccrualLedger::precompile_reward_rate(
    byte_string_view const input, evmc_address const &,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));
    BOOST_OUTCOME_TRY(expect_consumed(input));

    return byte_string{abi_encode_uint(vars.reward_rate.load())};
}

Result<byte_string> AccrualLedger::precompile_claim_lock_time(
    byte_string_view const input, evmc_address const &,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));
    BOOST_OUTCOME_TRY(expect_consumed(input));

    return byte_string{abi_encode_uint(vars.claim_lock_time.load())};
}

Result<byte_string> AccrualLedger::precompile_stakes(
    byte_string_view input, evmc_address const &,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));

    BOOST_OUTCOME_TRY(auto const account, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(auto const asset, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(expect_consumed(input));

    auto const record = stake(account, asset);

    AbiEncoder encoder;
    encoder.add_uint(record.balance);
    encoder.add_uint(record.stake_timestamp);
    encoder.add_uint(record.last_claim_timestamp);
    return encoder.encode_final();
}

Result<byte_string> AccrualLedger::precompile_referral_to_referrer(
    byte_string_view input, evmc_address const &,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));

    BOOST_OUTCOME_TRY(auto const referral, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(expect_consumed(input));

    return byte_string{abi_encode_address(referrer(referral))};
}

Result<byte_string> AccrualLedger::precompile_calculate_current_reward(
    byte_string_view input, evmc_address const &,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));

    BOOST_OUTCOME_TRY(auto const account, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(auto const asset, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(expect_consumed(input));

    BOOST_OUTCOME_TRY(
        auto const reward, calculate_current_reward(account, asset));

    AbiEncoder encoder;
    encoder.add_uint(u256_be{reward.amount});
    encoder.add_uint(u256_be{reward.cycles});
    return encoder.encode_final();
}

Result<byte_string> AccrualLedger::precompile_has_role(
    byte_string_view input, evmc_address const &,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));

    BOOST_OUTCOME_TRY(auto const role, abi_decode_fixed<bytes32_t>(input));
    BOOST_OUTCOME_TRY(auto const account, abi_decode_fixed<Address>(input));
    BOOST_OUTCOME_TRY(expect_consumed(input));

    return byte_string{abi_encode_bool(has_role(role, account))};
}

Result<byte_string> AccrualLedger::precompile_default_admin_role(
    byte_string_view const input, evmc_address const &,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));
    BOOST_OUTCOME_TRY(expect_consumed(input));

    return byte_string{DEFAULT_ADMIN_ROLE};
}

Result<byte_string> AccrualLedger::precompile_upgrader_role(
    byte_string_view const input, evmc_address const &,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));
    BOOST_OUTCOME_TRY(expect_consumed(input));

    return byte_string{UPGRADER_ROLE};
}

Result<byte_string> AccrualLedger::precompile_schema_version(
    byte_string_view const input, evmc_address const &,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));
    BOOST_OUTCOME_TRY(expect_consumed(input));

    return byte_string{abi_encode_uint(vars.schema_version.load())};
}

Result<byte_string> AccrualLedger::precompile_fallback(
    byte_string_view const, evmc_address const &, evmc_uint256be const &)
{
    return LedgerError::MethodNotSupported;
}

ACCRUAL_LEDGER_NAMESPACE_END
