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

#include <accrual/core/bytes.hpp>
#include <accrual/core/int.hpp>
#include <accrual/core/result.hpp>
#include <accrual/execution/asset/asset.hpp>
#include <accrual/execution/asset/erc20.hpp>
#include <accrual/execution/asset/token_error.hpp>
#include <accrual/execution/core/address.hpp>
#include <accrual/execution/core/contract/abi_encode.hpp>
#include <accrual/execution/core/contract/big_endian.hpp>
#include <accrual/execution/core/contract/checked_math.hpp>
#include <accrual/execution/ledger/accrual_ledger.hpp>
#include <accrual/execution/ledger/ledger_variables.hpp>
#include <accrual/execution/ledger/util/constants.hpp>
#include <accrual/execution/ledger/util/ledger_error.hpp>
#include <accrual/execution/ledger/util/schema_migration.hpp>
#include <accrual/execution/state/state.hpp>

#include <boost/outcome/success_failure.hpp>
#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <cstdint>
#include <variant>

using namespace accrual;
using namespace accrual::ledger;
using namespace intx::literals;

namespace
{
    constexpr auto TOKEN = 0x00000000000000000000000000000000000a55e7_address;
    constexpr auto admin = 0x00000000000000000000000000000000000000ad_address;
    constexpr auto user1 = 0x00000000000000000000000000000000000000a1_address;
    constexpr auto user2 = 0x00000000000000000000000000000000000000a2_address;
    constexpr auto user3 = 0x00000000000000000000000000000000000000a3_address;

    constexpr uint64_t GENESIS = 1'700'000'000;
    constexpr uint64_t DAY = 86400;

    constexpr uint256_t E18{1'000'000'000'000'000'000};
    constexpr uint256_t INITIAL_SUPPLY = 1'000'000 * E18;
    constexpr uint256_t USER_FUNDS = 10'000 * E18;
    constexpr uint256_t RESERVES = 50'000 * E18;
    constexpr uint256_t STAKE = 1'000 * E18;

    Result<void> keep_parameters(LedgerVariables &)
    {
        return outcome::success();
    }
}

struct AccrualLedgerTest : public ::testing::Test
{
    State state{};
    Erc20Token token{state, TOKEN};
    AssetRegistry assets{};
    uint64_t now{GENESIS};
    RevertArgs revert_args{};

    void SetUp() override
    {
        assets.add(TOKEN, token);
        ASSERT_FALSE(token.mint(admin, INITIAL_SUPPLY).has_error());
        for (auto const &user : {user1, user2, user3}) {
            ASSERT_FALSE(token.transfer(admin, user, USER_FUNDS).has_error());
            ASSERT_FALSE(
                token.approve(user, LEDGER_CA, UINT256_MAX).has_error());
        }
        ASSERT_FALSE(token.transfer(admin, LEDGER_CA, RESERVES).has_error());
        ASSERT_FALSE(call([](AccrualLedger &l) {
                         return l.initialize(admin, admin);
                     }).has_error());
    }

    // runs `f` on a fresh handle in its own checkpoint, as a call would
    template <typename F>
    Result<void> call(F &&f)
    {
        state.push();
        AccrualLedger ledger{state, assets, now};
        auto res = f(ledger);
        if (res.has_error()) {
            revert_args = ledger.revert_args();
            state.pop_reject();
        }
        else {
            state.pop_accept();
        }
        return res;
    }

    AccrualLedger view()
    {
        return AccrualLedger{state, assets, now};
    }

    Result<void> deposit(Address const &sender, uint256_t const &amount)
    {
        return call(
            [&](AccrualLedger &l) { return l.deposit(sender, TOKEN, amount); });
    }

    Result<void> claim(Address const &sender)
    {
        return call([&](AccrualLedger &l) { return l.claim(sender, TOKEN); });
    }

    Result<void> unstake(Address const &sender)
    {
        return call([&](AccrualLedger &l) { return l.unstake(sender, TOKEN); });
    }

    Result<void> set_referrer(Address const &sender, Address const &referral)
    {
        return call([&](AccrualLedger &l) {
            return l.set_referrer(sender, referral, TOKEN);
        });
    }

    Result<AccrualLedger::Reward> reward(Address const &account)
    {
        return view().calculate_current_reward(account, TOKEN);
    }

    StakeRecord record(Address const &account)
    {
        return view().stake(account, TOKEN);
    }
};

TEST_F(AccrualLedgerTest, initialized)
{
    auto ledger = view();
    EXPECT_EQ(ledger.reward_rate(), DEFAULT_REWARD_RATE);
    EXPECT_EQ(ledger.claim_lock_time(), DEFAULT_CLAIM_LOCK_TIME);
    EXPECT_EQ(ledger.schema_version(), 1);
    EXPECT_TRUE(ledger.has_role(DEFAULT_ADMIN_ROLE, admin));
    EXPECT_TRUE(ledger.has_role(UPGRADER_ROLE, admin));
    EXPECT_FALSE(ledger.has_role(DEFAULT_ADMIN_ROLE, user1));
    EXPECT_FALSE(ledger.has_role(UPGRADER_ROLE, user1));

    auto const res =
        call([](AccrualLedger &l) { return l.initialize(user1, user1); });
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::AlreadyInitialized);
    EXPECT_FALSE(view().has_role(DEFAULT_ADMIN_ROLE, user1));
}

TEST_F(AccrualLedgerTest, deposit)
{
    ASSERT_FALSE(deposit(user1, STAKE).has_error());

    auto const rec = record(user1);
    EXPECT_EQ(rec.balance.native(), STAKE);
    EXPECT_EQ(rec.stake_timestamp.native(), now);
    EXPECT_EQ(rec.last_claim_timestamp.native(), now);
    EXPECT_EQ(token.balance_of(user1), USER_FUNDS - STAKE);
    EXPECT_EQ(token.balance_of(LEDGER_CA), RESERVES + STAKE);

    // Stake(user1, TOKEN, STAKE, now)
    auto const &log = state.logs().back();
    EXPECT_EQ(log.address, LEDGER_CA);
    ASSERT_EQ(log.topics.size(), 3);
    EXPECT_EQ(
        log.topics[0],
        0x63602d0ecc7b3a0ef7ff1a116e23056662d64280355ba8031b6d0d767c4b4458_bytes32);
    EXPECT_EQ(log.topics[1], abi_encode_address(user1));
    EXPECT_EQ(log.topics[2], abi_encode_address(TOKEN));
    AbiEncoder data;
    data.add_uint(u256_be{STAKE});
    data.add_uint(u64_be{now});
    EXPECT_EQ(log.data, data.encode_final());
}

TEST_F(AccrualLedgerTest, deposit_adds_to_balance)
{
    ASSERT_FALSE(deposit(user1, STAKE).has_error());
    now += 100;
    ASSERT_FALSE(deposit(user1, 5 * E18).has_error());

    auto const rec = record(user1);
    EXPECT_EQ(rec.balance.native(), STAKE + 5 * E18);
    EXPECT_EQ(rec.stake_timestamp.native(), now);
    EXPECT_EQ(rec.last_claim_timestamp.native(), now);
    // no full cycle passed, no reward paid
    EXPECT_EQ(token.balance_of(user1), USER_FUNDS - STAKE - 5 * E18);
}

TEST_F(AccrualLedgerTest, zero_deposit)
{
    auto const logs_before = state.logs().size();

    auto const res = deposit(user1, 0);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::ZeroAmount);

    EXPECT_TRUE(record(user1).balance.is_zero());
    EXPECT_EQ(token.balance_of(user1), USER_FUNDS);
    EXPECT_EQ(state.logs().size(), logs_before);
}

TEST_F(AccrualLedgerTest, reward_is_pure)
{
    ASSERT_FALSE(deposit(user1, STAKE).has_error());
    now += 2 * DAY + 5;

    auto const logs_before = state.logs().size();
    auto const first = reward(user1);
    auto const second = reward(user1);
    ASSERT_FALSE(first.has_error());
    ASSERT_FALSE(second.has_error());
    EXPECT_EQ(first.value().amount, second.value().amount);
    EXPECT_EQ(first.value().cycles, second.value().cycles);
    EXPECT_EQ(first.value().amount, 20 * E18);
    EXPECT_EQ(first.value().cycles, 2);

    EXPECT_EQ(state.logs().size(), logs_before);
    EXPECT_EQ(record(user1).last_claim_timestamp.native(), GENESIS);
}

TEST_F(AccrualLedgerTest, reward_over_three_days)
{
    ASSERT_FALSE(deposit(user1, STAKE).has_error());
    now += 3 * DAY;

    auto const res = reward(user1);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().amount, 30 * E18);
    EXPECT_EQ(res.value().cycles, 3);
}

TEST_F(AccrualLedgerTest, reward_without_position)
{
    now += 10 * DAY;
    auto const res = reward(user3);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().amount, 0);
    EXPECT_EQ(res.value().cycles, 0);
}

TEST_F(AccrualLedgerTest, reward_before_reference_time)
{
    ASSERT_FALSE(deposit(user1, STAKE).has_error());
    now -= 1;
    auto const res = reward(user1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MathError::Underflow);
}

TEST_F(AccrualLedgerTest, claim_after_two_days)
{
    uint64_t const t0 = now;
    ASSERT_FALSE(deposit(user1, STAKE).has_error());
    now = t0 + 172800;

    auto const res = reward(user1);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().cycles, 2);
    EXPECT_EQ(res.value().amount, 20 * E18);

    ASSERT_FALSE(claim(user1).has_error());
    EXPECT_EQ(token.balance_of(user1), USER_FUNDS - STAKE + 20 * E18);
    EXPECT_EQ(record(user1).last_claim_timestamp.native(), t0 + 172800);
    EXPECT_EQ(record(user1).stake_timestamp.native(), t0);

    // Claim(user1, TOKEN, 20e18)
    auto const &log = state.logs().back();
    ASSERT_EQ(log.topics.size(), 3);
    EXPECT_EQ(
        log.topics[0],
        0x70eb43c4a8ae8c40502dcf22436c509c28d6ff421cf07c491be56984bd987068_bytes32);
    EXPECT_EQ(log.topics[1], abi_encode_address(user1));
    EXPECT_EQ(log.topics[2], abi_encode_address(TOKEN));
    EXPECT_EQ(log.data, byte_string{abi_encode_uint(u256_be{20 * E18})});
}

TEST_F(AccrualLedgerTest, claim_boundary)
{
    uint64_t const t0 = now;
    ASSERT_FALSE(deposit(user1, STAKE).has_error());

    now = t0 + DAY - 1;
    auto const res = claim(user1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::EarlyClaim);
    auto const *const args = std::get_if<EarlyClaimRevert>(&revert_args);
    ASSERT_NE(args, nullptr);
    EXPECT_EQ(args->next_claim_timestamp, uint256_t{t0 + DAY});

    now = t0 + DAY;
    ASSERT_FALSE(claim(user1).has_error());
    EXPECT_EQ(token.balance_of(user1), USER_FUNDS - STAKE + 10 * E18);
}

TEST_F(AccrualLedgerTest, claim_keeps_partial_cycle)
{
    uint64_t const t0 = now;
    ASSERT_FALSE(deposit(user1, STAKE).has_error());

    now = t0 + 2 * DAY + DAY / 2;
    ASSERT_FALSE(claim(user1).has_error());
    EXPECT_EQ(record(user1).last_claim_timestamp.native(), t0 + 2 * DAY);

    // the half day left over completes the third cycle
    now = t0 + 3 * DAY;
    ASSERT_FALSE(claim(user1).has_error());
    EXPECT_EQ(record(user1).last_claim_timestamp.native(), t0 + 3 * DAY);
    EXPECT_EQ(token.balance_of(user1), USER_FUNDS - STAKE + 30 * E18);
}

TEST_F(AccrualLedgerTest, claim_without_position)
{
    auto const res = claim(user3);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::EarlyClaim);
    auto const *const args = std::get_if<EarlyClaimRevert>(&revert_args);
    ASSERT_NE(args, nullptr);
    EXPECT_EQ(args->next_claim_timestamp, DEFAULT_CLAIM_LOCK_TIME);
}

TEST_F(AccrualLedgerTest, nothing_to_claim)
{
    // 99 * 10 / 1000 floors to zero
    ASSERT_FALSE(deposit(user1, 99).has_error());
    now += DAY;

    auto const res = claim(user1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::NothingToClaim);
    EXPECT_EQ(record(user1).last_claim_timestamp.native(), GENESIS);
}

TEST_F(AccrualLedgerTest, deposit_resets_last_claim)
{
    uint64_t const t0 = now;
    ASSERT_FALSE(deposit(user1, STAKE).has_error());

    now = t0 + 2 * DAY + DAY / 2;
    ASSERT_FALSE(deposit(user1, STAKE).has_error());

    // paid the two cycles but restarted at now, unlike claim
    EXPECT_EQ(token.balance_of(user1), USER_FUNDS - 2 * STAKE + 20 * E18);
    auto const rec = record(user1);
    EXPECT_EQ(rec.balance.native(), 2 * STAKE);
    EXPECT_EQ(rec.last_claim_timestamp.native(), now);
    EXPECT_NE(rec.last_claim_timestamp.native(), t0 + 2 * DAY);
    EXPECT_EQ(rec.stake_timestamp.native(), now);

    now = t0 + 3 * DAY;
    auto const res = reward(user1);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().cycles, 0);
}

TEST_F(AccrualLedgerTest, unstake_with_rewards)
{
    ASSERT_FALSE(deposit(user1, STAKE).has_error());
    now += 3 * DAY;

    ASSERT_FALSE(unstake(user1).has_error());
    EXPECT_EQ(token.balance_of(user1), USER_FUNDS + 30 * E18);
    EXPECT_EQ(token.balance_of(LEDGER_CA), RESERVES - 30 * E18);

    auto const rec = record(user1);
    EXPECT_TRUE(rec.balance.is_zero());
    EXPECT_TRUE(rec.stake_timestamp.is_zero());
    EXPECT_TRUE(rec.last_claim_timestamp.is_zero());

    // one Transfer of principal and reward, then Unstake(user1, TOKEN)
    auto const &logs = state.logs();
    ASSERT_GE(logs.size(), 2);
    auto const &transfer = logs[logs.size() - 2];
    EXPECT_EQ(transfer.address, TOKEN);
    EXPECT_EQ(transfer.topics[1], abi_encode_address(LEDGER_CA));
    EXPECT_EQ(transfer.topics[2], abi_encode_address(user1));
    EXPECT_EQ(
        transfer.data, byte_string{abi_encode_uint(u256_be{STAKE + 30 * E18})});

    auto const &log = logs.back();
    ASSERT_EQ(log.topics.size(), 3);
    EXPECT_EQ(
        log.topics[0],
        0x5f29108e674363437824f677d43735dc48a3956bbf8045b2989fc094b6b741a9_bytes32);
    EXPECT_TRUE(log.data.empty());

    auto const res = unstake(user1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::NothingToUnstake);
}

TEST_F(AccrualLedgerTest, unstake_nothing)
{
    auto const res = unstake(user2);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::NothingToUnstake);
}

TEST_F(AccrualLedgerTest, referral_bonus)
{
    ASSERT_FALSE(deposit(user1, STAKE).has_error());
    ASSERT_FALSE(set_referrer(user1, user2).has_error());
    EXPECT_EQ(view().referrer(user2), user1);

    // ReferrerSet(user2, user1)
    auto const &log = state.logs().back();
    ASSERT_EQ(log.topics.size(), 3);
    EXPECT_EQ(
        log.topics[0],
        0x5f7165288eef601591cf549e15ff19ef9060b7f71b9c115be946fa1fe7ebf68a_bytes32);
    EXPECT_EQ(log.topics[1], abi_encode_address(user2));
    EXPECT_EQ(log.topics[2], abi_encode_address(user1));

    ASSERT_FALSE(deposit(user2, STAKE).has_error());

    // 1000e18 * 5 / 1000, paid from reserves
    EXPECT_EQ(token.balance_of(user1), USER_FUNDS - STAKE + 5 * E18);
    EXPECT_EQ(token.balance_of(user2), USER_FUNDS - STAKE);
    EXPECT_EQ(token.balance_of(LEDGER_CA), RESERVES + 2 * STAKE - 5 * E18);
    EXPECT_EQ(record(user2).balance.native(), STAKE);
}

TEST_F(AccrualLedgerTest, referral_bonus_floors_to_zero)
{
    ASSERT_FALSE(deposit(user1, STAKE).has_error());
    ASSERT_FALSE(set_referrer(user1, user2).has_error());

    auto const logs_before = state.logs().size();
    ASSERT_FALSE(deposit(user2, 199).has_error());
    EXPECT_EQ(token.balance_of(user1), USER_FUNDS - STAKE);
    // Transfer into custody and Stake only
    EXPECT_EQ(state.logs().size(), logs_before + 2);
}

TEST_F(AccrualLedgerTest, self_referring)
{
    ASSERT_FALSE(deposit(user1, STAKE).has_error());
    auto const res = set_referrer(user1, user1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::SelfReferring);
    EXPECT_EQ(view().referrer(user1), Address{});
}

TEST_F(AccrualLedgerTest, zero_referrer_balance)
{
    auto const res = set_referrer(user3, user2);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::ZeroReferrerBalance);
    EXPECT_EQ(view().referrer(user2), Address{});
}

TEST_F(AccrualLedgerTest, referrer_already_set)
{
    ASSERT_FALSE(deposit(user1, STAKE).has_error());
    ASSERT_FALSE(deposit(user3, STAKE).has_error());
    ASSERT_FALSE(set_referrer(user1, user2).has_error());

    for (auto const &sender : {user3, user1}) {
        revert_args = {};
        auto const res = set_referrer(sender, user2);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), LedgerError::ReferrerAlreadySet);
        auto const *const args =
            std::get_if<ReferrerAlreadySetRevert>(&revert_args);
        ASSERT_NE(args, nullptr);
        EXPECT_EQ(args->referrer, user1);
    }
    EXPECT_EQ(view().referrer(user2), user1);
}

TEST_F(AccrualLedgerTest, referral_link_covers_every_asset)
{
    constexpr auto OTHER = 0x000000000000000000000000000000000000beef_address;
    Erc20Token other{state, OTHER};
    assets.add(OTHER, other);
    ASSERT_FALSE(other.mint(user2, USER_FUNDS).has_error());
    ASSERT_FALSE(other.mint(LEDGER_CA, RESERVES).has_error());
    ASSERT_FALSE(other.approve(user2, LEDGER_CA, UINT256_MAX).has_error());

    ASSERT_FALSE(deposit(user1, STAKE).has_error());
    ASSERT_FALSE(set_referrer(user1, user2).has_error());

    ASSERT_FALSE(call([&](AccrualLedger &l) {
                     return l.deposit(user2, OTHER, STAKE);
                 }).has_error());
    EXPECT_EQ(other.balance_of(user1), 5 * E18);
    EXPECT_EQ(view().stake(user2, OTHER).balance.native(), STAKE);
    EXPECT_TRUE(record(user2).balance.is_zero());
}

TEST_F(AccrualLedgerTest, admin_setters)
{
    ASSERT_FALSE(call([](AccrualLedger &l) {
                     return l.set_reward_rate(admin, 20);
                 }).has_error());
    EXPECT_EQ(view().reward_rate(), 20);

    // RewardRateUpdated(10, 20)
    auto const &log = state.logs().back();
    EXPECT_EQ(
        log.topics[0],
        0xc390a98ace15a7bb6bab611eedfdbb2685043b241a869420043cdfb23ccfee50_bytes32);
    AbiEncoder data;
    data.add_uint(u256_be{10});
    data.add_uint(u256_be{20});
    EXPECT_EQ(log.data, data.encode_final());

    ASSERT_FALSE(call([](AccrualLedger &l) {
                     return l.set_claim_lock_time(admin, 3600);
                 }).has_error());
    EXPECT_EQ(view().claim_lock_time(), 3600);
    EXPECT_EQ(
        state.logs().back().topics[0],
        0x34820a8a3b83f1a28b0dac1d87890a1cf40948d0bf8377c4e2e357d34f6dbb1e_bytes32);
}

TEST_F(AccrualLedgerTest, non_admin_setters)
{
    auto const res =
        call([](AccrualLedger &l) { return l.set_reward_rate(user1, 50); });
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::Unauthorized);
    auto const *const args = std::get_if<UnauthorizedRevert>(&revert_args);
    ASSERT_NE(args, nullptr);
    EXPECT_EQ(args->account, user1);
    EXPECT_EQ(args->role, DEFAULT_ADMIN_ROLE);
    EXPECT_EQ(view().reward_rate(), DEFAULT_REWARD_RATE);

    auto const res2 =
        call([](AccrualLedger &l) { return l.set_claim_lock_time(user1, 1); });
    ASSERT_TRUE(res2.has_error());
    EXPECT_EQ(res2.assume_error(), LedgerError::Unauthorized);
    EXPECT_EQ(view().claim_lock_time(), DEFAULT_CLAIM_LOCK_TIME);
}

TEST_F(AccrualLedgerTest, zero_lock_time)
{
    ASSERT_FALSE(call([](AccrualLedger &l) {
                     return l.set_claim_lock_time(admin, 0);
                 }).has_error());

    uint64_t const t0 = now;
    ASSERT_FALSE(deposit(user1, STAKE).has_error());
    now = t0 + 5;

    // every elapsed second is a cycle
    auto const res = reward(user1);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().cycles, 5);
    EXPECT_EQ(res.value().amount, 50 * E18);

    ASSERT_FALSE(claim(user1).has_error());
    EXPECT_EQ(record(user1).last_claim_timestamp.native(), t0 + 5);
    auto const again = claim(user1);
    ASSERT_TRUE(again.has_error());
    EXPECT_EQ(again.assume_error(), LedgerError::EarlyClaim);
}

TEST_F(AccrualLedgerTest, unknown_asset)
{
    constexpr auto UNKNOWN = 0x000000000000000000000000000000000000dead_address;
    auto const res = call([&](AccrualLedger &l) {
        return l.deposit(user1, UNKNOWN, STAKE);
    });
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::UnknownAsset);
    EXPECT_TRUE(view().stake(user1, UNKNOWN).balance.is_zero());
}

TEST_F(AccrualLedgerTest, reward_overflow)
{
    ASSERT_FALSE(call([](AccrualLedger &l) {
                     return l.set_reward_rate(admin, UINT256_MAX);
                 }).has_error());
    ASSERT_FALSE(deposit(user1, STAKE).has_error());
    now += DAY;

    auto const res = reward(user1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MathError::Overflow);

    auto const res2 = claim(user1);
    ASSERT_TRUE(res2.has_error());
    EXPECT_EQ(res2.assume_error(), MathError::Overflow);
    EXPECT_EQ(record(user1).balance.native(), STAKE);
}

TEST_F(AccrualLedgerTest, failed_pull_rolls_back)
{
    ASSERT_FALSE(token.approve(user3, LEDGER_CA, 0).has_error());
    auto const logs_before = state.logs().size();

    auto const res = deposit(user3, STAKE);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), TokenError::InsufficientAllowance);
    EXPECT_TRUE(record(user3).balance.is_zero());
    EXPECT_EQ(token.balance_of(user3), USER_FUNDS);
    EXPECT_EQ(state.logs().size(), logs_before);
}

TEST_F(AccrualLedgerTest, insufficient_reserves)
{
    ASSERT_FALSE(deposit(user1, STAKE).has_error());
    ASSERT_FALSE(token.transfer(LEDGER_CA, admin, RESERVES).has_error());
    now += DAY;

    // only the principal is left in custody
    auto const res = unstake(user1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), TokenError::InsufficientBalance);
    EXPECT_EQ(record(user1).balance.native(), STAKE);
    EXPECT_EQ(token.balance_of(user1), USER_FUNDS - STAKE);
}

TEST_F(AccrualLedgerTest, multiple_users)
{
    ASSERT_FALSE(deposit(user1, STAKE).has_error());
    ASSERT_FALSE(deposit(user2, 2 * STAKE).has_error());
    now += DAY;

    ASSERT_FALSE(claim(user1).has_error());
    ASSERT_FALSE(claim(user2).has_error());
    EXPECT_EQ(token.balance_of(user1), USER_FUNDS - STAKE + 10 * E18);
    EXPECT_EQ(token.balance_of(user2), USER_FUNDS - 2 * STAKE + 20 * E18);
    EXPECT_TRUE(record(user3).balance.is_zero());
}

TEST_F(AccrualLedgerTest, complete_cycle)
{
    ASSERT_FALSE(deposit(user1, STAKE).has_error());
    now += DAY;
    ASSERT_FALSE(claim(user1).has_error());
    now += DAY;
    ASSERT_FALSE(claim(user1).has_error());
    now += DAY;
    ASSERT_FALSE(unstake(user1).has_error());

    EXPECT_EQ(token.balance_of(user1), USER_FUNDS + 30 * E18);
    EXPECT_EQ(token.balance_of(LEDGER_CA), RESERVES - 30 * E18);
    EXPECT_TRUE(record(user1).balance.is_zero());
}

TEST_F(AccrualLedgerTest, upgrade_preserves_state)
{
    static SchemaMigration const migrations[] = {
        builtin_migrations()[0],
        {.version = 2, .apply = &keep_parameters},
    };

    ASSERT_FALSE(call([](AccrualLedger &l) {
                     return l.set_reward_rate(admin, 20);
                 }).has_error());
    ASSERT_FALSE(deposit(user1, STAKE).has_error());

    ASSERT_FALSE(call([](AccrualLedger &l) {
                     return l.upgrade_schema(admin, 2, migrations);
                 }).has_error());

    auto ledger = view();
    EXPECT_EQ(ledger.schema_version(), 2);
    EXPECT_EQ(ledger.reward_rate(), 20);
    EXPECT_EQ(ledger.claim_lock_time(), DEFAULT_CLAIM_LOCK_TIME);
    EXPECT_EQ(ledger.stake(user1, TOKEN).balance.native(), STAKE);

    // SchemaUpgraded(1, 2)
    auto const &log = state.logs().back();
    EXPECT_EQ(
        log.topics[0],
        0x6f96c032f7c9c0293fc4c9c655b83cff802a21ea37ee8ebbabafcb7cb3a1b0f8_bytes32);
    AbiEncoder data;
    data.add_uint(u64_be{1});
    data.add_uint(u64_be{2});
    EXPECT_EQ(log.data, data.encode_final());

    auto const res = call([](AccrualLedger &l) {
        return l.upgrade_schema(admin, 2, migrations);
    });
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::InvalidSchemaVersion);
}

TEST_F(AccrualLedgerTest, upgrade_requires_known_version)
{
    auto const res =
        call([](AccrualLedger &l) { return l.upgrade_schema(admin, 2); });
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::InvalidSchemaVersion);
    EXPECT_EQ(view().schema_version(), 1);
}

TEST_F(AccrualLedgerTest, non_upgrader)
{
    auto const res =
        call([](AccrualLedger &l) { return l.upgrade_schema(user1, 2); });
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), LedgerError::Unauthorized);
    auto const *const args = std::get_if<UnauthorizedRevert>(&revert_args);
    ASSERT_NE(args, nullptr);
    EXPECT_EQ(args->account, user1);
    EXPECT_EQ(args->role, UPGRADER_ROLE);
}

TEST(AccrualLedgerInit, initialize)
{
    State state;
    AssetRegistry assets;
    constexpr uint64_t timestamp = GENESIS;

    {
        AccrualLedger ledger{state, assets, timestamp};
        EXPECT_EQ(ledger.schema_version(), 0);
        EXPECT_EQ(ledger.reward_rate(), 0);
        ASSERT_FALSE(ledger.initialize(user1, admin).has_error());
    }

    // RoleGranted for both roles, then Initialized(1)
    auto const &logs = state.logs();
    ASSERT_EQ(logs.size(), 3);
    EXPECT_EQ(logs[0].topics[1], DEFAULT_ADMIN_ROLE);
    EXPECT_EQ(logs[0].topics[2], abi_encode_address(admin));
    EXPECT_EQ(logs[0].topics[3], abi_encode_address(user1));
    EXPECT_EQ(logs[1].topics[1], UPGRADER_ROLE);
    EXPECT_EQ(
        logs[2].topics[0],
        0xc7f505b2f371ae2175ee4913f4499e1f2633a7b5936321eed1cdaeb6115181d2_bytes32);
    EXPECT_EQ(logs[2].data, byte_string{abi_encode_uint(u64_be{1})});

    AccrualLedger ledger{state, assets, timestamp};
    EXPECT_EQ(ledger.schema_version(), 1);
    EXPECT_EQ(ledger.reward_rate(), DEFAULT_REWARD_RATE);
    EXPECT_FALSE(ledger.has_role(DEFAULT_ADMIN_ROLE, user1));
    EXPECT_TRUE(ledger.has_role(DEFAULT_ADMIN_ROLE, admin));
}
