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
#include <accrual/core/int.hpp>
#include <accrual/execution/core/address.hpp>
#include <accrual/execution/core/contract/abi_signatures.hpp>
#include <accrual/execution/ledger/config.hpp>

#include <cstdint>

#include <intx/intx.hpp>

ACCRUAL_LEDGER_NAMESPACE_BEGIN

using namespace intx::literals;

inline constexpr Address LEDGER_CA{0x1000};

// reward units per REWARD_RATE_DENOMINATOR staked, per elapsed cycle
inline constexpr uint256_t DEFAULT_REWARD_RATE{10};
inline constexpr uint256_t DEFAULT_CLAIM_LOCK_TIME{86400}; // one day
inline constexpr uint256_t REWARD_RATE_DENOMINATOR{1000};

// paid to the referrer out of ledger reserves: amount * 5 / 1000
inline constexpr uint256_t REFERRAL_BONUS{5};
inline constexpr uint256_t REFERRAL_BONUS_DENOMINATOR{1000};

// cycle length used while the claim lock time is set to zero
inline constexpr uint256_t MIN_CYCLE_LENGTH{1};

inline constexpr bytes32_t DEFAULT_ADMIN_ROLE{};
inline constexpr bytes32_t UPGRADER_ROLE = keccak256_literal("UPGRADER_ROLE");

static_assert(
    UPGRADER_ROLE ==
    0x189ab7a9244df0848122154315af71fe140f3db0fe014031783b0946b8c9d2e3_bytes32);

static_assert(REFERRAL_BONUS < REFERRAL_BONUS_DENOMINATOR);

ACCRUAL_LEDGER_NAMESPACE_END
