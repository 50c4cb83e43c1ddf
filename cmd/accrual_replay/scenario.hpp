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
#include <accrual/core/config.hpp>
#include <accrual/core/int.hpp>
#include <accrual/execution/core/address.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

ACCRUAL_NAMESPACE_BEGIN

struct TokenApproval
{
    Address owner;
    Address spender;
    uint256_t amount;
};

struct TokenSetup
{
    Address address;
    std::vector<std::pair<Address, uint256_t>> balances;
    std::vector<TokenApproval> approvals;
};

enum class Expectation
{
    None,
    Success,
    Revert,
};

struct ScenarioCall
{
    uint64_t timestamp;
    Address sender;
    std::string method;
    std::vector<std::string> args;
    Expectation expect;
};

struct Scenario
{
    std::vector<TokenSetup> tokens;
    std::vector<ScenarioCall> calls;
};

// Throws on malformed input, naming the offending entry where it can
Scenario parse_scenario(nlohmann::json const &);

// Selector of a canonical signature such as "claim(address)"
uint32_t method_selector(std::string_view signature);

// Calldata for `signature` with each argument parsed by its ABI type:
// hex for address and bytes32, decimal or 0x hex for uintN, true or false
// for bool. The string "ledger" stands for the ledger address.
byte_string
encode_calldata(std::string_view signature, std::vector<std::string> const &);

// Ledger custom errors by name and arguments, anything else as text
std::string decode_revert(byte_string_view output);

struct ReplayReport
{
    nlohmann::json json;
    unsigned violations{0};
};

// Runs every call against a fresh ledger funded as the scenario describes
ReplayReport replay_scenario(Scenario const &);

ACCRUAL_NAMESPACE_END
