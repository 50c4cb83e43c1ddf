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

#include "scenario.hpp"

#include <accrual/core/assert.h>
#include <accrual/core/byte_string.hpp>
#include <accrual/core/bytes.hpp>
#include <accrual/core/int.hpp>
#include <accrual/core/keccak.hpp>
#include <accrual/core/likely.h>
#include <accrual/execution/asset/asset.hpp>
#include <accrual/execution/asset/erc20.hpp>
#include <accrual/execution/core/address.hpp>
#include <accrual/execution/core/contract/abi_encode.hpp>
#include <accrual/execution/core/contract/big_endian.hpp>
#include <accrual/execution/core/fmt/address_fmt.hpp>
#include <accrual/execution/core/fmt/bytes_fmt.hpp>
#include <accrual/execution/core/fmt/int_fmt.hpp>
#include <accrual/execution/core/log.hpp>
#include <accrual/execution/ledger/ledger_call.hpp>
#include <accrual/execution/ledger/util/constants.hpp>
#include <accrual/execution/state/state.hpp>

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>
#include <quill/Quill.h>

#include <charconv>
#include <cstring>
#include <memory>
#include <optional>
#include <stdexcept>

ACCRUAL_ANONYMOUS_NAMESPACE_BEGIN

constexpr std::string_view LEDGER_ALIAS = "ledger";

constexpr int64_t CALL_GAS = 1'000'000;

constexpr std::string_view ledger_errors[] = {
    "InternalError()",
    "MethodNotSupported()",
    "InvalidInput()",
    "ValueNonZero()",
    "Staking__ZeroValue()",
    "Staking__EarlyClaim(uint256)",
    "Staking__NothingToClaim()",
    "Staking__NothingToUnstake()",
    "Staking__ZeroReferrerBalance()",
    "Staking__SelfReferringError()",
    "Staking__ReferrerAlreadySetted(address)",
    "Unauthorized(address,bytes32)",
    "BadConfirmation()",
    "ReentrantCall()",
    "AlreadyInitialized()",
    "InvalidSchemaVersion()",
    "UnknownAsset()",
};

constexpr std::string_view known_events[] = {
    "Stake(address,address,uint256,uint256)",
    "Claim(address,address,uint256)",
    "Unstake(address,address)",
    "ReferrerSet(address,address)",
    "RewardRateUpdated(uint256,uint256)",
    "ClaimLockTimeUpdated(uint256,uint256)",
    "Initialized(uint64)",
    "SchemaUpgraded(uint64,uint64)",
    "RoleGranted(bytes32,address,address)",
    "RoleRevoked(bytes32,address,address)",
    "Transfer(address,address,uint256)",
    "Approval(address,address,uint256)",
};

byte_string_view as_byte_string_view(std::string_view const text)
{
    return {reinterpret_cast<unsigned char const *>(text.data()), text.size()};
}

Address parse_address(std::string_view const text)
{
    if (text == LEDGER_ALIAS) {
        return ledger::LEDGER_CA;
    }
    auto const address = evmc::from_hex<Address>(text);
    if (ACCRUAL_UNLIKELY(!address.has_value())) {
        throw std::runtime_error(fmt::format("invalid address '{}'", text));
    }
    return address.value();
}

uint256_t parse_uint(std::string const &text, unsigned const bits = 256)
{
    if (ACCRUAL_UNLIKELY(text.empty())) {
        throw std::runtime_error("empty unsigned integer");
    }

    uint256_t value;
    try {
        value = intx::from_string<uint256_t>(text);
    }
    catch (std::exception const &) {
        throw std::runtime_error(
            fmt::format("invalid unsigned integer '{}'", text));
    }

    if (bits < 256 && (value >> bits) != 0) {
        throw std::runtime_error(
            fmt::format("'{}' does not fit in uint{}", text, bits));
    }
    return value;
}

uint256_t parse_amount(nlohmann::json const &json)
{
    if (json.is_string()) {
        return parse_uint(json.get<std::string>());
    }
    if (json.is_number_unsigned()) {
        return json.get<uint64_t>();
    }
    throw std::runtime_error(
        fmt::format("invalid amount {}", json.dump()));
}

// "uint64" -> 64, "uint" -> 256
unsigned uint_width(std::string_view const type)
{
    auto const digits = type.substr(4);
    if (digits.empty()) {
        return 256;
    }

    unsigned bits = 0;
    auto const [end, ec] =
        std::from_chars(digits.data(), digits.data() + digits.size(), bits);
    if (ec != std::errc{} || end != digits.data() + digits.size() ||
        bits == 0 || bits > 256 || bits % 8 != 0) {
        throw std::runtime_error(
            fmt::format("unsupported parameter type '{}'", type));
    }
    return bits;
}

std::vector<std::string_view> parameter_types(std::string_view const signature)
{
    auto const open = signature.find('(');
    if (open == std::string_view::npos || open == 0 ||
        signature.back() != ')') {
        throw std::runtime_error(
            fmt::format("malformed signature '{}'", signature));
    }

    auto params = signature.substr(open + 1, signature.size() - open - 2);
    std::vector<std::string_view> types;
    while (!params.empty()) {
        auto const comma = params.find(',');
        types.push_back(params.substr(0, comma));
        if (comma == std::string_view::npos) {
            break;
        }
        params.remove_prefix(comma + 1);
    }
    return types;
}

std::optional<std::string_view> event_name(bytes32_t const &topic)
{
    for (auto const signature : known_events) {
        if (to_bytes(keccak256(as_byte_string_view(signature))) == topic) {
            return signature.substr(0, signature.find('('));
        }
    }
    return std::nullopt;
}

nlohmann::json log_to_json(Log const &log)
{
    nlohmann::json topics = nlohmann::json::array();
    for (auto const &topic : log.topics) {
        topics.push_back(fmt::format("{}", topic));
    }

    nlohmann::json event;
    if (!log.topics.empty()) {
        if (auto const name = event_name(log.topics[0])) {
            event["name"] = std::string{*name};
        }
    }
    event["address"] = fmt::format("{}", log.address);
    event["topics"] = std::move(topics);
    event["data"] = "0x" + evmc::hex(log.data);
    return event;
}

ACCRUAL_ANONYMOUS_NAMESPACE_END

ACCRUAL_NAMESPACE_BEGIN

Scenario parse_scenario(nlohmann::json const &json)
{
    Scenario scenario;

    nlohmann::json const tokens = json.value("tokens", nlohmann::json::array());
    for (auto const &token : tokens) {
        TokenSetup setup{
            .address = parse_address(token.at("address").get<std::string>()),
            .balances = {},
            .approvals = {}};

        nlohmann::json const balances =
            token.value("balances", nlohmann::json::object());
        for (auto const &item : balances.items()) {
            setup.balances.emplace_back(
                parse_address(item.key()), parse_amount(item.value()));
        }

        nlohmann::json const approvals =
            token.value("approvals", nlohmann::json::array());
        for (auto const &approval : approvals) {
            setup.approvals.push_back(TokenApproval{
                .owner =
                    parse_address(approval.at("owner").get<std::string>()),
                .spender =
                    parse_address(approval.at("spender").get<std::string>()),
                .amount = parse_amount(approval.at("amount"))});
        }

        scenario.tokens.push_back(std::move(setup));
    }

    for (auto const &call : json.at("calls")) {
        ScenarioCall entry{
            .timestamp = call.at("timestamp").get<uint64_t>(),
            .sender = parse_address(call.at("sender").get<std::string>()),
            .method = call.at("method").get<std::string>(),
            .args = call.value("args", std::vector<std::string>{}),
            .expect = Expectation::None};

        if (call.contains("expect")) {
            auto const expect = call.at("expect").get<std::string>();
            if (expect == "success") {
                entry.expect = Expectation::Success;
            }
            else if (expect == "revert") {
                entry.expect = Expectation::Revert;
            }
            else {
                throw std::runtime_error(fmt::format(
                    "call {}: unknown expectation '{}'",
                    scenario.calls.size(),
                    expect));
            }
        }

        scenario.calls.push_back(std::move(entry));
    }

    return scenario;
}

uint32_t method_selector(std::string_view const signature)
{
    auto const hash = keccak256(as_byte_string_view(signature));
    return intx::be::unsafe::load<uint32_t>(hash.bytes);
}

byte_string encode_calldata(
    std::string_view const signature, std::vector<std::string> const &args)
{
    auto const types = parameter_types(signature);
    if (ACCRUAL_UNLIKELY(types.size() != args.size())) {
        throw std::runtime_error(fmt::format(
            "{} takes {} arguments, {} given",
            signature,
            types.size(),
            args.size()));
    }

    AbiEncoder encoder{method_selector(signature)};
    for (size_t i = 0; i < types.size(); ++i) {
        auto const type = types[i];
        auto const &arg = args[i];
        if (type == "address") {
            encoder.add_address(parse_address(arg));
        }
        else if (type == "bytes32") {
            auto const word = evmc::from_hex<bytes32_t>(arg);
            if (ACCRUAL_UNLIKELY(!word.has_value())) {
                throw std::runtime_error(
                    fmt::format("invalid bytes32 '{}'", arg));
            }
            encoder.add_bytes32(word.value());
        }
        else if (type == "bool") {
            if (arg != "true" && arg != "false") {
                throw std::runtime_error(fmt::format("invalid bool '{}'", arg));
            }
            encoder.add_bool(arg == "true");
        }
        else if (type.starts_with("uint")) {
            encoder.add_uint(u256_be{parse_uint(arg, uint_width(type))});
        }
        else {
            throw std::runtime_error(
                fmt::format("unsupported parameter type '{}'", type));
        }
    }
    return encoder.encode_final();
}

std::string decode_revert(byte_string_view const output)
{
    if (output.size() >= 4) {
        auto const selector = intx::be::unsafe::load<uint32_t>(output.data());
        for (auto const signature : ledger_errors) {
            if (method_selector(signature) != selector) {
                continue;
            }

            auto const name = signature.substr(0, signature.find('('));
            auto const types = parameter_types(signature);
            auto args = output.substr(4);
            if (args.size() != types.size() * sizeof(bytes32_t)) {
                return std::string{name};
            }

            std::string decoded{name};
            decoded += '(';
            for (size_t i = 0; i < types.size(); ++i) {
                if (i != 0) {
                    decoded += ", ";
                }
                if (types[i] == "address") {
                    Address address;
                    std::memcpy(address.bytes, args.data() + 12, 20);
                    decoded += fmt::format("{}", address);
                }
                else if (types[i] == "bytes32") {
                    bytes32_t word;
                    std::memcpy(word.bytes, args.data(), sizeof(bytes32_t));
                    decoded += fmt::format("{}", word);
                }
                else {
                    decoded += intx::to_string(
                        intx::be::unsafe::load<uint256_t>(args.data()));
                }
                args.remove_prefix(sizeof(bytes32_t));
            }
            decoded += ')';
            return decoded;
        }
    }
    return std::string(
        reinterpret_cast<char const *>(output.data()), output.size());
}

ReplayReport replay_scenario(Scenario const &scenario)
{
    State state;
    AssetRegistry assets;
    std::vector<std::unique_ptr<Erc20Token>> tokens;

    for (auto const &setup : scenario.tokens) {
        auto &token = *tokens.emplace_back(
            std::make_unique<Erc20Token>(state, setup.address));
        assets.add(setup.address, token);

        for (auto const &[holder, amount] : setup.balances) {
            auto const res = token.mint(holder, amount);
            if (ACCRUAL_UNLIKELY(res.has_error())) {
                throw std::runtime_error(fmt::format(
                    "cannot fund {} with {} of {}: {}",
                    holder,
                    amount,
                    setup.address,
                    res.error().message().c_str()));
            }
        }
        for (auto const &approval : setup.approvals) {
            auto const res = token.approve(
                approval.owner, approval.spender, approval.amount);
            if (ACCRUAL_UNLIKELY(res.has_error())) {
                throw std::runtime_error(fmt::format(
                    "cannot approve {} for {}: {}",
                    approval.spender,
                    approval.owner,
                    res.error().message().c_str()));
            }
        }
        LOG_DEBUG(
            "funded token {} for {} holders", setup.address,
            setup.balances.size());
    }

    nlohmann::json calls = nlohmann::json::array();
    unsigned violations = 0;
    for (size_t i = 0; i < scenario.calls.size(); ++i) {
        auto const &call = scenario.calls[i];
        byte_string const input = encode_calldata(call.method, call.args);

        evmc_message msg{};
        msg.kind = EVMC_CALL;
        msg.gas = CALL_GAS;
        msg.recipient = ledger::LEDGER_CA;
        msg.code_address = ledger::LEDGER_CA;
        msg.sender = call.sender;
        msg.input_data = input.data();
        msg.input_size = input.size();

        auto const logs_before = state.logs().size();
        auto const result =
            ledger::call_ledger(state, assets, msg, call.timestamp);
        ACCRUAL_ASSERT(result.has_value());

        bool const success = result->status_code == EVMC_SUCCESS;
        byte_string_view const output{result->output_data, result->output_size};

        nlohmann::json entry;
        entry["index"] = i;
        entry["method"] = call.method;
        entry["sender"] = fmt::format("{}", call.sender);
        entry["timestamp"] = call.timestamp;
        entry["status"] = success ? "success" : "revert";
        entry["output"] = "0x" + evmc::hex(output);
        if (!success) {
            entry["reason"] = decode_revert(output);
        }

        nlohmann::json events = nlohmann::json::array();
        for (size_t j = logs_before; j < state.logs().size(); ++j) {
            events.push_back(log_to_json(state.logs()[j]));
        }
        entry["events"] = std::move(events);

        bool const violated =
            (call.expect == Expectation::Success && !success) ||
            (call.expect == Expectation::Revert && success);
        if (violated) {
            ++violations;
            entry["violation"] = true;
            LOG_ERROR(
                "call {} {} from {} expected to {}",
                i,
                call.method,
                call.sender,
                success ? "revert" : "succeed");
        }
        else {
            LOG_INFO(
                "call {} {} from {}: {}",
                i,
                call.method,
                call.sender,
                success ? std::string{"success"} : decode_revert(output));
        }

        calls.push_back(std::move(entry));
    }

    nlohmann::json balances = nlohmann::json::array();
    for (size_t t = 0; t < scenario.tokens.size(); ++t) {
        auto const &setup = scenario.tokens[t];
        auto const &token = *tokens[t];

        nlohmann::json holders = nlohmann::json::object();
        for (auto const &[holder, amount] : setup.balances) {
            holders[fmt::format("{}", holder)] =
                intx::to_string(token.balance_of(holder));
        }
        holders[std::string{LEDGER_ALIAS}] =
            intx::to_string(token.balance_of(ledger::LEDGER_CA));

        nlohmann::json entry;
        entry["token"] = fmt::format("{}", setup.address);
        entry["balances"] = std::move(holders);
        balances.push_back(std::move(entry));
    }

    nlohmann::json report;
    report["calls"] = std::move(calls);
    report["balances"] = std::move(balances);
    report["violations"] = violations;
    return ReplayReport{.json = std::move(report), .violations = violations};
}

ACCRUAL_NAMESPACE_END
