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
#include <accrual/core/likely.h>
#include <accrual/execution/ledger/accrual_ledger.hpp>
#include <accrual/execution/ledger/ledger_call.hpp>
#include <accrual/execution/ledger/util/constants.hpp>
#include <accrual/execution/ledger/util/ledger_error.hpp>
#include <accrual/execution/state/state.hpp>

#include <evmc/evmc.hpp>

ACCRUAL_LEDGER_NAMESPACE_BEGIN

std::optional<evmc::Result> call_ledger(
    State &state, AssetRegistry &assets, evmc_message const &msg,
    uint64_t const timestamp)
{
    if (msg.code_address != LEDGER_CA) {
        return std::nullopt;
    }

    if (ACCRUAL_UNLIKELY(msg.kind != EVMC_CALL || msg.flags != 0)) {
        return evmc::Result{evmc_status_code::EVMC_REJECTED};
    }

    byte_string_view input{msg.input_data, msg.input_size};
    auto const method = AccrualLedger::precompile_dispatch(input);

    state.push();
    AccrualLedger ledger(state, assets, timestamp);
    auto const res = (ledger.*method)(input, msg.sender, msg.value);
    if (ACCRUAL_LIKELY(res.has_value())) {
        state.pop_accept();
        int64_t const gas_refund = 0;
        return evmc::Result(
            EVMC_SUCCESS,
            msg.gas,
            gas_refund,
            res.value().data(),
            res.value().size());
    }

    state.pop_reject();
    byte_string const output = encode_revert(res.error(), ledger.revert_args());
    return evmc::Result(
        EVMC_REVERT,
        0 /* gas left */,
        0 /* gas refund */,
        output.data(),
        output.size());
}

ACCRUAL_LEDGER_NAMESPACE_END
