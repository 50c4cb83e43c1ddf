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

#include <accrual/execution/asset/asset.hpp>
#include <accrual/execution/ledger/config.hpp>

#include <evmc/evmc.hpp>

#include <cstdint>
#include <optional>

ACCRUAL_NAMESPACE_BEGIN

class State;

ACCRUAL_NAMESPACE_END

ACCRUAL_LEDGER_NAMESPACE_BEGIN

// Executes `msg` against the ledger when it is addressed to LEDGER_CA and
// returns nullopt otherwise. The call runs inside its own State checkpoint:
// its storage writes and logs are kept on success and discarded on revert.
std::optional<evmc::Result> call_ledger(
    State &, AssetRegistry &, evmc_message const &msg, uint64_t timestamp);

ACCRUAL_LEDGER_NAMESPACE_END
