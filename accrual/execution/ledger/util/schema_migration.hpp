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

#include <accrual/core/result.hpp>
#include <accrual/execution/ledger/config.hpp>
#include <accrual/execution/ledger/ledger_variables.hpp>

#include <cstdint>
#include <span>

ACCRUAL_LEDGER_NAMESPACE_BEGIN

// One step of the storage layout history. Step `version` turns a ledger at
// version - 1 into one at `version`.
struct SchemaMigration
{
    uint64_t version;
    Result<void> (*apply)(LedgerVariables &);
};

// The migrations this build knows about, versions 1 through N in order.
// Only version 1 exists so far, so upgradeSchema through the call surface
// reverts with InvalidSchemaVersion until a version 2 step is added here.
std::span<SchemaMigration const> builtin_migrations() noexcept;

// Highest version reachable through `migrations`
uint64_t latest_schema_version(std::span<SchemaMigration const>) noexcept;

// Applies every step in (current, target] in ascending order and stores the
// new version. Steps are looked up by version, so a table may hold only the
// steps above the ledger's current version. Fails with InvalidSchemaVersion
// unless current < target <= latest and every step in between is present;
// nothing is applied in that case.
Result<void> migrate_schema(
    LedgerVariables &, uint64_t target, std::span<SchemaMigration const>);

ACCRUAL_LEDGER_NAMESPACE_END
