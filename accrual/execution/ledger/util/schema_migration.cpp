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

#include <accrual/core/likely.h>
#include <accrual/execution/ledger/util/constants.hpp>
#include <accrual/execution/ledger/util/ledger_error.hpp>
#include <accrual/execution/ledger/util/schema_migration.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <array>

ACCRUAL_LEDGER_ANONYMOUS_NAMESPACE_BEGIN

// Version 1 is the initial layout: the default parameters
Result<void> write_default_parameters(LedgerVariables &vars)
{
    vars.reward_rate.store(DEFAULT_REWARD_RATE);
    vars.claim_lock_time.store(DEFAULT_CLAIM_LOCK_TIME);
    return outcome::success();
}

constexpr std::array<SchemaMigration, 1> BUILTIN_MIGRATIONS{{
    {.version = 1, .apply = &write_default_parameters},
}};

SchemaMigration const *find_step(
    std::span<SchemaMigration const> const migrations, uint64_t const version)
{
    auto const it =
        std::ranges::find(migrations, version, &SchemaMigration::version);
    return it == migrations.end() ? nullptr : &*it;
}

ACCRUAL_LEDGER_ANONYMOUS_NAMESPACE_END

ACCRUAL_LEDGER_NAMESPACE_BEGIN

std::span<SchemaMigration const> builtin_migrations() noexcept
{
    return BUILTIN_MIGRATIONS;
}

uint64_t latest_schema_version(
    std::span<SchemaMigration const> const migrations) noexcept
{
    uint64_t latest = 0;
    for (auto const &step : migrations) {
        latest = std::max(latest, step.version);
    }
    return latest;
}

Result<void> migrate_schema(
    LedgerVariables &vars, uint64_t const target,
    std::span<SchemaMigration const> const migrations)
{
    uint64_t const current = vars.schema_version.load().native();
    if (ACCRUAL_UNLIKELY(
            target <= current || target > latest_schema_version(migrations))) {
        return LedgerError::InvalidSchemaVersion;
    }

    // every step must be present before the first one runs
    for (uint64_t v = current + 1; v <= target; ++v) {
        if (ACCRUAL_UNLIKELY(find_step(migrations, v) == nullptr)) {
            LOG_WARNING("AccrualLedger: no migration to schema version {}", v);
            return LedgerError::InvalidSchemaVersion;
        }
    }

    for (uint64_t v = current + 1; v <= target; ++v) {
        LOG_INFO("AccrualLedger: migrating schema to version {}", v);
        BOOST_OUTCOME_TRY(find_step(migrations, v)->apply(vars));
    }

    vars.schema_version.store(target);
    return outcome::success();
}

ACCRUAL_LEDGER_NAMESPACE_END
