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

#include <accrual/core/likely.h>
#include <accrual/core/result.hpp>
#include <accrual/execution/core/contract/storage_variable.hpp>
#include <accrual/execution/ledger/config.hpp>
#include <accrual/execution/ledger/util/ledger_error.hpp>

#include <boost/outcome/success_failure.hpp>

ACCRUAL_LEDGER_NAMESPACE_BEGIN

// Scoped hold on the ledger-wide reentrancy flag. The flag lives in storage
// so a nested call through another ledger handle on the same State sees it.
class ReentrancyGuard
{
    StorageVariable<bool> flag_;
    bool acquired_{false};

public:
    explicit ReentrancyGuard(StorageVariable<bool> const &flag)
        : flag_{flag}
    {
    }

    ReentrancyGuard(ReentrancyGuard const &) = delete;
    ReentrancyGuard &operator=(ReentrancyGuard const &) = delete;

    ~ReentrancyGuard()
    {
        if (acquired_) {
            flag_.clear();
        }
    }

    Result<void> enter()
    {
        if (ACCRUAL_UNLIKELY(flag_.load())) {
            return LedgerError::ReentrantCall;
        }
        flag_.store(true);
        acquired_ = true;
        return outcome::success();
    }
};

ACCRUAL_LEDGER_NAMESPACE_END
