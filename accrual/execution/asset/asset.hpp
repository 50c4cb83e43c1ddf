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

#include <accrual/core/config.hpp>
#include <accrual/core/int.hpp>
#include <accrual/core/result.hpp>
#include <accrual/execution/core/address.hpp>

#include <ankerl/unordered_dense.h>

ACCRUAL_NAMESPACE_BEGIN

// A transferable asset the ledger takes custody of. Implementations report
// insufficient balance or allowance as errors and leave their own state
// unchanged when they fail.
class Asset
{
public:
    virtual ~Asset() = default;

    // Moves `amount` from `sender` to `to`
    virtual Result<void> transfer(
        Address const &sender, Address const &to, uint256_t const &amount) = 0;

    // Moves `amount` from `owner` to `to` against the allowance `owner`
    // granted to `spender`
    virtual Result<void> transfer_from(
        Address const &spender, Address const &owner, Address const &to,
        uint256_t const &amount) = 0;
};

// Resolves asset identifiers to the assets behind them. Does not own them.
class AssetRegistry
{
    ankerl::unordered_dense::segmented_map<Address, Asset *> assets_{};

public:
    void add(Address const &id, Asset &asset)
    {
        assets_.insert_or_assign(id, &asset);
    }

    Asset *find(Address const &id) const
    {
        auto const it = assets_.find(id);
        return it == assets_.end() ? nullptr : it->second;
    }

    size_t size() const
    {
        return assets_.size();
    }
};

ACCRUAL_NAMESPACE_END
