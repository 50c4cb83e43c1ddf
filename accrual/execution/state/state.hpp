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
#include <accrual/core/config.hpp>
#include <accrual/execution/core/address.hpp>
#include <accrual/execution/core/log.hpp>
#include <accrual/execution/state/version_stack.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <utility>
#include <vector>

ACCRUAL_NAMESPACE_BEGIN

// Contract storage and emitted events with nested checkpoints. Every call
// runs between push() and either pop_accept() or pop_reject(), the latter
// discarding each slot write and event made since the matching push().
class State
{
    template <typename K, typename V>
    using Map = ankerl::unordered_dense::segmented_map<K, V>;

    using Slots = Map<bytes32_t, VersionStack<bytes32_t>>;

    // Slots holding a copy owned by one open checkpoint, and the number of
    // events emitted before it was pushed
    struct Checkpoint
    {
        std::vector<std::pair<Address, bytes32_t>> touched{};
        size_t log_mark{0};
    };

    Map<Address, Slots> storage_{};

    std::vector<Log> logs_{};

    std::vector<Checkpoint> checkpoints_{};

public:
    State() = default;

    State(State &&) = delete;
    State(State const &) = delete;
    State &operator=(State &&) = delete;
    State &operator=(State const &) = delete;

    unsigned version() const;

    void push();

    void pop_accept();

    void pop_reject();

    ////////////////////////////////////////

    bytes32_t get_storage(Address const &, bytes32_t const &key) const;

    void
    set_storage(Address const &, bytes32_t const &key, bytes32_t const &value);

    ////////////////////////////////////////

    std::vector<Log> const &logs() const;

    void store_log(Log const &);
};

ACCRUAL_NAMESPACE_END
