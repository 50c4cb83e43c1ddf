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

#include <accrual/core/assert.h>
#include <accrual/core/config.hpp>

#include <cstddef>
#include <utility>
#include <vector>

ACCRUAL_NAMESPACE_BEGIN

// Copies of one value, one per open checkpoint that wrote it, oldest first.
// The first entry is what is visible once every checkpoint is closed.
template <class T>
class VersionStack
{
    struct Entry
    {
        unsigned checkpoint;
        T value;
    };

    std::vector<Entry> entries_{};

public:
    explicit VersionStack(T value, unsigned const checkpoint = 0)
    {
        entries_.push_back(Entry{checkpoint, std::move(value)});
    }

    VersionStack(VersionStack &&) = default;
    VersionStack(VersionStack const &) = delete;
    VersionStack &operator=(VersionStack &&) = default;
    VersionStack &operator=(VersionStack const &) = delete;

    size_t depth() const
    {
        return entries_.size();
    }

    unsigned checkpoint() const
    {
        ACCRUAL_ASSERT(!entries_.empty());
        return entries_.back().checkpoint;
    }

    T const &latest() const
    {
        ACCRUAL_ASSERT(!entries_.empty());
        return entries_.back().value;
    }

    // The copy owned by `checkpoint`, made from the latest value on the
    // first write inside it
    T &writable(unsigned const checkpoint)
    {
        ACCRUAL_ASSERT(!entries_.empty());
        if (entries_.back().checkpoint < checkpoint) {
            entries_.push_back(Entry{checkpoint, entries_.back().value});
        }
        return entries_.back().value;
    }

    // Hands the copy owned by `checkpoint` to the enclosing checkpoint,
    // replacing the copy that one already owns. False when the enclosing
    // checkpoint held no copy before, that is when it now owns a value it
    // never wrote itself.
    [[nodiscard]] bool accept(unsigned const checkpoint)
    {
        ACCRUAL_ASSERT(checkpoint != 0 && !entries_.empty());
        if (entries_.back().checkpoint != checkpoint) {
            return true;
        }

        auto const n = entries_.size();
        if (n > 1 && entries_[n - 2].checkpoint == checkpoint - 1) {
            entries_[n - 2].value = std::move(entries_.back().value);
            entries_.pop_back();
            return true;
        }
        entries_.back().checkpoint = checkpoint - 1;
        return false;
    }

    // Drops the copy owned by `checkpoint`. True when no copy is left, that
    // is when the value was created inside `checkpoint`.
    [[nodiscard]] bool reject(unsigned const checkpoint)
    {
        ACCRUAL_ASSERT(checkpoint != 0 && !entries_.empty());
        if (entries_.back().checkpoint == checkpoint) {
            entries_.pop_back();
        }
        return entries_.empty();
    }
};

ACCRUAL_NAMESPACE_END
