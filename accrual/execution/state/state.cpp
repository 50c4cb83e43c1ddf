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

#include <accrual/core/assert.h>
#include <accrual/execution/state/state.hpp>

#include <cstddef>
#include <utility>
#include <vector>

ACCRUAL_NAMESPACE_BEGIN

unsigned State::version() const
{
    return static_cast<unsigned>(checkpoints_.size());
}

void State::push()
{
    checkpoints_.push_back(Checkpoint{.touched = {}, .log_mark = logs_.size()});
}

void State::pop_accept()
{
    ACCRUAL_ASSERT(!checkpoints_.empty());

    unsigned const version = this->version();
    auto const touched = std::move(checkpoints_.back().touched);
    checkpoints_.pop_back();

    for (auto const &[address, key] : touched) {
        auto &slot = storage_.find(address)->second.find(key)->second;
        if (!slot.accept(version) && !checkpoints_.empty()) {
            checkpoints_.back().touched.emplace_back(address, key);
        }
    }
}

void State::pop_reject()
{
    ACCRUAL_ASSERT(!checkpoints_.empty());

    unsigned const version = this->version();
    auto const touched = std::move(checkpoints_.back().touched);
    auto const log_mark = checkpoints_.back().log_mark;
    checkpoints_.pop_back();

    for (auto const &[address, key] : touched) {
        auto const account = storage_.find(address);
        ACCRUAL_ASSERT(account != storage_.end());
        auto &slots = account->second;
        auto const it = slots.find(key);
        ACCRUAL_ASSERT(it != slots.end());
        if (it->second.reject(version)) {
            slots.erase(it);
            if (slots.empty()) {
                storage_.erase(account);
            }
        }
    }

    ACCRUAL_ASSERT(log_mark <= logs_.size());
    logs_.erase(
        logs_.begin() + static_cast<std::ptrdiff_t>(log_mark), logs_.end());
}

bytes32_t
State::get_storage(Address const &address, bytes32_t const &key) const
{
    auto const it = storage_.find(address);
    if (it == storage_.end()) {
        return {};
    }
    auto const it2 = it->second.find(key);
    if (it2 == it->second.end()) {
        return {};
    }
    return it2->second.latest();
}

void State::set_storage(
    Address const &address, bytes32_t const &key, bytes32_t const &value)
{
    unsigned const version = this->version();
    auto &slots = storage_[address];
    auto const it = slots.find(key);
    bool first_write = true;
    if (it == slots.end()) {
        slots.try_emplace(key, value, version);
    }
    else {
        first_write = it->second.checkpoint() < version;
        it->second.writable(version) = value;
    }
    if (version && first_write) {
        checkpoints_.back().touched.emplace_back(address, key);
    }
}

std::vector<Log> const &State::logs() const
{
    return logs_;
}

void State::store_log(Log const &log)
{
    logs_.push_back(log);
}

ACCRUAL_NAMESPACE_END
