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

#include <accrual/core/byte_string.hpp>
#include <accrual/core/bytes.hpp>
#include <accrual/core/config.hpp>
#include <accrual/execution/core/address.hpp>
#include <accrual/execution/core/contract/abi_encode.hpp>
#include <accrual/execution/core/log.hpp>

#include <utility>

ACCRUAL_NAMESPACE_BEGIN

class EventBuilder
{
    Log event_;

public:
    explicit EventBuilder(Address const &emitter, bytes32_t const &signature)
    {
        event_.address = emitter;
        event_.topics.push_back(signature);
    }

    // Add an indexed parameter
    EventBuilder &&add_topic(bytes32_t const &topic) &&
    {
        event_.topics.push_back(topic);
        return std::move(*this);
    }

    EventBuilder &&add_topic(Address const &address) &&
    {
        event_.topics.push_back(abi_encode_address(address));
        return std::move(*this);
    }

    // Add a non-indexed parameter
    EventBuilder &&add_data(bytes32_t const &word) &&
    {
        event_.data += word;
        return std::move(*this);
    }

    Log &&build() &&
    {
        return std::move(event_);
    }
};

ACCRUAL_NAMESPACE_END
