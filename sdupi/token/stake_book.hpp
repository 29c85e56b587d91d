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

#include <sdupi/core/address.hpp>
#include <sdupi/core/int.hpp>
#include <sdupi/core/result.hpp>
#include <sdupi/token/config.hpp>

#include <cstdint>
#include <unordered_map>

SDUPI_TOKEN_NAMESPACE_BEGIN

struct StakeRecord
{
    uint256_t amount{0};
    uint64_t start_time{0};
    uint64_t lock_period{0};
    // rewards accrue from this instant; reset on every claim
    uint64_t snapshot_time{0};
    bool is_active{false};

    bool operator==(StakeRecord const &) const = default;
};

// Per account stake records, at most one active record per address
class StakeBook
{
    std::unordered_map<Address, StakeRecord> records_;

public:
    StakeRecord const *find(Address const &) const noexcept;

    bool has_active(Address const &address) const noexcept
    {
        return find(address) != nullptr;
    }

    size_t active_count() const noexcept
    {
        return records_.size();
    }

    // sum of escrowed principal over all active records
    uint256_t total_escrowed() const noexcept;

    Result<void> open(
        Address const &, uint256_t const &amount, uint64_t now,
        uint64_t lock_period);
    void reset_snapshot(Address const &, uint64_t now);
    void close(Address const &);
};

SDUPI_TOKEN_NAMESPACE_END
