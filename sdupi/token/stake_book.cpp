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

#include <sdupi/core/assert.h>
#include <sdupi/token/stake_book.hpp>
#include <sdupi/token/token_error.hpp>

#include <boost/outcome/success_failure.hpp>

SDUPI_TOKEN_NAMESPACE_BEGIN

StakeRecord const *StakeBook::find(Address const &address) const noexcept
{
    auto const it = records_.find(address);
    if (it == records_.end() || !it->second.is_active) {
        return nullptr;
    }
    return &it->second;
}

uint256_t StakeBook::total_escrowed() const noexcept
{
    uint256_t total{0};
    for (auto const &[_, record] : records_) {
        if (record.is_active) {
            total += record.amount;
        }
    }
    return total;
}

Result<void> StakeBook::open(
    Address const &address, uint256_t const &amount, uint64_t const now,
    uint64_t const lock_period)
{
    if (has_active(address)) {
        return TokenError::AlreadyStaked;
    }
    records_[address] = StakeRecord{
        .amount = amount,
        .start_time = now,
        .lock_period = lock_period,
        .snapshot_time = now,
        .is_active = true};
    return outcome::success();
}

void StakeBook::reset_snapshot(Address const &address, uint64_t const now)
{
    auto const it = records_.find(address);
    SDUPI_ASSERT(it != records_.end() && it->second.is_active);
    it->second.snapshot_time = now;
}

void StakeBook::close(Address const &address)
{
    auto const erased = records_.erase(address);
    SDUPI_ASSERT(erased == 1);
}

SDUPI_TOKEN_NAMESPACE_END
