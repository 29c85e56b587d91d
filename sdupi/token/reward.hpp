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

#include <sdupi/core/int.hpp>
#include <sdupi/core/result.hpp>
#include <sdupi/token/config.hpp>
#include <sdupi/token/stake_book.hpp>

#include <cstdint>

SDUPI_TOKEN_NAMESPACE_BEGIN

// Reward accrued on `record` since its snapshot, at the given APY:
//
//   annual = floor(amount * apy_percent / 100)
//   reward = floor(annual * elapsed / SECONDS_PER_YEAR)
//
// Linear in time and always computed on the original principal. The APY is
// whatever the pool holds at call time, so an APY change applies to the whole
// unclaimed window of existing stakes. Inactive records and timestamps at or
// before the snapshot yield zero.
Result<uint256_t> calculate_reward(
    StakeRecord const &record, uint64_t apy_percent, uint64_t now);

// Reward for a full year on `amount`
Result<uint256_t>
calculate_annual_reward(uint256_t const &amount, uint64_t apy_percent);

SDUPI_TOKEN_NAMESPACE_END
