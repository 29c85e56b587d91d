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

#include <sdupi/core/checked_math.hpp>
#include <sdupi/token/constants.hpp>
#include <sdupi/token/reward.hpp>

#include <boost/outcome/try.hpp>

SDUPI_TOKEN_NAMESPACE_BEGIN

Result<uint256_t>
calculate_annual_reward(uint256_t const &amount, uint64_t const apy_percent)
{
    return checked_mul_div(amount, apy_percent, 100);
}

Result<uint256_t> calculate_reward(
    StakeRecord const &record, uint64_t const apy_percent, uint64_t const now)
{
    if (!record.is_active || now <= record.snapshot_time) {
        return uint256_t{0};
    }
    uint64_t const elapsed = now - record.snapshot_time;
    BOOST_OUTCOME_TRY(
        auto const annual, calculate_annual_reward(record.amount, apy_percent));
    return checked_mul_div(annual, elapsed, SECONDS_PER_YEAR);
}

SDUPI_TOKEN_NAMESPACE_END
