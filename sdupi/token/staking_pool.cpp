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
#include <sdupi/core/checked_math.hpp>
#include <sdupi/token/staking_pool.hpp>

#include <boost/outcome/try.hpp>

SDUPI_TOKEN_NAMESPACE_BEGIN

StakingPool::StakingPool(StakingPoolParams const &params)
    : info_{
          .total_staked = 0,
          .total_rewards_paid = 0,
          .apy_percent = params.apy_percent,
          .lock_period = params.lock_period,
          .is_active = params.is_active}
{
}

Result<StakingPoolInfo> StakingPool::with_stake(uint256_t const &amount) const
{
    BOOST_OUTCOME_TRY(
        auto const total_staked, checked_add(info_.total_staked, amount));
    StakingPoolInfo next = info_;
    next.total_staked = total_staked;
    return next;
}

Result<StakingPoolInfo> StakingPool::with_unstake(
    uint256_t const &amount, uint256_t const &reward) const
{
    BOOST_OUTCOME_TRY(
        auto const total_staked, checked_sub(info_.total_staked, amount));
    BOOST_OUTCOME_TRY(
        auto const total_rewards_paid,
        checked_add(info_.total_rewards_paid, reward));
    StakingPoolInfo next = info_;
    next.total_staked = total_staked;
    next.total_rewards_paid = total_rewards_paid;
    return next;
}

Result<StakingPoolInfo> StakingPool::with_claim(uint256_t const &reward) const
{
    BOOST_OUTCOME_TRY(
        auto const total_rewards_paid,
        checked_add(info_.total_rewards_paid, reward));
    StakingPoolInfo next = info_;
    next.total_rewards_paid = total_rewards_paid;
    return next;
}

void StakingPool::commit(StakingPoolInfo const &next)
{
    // parameters only change through update() and set_active()
    SDUPI_ASSERT(next.apy_percent == info_.apy_percent);
    SDUPI_ASSERT(next.lock_period == info_.lock_period);
    SDUPI_ASSERT(next.is_active == info_.is_active);
    info_ = next;
}

void StakingPool::update(
    uint64_t const apy_percent, uint64_t const lock_period) noexcept
{
    info_.apy_percent = apy_percent;
    info_.lock_period = lock_period;
}

void StakingPool::set_active(bool const active) noexcept
{
    info_.is_active = active;
}

SDUPI_TOKEN_NAMESPACE_END
